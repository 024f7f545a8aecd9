// =============================================================================
// types.cpp - Address/amount formatting and error names
// =============================================================================

#include "cpamm/types.hpp"
#include <algorithm>

namespace cpamm {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

// =============================================================================
// Addresses
// =============================================================================

namespace addresses {

std::string to_hex(const Address& addr) {
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (uint8_t b : addr) {
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0F]);
    }
    return out;
}

std::optional<Address> from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) return std::nullopt;

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

} // namespace addresses

// =============================================================================
// Amounts
// =============================================================================

std::string to_string(Amount value) {
    if (value == 0) return "0";

    std::string out;
    while (value != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::optional<Amount> parse_amount(std::string_view text) {
    if (text.empty()) return std::nullopt;

    Amount value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        Amount digit = static_cast<Amount>(c - '0');
        if (value > (AMOUNT_MAX - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

// =============================================================================
// Error Names
// =============================================================================

namespace errors {

const char* name(int32_t code) {
    switch (code) {
        case OK:                       return "OK";
        case INVALID_RESERVES:         return "INVALID_RESERVES";
        case INSUFFICIENT_TOKEN_OFFER: return "INSUFFICIENT_TOKEN_OFFER";
        case SLIPPAGE_EXCEEDED:        return "SLIPPAGE_EXCEEDED";
        case INVALID_AMOUNT:           return "INVALID_AMOUNT";
        case TRANSFER_FAILED:          return "TRANSFER_FAILED";
        case NO_LIQUIDITY:             return "NO_LIQUIDITY";
        case ARITHMETIC_OVERFLOW:      return "ARITHMETIC_OVERFLOW";
        case INVALID_FEE:              return "INVALID_FEE";
        case INSUFFICIENT_BALANCE:     return "INSUFFICIENT_BALANCE";
        case INSUFFICIENT_ALLOWANCE:   return "INSUFFICIENT_ALLOWANCE";
        case RECIPIENT_REJECTED:       return "RECIPIENT_REJECTED";
        case REENTRANCY:               return "REENTRANCY";
        default:                       return "UNKNOWN";
    }
}

} // namespace errors

} // namespace cpamm
