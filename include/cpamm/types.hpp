#ifndef CPAMM_TYPES_HPP
#define CPAMM_TYPES_HPP

#include <cstdint>
#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace cpamm {

// =============================================================================
// Addresses (EVM-style 20-byte account identifiers)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

constexpr Address ZERO = {};

// Build an address from a small numeric id (stored big-endian in the tail)
constexpr Address from_id(uint64_t id) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((id >> (8 * i)) & 0xFF);
    }
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

// "0x" followed by 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts with or without the "0x" prefix
std::optional<Address> from_hex(std::string_view hex);

} // namespace addresses

// =============================================================================
// Amounts (unsigned 128-bit integer units)
// =============================================================================

using Amount = unsigned __int128;

constexpr Amount AMOUNT_MAX = ~Amount(0);

// Decimal rendering of an amount (no separators)
std::string to_string(Amount value);

// Parse a decimal string; nullopt on empty input, bad digits or overflow
std::optional<Amount> parse_amount(std::string_view text);

// =============================================================================
// Call Context (who calls, and how much base currency comes with the call)
// =============================================================================

struct CallContext {
    Address caller;
    Amount value;   // base currency attached to the call (0 for non-payable)
};

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Pool-level failures
constexpr int32_t INVALID_RESERVES = -1;
constexpr int32_t INSUFFICIENT_TOKEN_OFFER = -2;
constexpr int32_t SLIPPAGE_EXCEEDED = -3;
constexpr int32_t INVALID_AMOUNT = -4;
constexpr int32_t TRANSFER_FAILED = -5;
constexpr int32_t NO_LIQUIDITY = -6;
constexpr int32_t ARITHMETIC_OVERFLOW = -7;
constexpr int32_t INVALID_FEE = -8;

// Ledger-level failures (surface as TRANSFER_FAILED from the pool)
constexpr int32_t INSUFFICIENT_BALANCE = -10;
constexpr int32_t INSUFFICIENT_ALLOWANCE = -11;
constexpr int32_t RECIPIENT_REJECTED = -12;

constexpr int32_t REENTRANCY = -30;

const char* name(int32_t code);
} // namespace errors

} // namespace cpamm

#endif // CPAMM_TYPES_HPP
