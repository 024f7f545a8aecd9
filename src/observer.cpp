// =============================================================================
// observer.cpp - Pool event logging
// =============================================================================

#include "cpamm/observer.hpp"

namespace cpamm {

const char* to_string(SwapDirection direction) {
    switch (direction) {
        case SwapDirection::BASE_TO_TOKEN: return "base->token";
        case SwapDirection::TOKEN_TO_BASE: return "token->base";
    }
    return "unknown";
}

std::optional<LogLevel> parse_log_level(std::string_view text) {
    if (text == "debug") return LogLevel::DEBUG;
    if (text == "info") return LogLevel::INFO;
    if (text == "warn") return LogLevel::WARN;
    if (text == "error") return LogLevel::ERROR;
    if (text == "off") return LogLevel::OFF;
    return std::nullopt;
}

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
        case LogLevel::OFF:   return "off";
    }
    return "unknown";
}

StreamLogger::StreamLogger(std::ostream& out, LogLevel level)
    : out_(out), level_(level) {}

void StreamLogger::on_liquidity_added(const Address& provider, Amount base_in,
                                      Amount tokens_in, Amount shares_minted) {
    if (!enabled(LogLevel::INFO)) return;
    out_ << "[info] add_liquidity provider=" << addresses::to_hex(provider)
         << " base_in=" << to_string(base_in)
         << " tokens_in=" << to_string(tokens_in)
         << " shares=" << to_string(shares_minted) << "\n";
}

void StreamLogger::on_liquidity_removed(const Address& provider, Amount shares_burned,
                                        Amount base_out, Amount tokens_out) {
    if (!enabled(LogLevel::INFO)) return;
    out_ << "[info] remove_liquidity provider=" << addresses::to_hex(provider)
         << " shares=" << to_string(shares_burned)
         << " base_out=" << to_string(base_out)
         << " tokens_out=" << to_string(tokens_out) << "\n";
}

void StreamLogger::on_swap(const Address& trader, SwapDirection direction,
                           Amount amount_in, Amount amount_out) {
    if (!enabled(LogLevel::INFO)) return;
    out_ << "[info] swap " << to_string(direction)
         << " trader=" << addresses::to_hex(trader)
         << " in=" << to_string(amount_in)
         << " out=" << to_string(amount_out) << "\n";
}

void StreamLogger::on_rejected(const Address& caller, std::string_view operation,
                               int32_t status) {
    if (!enabled(LogLevel::WARN)) return;
    out_ << "[warn] " << operation << " rejected caller=" << addresses::to_hex(caller)
         << " status=" << errors::name(status) << "\n";
}

} // namespace cpamm
