#ifndef CPAMM_OBSERVER_HPP
#define CPAMM_OBSERVER_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

#include "types.hpp"

namespace cpamm {

enum class SwapDirection : uint8_t {
    BASE_TO_TOKEN = 0,
    TOKEN_TO_BASE = 1
};

const char* to_string(SwapDirection direction);

// =============================================================================
// Pool Observer Interface
//
// Notified after an operation has committed and the pool lock is released.
// A failed operation produces only on_rejected, after its rollback.
// =============================================================================

class IPoolObserver {
public:
    virtual ~IPoolObserver() = default;

    virtual void on_liquidity_added(const Address& provider, Amount base_in,
                                    Amount tokens_in, Amount shares_minted) {}
    virtual void on_liquidity_removed(const Address& provider, Amount shares_burned,
                                      Amount base_out, Amount tokens_out) {}
    virtual void on_swap(const Address& trader, SwapDirection direction,
                         Amount amount_in, Amount amount_out) {}
    virtual void on_rejected(const Address& caller, std::string_view operation,
                             int32_t status) {}
};

// =============================================================================
// StreamLogger - one line per pool event
// =============================================================================

enum class LogLevel : uint8_t {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    OFF = 4
};

std::optional<LogLevel> parse_log_level(std::string_view text);
const char* to_string(LogLevel level);

class StreamLogger : public IPoolObserver {
public:
    StreamLogger(std::ostream& out, LogLevel level);

    // Successful operations log at INFO, rejections at WARN
    void on_liquidity_added(const Address& provider, Amount base_in,
                            Amount tokens_in, Amount shares_minted) override;
    void on_liquidity_removed(const Address& provider, Amount shares_burned,
                              Amount base_out, Amount tokens_out) override;
    void on_swap(const Address& trader, SwapDirection direction,
                 Amount amount_in, Amount amount_out) override;
    void on_rejected(const Address& caller, std::string_view operation,
                     int32_t status) override;

    LogLevel level() const { return level_; }
    void set_level(LogLevel level) { level_ = level; }

private:
    std::ostream& out_;
    LogLevel level_;

    bool enabled(LogLevel level) const { return level >= level_ && level_ != LogLevel::OFF; }
};

} // namespace cpamm

#endif // CPAMM_OBSERVER_HPP
