#ifndef CPAMM_CONFIG_HPP
#define CPAMM_CONFIG_HPP

#include <string>
#include <string_view>

#include "pricing.hpp"
#include "types.hpp"

namespace cpamm {

struct PoolSnapshot;

// =============================================================================
// Pool Configuration (JSON; amounts are written as decimal strings)
// =============================================================================

class PoolConfig {
public:
    std::string name = "cpamm";
    FeeSchedule fee = fees::ONE_PERCENT;
    // Smallest base amount accepted for the first deposit (0 = any)
    Amount min_bootstrap_base = 0;
    std::string log_level = "info";

    PoolConfig() = default;

    // Load from JSON file; throws std::runtime_error on I/O or parse errors
    static PoolConfig from_file(std::string_view path);

    // Load from JSON text; missing keys keep their defaults
    static PoolConfig from_json(std::string_view content);

    [[nodiscard]] std::string to_json() const;

    // errors::OK or errors::INVALID_FEE
    [[nodiscard]] int32_t validate() const;

    // Builder methods
    PoolConfig& with_name(std::string_view n) {
        name = std::string(n);
        return *this;
    }

    PoolConfig& with_fee(uint32_t numerator, uint32_t denominator) {
        fee = FeeSchedule{numerator, denominator};
        return *this;
    }

    PoolConfig& with_min_bootstrap_base(Amount amount) {
        min_bootstrap_base = amount;
        return *this;
    }

    PoolConfig& with_log_level(std::string_view level) {
        log_level = std::string(level);
        return *this;
    }
};

// {"base_reserve": "...", "token_reserve": "...", "total_shares": "..."}
std::string snapshot_to_json(const PoolSnapshot& snapshot);

} // namespace cpamm

#endif // CPAMM_CONFIG_HPP
