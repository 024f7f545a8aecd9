#ifndef CPAMM_PRICING_HPP
#define CPAMM_PRICING_HPP

#include <cstdint>

#include "types.hpp"

namespace cpamm {

// =============================================================================
// Fee Schedule
//
// The input side is scaled by numerator/denominator before pricing, so the
// default 99/100 keeps 1% of every input in the pool.
// =============================================================================

struct FeeSchedule {
    uint32_t numerator = 99;
    uint32_t denominator = 100;

    bool valid() const { return denominator != 0 && numerator <= denominator; }

    bool operator==(const FeeSchedule& other) const {
        return numerator == other.numerator && denominator == other.denominator;
    }
};

namespace fees {
constexpr FeeSchedule ONE_PERCENT{99, 100};
constexpr FeeSchedule ZERO{1, 1};
}

struct QuoteResult {
    int32_t status;
    Amount amount_out;

    bool ok() const { return status == errors::OK; }
};

// =============================================================================
// Constant-Product Pricing
// =============================================================================

namespace pricing {

// Output of selling `input_amount` into a pool holding `input_reserve` of the
// sold asset and `output_reserve` of the bought asset:
//
//   in_fee = input_amount * fee.numerator
//   out    = floor(in_fee * output_reserve /
//                  (input_reserve * fee.denominator + in_fee))
//
// Pure: reads no state. Rounds down, so the pool never pays more than the
// curve allows. INVALID_RESERVES when either reserve is zero.
QuoteResult quote(Amount input_amount, Amount input_reserve, Amount output_reserve,
                  const FeeSchedule& fee = fees::ONE_PERCENT);

} // namespace pricing

} // namespace cpamm

#endif // CPAMM_PRICING_HPP
