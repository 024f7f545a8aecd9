// =============================================================================
// pricing.cpp - Fee-adjusted constant-product quote
// =============================================================================

#include "cpamm/pricing.hpp"
#include "cpamm/math.hpp"

namespace cpamm {
namespace pricing {

QuoteResult quote(Amount input_amount, Amount input_reserve, Amount output_reserve,
                  const FeeSchedule& fee) {
    if (!fee.valid()) {
        return {errors::INVALID_FEE, 0};
    }
    if (input_reserve == 0 || output_reserve == 0) {
        return {errors::INVALID_RESERVES, 0};
    }

    Amount input_with_fee = 0;
    int32_t rc = amount_math::checked_mul(input_amount, fee.numerator, input_with_fee);
    if (rc != errors::OK) return {rc, 0};

    Amount scaled_reserve = 0;
    rc = amount_math::checked_mul(input_reserve, fee.denominator, scaled_reserve);
    if (rc != errors::OK) return {rc, 0};

    Amount denominator = 0;
    rc = amount_math::checked_add(scaled_reserve, input_with_fee, denominator);
    if (rc != errors::OK) return {rc, 0};

    Amount out = 0;
    rc = amount_math::mul_div(input_with_fee, output_reserve, denominator, out);
    if (rc != errors::OK) return {rc, 0};

    return {errors::OK, out};
}

} // namespace pricing
} // namespace cpamm
