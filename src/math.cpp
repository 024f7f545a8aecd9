// =============================================================================
// math.cpp - Overflow-checked 128-bit amount arithmetic
// =============================================================================

#include "cpamm/math.hpp"

namespace cpamm {
namespace amount_math {

// =============================================================================
// 256-bit Helpers
// =============================================================================

U256 mul_wide(Amount a, Amount b) {
    // Split into 64-bit halves so no partial product overflows
    constexpr Amount MASK64 = (Amount(1) << 64) - 1;
    Amount a_lo = a & MASK64;
    Amount a_hi = a >> 64;
    Amount b_lo = b & MASK64;
    Amount b_hi = b >> 64;

    Amount p0 = a_lo * b_lo;
    Amount p1 = a_lo * b_hi;
    Amount p2 = a_hi * b_lo;
    Amount p3 = a_hi * b_hi;

    // Middle column with carry into the high limb
    Amount mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    Amount carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

U256 add_wide(U256 a, Amount b) {
    U256 result;
    result.lo = a.lo + b;
    result.hi = a.hi + (result.lo < b ? 1 : 0);
    return result;
}

int32_t div_wide(U256 num, Amount denom, Amount& out) {
    if (denom == 0) return errors::NO_LIQUIDITY;

    if (num.hi == 0) {
        out = num.lo / denom;
        return errors::OK;
    }

    // Quotient >= 2^128 exactly when the high limb alone reaches the divisor
    if (num.hi >= denom) return errors::ARITHMETIC_OVERFLOW;

    // Restoring long division over the low limb; rem < denom on every step
    Amount rem = num.hi;
    Amount quot = 0;
    for (int i = 127; i >= 0; --i) {
        bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | ((num.lo >> i) & 1);
        quot <<= 1;
        if (carry || rem >= denom) {
            rem -= denom;  // modular subtraction is exact when carry is set
            quot |= 1;
        }
    }

    out = quot;
    return errors::OK;
}

// =============================================================================
// Checked Operations
// =============================================================================

int32_t checked_add(Amount a, Amount b, Amount& out) {
    if (a > AMOUNT_MAX - b) return errors::ARITHMETIC_OVERFLOW;
    out = a + b;
    return errors::OK;
}

int32_t checked_sub(Amount a, Amount b, Amount& out) {
    if (b > a) return errors::ARITHMETIC_OVERFLOW;
    out = a - b;
    return errors::OK;
}

int32_t checked_mul(Amount a, Amount b, Amount& out) {
    if (a != 0 && b > AMOUNT_MAX / a) return errors::ARITHMETIC_OVERFLOW;
    out = a * b;
    return errors::OK;
}

int32_t mul_div(Amount a, Amount b, Amount denom, Amount& out) {
    return div_wide(mul_wide(a, b), denom, out);
}

} // namespace amount_math
} // namespace cpamm
