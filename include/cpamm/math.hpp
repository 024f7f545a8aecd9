#ifndef CPAMM_MATH_HPP
#define CPAMM_MATH_HPP

#include <cstdint>

#include "types.hpp"

namespace cpamm {

// =============================================================================
// 256-bit Unsigned Integer (two 128-bit limbs)
// =============================================================================

struct U256 {
    Amount lo;  // Low 128 bits
    Amount hi;  // High 128 bits

    U256() : lo(0), hi(0) {}
    U256(Amount l) : lo(l), hi(0) {}
    U256(Amount l, Amount h) : lo(l), hi(h) {}

    bool operator==(const U256& other) const {
        return lo == other.lo && hi == other.hi;
    }
    bool operator!=(const U256& other) const { return !(*this == other); }
    bool operator<(const U256& other) const {
        return hi < other.hi || (hi == other.hi && lo < other.lo);
    }
    bool operator>=(const U256& other) const { return !(*this < other); }
    bool is_zero() const { return lo == 0 && hi == 0; }
    bool fits_u128() const { return hi == 0; }
};

// =============================================================================
// Checked Amount Arithmetic
//
// Every function writes its result through `out` and returns errors::OK, or
// returns a failure code and leaves `out` untouched.
// =============================================================================

namespace amount_math {

// Full 128 x 128 -> 256 product
U256 mul_wide(Amount a, Amount b);

// 256 + 128 -> 256 (wraps only past 2^256, which 128-bit inputs never reach)
U256 add_wide(U256 a, Amount b);

// floor(num / denom). NO_LIQUIDITY on zero divisor, ARITHMETIC_OVERFLOW when
// the quotient needs more than 128 bits.
int32_t div_wide(U256 num, Amount denom, Amount& out);

int32_t checked_add(Amount a, Amount b, Amount& out);
int32_t checked_sub(Amount a, Amount b, Amount& out);
int32_t checked_mul(Amount a, Amount b, Amount& out);

// floor(a * b / denom) with a 256-bit intermediate product
int32_t mul_div(Amount a, Amount b, Amount denom, Amount& out);

} // namespace amount_math

} // namespace cpamm

#endif // CPAMM_MATH_HPP
