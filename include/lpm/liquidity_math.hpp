#ifndef LPM_LIQUIDITY_MATH_HPP
#define LPM_LIQUIDITY_MATH_HPP

#include "types.hpp"
#include "uint256.hpp"

namespace lpm {

// =============================================================================
// Concentrated-liquidity amount <-> liquidity conversion
// =============================================================================
//
// All results round down, so an estimate never exceeds what the pool would
// actually pay out or accept. Bounds given out of order are swapped; equal
// bounds yield zero.

namespace liquidity_math {

// Liquidity supported by amount0 alone over [sqrt_a, sqrt_b]
U128 liquidity_for_amount0(const U256& sqrt_a, const U256& sqrt_b, U128 amount0);

// Liquidity supported by amount1 alone over [sqrt_a, sqrt_b]
U128 liquidity_for_amount1(const U256& sqrt_a, const U256& sqrt_b, U128 amount1);

// Maximum liquidity both amounts can fund at the current price.
// Below the range only token0 binds, above it only token1, inside it the
// smaller of the two. Throws InvalidInput if the result exceeds uint128.
U128 liquidity_for_amounts(const U256& sqrt_price,
                           const U256& sqrt_a,
                           const U256& sqrt_b,
                           U128 amount0,
                           U128 amount1);

U128 amount0_for_liquidity(const U256& sqrt_a, const U256& sqrt_b, U128 liquidity);
U128 amount1_for_liquidity(const U256& sqrt_a, const U256& sqrt_b, U128 liquidity);

// Tokens redeemable for `liquidity` at the current price
TokenAmounts amounts_for_liquidity(U128 liquidity,
                                   const U256& sqrt_price,
                                   const U256& sqrt_a,
                                   const U256& sqrt_b);

} // namespace liquidity_math

} // namespace lpm

#endif // LPM_LIQUIDITY_MATH_HPP
