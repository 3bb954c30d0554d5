#ifndef LPM_TICK_MATH_HPP
#define LPM_TICK_MATH_HPP

#include <cstdint>

#include "uint256.hpp"

namespace lpm {

// =============================================================================
// Tick <-> sqrt(price) conversion, Q64.96 fixed point
// =============================================================================

namespace tick_math {

constexpr int32_t MIN_TICK = -887272;
constexpr int32_t MAX_TICK = 887272;

// sqrt ratio at MIN_TICK / MAX_TICK
const U256& min_sqrt_ratio();
const U256& max_sqrt_ratio();

// 2^96
const U256& q96();

// sqrt(1.0001^tick) * 2^96, rounded up.
// Throws OutOfBoundsTick when tick is outside [MIN_TICK, MAX_TICK].
U256 get_sqrt_ratio_at_tick(int32_t tick);

// Greatest tick whose sqrt ratio is <= sqrt_price_x96.
// Throws OutOfBoundsTick unless MIN_SQRT_RATIO <= sqrt_price_x96 < MAX_SQRT_RATIO.
int32_t get_tick_at_sqrt_ratio(const U256& sqrt_price_x96);

// Usable bounds for a spacing (multiples of spacing inside [MIN_TICK, MAX_TICK])
int32_t min_usable_tick(int32_t tick_spacing);
int32_t max_usable_tick(int32_t tick_spacing);

int32_t clamp_tick(int32_t tick, int32_t tick_spacing);

// Round to a multiple of spacing towards -inf / +inf
int32_t floor_to_spacing(int64_t tick, int32_t tick_spacing);
int32_t ceil_to_spacing(int64_t tick, int32_t tick_spacing);

// =============================================================================
// Floating-point helpers (reporting only, never used for on-chain amounts)
// =============================================================================

// Price of token0 in token1, adjusted for decimals
double tick_to_price(int32_t tick, int decimals0 = 0, int decimals1 = 0);
double sqrt_price_to_price(const U256& sqrt_price_x96, int decimals0 = 0, int decimals1 = 0);
int32_t price_to_tick(double price, int decimals0 = 0, int decimals1 = 0);

// Ticks spanned by a relative price move, e.g. pct = 20 -> ln(1.2) / ln(1.0001)
double tick_delta_for_pct(double pct);

} // namespace tick_math

} // namespace lpm

#endif // LPM_TICK_MATH_HPP
