#ifndef LPM_PLANNER_HPP
#define LPM_PLANNER_HPP

#include <optional>

#include "config.hpp"
#include "pool.hpp"
#include "types.hpp"

namespace lpm {

// =============================================================================
// Planner Types
// =============================================================================

// Off-chain USD price per whole token
struct PriceQuote {
    double usd0 = 0.0;
    double usd1 = 0.0;
};

enum class SwapDirection : uint8_t {
    None,
    ZeroForOne,   // Sell token0 for token1
    OneForZero,   // Sell token1 for token0
};

const char* to_string(SwapDirection direction);

struct TickRange {
    int32_t lower = 0;
    int32_t upper = 0;

    bool contains(int32_t tick) const { return tick >= lower && tick < upper; }
    bool operator==(const TickRange& o) const { return lower == o.lower && upper == o.upper; }
    bool operator!=(const TickRange& o) const { return !(*this == o); }
};

struct SwapPlan {
    SwapDirection direction = SwapDirection::None;
    U128 amount_in = 0;
    U128 expected_out = 0;        // After the pool fee
    U128 min_amount_out = 0;      // expected_out less the slippage buffer
    double imbalance_usd = 0.0;   // Positive = token0 over-weight

    bool required() const { return direction != SwapDirection::None; }
};

// Transient: computed fresh each run, never persisted
struct RebalancePlan {
    TickRange new_range;
    int32_t planned_tick = 0;           // Snapshot tick the plan was computed at
    TokenAmounts expected_withdrawal;   // Rounded down estimate from the old position
    TokenAmounts holdings;              // Wallet + expected withdrawal
    SwapPlan swap;
    TokenAmounts post_swap;
    U128 new_liquidity = 0;
    TokenAmounts mint_amounts;          // Needed for new_liquidity at the planned price
    TokenAmounts mint_max;              // Slippage-buffered guards, uncapped
    double target_ratio0 = 0.0;         // Share of value to hold as token0
    double value0_usd = 0.0;
    double value1_usd = 0.0;
};

// New range centered on tick: +/- range_pct converted to ticks, rounded
// outward to multiples of tick_spacing and clamped to the usable bounds.
// Throws InvalidRange for range_pct outside (0, 100) or a collapsed range.
TickRange compute_new_range(int32_t tick, int32_t tick_spacing, double range_pct);

// Fraction of value held as token0 by a position over `range` at the current
// price, solved in closed form from unit liquidity.
double target_token0_ratio(const U256& sqrt_price_x96,
                           const TickRange& range,
                           int decimals0,
                           int decimals1,
                           const PriceQuote& prices);

// Throws NoPriceData unless both prices are finite and positive
void require_prices(const PriceQuote& prices);

// =============================================================================
// RebalancePlanner
// =============================================================================

class RebalancePlanner {
public:
    RebalancePlanner(const PoolConfig& pool, const StrategyConfig& strategy);

    [[nodiscard]] TickRange compute_range(const PoolState& state) const;

    // Minimal exact-input swap moving `holdings` to `target_ratio0`.
    // No swap when the imbalance is below the materiality floor.
    [[nodiscard]] SwapPlan plan_swap(const TokenAmounts& holdings,
                                     double target_ratio0,
                                     const PriceQuote& prices,
                                     uint32_t fee_pips) const;

    // plan_swap toward the ratio of `range`. The materiality floor is waived
    // when the unswapped holdings cannot fund any liquidity in `range`, so a
    // one-sided dust balance still gets its missing side.
    [[nodiscard]] SwapPlan swap_to_ratio(const PoolState& state,
                                         const TickRange& range,
                                         const TokenAmounts& holdings,
                                         double target_ratio0,
                                         const PriceQuote& prices) const;

    // Liquidity fundable from balances with the slippage buffer held back,
    // so that slippage-buffered guards stay within the balances.
    [[nodiscard]] U128 liquidity_for_balances(const PoolState& state,
                                              const TickRange& range,
                                              const TokenAmounts& balances) const;

    // Maximum-amount guards for minting `liquidity`: the rounded-up cost
    // plus the slippage buffer
    [[nodiscard]] TokenAmounts mint_guards(const PoolState& state,
                                           const TickRange& range,
                                           U128 liquidity) const;

    // Full plan. `current` is the position being replaced (none for a
    // recovery mint from wallet balances).
    [[nodiscard]] RebalancePlan plan(const PoolState& state,
                                     const std::optional<Position>& current,
                                     const TokenAmounts& wallet,
                                     const PriceQuote& prices) const;

    // Effective pool fee in pips; dynamic-fee pools report it through slot0
    [[nodiscard]] uint32_t fee_pips(const PoolState& state) const;

    const StrategyConfig& strategy() const { return strategy_; }

private:
    double value_usd(U128 amount, int decimals, double usd) const;
    SwapPlan size_swap(const TokenAmounts& holdings, double target_ratio0,
                       const PriceQuote& prices, uint32_t fee, double floor_usd) const;

    PoolConfig pool_;
    StrategyConfig strategy_;
};

} // namespace lpm

#endif // LPM_PLANNER_HPP
