#include "lpm/planner.hpp"
#include "lpm/errors.hpp"
#include "lpm/liquidity_math.hpp"
#include "lpm/tick_math.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace lpm {

namespace {

constexpr double Q96_DOUBLE = 79228162514264337593543950336.0;
constexpr uint32_t BPS = 10000;

// Whole-token USD value -> smallest units, floored
U128 units_for_usd(double usd_value, int decimals, double usd_price) {
    double units = std::floor(usd_value / usd_price * std::pow(10.0, decimals));
    if (!(units > 0.0)) return 0;
    if (units >= 1.7e38) return U128_MAX;
    return static_cast<U128>(units);
}

U128 min_u128(U128 a, U128 b) { return a < b ? a : b; }

} // namespace

const char* to_string(SwapDirection direction) {
    switch (direction) {
        case SwapDirection::None:       return "none";
        case SwapDirection::ZeroForOne: return "zero_for_one";
        case SwapDirection::OneForZero: return "one_for_zero";
    }
    return "unknown";
}

TickRange compute_new_range(int32_t tick, int32_t tick_spacing, double range_pct) {
    if (!(range_pct > 0.0 && range_pct < 100.0)) {
        throw InvalidRange("range percentage must be in (0, 100), got " + std::to_string(range_pct));
    }
    if (tick_spacing <= 0) {
        throw InvalidRange("tick spacing must be positive");
    }

    // Symmetric in log space: mean of the ticks to +pct and to -pct
    const double up = tick_math::tick_delta_for_pct(range_pct);
    const double down = -tick_math::tick_delta_for_pct(-range_pct);
    const double half_width = (up + down) / 2.0;

    const auto raw_lower = static_cast<int64_t>(std::floor(tick - half_width));
    const auto raw_upper = static_cast<int64_t>(std::ceil(tick + half_width));

    TickRange range;
    range.lower = tick_math::clamp_tick(tick_math::floor_to_spacing(raw_lower, tick_spacing), tick_spacing);
    range.upper = tick_math::clamp_tick(tick_math::ceil_to_spacing(raw_upper, tick_spacing), tick_spacing);

    if (range.lower >= range.upper) {
        throw InvalidRange("range collapsed after rounding: [" + std::to_string(range.lower) +
                           ", " + std::to_string(range.upper) + ")");
    }
    return range;
}

void require_prices(const PriceQuote& prices) {
    if (!(std::isfinite(prices.usd0) && prices.usd0 > 0.0)) {
        throw NoPriceData("token0 price unavailable");
    }
    if (!(std::isfinite(prices.usd1) && prices.usd1 > 0.0)) {
        throw NoPriceData("token1 price unavailable");
    }
}

double target_token0_ratio(const U256& sqrt_price_x96,
                           const TickRange& range,
                           int decimals0,
                           int decimals1,
                           const PriceQuote& prices) {
    require_prices(prices);

    const double sa = to_double(tick_math::get_sqrt_ratio_at_tick(range.lower)) / Q96_DOUBLE;
    const double sb = to_double(tick_math::get_sqrt_ratio_at_tick(range.upper)) / Q96_DOUBLE;
    double sp = to_double(sqrt_price_x96) / Q96_DOUBLE;
    sp = std::min(std::max(sp, sa), sb);

    // Token requirements per unit of liquidity
    const double amount0 = (sb - sp) / (sp * sb);
    const double amount1 = sp - sa;

    const double v0 = amount0 / std::pow(10.0, decimals0) * prices.usd0;
    const double v1 = amount1 / std::pow(10.0, decimals1) * prices.usd1;
    if (v0 + v1 <= 0.0) {
        throw InvalidRange("range holds no value at the current price");
    }
    return v0 / (v0 + v1);
}

// =============================================================================
// RebalancePlanner
// =============================================================================

RebalancePlanner::RebalancePlanner(const PoolConfig& pool, const StrategyConfig& strategy)
    : pool_(pool), strategy_(strategy) {}

TickRange RebalancePlanner::compute_range(const PoolState& state) const {
    return compute_new_range(state.tick, state.tick_spacing, strategy_.range_pct);
}

uint32_t RebalancePlanner::fee_pips(const PoolState& state) const {
    if (state.lp_fee > 0 && state.lp_fee < fees::FEE_DENOMINATOR) return state.lp_fee;
    if (pool_.key.fee < fees::FEE_DENOMINATOR) return pool_.key.fee;
    return 0;
}

double RebalancePlanner::value_usd(U128 amount, int decimals, double usd) const {
    return static_cast<double>(amount) / std::pow(10.0, decimals) * usd;
}

SwapPlan RebalancePlanner::plan_swap(const TokenAmounts& holdings,
                                     double target_ratio0,
                                     const PriceQuote& prices,
                                     uint32_t fee) const {
    return size_swap(holdings, target_ratio0, prices, fee, strategy_.materiality_usd);
}

SwapPlan RebalancePlanner::swap_to_ratio(const PoolState& state,
                                         const TickRange& range,
                                         const TokenAmounts& holdings,
                                         double target_ratio0,
                                         const PriceQuote& prices) const {
    SwapPlan swap = plan_swap(holdings, target_ratio0, prices, fee_pips(state));
    if (swap.required() || holdings.is_zero()) return swap;
    if (liquidity_for_balances(state, range, holdings) > 0) return swap;

    spdlog::debug("holdings {} / {} fund no liquidity in [{}, {}), swapping below the floor",
                  to_string(holdings.amount0), to_string(holdings.amount1), range.lower, range.upper);
    return size_swap(holdings, target_ratio0, prices, fee_pips(state), 0.0);
}

SwapPlan RebalancePlanner::size_swap(const TokenAmounts& holdings,
                                     double target_ratio0,
                                     const PriceQuote& prices,
                                     uint32_t fee,
                                     double floor_usd) const {
    require_prices(prices);

    SwapPlan swap;
    const double v0 = value_usd(holdings.amount0, pool_.decimals0, prices.usd0);
    const double v1 = value_usd(holdings.amount1, pool_.decimals1, prices.usd1);
    const double total = v0 + v1;
    const double phi = static_cast<double>(fee) / fees::FEE_DENOMINATOR;

    swap.imbalance_usd = v0 - target_ratio0 * total;
    if (std::fabs(swap.imbalance_usd) < floor_usd || swap.imbalance_usd == 0.0) {
        return swap;
    }

    // Sell s USD of one side, receive s * (1 - phi) of the other, land on target
    if (swap.imbalance_usd > 0.0) {
        const double sell_usd = swap.imbalance_usd / (1.0 - target_ratio0 * phi);
        swap.amount_in = min_u128(units_for_usd(sell_usd, pool_.decimals0, prices.usd0), holdings.amount0);
        const double in_usd = value_usd(swap.amount_in, pool_.decimals0, prices.usd0);
        swap.expected_out = units_for_usd(in_usd * (1.0 - phi), pool_.decimals1, prices.usd1);
        swap.direction = SwapDirection::ZeroForOne;
    } else {
        const double sell_usd = -swap.imbalance_usd / (1.0 - phi + target_ratio0 * phi);
        swap.amount_in = min_u128(units_for_usd(sell_usd, pool_.decimals1, prices.usd1), holdings.amount1);
        const double in_usd = value_usd(swap.amount_in, pool_.decimals1, prices.usd1);
        swap.expected_out = units_for_usd(in_usd * (1.0 - phi), pool_.decimals0, prices.usd0);
        swap.direction = SwapDirection::OneForZero;
    }

    if (swap.amount_in == 0) {
        swap.direction = SwapDirection::None;
        swap.expected_out = 0;
        return swap;
    }

    const uint32_t bps = std::min(strategy_.slippage_bps(), BPS);
    swap.min_amount_out = scale({swap.expected_out, 0}, BPS - bps, BPS).amount0;
    return swap;
}

U128 RebalancePlanner::liquidity_for_balances(const PoolState& state,
                                              const TickRange& range,
                                              const TokenAmounts& balances) const {
    const TokenAmounts usable = scale(balances, BPS, BPS + strategy_.slippage_bps());
    return liquidity_math::liquidity_for_amounts(
        state.sqrt_price_x96,
        tick_math::get_sqrt_ratio_at_tick(range.lower),
        tick_math::get_sqrt_ratio_at_tick(range.upper),
        usable.amount0,
        usable.amount1);
}

TokenAmounts RebalancePlanner::mint_guards(const PoolState& state,
                                           const TickRange& range,
                                           U128 liquidity) const {
    TokenAmounts required = liquidity_math::amounts_for_liquidity(
        liquidity,
        state.sqrt_price_x96,
        tick_math::get_sqrt_ratio_at_tick(range.lower),
        tick_math::get_sqrt_ratio_at_tick(range.upper));

    // The pool rounds amounts owed up
    if (required.amount0 > 0) required.amount0 += 1;
    if (required.amount1 > 0) required.amount1 += 1;

    return scale(required, BPS + strategy_.slippage_bps(), BPS);
}

RebalancePlan RebalancePlanner::plan(const PoolState& state,
                                     const std::optional<Position>& current,
                                     const TokenAmounts& wallet,
                                     const PriceQuote& prices) const {
    require_prices(prices);

    RebalancePlan plan;
    plan.planned_tick = state.tick;
    plan.new_range = compute_range(state);

    if (current && current->liquidity > 0) {
        plan.expected_withdrawal = liquidity_math::amounts_for_liquidity(
            current->liquidity,
            state.sqrt_price_x96,
            tick_math::get_sqrt_ratio_at_tick(current->tick_lower),
            tick_math::get_sqrt_ratio_at_tick(current->tick_upper));
    }
    plan.holdings = wallet + plan.expected_withdrawal;

    plan.target_ratio0 = target_token0_ratio(state.sqrt_price_x96, plan.new_range,
                                             pool_.decimals0, pool_.decimals1, prices);
    plan.value0_usd = value_usd(plan.holdings.amount0, pool_.decimals0, prices.usd0);
    plan.value1_usd = value_usd(plan.holdings.amount1, pool_.decimals1, prices.usd1);

    plan.swap = swap_to_ratio(state, plan.new_range, plan.holdings, plan.target_ratio0, prices);

    plan.post_swap = plan.holdings;
    if (plan.swap.direction == SwapDirection::ZeroForOne) {
        plan.post_swap.amount0 -= plan.swap.amount_in;
        plan.post_swap.amount1 += plan.swap.expected_out;
    } else if (plan.swap.direction == SwapDirection::OneForZero) {
        plan.post_swap.amount1 -= plan.swap.amount_in;
        plan.post_swap.amount0 += plan.swap.expected_out;
    }

    plan.new_liquidity = liquidity_for_balances(state, plan.new_range, plan.post_swap);
    plan.mint_amounts = liquidity_math::amounts_for_liquidity(
        plan.new_liquidity,
        state.sqrt_price_x96,
        tick_math::get_sqrt_ratio_at_tick(plan.new_range.lower),
        tick_math::get_sqrt_ratio_at_tick(plan.new_range.upper));
    plan.mint_max = mint_guards(state, plan.new_range, plan.new_liquidity);

    spdlog::debug("plan: range [{}, {}) target0={:.4f} imbalance=${:.4f} swap={} liquidity={}",
                  plan.new_range.lower, plan.new_range.upper, plan.target_ratio0,
                  plan.swap.imbalance_usd, to_string(plan.swap.direction),
                  to_string(plan.new_liquidity));
    return plan;
}

} // namespace lpm
