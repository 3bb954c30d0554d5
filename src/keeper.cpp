#include "lpm/keeper.hpp"
#include "lpm/drift.hpp"
#include "lpm/errors.hpp"
#include "lpm/liquidity_math.hpp"
#include "lpm/tick_math.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <utility>

namespace lpm {

namespace {

constexpr uint32_t BPS = 10000;

std::string range_str(const TickRange& r) {
    return "[" + std::to_string(r.lower) + ", " + std::to_string(r.upper) + ")";
}

std::string amounts_str(const TokenAmounts& a) {
    return to_string(a.amount0) + " / " + to_string(a.amount1);
}

// Records the failure on the report; the report is the caller's result
template <typename Fn>
void guarded(RunReport& report, Fn&& body) {
    try {
        body();
    } catch (const LpmError& e) {
        report.outcome = Outcome::Failed;
        report.error_code = e.code();
        report.error = e.what();
        spdlog::error("{} failed [{}]: {}", report.operation, error_code_name(e.code()), e.what());
    } catch (const std::exception& e) {
        report.outcome = Outcome::Failed;
        report.error = e.what();
        spdlog::error("{} failed: {}", report.operation, e.what());
    }
}

} // namespace

PositionKeeper::PositionKeeper(Config config,
                               ChainClient& chain,
                               PriceSource& prices,
                               RetryPolicy retry,
                               Sleeper settle_sleeper,
                               Clock clock)
    : config_(std::move(config)),
      chain_(chain),
      prices_(prices),
      retry_(std::move(retry)),
      settle_sleeper_(std::move(settle_sleeper)),
      clock_(std::move(clock)),
      planner_(config_.pool, config_.strategy) {}

uint64_t PositionKeeper::system_clock_secs() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

// =============================================================================
// Snapshots
// =============================================================================

Position PositionKeeper::load_position(const U256& id) {
    Position position = retry_.run("read position", [&] { return chain_.read_position(id); });
    if (position.owner != chain_.wallet()) {
        throw UnauthorizedError("position " + to_string(id) + " is owned by " +
                                hex::encode(position.owner) + ", not the configured wallet");
    }
    if (position.key != config_.pool.key) {
        throw InvalidInput("position " + to_string(id) + " belongs to a different pool");
    }
    return position;
}

PoolState PositionKeeper::read_pool() {
    return retry_.run("read pool state", [&] { return chain_.read_pool_state(config_.pool); });
}

TokenAmounts PositionKeeper::read_balances() {
    return retry_.run("read balances", [&] { return chain_.read_balances(config_.pool.key); });
}

PriceQuote PositionKeeper::read_prices() {
    PriceQuote quote = retry_.run("fetch prices", [&] { return prices_.quote(config_.pool.key); });
    require_prices(quote);
    return quote;
}

TokenAmounts PositionKeeper::spendable(const TokenAmounts& balances) const {
    TokenAmounts out = balances;
    const U128 reserve = config_.execution.native_gas_reserve;
    if (config_.pool.key.currency0.is_native()) {
        out.amount0 = out.amount0 > reserve ? out.amount0 - reserve : 0;
    }
    return out;
}

bool PositionKeeper::plan_invalidated(const TickRange& range, int32_t tick) const {
    if (!range.contains(tick)) return true;
    return drift_pct(tick, range.lower, range.upper) > config_.strategy.drift_threshold_pct;
}

uint64_t PositionKeeper::deadline() const {
    return clock_() + static_cast<uint64_t>(config_.execution.deadline_secs);
}

void PositionKeeper::settle() {
    if (config_.execution.settle_delay_ms > 0) {
        settle_sleeper_(std::chrono::milliseconds(config_.execution.settle_delay_ms));
    }
}

// =============================================================================
// Operations
// =============================================================================

RunReport PositionKeeper::check(const U256& position_id) {
    RunReport report;
    report.operation = "check";
    report.position_id = position_id;

    guarded(report, [&] {
        Position position = load_position(position_id);
        report.position = position;
        PoolState pool = read_pool();
        report.pool = pool;
        report.wallet = read_balances();

        DriftReport drift = evaluate_drift(pool.tick, position.tick_lower, position.tick_upper,
                                           config_.strategy.drift_threshold_pct,
                                           config_.strategy.monitoring_enabled);
        report.drift = drift;
        report.path = drift.needs_rebalance() ? RunPath::Rebalance : RunPath::NoOp;
        report.outcome = Outcome::NoOp;

        spdlog::info("position {} tick {} range [{}, {}) drift {:.1f}% ({})",
                     to_string(position_id), pool.tick, position.tick_lower,
                     position.tick_upper, drift.drift_pct, to_string(drift.state));
    });
    return report;
}

RunReport PositionKeeper::run(const U256& position_id) {
    RunReport report;
    report.operation = "run";
    report.position_id = position_id;

    guarded(report, [&] {
        Position position = load_position(position_id);
        report.position = position;
        PoolState pool = read_pool();
        report.pool = pool;
        TokenAmounts wallet = read_balances();
        report.wallet = wallet;

        DriftReport drift = evaluate_drift(pool.tick, position.tick_lower, position.tick_upper,
                                           config_.strategy.drift_threshold_pct,
                                           config_.strategy.monitoring_enabled);
        report.drift = drift;

        if (!drift.needs_rebalance()) {
            report.path = RunPath::NoOp;
            report.outcome = Outcome::NoOp;
            spdlog::info("position {} {} (drift {:.1f}%), nothing to do",
                         to_string(position_id), to_string(drift.state), drift.drift_pct);
            return;
        }
        if (position.liquidity == 0) {
            throw InvalidInput("position " + to_string(position_id) +
                               " holds no liquidity; use recover to mint from the wallet");
        }

        report.path = RunPath::Rebalance;
        spdlog::info("position {} {} (drift {:.1f}% toward {}), rebalancing",
                     to_string(position_id), to_string(drift.state), drift.drift_pct,
                     to_string(drift.direction));
        rebalance(report, position, pool, wallet);
    });
    return report;
}

RunReport PositionKeeper::compound(const U256& position_id) {
    RunReport report;
    report.operation = "compound";
    report.position_id = position_id;
    report.path = RunPath::Compound;

    guarded(report, [&] {
        Position position = load_position(position_id);
        report.position = position;
        if (position.liquidity == 0) {
            throw InvalidInput("position " + to_string(position_id) + " holds no liquidity");
        }
        report.pool = read_pool();
        TokenAmounts before = read_balances();
        report.wallet = before;

        if (config_.execution.dry_run) {
            report.add_step("collect", StepStatus::Planned);
            report.add_step("increase", StepStatus::Planned);
            report.outcome = Outcome::DryRun;
            return;
        }

        execute(report, "collect", actions::collect_fees(position, chain_.wallet()));
        settle();

        const TokenAmounts collected = read_balances().saturating_sub(before);
        if (collected.is_zero()) {
            report.add_step("increase", StepStatus::Skipped, {}, "no fees collected");
            report.outcome = Outcome::NoOp;
            return;
        }

        const PoolState pool = read_pool();
        const TickRange range{position.tick_lower, position.tick_upper};
        const U128 liquidity = planner_.liquidity_for_balances(pool, range, collected);
        if (liquidity == 0) {
            report.add_step("increase", StepStatus::Skipped, {},
                            "collected " + amounts_str(collected) + " cannot fund liquidity at the current price");
            report.outcome = Outcome::Success;
            return;
        }

        const TokenAmounts max_in = min_each(planner_.mint_guards(pool, range, liquidity), collected);
        execute(report, "increase", actions::increase(position, liquidity, max_in));

        Position after = retry_.run("read position", [&] { return chain_.read_position(position_id); });
        report.new_liquidity = after.liquidity;
        report.outcome = Outcome::Success;
        spdlog::info("compounded {} into position {}, liquidity now {}",
                     amounts_str(collected), to_string(position_id), to_string(after.liquidity));
    });
    return report;
}

RunReport PositionKeeper::recover() {
    RunReport report;
    report.operation = "recover";
    report.path = RunPath::Recover;

    guarded(report, [&] {
        PoolState pool = read_pool();
        report.pool = pool;
        TokenAmounts wallet = read_balances();
        report.wallet = wallet;

        RebalancePlan plan = planner_.plan(pool, std::nullopt, spendable(wallet), read_prices());
        report.plan = plan;
        report.new_range = plan.new_range;
        report.encoding = Encoding::Sequential;
        report.encoding_reason = "recovery mints from wallet balances";

        if (plan.new_liquidity == 0) {
            throw InvalidInput("wallet balances " + amounts_str(wallet) + " cannot fund a position");
        }
        if (config_.execution.dry_run) {
            plan_dry_run(report, plan, Encoding::Sequential, false);
            return;
        }
        swap_and_mint(report, plan.new_range, wallet);
    });
    return report;
}

RunReport PositionKeeper::close(const U256& position_id, double percent) {
    RunReport report;
    report.operation = "close";
    report.position_id = position_id;
    report.path = RunPath::Close;

    guarded(report, [&] {
        if (!(percent > 0.0 && percent <= 100.0)) {
            throw InvalidInput("close percentage must be in (0, 100], got " + std::to_string(percent));
        }

        Position position = load_position(position_id);
        report.position = position;
        if (position.liquidity == 0) {
            throw InvalidInput("position " + to_string(position_id) + " holds no liquidity");
        }
        const PoolState pool = read_pool();
        report.pool = pool;
        report.wallet = read_balances();

        const U128 removed = actions::close_liquidity(position.liquidity, percent);
        const TokenAmounts expected = liquidity_math::amounts_for_liquidity(
            removed, pool.sqrt_price_x96,
            tick_math::get_sqrt_ratio_at_tick(position.tick_lower),
            tick_math::get_sqrt_ratio_at_tick(position.tick_upper));
        const uint32_t slippage = std::min(config_.strategy.slippage_bps(), BPS);
        const TokenAmounts min_out = scale(expected, BPS - slippage, BPS);
        const bool burn = removed == position.liquidity;

        spdlog::info("closing {:.2f}% of position {}: liquidity {} for at least {}{}",
                     percent, to_string(position_id), to_string(removed), amounts_str(min_out),
                     burn ? ", burning it" : "");

        if (config_.execution.dry_run) {
            report.add_step("close", StepStatus::Planned, {},
                            "liquidity " + to_string(removed) + (burn ? " and burn" : ""));
            report.outcome = Outcome::DryRun;
            return;
        }

        execute(report, "close", actions::close(position, percent, min_out, chain_.wallet()));

        if (!burn) {
            Position after = retry_.run("read position", [&] { return chain_.read_position(position_id); });
            report.new_liquidity = after.liquidity;
        }
        report.outcome = Outcome::Success;
    });
    return report;
}

// =============================================================================
// Rebalance
// =============================================================================

namespace {

TokenAmounts withdraw_floor(const RebalancePlan& plan, const StrategyConfig& strategy) {
    return scale(plan.expected_withdrawal, BPS - std::min(strategy.slippage_bps(), BPS), BPS);
}

} // namespace

PositionKeeper::AtomicSizing PositionKeeper::size_atomic(const PoolState& pool,
                                                        const RebalancePlan& plan) const {
    AtomicSizing sizing;
    // Re-center the position's own value; the wallet only backs the
    // difference between the mint guards and the withdrawal floor
    sizing.withdraw_min = withdraw_floor(plan, config_.strategy);
    sizing.liquidity = planner_.liquidity_for_balances(pool, plan.new_range, plan.expected_withdrawal);
    sizing.mint_max = planner_.mint_guards(pool, plan.new_range, sizing.liquidity);
    return sizing;
}

EncodingDecision PositionKeeper::decide(const RebalancePlan& plan, const AtomicSizing& sizing,
                                        const TokenAmounts& wallet) const {
    EncodingInputs in;
    in.atomic_enabled = config_.strategy.prefer_atomic;
    in.protocol_multi_action = chain_.capabilities().multi_action;
    in.swap_required = plan.swap.required();
    in.wallet = wallet;
    in.withdraw_min = sizing.withdraw_min;
    in.mint_max = sizing.mint_max;

    EncodingDecision decision = choose_encoding(in);
    if (decision.encoding == Encoding::Atomic && sizing.liquidity == 0) {
        return {Encoding::Sequential, "expected withdrawal cannot fund the new range"};
    }
    return decision;
}

void PositionKeeper::rebalance(RunReport& report, const Position& position,
                               const PoolState& pool, const TokenAmounts& wallet) {
    const PriceQuote quote = read_prices();
    const TokenAmounts spend = spendable(wallet);

    RebalancePlan plan = planner_.plan(pool, position, spend, quote);
    AtomicSizing sizing = size_atomic(pool, plan);
    EncodingDecision decision = decide(plan, sizing, spend);
    PoolState committed = pool;

    if (decision.encoding == Encoding::Atomic) {
        // One transaction, so the snapshot it commits against must be fresh
        PoolState latest = read_pool();
        if (latest.sqrt_price_x96 != pool.sqrt_price_x96) {
            if (plan_invalidated(plan.new_range, latest.tick)) {
                spdlog::info("tick moved {} -> {}, re-deriving the range", pool.tick, latest.tick);
            }
            report.pool = latest;
            committed = latest;
            plan = planner_.plan(latest, position, spend, quote);
            sizing = size_atomic(latest, plan);
            decision = decide(plan, sizing, spend);
        }
    }

    if (decision.encoding == Encoding::Atomic) {
        plan.new_liquidity = sizing.liquidity;
        plan.mint_max = sizing.mint_max;
        plan.mint_amounts = liquidity_math::amounts_for_liquidity(
            sizing.liquidity,
            committed.sqrt_price_x96,
            tick_math::get_sqrt_ratio_at_tick(plan.new_range.lower),
            tick_math::get_sqrt_ratio_at_tick(plan.new_range.upper));
    }

    report.plan = plan;
    report.new_range = plan.new_range;
    report.encoding = decision.encoding;
    report.encoding_reason = decision.reason;
    spdlog::info("plan: new range {} swap {} encoding {} ({})", range_str(plan.new_range),
                 to_string(plan.swap.direction), to_string(decision.encoding), decision.reason);

    if (plan.new_liquidity == 0) {
        throw InvalidInput("holdings " + amounts_str(plan.holdings) +
                           " cannot fund liquidity in " + range_str(plan.new_range));
    }

    if (config_.execution.dry_run) {
        plan_dry_run(report, plan, decision.encoding, true);
        if (decision.encoding == Encoding::Atomic && chain_.capabilities().dry_run) {
            chain_.dry_run(actions::atomic_rebalance(position, sizing.withdraw_min, plan.new_range,
                                                     sizing.liquidity, sizing.mint_max, chain_.wallet()),
                           deadline());
        }
        return;
    }

    if (decision.encoding == Encoding::Atomic) {
        run_atomic(report, position, plan, sizing);
    } else {
        run_sequential(report, position, plan);
    }
}

void PositionKeeper::run_atomic(RunReport& report, const Position& position,
                                const RebalancePlan& plan, const AtomicSizing& sizing) {
    ActionSet set = actions::atomic_rebalance(position, sizing.withdraw_min, plan.new_range,
                                              sizing.liquidity, sizing.mint_max, chain_.wallet());

    // A failed simulation aborts; there is no fallback to the sequential path
    if (chain_.capabilities().dry_run) {
        try {
            chain_.dry_run(set, deadline());
        } catch (const LpmError& e) {
            report.add_step("validate", StepStatus::Failed, {}, e.what());
            throw;
        }
        report.add_step("validate", StepStatus::Succeeded, {}, "simulation passed");
    }

    TxReceipt receipt = execute(report, "rebalance", set);
    verify_new_position(report, receipt);
    report.outcome = Outcome::Success;
    // The atomic mint never draws on the pre-run wallet, so only the surplus goes
    sweep_dust(report, report.wallet.value_or(TokenAmounts{}));
}

void PositionKeeper::run_sequential(RunReport& report, const Position& position,
                                    const RebalancePlan& plan) {
    execute(report, "withdraw",
            actions::withdraw(position, withdraw_floor(plan, config_.strategy), chain_.wallet()));
    settle();

    TokenAmounts balances = read_balances();
    spdlog::info("withdrawn, wallet holds {}", amounts_str(balances));
    swap_and_mint(report, plan.new_range, balances);
}

void PositionKeeper::swap_and_mint(RunReport& report, TickRange range, TokenAmounts balances) {
    bool degraded = false;

    PoolState pool = read_pool();
    if (plan_invalidated(range, pool.tick)) {
        range = planner_.compute_range(pool);
        spdlog::info("tick {} invalidated the plan, new range {}", pool.tick, range_str(range));
    }

    // Swap sized from what actually landed in the wallet
    const PriceQuote quote = read_prices();
    const double ratio = target_token0_ratio(pool.sqrt_price_x96, range, config_.pool.decimals0,
                                             config_.pool.decimals1, quote);
    const SwapPlan swap = planner_.swap_to_ratio(pool, range, spendable(balances), ratio, quote);

    if (!swap.required()) {
        report.add_step("swap", StepStatus::Skipped, {}, "imbalance below materiality floor");
    } else {
        try {
            execute(report, "swap", actions::swap(config_.pool.key, swap));
        } catch (const RevertError& e) {
            report.steps.back().status = StepStatus::Degraded;
            degraded = true;
            spdlog::warn("swap reverted, minting with unbalanced holdings: {}", e.what());
        }
        settle();
        balances = read_balances();

        pool = read_pool();
        if (plan_invalidated(range, pool.tick)) {
            range = planner_.compute_range(pool);
            spdlog::info("tick {} moved during the swap, new range {}", pool.tick, range_str(range));
        }
    }

    const TokenAmounts spend = spendable(balances);
    const U128 liquidity = planner_.liquidity_for_balances(pool, range, spend);
    if (liquidity == 0) {
        throw InvalidInput("balances " + amounts_str(spend) + " cannot fund liquidity in " + range_str(range));
    }

    const TokenAmounts max_in = min_each(planner_.mint_guards(pool, range, liquidity), spend);
    report.new_range = range;
    TxReceipt receipt = execute(report, "mint",
                                actions::mint(config_.pool.key, range, liquidity, max_in, chain_.wallet()));
    verify_new_position(report, receipt);

    report.outcome = degraded ? Outcome::Degraded : Outcome::Success;
    sweep_dust(report, TokenAmounts{});
}

// =============================================================================
// Steps
// =============================================================================

TxReceipt PositionKeeper::execute(RunReport& report, const std::string& step, const ActionSet& set) {
    spdlog::info("submitting {} ({} actions)", step, set.actions.size());

    std::string tx_hash;
    TxReceipt receipt;
    try {
        tx_hash = chain_.submit(set, deadline());
        receipt = chain_.wait_for_receipt(tx_hash);
    } catch (const LpmError& e) {
        report.add_step(step, StepStatus::Failed, tx_hash, e.what());
        throw;
    }

    if (!receipt.success) {
        report.add_step(step, StepStatus::Failed, tx_hash, "transaction reverted");
        throw RevertError(step + " transaction reverted", tx_hash);
    }

    report.add_step(step, StepStatus::Succeeded, tx_hash);
    spdlog::info("{} confirmed in block {}: {}", step, receipt.block_number, tx_hash);
    return receipt;
}

void PositionKeeper::verify_new_position(RunReport& report, const TxReceipt& receipt) {
    const U256 id = extract_new_position_id(receipt, chain_.position_manager(), chain_.wallet());
    report.new_position_id = id;

    Position minted = retry_.run("read new position", [&] { return chain_.read_position(id); });
    if (minted.liquidity == 0) {
        throw ChainError("new position " + to_string(id) + " holds no liquidity");
    }
    report.new_liquidity = minted.liquidity;
    report.new_range = TickRange{minted.tick_lower, minted.tick_upper};
    spdlog::info("minted position {} in [{}, {}) with liquidity {}", to_string(id),
                 minted.tick_lower, minted.tick_upper, to_string(minted.liquidity));
}

void PositionKeeper::sweep_dust(RunReport& report, const TokenAmounts& keep) {
    if (!config_.execution.harvest_address) return;

    // Remainders stay in the wallet when the sweep fails; the run already succeeded
    TokenAmounts balances;
    try {
        balances = read_balances().saturating_sub(keep);
    } catch (const LpmError& e) {
        report.add_step("sweep", StepStatus::Failed, {}, e.what());
        spdlog::warn("dust sweep skipped: {}", e.what());
        return;
    }

    const Address to = hex::to_address(*config_.execution.harvest_address);
    const PoolKey& key = config_.pool.key;

    struct Leg {
        const Currency& currency;
        U128 balance;
        U128 minimum;
        const std::string& symbol;
    };
    const Leg legs[] = {
        {key.currency0, balances.amount0, config_.execution.dust_min0, config_.pool.symbol0},
        {key.currency1, balances.amount1, config_.execution.dust_min1, config_.pool.symbol1},
    };

    for (const auto& leg : legs) {
        if (leg.currency.is_native() || leg.balance == 0 || leg.balance < leg.minimum) continue;
        const std::string step = "sweep_" + leg.symbol;
        try {
            execute(report, step, actions::transfer(leg.currency, to, leg.balance, step));
        } catch (const LpmError& e) {
            spdlog::warn("dust sweep of {} failed: {}", leg.symbol, e.what());
        }
    }
}

void PositionKeeper::plan_dry_run(RunReport& report, const RebalancePlan& plan,
                                  Encoding encoding, bool withdraw) {
    if (encoding == Encoding::Atomic) {
        report.add_step("rebalance", StepStatus::Planned, {},
                        "liquidity " + to_string(plan.new_liquidity) + " in " + range_str(plan.new_range));
    } else {
        if (withdraw) {
            report.add_step("withdraw", StepStatus::Planned, {},
                            "expected " + amounts_str(plan.expected_withdrawal));
        }
        if (plan.swap.required()) {
            report.add_step("swap", StepStatus::Planned, {},
                            std::string(to_string(plan.swap.direction)) + " " + to_string(plan.swap.amount_in));
        } else {
            report.add_step("swap", StepStatus::Skipped, {}, "imbalance below materiality floor");
        }
        report.add_step("mint", StepStatus::Planned, {},
                        "liquidity " + to_string(plan.new_liquidity) + " in " + range_str(plan.new_range));
    }
    report.outcome = Outcome::DryRun;
    spdlog::info("dry run: {} steps planned, nothing submitted", report.steps.size());
}

} // namespace lpm
