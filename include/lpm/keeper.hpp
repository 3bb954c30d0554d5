#ifndef LPM_KEEPER_HPP
#define LPM_KEEPER_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "chain.hpp"
#include "config.hpp"
#include "planner.hpp"
#include "price_source.hpp"
#include "report.hpp"
#include "retry.hpp"

namespace lpm {

// =============================================================================
// Position Keeper (execution coordinator)
// =============================================================================

// Drives one position through check, rebalance, fee compounding and
// recovery. Every public operation returns a RunReport; failures are
// recorded in the report rather than thrown.
//
// Execution order for the sequential path:
//   withdraw -> settle -> swap-to-ratio -> settle -> re-price -> mint
// Each step waits for its receipt before the next one is planned.
class PositionKeeper {
public:
    // Unix seconds, used for transaction deadlines
    using Clock = std::function<uint64_t()>;

    PositionKeeper(Config config,
                   ChainClient& chain,
                   PriceSource& prices,
                   RetryPolicy retry = RetryPolicy{},
                   Sleeper settle_sleeper = sleep_for,
                   Clock clock = system_clock_secs);

    // Read-only: snapshot and drift classification
    RunReport check(const U256& position_id);

    // Rebalances when the position is drifting or out of range
    RunReport run(const U256& position_id);

    // Collects accrued fees and adds them back into the same range
    RunReport compound(const U256& position_id);

    // Mints a fresh position from wallet balances after a failed rebalance
    // left the funds unallocated
    RunReport recover();

    // Removes `percent` (0, 100] of the liquidity to the wallet; a full
    // close also burns the position
    RunReport close(const U256& position_id, double percent = 100.0);

    const Config& config() const { return config_; }

    static uint64_t system_clock_secs();

private:
    // Snapshots (reads retry on TransientError)
    Position load_position(const U256& id);
    PoolState read_pool();
    TokenAmounts read_balances();
    PriceQuote read_prices();

    // Balances the strategy may commit: native currency keeps a gas reserve
    TokenAmounts spendable(const TokenAmounts& balances) const;

    // True when the tick has left `range` or drifted past the threshold
    bool plan_invalidated(const TickRange& range, int32_t tick) const;

    uint64_t deadline() const;
    void settle();

    // Netted withdraw + mint of the position's own value
    struct AtomicSizing {
        U128 liquidity = 0;
        TokenAmounts withdraw_min;
        TokenAmounts mint_max;
    };

    void rebalance(RunReport& report, const Position& position,
                   const PoolState& pool, const TokenAmounts& wallet);
    AtomicSizing size_atomic(const PoolState& pool, const RebalancePlan& plan) const;
    EncodingDecision decide(const RebalancePlan& plan, const AtomicSizing& sizing,
                            const TokenAmounts& wallet) const;
    void run_atomic(RunReport& report, const Position& position,
                    const RebalancePlan& plan, const AtomicSizing& sizing);
    void run_sequential(RunReport& report, const Position& position,
                        const RebalancePlan& plan);

    // Swap-to-ratio and mint from whatever the wallet holds now
    void swap_and_mint(RunReport& report, TickRange range, TokenAmounts balances);

    // Submits, waits for the receipt and records the step.
    // Throws RevertError when the transaction reverts.
    TxReceipt execute(RunReport& report, const std::string& step, const ActionSet& set);

    // Extracts the minted id and checks the new position holds liquidity
    void verify_new_position(RunReport& report, const TxReceipt& receipt);

    // Sends what the wallet holds above `keep` to the harvest address
    void sweep_dust(RunReport& report, const TokenAmounts& keep);
    void plan_dry_run(RunReport& report, const RebalancePlan& plan,
                      Encoding encoding, bool withdraw);

    Config config_;
    ChainClient& chain_;
    PriceSource& prices_;
    RetryPolicy retry_;
    Sleeper settle_sleeper_;
    Clock clock_;
    RebalancePlanner planner_;
};

} // namespace lpm

#endif // LPM_KEEPER_HPP
