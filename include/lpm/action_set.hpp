#ifndef LPM_ACTION_SET_HPP
#define LPM_ACTION_SET_HPP

#include <string>
#include <vector>

#include "planner.hpp"
#include "pool.hpp"
#include "types.hpp"
#include "uint256.hpp"

namespace lpm {

// =============================================================================
// Actions (position manager / router vocabulary)
// =============================================================================

enum class ActionKind : uint8_t {
    IncreaseLiquidity,
    DecreaseLiquidity,
    MintPosition,
    BurnPosition,
    SettlePair,
    TakePair,
    CloseCurrency,
    Sweep,
    SwapExactInSingle,
    SettleAll,
    TakeAll,
    Transfer,          // Plain ERC-20 transfer, outside the position manager
};

const char* to_string(ActionKind kind);

// One sub-action. Only the fields relevant to `kind` are meaningful.
struct Action {
    ActionKind kind = ActionKind::SettlePair;

    U256 token_id;                 // Increase / Decrease / Burn
    PoolKey key;                   // Mint / Swap
    int32_t tick_lower = 0;        // Mint
    int32_t tick_upper = 0;
    U128 liquidity = 0;            // Increase / Decrease / Mint

    // Max guards for Increase/Mint, min guards for Decrease/Burn
    U128 amount0 = 0;
    U128 amount1 = 0;

    Currency currency0;            // SettlePair / TakePair
    Currency currency1;
    Currency currency;             // CloseCurrency / Sweep / SettleAll / TakeAll / Transfer
    Address recipient{};           // Mint owner, TakePair / Sweep / Transfer target

    bool zero_for_one = false;     // Swap
    U128 amount_in = 0;            // Swap / SettleAll max / Transfer amount
    U128 amount_out_min = 0;       // Swap / TakeAll min
};

// Contract an action set is sent to
enum class ActionTarget : uint8_t {
    PositionManager,   // modifyLiquidities(unlockData, deadline)
    Router,            // execute(V4_SWAP, inputs, deadline)
    Token,             // ERC-20 transfer
};

// Ordered sub-actions submitted as one transaction
struct ActionSet {
    std::string label;
    ActionTarget target = ActionTarget::PositionManager;
    std::vector<Action> actions;
    U128 native_value = 0;         // msg.value for native-currency settlement

    bool contains(ActionKind kind) const;
};

// =============================================================================
// Encoding choice
// =============================================================================

enum class Encoding : uint8_t {
    Atomic,       // One netted instruction set
    Sequential,   // Withdraw -> swap-to-ratio -> mint, re-pricing between steps
};

const char* to_string(Encoding encoding);

struct EncodingInputs {
    bool atomic_enabled = true;          // Configuration allows the atomic path
    bool protocol_multi_action = true;   // Same-transaction composition available
    bool swap_required = false;          // Planned swap above the materiality floor
    TokenAmounts wallet;                 // Balances already in the wallet
    TokenAmounts withdraw_min;           // Guaranteed yield of the withdraw
    TokenAmounts mint_max;               // Worst-case cost of the mint
};

struct EncodingDecision {
    Encoding encoding = Encoding::Sequential;
    std::string reason;
};

// Decision rule, evaluated before anything is submitted:
//   1. atomic disabled by configuration                 -> Sequential
//   2. protocol lacks same-transaction composition      -> Sequential
//   3. a material swap is required (netting cannot swap) -> Sequential
//   4. wallet + withdraw_min < mint_max for either token -> Sequential
//   5. otherwise                                         -> Atomic
EncodingDecision choose_encoding(const EncodingInputs& inputs);

// =============================================================================
// Action set builders
// =============================================================================

namespace actions {

// DECREASE(all) + TAKE_PAIR -> wallet
ActionSet withdraw(const Position& position, const TokenAmounts& min_out, const Address& recipient);

// DECREASE(percent of liquidity) + TAKE_PAIR, then BURN when nothing is left.
// Throws InvalidInput unless 0 < percent <= 100.
ActionSet close(const Position& position, double percent, const TokenAmounts& min_out,
                const Address& recipient);

// Liquidity removed by close(position, percent), rounding down
U128 close_liquidity(U128 liquidity, double percent);

// DECREASE(0) + TAKE_PAIR: collects accrued fees only
ActionSet collect_fees(const Position& position, const Address& recipient);

// INCREASE + SETTLE_PAIR into an existing position
ActionSet increase(const Position& position, U128 liquidity, const TokenAmounts& max_in);

// MINT + SETTLE_PAIR (+ SWEEP of native change)
ActionSet mint(const PoolKey& key, const TickRange& range, U128 liquidity,
               const TokenAmounts& max_in, const Address& owner);

// SWAP_EXACT_IN_SINGLE + SETTLE_ALL + TAKE_ALL through the router
ActionSet swap(const PoolKey& key, const SwapPlan& plan);

// DECREASE(all) + MINT + CLOSE_CURRENCY x2: flash accounting nets the two
ActionSet atomic_rebalance(const Position& position, const TokenAmounts& withdraw_min,
                           const TickRange& range, U128 liquidity,
                           const TokenAmounts& max_in, const Address& owner);

// ERC-20 transfer of a remainder, submitted under `label`
ActionSet transfer(const Currency& currency, const Address& to, U128 amount,
                   const std::string& label = "sweep");

} // namespace actions

} // namespace lpm

#endif // LPM_ACTION_SET_HPP
