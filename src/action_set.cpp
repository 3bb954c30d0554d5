#include "lpm/action_set.hpp"

#include "lpm/errors.hpp"

#include <algorithm>

namespace lpm {

const char* to_string(ActionKind kind) {
    switch (kind) {
        case ActionKind::IncreaseLiquidity: return "INCREASE_LIQUIDITY";
        case ActionKind::DecreaseLiquidity: return "DECREASE_LIQUIDITY";
        case ActionKind::MintPosition:      return "MINT_POSITION";
        case ActionKind::BurnPosition:      return "BURN_POSITION";
        case ActionKind::SettlePair:        return "SETTLE_PAIR";
        case ActionKind::TakePair:          return "TAKE_PAIR";
        case ActionKind::CloseCurrency:     return "CLOSE_CURRENCY";
        case ActionKind::Sweep:             return "SWEEP";
        case ActionKind::SwapExactInSingle: return "SWAP_EXACT_IN_SINGLE";
        case ActionKind::SettleAll:         return "SETTLE_ALL";
        case ActionKind::TakeAll:           return "TAKE_ALL";
        case ActionKind::Transfer:          return "TRANSFER";
    }
    return "UNKNOWN";
}

const char* to_string(Encoding encoding) {
    return encoding == Encoding::Atomic ? "atomic" : "sequential";
}

bool ActionSet::contains(ActionKind kind) const {
    return std::any_of(actions.begin(), actions.end(),
                       [kind](const Action& a) { return a.kind == kind; });
}

EncodingDecision choose_encoding(const EncodingInputs& in) {
    if (!in.atomic_enabled) {
        return {Encoding::Sequential, "atomic encoding disabled by configuration"};
    }
    if (!in.protocol_multi_action) {
        return {Encoding::Sequential, "protocol lacks same-transaction multi-action support"};
    }
    if (in.swap_required) {
        return {Encoding::Sequential, "a swap to the target ratio is required"};
    }

    const TokenAmounts available = in.wallet + in.withdraw_min;
    if (available.amount0 < in.mint_max.amount0) {
        return {Encoding::Sequential, "insufficient token0 buffer for worst-case net delta"};
    }
    if (available.amount1 < in.mint_max.amount1) {
        return {Encoding::Sequential, "insufficient token1 buffer for worst-case net delta"};
    }
    return {Encoding::Atomic, "netted withdraw and mint fit the wallet buffer"};
}

namespace actions {

namespace {

Action decrease(const Position& position, U128 liquidity, const TokenAmounts& min_out) {
    Action a;
    a.kind = ActionKind::DecreaseLiquidity;
    a.token_id = position.id;
    a.liquidity = liquidity;
    a.amount0 = min_out.amount0;
    a.amount1 = min_out.amount1;
    return a;
}

Action pair(ActionKind kind, const PoolKey& key, const Address& recipient = {}) {
    Action a;
    a.kind = kind;
    a.currency0 = key.currency0;
    a.currency1 = key.currency1;
    a.recipient = recipient;
    return a;
}

Action single(ActionKind kind, const Currency& currency) {
    Action a;
    a.kind = kind;
    a.currency = currency;
    return a;
}

Action mint_action(const PoolKey& key, const TickRange& range, U128 liquidity,
                   const TokenAmounts& max_in, const Address& owner) {
    Action a;
    a.kind = ActionKind::MintPosition;
    a.key = key;
    a.tick_lower = range.lower;
    a.tick_upper = range.upper;
    a.liquidity = liquidity;
    a.amount0 = max_in.amount0;
    a.amount1 = max_in.amount1;
    a.recipient = owner;
    return a;
}

Action sweep_native(const PoolKey& key, const Address& to) {
    Action a = single(ActionKind::Sweep, key.currency0);
    a.recipient = to;
    return a;
}

} // namespace

ActionSet withdraw(const Position& position, const TokenAmounts& min_out, const Address& recipient) {
    ActionSet set;
    set.label = "withdraw";
    set.actions.push_back(decrease(position, position.liquidity, min_out));
    set.actions.push_back(pair(ActionKind::TakePair, position.key, recipient));
    return set;
}

U128 close_liquidity(U128 liquidity, double percent) {
    if (!(percent > 0.0 && percent <= 100.0)) {
        throw InvalidInput("close percentage must be in (0, 100], got " + std::to_string(percent));
    }
    if (percent == 100.0) return liquidity;

    // Basis points keep the scaling exact in integer arithmetic
    const auto bps = static_cast<uint32_t>(percent * 100.0);
    return to_u128(U256(liquidity) * bps / 10000);
}

ActionSet close(const Position& position, double percent, const TokenAmounts& min_out,
                const Address& recipient) {
    const U128 removed = close_liquidity(position.liquidity, percent);

    ActionSet set;
    set.label = "close";
    set.actions.push_back(decrease(position, removed, min_out));
    set.actions.push_back(pair(ActionKind::TakePair, position.key, recipient));

    if (removed == position.liquidity) {
        Action burn;
        burn.kind = ActionKind::BurnPosition;
        burn.token_id = position.id;
        set.actions.push_back(burn);
    }
    return set;
}

ActionSet collect_fees(const Position& position, const Address& recipient) {
    ActionSet set;
    set.label = "collect";
    set.actions.push_back(decrease(position, 0, {}));
    set.actions.push_back(pair(ActionKind::TakePair, position.key, recipient));
    return set;
}

ActionSet increase(const Position& position, U128 liquidity, const TokenAmounts& max_in) {
    ActionSet set;
    set.label = "increase";

    Action a;
    a.kind = ActionKind::IncreaseLiquidity;
    a.token_id = position.id;
    a.liquidity = liquidity;
    a.amount0 = max_in.amount0;
    a.amount1 = max_in.amount1;
    set.actions.push_back(a);
    set.actions.push_back(pair(ActionKind::SettlePair, position.key));

    if (position.key.currency0.is_native()) {
        set.native_value = max_in.amount0;
        set.actions.push_back(sweep_native(position.key, position.owner));
    }
    return set;
}

ActionSet mint(const PoolKey& key, const TickRange& range, U128 liquidity,
               const TokenAmounts& max_in, const Address& owner) {
    ActionSet set;
    set.label = "mint";
    set.actions.push_back(mint_action(key, range, liquidity, max_in, owner));
    set.actions.push_back(pair(ActionKind::SettlePair, key));

    if (key.currency0.is_native()) {
        set.native_value = max_in.amount0;
        set.actions.push_back(sweep_native(key, owner));
    }
    return set;
}

ActionSet swap(const PoolKey& key, const SwapPlan& plan) {
    ActionSet set;
    set.label = "swap";
    set.target = ActionTarget::Router;

    Action s;
    s.kind = ActionKind::SwapExactInSingle;
    s.key = key;
    s.zero_for_one = plan.direction == SwapDirection::ZeroForOne;
    s.amount_in = plan.amount_in;
    s.amount_out_min = plan.min_amount_out;
    set.actions.push_back(s);

    const Currency& in = s.zero_for_one ? key.currency0 : key.currency1;
    const Currency& out = s.zero_for_one ? key.currency1 : key.currency0;

    Action settle = single(ActionKind::SettleAll, in);
    settle.amount_in = plan.amount_in;
    set.actions.push_back(settle);

    Action take = single(ActionKind::TakeAll, out);
    take.amount_out_min = plan.min_amount_out;
    set.actions.push_back(take);

    if (in.is_native()) set.native_value = plan.amount_in;
    return set;
}

ActionSet atomic_rebalance(const Position& position, const TokenAmounts& withdraw_min,
                           const TickRange& range, U128 liquidity,
                           const TokenAmounts& max_in, const Address& owner) {
    ActionSet set;
    set.label = "rebalance";
    set.actions.push_back(decrease(position, position.liquidity, withdraw_min));
    set.actions.push_back(mint_action(position.key, range, liquidity, max_in, owner));
    set.actions.push_back(single(ActionKind::CloseCurrency, position.key.currency0));
    set.actions.push_back(single(ActionKind::CloseCurrency, position.key.currency1));

    if (position.key.currency0.is_native()) {
        set.native_value = max_in.amount0 > withdraw_min.amount0 ? max_in.amount0 - withdraw_min.amount0 : 0;
        set.actions.push_back(sweep_native(position.key, owner));
    }
    return set;
}

ActionSet transfer(const Currency& currency, const Address& to, U128 amount,
                   const std::string& label) {
    ActionSet set;
    set.label = label;
    set.target = ActionTarget::Token;

    Action a = single(ActionKind::Transfer, currency);
    a.recipient = to;
    a.amount_in = amount;
    set.actions.push_back(a);
    return set;
}

} // namespace actions

} // namespace lpm
