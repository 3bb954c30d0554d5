#include "lpm/abi.hpp"
#include "lpm/errors.hpp"

#include <algorithm>

namespace lpm {
namespace abi {

namespace {

Bytes word_bytes(const U256& v) {
    auto be = to_be_bytes(v);
    return Bytes(be.begin(), be.end());
}

// Length word + data right-padded to a 32-byte boundary
Bytes encode_bytes_body(const Bytes& data) {
    Bytes out = word_bytes(U256(static_cast<U128>(data.size())));
    out.insert(out.end(), data.begin(), data.end());
    out.resize(out.size() + (32 - data.size() % 32) % 32, 0);
    return out;
}

Encoder pool_key_tuple(const PoolKey& key) {
    Encoder t;
    t.add_address(key.currency0.addr)
     .add_address(key.currency1.addr)
     .add_uint(U256(static_cast<U128>(key.fee)))
     .add_int(key.tick_spacing)
     .add_address(key.hooks);
    return t;
}

const Bytes EMPTY_HOOK_DATA;

} // namespace

const U256& transfer_topic() {
    static const U256 topic =
        parse_u256("0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef");
    return topic;
}

// =============================================================================
// Encoder
// =============================================================================

Encoder& Encoder::add_uint(const U256& v) {
    slots_.push_back({false, word_bytes(v)});
    return *this;
}

Encoder& Encoder::add_int(int64_t v) {
    if (v >= 0) {
        return add_uint(U256(static_cast<U128>(v)));
    }
    // two's complement: -1 is all ones
    U256 magnitude_minus_one(static_cast<U128>(-(v + 1)));
    return add_uint(u256_max() - magnitude_minus_one);
}

Encoder& Encoder::add_address(const Address& a) {
    Bytes word(12, 0);
    word.insert(word.end(), a.begin(), a.end());
    slots_.push_back({false, std::move(word)});
    return *this;
}

Encoder& Encoder::add_bool(bool v) {
    return add_uint(U256(v ? 1 : 0));
}

Encoder& Encoder::add_bytes(const Bytes& data) {
    slots_.push_back({true, encode_bytes_body(data)});
    return *this;
}

Encoder& Encoder::add_bytes_array(const std::vector<Bytes>& items) {
    Bytes out = word_bytes(U256(static_cast<U128>(items.size())));

    std::vector<Bytes> bodies;
    bodies.reserve(items.size());
    for (const auto& item : items) bodies.push_back(encode_bytes_body(item));

    // Offsets are relative to the first offset word
    size_t offset = 32 * items.size();
    for (const auto& body : bodies) {
        Bytes w = word_bytes(U256(static_cast<U128>(offset)));
        out.insert(out.end(), w.begin(), w.end());
        offset += body.size();
    }
    for (const auto& body : bodies) {
        out.insert(out.end(), body.begin(), body.end());
    }

    slots_.push_back({true, std::move(out)});
    return *this;
}

Encoder& Encoder::add_tuple(const Encoder& tuple) {
    slots_.push_back({tuple.is_dynamic(), tuple.encode()});
    return *this;
}

bool Encoder::is_dynamic() const {
    return std::any_of(slots_.begin(), slots_.end(), [](const Slot& s) { return s.dynamic; });
}

Bytes Encoder::encode() const {
    size_t head_size = 0;
    for (const auto& s : slots_) head_size += s.dynamic ? 32 : s.data.size();

    Bytes head;
    Bytes tail;
    head.reserve(head_size);
    for (const auto& s : slots_) {
        if (s.dynamic) {
            Bytes w = word_bytes(U256(static_cast<U128>(head_size + tail.size())));
            head.insert(head.end(), w.begin(), w.end());
            tail.insert(tail.end(), s.data.begin(), s.data.end());
        } else {
            head.insert(head.end(), s.data.begin(), s.data.end());
        }
    }
    head.insert(head.end(), tail.begin(), tail.end());
    return head;
}

Bytes with_selector(uint32_t selector, const Bytes& args) {
    Bytes out = {
        static_cast<uint8_t>(selector >> 24),
        static_cast<uint8_t>(selector >> 16),
        static_cast<uint8_t>(selector >> 8),
        static_cast<uint8_t>(selector),
    };
    out.insert(out.end(), args.begin(), args.end());
    return out;
}

// =============================================================================
// Decoder
// =============================================================================

U256 Decoder::word(size_t index) const {
    if ((index + 1) * 32 > data_.size()) {
        throw ChainError("return data too short: need word " + std::to_string(index) +
                         ", have " + std::to_string(data_.size()) + " bytes");
    }
    return u256_from_be_bytes(data_.data() + index * 32, 32);
}

Address Decoder::address(size_t index) const {
    return word_to_address(word(index));
}

int32_t Decoder::int24(size_t index) const {
    const auto raw = static_cast<uint32_t>(word(index) & U256(0xFFFFFF));
    return (raw & 0x800000) ? static_cast<int32_t>(raw) - 0x1000000 : static_cast<int32_t>(raw);
}

Address word_to_address(const U256& word) {
    auto be = to_be_bytes(word);
    Address a{};
    std::copy(be.begin() + 12, be.end(), a.begin());
    return a;
}

// =============================================================================
// Action encoding
// =============================================================================

uint8_t action_code(ActionKind kind) {
    switch (kind) {
        case ActionKind::IncreaseLiquidity: return v4::INCREASE_LIQUIDITY;
        case ActionKind::DecreaseLiquidity: return v4::DECREASE_LIQUIDITY;
        case ActionKind::MintPosition:      return v4::MINT_POSITION;
        case ActionKind::BurnPosition:      return v4::BURN_POSITION;
        case ActionKind::SettlePair:        return v4::SETTLE_PAIR;
        case ActionKind::TakePair:          return v4::TAKE_PAIR;
        case ActionKind::CloseCurrency:     return v4::CLOSE_CURRENCY;
        case ActionKind::Sweep:             return v4::SWEEP;
        case ActionKind::SwapExactInSingle: return v4::SWAP_EXACT_IN_SINGLE;
        case ActionKind::SettleAll:         return v4::SETTLE_ALL;
        case ActionKind::TakeAll:           return v4::TAKE_ALL;
        case ActionKind::Transfer:          break;
    }
    throw InvalidInput(std::string("no action code for ") + to_string(kind));
}

Bytes encode_action_params(const Action& a) {
    Encoder e;
    switch (a.kind) {
        case ActionKind::IncreaseLiquidity:
        case ActionKind::DecreaseLiquidity:
            e.add_uint(a.token_id)
             .add_uint(U256(a.liquidity))
             .add_uint(U256(a.amount0))
             .add_uint(U256(a.amount1))
             .add_bytes(EMPTY_HOOK_DATA);
            break;
        case ActionKind::MintPosition:
            e.add_tuple(pool_key_tuple(a.key))
             .add_int(a.tick_lower)
             .add_int(a.tick_upper)
             .add_uint(U256(a.liquidity))
             .add_uint(U256(a.amount0))
             .add_uint(U256(a.amount1))
             .add_address(a.recipient)
             .add_bytes(EMPTY_HOOK_DATA);
            break;
        case ActionKind::BurnPosition:
            e.add_uint(a.token_id)
             .add_uint(U256(a.amount0))
             .add_uint(U256(a.amount1))
             .add_bytes(EMPTY_HOOK_DATA);
            break;
        case ActionKind::SettlePair:
            e.add_address(a.currency0.addr).add_address(a.currency1.addr);
            break;
        case ActionKind::TakePair:
            e.add_address(a.currency0.addr).add_address(a.currency1.addr).add_address(a.recipient);
            break;
        case ActionKind::CloseCurrency:
            e.add_address(a.currency.addr);
            break;
        case ActionKind::Sweep:
            e.add_address(a.currency.addr).add_address(a.recipient);
            break;
        case ActionKind::SwapExactInSingle: {
            Encoder params;
            params.add_tuple(pool_key_tuple(a.key))
                  .add_bool(a.zero_for_one)
                  .add_uint(U256(a.amount_in))
                  .add_uint(U256(a.amount_out_min))
                  .add_bytes(EMPTY_HOOK_DATA);
            e.add_tuple(params);
            break;
        }
        case ActionKind::SettleAll:
            e.add_address(a.currency.addr).add_uint(U256(a.amount_in));
            break;
        case ActionKind::TakeAll:
            e.add_address(a.currency.addr).add_uint(U256(a.amount_out_min));
            break;
        case ActionKind::Transfer:
            e.add_address(a.recipient).add_uint(U256(a.amount_in));
            break;
    }
    return e.encode();
}

Bytes encode_unlock_data(const std::vector<Action>& actions) {
    Bytes codes;
    std::vector<Bytes> params;
    codes.reserve(actions.size());
    params.reserve(actions.size());
    for (const auto& a : actions) {
        codes.push_back(action_code(a.kind));
        params.push_back(encode_action_params(a));
    }

    Encoder e;
    e.add_bytes(codes).add_bytes_array(params);
    return e.encode();
}

Bytes encode_calldata(const ActionSet& set, uint64_t deadline) {
    if (set.actions.empty()) {
        throw InvalidInput("action set '" + set.label + "' is empty");
    }

    Encoder e;
    switch (set.target) {
        case ActionTarget::PositionManager:
            e.add_bytes(encode_unlock_data(set.actions)).add_uint(U256(static_cast<U128>(deadline)));
            return with_selector(selectors::MODIFY_LIQUIDITIES, e.encode());
        case ActionTarget::Router:
            e.add_bytes(Bytes{v4::ROUTER_V4_SWAP})
             .add_bytes_array({encode_unlock_data(set.actions)})
             .add_uint(U256(static_cast<U128>(deadline)));
            return with_selector(selectors::EXECUTE, e.encode());
        case ActionTarget::Token:
            if (set.actions.size() != 1 || set.actions[0].kind != ActionKind::Transfer) {
                throw InvalidInput("token action set must hold exactly one transfer");
            }
            return with_selector(selectors::TRANSFER, encode_action_params(set.actions[0]));
    }
    throw InvalidInput("unknown action target");
}

} // namespace abi
} // namespace lpm
