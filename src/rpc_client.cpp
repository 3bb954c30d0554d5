#include "lpm/rpc_client.hpp"
#include "lpm/abi.hpp"
#include "lpm/errors.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <map>
#include <thread>

namespace lpm {

using json = nlohmann::json;

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string quantity(const U256& v) {
    return to_hex(v);
}

U256 parse_quantity(const json& v) {
    if (!v.is_string()) throw ChainError("expected hex quantity, got " + v.dump());
    const auto s = v.get<std::string>();
    if (s == "0x") return U256();
    return parse_u256(s);
}

uint64_t now_secs() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace

// =============================================================================
// Impl
// =============================================================================

class JsonRpcChainClient::Impl {
public:
    explicit Impl(const Config& config)
        : chain_(config.chain),
          timeout_ms_(config.general.timeout_ms),
          wallet_(hex::to_address(config.chain.wallet)),
          position_manager_(hex::to_address(config.chain.position_manager)),
          state_view_(hex::to_address(config.chain.state_view)),
          router_(hex::to_address(config.chain.universal_router)),
          permit2_(hex::to_address(config.chain.permit2)) {
        caps_.multi_action = config.chain.multi_action;
        caps_.dry_run = true;
        spdlog::info("JSON-RPC client for {} (wallet {})", chain_.rpc_url, hex::encode(wallet_));
    }

    // =========================================================================
    // Transport
    // =========================================================================

    json rpc(const std::string& method, json params) {
        json request = {
            {"jsonrpc", "2.0"},
            {"id", ++request_id_},
            {"method", method},
            {"params", std::move(params)},
        };

        auto response = cpr::Post(
            cpr::Url{chain_.rpc_url},
            cpr::Header{{"Content-Type", "application/json"}},
            cpr::Body{request.dump()},
            cpr::Timeout{timeout_ms_});

        if (response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
            throw TransientError(method + " timed out after " + std::to_string(timeout_ms_) + "ms");
        }
        if (response.status_code == 429) {
            throw TransientError(method + ": HTTP 429 rate limit");
        }
        if (response.status_code != 200) {
            throw ChainError(method + ": HTTP " + std::to_string(response.status_code) +
                             ": " + response.text);
        }

        json body;
        try {
            body = json::parse(response.text);
        } catch (const json::parse_error& e) {
            throw ChainError(method + ": malformed response: " + e.what());
        }

        if (body.contains("error") && !body["error"].is_null()) {
            const auto& err = body["error"];
            const int code = err.value("code", 0);
            const std::string message = err.value("message", std::string("unknown error"));
            const std::string lowered = lower(message);
            if (code == -32005 || lowered.find("rate limit") != std::string::npos ||
                lowered.find("too many requests") != std::string::npos) {
                throw TransientError(method + ": " + message);
            }
            if (lowered.find("revert") != std::string::npos) {
                throw RevertError(method + ": " + message);
            }
            throw ChainError(method + " failed (" + std::to_string(code) + "): " + message);
        }
        return body.value("result", json());
    }

    Bytes eth_call(const Address& to, const Bytes& data) {
        json tx = {{"from", hex::encode(wallet_)}, {"to", hex::encode(to)}, {"data", hex::encode(data)}};
        json result = rpc("eth_call", json::array({tx, "latest"}));
        if (!result.is_string()) throw ChainError("eth_call returned " + result.dump());
        return hex::decode(result.get<std::string>());
    }

    std::string send_transaction(const Address& to, const Bytes& data, U128 value) {
        json tx = {
            {"from", hex::encode(wallet_)},
            {"to", hex::encode(to)},
            {"data", hex::encode(data)},
            {"value", quantity(U256(value))},
        };
        json result = rpc("eth_sendTransaction", json::array({tx}));
        if (!result.is_string()) throw ChainError("eth_sendTransaction returned " + result.dump());
        return result.get<std::string>();
    }

    // =========================================================================
    // Reads
    // =========================================================================

    PoolState read_pool_state(const PoolConfig& pool) {
        const Bytes pool_id = hex::decode(pool.pool_id);
        if (pool_id.size() != 32) throw ConfigError("pool id must be 32 bytes");
        abi::Encoder args;
        args.add_uint(u256_from_be_bytes(pool_id.data(), pool_id.size()));
        abi::Decoder slot0(eth_call(state_view_, abi::with_selector(abi::selectors::GET_SLOT0, args.encode())));

        PoolState state;
        state.sqrt_price_x96 = slot0.word(0);
        state.tick = slot0.int24(1);
        state.lp_fee = static_cast<uint32_t>(slot0.word(3) & U256(0xFFFFFF));
        state.tick_spacing = pool.key.tick_spacing;

        if (state.sqrt_price_x96 == 0) {
            throw ChainError("pool " + pool.pool_id + " is not initialized");
        }
        return state;
    }

    Position read_position(const U256& token_id) {
        abi::Encoder args;
        args.add_uint(token_id);
        const Bytes encoded_id = args.encode();

        abi::Decoder info(eth_call(position_manager_,
                                   abi::with_selector(abi::selectors::GET_POOL_AND_POSITION, encoded_id)));
        abi::Decoder liq(eth_call(position_manager_,
                                  abi::with_selector(abi::selectors::GET_POSITION_LIQUIDITY, encoded_id)));
        abi::Decoder owner(eth_call(position_manager_,
                                    abi::with_selector(abi::selectors::OWNER_OF, encoded_id)));

        Position pos;
        pos.id = token_id;
        pos.key.currency0 = Currency(info.address(0));
        pos.key.currency1 = Currency(info.address(1));
        pos.key.fee = static_cast<uint32_t>(info.word(2) & U256(0xFFFFFF));
        pos.key.tick_spacing = info.int24(3);
        pos.key.hooks = info.address(4);
        decode_position_ticks(info.word(5), pos.tick_lower, pos.tick_upper);
        pos.liquidity = to_u128(liq.word(0));
        pos.owner = owner.address(0);
        return pos;
    }

    U128 token_balance(const Currency& currency) {
        if (currency.is_native()) {
            json result = rpc("eth_getBalance", json::array({hex::encode(wallet_), "latest"}));
            return to_u128(parse_quantity(result));
        }
        abi::Encoder args;
        args.add_address(wallet_);
        abi::Decoder out(eth_call(currency.addr, abi::with_selector(abi::selectors::BALANCE_OF, args.encode())));
        return to_u128(out.word(0));
    }

    TokenAmounts read_balances(const PoolKey& key) {
        return {token_balance(key.currency0), token_balance(key.currency1)};
    }

    // =========================================================================
    // Approvals (ERC-20 -> Permit2 -> spender)
    // =========================================================================

    void ensure_approvals(const ActionSet& set) {
        if (set.target == ActionTarget::Token) return;
        const Address& spender = set.target == ActionTarget::Router ? router_ : position_manager_;

        std::map<Address, U128> needed;
        for (const auto& a : set.actions) {
            switch (a.kind) {
                case ActionKind::MintPosition:
                    needed[a.key.currency0.addr] += a.amount0;
                    needed[a.key.currency1.addr] += a.amount1;
                    break;
                case ActionKind::IncreaseLiquidity: {
                    // Currencies of an increase come from the paired SETTLE_PAIR
                    auto settle = std::find_if(set.actions.begin(), set.actions.end(),
                        [](const Action& s) { return s.kind == ActionKind::SettlePair; });
                    if (settle != set.actions.end()) {
                        needed[settle->currency0.addr] += a.amount0;
                        needed[settle->currency1.addr] += a.amount1;
                    }
                    break;
                }
                case ActionKind::SettleAll:
                    needed[a.currency.addr] += a.amount_in;
                    break;
                default:
                    break;
            }
        }

        for (const auto& [token, amount] : needed) {
            if (amount == 0 || is_zero(token)) continue;
            ensure_token_approval(token, spender, amount);
        }
    }

    void ensure_token_approval(const Address& token, const Address& spender, U128 amount) {
        abi::Encoder allowance_args;
        allowance_args.add_address(wallet_).add_address(permit2_);
        abi::Decoder erc20(eth_call(token, abi::with_selector(abi::selectors::ALLOWANCE, allowance_args.encode())));
        if (erc20.word(0) < U256(amount)) {
            spdlog::info("approving Permit2 for token {}", hex::encode(token));
            abi::Encoder approve;
            approve.add_address(permit2_).add_uint(u256_max());
            confirm(send_transaction(token, abi::with_selector(abi::selectors::APPROVE, approve.encode()), 0),
                    "ERC-20 approve");
        }

        abi::Encoder p2_args;
        p2_args.add_address(wallet_).add_address(token).add_address(spender);
        abi::Decoder p2(eth_call(permit2_, abi::with_selector(abi::selectors::PERMIT2_ALLOWANCE, p2_args.encode())));
        const U256 p2_amount = p2.word(0);
        const uint64_t expiration = static_cast<uint64_t>(p2.word(1) & U256(0xFFFFFFFFFFFFULL));
        if (p2_amount < U256(amount) || expiration <= now_secs()) {
            spdlog::info("approving spender {} on Permit2 for token {}", hex::encode(spender), hex::encode(token));
            abi::Encoder approve;
            approve.add_address(token)
                   .add_address(spender)
                   .add_uint((U256(1) << 160) - U256(1))
                   .add_uint((U256(1) << 48) - U256(1));
            confirm(send_transaction(permit2_, abi::with_selector(abi::selectors::PERMIT2_APPROVE, approve.encode()), 0),
                    "Permit2 approve");
        }
    }

    void confirm(const std::string& tx_hash, const std::string& what) {
        TxReceipt receipt = wait_for_receipt(tx_hash);
        if (!receipt.success) {
            throw RevertError(what + " reverted", tx_hash);
        }
    }

    // =========================================================================
    // Submission
    // =========================================================================

    Address target_address(const ActionSet& set) const {
        switch (set.target) {
            case ActionTarget::PositionManager: return position_manager_;
            case ActionTarget::Router:          return router_;
            case ActionTarget::Token:           return set.actions.at(0).currency.addr;
        }
        throw InvalidInput("unknown action target");
    }

    std::string submit(const ActionSet& set, uint64_t deadline) {
        ensure_approvals(set);
        Bytes calldata = abi::encode_calldata(set, deadline);
        std::string hash = send_transaction(target_address(set), calldata, set.native_value);
        spdlog::info("submitted {} ({} actions): {}", set.label, set.actions.size(), hash);
        return hash;
    }

    void dry_run(const ActionSet& set, uint64_t deadline) {
        Bytes calldata = abi::encode_calldata(set, deadline);
        json tx = {
            {"from", hex::encode(wallet_)},
            {"to", hex::encode(target_address(set))},
            {"data", hex::encode(calldata)},
            {"value", quantity(U256(set.native_value))},
        };
        try {
            rpc("eth_call", json::array({tx, "latest"}));
        } catch (const RevertError& e) {
            throw RevertError(std::string("dry run of ") + set.label + " reverted: " + e.what());
        }
    }

    TxReceipt wait_for_receipt(const std::string& tx_hash) {
        const auto deadline = std::chrono::steady_clock::now() +
                              std::chrono::milliseconds(chain_.receipt_timeout_ms);

        while (std::chrono::steady_clock::now() < deadline) {
            json result;
            try {
                result = rpc("eth_getTransactionReceipt", json::array({tx_hash}));
            } catch (const TransientError& e) {
                spdlog::warn("receipt poll for {} throttled: {}", tx_hash, e.what());
            }

            if (!result.is_null()) {
                return parse_receipt(tx_hash, result);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(chain_.poll_interval_ms));
        }
        throw ChainError("no receipt for " + tx_hash + " after " +
                         std::to_string(chain_.receipt_timeout_ms) + "ms");
    }

    TxReceipt parse_receipt(const std::string& tx_hash, const json& r) {
        TxReceipt receipt;
        receipt.tx_hash = tx_hash;
        receipt.success = r.value("status", std::string("0x0")) == "0x1";
        if (r.contains("blockNumber") && r["blockNumber"].is_string()) {
            receipt.block_number = static_cast<uint64_t>(parse_quantity(r["blockNumber"]));
        }
        for (const auto& l : r.value("logs", json::array())) {
            LogEntry entry;
            entry.address = hex::to_address(l.at("address").get<std::string>());
            for (const auto& t : l.at("topics")) {
                entry.topics.push_back(parse_u256(t.get<std::string>()));
            }
            entry.data = hex::decode(l.value("data", std::string("0x")));
            receipt.logs.push_back(std::move(entry));
        }
        return receipt;
    }

    ChainConfig chain_;
    int timeout_ms_;
    ChainCapabilities caps_;
    Address wallet_;
    Address position_manager_;
    Address state_view_;
    Address router_;
    Address permit2_;
    int request_id_ = 0;
};

// =============================================================================
// Public interface
// =============================================================================

JsonRpcChainClient::JsonRpcChainClient(const Config& config)
    : impl_(std::make_unique<Impl>(config)) {}

JsonRpcChainClient::~JsonRpcChainClient() = default;

const ChainCapabilities& JsonRpcChainClient::capabilities() const { return impl_->caps_; }
Address JsonRpcChainClient::wallet() const { return impl_->wallet_; }
Address JsonRpcChainClient::position_manager() const { return impl_->position_manager_; }

PoolState JsonRpcChainClient::read_pool_state(const PoolConfig& pool) {
    return impl_->read_pool_state(pool);
}

Position JsonRpcChainClient::read_position(const U256& token_id) {
    return impl_->read_position(token_id);
}

TokenAmounts JsonRpcChainClient::read_balances(const PoolKey& key) {
    return impl_->read_balances(key);
}

std::string JsonRpcChainClient::submit(const ActionSet& set, uint64_t deadline) {
    return impl_->submit(set, deadline);
}

TxReceipt JsonRpcChainClient::wait_for_receipt(const std::string& tx_hash) {
    return impl_->wait_for_receipt(tx_hash);
}

void JsonRpcChainClient::dry_run(const ActionSet& set, uint64_t deadline) {
    impl_->dry_run(set, deadline);
}

} // namespace lpm
