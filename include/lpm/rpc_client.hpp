#ifndef LPM_RPC_CLIENT_HPP
#define LPM_RPC_CLIENT_HPP

#include <memory>
#include <string>

#include "chain.hpp"
#include "config.hpp"

namespace lpm {

// =============================================================================
// Ethereum JSON-RPC chain client
// =============================================================================
//
// Reads through eth_call against the position manager, state view and token
// contracts; submits through eth_sendTransaction, so signing is done by the
// node or signer proxy behind rpc_url. Before a set that pulls tokens from
// the wallet, the ERC-20 -> Permit2 -> spender approvals are brought up to date.
//
// HTTP 429, rate-limit RPC errors and timeouts raise TransientError; reverts
// raise RevertError; anything else raises ChainError.

class JsonRpcChainClient : public ChainClient {
public:
    explicit JsonRpcChainClient(const Config& config);
    ~JsonRpcChainClient() override;

    JsonRpcChainClient(const JsonRpcChainClient&) = delete;
    JsonRpcChainClient& operator=(const JsonRpcChainClient&) = delete;

    [[nodiscard]] const ChainCapabilities& capabilities() const override;
    [[nodiscard]] Address wallet() const override;
    [[nodiscard]] Address position_manager() const override;

    PoolState read_pool_state(const PoolConfig& pool) override;
    Position read_position(const U256& token_id) override;
    TokenAmounts read_balances(const PoolKey& key) override;

    std::string submit(const ActionSet& set, uint64_t deadline) override;
    TxReceipt wait_for_receipt(const std::string& tx_hash) override;
    void dry_run(const ActionSet& set, uint64_t deadline) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lpm

#endif // LPM_RPC_CLIENT_HPP
