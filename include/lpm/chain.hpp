#ifndef LPM_CHAIN_HPP
#define LPM_CHAIN_HPP

#include <string>
#include <vector>

#include "action_set.hpp"
#include "pool.hpp"
#include "types.hpp"
#include "uint256.hpp"

namespace lpm {

// =============================================================================
// Receipts
// =============================================================================

struct LogEntry {
    Address address{};
    std::vector<U256> topics;
    Bytes data;
};

struct TxReceipt {
    std::string tx_hash;
    bool success = false;
    uint64_t block_number = 0;
    std::vector<LogEntry> logs;
};

// =============================================================================
// Chain Interface
// =============================================================================

struct ChainCapabilities {
    bool multi_action = true;   // Netted multi-action sets in one transaction
    bool dry_run = true;        // Non-mutating simulation of a set
};

class ChainClient {
public:
    virtual ~ChainClient() = default;

    [[nodiscard]] virtual const ChainCapabilities& capabilities() const = 0;
    [[nodiscard]] virtual Address wallet() const = 0;
    [[nodiscard]] virtual Address position_manager() const = 0;

    // Reads: idempotent, safe to retry
    virtual PoolState read_pool_state(const PoolConfig& pool) = 0;
    virtual Position read_position(const U256& token_id) = 0;
    virtual TokenAmounts read_balances(const PoolKey& key) = 0;

    // Mutations: never retried. Returns the transaction hash.
    virtual std::string submit(const ActionSet& set, uint64_t deadline) = 0;

    // Blocks until the transaction is mined or the receipt timeout passes
    virtual TxReceipt wait_for_receipt(const std::string& tx_hash) = 0;

    // Simulates the set without state change; throws RevertError on failure
    virtual void dry_run(const ActionSet& set, uint64_t deadline) = 0;
};

// Token id of the position minted in `receipt`: the ERC-721 Transfer from the
// zero address to `owner` emitted by the position manager.
// Throws PositionIdNotFound when no such log exists.
U256 extract_new_position_id(const TxReceipt& receipt,
                             const Address& position_manager,
                             const Address& owner);

} // namespace lpm

#endif // LPM_CHAIN_HPP
