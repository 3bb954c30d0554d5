#include "lpm/chain.hpp"
#include "lpm/abi.hpp"
#include "lpm/errors.hpp"

namespace lpm {

U256 extract_new_position_id(const TxReceipt& receipt,
                             const Address& position_manager,
                             const Address& owner) {
    for (const auto& log : receipt.logs) {
        // ERC-721 Transfer indexes from, to and tokenId
        if (log.address != position_manager || log.topics.size() < 4) continue;
        if (log.topics[0] != abi::transfer_topic()) continue;
        if (!is_zero(abi::word_to_address(log.topics[1]))) continue;
        if (abi::word_to_address(log.topics[2]) != owner) continue;
        return log.topics[3];
    }
    throw PositionIdNotFound("no position mint found in receipt " + receipt.tx_hash +
                             "; reconcile the new position manually", receipt.tx_hash);
}

} // namespace lpm
