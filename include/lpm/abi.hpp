#ifndef LPM_ABI_HPP
#define LPM_ABI_HPP

#include <cstdint>
#include <utility>
#include <vector>

#include "action_set.hpp"
#include "types.hpp"
#include "uint256.hpp"

namespace lpm {
namespace abi {

// =============================================================================
// Function selectors
// =============================================================================

namespace selectors {
constexpr uint32_t BALANCE_OF               = 0x70a08231;  // balanceOf(address)
constexpr uint32_t TRANSFER                 = 0xa9059cbb;  // transfer(address,uint256)
constexpr uint32_t ALLOWANCE                = 0xdd62ed3e;  // allowance(address,address)
constexpr uint32_t APPROVE                  = 0x095ea7b3;  // approve(address,uint256)
constexpr uint32_t OWNER_OF                 = 0x6352211e;  // ownerOf(uint256)
constexpr uint32_t GET_POSITION_LIQUIDITY   = 0x1efeed33;  // getPositionLiquidity(uint256)
constexpr uint32_t GET_POOL_AND_POSITION    = 0x7ba03aad;  // getPoolAndPositionInfo(uint256)
constexpr uint32_t GET_SLOT0                = 0xc815641c;  // getSlot0(bytes32)
constexpr uint32_t MODIFY_LIQUIDITIES       = 0xdd46508f;  // modifyLiquidities(bytes,uint256)
constexpr uint32_t EXECUTE                  = 0x3593564c;  // execute(bytes,bytes[],uint256)
constexpr uint32_t PERMIT2_APPROVE          = 0x87517c45;  // approve(address,address,uint160,uint48)
constexpr uint32_t PERMIT2_ALLOWANCE        = 0x927da105;  // allowance(address,address,address)
} // namespace selectors

// Position manager / router action bytes
namespace v4 {
constexpr uint8_t INCREASE_LIQUIDITY   = 0x00;
constexpr uint8_t DECREASE_LIQUIDITY   = 0x01;
constexpr uint8_t MINT_POSITION        = 0x02;
constexpr uint8_t BURN_POSITION        = 0x03;
constexpr uint8_t SWAP_EXACT_IN_SINGLE = 0x06;
constexpr uint8_t SETTLE_ALL           = 0x0c;
constexpr uint8_t SETTLE_PAIR          = 0x0d;
constexpr uint8_t TAKE_ALL             = 0x0f;
constexpr uint8_t TAKE_PAIR            = 0x11;
constexpr uint8_t CLOSE_CURRENCY       = 0x12;
constexpr uint8_t SWEEP                = 0x14;

constexpr uint8_t ROUTER_V4_SWAP       = 0x10;  // Universal Router command
} // namespace v4

// keccak256("Transfer(address,address,uint256)")
const U256& transfer_topic();

// =============================================================================
// Encoder (head/tail layout)
// =============================================================================

class Encoder {
public:
    Encoder& add_uint(const U256& v);
    Encoder& add_int(int64_t v);
    Encoder& add_address(const Address& a);
    Encoder& add_bool(bool v);
    Encoder& add_bytes(const Bytes& data);
    Encoder& add_bytes_array(const std::vector<Bytes>& items);

    // Static tuples are inlined, dynamic ones go to the tail
    Encoder& add_tuple(const Encoder& tuple);

    [[nodiscard]] bool is_dynamic() const;
    [[nodiscard]] Bytes encode() const;

private:
    struct Slot {
        bool dynamic;
        Bytes data;
    };
    std::vector<Slot> slots_;
};

Bytes with_selector(uint32_t selector, const Bytes& args);

// =============================================================================
// Decoder (static words of a return value)
// =============================================================================

class Decoder {
public:
    explicit Decoder(Bytes data) : data_(std::move(data)) {}

    [[nodiscard]] size_t words() const { return data_.size() / 32; }
    [[nodiscard]] U256 word(size_t index) const;
    [[nodiscard]] Address address(size_t index) const;
    [[nodiscard]] int32_t int24(size_t index) const;

private:
    Bytes data_;
};

Address word_to_address(const U256& word);

// =============================================================================
// Action encoding
// =============================================================================

uint8_t action_code(ActionKind kind);

// abi.encode of a single action's parameters
Bytes encode_action_params(const Action& action);

// abi.encode(bytes actions, bytes[] params)
Bytes encode_unlock_data(const std::vector<Action>& actions);

// Full calldata for the set's target contract:
//   PositionManager -> modifyLiquidities(unlockData, deadline)
//   Router          -> execute(0x10, [unlockData], deadline)
//   Token           -> transfer(recipient, amount)
Bytes encode_calldata(const ActionSet& set, uint64_t deadline);

} // namespace abi
} // namespace lpm

#endif // LPM_ABI_HPP
