#ifndef LPM_POOL_HPP
#define LPM_POOL_HPP

#include <string>

#include "types.hpp"
#include "uint256.hpp"

namespace lpm {

// =============================================================================
// Pool Configuration (explicit, passed into every component)
// =============================================================================

struct PoolConfig {
    PoolKey key;
    std::string pool_id;        // bytes32 keccak(abi.encode(key)), hex
    int decimals0 = 18;
    int decimals1 = 18;
    std::string symbol0 = "TOKEN0";
    std::string symbol1 = "TOKEN1";
};

// =============================================================================
// Pool State (snapshot of slot0)
// =============================================================================

struct PoolState {
    U256 sqrt_price_x96;        // Current sqrt(price) as Q64.96
    int32_t tick = 0;           // Current tick
    int32_t tick_spacing = 1;   // Range bounds must be multiples of this
    uint32_t lp_fee = 0;        // LP fee (hundredths of bip)
};

// =============================================================================
// Position
// =============================================================================

struct Position {
    U256 id;                    // Position NFT token id
    PoolKey key;
    int32_t tick_lower = 0;
    int32_t tick_upper = 0;
    U128 liquidity = 0;
    Address owner{};

    bool in_range(int32_t tick) const { return tick >= tick_lower && tick < tick_upper; }
};

// Unpack the (tickLower, tickUpper) pair stored in the position manager's
// packed PositionInfo word (int24 at bit 8 and bit 32).
void decode_position_ticks(const U256& packed_info, int32_t& tick_lower, int32_t& tick_upper);

} // namespace lpm

#endif // LPM_POOL_HPP
