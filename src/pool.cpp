#include "lpm/pool.hpp"

#include <algorithm>

namespace lpm {

namespace {

int32_t sign_extend_int24(uint32_t raw) {
    raw &= 0xFFFFFF;
    return (raw & 0x800000) ? static_cast<int32_t>(raw) - 0x1000000 : static_cast<int32_t>(raw);
}

} // namespace

void decode_position_ticks(const U256& packed_info, int32_t& tick_lower, int32_t& tick_upper) {
    // Layout: poolId(200) | tickUpper(24) | tickLower(24) | hasSubscriber(8)
    const int32_t a = sign_extend_int24(static_cast<uint32_t>((packed_info >> 8) & U256(0xFFFFFF)));
    const int32_t b = sign_extend_int24(static_cast<uint32_t>((packed_info >> 32) & U256(0xFFFFFF)));
    tick_lower = std::min(a, b);
    tick_upper = std::max(a, b);
}

} // namespace lpm
