// LPM - Pool and Position Tests

#include <catch2/catch_test_macros.hpp>
#include <lpm/pool.hpp>

using namespace lpm;

namespace {

U256 packed_info(uint32_t lower_bits, uint32_t upper_bits, bool subscriber) {
    const U256 pool_id_prefix = parse_u256("0xabcdef0123456789abcdef0123456789abcdef0123456789ab");
    return (pool_id_prefix << 56) | (U256(upper_bits) << 32) | (U256(lower_bits) << 8) |
           U256(subscriber ? 1 : 0);
}

} // namespace

TEST_CASE("Packed position info", "[pool]") {
    int32_t lower = 0;
    int32_t upper = 0;

    SECTION("Signed ticks around zero") {
        // -600 as int24 is 0xFFFDA8
        decode_position_ticks(packed_info(0xFFFDA8, 0x258, true), lower, upper);
        REQUIRE(lower == -600);
        REQUIRE(upper == 600);
    }

    SECTION("Both ticks negative") {
        // -198000 and -196020
        decode_position_ticks(packed_info(0x1000000 - 198000, 0x1000000 - 196020, false), lower, upper);
        REQUIRE(lower == -198000);
        REQUIRE(upper == -196020);
    }

    SECTION("Pool id bits do not leak into the ticks") {
        decode_position_ticks(packed_info(100020, 119820, false), lower, upper);
        REQUIRE(lower == 100020);
        REQUIRE(upper == 119820);
    }
}

TEST_CASE("Position range membership", "[pool]") {
    Position p;
    p.tick_lower = -600;
    p.tick_upper = 600;

    REQUIRE(p.in_range(-600));
    REQUIRE(p.in_range(0));
    REQUIRE(p.in_range(599));
    REQUIRE_FALSE(p.in_range(600));
    REQUIRE_FALSE(p.in_range(-601));
}
