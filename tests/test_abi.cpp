// LPM - ABI Encoding Tests

#include <catch2/catch_test_macros.hpp>
#include <lpm/abi.hpp>
#include <lpm/action_set.hpp>
#include <lpm/errors.hpp>

#include "fake_chain.hpp"

using namespace lpm;
using lpm::testing::test_pool_key;
using lpm::testing::test_wallet;

namespace {

uint32_t selector_of(const Bytes& calldata) {
    return (static_cast<uint32_t>(calldata[0]) << 24) | (static_cast<uint32_t>(calldata[1]) << 16) |
           (static_cast<uint32_t>(calldata[2]) << 8) | static_cast<uint32_t>(calldata[3]);
}

Bytes args_of(const Bytes& calldata) {
    return Bytes(calldata.begin() + 4, calldata.end());
}

Position sample_position() {
    Position p;
    p.id = U256(4242);
    p.key = test_pool_key();
    p.tick_lower = -600;
    p.tick_upper = 600;
    p.liquidity = 1000000;
    p.owner = test_wallet();
    return p;
}

} // namespace

TEST_CASE("Encoder head and tail layout", "[abi]") {
    SECTION("Static words are inlined") {
        abi::Encoder e;
        e.add_uint(U256(7)).add_bool(true).add_address(test_wallet());
        Bytes out = e.encode();
        REQUIRE(out.size() == 96);

        abi::Decoder d(out);
        REQUIRE(d.word(0) == U256(7));
        REQUIRE(d.word(1) == U256(1));
        REQUIRE(d.address(2) == test_wallet());
    }

    SECTION("Dynamic bytes go to the tail") {
        abi::Encoder e;
        e.add_uint(U256(5)).add_bytes(Bytes{0xde, 0xad});
        Bytes out = e.encode();
        REQUIRE(out.size() == 128);
        REQUIRE(e.is_dynamic());

        abi::Decoder d(out);
        REQUIRE(d.word(1) == U256(64));   // offset
        REQUIRE(d.word(2) == U256(2));    // length
        REQUIRE(out[96] == 0xde);
        REQUIRE(out[97] == 0xad);
        REQUIRE(out[98] == 0x00);
    }

    SECTION("Negative ints are two's complement") {
        abi::Encoder e;
        e.add_int(-1).add_int(-887220).add_int(600);
        abi::Decoder d(e.encode());
        REQUIRE(d.word(0) == u256_max());
        REQUIRE(d.int24(1) == -887220);
        REQUIRE(d.int24(2) == 600);
    }

    SECTION("Short return data is a chain error") {
        abi::Decoder d(Bytes(31, 0));
        REQUIRE(d.words() == 0);
        REQUIRE_THROWS_AS(d.word(0), ChainError);
    }
}

TEST_CASE("Action parameters", "[abi]") {
    SECTION("Mint inlines the pool key and tails the hook data") {
        ActionSet set = actions::mint(test_pool_key(), TickRange{-120, 180}, 5000, {700, 800}, test_wallet());
        abi::Decoder d(abi::encode_action_params(set.actions[0]));

        REQUIRE(d.address(0) == test_pool_key().currency0.addr);
        REQUIRE(d.address(1) == test_pool_key().currency1.addr);
        REQUIRE(d.word(2) == U256(3000));
        REQUIRE(d.int24(3) == 60);
        REQUIRE(d.int24(5) == -120);
        REQUIRE(d.int24(6) == 180);
        REQUIRE(d.word(7) == U256(5000));
        REQUIRE(d.word(8) == U256(700));
        REQUIRE(d.word(9) == U256(800));
        REQUIRE(d.address(10) == test_wallet());
        REQUIRE(d.word(11) == U256(12 * 32));
        REQUIRE(d.word(12) == U256(0));
    }

    SECTION("Decrease carries the minimum outputs") {
        ActionSet set = actions::withdraw(sample_position(), {11, 22}, test_wallet());
        abi::Decoder d(abi::encode_action_params(set.actions[0]));
        REQUIRE(d.word(0) == U256(4242));
        REQUIRE(d.word(1) == U256(1000000));
        REQUIRE(d.word(2) == U256(11));
        REQUIRE(d.word(3) == U256(22));
    }

    SECTION("Burn names the token and tails empty hook data") {
        ActionSet set = actions::close(sample_position(), 100.0, {11, 22}, test_wallet());
        abi::Decoder d(abi::encode_action_params(set.actions[2]));
        REQUIRE(abi::action_code(set.actions[2].kind) == abi::v4::BURN_POSITION);
        REQUIRE(d.word(0) == U256(4242));
        REQUIRE(d.word(1) == U256(0));
        REQUIRE(d.word(2) == U256(0));
        REQUIRE(d.word(3) == U256(4 * 32));
        REQUIRE(d.word(4) == U256(0));
    }

    SECTION("Transfers have no action code") {
        ActionSet set = actions::transfer(test_pool_key().currency0, test_wallet(), 5);
        REQUIRE_THROWS_AS(abi::action_code(set.actions[0].kind), InvalidInput);
    }
}

TEST_CASE("Calldata per target", "[abi]") {
    SECTION("Position manager sets call modifyLiquidities") {
        ActionSet set = actions::withdraw(sample_position(), {}, test_wallet());
        Bytes data = abi::encode_calldata(set, 1700000000);
        REQUIRE(selector_of(data) == abi::selectors::MODIFY_LIQUIDITIES);

        abi::Decoder d(args_of(data));
        REQUIRE(d.word(0) == U256(64));
        REQUIRE(d.word(1) == U256(1700000000));

        // unlockData = abi.encode(bytes actions, bytes[] params)
        Bytes unlock = abi::encode_unlock_data(set.actions);
        abi::Decoder u(unlock);
        REQUIRE(u.word(2) == U256(2));
        REQUIRE(unlock[96] == abi::v4::DECREASE_LIQUIDITY);
        REQUIRE(unlock[97] == abi::v4::TAKE_PAIR);
    }

    SECTION("Full close burns last") {
        ActionSet set = actions::close(sample_position(), 100.0, {}, test_wallet());
        Bytes unlock = abi::encode_unlock_data(set.actions);
        abi::Decoder u(unlock);
        REQUIRE(u.word(2) == U256(3));
        REQUIRE(unlock[96] == abi::v4::DECREASE_LIQUIDITY);
        REQUIRE(unlock[97] == abi::v4::TAKE_PAIR);
        REQUIRE(unlock[98] == abi::v4::BURN_POSITION);
    }

    SECTION("Swaps go through the router's V4 command") {
        SwapPlan plan;
        plan.direction = SwapDirection::ZeroForOne;
        plan.amount_in = 1000;
        plan.min_amount_out = 900;
        Bytes data = abi::encode_calldata(actions::swap(test_pool_key(), plan), 1);
        REQUIRE(selector_of(data) == abi::selectors::EXECUTE);

        abi::Decoder d(args_of(data));
        REQUIRE(d.word(2) == U256(1));           // deadline
        const size_t commands = 4 + 96 + 32;     // selector, head, length word
        REQUIRE(data[commands] == abi::v4::ROUTER_V4_SWAP);

        Bytes unlock = abi::encode_unlock_data(actions::swap(test_pool_key(), plan).actions);
        REQUIRE(unlock[96] == abi::v4::SWAP_EXACT_IN_SINGLE);
        REQUIRE(unlock[97] == abi::v4::SETTLE_ALL);
        REQUIRE(unlock[98] == abi::v4::TAKE_ALL);
    }

    SECTION("Token sets are plain transfers") {
        Bytes data = abi::encode_calldata(actions::transfer(test_pool_key().currency1, test_wallet(), 99), 0);
        REQUIRE(selector_of(data) == abi::selectors::TRANSFER);
        REQUIRE(data.size() == 4 + 64);

        abi::Decoder d(args_of(data));
        REQUIRE(d.address(0) == test_wallet());
        REQUIRE(d.word(1) == U256(99));
    }

    SECTION("Empty sets are refused") {
        ActionSet empty;
        empty.label = "nothing";
        REQUIRE_THROWS_AS(abi::encode_calldata(empty, 0), InvalidInput);
    }
}

TEST_CASE("Receipt log helpers", "[abi]") {
    REQUIRE(to_hex(abi::transfer_topic()) ==
            "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef");

    const Address a = test_wallet();
    const U256 word = u256_from_be_bytes(a.data(), a.size());
    REQUIRE(abi::word_to_address(word) == a);
}
