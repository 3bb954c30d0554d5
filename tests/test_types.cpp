// LPM - Core Types Tests

#include <catch2/catch_test_macros.hpp>
#include <lpm/errors.hpp>
#include <lpm/types.hpp>
#include <lpm/uint256.hpp>

using namespace lpm;

TEST_CASE("128-bit amounts", "[types]") {
    SECTION("Parse decimal and hex") {
        REQUIRE(parse_u128("0") == 0);
        REQUIRE(parse_u128("1000000000000000000") == static_cast<U128>(1000000000000000000ULL));
        REQUIRE(parse_u128("0xff") == 255);
        REQUIRE(parse_u128("340282366920938463463374607431768211455") == U128_MAX);
    }

    SECTION("Reject junk and overflow") {
        REQUIRE_THROWS_AS(parse_u128(""), InvalidInput);
        REQUIRE_THROWS_AS(parse_u128("12a"), InvalidInput);
        REQUIRE_THROWS_AS(parse_u128("-1"), InvalidInput);
        REQUIRE_THROWS_AS(parse_u128("340282366920938463463374607431768211456"), InvalidInput);
    }

    SECTION("Render") {
        REQUIRE(to_string(static_cast<U128>(0)) == "0");
        REQUIRE(to_string(u128(1, 0)) == "18446744073709551616");
        REQUIRE(to_string(U128_MAX) == "340282366920938463463374607431768211455");
    }
}

TEST_CASE("Hex and addresses", "[types]") {
    SECTION("Round trip bytes") {
        Bytes b{0x00, 0xab, 0xff};
        REQUIRE(hex::encode(b) == "0x00abff");
        REQUIRE(hex::decode("0x00ABff") == b);
        REQUIRE(hex::decode("00abff") == b);
        REQUIRE(hex::decode("0x").empty());
    }

    SECTION("Bad input") {
        REQUIRE_THROWS_AS(hex::decode("0xabc"), InvalidInput);
        REQUIRE_THROWS_AS(hex::decode("0xzz"), InvalidInput);
        REQUIRE_THROWS_AS(hex::to_address("0x1234"), InvalidInput);
    }

    SECTION("Addresses and currencies") {
        Address a = hex::to_address("0x833589fCD6eDb6E08f4c7C32D4f71b54bdA02913");
        REQUIRE(a[0] == 0x83);
        REQUIRE(a[19] == 0x13);
        REQUIRE(hex::encode(a) == "0x833589fcd6edb6e08f4c7c32d4f71b54bda02913");

        Currency native;
        Currency usdc(a);
        REQUIRE(native.is_native());
        REQUIRE_FALSE(usdc.is_native());
        REQUIRE(native < usdc);
    }
}

TEST_CASE("Token amount helpers", "[types]") {
    TokenAmounts a{100, 7};
    TokenAmounts b{30, 9};

    REQUIRE((a + b) == TokenAmounts{130, 16});
    REQUIRE(a.saturating_sub(b) == TokenAmounts{70, 0});
    REQUIRE(min_each(a, b) == TokenAmounts{30, 7});
    REQUIRE(TokenAmounts{}.is_zero());

    SECTION("Scale rounds down") {
        REQUIRE(scale(a, 9500, 10000) == TokenAmounts{95, 6});
        REQUIRE(scale({U128_MAX, 1}, 1, 2) == TokenAmounts{U128_MAX / 2, 0});
        REQUIRE(scale({10000, 3}, 10500, 10000) == TokenAmounts{10500, 3});
    }
}

TEST_CASE("256-bit integers", "[types]") {
    SECTION("Parse and print") {
        const U256 q96 = parse_u256("79228162514264337593543950336");
        REQUIRE(q96 == U256(1) << 96);
        REQUIRE(to_hex(q96) == "0x1000000000000000000000000");
        REQUIRE(parse_u256("0x1000000000000000000000000") == q96);
        REQUIRE(to_string(u256_max()) ==
                "115792089237316195423570985008687907853269984665640564039457584007913129639935");
        REQUIRE(to_hex(U256()) == "0x0");
    }

    SECTION("Reject junk and overflow") {
        REQUIRE_THROWS_AS(parse_u256(""), InvalidInput);
        REQUIRE_THROWS_AS(parse_u256("12 34"), InvalidInput);
        REQUIRE_THROWS_AS(parse_u256(
            "115792089237316195423570985008687907853269984665640564039457584007913129639936"),
            InvalidInput);
    }

    SECTION("Wrapping arithmetic") {
        REQUIRE(u256_max() + U256(1) == U256());
        REQUIRE(U256() - U256(1) == u256_max());
    }

    SECTION("Multiply-divide keeps the full product") {
        const U256 big = U256(1) << 200;
        REQUIRE(mul_div(big, big, big) == big);
        REQUIRE(mul_div(U256(10), U256(10), U256(3)) == U256(33));
        REQUIRE(mul_div_rounding_up(U256(10), U256(10), U256(3)) == U256(34));
        REQUIRE(mul_div_rounding_up(U256(10), U256(9), U256(3)) == U256(30));
    }

    SECTION("Multiply-divide failures") {
        REQUIRE_THROWS_AS(mul_div(U256(1), U256(1), U256()), ArithmeticError);
        const U256 big = U256(1) << 200;
        REQUIRE_THROWS_AS(mul_div(big, big, U256(1)), ArithmeticError);
    }

    SECTION("Big-endian bytes") {
        const uint8_t raw[] = {0x01, 0x02};
        REQUIRE(u256_from_be_bytes(raw, 2) == U256(0x0102));
        auto bytes = to_be_bytes(U256(0x0102));
        REQUIRE(bytes[30] == 0x01);
        REQUIRE(bytes[31] == 0x02);
    }
}
