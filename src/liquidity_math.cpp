#include "lpm/liquidity_math.hpp"
#include "lpm/tick_math.hpp"

#include <utility>

namespace lpm {
namespace liquidity_math {

namespace {

void order_bounds(U256& a, U256& b) {
    if (a > b) std::swap(a, b);
}

U128 narrow(const U256& v, const char* what) {
    if (!fits_u128(v)) {
        throw InvalidInput(std::string(what) + " exceeds uint128");
    }
    return to_u128(v);
}

} // namespace

U128 liquidity_for_amount0(const U256& sqrt_a, const U256& sqrt_b, U128 amount0) {
    U256 a = sqrt_a, b = sqrt_b;
    order_bounds(a, b);
    if (a == b || amount0 == 0) return 0;

    try {
        // amount0 * (a * b / Q96) / (b - a)
        U256 intermediate = mul_div(a, b, tick_math::q96());
        return narrow(mul_div(U256(amount0), intermediate, b - a), "liquidity");
    } catch (const ArithmeticError&) {
        throw InvalidInput("liquidity exceeds uint128");
    }
}

U128 liquidity_for_amount1(const U256& sqrt_a, const U256& sqrt_b, U128 amount1) {
    U256 a = sqrt_a, b = sqrt_b;
    order_bounds(a, b);
    if (a == b || amount1 == 0) return 0;

    try {
        return narrow(mul_div(U256(amount1), tick_math::q96(), b - a), "liquidity");
    } catch (const ArithmeticError&) {
        throw InvalidInput("liquidity exceeds uint128");
    }
}

U128 liquidity_for_amounts(const U256& sqrt_price,
                           const U256& sqrt_a,
                           const U256& sqrt_b,
                           U128 amount0,
                           U128 amount1) {
    U256 a = sqrt_a, b = sqrt_b;
    order_bounds(a, b);
    if (a == b) return 0;

    if (sqrt_price <= a) {
        return liquidity_for_amount0(a, b, amount0);
    }
    if (sqrt_price < b) {
        U128 l0 = liquidity_for_amount0(sqrt_price, b, amount0);
        U128 l1 = liquidity_for_amount1(a, sqrt_price, amount1);
        return l0 < l1 ? l0 : l1;
    }
    return liquidity_for_amount1(a, b, amount1);
}

U128 amount0_for_liquidity(const U256& sqrt_a, const U256& sqrt_b, U128 liquidity) {
    U256 a = sqrt_a, b = sqrt_b;
    order_bounds(a, b);
    if (a == b || liquidity == 0 || a == 0) return 0;

    try {
        // (L << 96) * (b - a) / b / a
        U256 numerator = U256(liquidity) << 96;
        return narrow(mul_div(numerator, b - a, b) / a, "amount0");
    } catch (const ArithmeticError&) {
        throw InvalidInput("amount0 exceeds uint128");
    }
}

U128 amount1_for_liquidity(const U256& sqrt_a, const U256& sqrt_b, U128 liquidity) {
    U256 a = sqrt_a, b = sqrt_b;
    order_bounds(a, b);
    if (a == b || liquidity == 0) return 0;

    try {
        return narrow(mul_div(U256(liquidity), b - a, tick_math::q96()), "amount1");
    } catch (const ArithmeticError&) {
        throw InvalidInput("amount1 exceeds uint128");
    }
}

TokenAmounts amounts_for_liquidity(U128 liquidity,
                                   const U256& sqrt_price,
                                   const U256& sqrt_a,
                                   const U256& sqrt_b) {
    U256 a = sqrt_a, b = sqrt_b;
    order_bounds(a, b);

    TokenAmounts out;
    if (a == b || liquidity == 0) return out;

    if (sqrt_price <= a) {
        out.amount0 = amount0_for_liquidity(a, b, liquidity);
    } else if (sqrt_price < b) {
        out.amount0 = amount0_for_liquidity(sqrt_price, b, liquidity);
        out.amount1 = amount1_for_liquidity(a, sqrt_price, liquidity);
    } else {
        out.amount1 = amount1_for_liquidity(a, b, liquidity);
    }
    return out;
}

} // namespace liquidity_math
} // namespace lpm
