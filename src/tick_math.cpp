#include "lpm/tick_math.hpp"
#include "lpm/errors.hpp"

#include <cmath>
#include <string>

namespace lpm {
namespace tick_math {

namespace {

// 2^128 / sqrt(1.0001^(2^i)) for i = 0..19, as Q128.128
const U128 MAGIC[20] = {
    u128(0xfffcb933bd6fad37ULL, 0xaa2d162d1a594001ULL),  // 0x1
    u128(0xfff97272373d4132ULL, 0x59a46990580e213aULL),  // 0x2
    u128(0xfff2e50f5f656932ULL, 0xef12357cf3c7fdccULL),  // 0x4
    u128(0xffe5caca7e10e4e6ULL, 0x1c3624eaa0941cd0ULL),  // 0x8
    u128(0xffcb9843d60f6159ULL, 0xc9db58835c926644ULL),  // 0x10
    u128(0xff973b41fa98c081ULL, 0x472e6896dfb254c0ULL),  // 0x20
    u128(0xff2ea16466c96a38ULL, 0x43ec78b326b52861ULL),  // 0x40
    u128(0xfe5dee046a99a2a8ULL, 0x11c461f1969c3053ULL),  // 0x80
    u128(0xfcbe86c7900a88aeULL, 0xdcffc83b479aa3a4ULL),  // 0x100
    u128(0xf987a7253ac41317ULL, 0x6f2b074cf7815e54ULL),  // 0x200
    u128(0xf3392b0822b70005ULL, 0x940c7a398e4b70f3ULL),  // 0x400
    u128(0xe7159475a2c29b74ULL, 0x43b29c7fa6e889d9ULL),  // 0x800
    u128(0xd097f3bdfd2022b8ULL, 0x845ad8f792aa5825ULL),  // 0x1000
    u128(0xa9f746462d870fdfULL, 0x8a65dc1f90e061e5ULL),  // 0x2000
    u128(0x70d869a156d2a1b8ULL, 0x90bb3df62baf32f7ULL),  // 0x4000
    u128(0x31be135f97d08fd9ULL, 0x81231505542fcfa6ULL),  // 0x8000
    u128(0x09aa508b5b7a84e1ULL, 0xc677de54f3e99bc9ULL),  // 0x10000
    u128(0x005d6af8dedb8119ULL, 0x6699c329225ee604ULL),  // 0x20000
    u128(0x00002216e584f5faULL, 0x1ea926041bedfe98ULL),  // 0x40000
    u128(0x00000000048a1703ULL, 0x91f7dc42444e8fa2ULL),  // 0x80000
};

const double LOG_BASE = std::log(1.0001);

} // namespace

const U256& min_sqrt_ratio() {
    static const U256 v(static_cast<U128>(4295128739ULL));
    return v;
}

const U256& max_sqrt_ratio() {
    static const U256 v = parse_u256("0xfffd8963efd1fc6a506488495d951d5263988d26");
    return v;
}

const U256& q96() {
    static const U256 v = U256(1) << 96;
    return v;
}

U256 get_sqrt_ratio_at_tick(int32_t tick) {
    if (tick < MIN_TICK || tick > MAX_TICK) {
        throw OutOfBoundsTick("tick " + std::to_string(tick) + " outside [" +
                              std::to_string(MIN_TICK) + ", " + std::to_string(MAX_TICK) + "]");
    }

    const uint32_t abs_tick = static_cast<uint32_t>(tick < 0 ? -static_cast<int64_t>(tick) : tick);

    U256 ratio = (abs_tick & 0x1) ? U256(MAGIC[0]) : (U256(1) << 128);
    for (unsigned i = 1; i < 20; ++i) {
        if (abs_tick & (1u << i)) {
            ratio = (ratio * U256(MAGIC[i])) >> 128;
        }
    }

    if (tick > 0) {
        ratio = u256_max() / ratio;
    }

    // Q128.128 -> Q64.96, rounding up
    U256 result = ratio >> 32;
    if ((ratio & U256(0xffffffffULL)) != 0) {
        result = result + U256(1);
    }
    return result;
}

int32_t get_tick_at_sqrt_ratio(const U256& sqrt_price_x96) {
    if (sqrt_price_x96 < min_sqrt_ratio() || sqrt_price_x96 >= max_sqrt_ratio()) {
        throw OutOfBoundsTick("sqrt price " + to_string(sqrt_price_x96) + " outside tick bounds");
    }

    // Invariant: ratio(lo) <= sqrt_price < ratio(hi)
    int32_t lo = MIN_TICK;
    int32_t hi = MAX_TICK;
    while (hi - lo > 1) {
        int32_t mid = lo + (hi - lo) / 2;
        if (get_sqrt_ratio_at_tick(mid) <= sqrt_price_x96) {
            lo = mid;
        } else {
            hi = mid;
        }
    }
    return lo;
}

int32_t min_usable_tick(int32_t tick_spacing) {
    return (MIN_TICK / tick_spacing) * tick_spacing;
}

int32_t max_usable_tick(int32_t tick_spacing) {
    return (MAX_TICK / tick_spacing) * tick_spacing;
}

int32_t clamp_tick(int32_t tick, int32_t tick_spacing) {
    if (tick < min_usable_tick(tick_spacing)) return min_usable_tick(tick_spacing);
    if (tick > max_usable_tick(tick_spacing)) return max_usable_tick(tick_spacing);
    return tick;
}

int32_t floor_to_spacing(int64_t tick, int32_t tick_spacing) {
    int64_t q = tick / tick_spacing;
    if (tick % tick_spacing != 0 && tick < 0) --q;
    return static_cast<int32_t>(q * tick_spacing);
}

int32_t ceil_to_spacing(int64_t tick, int32_t tick_spacing) {
    int64_t q = tick / tick_spacing;
    if (tick % tick_spacing != 0 && tick > 0) ++q;
    return static_cast<int32_t>(q * tick_spacing);
}

double tick_to_price(int32_t tick, int decimals0, int decimals1) {
    return std::pow(1.0001, tick) * std::pow(10.0, decimals0 - decimals1);
}

double sqrt_price_to_price(const U256& sqrt_price_x96, int decimals0, int decimals1) {
    double s = to_double(sqrt_price_x96) / 79228162514264337593543950336.0;
    return s * s * std::pow(10.0, decimals0 - decimals1);
}

int32_t price_to_tick(double price, int decimals0, int decimals1) {
    if (!(price > 0.0)) {
        throw InvalidInput("price must be positive");
    }
    double raw = price / std::pow(10.0, decimals0 - decimals1);
    double t = std::floor(std::log(raw) / LOG_BASE);
    if (t < MIN_TICK || t > MAX_TICK) {
        throw OutOfBoundsTick("price maps outside tick bounds");
    }
    return static_cast<int32_t>(t);
}

double tick_delta_for_pct(double pct) {
    return std::log(1.0 + pct / 100.0) / LOG_BASE;
}

} // namespace tick_math
} // namespace lpm
