#ifndef LPM_TYPES_HPP
#define LPM_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace lpm {

// =============================================================================
// Integer Aliases
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr U128 U128_MAX = ~static_cast<U128>(0);

// Build a 128-bit constant from two 64-bit halves
constexpr U128 u128(uint64_t hi, uint64_t lo) {
    return (static_cast<U128>(hi) << 64) | static_cast<U128>(lo);
}

// Decimal rendering of 128-bit amounts (logs, reports)
std::string to_string(U128 v);

// Parse a decimal or 0x-prefixed hex amount; throws InvalidInput
U128 parse_u128(std::string_view s);

// =============================================================================
// EVM Addresses and Byte Strings
// =============================================================================

using Address = std::array<uint8_t, 20>;
using Bytes = std::vector<uint8_t>;

namespace hex {

// "0x"-prefixed lowercase hex of arbitrary bytes
std::string encode(const uint8_t* data, size_t len);
std::string encode(const Bytes& data);
std::string encode(const Address& addr);

// Accepts an optional 0x prefix; throws InvalidInput on odd length or bad digits
Bytes decode(std::string_view s);

// Exactly 20 bytes, 0x-prefixed
Address to_address(std::string_view s);

} // namespace hex

inline bool is_zero(const Address& a) {
    for (auto b : a) if (b != 0) return false;
    return true;
}

// =============================================================================
// Currency Type (Token Address)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    // address(0) is the chain's native asset
    bool is_native() const { return is_zero(addr); }

    std::string to_hex() const { return hex::encode(addr); }

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

// =============================================================================
// Pool Key (Unique Pool Identifier)
// =============================================================================

struct PoolKey {
    Currency currency0;      // Sorted: currency0 < currency1
    Currency currency1;
    uint32_t fee = 0;        // Fee in hundredths of a bip (3000 = 0.30%)
    int32_t tick_spacing = 1;
    Address hooks{};         // Hook contract address (0 = no hooks)

    bool operator==(const PoolKey& other) const {
        return currency0 == other.currency0 &&
               currency1 == other.currency1 &&
               fee == other.fee &&
               tick_spacing == other.tick_spacing &&
               hooks == other.hooks;
    }
    bool operator!=(const PoolKey& other) const { return !(*this == other); }
};

namespace fees {
constexpr uint32_t FEE_DENOMINATOR = 1000000;
constexpr uint32_t FEE_030 = 3000;    // 0.30%
constexpr uint32_t FEE_100 = 10000;   // 1.00%
}

// =============================================================================
// Token Amounts (smallest units, never negative)
// =============================================================================

struct TokenAmounts {
    U128 amount0 = 0;
    U128 amount1 = 0;

    bool is_zero() const { return amount0 == 0 && amount1 == 0; }

    TokenAmounts operator+(const TokenAmounts& other) const {
        return {amount0 + other.amount0, amount1 + other.amount1};
    }

    // Saturates at zero per side
    TokenAmounts saturating_sub(const TokenAmounts& other) const {
        return {amount0 > other.amount0 ? amount0 - other.amount0 : 0,
                amount1 > other.amount1 ? amount1 - other.amount1 : 0};
    }

    bool operator==(const TokenAmounts& other) const {
        return amount0 == other.amount0 && amount1 == other.amount1;
    }
    bool operator!=(const TokenAmounts& other) const { return !(*this == other); }
};

// Scale both sides by num/den, rounding down
TokenAmounts scale(const TokenAmounts& a, uint32_t num, uint32_t den);

// Per-side minimum
inline TokenAmounts min_each(const TokenAmounts& a, const TokenAmounts& b) {
    return {a.amount0 < b.amount0 ? a.amount0 : b.amount0,
            a.amount1 < b.amount1 ? a.amount1 : b.amount1};
}

} // namespace lpm

#endif // LPM_TYPES_HPP
