#include "lpm/types.hpp"
#include "lpm/errors.hpp"

#include <algorithm>

namespace lpm {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string_view strip_prefix(std::string_view s) {
    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        return s.substr(2);
    }
    return s;
}

} // namespace

std::string to_string(U128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

U128 parse_u128(std::string_view s) {
    if (s.empty()) throw InvalidInput("empty amount");

    const bool is_hex = s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
    const U128 base = is_hex ? 16 : 10;
    std::string_view digits = is_hex ? s.substr(2) : s;

    U128 v = 0;
    for (char c : digits) {
        int d = hex_digit(c);
        if (d < 0 || static_cast<U128>(d) >= base) {
            throw InvalidInput("invalid amount: " + std::string(s));
        }
        if (v > (U128_MAX - static_cast<U128>(d)) / base) {
            throw InvalidInput("amount exceeds 128 bits: " + std::string(s));
        }
        v = v * base + static_cast<U128>(d);
    }
    return v;
}

TokenAmounts scale(const TokenAmounts& a, uint32_t num, uint32_t den) {
    // split so x * num never forms
    auto mul = [&](U128 x) -> U128 {
        return (x / den) * num + ((x % den) * num) / den;
    };
    return {mul(a.amount0), mul(a.amount1)};
}

namespace hex {

std::string encode(const uint8_t* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

std::string encode(const Bytes& data) {
    return encode(data.data(), data.size());
}

std::string encode(const Address& addr) {
    return encode(addr.data(), addr.size());
}

Bytes decode(std::string_view s) {
    std::string_view body = strip_prefix(s);
    if (body.size() % 2 != 0) {
        throw InvalidInput("odd-length hex string");
    }

    Bytes out;
    out.reserve(body.size() / 2);
    for (size_t i = 0; i < body.size(); i += 2) {
        int hi = hex_digit(body[i]);
        int lo = hex_digit(body[i + 1]);
        if (hi < 0 || lo < 0) {
            throw InvalidInput("invalid hex digit in: " + std::string(s));
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

Address to_address(std::string_view s) {
    Bytes raw = decode(s);
    if (raw.size() != 20) {
        throw InvalidInput("address must be 20 bytes: " + std::string(s));
    }
    Address addr{};
    std::copy(raw.begin(), raw.end(), addr.begin());
    return addr;
}

} // namespace hex

} // namespace lpm
