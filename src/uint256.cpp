#include "lpm/uint256.hpp"

#include <algorithm>
#include <cctype>
#include <ios>
#include <iterator>
#include <vector>

namespace lpm {

using boost::multiprecision::cpp_int;

U256 u256_max() {
    static const U256 v = ~U256(0);
    return v;
}

U256 parse_u256(std::string_view s) {
    if (s.empty()) throw InvalidInput("empty integer literal");

    const bool is_hex = s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
    std::string_view digits = is_hex ? s.substr(2) : s;
    for (char c : digits) {
        const bool ok = is_hex ? std::isxdigit(static_cast<unsigned char>(c)) != 0
                               : (c >= '0' && c <= '9');
        if (!ok) throw InvalidInput("invalid integer literal: " + std::string(s));
    }

    // cpp_int reads a leading zero as octal
    std::string text;
    if (is_hex) {
        text = "0x" + std::string(digits);
    } else {
        size_t first = digits.find_first_not_of('0');
        text = first == std::string_view::npos ? "0" : std::string(digits.substr(first));
    }

    cpp_int wide(text);
    if (wide != 0 && boost::multiprecision::msb(wide) >= 256) {
        throw InvalidInput("integer literal overflows: " + std::string(s));
    }
    return U256(wide);
}

std::string to_string(const U256& v) {
    return v.str();
}

std::string to_hex(const U256& v) {
    std::string digits = v.str(0, std::ios_base::hex);
    std::transform(digits.begin(), digits.end(), digits.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return "0x" + digits;
}

std::array<uint8_t, 32> to_be_bytes(const U256& v) {
    std::vector<uint8_t> raw;
    boost::multiprecision::export_bits(v, std::back_inserter(raw), 8);

    std::array<uint8_t, 32> out{};
    std::copy(raw.begin(), raw.end(), out.begin() + (32 - raw.size()));
    return out;
}

U256 u256_from_be_bytes(const uint8_t* data, size_t len) {
    if (len > 32) throw InvalidInput("byte string too wide");
    U256 r;
    if (len > 0) boost::multiprecision::import_bits(r, data, data + len);
    return r;
}

U128 to_u128(const U256& v) {
    if (!fits_u128(v)) throw ArithmeticError("value exceeds 128 bits: " + to_string(v));
    const auto hi = static_cast<uint64_t>(v >> 64);
    const auto lo = static_cast<uint64_t>(v & U256(~uint64_t{0}));
    return u128(hi, lo);
}

U256 mul_div(const U256& a, const U256& b, const U256& denom) {
    if (denom == 0) throw ArithmeticError("mul_div: zero denominator");
    const U512 q = U512(a) * U512(b) / U512(denom);
    if ((q >> 256) != 0) throw ArithmeticError("mul_div: result exceeds 256 bits");
    return U256(q);
}

U256 mul_div_rounding_up(const U256& a, const U256& b, const U256& denom) {
    if (denom == 0) throw ArithmeticError("mul_div: zero denominator");
    const U512 product = U512(a) * U512(b);
    U512 q = product / U512(denom);
    if (product % U512(denom) != 0) q += 1;
    if ((q >> 256) != 0) throw ArithmeticError("mul_div: result exceeds 256 bits");
    return U256(q);
}

} // namespace lpm
