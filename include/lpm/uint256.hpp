#ifndef LPM_UINT256_HPP
#define LPM_UINT256_HPP

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

#include "errors.hpp"
#include "types.hpp"

namespace lpm {

// =============================================================================
// EVM words
// =============================================================================
//
// Fixed-width and unchecked: arithmetic wraps modulo 2^256 like Solidity's
// unchecked uint256. Overflow-sensitive paths go through mul_div below.

using U256 = boost::multiprecision::uint256_t;
using U512 = boost::multiprecision::uint512_t;

U256 u256_max();

// Decimal, or hex with a 0x prefix; throws InvalidInput
U256 parse_u256(std::string_view s);

std::string to_string(const U256& v);

// "0x"-prefixed lowercase hex, no leading zeros ("0x0" for zero)
std::string to_hex(const U256& v);

// Big-endian, exactly 32 bytes
std::array<uint8_t, 32> to_be_bytes(const U256& v);

// Big-endian input of at most 32 bytes
U256 u256_from_be_bytes(const uint8_t* data, size_t len);

inline double to_double(const U256& v) { return v.convert_to<double>(); }

inline bool fits_u128(const U256& v) { return (v >> 128) == 0; }

// Throws ArithmeticError when v does not fit
U128 to_u128(const U256& v);

// =============================================================================
// Full-precision multiply-divide
// =============================================================================

// floor(a * b / denom) with a 512-bit intermediate
U256 mul_div(const U256& a, const U256& b, const U256& denom);

// ceil(a * b / denom)
U256 mul_div_rounding_up(const U256& a, const U256& b, const U256& denom);

} // namespace lpm

#endif // LPM_UINT256_HPP
