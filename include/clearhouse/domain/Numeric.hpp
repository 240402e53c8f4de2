#pragma once

#include <string>

#include <boost/multiprecision/cpp_dec_float.hpp>
#include <boost/multiprecision/cpp_int.hpp>

namespace clearhouse {

namespace mp = boost::multiprecision;

// Token amounts are integer atoms. A token with 18 decimals stores 1.0 as
// 10^18, so every amount is an exact fixed-point decimal.
using Amount = mp::cpp_int;

// Prices, surplus and scores. Exact, never rounded.
using Rational = mp::cpp_rational;

// Only for non-integer powers (weighted pools). Converted back to Amount with
// directed rounding before leaving pool math.
using Decimal = mp::cpp_dec_float_50;

Rational ratio(const Amount& num, const Amount& den);

Amount floor_of(const Rational& r);
Amount ceil_of(const Rational& r);

Amount floor_of(const Decimal& d);
Amount ceil_of(const Decimal& d);

Decimal to_decimal(const Amount& a);
Decimal to_decimal(const Rational& r);

// Decimal integer string of atoms ("1000000000000000000"). Throws
// std::invalid_argument on anything else, including a sign.
Amount parse_amount(const std::string& s);

// Accepts "3", "0.25" or "1/3". Negative values are rejected.
Rational parse_rational(const std::string& s);

std::string to_string(const Amount& a);

// Fixed-point rendering, truncated toward zero: to_fixed(1/3, 4) == "0.3333".
std::string to_fixed(const Rational& r, unsigned digits);

Amount pow10(unsigned exp);

} // namespace clearhouse
