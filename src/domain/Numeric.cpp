#include "clearhouse/domain/Numeric.hpp"

#include <cctype>
#include <stdexcept>

namespace clearhouse {

namespace {

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

Rational ratio(const Amount& num, const Amount& den) {
    if (den == 0) throw std::domain_error("[NUMERIC] ratio with zero denominator");
    return Rational(num) / Rational(den);
}

Amount floor_of(const Rational& r) {
    Amount n = mp::numerator(r);
    Amount d = mp::denominator(r);
    Amount q = n / d;
    if (n < 0 && q * d != n) q -= 1;
    return q;
}

Amount ceil_of(const Rational& r) {
    Amount n = mp::numerator(r);
    Amount d = mp::denominator(r);
    Amount q = n / d;
    if (n > 0 && q * d != n) q += 1;
    return q;
}

Amount floor_of(const Decimal& d) {
    Decimal f = mp::floor(d);
    return Amount(f);
}

Amount ceil_of(const Decimal& d) {
    Decimal c = mp::ceil(d);
    return Amount(c);
}

Decimal to_decimal(const Amount& a) {
    return Decimal(a);
}

Decimal to_decimal(const Rational& r) {
    return Decimal(mp::numerator(r)) / Decimal(mp::denominator(r));
}

Amount parse_amount(const std::string& s) {
    if (!all_digits(s)) {
        throw std::invalid_argument("[NUMERIC] not an unsigned integer amount: '" + s + "'");
    }
    return Amount(s);
}

Rational parse_rational(const std::string& s) {
    auto slash = s.find('/');
    if (slash != std::string::npos) {
        std::string num = s.substr(0, slash);
        std::string den = s.substr(slash + 1);
        if (!all_digits(num) || !all_digits(den)) {
            throw std::invalid_argument("[NUMERIC] malformed rational: '" + s + "'");
        }
        Amount d(den);
        if (d == 0) throw std::invalid_argument("[NUMERIC] zero denominator: '" + s + "'");
        return ratio(Amount(num), d);
    }

    auto dot = s.find('.');
    if (dot == std::string::npos) {
        if (!all_digits(s)) {
            throw std::invalid_argument("[NUMERIC] malformed number: '" + s + "'");
        }
        return Rational(Amount(s));
    }

    std::string whole = s.substr(0, dot);
    std::string frac = s.substr(dot + 1);
    if (whole.empty()) whole = "0";
    if (!all_digits(whole) || !all_digits(frac)) {
        throw std::invalid_argument("[NUMERIC] malformed decimal: '" + s + "'");
    }
    Amount scale = pow10(static_cast<unsigned>(frac.size()));
    return ratio(Amount(whole) * scale + Amount(frac), scale);
}

std::string to_string(const Amount& a) {
    return a.str();
}

std::string to_fixed(const Rational& r, unsigned digits) {
    bool neg = r < 0;
    Rational abs_r = neg ? Rational(-r) : r;
    Amount scale = pow10(digits);
    Amount scaled = floor_of(abs_r * Rational(scale));

    Amount whole = scaled / scale;
    Amount frac = scaled % scale;

    std::string out = neg ? "-" : "";
    out += whole.str();
    if (digits > 0) {
        std::string f = frac.str();
        out += ".";
        out += std::string(digits - f.size(), '0');
        out += f;
    }
    return out;
}

Amount pow10(unsigned exp) {
    Amount v = 1;
    for (unsigned i = 0; i < exp; ++i) v *= 10;
    return v;
}

} // namespace clearhouse
