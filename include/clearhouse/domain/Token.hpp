#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "clearhouse/domain/Numeric.hpp"

namespace clearhouse {

// Lower-case "0x" + 40 hex digits.
using TokenAddress = std::string;

struct Token {
    TokenAddress address;
    uint8_t decimals = 18;
    // External native price of one atom, when the snapshot provider knows it.
    std::optional<Rational> reference_price;
};

using TokenMap = std::map<TokenAddress, Token>;

// Normalizes case; returns false when the input is not a 20-byte hex address.
bool normalize_address(const std::string& raw, TokenAddress& out);

} // namespace clearhouse
