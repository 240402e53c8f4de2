#pragma once

#include <map>
#include <optional>

#include "clearhouse/domain/Auction.hpp"
#include "clearhouse/domain/Numeric.hpp"
#include "clearhouse/domain/Token.hpp"

namespace clearhouse {

// ---------------------------------------------------------------------------
// One unit of account for a whole auction. Every candidate settles against
// the same basis, so their scores compare in the same unit.
//
// Built from the snapshot alone:
//   1. the configured numeraire at 1, when the auction knows it; reference
//      prices are rescaled by the numeraire's own reference price if it has one
//   2. otherwise the reference prices as given
//   3. unpriced tokens take the mid marginal rate of snapshot pools from a
//      priced neighbour, pools visited in snapshot order
//   4. anything still unpriced is seeded from the first order whose sell
//      token lacks a price, at 1, and step 3 repeats. With no other seed at
//      all, that first token becomes the numeraire.
// ---------------------------------------------------------------------------
struct PriceBasis {
    std::optional<TokenAddress> numeraire;
    std::map<TokenAddress, Rational> prices;

    const Rational* price(const TokenAddress& token) const {
        auto it = prices.find(token);
        return it == prices.end() ? nullptr : &it->second;
    }
};

PriceBasis derive_price_basis(const Auction& auction, const std::optional<TokenAddress>& numeraire);

} // namespace clearhouse
