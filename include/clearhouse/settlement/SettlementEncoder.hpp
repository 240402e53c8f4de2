#pragma once

#include <optional>
#include <vector>

#include "clearhouse/domain/Auction.hpp"
#include "clearhouse/domain/Solution.hpp"
#include "clearhouse/matching/PeerMatcher.hpp"
#include "clearhouse/routing/OrderRouter.hpp"
#include "clearhouse/scoring/PriceBasis.hpp"

namespace clearhouse {

// ---------------------------------------------------------------------------
// Turns one candidate's matches and routes into a Solution.
//
//   fills         merged per order, auction sequence, positive fills only
//   interactions  route legs in commit order
//   fees          pro-rata order fees, keyed by sell token
//   prices        see clearing_prices() below
//
// Before returning, every invariant a settlement must satisfy is re-checked
// from scratch: caps, fill-or-kill, limits, pool deliverability against a fresh
// overlay, and per-token conservation. Any violation throws Infeasible. The
// score is left at zero for the Scorer.
// ---------------------------------------------------------------------------
class SettlementEncoder {
public:
    SettlementEncoder(const Auction& auction, PriceBasis basis)
        : auction_(auction), basis_(std::move(basis)) {}

    // Derives the basis from the snapshot. Candidates of one solve share a
    // basis through the other constructor instead.
    SettlementEncoder(const Auction& auction, const std::optional<TokenAddress>& numeraire)
        : SettlementEncoder(auction, derive_price_basis(auction, numeraire)) {}

    Solution encode(const std::vector<PeerMatch>& matches,
                    const std::vector<RoutedFill>& routed) const;

private:
    struct Trade {
        std::size_t order;
        Amount sell;
        Amount buy;
    };

    void check_fills(const std::vector<Fill>& fills) const;
    void check_pools(const std::vector<RoutedFill>& routed) const;
    void check_conservation(const Solution& s) const;

    // Each set of tokens linked by trades gets one seed at its basis price:
    // the basis numeraire when it is in the set, else the first token in
    // decision order the basis prices. The rest inherit prices across trades,
    // valuing both sides of a trade equally. A set the basis cannot price at
    // all starts from its first sell token at 1.
    std::map<TokenAddress, Rational> clearing_prices(const std::vector<Trade>& trades) const;

    const Auction& auction_;
    PriceBasis basis_;
};

} // namespace clearhouse
