#pragma once

#include <cstddef>
#include <vector>

#include "clearhouse/domain/Numeric.hpp"
#include "clearhouse/domain/Order.hpp"

namespace clearhouse {

namespace infra { class CancelToken; }

// Progress of one order through a candidate. Indices refer to the auction's
// order sequence.
struct OrderResidual {
    std::size_t order = 0;
    Amount executed_sell;
    Amount executed_buy;

    // Sell: sell amount still open. Buy: buy amount still open.
    Amount remaining(const Order& o) const;
    bool done(const Order& o) const { return remaining(o) <= 0; }
    bool touched() const { return executed_sell > 0 || executed_buy > 0; }
};

// first sells amount_first of its sell token to second, second sells
// amount_second back. price is second's token per first's token.
struct PeerMatch {
    std::size_t first = 0;
    std::size_t second = 0;
    Amount amount_first;
    Amount amount_second;
    Rational price;
};

struct MatchResult {
    std::vector<PeerMatch> matches;         // decision order
    std::vector<OrderResidual> residuals;   // one per auction order
};

// ---------------------------------------------------------------------------
// Direct order-to-order matching, attempted before any liquidity is touched.
//
// Orders are scanned in auction sequence. For each open order, counterparties
// are tried in auction sequence as well, so the earliest eligible counterparty
// always wins. Two orders are eligible when they trade the same pair in
// opposite directions and their limits overlap:
//
//     limit(first) <= 1 / limit(second)     (both in second-token per first-token)
//
// Settlement price is the midpoint of that overlap. The smaller side is filled
// completely; the larger side keeps a residual, which is only allowed when it
// is partially fillable. Otherwise the pair is skipped and both orders stay
// open for routing. A partially fillable order with a residual keeps matching
// later counterparties, so one order can clear against several.
//
// Amounts are rounded down on the side derived from the binding amount and
// both limits are re-checked exactly after rounding.
// ---------------------------------------------------------------------------
class PeerMatcher {
public:
    explicit PeerMatcher(const infra::CancelToken* cancel = nullptr) : cancel_(cancel) {}

    MatchResult match(const std::vector<Order>& orders) const;

private:
    bool try_match(const std::vector<Order>& orders, std::size_t i, std::size_t j,
                   std::vector<OrderResidual>& residuals, PeerMatch& out) const;

    const infra::CancelToken* cancel_;
};

} // namespace clearhouse
