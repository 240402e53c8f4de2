#pragma once

#include "clearhouse/domain/Auction.hpp"
#include "clearhouse/domain/Numeric.hpp"
#include "clearhouse/domain/Solution.hpp"

namespace clearhouse {

// ---------------------------------------------------------------------------
// Objective value of a settled candidate:
//
//   score = sum over fills of surplus * clearing price - interaction_cost * #interactions
//
// Surplus is measured in the token the order is not capped in:
//   Sell: executed_buy - executed_sell * buy_amount / sell_amount   (buy token)
//   Buy:  executed_buy * sell_amount / buy_amount - executed_sell   (sell token)
//
// A solution without fills scores exactly zero. Larger is better.
// ---------------------------------------------------------------------------
class Scorer {
public:
    explicit Scorer(Rational interaction_cost = Rational(0))
        : interaction_cost_(std::move(interaction_cost)) {}

    Rational surplus(const Auction& auction, const Solution& s) const;
    Rational score(const Auction& auction, const Solution& s) const;

    // Writes score() into s and returns it.
    const Rational& apply(const Auction& auction, Solution& s) const;

private:
    Rational interaction_cost_;
};

// Descending by score; ties keep the earlier candidate.
inline bool better_than(const Solution& a, const Solution& b) {
    return a.score > b.score;
}

} // namespace clearhouse
