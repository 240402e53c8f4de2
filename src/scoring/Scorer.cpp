#include "clearhouse/scoring/Scorer.hpp"

#include "clearhouse/domain/Errors.hpp"

namespace clearhouse {

namespace {

const Rational& price_of(const Solution& s, const TokenAddress& token) {
    auto it = s.clearing_prices.find(token);
    if (it == s.clearing_prices.end()) throw Infeasible("no clearing price for " + token);
    return it->second;
}

} // namespace

Rational Scorer::surplus(const Auction& auction, const Solution& s) const {
    Rational total = 0;
    for (const auto& f : s.fills) {
        const Order* o = auction.order(f.order_id);
        if (!o) throw Infeasible("scored fill for unknown order " + f.order_id);

        if (o->kind == OrderKind::Sell) {
            Rational owed = Rational(f.executed_sell) * ratio(o->buy_amount, o->sell_amount);
            total += (Rational(f.executed_buy) - owed) * price_of(s, o->buy_token);
        } else {
            Rational worth = Rational(f.executed_buy) * ratio(o->sell_amount, o->buy_amount);
            total += (worth - Rational(f.executed_sell)) * price_of(s, o->sell_token);
        }
    }
    return total;
}

Rational Scorer::score(const Auction& auction, const Solution& s) const {
    if (s.empty()) return Rational(0);
    Rational cost = interaction_cost_ * static_cast<long>(s.interactions.size());
    return surplus(auction, s) - cost;
}

const Rational& Scorer::apply(const Auction& auction, Solution& s) const {
    s.score = score(auction, s);
    return s.score;
}

} // namespace clearhouse
