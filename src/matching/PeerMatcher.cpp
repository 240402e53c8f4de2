#include "clearhouse/matching/PeerMatcher.hpp"

#include "clearhouse/infra/CancelToken.hpp"
#include "clearhouse/infra/Log.hpp"

namespace clearhouse {

Amount OrderResidual::remaining(const Order& o) const {
    if (o.kind == OrderKind::Sell) return o.sell_amount - executed_sell;
    return o.buy_amount - executed_buy;
}

MatchResult PeerMatcher::match(const std::vector<Order>& orders) const {
    MatchResult result;
    result.residuals.resize(orders.size());
    for (std::size_t k = 0; k < orders.size(); ++k) result.residuals[k].order = k;

    for (std::size_t i = 0; i < orders.size(); ++i) {
        for (std::size_t j = 0; j < orders.size(); ++j) {
            if (result.residuals[i].done(orders[i])) break;
            if (j == i || result.residuals[j].done(orders[j])) continue;
            if (cancel_) cancel_->check("peer_match");

            PeerMatch m;
            if (try_match(orders, i, j, result.residuals, m)) {
                infra::log_debug("MATCH") << orders[i].id << " <-> " << orders[j].id
                                          << " " << to_string(m.amount_first) << "/"
                                          << to_string(m.amount_second)
                                          << " @ " << to_fixed(m.price, 6);
                result.matches.push_back(std::move(m));
            }
        }
    }
    return result;
}

bool PeerMatcher::try_match(const std::vector<Order>& orders, std::size_t i, std::size_t j,
                            std::vector<OrderResidual>& residuals, PeerMatch& out) const {
    const Order& a = orders[i];
    const Order& b = orders[j];
    if (a.sell_token != b.buy_token || a.buy_token != b.sell_token) return false;

    // Prices in b's sell token (Y) per a's sell token (X).
    Rational a_min = limit_price(a);                 // a wants at least this
    Rational b_max = ratio(b.sell_amount, b.buy_amount);  // b pays at most this
    if (a_min > b_max) return false;

    Rational price = (a_min + b_max) / 2;

    OrderResidual& ra = residuals[i];
    OrderResidual& rb = residuals[j];
    Amount open_a = ra.remaining(a);
    Amount open_b = rb.remaining(b);

    // Capacities in X. Record which integer amount each cap comes from.
    bool a_cap_in_x = a.kind == OrderKind::Sell;
    Rational cap_a = a_cap_in_x ? Rational(open_a) : Rational(open_a) / price;
    bool b_cap_in_x = b.kind == OrderKind::Buy;
    Rational cap_b = b_cap_in_x ? Rational(open_b) : Rational(open_b) / price;

    // The larger side keeps a residual and must accept partial fills.
    if (cap_a < cap_b && !b.partially_fillable) return false;
    if (cap_b < cap_a && !a.partially_fillable) return false;

    bool a_binds = cap_a <= cap_b;
    bool binding_in_x = a_binds ? a_cap_in_x : b_cap_in_x;
    const Amount& binding = a_binds ? open_a : open_b;

    Amount x, y;
    if (binding_in_x) {
        x = binding;
        y = floor_of(Rational(x) * price);
    } else {
        y = binding;
        x = floor_of(Rational(y) / price);
    }
    if (x <= 0 || y <= 0) return false;

    if (!respects_limit(a, x, y) || !respects_limit(b, y, x)) return false;

    ra.executed_sell += x;
    ra.executed_buy += y;
    rb.executed_sell += y;
    rb.executed_buy += x;

    out.first = i;
    out.second = j;
    out.amount_first = x;
    out.amount_second = y;
    out.price = price;
    return true;
}

} // namespace clearhouse
