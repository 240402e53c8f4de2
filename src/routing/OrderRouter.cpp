#include "clearhouse/routing/OrderRouter.hpp"

#include "clearhouse/infra/Log.hpp"
#include "clearhouse/liquidity/ReserveOverlay.hpp"

namespace clearhouse {

namespace {

// Route amounts as the trader sees them: what leaves the trader, what arrives.
bool route_meets_limit(const Order& o, const Route& r) {
    return respects_limit(o, r.amount_in(), r.amount_out());
}

} // namespace

void commit_route(const Route& route, ReserveOverlay& overlay) {
    for (const auto& hop : route.hops) {
        for (const auto& leg : hop.legs) {
            overlay.consume(leg.pool, hop.token_in, leg.amount_in, hop.token_out, leg.amount_out);
        }
    }
}

std::optional<Route> OrderRouter::attempt(const Order& o, const Amount& size,
                                          const ReserveOverlay& overlay) const {
    std::optional<Route> r;
    if (o.kind == OrderKind::Sell) {
        r = search_.best_exact_in(overlay, o.sell_token, o.buy_token, size);
    } else {
        r = search_.best_exact_out(overlay, o.sell_token, o.buy_token, size);
    }
    if (r && route_meets_limit(o, *r)) return r;
    return std::nullopt;
}

std::optional<Route> OrderRouter::largest_partial(const Order& o, const Amount& open,
                                                  const ReserveOverlay& overlay) const {
    // Realized rate only worsens with size along any fixed path, so the
    // feasible sizes form a prefix of [1, open).
    Amount lo = 0;
    Amount hi = open;
    std::optional<Route> best;

    for (std::size_t step = 0; step < partial_fill_steps_ && hi - lo > 1; ++step) {
        Amount mid = (lo + hi) / 2;
        if (auto r = attempt(o, mid, overlay)) {
            lo = mid;
            best = std::move(r);
        } else {
            hi = mid;
        }
    }
    return best;
}

std::vector<RoutedFill> OrderRouter::route(const std::vector<Order>& orders,
                                           std::vector<OrderResidual>& residuals,
                                           ReserveOverlay& overlay) const {
    std::vector<RoutedFill> fills;

    for (auto& res : residuals) {
        const Order& o = orders[res.order];
        if (res.done(o)) continue;
        if (!search_.connects(o.sell_token, o.buy_token)) continue;

        Amount open = res.remaining(o);
        auto route = attempt(o, open, overlay);
        if (!route && o.partially_fillable) route = largest_partial(o, open, overlay);

        if (!route) {
            infra::log_debug("ROUTE") << o.id << " no route meets limit "
                                      << to_fixed(limit_price(o), 8);
            continue;
        }

        commit_route(*route, overlay);

        RoutedFill f;
        f.order = res.order;
        f.executed_sell = route->amount_in();
        f.executed_buy = route->amount_out();
        f.route = std::move(*route);

        res.executed_sell += f.executed_sell;
        res.executed_buy += f.executed_buy;

        infra::log_debug("ROUTE") << o.id << " " << f.route.hops.size() << " hop(s), "
                                  << f.route.interaction_count() << " interaction(s), in="
                                  << to_string(f.executed_sell) << " out="
                                  << to_string(f.executed_buy);
        fills.push_back(std::move(f));
    }
    return fills;
}

} // namespace clearhouse
