#include "clearhouse/quote/Quoter.hpp"

#include "clearhouse/domain/Errors.hpp"
#include "clearhouse/infra/CancelToken.hpp"
#include "clearhouse/infra/Log.hpp"
#include "clearhouse/liquidity/ReserveOverlay.hpp"

namespace clearhouse {

Quoter::Quoter(const Auction& auction, const SolverConfig& cfg)
    : auction_(auction), graph_(LiquidityGraph::build(auction.pools())) {
    params_.max_hops = cfg.max_hops;
    params_.allow_splits = cfg.allow_splits;
    params_.split.granularity = cfg.split_granularity;
    params_.split.max_pools = cfg.max_split_pools;
}

Quote Quoter::quote(const QuoteRequest& req) const {
    TokenAddress sell, buy;
    if (!normalize_address(req.sell_token, sell)) throw InvalidOrder("malformed sell token " + req.sell_token);
    if (!normalize_address(req.buy_token, buy)) throw InvalidOrder("malformed buy token " + req.buy_token);
    if (sell == buy) throw InvalidOrder("sell and buy token are the same");
    if (req.amount <= 0) throw InvalidOrder("amount must be positive");

    if (req.deadline <= infra::now()) throw QuoteTimeout("deadline already passed");

    infra::CancelToken cancel(req.deadline);
    RouteSearch search(graph_, params_, &cancel);
    if (!search.connects(sell, buy)) throw NoRoute(sell + " -> " + buy);

    ReserveOverlay overlay(auction_.pools());
    std::optional<Route> route;
    try {
        route = req.kind == OrderKind::Sell
              ? search.best_exact_in(overlay, sell, buy, req.amount)
              : search.best_exact_out(overlay, sell, buy, req.amount);
    } catch (const Cancelled&) {
        throw QuoteTimeout(sell + " -> " + buy + " for " + to_string(req.amount));
    }
    if (!route) throw NoRoute(sell + " -> " + buy + " for " + to_string(req.amount));

    Quote q;
    q.sell_amount = route->amount_in();
    q.buy_amount = route->amount_out();
    for (const auto& hop : route->hops) {
        for (const auto& leg : hop.legs) {
            q.interactions.push_back(
                Interaction{leg.pool_id, hop.token_in, hop.token_out, leg.amount_in, leg.amount_out});
        }
    }
    q.clearing_prices[sell] = Rational(q.buy_amount);
    q.clearing_prices[buy] = Rational(q.sell_amount);

    infra::log_debug("ROUTE") << "quote " << kind_str(req.kind) << " " << to_string(q.sell_amount)
                              << " -> " << to_string(q.buy_amount) << " via "
                              << q.interactions.size() << " interaction(s)";
    return q;
}

} // namespace clearhouse
