#include "clearhouse/routing/SplitRouter.hpp"

#include <algorithm>

#include "clearhouse/infra/CancelToken.hpp"
#include "clearhouse/infra/Log.hpp"
#include "clearhouse/liquidity/LiquidityGraph.hpp"
#include "clearhouse/liquidity/ReserveOverlay.hpp"

namespace clearhouse {

std::optional<RouteHop> SplitRouter::split_hop(const ReserveOverlay& overlay,
                                               std::size_t from, std::size_t to,
                                               const Amount& amount_in,
                                               const std::set<std::size_t>& excluded) const {
    if (amount_in <= 0) return std::nullopt;

    const TokenAddress& tin = graph_.token(from);
    const TokenAddress& tout = graph_.token(to);

    // Candidate pools, best current rate first, capped at max_pools.
    struct Candidate { std::size_t pool; Rational rate; };
    std::vector<Candidate> cands;
    for (std::size_t e : graph_.parallel_edges(from, to)) {
        std::size_t pool = graph_.edge(e).pool;
        if (excluded.count(pool)) continue;
        auto rate = graph_.current_rate(e, overlay);
        if (!rate) continue;
        cands.push_back({pool, *rate});
    }
    if (cands.empty()) return std::nullopt;

    std::stable_sort(cands.begin(), cands.end(),
                     [](const Candidate& a, const Candidate& b) { return a.rate > b.rate; });
    if (cands.size() > params_.max_pools) cands.resize(params_.max_pools);

    std::size_t chunks = std::max<std::size_t>(params_.granularity, 1);
    Amount chunk = amount_in / chunks;
    if (chunk == 0) {
        chunk = amount_in;
        chunks = 1;
    }

    std::vector<Amount> alloc(cands.size(), Amount(0));
    std::vector<Amount> out(cands.size(), Amount(0));

    for (std::size_t c = 0; c < chunks; ++c) {
        if (cancel_) cancel_->check("split_hop");

        Amount piece = (c + 1 == chunks) ? Amount(amount_in - chunk * (chunks - 1)) : chunk;

        std::optional<std::size_t> best;
        Amount best_gain = 0;
        Amount best_out = 0;
        for (std::size_t k = 0; k < cands.size(); ++k) {
            auto got = quote(overlay.view(cands[k].pool), tin, tout, alloc[k] + piece);
            if (!got) continue;
            Amount gain = *got - out[k];
            if (!best || gain > best_gain) {
                best = k;
                best_gain = gain;
                best_out = *got;
            }
        }
        if (!best || best_gain <= 0) return std::nullopt;

        alloc[*best] += piece;
        out[*best] = best_out;
    }

    RouteHop hop;
    hop.token_in = tin;
    hop.token_out = tout;
    for (std::size_t k = 0; k < cands.size(); ++k) {
        if (alloc[k] == 0) continue;
        RouteLeg leg;
        leg.pool = cands[k].pool;
        leg.pool_id = pool_id(overlay.view(cands[k].pool));
        leg.amount_in = alloc[k];
        leg.amount_out = out[k];
        hop.legs.push_back(std::move(leg));
    }
    return hop;
}

std::optional<Route> SplitRouter::improve(const ReserveOverlay& overlay, const Route& route) const {
    if (route.empty()) return std::nullopt;

    std::set<std::size_t> on_path;
    for (const auto& h : route.hops) {
        for (const auto& l : h.legs) on_path.insert(l.pool);
    }

    Route split;
    Amount amount = route.amount_in();
    // Every hop quotes against the same overlay, so a pool may serve only one
    // hop of the split route.
    std::set<std::size_t> used;
    for (const auto& hop : route.hops) {
        auto from = graph_.node(hop.token_in);
        auto to = graph_.node(hop.token_out);
        if (!from || !to) return std::nullopt;

        std::set<std::size_t> excluded = on_path;
        for (const auto& l : hop.legs) excluded.erase(l.pool);
        excluded.insert(used.begin(), used.end());

        auto next = split_hop(overlay, *from, *to, amount, excluded);
        if (!next) return std::nullopt;
        for (const auto& l : next->legs) used.insert(l.pool);
        amount = next->amount_out();
        split.hops.push_back(std::move(*next));
    }

    if (!split.split() || split.amount_out() <= route.amount_out()) return std::nullopt;

    infra::log_debug("ROUTE") << "split improves " << route.hops.size() << "-hop route by "
                       << to_string(split.amount_out() - route.amount_out()) << " atoms";
    return split;
}

} // namespace clearhouse
