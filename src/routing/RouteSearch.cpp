#include "clearhouse/routing/RouteSearch.hpp"

#include <queue>
#include <vector>

#include "clearhouse/infra/CancelToken.hpp"
#include "clearhouse/infra/Log.hpp"
#include "clearhouse/liquidity/LiquidityGraph.hpp"
#include "clearhouse/liquidity/ReserveOverlay.hpp"

namespace clearhouse {

namespace {

struct Step {
    std::size_t edge;
    Amount amount_in;
    Amount amount_out;
};

struct Label {
    std::size_t node;
    Amount amount;            // reached output (exact-in) or required input (exact-out)
    Rational key;             // optimistic final value
    uint64_t seq;             // insertion order, breaks key ties
    std::vector<Step> steps;  // forward for exact-in, reversed for exact-out
};

// Max-heap on key for exact-in; earlier labels first on ties.
struct MaxKey {
    bool operator()(const Label& a, const Label& b) const {
        if (a.key != b.key) return a.key < b.key;
        return a.seq > b.seq;
    }
};

// Min-heap on key for exact-out.
struct MinKey {
    bool operator()(const Label& a, const Label& b) const {
        if (a.key != b.key) return a.key > b.key;
        return a.seq > b.seq;
    }
};

bool uses_pool(const std::vector<Step>& steps, const LiquidityGraph& g, std::size_t pool) {
    for (const auto& s : steps) {
        if (g.edge(s.edge).pool == pool) return true;
    }
    return false;
}

bool visits_forward(const std::vector<Step>& steps, const LiquidityGraph& g,
                    std::size_t source, std::size_t node) {
    if (node == source) return true;
    for (const auto& s : steps) {
        if (g.edge(s.edge).to == node) return true;
    }
    return false;
}

bool visits_backward(const std::vector<Step>& steps, const LiquidityGraph& g,
                     std::size_t target, std::size_t node) {
    if (node == target) return true;
    for (const auto& s : steps) {
        if (g.edge(s.edge).from == node) return true;
    }
    return false;
}

Route to_route(const std::vector<Step>& steps, const LiquidityGraph& g,
               const ReserveOverlay& overlay) {
    Route r;
    for (const auto& s : steps) {
        const GraphEdge& e = g.edge(s.edge);
        RouteHop hop;
        hop.token_in = g.token(e.from);
        hop.token_out = g.token(e.to);
        RouteLeg leg;
        leg.pool = e.pool;
        leg.pool_id = pool_id(overlay.view(e.pool));
        leg.amount_in = s.amount_in;
        leg.amount_out = s.amount_out;
        hop.legs.push_back(std::move(leg));
        r.hops.push_back(std::move(hop));
    }
    return r;
}

} // namespace

RouteSearch::RouteSearch(const LiquidityGraph& graph, RouteSearchParams params,
                         const infra::CancelToken* cancel)
    : graph_(graph),
      params_(params),
      cancel_(cancel),
      splitter_(graph, params.split, cancel) {}

bool RouteSearch::connects(const TokenAddress& sell, const TokenAddress& buy) const {
    return graph_.node(sell).has_value() && graph_.node(buy).has_value();
}

std::optional<Route> RouteSearch::best_exact_in(const ReserveOverlay& overlay,
                                                const TokenAddress& sell, const TokenAddress& buy,
                                                const Amount& amount_in) const {
    auto source = graph_.node(sell);
    auto target = graph_.node(buy);
    if (!source || !target || *source == *target || amount_in <= 0) return std::nullopt;
    if (params_.max_hops < 1) return std::nullopt;

    ++stats_.searches;
    const int max_hops = params_.max_hops;
    auto bound = graph_.best_rates_to(*target, max_hops, overlay);
    if (!bound[max_hops][*source]) return std::nullopt;

    std::priority_queue<Label, std::vector<Label>, MaxKey> open;
    uint64_t seq = 0;
    open.push(Label{*source, amount_in, Rational(amount_in) * *bound[max_hops][*source], seq++, {}});

    std::optional<Label> best;

    while (!open.empty()) {
        if (cancel_) cancel_->check("route_search");

        Label cur = open.top();
        open.pop();

        if (best && cur.key <= Rational(best->amount)) break;
        ++stats_.expanded;

        if (cur.node == *target) {
            if (!best || cur.amount > best->amount) best = std::move(cur);
            continue;
        }

        int used = static_cast<int>(cur.steps.size());
        if (used >= max_hops) continue;
        int remaining = max_hops - used - 1;

        for (std::size_t e : graph_.out_edges(cur.node)) {
            const GraphEdge& edge = graph_.edge(e);
            const auto& downstream = bound[remaining][edge.to];
            if (!downstream) continue;
            if (visits_forward(cur.steps, graph_, *source, edge.to)) continue;
            if (uses_pool(cur.steps, graph_, edge.pool)) continue;

            auto out = quote(overlay.view(edge.pool), graph_.token(edge.from),
                             graph_.token(edge.to), cur.amount);
            if (!out) continue;

            Rational key = Rational(*out) * *downstream;
            if (best && key <= Rational(best->amount)) {
                ++stats_.pruned;
                continue;
            }

            Label next{edge.to, *out, std::move(key), seq++, cur.steps};
            next.steps.push_back(Step{e, cur.amount, *out});
            open.push(std::move(next));
        }
    }

    if (!best) return std::nullopt;

    Route route = to_route(best->steps, graph_, overlay);
    if (params_.allow_splits) {
        if (auto split = splitter_.improve(overlay, route)) return split;
    }
    return route;
}

std::optional<Route> RouteSearch::best_exact_out(const ReserveOverlay& overlay,
                                                 const TokenAddress& sell, const TokenAddress& buy,
                                                 const Amount& amount_out) const {
    auto source = graph_.node(sell);
    auto target = graph_.node(buy);
    if (!source || !target || *source == *target || amount_out <= 0) return std::nullopt;
    if (params_.max_hops < 1) return std::nullopt;

    ++stats_.searches;
    const int max_hops = params_.max_hops;
    auto bound = graph_.best_rates_from(*source, max_hops, overlay);
    if (!bound[max_hops][*target]) return std::nullopt;

    std::priority_queue<Label, std::vector<Label>, MinKey> open;
    uint64_t seq = 0;
    open.push(Label{*target, amount_out, Rational(amount_out) / *bound[max_hops][*target], seq++, {}});

    std::optional<Label> best;

    while (!open.empty()) {
        if (cancel_) cancel_->check("route_search");

        Label cur = open.top();
        open.pop();

        if (best && cur.key >= Rational(best->amount)) break;
        ++stats_.expanded;

        if (cur.node == *source) {
            if (!best || cur.amount < best->amount) best = std::move(cur);
            continue;
        }

        int used = static_cast<int>(cur.steps.size());
        if (used >= max_hops) continue;
        int remaining = max_hops - used - 1;

        for (std::size_t e : graph_.in_edges(cur.node)) {
            const GraphEdge& edge = graph_.edge(e);
            const auto& upstream = bound[remaining][edge.from];
            if (!upstream) continue;
            if (visits_backward(cur.steps, graph_, *target, edge.from)) continue;
            if (uses_pool(cur.steps, graph_, edge.pool)) continue;

            auto in = quote_inverse(overlay.view(edge.pool), graph_.token(edge.from),
                                    graph_.token(edge.to), cur.amount);
            if (!in) continue;

            Rational key = Rational(*in) / *upstream;
            if (best && key >= Rational(best->amount)) {
                ++stats_.pruned;
                continue;
            }

            Label next{edge.from, *in, std::move(key), seq++, cur.steps};
            next.steps.push_back(Step{e, *in, cur.amount});
            open.push(std::move(next));
        }
    }

    if (!best) return std::nullopt;

    std::vector<Step> forward(best->steps.rbegin(), best->steps.rend());
    return to_route(forward, graph_, overlay);
}

} // namespace clearhouse
