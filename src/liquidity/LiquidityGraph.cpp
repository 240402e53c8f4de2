#include "clearhouse/liquidity/LiquidityGraph.hpp"

#include "clearhouse/liquidity/ReserveOverlay.hpp"

namespace clearhouse {

LiquidityGraph LiquidityGraph::build(const std::vector<LiquidityPool>& pools) {
    LiquidityGraph g;
    for (std::size_t p = 0; p < pools.size(); ++p) {
        auto toks = pool_tokens(pools[p]);
        for (const auto& a : toks) {
            for (const auto& b : toks) {
                if (a == b) continue;
                auto price = marginal_price(pools[p], a, b);
                if (!price || *price <= 0) continue;

                GraphEdge e;
                e.pool = p;
                e.from = g.intern(a);
                e.to = g.intern(b);
                e.marginal_price = *price;

                std::size_t idx = g.edges_.size();
                g.edges_.push_back(std::move(e));
                g.out_[g.edges_[idx].from].push_back(idx);
                g.in_[g.edges_[idx].to].push_back(idx);
            }
        }
    }
    return g;
}

std::size_t LiquidityGraph::intern(const TokenAddress& token) {
    auto it = index_.find(token);
    if (it != index_.end()) return it->second;
    std::size_t idx = tokens_.size();
    tokens_.push_back(token);
    index_.emplace(token, idx);
    out_.emplace_back();
    in_.emplace_back();
    return idx;
}

std::optional<std::size_t> LiquidityGraph::node(const TokenAddress& token) const {
    auto it = index_.find(token);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::size_t> LiquidityGraph::parallel_edges(std::size_t from, std::size_t to) const {
    std::vector<std::size_t> out;
    for (std::size_t e : out_[from]) {
        if (edges_[e].to == to) out.push_back(e);
    }
    return out;
}

std::optional<Rational> LiquidityGraph::current_rate(std::size_t e, const ReserveOverlay& overlay) const {
    const GraphEdge& edge = edges_[e];
    if (!overlay.touched(edge.pool)) return edge.marginal_price;
    return marginal_price(overlay.view(edge.pool), tokens_[edge.from], tokens_[edge.to]);
}

LiquidityGraph::RateTable LiquidityGraph::best_rates_to(std::size_t target, int max_hops,
                                                        const ReserveOverlay& overlay) const {
    std::vector<std::optional<Rational>> rates(edges_.size());
    for (std::size_t e = 0; e < edges_.size(); ++e) rates[e] = current_rate(e, overlay);

    RateTable best(static_cast<std::size_t>(max_hops) + 1,
                   std::vector<std::optional<Rational>>(tokens_.size()));
    best[0][target] = Rational(1);

    for (int h = 1; h <= max_hops; ++h) {
        best[h] = best[h - 1];
        for (std::size_t e = 0; e < edges_.size(); ++e) {
            const auto& downstream = best[h - 1][edges_[e].to];
            if (!rates[e] || !downstream) continue;
            Rational cand = *rates[e] * *downstream;
            auto& slot = best[h][edges_[e].from];
            if (!slot || cand > *slot) slot = cand;
        }
    }
    return best;
}

LiquidityGraph::RateTable LiquidityGraph::best_rates_from(std::size_t source, int max_hops,
                                                          const ReserveOverlay& overlay) const {
    std::vector<std::optional<Rational>> rates(edges_.size());
    for (std::size_t e = 0; e < edges_.size(); ++e) rates[e] = current_rate(e, overlay);

    RateTable best(static_cast<std::size_t>(max_hops) + 1,
                   std::vector<std::optional<Rational>>(tokens_.size()));
    best[0][source] = Rational(1);

    for (int h = 1; h <= max_hops; ++h) {
        best[h] = best[h - 1];
        for (std::size_t e = 0; e < edges_.size(); ++e) {
            const auto& upstream = best[h - 1][edges_[e].from];
            if (!rates[e] || !upstream) continue;
            Rational cand = *upstream * *rates[e];
            auto& slot = best[h][edges_[e].to];
            if (!slot || cand > *slot) slot = cand;
        }
    }
    return best;
}

} // namespace clearhouse
