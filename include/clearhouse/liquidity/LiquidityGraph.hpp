#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

#include "clearhouse/domain/Numeric.hpp"
#include "clearhouse/domain/Pool.hpp"
#include "clearhouse/domain/Token.hpp"

namespace clearhouse {

class ReserveOverlay;

// One direction through one pool.
struct GraphEdge {
    std::size_t pool = 0;        // index into the auction's pool list
    std::size_t from = 0;        // node index
    std::size_t to = 0;          // node index
    Rational    marginal_price;  // out per in at snapshot reserves, net of fee
};

// ---------------------------------------------------------------------------
// Directed multigraph over tokens. Parallel pools between the same pair stay
// parallel edges; nothing is aggregated. Built in O(pools * k^2) for k tokens
// per pool (k = 2 for constant product) from the immutable snapshot.
// ---------------------------------------------------------------------------
class LiquidityGraph {
public:
    static LiquidityGraph build(const std::vector<LiquidityPool>& pools);

    std::size_t node_count() const { return tokens_.size(); }
    std::size_t edge_count() const { return edges_.size(); }

    std::optional<std::size_t> node(const TokenAddress& token) const;
    const TokenAddress& token(std::size_t node) const { return tokens_[node]; }

    const GraphEdge& edge(std::size_t e) const { return edges_[e]; }
    const std::vector<std::size_t>& out_edges(std::size_t node) const { return out_[node]; }
    const std::vector<std::size_t>& in_edges(std::size_t node) const { return in_[node]; }

    // Edges from -> to, in pool order.
    std::vector<std::size_t> parallel_edges(std::size_t from, std::size_t to) const;

    // Edge weight under an overlay: the snapshot weight unless the pool has
    // been consumed, in which case it is re-quoted. nullopt if the pool can
    // no longer price the direction.
    std::optional<Rational> current_rate(std::size_t e, const ReserveOverlay& overlay) const;

    // best[h][v]: highest product of current rates over any walk of at most h
    // edges from v to target. An upper bound on the realized output per unit
    // of input, since every pool kind here quotes below its marginal price.
    using RateTable = std::vector<std::vector<std::optional<Rational>>>;
    RateTable best_rates_to(std::size_t target, int max_hops, const ReserveOverlay& overlay) const;

    // Same bound for walks from source to v.
    RateTable best_rates_from(std::size_t source, int max_hops, const ReserveOverlay& overlay) const;

private:
    std::size_t intern(const TokenAddress& token);

    std::vector<TokenAddress> tokens_;
    std::map<TokenAddress, std::size_t> index_;
    std::vector<GraphEdge> edges_;
    std::vector<std::vector<std::size_t>> out_;
    std::vector<std::vector<std::size_t>> in_;
};

} // namespace clearhouse
