#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "clearhouse/domain/Numeric.hpp"
#include "clearhouse/domain/Token.hpp"
#include "clearhouse/routing/Route.hpp"
#include "clearhouse/routing/SplitRouter.hpp"

namespace clearhouse {

class LiquidityGraph;
class ReserveOverlay;

namespace infra { class CancelToken; }

struct RouteSearchParams {
    int  max_hops = 3;
    bool allow_splits = true;
    SplitParams split;
};

struct RouteSearchStats {
    uint64_t searches = 0;
    uint64_t expanded = 0;
    uint64_t pruned = 0;
};

// ---------------------------------------------------------------------------
// Best-first path search over the liquidity graph.
//
// Labels carry the amount reached so far. The queue key is an optimistic
// final output: amount * best rate product still reachable within the
// remaining hops (LiquidityGraph::best_rates_to). The first complete path
// whose output beats every remaining key is optimal, and any label whose key
// cannot beat the best complete path is dropped. Paths never revisit a token
// or reuse a pool.
//
// Exact-out search runs the same procedure backwards from the buy token,
// minimizing required input with a pessimistic-rate lower bound.
//
// Quotes are taken against the overlay, so routes committed earlier in the
// same candidate are visible. The search itself never writes to the overlay.
// ---------------------------------------------------------------------------
class RouteSearch {
public:
    RouteSearch(const LiquidityGraph& graph, RouteSearchParams params,
                const infra::CancelToken* cancel = nullptr);

    std::optional<Route> best_exact_in(const ReserveOverlay& overlay,
                                       const TokenAddress& sell, const TokenAddress& buy,
                                       const Amount& amount_in) const;

    std::optional<Route> best_exact_out(const ReserveOverlay& overlay,
                                        const TokenAddress& sell, const TokenAddress& buy,
                                        const Amount& amount_out) const;

    bool connects(const TokenAddress& sell, const TokenAddress& buy) const;

    const RouteSearchParams& params() const { return params_; }
    const RouteSearchStats& stats() const { return stats_; }

private:
    const LiquidityGraph& graph_;
    RouteSearchParams params_;
    const infra::CancelToken* cancel_;
    SplitRouter splitter_;
    mutable RouteSearchStats stats_;
};

} // namespace clearhouse
