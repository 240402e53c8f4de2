#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <vector>

#include "clearhouse/domain/Numeric.hpp"
#include "clearhouse/routing/Route.hpp"

namespace clearhouse {

class LiquidityGraph;
class ReserveOverlay;

namespace infra { class CancelToken; }

struct SplitParams {
    std::size_t granularity = 20;   // chunks per hop
    std::size_t max_pools = 4;      // parallel pools considered per hop
};

// ---------------------------------------------------------------------------
// Spreads one hop across parallel pools.
//
// The input is cut into `granularity` equal chunks (the last one takes the
// remainder). Each chunk goes to the pool whose next chunk yields the most
// output at its current allocation. Allocating greedily by incremental output
// drives the marginal rates of the used pools toward each other, which is the
// exchange-rate-equalizing rule. Ties go to the lower pool index.
// ---------------------------------------------------------------------------
class SplitRouter {
public:
    SplitRouter(const LiquidityGraph& graph, SplitParams params, const infra::CancelToken* cancel)
        : graph_(graph), params_(params), cancel_(cancel) {}

    // Best allocation of amount_in over the parallel edges from -> to, skipping
    // pools in `excluded`. nullopt when no pool can take any chunk.
    std::optional<RouteHop> split_hop(const ReserveOverlay& overlay,
                                      std::size_t from, std::size_t to,
                                      const Amount& amount_in,
                                      const std::set<std::size_t>& excluded) const;

    // Re-executes a single-pool route hop by hop with splitting. Returns the
    // split route only when its final output is strictly larger.
    std::optional<Route> improve(const ReserveOverlay& overlay, const Route& route) const;

private:
    const LiquidityGraph& graph_;
    SplitParams params_;
    const infra::CancelToken* cancel_;
};

} // namespace clearhouse
