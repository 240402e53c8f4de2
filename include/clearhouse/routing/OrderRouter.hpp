#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "clearhouse/domain/Numeric.hpp"
#include "clearhouse/domain/Order.hpp"
#include "clearhouse/matching/PeerMatcher.hpp"
#include "clearhouse/routing/Route.hpp"
#include "clearhouse/routing/RouteSearch.hpp"

namespace clearhouse {

class ReserveOverlay;

// A route committed for one order. executed_* cover the routed part only.
struct RoutedFill {
    std::size_t order = 0;
    Amount executed_sell;
    Amount executed_buy;
    Route route;
};

// ---------------------------------------------------------------------------
// Routes whatever matching left open, one order at a time in auction
// sequence, and commits each accepted route into the overlay before the next
// order is searched. Later orders therefore quote against reserves already
// moved by earlier ones.
//
// Sell orders search exact-in on their open sell amount, Buy orders exact-out
// on their open buy amount. A route is accepted only if it meets the order's
// limit on its own. Partially fillable orders that miss their limit at full
// size are bisected down to the largest size that still meets it.
// ---------------------------------------------------------------------------
class OrderRouter {
public:
    OrderRouter(const RouteSearch& search, std::size_t partial_fill_steps)
        : search_(search), partial_fill_steps_(partial_fill_steps) {}

    std::vector<RoutedFill> route(const std::vector<Order>& orders,
                                  std::vector<OrderResidual>& residuals,
                                  ReserveOverlay& overlay) const;

private:
    std::optional<Route> attempt(const Order& o, const Amount& size,
                                 const ReserveOverlay& overlay) const;
    std::optional<Route> largest_partial(const Order& o, const Amount& open,
                                         const ReserveOverlay& overlay) const;

    const RouteSearch& search_;
    std::size_t partial_fill_steps_;
};

// Applies every leg of a route to the overlay, in hop order.
void commit_route(const Route& route, ReserveOverlay& overlay);

} // namespace clearhouse
