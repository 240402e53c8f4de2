#pragma once

#include <map>
#include <vector>

#include "clearhouse/config/SolverConfig.hpp"
#include "clearhouse/domain/Auction.hpp"
#include "clearhouse/domain/Numeric.hpp"
#include "clearhouse/domain/Order.hpp"
#include "clearhouse/domain/Solution.hpp"
#include "clearhouse/infra/Clock.hpp"
#include "clearhouse/liquidity/LiquidityGraph.hpp"
#include "clearhouse/routing/RouteSearch.hpp"

namespace clearhouse {

// Sell: amount is what the trader sells. Buy: amount is what they receive.
struct QuoteRequest {
    TokenAddress sell_token;
    TokenAddress buy_token;
    Amount amount;
    OrderKind kind = OrderKind::Sell;
    infra::MonoTime deadline = infra::MonoTime::max();
};

struct Quote {
    Amount sell_amount;
    Amount buy_amount;
    std::vector<Interaction> interactions;
    // sell_amount * p(sell) == buy_amount * p(buy)
    std::map<TokenAddress, Rational> clearing_prices;
};

// ---------------------------------------------------------------------------
// Prices a single hypothetical order against the auction's liquidity, with
// the same search and split logic the solver uses. Each quote starts from
// untouched reserves.
//
// Throws InvalidOrder for a malformed request, NoRoute when nothing can serve
// the amount, QuoteTimeout when the deadline passes mid-search.
// ---------------------------------------------------------------------------
class Quoter {
public:
    Quoter(const Auction& auction, const SolverConfig& cfg);

    Quote quote(const QuoteRequest& req) const;

private:
    const Auction& auction_;
    LiquidityGraph graph_;
    RouteSearchParams params_;
};

} // namespace clearhouse
