#include "clearhouse/governor/CandidateStrategy.hpp"

#include "clearhouse/infra/CancelToken.hpp"
#include "clearhouse/infra/Log.hpp"
#include "clearhouse/liquidity/LiquidityGraph.hpp"
#include "clearhouse/liquidity/ReserveOverlay.hpp"
#include "clearhouse/matching/PeerMatcher.hpp"
#include "clearhouse/routing/OrderRouter.hpp"
#include "clearhouse/scoring/Scorer.hpp"
#include "clearhouse/settlement/SettlementEncoder.hpp"

namespace clearhouse {

CandidateStrategy::CandidateStrategy(StrategyConfig strategy, const SolverConfig& cfg)
    : strategy_(std::move(strategy)),
      partial_fill_steps_(cfg.partial_fill_steps),
      interaction_cost_(cfg.interaction_cost),
      numeraire_(cfg.numeraire) {
    search_.max_hops = strategy_.max_hops;
    search_.allow_splits = strategy_.allow_splits && cfg.allow_splits;
    search_.split.granularity = cfg.split_granularity;
    search_.split.max_pools = cfg.max_split_pools;
}

Solution CandidateStrategy::run(const Auction& auction, const infra::CancelToken& cancel,
                                CandidateStats* stats) const {
    return run(auction, derive_price_basis(auction, numeraire_), cancel, stats);
}

Solution CandidateStrategy::run(const Auction& auction, const PriceBasis& basis,
                                const infra::CancelToken& cancel, CandidateStats* stats) const {
    const auto& orders = auction.orders();

    LiquidityGraph graph = LiquidityGraph::build(auction.pools());
    ReserveOverlay overlay(auction.pools());

    PeerMatcher matcher(&cancel);
    MatchResult matched = matcher.match(orders);

    RouteSearch search(graph, search_, &cancel);
    OrderRouter router(search, partial_fill_steps_);
    std::vector<RoutedFill> routed = router.route(orders, matched.residuals, overlay);

    cancel.check(strategy_.name.c_str());

    SettlementEncoder encoder(auction, basis);
    Solution s = encoder.encode(matched.matches, routed);
    Scorer(interaction_cost_).apply(auction, s);
    s.strategy = strategy_.name;

    if (stats) {
        stats->matches = matched.matches.size();
        stats->routed = routed.size();
        stats->search = search.stats();
    }

    infra::log_debug("CANDIDATE") << strategy_.name << ": " << matched.matches.size()
                                  << " match(es), " << routed.size() << " route(s), "
                                  << search.stats().expanded << " labels expanded, score "
                                  << to_fixed(s.score, 6);
    return s;
}

} // namespace clearhouse
