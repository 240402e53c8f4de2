#pragma once

#include <cstddef>
#include <string>

#include "clearhouse/config/SolverConfig.hpp"
#include "clearhouse/domain/Auction.hpp"
#include "clearhouse/domain/Solution.hpp"
#include "clearhouse/routing/RouteSearch.hpp"
#include "clearhouse/scoring/PriceBasis.hpp"

namespace clearhouse {

namespace infra { class CancelToken; }

struct CandidateStats {
    std::size_t matches = 0;
    std::size_t routed = 0;
    RouteSearchStats search;
};

// ---------------------------------------------------------------------------
// One complete solving pipeline:
//
//   graph -> peer matching -> residual routing (own overlay) -> settlement -> score
//
// Stateless between runs. Everything a run touches is built inside run() from
// the auction, so any number of runs may proceed in parallel on one Auction.
// Throws Cancelled when the token fires and Infeasible when settlement
// rejects the result.
// ---------------------------------------------------------------------------
class CandidateStrategy {
public:
    CandidateStrategy(StrategyConfig strategy, const SolverConfig& cfg);

    const std::string& name() const { return strategy_.name; }
    const StrategyConfig& strategy() const { return strategy_; }

    // Scores against `basis`; the governor hands every candidate the same one.
    Solution run(const Auction& auction, const PriceBasis& basis, const infra::CancelToken& cancel,
                 CandidateStats* stats = nullptr) const;

    // Standalone run with a basis derived from the configured numeraire.
    Solution run(const Auction& auction, const infra::CancelToken& cancel,
                 CandidateStats* stats = nullptr) const;

private:
    StrategyConfig strategy_;
    RouteSearchParams search_;
    std::size_t partial_fill_steps_;
    Rational interaction_cost_;
    std::optional<TokenAddress> numeraire_;
};

} // namespace clearhouse
