#include "clearhouse/governor/SolveGovernor.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <thread>

#include "clearhouse/domain/Errors.hpp"
#include "clearhouse/governor/SolutionChannel.hpp"
#include "clearhouse/infra/CancelToken.hpp"
#include "clearhouse/infra/Log.hpp"
#include "clearhouse/prioritize/OrderSorting.hpp"
#include "clearhouse/scoring/PriceBasis.hpp"
#include "clearhouse/scoring/Scorer.hpp"

namespace clearhouse {

const char* state_str(SolveState s) noexcept {
    switch (s) {
        case SolveState::Idle:      return "idle";
        case SolveState::Running:   return "running";
        case SolveState::Completed: return "completed";
        case SolveState::TimedOut:  return "timed_out";
    }
    return "idle";
}

SolveGovernor::SolveGovernor(SolverConfig cfg)
    : SolveGovernor(std::move(cfg), steady_) {}

SolveGovernor::SolveGovernor(SolverConfig cfg, const infra::Clock& clock)
    : cfg_(std::move(cfg)), clock_(clock) {
    if (cfg_.strategies.empty()) cfg_.strategies = SolverConfig::default_strategies(cfg_.max_hops);
    // Reject bad comparator kinds now rather than inside solve().
    if (cfg_.prioritization) make_comparators(*cfg_.prioritization);

    for (const auto& s : cfg_.strategies) candidates_.emplace_back(s, cfg_);
}

Auction SolveGovernor::prepare(const Auction& auction) const {
    if (!cfg_.prioritization) return auction;
    std::vector<Order> orders = prioritize(auction, *cfg_.prioritization);
    infra::log_debug("GOVERNOR") << "prioritized " << auction.orders().size() << " -> "
                                 << orders.size() << " orders";
    return auction.with_orders(std::move(orders));
}

Solution SolveGovernor::solve(const Auction& auction, infra::MonoTime deadline) {
    report_ = SolveReport{};
    report_.winner = "baseline";
    state_.store(SolveState::Running, std::memory_order_release);

    infra::MonoTime effective = std::min(deadline, auction.deadline())
                              - std::chrono::milliseconds(cfg_.deadline_buffer_ms);

    if (effective <= clock_.now()) {
        infra::log_info("GOVERNOR") << auction.id() << " deadline already passed, baseline";
        report_.outcome = SolveState::TimedOut;
        state_.store(SolveState::TimedOut, std::memory_order_release);
        return Solution::baseline();
    }

    std::shared_ptr<const Auction> shared;
    try {
        shared = std::make_shared<const Auction>(prepare(auction));
    } catch (const std::exception& e) {
        infra::log_error("GOVERNOR") << "prioritization failed, using input order: " << e.what();
        shared = std::make_shared<const Auction>(auction);
    }
    std::shared_ptr<const PriceBasis> basis;
    try {
        basis = std::make_shared<const PriceBasis>(derive_price_basis(*shared, cfg_.numeraire));
    } catch (const std::exception& e) {
        infra::log_error("GOVERNOR") << "price basis failed, candidates seed their own: " << e.what();
        basis = std::make_shared<const PriceBasis>();
    }

    auto cancel = std::make_shared<infra::CancelToken>();
    auto channel = std::make_shared<SolutionChannel>();

    std::vector<std::thread> workers;
    workers.reserve(candidates_.size());
    for (std::size_t i = 0; i < candidates_.size(); ++i) {
        const CandidateStrategy& cand = candidates_[i];
        workers.emplace_back([i, &cand, shared, basis, cancel, channel]() {
            CandidateResult r;
            r.index = i;
            r.name = cand.name();
            try {
                r.solution = cand.run(*shared, *basis, *cancel);
            } catch (const Cancelled& e) {
                r.error = e.what();
            } catch (const std::exception& e) {
                r.error = e.what();
                infra::log_error("CANDIDATE") << cand.name() << " failed: " << e.what();
            }
            channel->push(std::move(r));
        });
    }
    report_.started = workers.size();

    infra::log_info("GOVERNOR") << shared->id() << ": " << shared->orders().size() << " orders, "
                                << shared->pools().size() << " pools, " << workers.size()
                                << " candidates, " << infra::ms_until(effective, clock_.now())
                                << "ms budget";

    std::vector<std::optional<Solution>> results(candidates_.size());
    std::size_t pending = workers.size();
    bool timed_out = false;

    auto take = [&](CandidateResult r) {
        --pending;
        if (r.solution) {
            ++report_.completed;
            results[r.index] = std::move(r.solution);
        } else {
            ++report_.failed;
        }
    };

    while (pending > 0) {
        infra::MonoDur left = effective - clock_.now();
        if (left <= infra::MonoDur::zero()) {
            timed_out = true;
            break;
        }
        // Wake at least hourly so an unbounded deadline never overflows the wait.
        left = std::min<infra::MonoDur>(left, std::chrono::hours(1));
        if (auto r = channel->pop_for(left)) take(std::move(*r));
    }

    if (timed_out) {
        // Anything already queued finished before the deadline.
        while (auto r = channel->try_pop()) take(std::move(*r));
        cancel->cancel();
    }
    for (auto& w : workers) w.join();

    std::optional<std::size_t> best;
    for (std::size_t i = 0; i < results.size(); ++i) {
        if (!results[i] || results[i]->empty() || results[i]->score < 0) continue;
        if (!best || better_than(*results[i], *results[*best])) best = i;
    }

    Solution winner = best ? std::move(*results[*best]) : Solution::baseline();
    report_.winner = winner.strategy;
    report_.outcome = timed_out ? SolveState::TimedOut : SolveState::Completed;
    state_.store(report_.outcome, std::memory_order_release);

    infra::log_info("GOVERNOR") << shared->id() << " " << state_str(report_.outcome) << ": "
                                << report_.completed << "/" << report_.started
                                << " candidates done, winner " << winner.strategy
                                << " with " << winner.fills.size() << " fill(s), score "
                                << to_fixed(winner.score, 6);
    return winner;
}

} // namespace clearhouse
