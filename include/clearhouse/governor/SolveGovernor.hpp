#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "clearhouse/config/SolverConfig.hpp"
#include "clearhouse/domain/Auction.hpp"
#include "clearhouse/domain/Solution.hpp"
#include "clearhouse/governor/CandidateStrategy.hpp"
#include "clearhouse/infra/Clock.hpp"

namespace clearhouse {

enum class SolveState : uint8_t { Idle, Running, Completed, TimedOut };

const char* state_str(SolveState s) noexcept;

struct SolveReport {
    SolveState  outcome = SolveState::Idle;
    std::size_t started = 0;
    std::size_t completed = 0;   // produced a Solution before the deadline
    std::size_t failed = 0;      // Infeasible or any other local error
    std::string winner;          // strategy name, "baseline" if none beat it
};

// ---------------------------------------------------------------------------
// Runs every configured strategy on its own thread against one shared,
// immutable Auction and keeps the best result that arrives in time.
//
//   Idle -> Running -> Completed   every candidate reported before the deadline
//                   -> TimedOut    the deadline fired first; the rest are
//                                  cancelled and their work discarded
//
// Candidates talk to the governor only through a SolutionChannel. Selection:
// highest score, earlier strategy on ties, the zero-fill baseline when no
// candidate fills anything at a score of at least zero. solve() never throws.
//
// The effective deadline is the earlier of the argument and the auction's own
// deadline, less deadline_buffer_ms. A deadline already in the past returns
// the baseline without starting anything.
// ---------------------------------------------------------------------------
class SolveGovernor {
public:
    explicit SolveGovernor(SolverConfig cfg);
    SolveGovernor(SolverConfig cfg, const infra::Clock& clock);

    SolveGovernor(const SolveGovernor&) = delete;
    SolveGovernor& operator=(const SolveGovernor&) = delete;

    Solution solve(const Auction& auction, infra::MonoTime deadline);

    SolveState state() const { return state_.load(std::memory_order_acquire); }
    const SolveReport& report() const { return report_; }
    const SolverConfig& config() const { return cfg_; }

private:
    Auction prepare(const Auction& auction) const;

    SolverConfig cfg_;
    infra::SteadyClock steady_;
    const infra::Clock& clock_;
    std::vector<CandidateStrategy> candidates_;
    std::atomic<SolveState> state_{SolveState::Idle};
    SolveReport report_;
};

} // namespace clearhouse
