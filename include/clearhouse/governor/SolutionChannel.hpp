#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "clearhouse/domain/Solution.hpp"
#include "clearhouse/infra/Clock.hpp"

namespace clearhouse {

// What a candidate sends back: a Solution, or the reason it has none.
struct CandidateResult {
    std::size_t index = 0;
    std::string name;
    std::optional<Solution> solution;
    std::string error;
};

// ---------------------------------------------------------------------------
// One-way mailbox from candidate threads to the governor. Candidates only
// push; the governor only pops. Nothing else is shared between them.
// ---------------------------------------------------------------------------
class SolutionChannel {
public:
    void push(CandidateResult r) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            queue_.push_back(std::move(r));
        }
        cv_.notify_one();
    }

    std::optional<CandidateResult> pop_for(infra::MonoDur timeout) {
        std::unique_lock<std::mutex> lk(mtx_);
        if (!cv_.wait_for(lk, timeout, [&]() { return !queue_.empty(); })) return std::nullopt;
        CandidateResult r = std::move(queue_.front());
        queue_.pop_front();
        return r;
    }

    std::optional<CandidateResult> try_pop() {
        std::lock_guard<std::mutex> lk(mtx_);
        if (queue_.empty()) return std::nullopt;
        CandidateResult r = std::move(queue_.front());
        queue_.pop_front();
        return r;
    }

private:
    std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<CandidateResult> queue_;
};

} // namespace clearhouse
