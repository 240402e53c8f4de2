#pragma once

#include <atomic>
#include <optional>

#include "clearhouse/infra/Clock.hpp"

namespace clearhouse::infra {

// ---------------------------------------------------------------------------
// Cooperative cancellation flag shared between the governor and one or more
// search tasks. Searches poll cancelled() between expansions and throw
// Cancelled; nothing is ever interrupted mid-quote.
//
// An optional deadline makes the token self-expiring, which lets callers
// without a governor (the quoter) bound a search by time alone.
// ---------------------------------------------------------------------------
class CancelToken {
public:
    CancelToken() = default;
    explicit CancelToken(MonoTime deadline) : deadline_(deadline) {}

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel() noexcept { flag_.store(true, std::memory_order_release); }

    bool cancelled() const noexcept {
        if (flag_.load(std::memory_order_acquire)) return true;
        return deadline_ && MonoClock::now() >= *deadline_;
    }

    // Throws Cancelled when the token has fired.
    void check(const char* where) const;

private:
    std::atomic<bool> flag_{false};
    std::optional<MonoTime> deadline_;
};

} // namespace clearhouse::infra
