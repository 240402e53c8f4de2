#pragma once

#include <cstddef>
#include <map>
#include <unordered_map>
#include <vector>

#include "clearhouse/domain/Numeric.hpp"
#include "clearhouse/domain/Pool.hpp"

namespace clearhouse {

// ---------------------------------------------------------------------------
// Copy-on-write view of pool reserves for one candidate.
//
// The base pools belong to the Auction and are never touched. Consumption is
// recorded as signed reserve deltas keyed by pool id; a materialized pool
// value is cached per touched pool so quoting stays a single lookup.
//
// Each candidate owns its overlay by value. Copying one forks the simulation.
// ---------------------------------------------------------------------------
class ReserveOverlay {
public:
    explicit ReserveOverlay(const std::vector<LiquidityPool>& base);

    std::size_t size() const { return base_->size(); }

    // Current state of pool `index`: the base pool if untouched.
    const LiquidityPool& view(std::size_t index) const;

    // Record a swap: token_in flows into the pool, token_out flows out.
    void consume(std::size_t index,
                 const TokenAddress& token_in, const Amount& amount_in,
                 const TokenAddress& token_out, const Amount& amount_out);

    bool touched(std::size_t index) const;
    std::size_t touched_count() const { return deltas_.size(); }

    // Signed delta for a pool/token pair; zero when untouched.
    Amount delta(const PoolId& pool, const TokenAddress& token) const;

private:
    const std::vector<LiquidityPool>* base_;
    std::unordered_map<PoolId, std::map<TokenAddress, Amount>> deltas_;
    std::unordered_map<std::size_t, LiquidityPool> materialized_;
};

} // namespace clearhouse
