#include "clearhouse/liquidity/ReserveOverlay.hpp"

#include <stdexcept>

namespace clearhouse {

ReserveOverlay::ReserveOverlay(const std::vector<LiquidityPool>& base)
    : base_(&base) {}

const LiquidityPool& ReserveOverlay::view(std::size_t index) const {
    auto it = materialized_.find(index);
    if (it != materialized_.end()) return it->second;
    return base_->at(index);
}

void ReserveOverlay::consume(std::size_t index,
                             const TokenAddress& token_in, const Amount& amount_in,
                             const TokenAddress& token_out, const Amount& amount_out) {
    const LiquidityPool& base = base_->at(index);
    const PoolId& id = pool_id(base);

    std::map<TokenAddress, Amount> d;
    auto it = deltas_.find(id);
    if (it != deltas_.end()) d = it->second;
    d[token_in] += amount_in;
    d[token_out] -= amount_out;

    // Rebuild from the base so the cached value is always base + deltas. A
    // throw here leaves the overlay as it was.
    LiquidityPool next = with_reserve_deltas(base, d);
    deltas_[id] = std::move(d);
    materialized_.insert_or_assign(index, std::move(next));
}

bool ReserveOverlay::touched(std::size_t index) const {
    return materialized_.count(index) != 0;
}

Amount ReserveOverlay::delta(const PoolId& pool, const TokenAddress& token) const {
    auto pit = deltas_.find(pool);
    if (pit == deltas_.end()) return Amount(0);
    auto tit = pit->second.find(token);
    return tit == pit->second.end() ? Amount(0) : tit->second;
}

} // namespace clearhouse
