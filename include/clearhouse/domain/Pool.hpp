#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "clearhouse/domain/Numeric.hpp"
#include "clearhouse/domain/Token.hpp"

namespace clearhouse {

using PoolId = std::string;

constexpr uint32_t BPS_DENOMINATOR = 10000;

// Uniswap v2 style x*y=k.
struct ConstantProductPool {
    PoolId id;
    std::array<TokenAddress, 2> tokens;
    std::array<Amount, 2> reserves;
    uint32_t fee_bps = 30;
};

struct WeightedToken {
    TokenAddress token;
    Amount reserve;
    Rational weight;
};

// Balancer style weighted product.
struct WeightedPool {
    PoolId id;
    std::vector<WeightedToken> tokens;
    uint32_t fee_bps = 30;
};

struct StableToken {
    TokenAddress token;
    Amount reserve;
    uint8_t decimals = 18;
};

// Curve style StableSwap invariant over balances scaled to 18 decimals.
struct StableSwapPool {
    PoolId id;
    std::vector<StableToken> tokens;
    Amount amplification;
    uint32_t fee_bps = 4;
};

// Closed set of pool kinds. Every pricing site dispatches with std::visit.
using LiquidityPool = std::variant<ConstantProductPool, WeightedPool, StableSwapPool>;

const PoolId& pool_id(const LiquidityPool& pool);
const char* pool_kind(const LiquidityPool& pool);
uint32_t pool_fee_bps(const LiquidityPool& pool);
std::vector<TokenAddress> pool_tokens(const LiquidityPool& pool);
std::optional<Amount> pool_reserve(const LiquidityPool& pool, const TokenAddress& token);

// Output for an exact input, rounded in the pool's favor. nullopt when the pool
// does not trade the pair, the input is zero, or the output would be zero or
// drain the reserve.
std::optional<Amount> quote(const LiquidityPool& pool,
                            const TokenAddress& token_in,
                            const TokenAddress& token_out,
                            const Amount& amount_in);

// Input required for an exact output, rounded in the pool's favor:
// quote(pool, in, out, *quote_inverse(pool, in, out, x)) >= x.
std::optional<Amount> quote_inverse(const LiquidityPool& pool,
                                    const TokenAddress& token_in,
                                    const TokenAddress& token_out,
                                    const Amount& amount_out);

// Spot rate (out per in) net of fees at the current reserves.
std::optional<Rational> marginal_price(const LiquidityPool& pool,
                                       const TokenAddress& token_in,
                                       const TokenAddress& token_out);

// New pool value with reserves shifted by signed per-token deltas. Throws
// std::logic_error if a reserve would go non-positive.
LiquidityPool with_reserve_deltas(const LiquidityPool& pool,
                                  const std::map<TokenAddress, Amount>& deltas);

} // namespace clearhouse
