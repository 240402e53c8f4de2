#pragma once

#include <cstddef>
#include <vector>

#include "clearhouse/domain/Numeric.hpp"
#include "clearhouse/domain/Pool.hpp"
#include "clearhouse/domain/Token.hpp"

namespace clearhouse {

// One pool's share of a hop.
struct RouteLeg {
    std::size_t pool = 0;
    PoolId      pool_id;
    Amount      amount_in;
    Amount      amount_out;
};

// token_in -> token_out through one or more parallel pools.
struct RouteHop {
    TokenAddress token_in;
    TokenAddress token_out;
    std::vector<RouteLeg> legs;

    Amount amount_in() const {
        Amount a = 0;
        for (const auto& l : legs) a += l.amount_in;
        return a;
    }
    Amount amount_out() const {
        Amount a = 0;
        for (const auto& l : legs) a += l.amount_out;
        return a;
    }
};

struct Route {
    std::vector<RouteHop> hops;

    bool empty() const { return hops.empty(); }
    Amount amount_in() const { return hops.empty() ? Amount(0) : hops.front().amount_in(); }
    Amount amount_out() const { return hops.empty() ? Amount(0) : hops.back().amount_out(); }

    bool split() const {
        for (const auto& h : hops) {
            if (h.legs.size() > 1) return true;
        }
        return false;
    }

    std::size_t interaction_count() const {
        std::size_t n = 0;
        for (const auto& h : hops) n += h.legs.size();
        return n;
    }
};

} // namespace clearhouse
