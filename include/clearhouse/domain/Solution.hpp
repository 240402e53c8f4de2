#pragma once

#include <map>
#include <string>
#include <vector>

#include "clearhouse/domain/Numeric.hpp"
#include "clearhouse/domain/Order.hpp"
#include "clearhouse/domain/Pool.hpp"
#include "clearhouse/domain/Token.hpp"

namespace clearhouse {

// Realized execution of one order. executed_fee is paid in the sell token on
// top of executed_sell.
struct Fill {
    OrderId order_id;
    Amount  executed_sell;
    Amount  executed_buy;
    Amount  executed_fee;
};

// One atomic exchange against one pool.
struct Interaction {
    PoolId       pool_id;
    TokenAddress token_in;
    TokenAddress token_out;
    Amount       amount_in;
    Amount       amount_out;
};

struct Solution {
    std::vector<Fill> fills;                       // auction order sequence
    std::vector<Interaction> interactions;         // execution order
    std::map<TokenAddress, Rational> clearing_prices;
    std::map<TokenAddress, Amount> fees;           // collected by the settlement
    Rational score;
    std::string strategy;

    bool empty() const { return fills.empty(); }

    // The do-nothing answer. Always valid, scores exactly zero.
    static Solution baseline() {
        Solution s;
        s.score = 0;
        s.strategy = "baseline";
        return s;
    }
};

} // namespace clearhouse
