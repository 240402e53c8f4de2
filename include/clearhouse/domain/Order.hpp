#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "clearhouse/domain/Numeric.hpp"
#include "clearhouse/domain/Token.hpp"

namespace clearhouse {

using OrderId = std::string;

enum class OrderKind : uint8_t { Sell, Buy };

inline const char* kind_str(OrderKind k) {
    return k == OrderKind::Sell ? "sell" : "buy";
}

// ---------------------------------------------------------------------------
// A signed trade intent from the auction snapshot. Never mutated: matching
// and routing produce Fills that reference it by id.
//
//   Sell: sell exactly up to sell_amount, receive at least the limit rate.
//   Buy:  receive exactly up to buy_amount, pay at most the limit rate.
//
// The limit rate is buy_amount / sell_amount for both kinds.
// ---------------------------------------------------------------------------
struct Order {
    OrderId      id;
    TokenAddress sell_token;
    TokenAddress buy_token;
    Amount       sell_amount;
    Amount       buy_amount;
    OrderKind    kind = OrderKind::Sell;
    bool         partially_fillable = false;
    Amount       fee_amount;                 // sell token, charged pro rata
    uint32_t     valid_to = 0;               // unix seconds
    uint32_t     created = 0;                // unix seconds
    std::optional<std::string> quote_solver; // who provided the winning quote
};

// buy per sell
Rational limit_price(const Order& o);

// executed_buy * sell_amount >= executed_sell * buy_amount
bool respects_limit(const Order& o, const Amount& executed_sell, const Amount& executed_buy);

// Pro-rata fee for an execution, rounded down.
Amount fee_for(const Order& o, const Amount& executed_sell, const Amount& executed_buy);

// The amount that caps the order: sell_amount for Sell, buy_amount for Buy.
const Amount& capped_amount(const Order& o);

} // namespace clearhouse
