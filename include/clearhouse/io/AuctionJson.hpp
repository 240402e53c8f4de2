#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "clearhouse/domain/Auction.hpp"
#include "clearhouse/domain/Solution.hpp"
#include "clearhouse/infra/Clock.hpp"

namespace clearhouse::io {

// Auction snapshot document:
//
//   { "id": "42", "deadline_ms": 2000, "now": 1700000000,
//     "tokens":    [ { "address", "decimals", "reference_price"? } ],
//     "orders":    [ { "id", "sell_token", "buy_token", "sell_amount", "buy_amount",
//                      "kind", "partially_fillable", "fee_amount", "valid_to",
//                      "created", "quote_solver"? } ],
//     "liquidity": [ { "kind": "constant_product" | "weighted" | "stable", ... } ] }
//
// Amounts are decimal strings of atoms. deadline_ms counts from `received`.
// Throws InvalidAuction (or a subclass) on anything malformed.
Auction parse_auction(const std::string& text, infra::MonoTime received = infra::now());
Auction load_auction(const std::string& path, infra::MonoTime received = infra::now());

// { "id", "strategy", "score", "prices", "fees", "trades", "interactions" }.
// Rationals are written exactly as "n/d" or "n".
nlohmann::json solution_to_json(const Auction& auction, const Solution& s);
std::string serialize_solution(const Auction& auction, const Solution& s);

} // namespace clearhouse::io
