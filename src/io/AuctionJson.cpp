#include "clearhouse/io/AuctionJson.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

#include "clearhouse/domain/Errors.hpp"

using json = nlohmann::json;

namespace clearhouse::io {

namespace {

// A solve budget beyond a day is a unit mistake, and would overflow a steady
// clock time point near its maximum.
constexpr uint64_t kMaxDeadlineMs = 24ull * 60 * 60 * 1000;

const json& need(const json& j, const char* key, const char* what) {
    if (!j.is_object() || !j.contains(key)) {
        throw InvalidAuction(std::string(what) + "." + key + " is required");
    }
    return j[key];
}

std::string text(const json& j, const char* key, const char* what) {
    const json& v = need(j, key, what);
    if (!v.is_string()) throw InvalidAuction(std::string(what) + "." + key + " must be a string");
    return v.get<std::string>();
}

Amount amount(const json& j, const char* key, const char* what) {
    std::string s = text(j, key, what);
    try {
        return parse_amount(s);
    } catch (const std::invalid_argument&) {
        throw InvalidAuction(std::string(what) + "." + key + " is not an amount: " + s);
    }
}

Amount amount_or_zero(const json& j, const char* key, const char* what) {
    if (!j.contains(key)) return Amount(0);
    return amount(j, key, what);
}

Rational rational(const json& v, const char* what) {
    if (!v.is_string()) throw InvalidAuction(std::string(what) + " must be a string");
    try {
        return parse_rational(v.get<std::string>());
    } catch (const std::invalid_argument&) {
        throw InvalidAuction(std::string(what) + " is not a number: " + v.get<std::string>());
    }
}

template<typename T>
T uint_or(const json& j, const char* key, T fallback, const char* what) {
    if (!j.contains(key)) return fallback;
    const json& v = j[key];
    if (!v.is_number_unsigned()) {
        throw InvalidAuction(std::string(what) + "." + key + " must be a non-negative integer");
    }
    // Read wide, then narrow; get<uint8_t>() would wrap 262 to 6.
    uint64_t wide = v.get<uint64_t>();
    if (wide > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        throw InvalidAuction(std::string(what) + "." + key + " is out of range: " + std::to_string(wide));
    }
    return static_cast<T>(wide);
}

const json& array(const json& j, const char* key, const char* what) {
    const json& v = need(j, key, what);
    if (!v.is_array()) throw InvalidAuction(std::string(what) + "." + key + " must be an array");
    return v;
}

Token parse_token(const json& j) {
    Token t;
    t.address = text(j, "address", "token");
    t.decimals = uint_or<uint8_t>(j, "decimals", 18, "token");
    if (j.contains("reference_price") && !j["reference_price"].is_null()) {
        t.reference_price = rational(j["reference_price"], "token.reference_price");
    }
    return t;
}

Order parse_order(const json& j) {
    Order o;
    o.id = text(j, "id", "order");
    o.sell_token = text(j, "sell_token", "order");
    o.buy_token = text(j, "buy_token", "order");
    o.sell_amount = amount(j, "sell_amount", "order");
    o.buy_amount = amount(j, "buy_amount", "order");
    o.fee_amount = amount_or_zero(j, "fee_amount", "order");

    std::string kind = j.contains("kind") ? text(j, "kind", "order") : "sell";
    if (kind == "sell") {
        o.kind = OrderKind::Sell;
    } else if (kind == "buy") {
        o.kind = OrderKind::Buy;
    } else {
        throw InvalidOrder(o.id + " has unknown kind " + kind);
    }

    if (j.contains("partially_fillable")) {
        if (!j["partially_fillable"].is_boolean()) {
            throw InvalidOrder(o.id + " partially_fillable must be a boolean");
        }
        o.partially_fillable = j["partially_fillable"].get<bool>();
    }
    o.valid_to = uint_or<uint32_t>(j, "valid_to", 0, "order");
    o.created = uint_or<uint32_t>(j, "created", 0, "order");
    if (j.contains("quote_solver") && !j["quote_solver"].is_null()) {
        o.quote_solver = text(j, "quote_solver", "order");
    }
    return o;
}

LiquidityPool parse_pool(const json& j) {
    std::string kind = text(j, "kind", "pool");
    std::string id = text(j, "id", "pool");

    if (kind == "constant_product") {
        ConstantProductPool p;
        p.id = id;
        p.fee_bps = uint_or<uint32_t>(j, "fee_bps", p.fee_bps, "pool");
        const json& tokens = array(j, "tokens", "pool");
        const json& reserves = array(j, "reserves", "pool");
        if (tokens.size() != 2 || reserves.size() != 2) {
            throw InvalidAuction("constant product pool " + id + " needs exactly two tokens");
        }
        for (std::size_t k = 0; k < 2; ++k) {
            if (!tokens[k].is_string() || !reserves[k].is_string()) {
                throw InvalidAuction("pool " + id + " tokens and reserves must be strings");
            }
            p.tokens[k] = tokens[k].get<std::string>();
            try {
                p.reserves[k] = parse_amount(reserves[k].get<std::string>());
            } catch (const std::invalid_argument&) {
                throw InvalidAuction("pool " + id + " has a malformed reserve");
            }
        }
        return p;
    }

    if (kind == "weighted") {
        WeightedPool p;
        p.id = id;
        p.fee_bps = uint_or<uint32_t>(j, "fee_bps", p.fee_bps, "pool");
        for (const auto& t : array(j, "tokens", "pool")) {
            WeightedToken w;
            w.token = text(t, "address", "pool.token");
            w.reserve = amount(t, "reserve", "pool.token");
            w.weight = rational(need(t, "weight", "pool.token"), "pool.token.weight");
            p.tokens.push_back(std::move(w));
        }
        return p;
    }

    if (kind == "stable") {
        StableSwapPool p;
        p.id = id;
        p.fee_bps = uint_or<uint32_t>(j, "fee_bps", p.fee_bps, "pool");
        p.amplification = amount(j, "amplification", "pool");
        for (const auto& t : array(j, "tokens", "pool")) {
            StableToken s;
            s.token = text(t, "address", "pool.token");
            s.reserve = amount(t, "reserve", "pool.token");
            s.decimals = uint_or<uint8_t>(t, "decimals", 18, "pool.token");
            p.tokens.push_back(std::move(s));
        }
        return p;
    }

    throw InvalidAuction("pool " + id + " has unknown kind " + kind);
}

std::string exact(const Rational& r) {
    return r.str();
}

} // namespace

Auction parse_auction(const std::string& body, infra::MonoTime received) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw InvalidAuction(std::string("malformed JSON: ") + e.what());
    }
    if (!j.is_object()) throw InvalidAuction("top level must be an object");

    AuctionBuilder b;
    b.id(j.contains("id") ? text(j, "id", "auction") : std::string());
    b.now_unix(uint_or<uint32_t>(j, "now", 0, "auction"));
    if (j.contains("deadline_ms")) {
        auto ms = uint_or<uint64_t>(j, "deadline_ms", 0, "auction");
        if (ms > kMaxDeadlineMs) {
            throw InvalidAuction("auction.deadline_ms exceeds one day: " + std::to_string(ms));
        }
        b.deadline(received + std::chrono::milliseconds(ms));
    }

    for (const auto& t : array(j, "tokens", "auction")) b.add_token(parse_token(t));
    if (j.contains("orders")) {
        for (const auto& o : array(j, "orders", "auction")) b.add_order(parse_order(o));
    }
    if (j.contains("liquidity")) {
        for (const auto& p : array(j, "liquidity", "auction")) b.add_pool(parse_pool(p));
    }
    return b.build();
}

Auction load_auction(const std::string& path, infra::MonoTime received) {
    std::ifstream f(path);
    if (!f) throw InvalidAuction("cannot open " + path);
    std::stringstream ss;
    ss << f.rdbuf();
    return parse_auction(ss.str(), received);
}

json solution_to_json(const Auction& auction, const Solution& s) {
    json out;
    out["id"] = auction.id();
    out["strategy"] = s.strategy;
    out["score"] = exact(s.score);

    json prices = json::object();
    for (const auto& [token, p] : s.clearing_prices) prices[token] = exact(p);
    out["prices"] = prices;

    json fees = json::object();
    for (const auto& [token, a] : s.fees) fees[token] = to_string(a);
    out["fees"] = fees;

    json trades = json::array();
    for (const auto& f : s.fills) {
        trades.push_back({
            {"order", f.order_id},
            {"executed_sell", to_string(f.executed_sell)},
            {"executed_buy", to_string(f.executed_buy)},
            {"fee", to_string(f.executed_fee)},
        });
    }
    out["trades"] = trades;

    json interactions = json::array();
    for (const auto& i : s.interactions) {
        interactions.push_back({
            {"pool", i.pool_id},
            {"token_in", i.token_in},
            {"token_out", i.token_out},
            {"amount_in", to_string(i.amount_in)},
            {"amount_out", to_string(i.amount_out)},
        });
    }
    out["interactions"] = interactions;
    return out;
}

std::string serialize_solution(const Auction& auction, const Solution& s) {
    return solution_to_json(auction, s).dump(2);
}

} // namespace clearhouse::io
