#pragma once

// =============================================================================
// tests/Fixtures.hpp - token addresses, orders and pools for the test suites
// =============================================================================

#include <cstdint>
#include <string>

#include "clearhouse/domain/Auction.hpp"
#include "clearhouse/domain/Numeric.hpp"
#include "clearhouse/domain/Order.hpp"
#include "clearhouse/domain/Pool.hpp"
#include "clearhouse/domain/Token.hpp"
#include "clearhouse/infra/Log.hpp"

namespace clearhouse::testing {

constexpr uint32_t NOW = 1700000000;

// "0xaaaa...a" style addresses, one hex digit repeated.
inline TokenAddress addr(char digit) {
    return "0x" + std::string(40, digit);
}

inline const TokenAddress A = addr('a');
inline const TokenAddress B = addr('b');
inline const TokenAddress C = addr('c');
inline const TokenAddress D = addr('d');

inline Amount units(uint64_t n, unsigned decimals = 18) {
    return Amount(n) * pow10(decimals);
}

inline Amount negative(const Amount& a) {
    return Amount(-a);
}

inline Rational frac(long num, long den) {
    return ratio(Amount(num), Amount(den));
}

inline Token token(const TokenAddress& a, uint8_t decimals = 18) {
    Token t;
    t.address = a;
    t.decimals = decimals;
    return t;
}

inline Token priced_token(const TokenAddress& a, const Rational& price) {
    Token t = token(a);
    t.reference_price = price;
    return t;
}

inline Order sell(const std::string& id, const TokenAddress& sell_token, const TokenAddress& buy_token,
                  Amount sell_amount, Amount buy_amount, bool partial = false) {
    Order o;
    o.id = id;
    o.sell_token = sell_token;
    o.buy_token = buy_token;
    o.sell_amount = std::move(sell_amount);
    o.buy_amount = std::move(buy_amount);
    o.kind = OrderKind::Sell;
    o.partially_fillable = partial;
    o.fee_amount = 0;
    o.valid_to = NOW + 600;
    o.created = NOW - 60;
    return o;
}

inline Order buy(const std::string& id, const TokenAddress& sell_token, const TokenAddress& buy_token,
                 Amount sell_amount, Amount buy_amount, bool partial = false) {
    Order o = sell(id, sell_token, buy_token, std::move(sell_amount), std::move(buy_amount), partial);
    o.kind = OrderKind::Buy;
    return o;
}

inline ConstantProductPool cp_pool(const std::string& id, const TokenAddress& t0, const TokenAddress& t1,
                                   Amount r0, Amount r1, uint32_t fee_bps = 30) {
    ConstantProductPool p;
    p.id = id;
    p.tokens = {t0, t1};
    p.reserves = {std::move(r0), std::move(r1)};
    p.fee_bps = fee_bps;
    return p;
}

// Builder preloaded with the four test tokens at NOW.
inline AuctionBuilder builder(const std::string& id = "test") {
    AuctionBuilder b;
    b.id(id).now_unix(NOW);
    for (const auto& t : {A, B, C, D}) b.add_token(token(t));
    return b;
}

inline void quiet_logs() {
    infra::Log::set_level(infra::LogLevel::QUIET);
}

} // namespace clearhouse::testing
