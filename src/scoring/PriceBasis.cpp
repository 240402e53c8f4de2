#include "clearhouse/scoring/PriceBasis.hpp"

#include <vector>

#include "clearhouse/domain/Pool.hpp"
#include "clearhouse/infra/Log.hpp"

namespace clearhouse {

namespace {

// Price of `out` given `in`, from the pool's marginal rates in both
// directions. Fees push each one-sided rate the opposite way, so the mean of
// the two sits near the fee-free mid.
std::optional<Rational> mid_price(const LiquidityPool& pool, const TokenAddress& in,
                                  const Rational& p_in, const TokenAddress& out) {
    auto fwd = marginal_price(pool, in, out);   // out atoms per in atom
    auto back = marginal_price(pool, out, in);  // in atoms per out atom
    if (fwd && *fwd <= 0) fwd.reset();
    if (back && *back <= 0) back.reset();

    if (fwd && back) return Rational(p_in * (*back + Rational(1) / *fwd) / 2);
    if (back) return Rational(p_in * *back);
    if (fwd) return Rational(p_in / *fwd);
    return std::nullopt;
}

void spread_through_pools(const Auction& auction, std::map<TokenAddress, Rational>& prices) {
    bool progressed = true;
    while (progressed) {
        progressed = false;
        for (const auto& pool : auction.pools()) {
            std::vector<TokenAddress> tokens = pool_tokens(pool);
            for (const auto& out : tokens) {
                if (prices.count(out)) continue;
                for (const auto& in : tokens) {
                    auto known = prices.find(in);
                    if (in == out || known == prices.end()) continue;
                    if (auto p = mid_price(pool, in, known->second, out)) {
                        prices[out] = *p;
                        progressed = true;
                        break;
                    }
                }
            }
        }
    }
}

} // namespace

PriceBasis derive_price_basis(const Auction& auction, const std::optional<TokenAddress>& numeraire) {
    PriceBasis basis;
    auto& prices = basis.prices;

    const Token* anchor = numeraire ? auction.token(*numeraire) : nullptr;
    if (anchor) {
        basis.numeraire = anchor->address;
        prices[anchor->address] = 1;
        if (anchor->reference_price && *anchor->reference_price > 0) {
            const Rational& unit = *anchor->reference_price;
            for (const auto& [addr, tok] : auction.tokens()) {
                if (tok.reference_price && *tok.reference_price > 0) {
                    prices[addr] = *tok.reference_price / unit;
                }
            }
        }
        spread_through_pools(auction, prices);
    }

    // Reference prices for whatever the numeraire could not reach.
    bool seeded = false;
    for (const auto& [addr, tok] : auction.tokens()) {
        if (prices.count(addr) || !tok.reference_price || *tok.reference_price <= 0) continue;
        prices[addr] = *tok.reference_price;
        seeded = true;
    }
    if (seeded) spread_through_pools(auction, prices);

    for (const auto& o : auction.orders()) {
        if (prices.count(o.sell_token)) continue;
        if (prices.empty()) basis.numeraire = o.sell_token;
        prices[o.sell_token] = 1;
        spread_through_pools(auction, prices);
    }

    infra::log_debug("PRICES") << auction.id() << ": basis "
                               << (basis.numeraire ? *basis.numeraire : std::string("<reference>"))
                               << ", " << prices.size() << "/" << auction.tokens().size()
                               << " tokens priced";
    return basis;
}

} // namespace clearhouse
