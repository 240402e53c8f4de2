#include "clearhouse/settlement/SettlementEncoder.hpp"

#include <vector>

#include "clearhouse/domain/Errors.hpp"
#include "clearhouse/infra/Log.hpp"
#include "clearhouse/liquidity/ReserveOverlay.hpp"

namespace clearhouse {

Solution SettlementEncoder::encode(const std::vector<PeerMatch>& matches,
                                   const std::vector<RoutedFill>& routed) const {
    const auto& orders = auction_.orders();

    // Decision order: matches first, then routes as committed.
    std::vector<Trade> trades;
    for (const auto& m : matches) {
        trades.push_back({m.first, m.amount_first, m.amount_second});
        trades.push_back({m.second, m.amount_second, m.amount_first});
    }
    for (const auto& r : routed) {
        trades.push_back({r.order, r.executed_sell, r.executed_buy});
    }

    std::vector<Amount> sell(orders.size(), Amount(0));
    std::vector<Amount> buy(orders.size(), Amount(0));
    for (const auto& t : trades) {
        if (t.order >= orders.size()) {
            throw Infeasible("trade references order index " + std::to_string(t.order));
        }
        sell[t.order] += t.sell;
        buy[t.order] += t.buy;
    }

    Solution s;
    for (std::size_t i = 0; i < orders.size(); ++i) {
        if (sell[i] == 0 && buy[i] == 0) continue;
        const Order& o = orders[i];
        Fill f;
        f.order_id = o.id;
        f.executed_sell = sell[i];
        f.executed_buy = buy[i];
        f.executed_fee = fee_for(o, sell[i], buy[i]);
        if (f.executed_fee > 0) s.fees[o.sell_token] += f.executed_fee;
        s.fills.push_back(std::move(f));
    }

    for (const auto& r : routed) {
        for (const auto& hop : r.route.hops) {
            for (const auto& leg : hop.legs) {
                s.interactions.push_back(
                    Interaction{leg.pool_id, hop.token_in, hop.token_out, leg.amount_in, leg.amount_out});
            }
        }
    }

    check_fills(s.fills);
    check_pools(routed);
    check_conservation(s);

    s.clearing_prices = clearing_prices(trades);
    s.score = 0;

    infra::log_debug("SETTLE") << s.fills.size() << " fill(s), " << s.interactions.size()
                               << " interaction(s), " << s.clearing_prices.size() << " price(s)";
    return s;
}

void SettlementEncoder::check_fills(const std::vector<Fill>& fills) const {
    for (const auto& f : fills) {
        const Order* o = auction_.order(f.order_id);
        if (!o) throw Infeasible("fill for unknown order " + f.order_id);

        if (f.executed_sell <= 0 || f.executed_buy <= 0) {
            throw Infeasible(o->id + " has a one-sided fill");
        }
        if (o->kind == OrderKind::Sell && f.executed_sell > o->sell_amount) {
            throw Infeasible(o->id + " sells more than its sell amount");
        }
        if (o->kind == OrderKind::Buy && f.executed_buy > o->buy_amount) {
            throw Infeasible(o->id + " buys more than its buy amount");
        }
        if (!o->partially_fillable && f.executed_sell < o->sell_amount && o->kind == OrderKind::Sell) {
            throw Infeasible(o->id + " is fill-or-kill but partially filled");
        }
        if (!o->partially_fillable && f.executed_buy < o->buy_amount && o->kind == OrderKind::Buy) {
            throw Infeasible(o->id + " is fill-or-kill but partially filled");
        }
        if (!respects_limit(*o, f.executed_sell, f.executed_buy)) {
            throw Infeasible(o->id + " violates its limit price");
        }
    }
}

void SettlementEncoder::check_pools(const std::vector<RoutedFill>& routed) const {
    // Replay against untouched reserves; each leg must be deliverable by the
    // pool state left behind by every earlier leg.
    ReserveOverlay replay(auction_.pools());
    for (const auto& r : routed) {
        for (const auto& hop : r.route.hops) {
            for (const auto& leg : hop.legs) {
                if (leg.amount_in <= 0 || leg.amount_out <= 0) {
                    throw Infeasible("empty interaction on pool " + leg.pool_id);
                }
                auto got = quote(replay.view(leg.pool), hop.token_in, hop.token_out, leg.amount_in);
                if (!got || *got < leg.amount_out) {
                    throw Infeasible("pool " + leg.pool_id + " cannot deliver "
                                     + to_string(leg.amount_out));
                }
                replay.consume(leg.pool, hop.token_in, leg.amount_in, hop.token_out, leg.amount_out);
            }
        }
    }
}

void SettlementEncoder::check_conservation(const Solution& s) const {
    // Settlement inflow minus outflow per token must equal the fees it keeps.
    std::map<TokenAddress, Amount> net;
    for (const auto& f : s.fills) {
        const Order* o = auction_.order(f.order_id);
        net[o->sell_token] += f.executed_sell + f.executed_fee;
        net[o->buy_token] -= f.executed_buy;
    }
    for (const auto& i : s.interactions) {
        net[i.token_in] -= i.amount_in;
        net[i.token_out] += i.amount_out;
    }

    for (const auto& [token, amount] : net) {
        auto fee = s.fees.find(token);
        Amount kept = fee == s.fees.end() ? Amount(0) : fee->second;
        if (amount != kept) {
            throw Infeasible("token " + token + " off balance by " + to_string(amount - kept));
        }
    }
}

std::map<TokenAddress, Rational> SettlementEncoder::clearing_prices(
    const std::vector<Trade>& trades) const {
    const auto& orders = auction_.orders();
    std::map<TokenAddress, Rational> prices;
    if (trades.empty()) return prices;

    // Label connected sets of traded tokens.
    std::map<TokenAddress, std::size_t> group;
    std::vector<TokenAddress> sequence;  // decision order, sell before buy
    for (const auto& t : trades) {
        sequence.push_back(orders[t.order].sell_token);
        sequence.push_back(orders[t.order].buy_token);
    }
    std::size_t groups = 0;
    for (const auto& start : sequence) {
        if (group.count(start)) continue;
        std::vector<TokenAddress> stack{start};
        group[start] = groups;
        while (!stack.empty()) {
            TokenAddress tok = stack.back();
            stack.pop_back();
            for (const auto& t : trades) {
                const Order& o = orders[t.order];
                const TokenAddress* other = nullptr;
                if (o.sell_token == tok) other = &o.buy_token;
                else if (o.buy_token == tok) other = &o.sell_token;
                if (other && !group.count(*other)) {
                    group[*other] = groups;
                    stack.push_back(*other);
                }
            }
        }
        ++groups;
    }

    std::vector<bool> seeded(groups, false);
    if (basis_.numeraire && group.count(*basis_.numeraire)) {
        if (const Rational* p = basis_.price(*basis_.numeraire)) {
            prices[*basis_.numeraire] = *p;
            seeded[group[*basis_.numeraire]] = true;
        }
    }
    for (const auto& tok : sequence) {
        std::size_t g = group[tok];
        if (seeded[g]) continue;
        if (const Rational* p = basis_.price(tok)) {
            prices[tok] = *p;
            seeded[g] = true;
        }
    }
    for (std::size_t k = 0; k < sequence.size(); k += 2) {
        std::size_t g = group[sequence[k]];
        if (seeded[g]) continue;
        prices[sequence[k]] = 1;
        seeded[g] = true;
    }

    bool progressed = true;
    while (progressed) {
        progressed = false;
        for (const auto& t : trades) {
            const Order& o = orders[t.order];
            auto ps = prices.find(o.sell_token);
            auto pb = prices.find(o.buy_token);
            if (ps != prices.end() && pb == prices.end()) {
                prices[o.buy_token] = ps->second * ratio(t.sell, t.buy);
                progressed = true;
            } else if (pb != prices.end() && ps == prices.end()) {
                prices[o.sell_token] = pb->second * ratio(t.buy, t.sell);
                progressed = true;
            }
        }
    }
    return prices;
}

} // namespace clearhouse
