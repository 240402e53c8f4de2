// =============================================================================
// tests/test_settlement.cpp - merging, conservation, clearing prices
// =============================================================================

#include <map>
#include <vector>

#include "Fixtures.hpp"
#include "TestHarness.hpp"

#include "clearhouse/domain/Errors.hpp"
#include "clearhouse/liquidity/LiquidityGraph.hpp"
#include "clearhouse/liquidity/ReserveOverlay.hpp"
#include "clearhouse/matching/PeerMatcher.hpp"
#include "clearhouse/routing/OrderRouter.hpp"
#include "clearhouse/routing/RouteSearch.hpp"
#include "clearhouse/scoring/PriceBasis.hpp"
#include "clearhouse/settlement/SettlementEncoder.hpp"

using namespace clearhouse;
using namespace clearhouse::testing;

namespace {

// o1/o2 match each other exactly; o3 routes C -> B through one pool and pays
// a one-unit fee.
Auction mixed_auction(std::optional<Rational> price_a = std::nullopt) {
    Order o3 = sell("o3", C, B, units(100), units(90));
    o3.fee_amount = units(1);

    AuctionBuilder b;
    b.id("settle").now_unix(NOW);
    b.add_token(price_a ? priced_token(A, *price_a) : token(A));
    b.add_token(token(B));
    b.add_token(token(C));
    b.add_order(sell("o1", A, B, units(50), units(45)));
    b.add_order(sell("o2", B, A, units(45), units(50)));
    b.add_order(o3);
    b.add_pool(cp_pool("cb", C, B, units(1000), units(1000), 0));
    return b.build();
}

struct Plan {
    MatchResult matched;
    std::vector<RoutedFill> routed;
};

Plan plan_for(const Auction& auction) {
    Plan p;
    p.matched = PeerMatcher().match(auction.orders());
    LiquidityGraph g = LiquidityGraph::build(auction.pools());
    ReserveOverlay overlay(auction.pools());
    RouteSearchParams params;
    RouteSearch search(g, params);
    OrderRouter router(search, 16);
    p.routed = router.route(auction.orders(), p.matched.residuals, overlay);
    return p;
}

template<typename F>
bool infeasible(F&& f) {
    try {
        f();
    } catch (const Infeasible&) {
        return true;
    }
    return false;
}

} // namespace

class SettlementTest : public TestSuite {
public:
    SettlementTest() : TestSuite("CLEARHOUSE - SETTLEMENT ENCODER") {}

protected:
    void run_all_tests() override {
        test_merge_and_conservation();
        test_numeraire_prices();
        test_reference_and_fallback_prices();
        test_price_basis();
        test_empty();
        test_infeasible();
    }

private:
    void test_merge_and_conservation() {
        section("Merge And Conservation");

        Auction auction = mixed_auction();
        Plan p = plan_for(auction);
        check(p.matched.matches.size() == 1 && p.routed.size() == 1, "One match and one route planned");

        Solution s = SettlementEncoder(auction, std::nullopt).encode(p.matched.matches, p.routed);

        check(s.fills.size() == 3, "Three fills");
        check(s.fills.size() == 3 && s.fills[0].order_id == "o1" && s.fills[1].order_id == "o2"
              && s.fills[2].order_id == "o3", "Fills follow auction order");
        check(s.interactions.size() == 1 && s.interactions[0].pool_id == "cb", "One pool interaction");
        check(s.fees.size() == 1 && s.fees[C] == units(1), "Full fee collected in the sell token");
        check(s.fills.size() == 3 && s.fills[2].executed_fee == units(1), "Fee recorded on the fill");

        // Recompute the per-token balance from the outside.
        std::map<TokenAddress, Amount> net;
        for (const auto& f : s.fills) {
            const Order* o = auction.order(f.order_id);
            net[o->sell_token] += f.executed_sell + f.executed_fee;
            net[o->buy_token] -= f.executed_buy;
        }
        for (const auto& i : s.interactions) {
            net[i.token_in] -= i.amount_in;
            net[i.token_out] += i.amount_out;
        }
        check(net[A] == 0 && net[B] == 0, "A and B balance exactly");
        check(net[C] == units(1), "C surplus equals the collected fee");
        check(s.score == 0, "Encoder leaves scoring to the scorer");
    }

    void test_numeraire_prices() {
        section("Numeraire Clearing Prices");

        Auction auction = mixed_auction();
        Plan p = plan_for(auction);
        Solution s = SettlementEncoder(auction, B).encode(p.matched.matches, p.routed);

        check(s.clearing_prices.size() == 3, "Every traded token priced");
        check(s.clearing_prices[B] == 1, "Numeraire priced at one");
        check(s.clearing_prices[A] == frac(9, 10), "A priced through the match");
        Rational c = ratio(p.routed[0].executed_buy, p.routed[0].executed_sell);
        check(s.clearing_prices[C] == c, "C priced through its route");

        // Value in equals value out for every trade at these prices.
        bool consistent = true;
        for (const auto& f : s.fills) {
            const Order* o = auction.order(f.order_id);
            Rational in = Rational(f.executed_sell) * s.clearing_prices[o->sell_token];
            Rational out = Rational(f.executed_buy) * s.clearing_prices[o->buy_token];
            if (in != out) consistent = false;
        }
        check(consistent, "Clearing prices value both sides of every trade equally");
    }

    void test_reference_and_fallback_prices() {
        section("Reference And Fallback Prices");

        Auction priced = mixed_auction(Rational(2));
        Plan p = plan_for(priced);
        Solution s = SettlementEncoder(priced, std::nullopt).encode(p.matched.matches, p.routed);
        check(s.clearing_prices[A] == 2, "Reference price seeds A");
        check(s.clearing_prices[B] == Rational(2) * frac(50, 45), "B derived from A");

        Solution n = SettlementEncoder(priced, D).encode(p.matched.matches, p.routed);
        check(n.clearing_prices[A] == 2, "Untraded numeraire falls back to reference prices");

        Auction bare = mixed_auction();
        Plan q = plan_for(bare);
        Solution f = SettlementEncoder(bare, std::nullopt).encode(q.matched.matches, q.routed);
        check(f.clearing_prices[A] == 1, "Without seeds the first sell token is priced at one");
        check(f.clearing_prices[B] == frac(50, 45), "Others follow from it");
    }

    void test_price_basis() {
        section("Auction Price Basis");

        Auction bare = mixed_auction();
        PriceBasis first = derive_price_basis(bare, std::nullopt);
        check(first.numeraire && *first.numeraire == A, "First order's sell token anchors a bare auction");
        check(first.prices.size() == 3 && first.prices[B] == 1 && first.prices[C] == 1,
              "Pools price what the anchor cannot reach");

        PriceBasis via_c = derive_price_basis(bare, C);
        check(via_c.numeraire && *via_c.numeraire == C && via_c.prices[C] == 1 && via_c.prices[B] == 1,
              "Numeraire reaches B through the balanced pool");

        AuctionBuilder b;
        b.id("rescaled").now_unix(NOW);
        b.add_token(priced_token(A, Rational(4)));
        b.add_token(priced_token(B, Rational(2)));
        b.add_order(sell("o1", A, B, units(1), units(1)));
        Auction rescaled = b.build();
        PriceBasis by_b = derive_price_basis(rescaled, B);
        check(by_b.prices[B] == 1 && by_b.prices[A] == 2, "Reference prices rescale to the numeraire");

        // Two encoders on one basis price the shared token identically even
        // when their trades reach it from different sides.
        Plan p = plan_for(bare);
        Solution whole = SettlementEncoder(bare, first).encode(p.matched.matches, p.routed);
        Solution routed_only = SettlementEncoder(bare, first).encode({}, p.routed);
        check(whole.clearing_prices[A] == 1 && routed_only.clearing_prices[C] == first.prices[C],
              "Every trade set is seeded at its basis price");
    }

    void test_empty() {
        section("Empty Candidate");

        Auction auction = mixed_auction();
        Solution s = SettlementEncoder(auction, std::nullopt).encode({}, {});
        check(s.empty() && s.interactions.empty() && s.clearing_prices.empty() && s.fees.empty(),
              "Nothing planned encodes to an empty solution");
    }

    void test_infeasible() {
        section("Infeasible Candidates");

        Auction auction = mixed_auction();
        SettlementEncoder enc(auction, std::nullopt);
        Plan p = plan_for(auction);

        check(infeasible([&]() {
            auto routed = p.routed;
            routed[0].route.hops[0].legs[0].amount_out += units(1);
            routed[0].executed_buy += units(1);
            enc.encode(p.matched.matches, routed);
        }), "Pool asked for more than it can deliver");

        check(infeasible([&]() {
            auto routed = p.routed;
            routed[0].executed_buy += 1;
            enc.encode(p.matched.matches, routed);
        }), "Trader paid out more than the pools produced");

        check(infeasible([&]() {
            auto matches = p.matched.matches;
            matches[0].amount_second -= units(1);
            enc.encode(matches, p.routed);
        }), "Match below o1's limit");

        check(infeasible([&]() {
            PeerMatch half;
            half.first = 0;
            half.second = 1;
            half.amount_first = units(25);
            half.amount_second = units(45) / 2;
            half.price = frac(9, 10);
            enc.encode({half}, {});
        }), "Fill-or-kill orders half filled");

        check(infeasible([&]() {
            RoutedFill bogus = p.routed[0];
            bogus.order = 7;
            enc.encode({}, {bogus});
        }), "Unknown order index");
    }
};

int main() {
    quiet_logs();
    SettlementTest tester;
    return tester.run();
}
