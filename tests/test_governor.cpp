// =============================================================================
// tests/test_governor.cpp - deadline handling, candidate selection, invariants
// =============================================================================

#include <atomic>
#include <chrono>
#include <map>
#include <random>
#include <set>
#include <vector>

#include "Fixtures.hpp"
#include "TestHarness.hpp"

#include "clearhouse/governor/CandidateStrategy.hpp"
#include "clearhouse/governor/SolveGovernor.hpp"
#include "clearhouse/infra/CancelToken.hpp"
#include "clearhouse/liquidity/LiquidityGraph.hpp"
#include "clearhouse/liquidity/ReserveOverlay.hpp"
#include "clearhouse/routing/OrderRouter.hpp"
#include "clearhouse/scoring/Scorer.hpp"
#include "clearhouse/settlement/SettlementEncoder.hpp"

using namespace clearhouse;
using namespace clearhouse::testing;
using namespace std::chrono_literals;

namespace {

// First reading is real time; every later one is an hour ahead.
class JumpingClock final : public infra::Clock {
public:
    infra::MonoTime now() const override {
        infra::MonoTime t = infra::now();
        return calls_.fetch_add(1) == 0 ? t : t + 1h;
    }

private:
    mutable std::atomic<int> calls_{0};
};

infra::MonoTime in(std::chrono::milliseconds d) {
    return infra::now() + d;
}

SolverConfig config_with_numeraire(const TokenAddress& numeraire) {
    SolverConfig cfg = SolverConfig::defaults();
    cfg.numeraire = numeraire;
    return cfg;
}

// Recomputes every settlement invariant independently of the encoder.
bool valid_settlement(const Auction& auction, const Solution& s, std::string& why) {
    std::map<TokenAddress, Amount> net;
    std::set<OrderId> seen;
    for (const auto& f : s.fills) {
        const Order* o = auction.order(f.order_id);
        if (!o) { why = "unknown order " + f.order_id; return false; }
        if (!seen.insert(f.order_id).second) { why = "duplicate fill"; return false; }
        if (!respects_limit(*o, f.executed_sell, f.executed_buy)) { why = o->id + " limit"; return false; }
        if (o->kind == OrderKind::Sell && f.executed_sell > o->sell_amount) { why = o->id + " cap"; return false; }
        if (o->kind == OrderKind::Buy && f.executed_buy > o->buy_amount) { why = o->id + " cap"; return false; }
        if (!o->partially_fillable && f.executed_sell < o->sell_amount && o->kind == OrderKind::Sell) {
            why = o->id + " fill-or-kill";
            return false;
        }
        if (!o->partially_fillable && f.executed_buy < o->buy_amount && o->kind == OrderKind::Buy) {
            why = o->id + " fill-or-kill";
            return false;
        }
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
        if (amount != kept) { why = "imbalance in " + token; return false; }
    }
    if (s.score < 0) { why = "negative score"; return false; }
    return true;
}

} // namespace

class GovernorTest : public TestSuite {
public:
    GovernorTest() : TestSuite("CLEARHOUSE - SOLVE GOVERNOR") {}

protected:
    void run_all_tests() override {
        test_past_deadline();
        test_buffer_and_auction_deadline();
        test_empty_and_unmatchable();
        test_single_pool_scenario();
        test_match_without_routing();
        test_matching_dominance();
        test_shared_price_basis();
        test_timeout_path();
        test_monotonic_deadline();
        test_randomized_invariants();
    }

private:
    void test_past_deadline() {
        section("Past Deadline");

        Auction auction = builder()
            .add_order(sell("o1", A, B, units(100), units(90)))
            .add_pool(cp_pool("ab", A, B, units(1000), units(1000), 0))
            .build();

        SolveGovernor gov(SolverConfig::defaults());
        check(gov.state() == SolveState::Idle, "Governor starts idle");

        auto t0 = infra::now();
        Solution s = gov.solve(auction, t0 - 1ms);
        auto took = infra::now() - t0;

        check(s.empty() && s.score == 0 && s.strategy == "baseline", "Returns the zero-fill baseline");
        check(gov.report().started == 0, "No candidate was started");
        check(gov.state() == SolveState::TimedOut, "Ends in TimedOut");
        check(took < 50ms, "Returns immediately");
    }

    void test_buffer_and_auction_deadline() {
        section("Deadline Buffer And Auction Deadline");

        Auction auction = builder()
            .add_order(sell("o1", A, B, units(100), units(90)))
            .add_pool(cp_pool("ab", A, B, units(1000), units(1000), 0))
            .build();

        SolverConfig cfg = SolverConfig::defaults();
        cfg.deadline_buffer_ms = 10000;
        SolveGovernor buffered(cfg);
        Solution s = buffered.solve(auction, in(5000ms));
        check(s.empty() && buffered.report().started == 0, "Buffer larger than the budget yields baseline");

        Auction expired = builder()
            .deadline(infra::now() - 1ms)
            .add_order(sell("o1", A, B, units(100), units(90)))
            .add_pool(cp_pool("ab", A, B, units(1000), units(1000), 0))
            .build();
        SolveGovernor gov(SolverConfig::defaults());
        Solution e = gov.solve(expired, in(5000ms));
        check(e.empty() && gov.report().started == 0, "Auction's own deadline also bounds the solve");
    }

    void test_empty_and_unmatchable() {
        section("Baseline Idempotence");

        SolveGovernor gov(SolverConfig::defaults());
        Auction empty = builder().add_pool(cp_pool("ab", A, B, units(1000), units(1000))).build();
        Solution s = gov.solve(empty, in(5000ms));
        check(s.empty() && s.score == 0 && s.strategy == "baseline", "No orders: baseline");
        check(gov.state() == SolveState::Completed, "Completed when every candidate reported");
        check(gov.report().completed == gov.report().started && gov.report().started == 3,
              "All three default candidates completed");

        Auction hopeless = builder()
            .add_order(sell("o1", A, B, units(100), units(200)))
            .add_order(sell("o2", B, A, units(100), units(200)))
            .add_pool(cp_pool("ab", A, B, units(1000), units(1000)))
            .build();
        Solution h = gov.solve(hopeless, in(5000ms));
        check(h.empty() && h.score == 0, "Disjoint limits beyond every pool: baseline");
    }

    void test_single_pool_scenario() {
        section("Single Pool Scenario");

        Auction auction = builder()
            .add_order(sell("o1", A, B, units(100), units(90)))
            .add_pool(cp_pool("ab", A, B, units(1000), units(1000), 0))
            .build();

        SolveGovernor gov(config_with_numeraire(B));
        Solution s = gov.solve(auction, in(5000ms));

        check(s.fills.size() == 1 && s.fills[0].executed_buy == parse_amount("90909090909090909090"),
              "Fill realizes 90.909... B", s.fills.empty() ? "no fill" : clearhouse::to_string(s.fills[0].executed_buy));
        check(s.interactions.size() == 1 && s.interactions[0].amount_in == units(100),
              "Single interaction consumes the pool");
        check(s.score == Rational(parse_amount("909090909090909090")), "Score is the surplus over 90 B",
              to_fixed(s.score, 0));
        check(gov.report().winner == "direct", "Earliest strategy wins the tie");
    }

    void test_match_without_routing() {
        section("Match Without Routing");

        Auction auction = builder()
            .add_order(sell("o1", A, B, units(50), units(45), true))
            .add_order(sell("o2", B, A, units(45), units(48)))
            .build();

        SolverConfig cfg = SolverConfig::defaults();
        CandidateStrategy cand(cfg.strategies[2], cfg);
        infra::CancelToken cancel;
        CandidateStats stats;
        Solution s = cand.run(auction, cancel, &stats);

        check(stats.matches == 1 && s.fills.size() == 2, "Peer match fills both orders");
        check(s.interactions.empty(), "No pool interaction");
        check(stats.search.searches == 0, "Route search never invoked");
        check(s.score > 0, "Positive surplus at the midpoint");

        SolveGovernor gov(cfg);
        Solution g = gov.solve(auction, in(5000ms));
        check(g.fills.size() == 2 && g.interactions.empty(), "Governor returns the match");
    }

    void test_matching_dominance() {
        section("Matching Dominance");

        // Mutual opposites clearing at 1.0, and a pool that could serve both.
        Auction auction = builder()
            .add_order(sell("o1", A, B, units(120), units(96)))
            .add_order(sell("o2", B, A, units(120), units(100)))
            .add_pool(cp_pool("ab", A, B, units(10000), units(10000), 300))
            .build();

        SolverConfig cfg = config_with_numeraire(B);
        SolveGovernor gov(cfg);
        Solution matched = gov.solve(auction, in(5000ms));
        check(matched.fills.size() == 2 && matched.interactions.empty(), "Both orders cleared peer to peer");

        // The same orders routed through the pool alone.
        LiquidityGraph g = LiquidityGraph::build(auction.pools());
        ReserveOverlay overlay(auction.pools());
        RouteSearchParams params;
        RouteSearch search(g, params);
        OrderRouter router(search, cfg.partial_fill_steps);
        std::vector<OrderResidual> residuals(2);
        residuals[1].order = 1;
        auto routed = router.route(auction.orders(), residuals, overlay);
        Solution pooled = SettlementEncoder(auction, cfg.numeraire).encode({}, routed);
        Scorer(cfg.interaction_cost).apply(auction, pooled);

        check(routed.size() == 2, "Pool alone could also fill both");
        check(matched.score >= pooled.score, "Match scores at least the pool route",
              to_fixed(matched.score, 0) + " < " + to_fixed(pooled.score, 0));
    }

    void test_shared_price_basis() {
        section("Shared Price Basis");

        // No numeraire and no reference prices. A is worth about 1000 B; o1
        // needs A -> B -> C while o2 trades B -> C in one hop.
        Auction auction = builder()
            .add_order(sell("o1", A, C, units(1), units(900)))
            .add_order(sell("o2", B, C, units(1000), units(900)))
            .add_pool(cp_pool("ab", A, B, units(1000), units(1000000), 30))
            .add_pool(cp_pool("bc", B, C, units(1000000), units(1000000), 30))
            .build();

        SolverConfig cfg = SolverConfig::defaults();
        infra::CancelToken cancel;
        Solution direct = CandidateStrategy(cfg.strategies[0], cfg).run(auction, cancel);
        check(direct.fills.size() == 1, "One-hop candidate fills only the direct order");

        SolveGovernor gov(cfg);
        Solution s = gov.solve(auction, in(5000ms));
        check(s.fills.size() == 2, "Candidate filling both orders wins",
              gov.report().winner + " with " + std::to_string(s.fills.size()) + " fill(s)");
        check(gov.report().winner != "direct", "Direct candidate does not win on unit mismatch");
        check(s.score > direct.score, "Superset of fills scores higher in the shared unit",
              to_fixed(s.score, 0) + " vs " + to_fixed(direct.score, 0));
    }

    void test_timeout_path() {
        section("Timeout Path");

        Auction auction = builder()
            .add_order(sell("o1", A, B, units(100), units(90)))
            .add_pool(cp_pool("ab", A, B, units(1000), units(1000), 0))
            .build();

        JumpingClock clock;
        SolveGovernor gov(SolverConfig::defaults(), clock);
        Solution s = gov.solve(auction, in(60000ms));

        check(gov.state() == SolveState::TimedOut, "Deadline observed before results: TimedOut");
        check(gov.report().started == 3, "Candidates were started");
        std::string why;
        check(valid_settlement(auction, s, why), "Whatever was returned is a valid settlement", why);
    }

    void test_monotonic_deadline() {
        section("Monotonic Deadline");

        Auction auction = builder()
            .add_order(sell("o1", A, B, units(100), units(90)))
            .add_order(sell("o2", A, C, units(10), units(9)))
            .add_pool(cp_pool("ab", A, B, units(1000), units(1000), 30))
            .add_pool(cp_pool("ac", A, C, units(1000), units(1000), 30))
            .build();

        SolveGovernor gov(config_with_numeraire(A));
        Rational previous = -1;
        bool monotone = true;
        for (auto budget : {0ms, 5000ms, 10000ms}) {
            Solution s = gov.solve(auction, in(budget));
            if (s.score < previous) monotone = false;
            previous = s.score;
        }
        check(monotone, "More time never lowers the score");
        check(previous > 0, "Full budget finds a positive solution");
    }

    void test_randomized_invariants() {
        section("Randomized Limit And Conservation Fuzz");

        std::mt19937 rng(7);
        const std::vector<TokenAddress> toks{A, B, C, D};
        auto pick = [&](int lo, int hi) { return std::uniform_int_distribution<int>(lo, hi)(rng); };

        int solved = 0;
        int filled = 0;
        std::string failure;

        for (int round = 0; round < 40 && failure.empty(); ++round) {
            AuctionBuilder b = builder("fuzz-" + std::to_string(round));

            int n_pools = pick(1, 5);
            for (int k = 0; k < n_pools; ++k) {
                int x = pick(0, 3);
                int y = (x + pick(1, 3)) % 4;
                b.add_pool(cp_pool("p" + std::to_string(k), toks[x], toks[y],
                                   units(pick(100, 5000)), units(pick(100, 5000)),
                                   static_cast<uint32_t>(pick(0, 100))));
            }

            int n_orders = pick(1, 6);
            for (int k = 0; k < n_orders; ++k) {
                int x = pick(0, 3);
                int y = (x + pick(1, 3)) % 4;
                Amount s_amt = units(pick(1, 200));
                Amount b_amt = s_amt * pick(20, 150) / 100 + 1;
                bool partial = pick(0, 1) == 1;
                std::string id = "o" + std::to_string(k);
                Order o = pick(0, 1) == 0 ? sell(id, toks[x], toks[y], s_amt, b_amt, partial)
                                          : buy(id, toks[x], toks[y], s_amt, b_amt, partial);
                o.fee_amount = s_amt * pick(0, 2) / 100;
                b.add_order(o);
            }

            Auction auction = b.build();
            SolveGovernor gov(config_with_numeraire(A));
            Solution s = gov.solve(auction, in(5000ms));
            ++solved;
            if (!s.empty()) ++filled;

            std::string why;
            if (!valid_settlement(auction, s, why)) failure = "round " + std::to_string(round) + ": " + why;
        }

        check(failure.empty(), "Every winning settlement respects limits, caps and conservation", failure);
        check(solved == 40, "All rounds answered");
        check(filled > 0, "Some rounds produced trades");
    }
};

int main() {
    quiet_logs();
    GovernorTest tester;
    return tester.run();
}
