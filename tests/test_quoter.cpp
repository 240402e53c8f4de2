// =============================================================================
// tests/test_quoter.cpp - single-order price quotes
// =============================================================================

#include <algorithm>
#include <cctype>
#include <chrono>
#include <string>

#include "Fixtures.hpp"
#include "TestHarness.hpp"

#include "clearhouse/domain/Errors.hpp"
#include "clearhouse/quote/Quoter.hpp"

using namespace clearhouse;
using namespace clearhouse::testing;
using namespace std::chrono_literals;

namespace {

QuoteRequest request(const TokenAddress& sell_token, const TokenAddress& buy_token,
                     Amount amount, OrderKind kind = OrderKind::Sell) {
    QuoteRequest r;
    r.sell_token = sell_token;
    r.buy_token = buy_token;
    r.amount = std::move(amount);
    r.kind = kind;
    return r;
}

std::string upper(std::string s) {
    std::transform(s.begin() + 2, s.end(), s.begin() + 2,
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

template<typename E>
bool throws(const Quoter& q, const QuoteRequest& r) {
    try {
        q.quote(r);
    } catch (const E&) {
        return true;
    } catch (const std::exception&) {
        return false;
    }
    return false;
}

} // namespace

class QuoterTest : public TestSuite {
public:
    QuoterTest() : TestSuite("CLEARHOUSE - QUOTER") {}

protected:
    void run_all_tests() override {
        test_exact_in();
        test_exact_out();
        test_multi_hop();
        test_splits();
        test_rejections();
        test_timeout();
    }

private:
    Auction single_pool() {
        return builder()
            .add_pool(cp_pool("ab", A, B, units(1000), units(1000), 0))
            .build();
    }

    void test_exact_in() {
        section("Exact-In Quote");

        Auction auction = single_pool();
        Quoter quoter(auction, SolverConfig::defaults());
        Quote q = quoter.quote(request(A, B, units(100)));

        check(q.sell_amount == units(100), "Sells the requested amount");
        check(q.buy_amount == parse_amount("90909090909090909090"), "Constant product output",
              clearhouse::to_string(q.buy_amount));
        check(q.interactions.size() == 1 && q.interactions[0].pool_id == "ab"
                  && q.interactions[0].amount_in == units(100),
              "One interaction against the pool");
        check(Rational(q.sell_amount) * q.clearing_prices[A] == Rational(q.buy_amount) * q.clearing_prices[B],
              "Clearing prices balance the trade");

        Quote again = quoter.quote(request(upper(A), upper(B), units(100)));
        check(again.buy_amount == q.buy_amount, "Quotes never move reserves, case is normalized");
    }

    void test_exact_out() {
        section("Exact-Out Quote");

        Auction auction = single_pool();
        Quoter quoter(auction, SolverConfig::defaults());
        Quote q = quoter.quote(request(A, B, units(90), OrderKind::Buy));

        check(q.buy_amount >= units(90), "Receives at least the requested amount");
        check(q.sell_amount > units(98) && q.sell_amount < units(99), "Input near 98.9 A",
              clearhouse::to_string(q.sell_amount));

        Quote forward = quoter.quote(request(A, B, q.sell_amount));
        check(forward.buy_amount >= units(90), "Feeding the quoted input back yields the output");

        check(throws<NoRoute>(quoter, request(A, B, units(1000), OrderKind::Buy)),
              "Draining the whole reserve has no route");
    }

    void test_multi_hop() {
        section("Multi-Hop Quote");

        Auction auction = builder()
            .add_pool(cp_pool("ab", A, B, units(1000), units(1000)))
            .add_pool(cp_pool("bc", B, C, units(1000), units(1000)))
            .build();
        Quoter quoter(auction, SolverConfig::defaults());
        Quote q = quoter.quote(request(A, C, units(10)));

        check(q.interactions.size() == 2, "Routes through the intermediate token");
        check(q.interactions[0].token_out == B && q.interactions[1].token_in == B,
              "Hops chain through B");
        check(q.interactions[0].amount_out == q.interactions[1].amount_in, "Hop amounts chain exactly");

        SolverConfig one_hop = SolverConfig::defaults();
        one_hop.max_hops = 1;
        Quoter direct(auction, one_hop);
        check(throws<NoRoute>(direct, request(A, C, units(10))), "Hop limit excludes the path");
        check(throws<NoRoute>(quoter, request(A, D, units(10))), "Unconnected token has no route");
    }

    void test_splits() {
        section("Split Quote");

        Auction auction = builder()
            .add_pool(cp_pool("ab1", A, B, units(1000), units(1000), 0))
            .add_pool(cp_pool("ab2", A, B, units(1000), units(1000), 0))
            .build();

        Quote split = Quoter(auction, SolverConfig::defaults()).quote(request(A, B, units(200)));

        SolverConfig cfg = SolverConfig::defaults();
        cfg.allow_splits = false;
        Quote whole = Quoter(auction, cfg).quote(request(A, B, units(200)));

        check(split.interactions.size() == 2, "Both pools used");
        check(whole.interactions.size() == 1, "Splitting disabled uses one pool");
        check(split.buy_amount > whole.buy_amount, "Split beats the single pool",
              clearhouse::to_string(split.buy_amount) + " vs " + clearhouse::to_string(whole.buy_amount));
    }

    void test_rejections() {
        section("Malformed Requests");

        Auction auction = single_pool();
        Quoter quoter(auction, SolverConfig::defaults());

        check(throws<InvalidOrder>(quoter, request(A, A, units(1))), "Same token");
        check(throws<InvalidOrder>(quoter, request("0x12", B, units(1))), "Malformed address");
        check(throws<InvalidOrder>(quoter, request(A, B, Amount(0))), "Zero amount");
        check(throws<InvalidOrder>(quoter, request(A, B, negative(units(1)))), "Negative amount");
    }

    void test_timeout() {
        section("Quote Deadline");

        Auction auction = single_pool();
        Quoter quoter(auction, SolverConfig::defaults());

        QuoteRequest late = request(A, B, units(1));
        late.deadline = infra::now() - 1ms;
        check(throws<QuoteTimeout>(quoter, late), "Expired deadline throws QuoteTimeout");

        QuoteRequest ok = request(A, B, units(1));
        ok.deadline = infra::now() + 5000ms;
        bool served = false;
        try {
            served = quoter.quote(ok).buy_amount > 0;
        } catch (const std::exception& e) {
            test_fail("Generous deadline", e.what());
            return;
        }
        check(served, "Generous deadline is served");
    }
};

int main() {
    quiet_logs();
    QuoterTest tester;
    return tester.run();
}
