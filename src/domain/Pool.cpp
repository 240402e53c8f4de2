#include "clearhouse/domain/Pool.hpp"

#include <stdexcept>

namespace clearhouse {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// Newton iterations for the StableSwap invariant. Curve uses 255.
constexpr int STABLE_MAX_ITER = 255;

// Bounded nudging when verifying inverse quotes of non-closed-form pools.
constexpr int INVERSE_FIXUP_STEPS = 32;

Rational fee_factor(uint32_t fee_bps) {
    return ratio(Amount(BPS_DENOMINATOR - fee_bps), Amount(BPS_DENOMINATOR));
}

// ---------------------------------------------------------------------------
// Constant product
// ---------------------------------------------------------------------------

std::optional<std::pair<int, int>> cp_indices(const ConstantProductPool& p,
                                              const TokenAddress& in,
                                              const TokenAddress& out) {
    if (p.tokens[0] == in && p.tokens[1] == out) return std::make_pair(0, 1);
    if (p.tokens[1] == in && p.tokens[0] == out) return std::make_pair(1, 0);
    return std::nullopt;
}

std::optional<Amount> cp_quote(const ConstantProductPool& p, const TokenAddress& in,
                               const TokenAddress& out, const Amount& amount_in) {
    auto idx = cp_indices(p, in, out);
    if (!idx || amount_in <= 0) return std::nullopt;

    const Amount& r_in = p.reserves[idx->first];
    const Amount& r_out = p.reserves[idx->second];
    Amount in_with_fee = amount_in * (BPS_DENOMINATOR - p.fee_bps);
    Amount num = r_out * in_with_fee;
    Amount den = r_in * BPS_DENOMINATOR + in_with_fee;
    Amount amount_out = num / den;

    if (amount_out <= 0 || amount_out >= r_out) return std::nullopt;
    return amount_out;
}

std::optional<Amount> cp_quote_inverse(const ConstantProductPool& p, const TokenAddress& in,
                                       const TokenAddress& out, const Amount& amount_out) {
    auto idx = cp_indices(p, in, out);
    if (!idx || amount_out <= 0) return std::nullopt;

    const Amount& r_in = p.reserves[idx->first];
    const Amount& r_out = p.reserves[idx->second];
    if (amount_out >= r_out) return std::nullopt;

    Amount num = r_in * amount_out * BPS_DENOMINATOR;
    Amount den = (r_out - amount_out) * (BPS_DENOMINATOR - p.fee_bps);
    return Amount(num / den + 1);
}

std::optional<Rational> cp_marginal(const ConstantProductPool& p, const TokenAddress& in,
                                    const TokenAddress& out) {
    auto idx = cp_indices(p, in, out);
    if (!idx) return std::nullopt;
    return Rational(ratio(p.reserves[idx->second], p.reserves[idx->first]) * fee_factor(p.fee_bps));
}

// ---------------------------------------------------------------------------
// Weighted
// ---------------------------------------------------------------------------

template<typename Tokens>
std::optional<std::pair<std::size_t, std::size_t>> find_pair(const Tokens& tokens,
                                                             const TokenAddress& in,
                                                             const TokenAddress& out) {
    std::optional<std::size_t> i, j;
    for (std::size_t k = 0; k < tokens.size(); ++k) {
        if (tokens[k].token == in) i = k;
        if (tokens[k].token == out) j = k;
    }
    if (!i || !j || *i == *j) return std::nullopt;
    return std::make_pair(*i, *j);
}

std::optional<Amount> w_quote(const WeightedPool& p, const TokenAddress& in,
                              const TokenAddress& out, const Amount& amount_in) {
    auto idx = find_pair(p.tokens, in, out);
    if (!idx || amount_in <= 0) return std::nullopt;

    const WeightedToken& ti = p.tokens[idx->first];
    const WeightedToken& to = p.tokens[idx->second];

    Decimal r_in = to_decimal(ti.reserve);
    Decimal r_out = to_decimal(to.reserve);
    Rational a_eff = Rational(amount_in) * fee_factor(p.fee_bps);
    Rational w_ratio = ti.weight / to.weight;
    Decimal a = to_decimal(a_eff);
    Decimal base = r_in / (r_in + a);
    Decimal exponent = to_decimal(w_ratio);
    Decimal value = r_out * (Decimal(1) - mp::pow(base, exponent));

    Amount amount_out = floor_of(value);
    if (amount_out <= 0 || amount_out >= to.reserve) return std::nullopt;
    return amount_out;
}

std::optional<Amount> w_quote_inverse(const WeightedPool& p, const TokenAddress& in,
                                      const TokenAddress& out, const Amount& amount_out) {
    auto idx = find_pair(p.tokens, in, out);
    if (!idx || amount_out <= 0) return std::nullopt;

    const WeightedToken& ti = p.tokens[idx->first];
    const WeightedToken& to = p.tokens[idx->second];
    if (amount_out >= to.reserve) return std::nullopt;

    Decimal r_in = to_decimal(ti.reserve);
    Decimal r_out = to_decimal(to.reserve);
    Decimal base = r_out / (r_out - to_decimal(amount_out));
    Rational w_ratio = to.weight / ti.weight;
    Decimal exponent = to_decimal(w_ratio);
    Decimal gross = r_in * (mp::pow(base, exponent) - Decimal(1));
    Decimal with_fee = gross / to_decimal(fee_factor(p.fee_bps));

    return Amount(ceil_of(with_fee) + 1);
}

std::optional<Rational> w_marginal(const WeightedPool& p, const TokenAddress& in,
                                   const TokenAddress& out) {
    auto idx = find_pair(p.tokens, in, out);
    if (!idx) return std::nullopt;

    const WeightedToken& ti = p.tokens[idx->first];
    const WeightedToken& to = p.tokens[idx->second];
    Rational out_side = Rational(to.reserve) / to.weight;
    Rational in_side = Rational(ti.reserve) / ti.weight;
    return Rational(out_side / in_side * fee_factor(p.fee_bps));
}

// ---------------------------------------------------------------------------
// StableSwap
//
// Balances are scaled to 18 decimals (xp). D is the invariant; get_y solves
// for one balance given the others. Integer Newton iteration as in Curve v1,
// Ann = A * n.
// ---------------------------------------------------------------------------

Amount stable_rate(const StableToken& t) {
    return pow10(18u - t.decimals);
}

std::vector<Amount> stable_xp(const StableSwapPool& p) {
    std::vector<Amount> xp;
    xp.reserve(p.tokens.size());
    for (const auto& t : p.tokens) xp.push_back(t.reserve * stable_rate(t));
    return xp;
}

Amount abs_diff(const Amount& a, const Amount& b) {
    return a > b ? Amount(a - b) : Amount(b - a);
}

Amount stable_get_d(const std::vector<Amount>& xp, const Amount& amp) {
    Amount n = xp.size();
    Amount s = 0;
    for (const auto& x : xp) s += x;
    if (s == 0) return 0;

    Amount d = s;
    Amount ann = amp * n;
    for (int it = 0; it < STABLE_MAX_ITER; ++it) {
        Amount d_p = d;
        for (const auto& x : xp) d_p = d_p * d / (x * n);
        Amount d_prev = d;
        d = (ann * s + d_p * n) * d / ((ann - 1) * d + (n + 1) * d_p);
        if (abs_diff(d, d_prev) <= 1) break;
    }
    return d;
}

std::optional<Amount> stable_get_y(std::size_t i, std::size_t j, const Amount& x,
                                   const std::vector<Amount>& xp, const Amount& amp) {
    Amount n = xp.size();
    Amount d = stable_get_d(xp, amp);
    Amount ann = amp * n;
    Amount c = d;
    Amount s = 0;

    for (std::size_t k = 0; k < xp.size(); ++k) {
        if (k == j) continue;
        const Amount& xk = (k == i) ? x : xp[k];
        if (xk <= 0) return std::nullopt;
        s += xk;
        c = c * d / (xk * n);
    }
    c = c * d / (ann * n);
    Amount b = s + d / ann;

    Amount y = d;
    for (int it = 0; it < STABLE_MAX_ITER; ++it) {
        Amount y_prev = y;
        Amount den = 2 * y + b - d;
        if (den <= 0) return std::nullopt;
        y = (y * y + c) / den;
        if (abs_diff(y, y_prev) <= 1) break;
    }
    return y;
}

std::optional<Amount> s_quote(const StableSwapPool& p, const TokenAddress& in,
                              const TokenAddress& out, const Amount& amount_in) {
    auto idx = find_pair(p.tokens, in, out);
    if (!idx || amount_in <= 0) return std::nullopt;
    auto [i, j] = *idx;

    std::vector<Amount> xp = stable_xp(p);
    Amount x = xp[i] + amount_in * stable_rate(p.tokens[i]);
    auto y = stable_get_y(i, j, x, xp, p.amplification);
    if (!y || *y >= xp[j]) return std::nullopt;

    Amount dy = xp[j] - *y - 1;
    Amount fee = dy * p.fee_bps / BPS_DENOMINATOR;
    Amount amount_out = (dy - fee) / stable_rate(p.tokens[j]);

    if (amount_out <= 0 || amount_out >= p.tokens[j].reserve) return std::nullopt;
    return amount_out;
}

std::optional<Amount> s_quote_inverse(const StableSwapPool& p, const TokenAddress& in,
                                      const TokenAddress& out, const Amount& amount_out) {
    auto idx = find_pair(p.tokens, in, out);
    if (!idx || amount_out <= 0) return std::nullopt;
    auto [i, j] = *idx;
    if (amount_out >= p.tokens[j].reserve) return std::nullopt;

    std::vector<Amount> xp = stable_xp(p);
    Amount dy = amount_out * stable_rate(p.tokens[j]);
    Rational gross = Rational(dy) / fee_factor(p.fee_bps);
    Amount dy_gross = ceil_of(gross) + 1;
    if (dy_gross >= xp[j]) return std::nullopt;

    auto x = stable_get_y(j, i, xp[j] - dy_gross, xp, p.amplification);
    if (!x || *x <= xp[i]) return std::nullopt;

    Amount rate_i = stable_rate(p.tokens[i]);
    return Amount(ceil_of(ratio(*x - xp[i], rate_i)) + 1);
}

std::optional<Rational> s_marginal(const StableSwapPool& p, const TokenAddress& in,
                                   const TokenAddress& out) {
    auto idx = find_pair(p.tokens, in, out);
    if (!idx) return std::nullopt;
    auto [i, j] = *idx;

    // Implicit derivative of Ann*S + D = Ann*D + D^(n+1) / (n^n * prod(x))
    // at fixed D:  dy/dx = (Ann + D_P/x_i) / (Ann + D_P/x_j).
    // The curve is convex, so no finite trade realizes more than this rate.
    std::vector<Amount> xp = stable_xp(p);
    for (const auto& x : xp) {
        if (x <= 0) return std::nullopt;
    }
    Amount n = xp.size();
    Amount d = stable_get_d(xp, p.amplification);
    Amount ann = p.amplification * n;

    Amount den = 1;
    for (const auto& x : xp) den *= x * n;
    Amount num = d;
    for (std::size_t k = 0; k < xp.size(); ++k) num *= d;
    Rational d_p = ratio(num, den);

    Rational dy_dx = (Rational(ann) + d_p / Rational(xp[i])) / (Rational(ann) + d_p / Rational(xp[j]));
    Rational atoms = dy_dx * ratio(stable_rate(p.tokens[i]), stable_rate(p.tokens[j]));
    return Rational(atoms * fee_factor(p.fee_bps));
}

// quote(inverse) must cover the requested output. Closed forms already do;
// the iterative ones get a bounded upward nudge.
std::optional<Amount> verify_inverse(const LiquidityPool& pool, const TokenAddress& in,
                                     const TokenAddress& out, const Amount& want,
                                     std::optional<Amount> guess) {
    if (!guess) return std::nullopt;
    Amount amount_in = *guess;
    Amount step = amount_in / 1000000 + 1;
    for (int k = 0; k < INVERSE_FIXUP_STEPS; ++k) {
        auto got = quote(pool, in, out, amount_in);
        if (got && *got >= want) return amount_in;
        amount_in += step;
        step *= 2;
    }
    return std::nullopt;
}

template<typename Tokens>
void apply_deltas(Tokens& tokens, const std::map<TokenAddress, Amount>& deltas, const PoolId& id) {
    for (auto& t : tokens) {
        auto it = deltas.find(t.token);
        if (it == deltas.end()) continue;
        t.reserve += it->second;
        if (t.reserve <= 0) {
            throw std::logic_error("[POOL] reserve exhausted in " + id + " for " + t.token);
        }
    }
}

} // namespace

const PoolId& pool_id(const LiquidityPool& pool) {
    return std::visit([](const auto& p) -> const PoolId& { return p.id; }, pool);
}

const char* pool_kind(const LiquidityPool& pool) {
    return std::visit(overloaded{
        [](const ConstantProductPool&) { return "constant_product"; },
        [](const WeightedPool&)        { return "weighted"; },
        [](const StableSwapPool&)      { return "stable"; },
    }, pool);
}

uint32_t pool_fee_bps(const LiquidityPool& pool) {
    return std::visit([](const auto& p) { return p.fee_bps; }, pool);
}

std::vector<TokenAddress> pool_tokens(const LiquidityPool& pool) {
    return std::visit(overloaded{
        [](const ConstantProductPool& p) {
            return std::vector<TokenAddress>{p.tokens[0], p.tokens[1]};
        },
        [](const auto& p) {
            std::vector<TokenAddress> out;
            out.reserve(p.tokens.size());
            for (const auto& t : p.tokens) out.push_back(t.token);
            return out;
        },
    }, pool);
}

std::optional<Amount> pool_reserve(const LiquidityPool& pool, const TokenAddress& token) {
    return std::visit(overloaded{
        [&](const ConstantProductPool& p) -> std::optional<Amount> {
            if (p.tokens[0] == token) return p.reserves[0];
            if (p.tokens[1] == token) return p.reserves[1];
            return std::nullopt;
        },
        [&](const auto& p) -> std::optional<Amount> {
            for (const auto& t : p.tokens) {
                if (t.token == token) return t.reserve;
            }
            return std::nullopt;
        },
    }, pool);
}

std::optional<Amount> quote(const LiquidityPool& pool,
                            const TokenAddress& token_in,
                            const TokenAddress& token_out,
                            const Amount& amount_in) {
    return std::visit(overloaded{
        [&](const ConstantProductPool& p) { return cp_quote(p, token_in, token_out, amount_in); },
        [&](const WeightedPool& p)        { return w_quote(p, token_in, token_out, amount_in); },
        [&](const StableSwapPool& p)      { return s_quote(p, token_in, token_out, amount_in); },
    }, pool);
}

std::optional<Amount> quote_inverse(const LiquidityPool& pool,
                                    const TokenAddress& token_in,
                                    const TokenAddress& token_out,
                                    const Amount& amount_out) {
    return std::visit(overloaded{
        [&](const ConstantProductPool& p) {
            return cp_quote_inverse(p, token_in, token_out, amount_out);
        },
        [&](const WeightedPool& p) {
            return verify_inverse(pool, token_in, token_out, amount_out,
                                  w_quote_inverse(p, token_in, token_out, amount_out));
        },
        [&](const StableSwapPool& p) {
            return verify_inverse(pool, token_in, token_out, amount_out,
                                  s_quote_inverse(p, token_in, token_out, amount_out));
        },
    }, pool);
}

std::optional<Rational> marginal_price(const LiquidityPool& pool,
                                       const TokenAddress& token_in,
                                       const TokenAddress& token_out) {
    return std::visit(overloaded{
        [&](const ConstantProductPool& p) { return cp_marginal(p, token_in, token_out); },
        [&](const WeightedPool& p)        { return w_marginal(p, token_in, token_out); },
        [&](const StableSwapPool& p)      { return s_marginal(p, token_in, token_out); },
    }, pool);
}

LiquidityPool with_reserve_deltas(const LiquidityPool& pool,
                                  const std::map<TokenAddress, Amount>& deltas) {
    return std::visit(overloaded{
        [&](const ConstantProductPool& p) -> LiquidityPool {
            ConstantProductPool next = p;
            for (int k = 0; k < 2; ++k) {
                auto it = deltas.find(next.tokens[k]);
                if (it == deltas.end()) continue;
                next.reserves[k] += it->second;
                if (next.reserves[k] <= 0) {
                    throw std::logic_error("[POOL] reserve exhausted in " + p.id +
                                           " for " + next.tokens[k]);
                }
            }
            return next;
        },
        [&](const WeightedPool& p) -> LiquidityPool {
            WeightedPool next = p;
            apply_deltas(next.tokens, deltas, p.id);
            return next;
        },
        [&](const StableSwapPool& p) -> LiquidityPool {
            StableSwapPool next = p;
            apply_deltas(next.tokens, deltas, p.id);
            return next;
        },
    }, pool);
}

} // namespace clearhouse
