#include "clearhouse/prioritize/OrderSorting.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

#include "clearhouse/domain/Errors.hpp"

namespace clearhouse {

namespace {

std::optional<Rational> reference(const TokenMap& tokens, const TokenAddress& addr) {
    auto it = tokens.find(addr);
    if (it == tokens.end() || !it->second.reference_price) return std::nullopt;
    return it->second.reference_price;
}

bool outdated(const Order& o, std::optional<uint32_t> max_age, uint32_t now) {
    if (!max_age) return false;
    uint32_t earliest = now > *max_age ? now - *max_age : 0;
    return o.created < earliest;
}

using KeyRow = std::vector<SortingKey>;

} // namespace

SortingKey ExternalPrice::key(const Order& o, const SortingContext& ctx) const {
    auto ps = reference(ctx.tokens, o.sell_token);
    auto pb = reference(ctx.tokens, o.buy_token);
    if (!ps || !pb || *pb == 0) return std::optional<Rational>{};
    Rational likelihood = Rational(o.sell_amount) * *ps / (Rational(o.buy_amount) * *pb);
    return std::optional<Rational>{likelihood};
}

SortingKey ExternalSurplus::key(const Order& o, const SortingContext& ctx) const {
    auto ps = reference(ctx.tokens, o.sell_token);
    auto pb = reference(ctx.tokens, o.buy_token);
    if (!ps || !pb) return std::optional<Rational>{};
    Rational surplus = Rational(o.sell_amount) * *ps - Rational(o.buy_amount) * *pb;
    return std::optional<Rational>{surplus};
}

SortingKey CreationTimestamp::key(const Order& o, const SortingContext& ctx) const {
    if (outdated(o, max_age_, ctx.now)) return std::optional<uint32_t>{};
    return std::optional<uint32_t>{o.created};
}

SortingKey OwnQuotes::key(const Order& o, const SortingContext& ctx) const {
    bool own = o.quote_solver && !ctx.solver.empty() && *o.quote_solver == ctx.solver;
    return SortingKey{std::in_place_type<bool>, own && !outdated(o, max_age_, ctx.now)};
}

void sort_orders(std::vector<Order>& orders, const SortingContext& ctx,
                 const SortingStrategies& comparators) {
    if (comparators.empty()) return;

    std::vector<std::pair<KeyRow, std::size_t>> keyed;
    keyed.reserve(orders.size());
    for (std::size_t i = 0; i < orders.size(); ++i) {
        KeyRow row;
        row.reserve(comparators.size());
        for (const auto& c : comparators) row.push_back(c->key(orders[i], ctx));
        keyed.emplace_back(std::move(row), i);
    }

    std::stable_sort(keyed.begin(), keyed.end(),
                     [](const auto& a, const auto& b) { return b.first < a.first; });

    std::vector<Order> sorted;
    sorted.reserve(orders.size());
    for (const auto& k : keyed) sorted.push_back(std::move(orders[k.second]));
    orders = std::move(sorted);
}

void sort_and_filter_orders(std::vector<Order>& orders, const SortingContext& ctx,
                            const SortingStrategies& comparators, std::size_t max_nr_orders) {
    std::vector<Order> selected;
    std::unordered_set<OrderId> taken;

    for (const auto& cmp : comparators) {
        if (cmp->min_fraction() <= 0.0) continue;
        std::vector<Order> by_cmp = orders;
        sort_orders(by_cmp, ctx, SortingStrategies{cmp});
        auto quota = static_cast<std::size_t>(
            std::ceil(cmp->min_fraction() * static_cast<double>(max_nr_orders)));
        if (by_cmp.size() > quota) by_cmp.resize(quota);
        for (auto& o : by_cmp) {
            if (taken.insert(o.id).second) selected.push_back(std::move(o));
        }
    }

    if (selected.size() < max_nr_orders) {
        std::vector<Order> rest = orders;
        sort_orders(rest, ctx, comparators);
        for (auto& o : rest) {
            if (selected.size() >= max_nr_orders) break;
            if (taken.insert(o.id).second) selected.push_back(std::move(o));
        }
    }

    if (selected.size() > max_nr_orders) selected.resize(max_nr_orders);
    orders = std::move(selected);
}

SortingStrategies make_comparators(const PrioritizationConfig& cfg) {
    SortingStrategies out;
    for (const auto& c : cfg.comparators) {
        if (c.kind == "external_price") {
            out.push_back(std::make_shared<ExternalPrice>(c.min_fraction));
        } else if (c.kind == "external_surplus") {
            out.push_back(std::make_shared<ExternalSurplus>(c.min_fraction));
        } else if (c.kind == "creation_timestamp") {
            out.push_back(std::make_shared<CreationTimestamp>(c.min_fraction, c.max_order_age_s));
        } else if (c.kind == "own_quotes") {
            out.push_back(std::make_shared<OwnQuotes>(c.min_fraction, c.max_order_age_s));
        } else {
            throw ConfigError("unknown comparator kind " + c.kind);
        }
    }
    return out;
}

std::vector<Order> prioritize(const Auction& auction, const PrioritizationConfig& cfg) {
    std::vector<Order> orders = auction.orders();
    SortingContext ctx{auction.tokens(), cfg.solver, auction.now_unix()};
    SortingStrategies comparators = make_comparators(cfg);

    if (cfg.max_orders > 0) {
        sort_and_filter_orders(orders, ctx, comparators, cfg.max_orders);
    } else {
        sort_orders(orders, ctx, comparators);
    }
    return orders;
}

} // namespace clearhouse
