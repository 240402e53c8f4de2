#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "clearhouse/config/SolverConfig.hpp"
#include "clearhouse/domain/Auction.hpp"
#include "clearhouse/domain/Numeric.hpp"
#include "clearhouse/domain/Order.hpp"
#include "clearhouse/domain/Token.hpp"

namespace clearhouse {

// Larger keys are more important. An empty optional ranks below every value.
using SortingKey = std::variant<std::optional<Rational>, std::optional<uint32_t>, bool>;

struct SortingContext {
    const TokenMap& tokens;
    std::string solver;
    uint32_t now = 0;           // unix seconds, from the auction
};

class SortingStrategy {
public:
    virtual ~SortingStrategy() = default;

    virtual SortingKey key(const Order& o, const SortingContext& ctx) const = 0;

    // Share of max_orders reserved for the top orders by this key alone.
    virtual double min_fraction() const = 0;
};

using SortingStrategies = std::vector<std::shared_ptr<const SortingStrategy>>;

// Most likely to fill first: sell value over buy value at reference prices.
class ExternalPrice final : public SortingStrategy {
public:
    explicit ExternalPrice(double min_fraction) : min_fraction_(min_fraction) {}
    SortingKey key(const Order& o, const SortingContext& ctx) const override;
    double min_fraction() const override { return min_fraction_; }

private:
    double min_fraction_;
};

// Largest external surplus first: sell value minus buy value.
class ExternalSurplus final : public SortingStrategy {
public:
    explicit ExternalSurplus(double min_fraction) : min_fraction_(min_fraction) {}
    SortingKey key(const Order& o, const SortingContext& ctx) const override;
    double min_fraction() const override { return min_fraction_; }

private:
    double min_fraction_;
};

// Newest first. Orders older than max_order_age get an empty key.
class CreationTimestamp final : public SortingStrategy {
public:
    CreationTimestamp(double min_fraction, std::optional<uint32_t> max_order_age_s)
        : min_fraction_(min_fraction), max_age_(max_order_age_s) {}
    SortingKey key(const Order& o, const SortingContext& ctx) const override;
    double min_fraction() const override { return min_fraction_; }

private:
    double min_fraction_;
    std::optional<uint32_t> max_age_;
};

// Orders quoted by this solver first, unless they are older than max_order_age.
class OwnQuotes final : public SortingStrategy {
public:
    OwnQuotes(double min_fraction, std::optional<uint32_t> max_order_age_s)
        : min_fraction_(min_fraction), max_age_(max_order_age_s) {}
    SortingKey key(const Order& o, const SortingContext& ctx) const override;
    double min_fraction() const override { return min_fraction_; }

private:
    double min_fraction_;
    std::optional<uint32_t> max_age_;
};

// Stable, descending, lexicographic over the comparators' keys.
void sort_orders(std::vector<Order>& orders, const SortingContext& ctx,
                 const SortingStrategies& comparators);

// Every comparator with min_fraction > 0 first contributes its own top
// ceil(min_fraction * max_nr_orders) orders; remaining slots are filled from
// the combined ordering. Never returns more than max_nr_orders.
void sort_and_filter_orders(std::vector<Order>& orders, const SortingContext& ctx,
                            const SortingStrategies& comparators, std::size_t max_nr_orders);

// Throws ConfigError on an unknown comparator kind.
SortingStrategies make_comparators(const PrioritizationConfig& cfg);

// The auction's orders in prioritized sequence, truncated when configured.
std::vector<Order> prioritize(const Auction& auction, const PrioritizationConfig& cfg);

} // namespace clearhouse
