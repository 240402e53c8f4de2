#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "clearhouse/domain/Numeric.hpp"
#include "clearhouse/domain/Token.hpp"
#include "clearhouse/infra/Log.hpp"

namespace clearhouse {

// One candidate the governor runs. Matching always runs first; these knobs
// only shape routing.
struct StrategyConfig {
    std::string name;
    int  max_hops = 3;
    bool allow_splits = false;
};

struct ComparatorConfig {
    std::string kind;                        // external_price | external_surplus |
                                             // creation_timestamp | own_quotes
    double min_fraction = 0.0;
    std::optional<uint32_t> max_order_age_s;
};

struct PrioritizationConfig {
    std::size_t max_orders = 0;              // 0 keeps every order
    std::string solver;                      // address matched against quote_solver
    std::vector<ComparatorConfig> comparators;
};

struct SolverConfig {
    int         max_hops = 3;
    std::size_t split_granularity = 20;
    std::size_t max_split_pools = 4;
    bool        allow_splits = true;
    std::size_t partial_fill_steps = 16;

    Rational interaction_cost = 0;           // numeraire units per interaction
    std::optional<TokenAddress> numeraire;

    uint32_t deadline_buffer_ms = 0;

    std::vector<StrategyConfig> strategies;
    std::optional<PrioritizationConfig> prioritization;

    infra::LogLevel log_level = infra::LogLevel::INFO;

    // direct, multihop, split
    static SolverConfig defaults();
    static std::vector<StrategyConfig> default_strategies(int max_hops);
};

// Reads a JSON document over defaults. Unknown keys are ignored; a known key
// with the wrong type or an out-of-range value throws ConfigError.
SolverConfig parse_config(const std::string& text);
SolverConfig load_config(const std::string& path);

} // namespace clearhouse
