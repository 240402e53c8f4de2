#include "clearhouse/config/SolverConfig.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "clearhouse/domain/Errors.hpp"

using json = nlohmann::json;

namespace clearhouse {

namespace {

const json* field(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return nullptr;
    return &j[key];
}

template<typename T>
T unsigned_field(const json& v, const char* key) {
    if (!v.is_number_unsigned()) {
        throw ConfigError(std::string(key) + " must be a non-negative integer");
    }
    return v.get<T>();
}

bool bool_field(const json& v, const char* key) {
    if (!v.is_boolean()) throw ConfigError(std::string(key) + " must be a boolean");
    return v.get<bool>();
}

std::string string_field(const json& v, const char* key) {
    if (!v.is_string()) throw ConfigError(std::string(key) + " must be a string");
    return v.get<std::string>();
}

int hops_field(const json& v, const char* key) {
    if (!v.is_number_integer() || v.get<int64_t>() < 1 || v.get<int64_t>() > 8) {
        throw ConfigError(std::string(key) + " must be an integer in [1, 8]");
    }
    return v.get<int>();
}

TokenAddress address_field(const json& v, const char* key) {
    TokenAddress out;
    if (!normalize_address(string_field(v, key), out)) {
        throw ConfigError(std::string(key) + " is not a token address");
    }
    return out;
}

ComparatorConfig parse_comparator(const json& j) {
    if (!j.is_object()) throw ConfigError("comparator must be an object");
    ComparatorConfig c;
    const json* kind = field(j, "kind");
    if (!kind) throw ConfigError("comparator.kind is required");
    c.kind = string_field(*kind, "comparator.kind");

    if (const json* v = field(j, "min_fraction")) {
        if (!v->is_number()) throw ConfigError("comparator.min_fraction must be a number");
        c.min_fraction = v->get<double>();
        if (c.min_fraction < 0.0 || c.min_fraction > 1.0) {
            throw ConfigError("comparator.min_fraction must be in [0, 1]");
        }
    }
    if (const json* v = field(j, "max_order_age_s")) {
        c.max_order_age_s = unsigned_field<uint32_t>(*v, "comparator.max_order_age_s");
    }
    return c;
}

PrioritizationConfig parse_prioritization(const json& j) {
    if (!j.is_object()) throw ConfigError("prioritization must be an object");
    PrioritizationConfig p;
    if (const json* v = field(j, "max_orders")) {
        p.max_orders = unsigned_field<std::size_t>(*v, "prioritization.max_orders");
    }
    if (const json* v = field(j, "solver")) {
        p.solver = address_field(*v, "prioritization.solver");
    }
    if (const json* v = field(j, "comparators")) {
        if (!v->is_array()) throw ConfigError("prioritization.comparators must be an array");
        for (const auto& c : *v) p.comparators.push_back(parse_comparator(c));
    }
    return p;
}

StrategyConfig parse_strategy(const json& j, int default_hops) {
    if (!j.is_object()) throw ConfigError("strategy must be an object");
    StrategyConfig s;
    s.max_hops = default_hops;
    const json* name = field(j, "name");
    if (!name) throw ConfigError("strategy.name is required");
    s.name = string_field(*name, "strategy.name");
    if (s.name.empty()) throw ConfigError("strategy.name must not be empty");
    if (const json* v = field(j, "max_hops")) s.max_hops = hops_field(*v, "strategy.max_hops");
    if (const json* v = field(j, "allow_splits")) s.allow_splits = bool_field(*v, "strategy.allow_splits");
    return s;
}

} // namespace

std::vector<StrategyConfig> SolverConfig::default_strategies(int max_hops) {
    return {
        StrategyConfig{"direct", 1, false},
        StrategyConfig{"multihop", max_hops, false},
        StrategyConfig{"split", max_hops, true},
    };
}

SolverConfig SolverConfig::defaults() {
    SolverConfig c;
    c.strategies = default_strategies(c.max_hops);
    return c;
}

SolverConfig parse_config(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("malformed JSON: ") + e.what());
    }
    if (!j.is_object()) throw ConfigError("top level must be an object");

    SolverConfig c;
    if (const json* v = field(j, "max_hops")) c.max_hops = hops_field(*v, "max_hops");
    if (const json* v = field(j, "split_granularity")) {
        c.split_granularity = unsigned_field<std::size_t>(*v, "split_granularity");
        if (c.split_granularity == 0) throw ConfigError("split_granularity must be positive");
    }
    if (const json* v = field(j, "max_split_pools")) {
        c.max_split_pools = unsigned_field<std::size_t>(*v, "max_split_pools");
        if (c.max_split_pools < 2) throw ConfigError("max_split_pools must be at least 2");
    }
    if (const json* v = field(j, "allow_splits")) c.allow_splits = bool_field(*v, "allow_splits");
    if (const json* v = field(j, "partial_fill_steps")) {
        c.partial_fill_steps = unsigned_field<std::size_t>(*v, "partial_fill_steps");
    }
    if (const json* v = field(j, "interaction_cost")) {
        try {
            c.interaction_cost = parse_rational(string_field(*v, "interaction_cost"));
        } catch (const std::invalid_argument& e) {
            throw ConfigError(std::string("interaction_cost: ") + e.what());
        }
    }
    if (const json* v = field(j, "numeraire")) c.numeraire = address_field(*v, "numeraire");
    if (const json* v = field(j, "deadline_buffer_ms")) {
        c.deadline_buffer_ms = unsigned_field<uint32_t>(*v, "deadline_buffer_ms");
    }

    if (const json* v = field(j, "strategies")) {
        if (!v->is_array()) throw ConfigError("strategies must be an array");
        for (const auto& s : *v) {
            StrategyConfig sc = parse_strategy(s, c.max_hops);
            if (!c.allow_splits) sc.allow_splits = false;
            c.strategies.push_back(std::move(sc));
        }
        if (c.strategies.empty()) throw ConfigError("strategies must not be empty");
    } else {
        c.strategies = SolverConfig::default_strategies(c.max_hops);
        if (!c.allow_splits) {
            for (auto& s : c.strategies) s.allow_splits = false;
        }
    }

    if (const json* v = field(j, "prioritization")) c.prioritization = parse_prioritization(*v);

    if (const json* v = field(j, "log_level")) {
        std::string s = string_field(*v, "log_level");
        if (!infra::parse_level(s, c.log_level)) throw ConfigError("unknown log_level " + s);
    }
    return c;
}

SolverConfig load_config(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw ConfigError("cannot open " + path);
    std::stringstream ss;
    ss << f.rdbuf();
    return parse_config(ss.str());
}

} // namespace clearhouse
