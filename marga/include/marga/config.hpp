#pragma once
// Configuration: JSON file → OrchestratorConfig
//
// {
//   "scorer":    { "decay_rate": 0.85, ... },
//   "retriever": { "max_depth": 3, "pruning_threshold": 0.01, "max_paths": 5, "max_workers": 16 },
//   "cache":     { "fast_budget_bytes": ..., "slow_dir": "...",
//                  "importance": { "recency_weight": 0.3, ... } },
//   "context":   { "max_tokens": 4096, "reserved_tokens": 512 },
//   "empty_result_importance": 0.05,
//   "default_timeout_ms": 0
// }
//
// Missing keys keep their defaults. MARGA_CACHE_DIR overrides cache.slow_dir.

#include "orchestrator.hpp"
#include "serialize.hpp"
#include "log.hpp"
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace marga {

inline std::string default_cache_dir() {
    const char* home = std::getenv("HOME");
    if (!home) home = ".";
    return std::string(home) + "/.cache/marga";
}

// Throws json::exception on type mismatches
inline OrchestratorConfig config_from_json(const json& j) {
    OrchestratorConfig c;

    if (auto it = j.find("scorer"); it != j.end()) {
        c.scorer.decay_rate = it->value("decay_rate", c.scorer.decay_rate);
        c.scorer.single_node_score = it->value("single_node_score", c.scorer.single_node_score);
        c.scorer.length_heuristic_base =
            it->value("length_heuristic_base", c.scorer.length_heuristic_base);
    }
    if (auto it = j.find("retriever"); it != j.end()) {
        c.retriever.max_depth = it->value("max_depth", c.retriever.max_depth);
        c.retriever.pruning_threshold = it->value("pruning_threshold", c.retriever.pruning_threshold);
        c.retriever.max_paths = it->value("max_paths", c.retriever.max_paths);
        c.retriever.max_workers = it->value("max_workers", c.retriever.max_workers);
    }
    if (auto it = j.find("cache"); it != j.end()) {
        c.cache.fast_budget_bytes = it->value("fast_budget_bytes", c.cache.fast_budget_bytes);
        c.cache.slow_budget_bytes = it->value("slow_budget_bytes", c.cache.slow_budget_bytes);
        c.cache.slow_dir = it->value("slow_dir", c.cache.slow_dir);
        c.cache.high_importance_threshold =
            it->value("high_importance_threshold", c.cache.high_importance_threshold);
        c.cache.promotion_access_count =
            it->value("promotion_access_count", c.cache.promotion_access_count);
        c.cache.lock_stripes = it->value("lock_stripes", c.cache.lock_stripes);

        if (auto imp = it->find("importance"); imp != it->end()) {
            auto& ic = c.cache.importance;
            ic.recency_weight = imp->value("recency_weight", ic.recency_weight);
            ic.confidence_weight = imp->value("confidence_weight", ic.confidence_weight);
            ic.richness_weight = imp->value("richness_weight", ic.richness_weight);
            ic.relevance_weight = imp->value("relevance_weight", ic.relevance_weight);
            ic.recency_halflife_days = imp->value("recency_halflife_days", ic.recency_halflife_days);
            ic.richness_cap = imp->value("richness_cap", ic.richness_cap);
            ic.query_window = imp->value("query_window", ic.query_window);
        }
    }
    if (auto it = j.find("context"); it != j.end()) {
        c.context.max_tokens = it->value("max_tokens", c.context.max_tokens);
        c.context.reserved_tokens = it->value("reserved_tokens", c.context.reserved_tokens);
    }
    c.empty_result_importance = j.value("empty_result_importance", c.empty_result_importance);
    c.default_timeout_ms = j.value("default_timeout_ms", c.default_timeout_ms);
    return c;
}

inline json config_to_json(const OrchestratorConfig& c) {
    const auto& ic = c.cache.importance;
    return json{
        {"scorer", {
            {"decay_rate", c.scorer.decay_rate},
            {"single_node_score", c.scorer.single_node_score},
            {"length_heuristic_base", c.scorer.length_heuristic_base}
        }},
        {"retriever", {
            {"max_depth", c.retriever.max_depth},
            {"pruning_threshold", c.retriever.pruning_threshold},
            {"max_paths", c.retriever.max_paths},
            {"max_workers", c.retriever.max_workers}
        }},
        {"cache", {
            {"fast_budget_bytes", c.cache.fast_budget_bytes},
            {"slow_budget_bytes", c.cache.slow_budget_bytes},
            {"slow_dir", c.cache.slow_dir},
            {"high_importance_threshold", c.cache.high_importance_threshold},
            {"promotion_access_count", c.cache.promotion_access_count},
            {"lock_stripes", c.cache.lock_stripes},
            {"importance", {
                {"recency_weight", ic.recency_weight},
                {"confidence_weight", ic.confidence_weight},
                {"richness_weight", ic.richness_weight},
                {"relevance_weight", ic.relevance_weight},
                {"recency_halflife_days", ic.recency_halflife_days},
                {"richness_cap", ic.richness_cap},
                {"query_window", ic.query_window}
            }}
        }},
        {"context", {
            {"max_tokens", c.context.max_tokens},
            {"reserved_tokens", c.context.reserved_tokens}
        }},
        {"empty_result_importance", c.empty_result_importance},
        {"default_timeout_ms", c.default_timeout_ms}
    };
}

// nullopt (with a logged error) when the file is unreadable or invalid
inline std::optional<OrchestratorConfig> load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        log_error("Config", "cannot open %s", path.c_str());
        return std::nullopt;
    }
    try {
        json j = json::parse(in);
        if (!j.is_object()) {
            log_error("Config", "%s: top level must be an object", path.c_str());
            return std::nullopt;
        }
        return config_from_json(j);
    } catch (const json::exception& e) {
        log_error("Config", "%s: %s", path.c_str(), e.what());
        return std::nullopt;
    }
}

inline void apply_env(OrchestratorConfig& config) {
    if (const char* dir = std::getenv("MARGA_CACHE_DIR"); dir && dir[0] != '\0') {
        config.cache.slow_dir = dir;
    }
    init_logging_from_env();
}

// Problems found in the configuration; empty when valid
inline std::vector<std::string> validate(const OrchestratorConfig& c) {
    std::vector<std::string> problems;
    auto unit = [&](double v, const char* name) {
        if (!(v >= 0.0 && v <= 1.0)) problems.push_back(std::string(name) + " must be in [0,1]");
    };

    if (!(c.scorer.decay_rate > 0.0 && c.scorer.decay_rate <= 1.0)) {
        problems.push_back("scorer.decay_rate must be in (0,1]");
    }
    unit(c.scorer.single_node_score, "scorer.single_node_score");
    unit(c.scorer.length_heuristic_base, "scorer.length_heuristic_base");

    if (c.retriever.max_depth < RetrieverConfig::MIN_DEPTH ||
        c.retriever.max_depth > RetrieverConfig::MAX_DEPTH) {
        problems.push_back("retriever.max_depth must be in [1,7]");
    }
    unit(c.retriever.pruning_threshold, "retriever.pruning_threshold");
    if (c.retriever.max_paths == 0) problems.push_back("retriever.max_paths must be positive");
    if (c.retriever.max_workers == 0) problems.push_back("retriever.max_workers must be positive");

    if (c.cache.fast_budget_bytes == 0) problems.push_back("cache.fast_budget_bytes must be positive");
    if (c.cache.slow_budget_bytes == 0) problems.push_back("cache.slow_budget_bytes must be positive");
    unit(c.cache.high_importance_threshold, "cache.high_importance_threshold");
    if (c.cache.lock_stripes == 0) problems.push_back("cache.lock_stripes must be positive");

    const auto& ic = c.cache.importance;
    if (ic.recency_weight < 0 || ic.confidence_weight < 0 ||
        ic.richness_weight < 0 || ic.relevance_weight < 0) {
        problems.push_back("cache.importance weights must be non-negative");
    }
    if (ic.recency_halflife_days <= 0) {
        problems.push_back("cache.importance.recency_halflife_days must be positive");
    }

    if (c.context.reserved_tokens >= c.context.max_tokens) {
        problems.push_back("context.reserved_tokens must be below context.max_tokens");
    }
    unit(c.empty_result_importance, "empty_result_importance");
    return problems;
}

} // namespace marga
