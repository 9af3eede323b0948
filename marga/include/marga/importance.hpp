#pragma once
// Importance: how much a cache entry deserves the fast tier
//
// Importance = weighted sum of four signals, each in [0,1]:
//   recency    - how fresh the underlying data is (exponential half-life)
//   confidence - reliability carried by the result
//   richness   - vertices + edges in the result, capped
//   relevance  - share of recent queries that appear in the result text
//
// A signal with no input contributes a neutral 0.5. Swappable: the cache
// only sees the ImportanceScorer interface.

#include "types.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace marga {

struct ImportanceConfig {
    double recency_weight = 0.3;
    double confidence_weight = 0.3;
    double richness_weight = 0.2;
    double relevance_weight = 0.2;

    double recency_halflife_days = 7.0;
    size_t richness_cap = 10;       // vertices + edges for a full richness score
    size_t query_window = 16;       // Recent queries remembered for relevance
};

struct ImportanceInput {
    std::optional<Timestamp> data_timestamp;   // When the underlying data changed
    std::optional<double> confidence;          // [0,1]
    size_t vertex_count = 0;
    size_t edge_count = 0;
    std::string text;                          // Searchable rendering of the entry
    std::vector<std::string> recent_queries;
    Timestamp now = 0;
};

class ImportanceScorer {
public:
    virtual ~ImportanceScorer() = default;
    virtual double score(const ImportanceInput& input) const = 0;
};

inline std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

class HeuristicImportance : public ImportanceScorer {
public:
    explicit HeuristicImportance(ImportanceConfig config = {}) : config_(config) {}

    double score(const ImportanceInput& in) const override {
        double total = config_.recency_weight + config_.confidence_weight +
                       config_.richness_weight + config_.relevance_weight;
        if (total <= 0.0) return 0.0;

        double s = config_.recency_weight * recency(in) +
                   config_.confidence_weight * confidence(in) +
                   config_.richness_weight * richness(in) +
                   config_.relevance_weight * relevance(in);
        return std::clamp(s / total, 0.0, 1.0);
    }

    double recency(const ImportanceInput& in) const {
        if (!in.data_timestamp) return 0.5;
        Timestamp current = in.now != 0 ? in.now : now();
        double days_ago = std::max(0.0,
            static_cast<double>(current - *in.data_timestamp) / 86400000.0);
        return std::exp(-days_ago * 0.693 / config_.recency_halflife_days);
    }

    double confidence(const ImportanceInput& in) const {
        if (!in.confidence) return 0.5;
        return std::clamp(*in.confidence, 0.0, 1.0);
    }

    double richness(const ImportanceInput& in) const {
        if (config_.richness_cap == 0) return 1.0;
        double size = static_cast<double>(in.vertex_count + in.edge_count);
        return std::min(1.0, size / static_cast<double>(config_.richness_cap));
    }

    // Substring match, case-insensitive
    double relevance(const ImportanceInput& in) const {
        if (in.recent_queries.empty() || in.text.empty()) return 0.5;
        std::string haystack = lowercase(in.text);
        size_t matched = 0;
        for (const auto& q : in.recent_queries) {
            if (!q.empty() && haystack.find(lowercase(q)) != std::string::npos) ++matched;
        }
        return static_cast<double>(matched) / static_cast<double>(in.recent_queries.size());
    }

    const ImportanceConfig& config() const { return config_; }

private:
    ImportanceConfig config_;
};

} // namespace marga
