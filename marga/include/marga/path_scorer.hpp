#pragma once
// PathScorer: resource-flow reliability for a single path
//
// A unit of resource starts at the source node and flows along each edge,
// scaled by the edge weight and a geometric per-hop decay:
//
//   flow_i = resource(from_i) * weight_i * decay^i
//
// The path's reliability is the total flow averaged over its edges.
// Pure function, no side effects.

#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_map>

namespace marga {

struct ScorerConfig {
    double decay_rate = 0.85;            // (0,1]: near 1 favours deep paths
    double single_node_score = 0.1;      // Path with no hops
    double length_heuristic_base = 0.3;  // Vertex-only paths: base / hops
};

// Score a path. Result is always in [0,1].
inline double score_path(const Path& path, double decay_rate,
                         const ScorerConfig& config = {}) {
    if (path.vertices.empty()) return 0.0;
    if (path.vertices.size() == 1 && path.edges.empty()) {
        return config.single_node_score;
    }

    // No edge data: nothing to propagate, fall back to path length
    if (path.edges.empty()) {
        double hops = static_cast<double>(path.vertices.size() - 1);
        return std::clamp(config.length_heuristic_base / std::max(1.0, hops), 0.0, 1.0);
    }

    std::unordered_map<std::string, double> resource;
    resource[path.vertices.front().id] = 1.0;

    double path_score = 0.0;
    double decay_factor = 1.0;  // decay^i
    for (size_t i = 0; i < path.edges.size(); ++i) {
        const Edge& edge = path.edges[i];
        auto it = resource.find(edge.from);
        if (it != resource.end()) {
            double flow = it->second * std::max(0.0, edge.weight) * decay_factor;
            resource[edge.to] += flow;
            path_score += flow;
        }
        decay_factor *= decay_rate;
    }

    double edge_count = static_cast<double>(path.edges.size());
    double reliability = path_score / std::max(1.0, edge_count);
    if (!std::isfinite(reliability)) return 0.0;
    return std::clamp(reliability, 0.0, 1.0);
}

class PathScorer {
public:
    explicit PathScorer(ScorerConfig config = {}) : config_(config) {}

    double score(const Path& path) const {
        return score_path(path, config_.decay_rate, config_);
    }

    double score(const Path& path, double decay_rate) const {
        return score_path(path, decay_rate, config_);
    }

    ScoredPath scored(Path path) const {
        ScoredPath sp;
        sp.reliability = score(path);
        sp.decay_rate = config_.decay_rate;
        sp.path = std::move(path);
        return sp;
    }

    const ScorerConfig& config() const { return config_; }

private:
    ScorerConfig config_;
};

} // namespace marga
