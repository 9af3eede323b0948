#pragma once
// PathRetriever: bounded traversal, flow scoring, threshold pruning
//
// One traversal request per query. Raw paths come back from the graph
// store, each is scored with the configured decay, weak ones are dropped,
// and the survivors are ranked.
//
// Ranking: reliability desc, then fewer hops, then joined node names.

#include "graph_source.hpp"
#include "path_scorer.hpp"
#include "log.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <thread>
#include <vector>

namespace marga {

struct RetrieverConfig {
    size_t max_depth = 3;              // Clamped to [MIN_DEPTH, MAX_DEPTH]
    double pruning_threshold = 0.01;
    size_t max_paths = 5;
    size_t max_workers = 16;           // Timed traversals running at once

    static constexpr size_t MIN_DEPTH = 1;
    static constexpr size_t MAX_DEPTH = 7;
};

inline size_t clamp_depth(size_t depth) {
    return std::clamp(depth, RetrieverConfig::MIN_DEPTH, RetrieverConfig::MAX_DEPTH);
}

// Strict weak ordering for ranked output
inline bool ranks_before(const ScoredPath& a, const ScoredPath& b) {
    if (a.reliability != b.reliability) return a.reliability > b.reliability;
    if (a.path.hop_count() != b.path.hop_count()) {
        return a.path.hop_count() < b.path.hop_count();
    }
    return a.path.joined_names() < b.path.joined_names();
}

class PathRetriever {
public:
    PathRetriever(std::shared_ptr<GraphSource> source,
                  RetrieverConfig config = {},
                  ScorerConfig scorer = {})
        : source_(std::move(source)), config_(config), scorer_(scorer),
          workers_(std::make_shared<std::atomic<size_t>>(0)) {}

    // Issue one traversal. timeout_ms == 0 waits indefinitely.
    TraversalResult retrieve_candidates(const std::string& anchor,
                                        size_t max_depth,
                                        const std::optional<std::string>& domain_filter,
                                        const VersionConstraint& constraint,
                                        uint64_t timeout_ms = 0) const {
        if (!source_) return TraversalResult::unavailable("no graph source configured");

        TraversalRequest request;
        request.anchor = anchor;
        request.max_depth = clamp_depth(max_depth);
        request.domain_filter = domain_filter;
        request.constraint = constraint;

        if (timeout_ms == 0) return call_source(source_, request);

        // The worker owns everything it touches, so a late finish after a
        // timeout only writes into the abandoned shared state. A worker
        // abandoned by a timeout keeps running until the store returns;
        // max_workers bounds how many of them can pile up.
        if (workers_->fetch_add(1) >= config_.max_workers) {
            workers_->fetch_sub(1);
            log_warn("PathRetriever", "%zu traversals still running, refusing '%s'",
                     config_.max_workers, anchor.c_str());
            return TraversalResult::unavailable("graph store saturated: " +
                                                std::to_string(config_.max_workers) +
                                                " traversals still running");
        }
        auto task = std::make_shared<std::packaged_task<TraversalResult()>>(
            [src = source_, request]() { return call_source(src, request); });
        std::future<TraversalResult> result = task->get_future();
        std::thread([task, workers = workers_]() {
            (*task)();
            workers->fetch_sub(1);
        }).detach();

        if (result.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
            log_warn("PathRetriever", "traversal from '%s' exceeded %llu ms",
                     anchor.c_str(), static_cast<unsigned long long>(timeout_ms));
            return TraversalResult::timeout("graph store exceeded " +
                                            std::to_string(timeout_ms) + " ms");
        }
        return result.get();
    }

    TraversalResult retrieve_candidates(const std::string& anchor) const {
        return retrieve_candidates(anchor, config_.max_depth, std::nullopt, {});
    }

    // Score, filter and rank. Malformed paths are dropped with a warning.
    std::vector<ScoredPath> prune(const std::vector<Path>& candidates,
                                  double threshold, size_t max_paths) const {
        std::vector<ScoredPath> kept;
        kept.reserve(candidates.size());

        size_t malformed = 0;
        for (const auto& path : candidates) {
            if (!path.well_formed()) {
                ++malformed;
                log_warn("PathRetriever", "dropped malformed path (%zu vertices, %zu edges)",
                         path.vertices.size(), path.edges.size());
                continue;
            }
            ScoredPath sp = scorer_.scored(path);
            if (sp.reliability < threshold) continue;
            kept.push_back(std::move(sp));
        }

        std::stable_sort(kept.begin(), kept.end(), ranks_before);
        if (kept.size() > max_paths) kept.resize(max_paths);

        log_debug("PathRetriever", "pruned %zu candidates → %zu kept (%zu malformed, threshold %.3f)",
                  candidates.size(), kept.size(), malformed, threshold);
        return kept;
    }

    std::vector<ScoredPath> prune(const std::vector<Path>& candidates, double threshold) const {
        return prune(candidates, threshold, config_.max_paths);
    }

    std::vector<ScoredPath> prune(const std::vector<Path>& candidates) const {
        return prune(candidates, config_.pruning_threshold, config_.max_paths);
    }

    const RetrieverConfig& config() const { return config_; }
    const PathScorer& scorer() const { return scorer_; }
    size_t running_workers() const { return workers_->load(); }

private:
    static TraversalResult call_source(const std::shared_ptr<GraphSource>& source,
                                       const TraversalRequest& request) {
        try {
            return source->traverse(request);
        } catch (const std::exception& e) {
            log_error("PathRetriever", "graph store '%s' failed: %s",
                      source->name().c_str(), e.what());
            return TraversalResult::unavailable(e.what());
        }
    }

    std::shared_ptr<GraphSource> source_;
    RetrieverConfig config_;
    PathScorer scorer_;
    std::shared_ptr<std::atomic<size_t>> workers_;
};

} // namespace marga
