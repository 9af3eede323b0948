#pragma once
// Orchestrator: cache-first retrieval behind one entry point
//
// answer_context(request):
//   1. Derive a deterministic key from every retrieval parameter
//   2. Cache hit → return immediately
//   3. Miss → traverse, score, prune (one upstream call per key at a time)
//   4. Cache the outcome (empty results too, at low importance)
//   5. Optionally assemble a token-bounded context
//
// Concurrent misses on the same key are coalesced: the first caller
// retrieves, later callers wait on its shared future and get the same
// result. The cache is written before the in-flight slot is released, so
// a caller arriving afterwards always hits.
//
// Failures (unavailable store, timeout) are never cached.

#include "cache_tier.hpp"
#include "context_assembler.hpp"
#include "error.hpp"
#include "graph_source.hpp"
#include "importance.hpp"
#include "log.hpp"
#include "path_retriever.hpp"
#include "path_scorer.hpp"
#include "serialize.hpp"
#include "tiered_cache.hpp"
#include "token_counter.hpp"
#include <algorithm>
#include <atomic>
#include <cstdio>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace marga {

struct OrchestratorConfig {
    ScorerConfig scorer;
    RetrieverConfig retriever;
    CacheConfig cache;
    ContextBudget context;

    double empty_result_importance = 0.05;
    uint64_t default_timeout_ms = 0;        // 0: wait for the graph store indefinitely
};

struct AnswerRequest {
    std::string anchor;
    size_t max_paths = 5;
    std::optional<std::string> domain_filter;
    VersionConstraint constraint;
    bool format_for_output = false;
    uint64_t timeout_ms = 0;                // 0: OrchestratorConfig default
    std::optional<size_t> max_depth;        // Unset: RetrieverConfig default
};

struct AnswerResult {
    RetrievalError error = RetrievalError::None;
    std::string message;

    bool from_cache = false;
    bool coalesced = false;                 // Served by another caller's retrieval
    bool empty = false;                     // Successful retrieval, zero paths
    bool cache_write_rejected = false;

    std::vector<ScoredPath> paths;
    std::vector<RankedPath> ranked;
    std::optional<std::string> context;     // Set when format_for_output

    bool ok() const { return error == RetrievalError::None; }

    static AnswerResult failure(RetrievalError e, std::string msg) {
        AnswerResult r;
        r.error = e;
        r.message = std::move(msg);
        return r;
    }
};

struct OrchestratorStats {
    uint64_t requests = 0;
    uint64_t cache_hits = 0;
    uint64_t upstream_calls = 0;
    uint64_t timeouts = 0;
    uint64_t failures = 0;
    uint64_t coalesced = 0;
    uint64_t rejected_writes = 0;
    CacheStats cache;
};

inline std::string format_reliability(double r) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%.3f", r);
    return buf;
}

// "A -[causes]-> B (reliability 0.713)"
inline std::string fragment_text(const ScoredPath& sp) {
    return sp.path.render() + " (reliability " + format_reliability(sp.reliability) + ")";
}

inline std::vector<RankedPath> to_ranked(const std::vector<ScoredPath>& paths) {
    std::vector<RankedPath> out;
    out.reserve(paths.size());
    for (const auto& sp : paths) out.push_back({sp.path.render(), sp.reliability});
    return out;
}

class Orchestrator {
public:
    Orchestrator(std::shared_ptr<GraphSource> source,
                 OrchestratorConfig config = {},
                 TokenCounter counter = word_token_counter(),
                 std::unique_ptr<PlacementPolicy> placement = nullptr,
                 std::unique_ptr<ImportanceScorer> importance = nullptr)
        : config_(config),
          retriever_(std::move(source), config_.retriever, config_.scorer),
          cache_(config_.cache, std::move(importance)),
          counter_(counter ? std::move(counter) : word_token_counter()),
          placement_(placement ? std::move(placement) : std::make_unique<BoundaryPlacement>()) {}

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Open the persistent cache tier
    bool open() { return cache_.open(); }

    AnswerResult answer_context(const AnswerRequest& request) {
        requests_.fetch_add(1, std::memory_order_relaxed);

        if (auto problem = check(request)) {
            log_warn("Orchestrator", "rejected request: %s", problem->c_str());
            return AnswerResult::failure(RetrievalError::InvalidArgument, *problem);
        }

        std::string key = cache_key(request);
        CacheContext context{request.anchor, std::nullopt, std::nullopt};

        if (auto hit = cache_.get(key, context)) {
            cache_hits_.fetch_add(1, std::memory_order_relaxed);
            log_debug("Orchestrator", "cache hit for '%s'", request.anchor.c_str());
            return from_payload(*hit, request);
        }

        std::promise<AnswerResult> promise;
        std::shared_future<AnswerResult> shared;
        bool leader = false;
        {
            std::lock_guard<std::mutex> lock(inflight_mutex_);
            auto it = inflight_.find(key);
            if (it != inflight_.end()) {
                shared = it->second;
            } else {
                shared = promise.get_future().share();
                inflight_.emplace(key, shared);
                leader = true;
            }
        }

        if (!leader) {
            coalesced_.fetch_add(1, std::memory_order_relaxed);
            log_debug("Orchestrator", "waiting on in-flight retrieval for '%s'",
                      request.anchor.c_str());
            AnswerResult r = shared.get();
            r.coalesced = true;
            return r;
        }

        AnswerResult result;
        try {
            // A previous leader may have finished between our miss and our claim
            if (auto hit = cache_.get(key, context)) {
                cache_hits_.fetch_add(1, std::memory_order_relaxed);
                result = from_payload(*hit, request);
            } else {
                result = retrieve(request, key, context);
            }
        } catch (const std::exception& e) {
            log_error("Orchestrator", "retrieval for '%s' failed: %s",
                      request.anchor.c_str(), e.what());
            result = AnswerResult::failure(RetrievalError::UpstreamUnavailable, e.what());
        }

        promise.set_value(result);
        {
            std::lock_guard<std::mutex> lock(inflight_mutex_);
            inflight_.erase(key);
        }
        return result;
    }

    // Canonical form of every parameter that shapes the result. The
    // timeout is excluded: it bounds the wait, not the answer. Fields are
    // length-prefixed raw bytes, so any anchor text (valid UTF-8 or not)
    // maps to its own key.
    std::string cache_key(const AnswerRequest& request) const {
        std::string canonical;
        auto field = [&canonical](const char* name, const std::string& value) {
            canonical += name;
            canonical += '=';
            canonical += std::to_string(value.size());
            canonical += ':';
            canonical += value;
            canonical += ';';
        };
        // "-" when unset, "+value" when set, so unset never equals ""
        auto optional_field = [&field](const char* name, const std::optional<std::string>& v) {
            field(name, v ? "+" + *v : std::string("-"));
        };
        auto number = [](double d) {
            char buf[32];
            snprintf(buf, sizeof(buf), "%.17g", d);
            return std::string(buf);
        };

        field("anchor", request.anchor);
        field("max_paths", std::to_string(request.max_paths));
        field("depth", std::to_string(effective_depth(request)));
        optional_field("domain", request.domain_filter);
        optional_field("version", request.constraint.version);
        optional_field("as_of", request.constraint.as_of
            ? std::optional<std::string>(std::to_string(*request.constraint.as_of))
            : std::nullopt);
        field("format", request.format_for_output ? "1" : "0");
        field("decay", number(config_.scorer.decay_rate));
        field("threshold", number(config_.retriever.pruning_threshold));
        return "answer:" + to_hex(fnv1a64(canonical));
    }

    OrchestratorStats stats() const {
        OrchestratorStats s;
        s.requests = requests_.load();
        s.cache_hits = cache_hits_.load();
        s.upstream_calls = upstream_calls_.load();
        s.timeouts = timeouts_.load();
        s.failures = failures_.load();
        s.coalesced = coalesced_.load();
        s.rejected_writes = rejected_writes_.load();
        s.cache = cache_.stats();
        return s;
    }

    TieredCache& cache() { return cache_; }
    const PathRetriever& retriever() const { return retriever_; }
    const OrchestratorConfig& config() const { return config_; }
    const PlacementPolicy& placement() const { return *placement_; }

    // Assemble ranked paths (strongest first) into a bounded context
    std::string assemble(const std::string& anchor, const std::vector<ScoredPath>& ranked) const {
        ContextAssembler assembler(config_.context, counter_);

        std::vector<double> reliabilities;
        reliabilities.reserve(ranked.size());
        for (const auto& sp : ranked) reliabilities.push_back(sp.reliability);
        std::vector<Priority> priorities = placement_->assign(reliabilities);

        // Weakest first: the strongest path is added last and nothing
        // added after it can displace it
        for (size_t i = ranked.size(); i-- > 0;) {
            Priority p = i < priorities.size() ? priorities[i] : Priority::Medium;
            if (!assembler.add(fragment_text(ranked[i]), p, ranked[i].reliability)) {
                log_debug("Orchestrator", "path %zu does not fit the context budget", i);
            }
        }
        return assembler.finalize("Query: " + anchor);
    }

private:
    std::optional<std::string> check(const AnswerRequest& request) const {
        if (request.anchor.empty()) return std::string("anchor must not be empty");
        if (request.max_paths == 0) return std::string("max_paths must be positive");
        double decay = config_.scorer.decay_rate;
        if (!(decay > 0.0 && decay <= 1.0)) {
            return "decay_rate " + format_reliability(decay) + " outside (0,1]";
        }
        return std::nullopt;
    }

    size_t effective_depth(const AnswerRequest& request) const {
        return clamp_depth(request.max_depth.value_or(config_.retriever.max_depth));
    }

    AnswerResult retrieve(const AnswerRequest& request, const std::string& key,
                          const CacheContext& context) {
        upstream_calls_.fetch_add(1, std::memory_order_relaxed);
        uint64_t timeout = request.timeout_ms ? request.timeout_ms : config_.default_timeout_ms;

        TraversalResult traversal = retriever_.retrieve_candidates(
            request.anchor, effective_depth(request), request.domain_filter,
            request.constraint, timeout);

        if (traversal.status == TraversalStatus::Timeout) {
            timeouts_.fetch_add(1, std::memory_order_relaxed);
            return AnswerResult::failure(RetrievalError::Timeout, traversal.message);
        }
        if (!traversal.ok()) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            log_warn("Orchestrator", "graph store unavailable for '%s': %s",
                     request.anchor.c_str(), traversal.message.c_str());
            return AnswerResult::failure(RetrievalError::UpstreamUnavailable, traversal.message);
        }

        AnswerResult result;
        result.paths = retriever_.prune(traversal.paths, config_.retriever.pruning_threshold,
                                        request.max_paths);
        result.ranked = to_ranked(result.paths);
        result.empty = result.paths.empty();

        CachePayload payload;
        if (request.format_for_output) {
            result.context = assemble(request.anchor, result.paths);
            payload = CachePayload::of_text(*result.context, result.paths);
        } else {
            payload = CachePayload::of_paths(result.paths);
        }

        double importance = result.empty
            ? config_.empty_result_importance
            : result_importance(payload, result.paths.size(), request.max_paths, context);

        if (!cache_.put(key, payload, importance, &context)) {
            rejected_writes_.fetch_add(1, std::memory_order_relaxed);
            result.cache_write_rejected = true;
            log_debug("Orchestrator", "result for '%s' not cached", request.anchor.c_str());
        }

        log_debug("Orchestrator", "'%s': %zu raw paths → %zu kept (importance %.3f)",
                  request.anchor.c_str(), traversal.paths.size(), result.paths.size(),
                  importance);
        return result;
    }

    // Half coverage (survivors / max_paths), half the importance strategy
    double result_importance(const CachePayload& payload, size_t kept, size_t max_paths,
                             const CacheContext& context) const {
        double coverage = std::min(1.0, static_cast<double>(kept) /
                                        static_cast<double>(std::max<size_t>(1, max_paths)));
        double heuristic = cache_.importance_of(payload, context);
        return std::clamp(0.5 * coverage + 0.5 * heuristic, 0.0, 1.0);
    }

    AnswerResult from_payload(const CachePayload& payload, const AnswerRequest& request) const {
        AnswerResult r;
        r.from_cache = true;
        r.paths = payload.paths;
        r.ranked = to_ranked(r.paths);
        r.empty = r.paths.empty();
        if (request.format_for_output) {
            r.context = payload.kind == CachePayload::Kind::Text
                ? payload.text
                : assemble(request.anchor, r.paths);
        }
        return r;
    }

    OrchestratorConfig config_;
    PathRetriever retriever_;
    TieredCache cache_;
    TokenCounter counter_;
    std::unique_ptr<PlacementPolicy> placement_;

    std::mutex inflight_mutex_;
    std::unordered_map<std::string, std::shared_future<AnswerResult>> inflight_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> upstream_calls_{0};
    std::atomic<uint64_t> timeouts_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> coalesced_{0};
    std::atomic<uint64_t> rejected_writes_{0};
};

} // namespace marga
