#pragma once
// TieredCache: fast RAM tier over a durable slow tier
//
// Placement:
//   put  → always persisted to the slow tier; also placed in the fast tier
//          when importance ≥ high_importance_threshold (or already there)
//   get  → fast tier first; on a slow-tier hit the entry is promoted when
//          it has been read more than promotion_access_count times or its
//          recomputed importance clears the high threshold
//
// The fast tier is a subset of the slow tier, not a disjoint level.
// Every operation on a key holds that key's lock stripe (shared for
// reads, exclusive for writes and promotion), so promotion is atomic per
// key while unrelated keys proceed.

#include "cache_tier.hpp"
#include "disk_tier.hpp"
#include "importance.hpp"
#include "log.hpp"
#include <algorithm>
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace marga {

struct CacheConfig {
    size_t fast_budget_bytes = 64ULL * 1024 * 1024;     // 64 MiB
    size_t slow_budget_bytes = 1024ULL * 1024 * 1024;   // 1 GiB
    std::string slow_dir;              // Empty: slow tier kept in RAM (no durability)
    double high_importance_threshold = 0.6;
    uint64_t promotion_access_count = 5;
    size_t lock_stripes = 64;
    ImportanceConfig importance;
};

// What the caller knows about the entry beyond its payload
struct CacheContext {
    std::string query;
    std::optional<Timestamp> data_timestamp;
    std::optional<double> confidence;
};

enum class CacheTierKind { None, Fast, Slow };

struct CacheStats {
    TierStats fast;
    TierStats slow;
    uint64_t fast_hits = 0;
    uint64_t slow_hits = 0;
    uint64_t misses = 0;
    uint64_t promotions = 0;
    uint64_t rejected_writes = 0;
};

class TieredCache {
public:
    explicit TieredCache(CacheConfig config = {},
                         std::unique_ptr<ImportanceScorer> scorer = nullptr)
        : config_(std::move(config)),
          scorer_(scorer ? std::move(scorer)
                         : std::make_unique<HeuristicImportance>(config_.importance)),
          stripes_(std::max<size_t>(1, config_.lock_stripes))
    {
        fast_ = std::make_unique<MemoryTier>(config_.fast_budget_bytes);
        if (config_.slow_dir.empty()) {
            slow_ = std::make_unique<MemoryTier>(config_.slow_budget_bytes);
        } else {
            auto disk = std::make_unique<DiskTier>(config_.slow_dir, config_.slow_budget_bytes);
            disk_ = disk.get();
            slow_ = std::move(disk);
        }
    }

    // Bring your own tiers; a DiskTier passed here must already be open
    TieredCache(std::unique_ptr<CacheTier> fast, std::unique_ptr<CacheTier> slow,
                CacheConfig config = {},
                std::unique_ptr<ImportanceScorer> scorer = nullptr)
        : config_(std::move(config)),
          scorer_(scorer ? std::move(scorer)
                         : std::make_unique<HeuristicImportance>(config_.importance)),
          stripes_(std::max<size_t>(1, config_.lock_stripes)),
          fast_(std::move(fast)),
          slow_(std::move(slow)) {}

    TieredCache(const TieredCache&) = delete;
    TieredCache& operator=(const TieredCache&) = delete;

    // Open the persistent tier, if any. A failure leaves the cache usable
    // with writes to the slow tier rejected.
    bool open() {
        if (!disk_) return true;
        return disk_->open();
    }

    std::optional<CachePayload> get(const std::string& key, const CacheContext& context = {}) {
        if (!context.query.empty()) remember_query(context.query);

        auto& stripe = stripe_for(key);
        std::optional<TierHit> slow_hit;
        double importance = 0.0;
        {
            std::shared_lock lock(stripe);
            if (auto hit = fast_->get(key)) {
                fast_hits_.fetch_add(1, std::memory_order_relaxed);
                return std::move(hit->payload);
            }

            slow_hit = slow_->get(key);
            if (!slow_hit) {
                misses_.fetch_add(1, std::memory_order_relaxed);
                return std::nullopt;
            }
            slow_hits_.fetch_add(1, std::memory_order_relaxed);

            importance = importance_of(slow_hit->payload, context);
            if (!should_promote(slow_hit->meta, importance)) {
                return std::move(slow_hit->payload);
            }
        }

        std::unique_lock lock(stripe);
        // A put may have replaced the entry between the two locks; only the
        // copy that is still current in the slow tier may be promoted.
        auto current = slow_->meta(key);
        if (current && current->revision == slow_hit->meta.revision) {
            promote_locked(key, slow_hit->payload, importance, slow_hit->meta.metadata);
        } else {
            log_debug("TieredCache", "%s changed before promotion, skipped", key.c_str());
        }
        return std::move(slow_hit->payload);
    }

    // Best-effort: false means no tier accepted the entry (CacheWriteRejected)
    bool put(const std::string& key, const CachePayload& payload,
             std::optional<double> importance = std::nullopt,
             const CacheContext* context = nullptr) {
        double imp = importance
            ? std::clamp(*importance, 0.0, 1.0)
            : importance_of(payload, context ? *context : CacheContext{});

        Metadata metadata;
        if (context && !context->query.empty()) metadata["query"] = context->query;

        std::unique_lock lock(stripe_for(key));

        bool slow_ok = slow_->put(key, payload, imp, metadata);

        bool fast_ok = false;
        bool in_fast = fast_->contains(key);
        if (imp >= config_.high_importance_threshold || in_fast) {
            fast_ok = fast_->put(key, payload, imp, metadata);
            if (!fast_ok && in_fast) fast_->erase(key);  // Never serve a stale copy
        }

        if (!slow_ok && !fast_ok) {
            rejected_writes_.fetch_add(1, std::memory_order_relaxed);
            log_debug("TieredCache", "write rejected for %s (%zu bytes)",
                      key.c_str(), payload.byte_size());
            return false;
        }
        log_debug("TieredCache", "put %s importance=%.3f fast=%d slow=%d",
                  key.c_str(), imp, fast_ok ? 1 : 0, slow_ok ? 1 : 0);
        return true;
    }

    // Copy a slow-tier entry into the fast tier. Already fast: no-op.
    bool promote(const std::string& key) {
        std::unique_lock lock(stripe_for(key));
        if (fast_->contains(key)) return true;

        auto hit = slow_->get(key);
        if (!hit) return false;
        return promote_locked(key, hit->payload, hit->meta.importance, hit->meta.metadata);
    }

    bool erase(const std::string& key) {
        std::unique_lock lock(stripe_for(key));
        bool in_fast = fast_->erase(key);
        bool in_slow = slow_->erase(key);
        return in_fast || in_slow;
    }

    void clear() {
        // Exclusive on every stripe: nothing may observe a half-cleared cache
        std::vector<std::unique_lock<std::shared_mutex>> locks;
        locks.reserve(stripes_.size());
        for (auto& s : stripes_) locks.emplace_back(s);
        fast_->clear();
        slow_->clear();
    }

    bool contains(const std::string& key) const {
        std::shared_lock lock(stripe_for(key));
        return fast_->contains(key) || slow_->contains(key);
    }

    CacheTierKind tier_of(const std::string& key) const {
        std::shared_lock lock(stripe_for(key));
        if (fast_->contains(key)) return CacheTierKind::Fast;
        if (slow_->contains(key)) return CacheTierKind::Slow;
        return CacheTierKind::None;
    }

    double importance_of(const CachePayload& payload, const CacheContext& context) const {
        ImportanceInput in;
        in.now = now();
        in.data_timestamp = context.data_timestamp;
        in.confidence = context.confidence;
        in.recent_queries = recent_queries();

        double reliability_sum = 0.0;
        Timestamp newest = 0;
        for (const auto& sp : payload.paths) {
            in.vertex_count += sp.path.vertices.size();
            in.edge_count += sp.path.edges.size();
            reliability_sum += sp.reliability;
            for (const auto& e : sp.path.edges) newest = std::max(newest, e.created_at);
            if (!in.text.empty()) in.text += '\n';
            in.text += sp.path.render();
        }
        if (!in.confidence && !payload.paths.empty()) {
            in.confidence = reliability_sum / static_cast<double>(payload.paths.size());
        }
        if (!in.data_timestamp && newest != 0) in.data_timestamp = newest;
        if (!payload.text.empty()) {
            if (!in.text.empty()) in.text += '\n';
            in.text += payload.text;
        }
        return scorer_->score(in);
    }

    std::vector<std::string> recent_queries() const {
        std::lock_guard<std::mutex> lock(queries_mutex_);
        return std::vector<std::string>(recent_queries_.begin(), recent_queries_.end());
    }

    CacheStats stats() const {
        CacheStats s;
        s.fast = fast_->stats();
        s.slow = slow_->stats();
        s.fast_hits = fast_hits_.load();
        s.slow_hits = slow_hits_.load();
        s.misses = misses_.load();
        s.promotions = promotions_.load();
        s.rejected_writes = rejected_writes_.load();
        return s;
    }

    const CacheConfig& config() const { return config_; }
    CacheTier& fast_tier() { return *fast_; }
    CacheTier& slow_tier() { return *slow_; }

private:
    bool should_promote(const EntryMeta& meta, double importance) const {
        return meta.access_count > config_.promotion_access_count ||
               importance >= config_.high_importance_threshold;
    }

    bool promote_locked(const std::string& key, const CachePayload& payload,
                        double importance, const Metadata& metadata) {
        if (fast_->contains(key)) return true;
        if (!fast_->put(key, payload, importance, metadata)) {
            log_debug("TieredCache", "promotion of %s refused by fast tier", key.c_str());
            return false;
        }
        promotions_.fetch_add(1, std::memory_order_relaxed);
        log_debug("TieredCache", "promoted %s (importance %.3f)", key.c_str(), importance);
        return true;
    }

    void remember_query(const std::string& query) {
        std::lock_guard<std::mutex> lock(queries_mutex_);
        recent_queries_.push_back(query);
        while (recent_queries_.size() > config_.importance.query_window) {
            recent_queries_.pop_front();
        }
    }

    std::shared_mutex& stripe_for(const std::string& key) const {
        return stripes_[fnv1a64(key) % stripes_.size()];
    }

    CacheConfig config_;
    std::unique_ptr<ImportanceScorer> scorer_;
    mutable std::vector<std::shared_mutex> stripes_;

    std::unique_ptr<CacheTier> fast_;
    std::unique_ptr<CacheTier> slow_;
    DiskTier* disk_ = nullptr;   // Non-owning view of slow_ when it is on disk

    mutable std::mutex queries_mutex_;
    std::deque<std::string> recent_queries_;

    std::atomic<uint64_t> fast_hits_{0};
    std::atomic<uint64_t> slow_hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> promotions_{0};
    std::atomic<uint64_t> rejected_writes_{0};
};

} // namespace marga
