#pragma once
// Cache tiers: byte-budgeted key → payload stores
//
// Fast tier: RAM, volatile.
// Slow tier: disk, durable (see disk_tier.hpp).
//
// Both evict the same way: least recently used first, ties broken by
// lowest access count, until the incoming entry fits. An entry larger
// than the whole budget is refused; caching is best-effort.
//
// Reads take a shared lock on the tier index; recency and access counts
// are atomics so concurrent readers never block each other.

#include "types.hpp"
#include "serialize.hpp"
#include "log.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace marga {

// What a cache entry holds: ranked paths or assembled context text
struct CachePayload {
    enum class Kind : uint8_t { Paths, Text };

    Kind kind = Kind::Paths;
    std::vector<ScoredPath> paths;
    std::string text;

    static CachePayload of_paths(std::vector<ScoredPath> p) {
        CachePayload payload;
        payload.kind = Kind::Paths;
        payload.paths = std::move(p);
        return payload;
    }

    static CachePayload of_text(std::string t, std::vector<ScoredPath> p = {}) {
        CachePayload payload;
        payload.kind = Kind::Text;
        payload.text = std::move(t);
        payload.paths = std::move(p);
        return payload;
    }

    // Rough resident size: string bytes plus fixed per-object overhead
    size_t byte_size() const {
        size_t bytes = sizeof(CachePayload) + text.size();
        for (const auto& sp : paths) {
            bytes += sizeof(ScoredPath);
            for (const auto& v : sp.path.vertices) {
                bytes += sizeof(Node) + v.id.size() + v.type.size() + v.domain.size();
                for (const auto& o : v.observations) bytes += o.size() + 32;
                for (const auto& [k, val] : v.metadata) bytes += k.size() + val.size() + 64;
                if (v.embedding) bytes += v.embedding->size();
            }
            for (const auto& e : sp.path.edges) {
                bytes += sizeof(Edge) + e.from.size() + e.to.size() +
                         e.relation.size() + e.version.size();
                for (const auto& [k, val] : e.metadata) bytes += k.size() + val.size() + 64;
            }
        }
        return bytes;
    }

    bool operator==(const CachePayload& o) const {
        return kind == o.kind && paths == o.paths && text == o.text;
    }
    bool operator!=(const CachePayload& o) const { return !(*this == o); }
};

inline void to_json(json& j, const CachePayload& p) {
    j = json{{"kind", p.kind == CachePayload::Kind::Text ? "text" : "paths"},
             {"paths", p.paths}};
    if (p.kind == CachePayload::Kind::Text) j["text"] = p.text;
}

inline void from_json(const json& j, CachePayload& p) {
    p.kind = j.value("kind", std::string("paths")) == "text"
        ? CachePayload::Kind::Text : CachePayload::Kind::Paths;
    p.paths = j.value("paths", std::vector<ScoredPath>{});
    p.text = j.value("text", std::string());
}

// Per-entry bookkeeping (a snapshot; live values are atomics in the tier)
struct EntryMeta {
    size_t byte_size = 0;
    Timestamp created_at = 0;
    Timestamp last_accessed = 0;
    uint64_t access_count = 0;
    uint64_t sequence = 0;        // Recency order within the tier
    uint64_t revision = 0;        // Changes on every put of the key
    double importance = 0.0;
    Metadata metadata;
};

struct TierHit {
    CachePayload payload;
    EntryMeta meta;
};

struct TierStats {
    size_t entries = 0;
    size_t bytes = 0;
    size_t budget = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t rejected = 0;
};

class CacheTier {
public:
    virtual ~CacheTier() = default;

    // Lookup; counts as an access on hit
    virtual std::optional<TierHit> get(const std::string& key) = 0;

    // Insert or replace. False if the entry can never fit or the write failed.
    virtual bool put(const std::string& key, const CachePayload& payload,
                     double importance, const Metadata& metadata = {}) = 0;

    virtual bool erase(const std::string& key) = 0;
    virtual bool contains(const std::string& key) const = 0;
    virtual std::optional<EntryMeta> meta(const std::string& key) const = 0;
    virtual void clear() = 0;

    virtual size_t size() const = 0;
    virtual size_t bytes() const = 0;
    virtual size_t budget() const = 0;
    virtual TierStats stats() const = 0;

    virtual const char* name() const = 0;
};

// Live slot bookkeeping shared by both tiers
struct SlotState {
    size_t byte_size = 0;
    Timestamp created_at = 0;
    std::atomic<Timestamp> last_accessed{0};
    std::atomic<uint64_t> access_count{0};
    std::atomic<uint64_t> sequence{0};
    uint64_t revision = 0;
    double importance = 0.0;
    Metadata metadata;

    void touch(uint64_t seq) {
        last_accessed.store(now(), std::memory_order_relaxed);
        access_count.fetch_add(1, std::memory_order_relaxed);
        sequence.store(seq, std::memory_order_relaxed);
    }

    EntryMeta snapshot() const {
        EntryMeta m;
        m.byte_size = byte_size;
        m.created_at = created_at;
        m.last_accessed = last_accessed.load(std::memory_order_relaxed);
        m.access_count = access_count.load(std::memory_order_relaxed);
        m.sequence = sequence.load(std::memory_order_relaxed);
        m.revision = revision;
        m.importance = importance;
        m.metadata = metadata;
        return m;
    }
};

// Pick the eviction victim: oldest sequence, then fewest accesses
template <typename Map>
typename Map::const_iterator pick_victim(const Map& slots, const std::string& skip) {
    auto victim = slots.end();
    uint64_t best_seq = 0;
    uint64_t best_count = 0;
    for (auto it = slots.begin(); it != slots.end(); ++it) {
        if (it->first == skip) continue;
        const auto& s = *it->second;
        uint64_t seq = s.state.sequence.load(std::memory_order_relaxed);
        uint64_t count = s.state.access_count.load(std::memory_order_relaxed);
        if (victim == slots.end() || seq < best_seq ||
            (seq == best_seq && count < best_count)) {
            victim = it;
            best_seq = seq;
            best_count = count;
        }
    }
    return victim;
}

// ═══════════════════════════════════════════════════════════════════════════
// MemoryTier: fast, volatile
// ═══════════════════════════════════════════════════════════════════════════

class MemoryTier : public CacheTier {
public:
    explicit MemoryTier(size_t budget_bytes) : budget_(budget_bytes) {}

    std::optional<TierHit> get(const std::string& key) override {
        std::shared_lock lock(mutex_);
        auto it = slots_.find(key);
        if (it == slots_.end()) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }
        hits_.fetch_add(1, std::memory_order_relaxed);
        it->second->state.touch(clock_.fetch_add(1) + 1);
        return TierHit{it->second->payload, it->second->state.snapshot()};
    }

    bool put(const std::string& key, const CachePayload& payload,
             double importance, const Metadata& metadata = {}) override {
        size_t needed = payload.byte_size();
        if (needed > budget_) {
            rejected_.fetch_add(1, std::memory_order_relaxed);
            log_debug("MemoryTier", "refused %s: %zu bytes exceeds budget %zu",
                      key.c_str(), needed, budget_);
            return false;
        }

        std::unique_lock lock(mutex_);

        // Replacing frees the old size first
        size_t existing = 0;
        uint64_t prior_accesses = 0;
        Timestamp created = now();
        auto found = slots_.find(key);
        if (found != slots_.end()) {
            existing = found->second->state.byte_size;
            prior_accesses = found->second->state.access_count.load();
            created = found->second->state.created_at;
        }

        while (bytes_ - existing + needed > budget_) {
            auto victim = pick_victim(slots_, key);
            if (victim == slots_.end()) break;
            log_debug("MemoryTier", "evict %s (%zu bytes)", victim->first.c_str(),
                      victim->second->state.byte_size);
            bytes_ -= victim->second->state.byte_size;
            slots_.erase(victim);
            evictions_.fetch_add(1, std::memory_order_relaxed);
        }

        auto slot = std::make_unique<Slot>();
        slot->payload = payload;
        slot->state.byte_size = needed;
        slot->state.created_at = created;
        slot->state.last_accessed.store(now());
        slot->state.access_count.store(prior_accesses);
        uint64_t seq = clock_.fetch_add(1) + 1;
        slot->state.sequence.store(seq);
        slot->state.revision = seq;
        slot->state.importance = importance;
        slot->state.metadata = metadata;

        bytes_ = bytes_ - existing + needed;
        slots_[key] = std::move(slot);
        return true;
    }

    bool erase(const std::string& key) override {
        std::unique_lock lock(mutex_);
        auto it = slots_.find(key);
        if (it == slots_.end()) return false;
        bytes_ -= it->second->state.byte_size;
        slots_.erase(it);
        return true;
    }

    bool contains(const std::string& key) const override {
        std::shared_lock lock(mutex_);
        return slots_.find(key) != slots_.end();
    }

    std::optional<EntryMeta> meta(const std::string& key) const override {
        std::shared_lock lock(mutex_);
        auto it = slots_.find(key);
        if (it == slots_.end()) return std::nullopt;
        return it->second->state.snapshot();
    }

    void clear() override {
        std::unique_lock lock(mutex_);
        slots_.clear();
        bytes_ = 0;
    }

    size_t size() const override {
        std::shared_lock lock(mutex_);
        return slots_.size();
    }

    size_t bytes() const override {
        std::shared_lock lock(mutex_);
        return bytes_;
    }

    size_t budget() const override { return budget_; }

    TierStats stats() const override {
        std::shared_lock lock(mutex_);
        TierStats s;
        s.entries = slots_.size();
        s.bytes = bytes_;
        s.budget = budget_;
        s.hits = hits_.load();
        s.misses = misses_.load();
        s.evictions = evictions_.load();
        s.rejected = rejected_.load();
        return s;
    }

    const char* name() const override { return "memory"; }

private:
    struct Slot {
        CachePayload payload;
        SlotState state;
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<Slot>> slots_;
    size_t bytes_ = 0;
    size_t budget_;

    std::atomic<uint64_t> clock_{0};
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> rejected_{0};
};

} // namespace marga
