#pragma once
// DiskTier: slow, durable cache tier
//
// Layout under the tier directory:
//   index.json          key → {byte_size, created_at, last_accessed,
//                              access_count, sequence, importance, blob, metadata}
//   blobs/<hash>-<seq>.blob   one JSON payload per key
//
// The index is replaced atomically (temp → fsync → rename) on every
// put/erase/eviction, so readers never observe a torn index. Access
// counters ride along with the next rewrite (or flush()).
//
// An unreadable or inconsistent index is a full miss: the tier starts
// empty and the next successful write rebuilds it.

#include "cache_tier.hpp"
#include "log.hpp"
#include "version.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace marga {

constexpr int DISK_INDEX_VERSION = MARGA_CACHE_FORMAT_VERSION;

class DiskTier : public CacheTier {
public:
    DiskTier(std::string dir, size_t budget_bytes)
        : dir_(std::move(dir)), budget_(budget_bytes) {}

    ~DiskTier() override {
        if (access_dirty_.load()) flush();
    }

    DiskTier(const DiskTier&) = delete;
    DiskTier& operator=(const DiskTier&) = delete;

    // Create directories and load the index. False only if the directory
    // cannot be created; a bad index just means an empty tier.
    bool open() {
        std::unique_lock lock(mutex_);
        std::error_code ec;
        std::filesystem::create_directories(blob_dir(), ec);
        if (ec) {
            log_error("DiskTier", "cannot create %s: %s", blob_dir().c_str(),
                      ec.message().c_str());
            return false;
        }
        load_index_locked();
        remove_orphans_locked();
        opened_ = true;
        log_debug("DiskTier", "opened %s: %zu entries, %zu bytes",
                  dir_.c_str(), slots_.size(), bytes_);
        return true;
    }

    bool is_open() const {
        std::shared_lock lock(mutex_);
        return opened_;
    }

    std::optional<TierHit> get(const std::string& key) override {
        std::string bad_blob;
        {
            std::shared_lock lock(mutex_);
            auto it = slots_.find(key);
            if (it == slots_.end()) {
                misses_.fetch_add(1, std::memory_order_relaxed);
                return std::nullopt;
            }

            auto payload = read_blob(it->second->blob);
            if (payload) {
                hits_.fetch_add(1, std::memory_order_relaxed);
                it->second->state.touch(clock_.fetch_add(1) + 1);
                access_dirty_.store(true);
                return TierHit{std::move(*payload), it->second->state.snapshot()};
            }
            bad_blob = it->second->blob;
        }

        log_warn("DiskTier", "blob for %s unreadable, dropping entry", key.c_str());
        erase_if_blob(key, bad_blob);
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    bool put(const std::string& key, const CachePayload& payload,
             double importance, const Metadata& metadata = {}) override {
        // Keys and payloads must survive a JSON round trip byte for byte;
        // text that is not valid UTF-8 cannot, so the entry is refused.
        std::string blob;
        try {
            blob = json(payload).dump();
            json(key).dump();
        } catch (const json::exception& e) {
            rejected_.fetch_add(1, std::memory_order_relaxed);
            log_warn("DiskTier", "refused entry: %s", e.what());
            return false;
        }
        size_t needed = blob.size();
        if (needed > budget_) {
            rejected_.fetch_add(1, std::memory_order_relaxed);
            log_debug("DiskTier", "refused %s: %zu bytes exceeds budget %zu",
                      key.c_str(), needed, budget_);
            return false;
        }

        std::unique_lock lock(mutex_);
        if (!opened_) {
            rejected_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        size_t existing = 0;
        uint64_t prior_accesses = 0;
        Timestamp created = now();
        std::string old_blob;
        auto found = slots_.find(key);
        if (found != slots_.end()) {
            existing = found->second->state.byte_size;
            prior_accesses = found->second->state.access_count.load();
            created = found->second->state.created_at;
            old_blob = found->second->blob;
        }

        while (bytes_ - existing + needed > budget_) {
            auto victim = pick_victim(slots_, key);
            if (victim == slots_.end()) break;
            log_debug("DiskTier", "evict %s (%zu bytes)", victim->first.c_str(),
                      victim->second->state.byte_size);
            bytes_ -= victim->second->state.byte_size;
            remove_blob(victim->second->blob);
            slots_.erase(victim);
            evictions_.fetch_add(1, std::memory_order_relaxed);
        }

        uint64_t seq = clock_.fetch_add(1) + 1;
        std::string blob_name = to_hex(fnv1a64(key)) + "-" + std::to_string(seq) + ".blob";
        if (!safe_save_string(blob_dir() + "/" + blob_name, blob)) {
            log_error("DiskTier", "failed to write blob for %s", key.c_str());
            rejected_.fetch_add(1, std::memory_order_relaxed);
            write_index_locked();  // Evictions above still need recording
            return false;
        }

        auto slot = std::make_unique<Slot>();
        slot->blob = blob_name;
        slot->state.byte_size = needed;
        slot->state.created_at = created;
        slot->state.last_accessed.store(now());
        slot->state.access_count.store(prior_accesses);
        slot->state.sequence.store(seq);
        slot->state.revision = seq;
        slot->state.importance = importance;
        slot->state.metadata = metadata;

        auto previous = std::move(slots_[key]);
        slots_[key] = std::move(slot);
        bytes_ = bytes_ - existing + needed;

        if (!write_index_locked()) {
            // Roll back to the previous entry (or none)
            remove_blob(blob_name);
            bytes_ = bytes_ - needed + existing;
            if (previous) {
                slots_[key] = std::move(previous);
            } else {
                slots_.erase(key);
            }
            rejected_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        if (!old_blob.empty()) remove_blob(old_blob);
        return true;
    }

    bool erase(const std::string& key) override {
        std::unique_lock lock(mutex_);
        auto it = slots_.find(key);
        if (it == slots_.end()) return false;
        bytes_ -= it->second->state.byte_size;
        std::string blob = it->second->blob;
        slots_.erase(it);
        write_index_locked();
        remove_blob(blob);
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
        for (const auto& [key, slot] : slots_) remove_blob(slot->blob);
        slots_.clear();
        bytes_ = 0;
        if (opened_) write_index_locked();
    }

    // Persist access counters gathered since the last rewrite
    bool flush() {
        std::unique_lock lock(mutex_);
        if (!opened_) return false;
        return write_index_locked();
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

    const char* name() const override { return "disk"; }

    const std::string& directory() const { return dir_; }
    std::string index_path() const { return dir_ + "/index.json"; }

private:
    struct Slot {
        std::string blob;
        SlotState state;
    };

    std::string blob_dir() const { return dir_ + "/blobs"; }

    // Drop an entry only if it still points at the given blob; a concurrent
    // put may have replaced it in the meantime.
    void erase_if_blob(const std::string& key, const std::string& blob) {
        std::unique_lock lock(mutex_);
        auto it = slots_.find(key);
        if (it == slots_.end() || it->second->blob != blob) return;
        bytes_ -= it->second->state.byte_size;
        slots_.erase(it);
        write_index_locked();
        remove_blob(blob);
    }

    std::optional<CachePayload> read_blob(const std::string& name) const {
        std::ifstream in(blob_dir() + "/" + name, std::ios::binary);
        if (!in) return std::nullopt;
        try {
            return json::parse(in).get<CachePayload>();
        } catch (const json::exception& e) {
            log_warn("DiskTier", "corrupt blob %s: %s", name.c_str(), e.what());
            return std::nullopt;
        }
    }

    void remove_blob(const std::string& name) const {
        std::error_code ec;
        std::filesystem::remove(blob_dir() + "/" + name, ec);
    }

    bool write_index_locked() {
        json entries = json::object();
        for (const auto& [key, slot] : slots_) {
            EntryMeta m = slot->state.snapshot();
            entries[key] = json{
                {"byte_size", m.byte_size},
                {"created_at", m.created_at},
                {"last_accessed", m.last_accessed},
                {"access_count", m.access_count},
                {"sequence", m.sequence},
                {"revision", m.revision},
                {"importance", m.importance},
                {"blob", slot->blob},
                {"metadata", m.metadata}
            };
        }
        json index{{"version", DISK_INDEX_VERSION}, {"entries", entries}};

        if (!safe_save_string(index_path(), dump_text(index))) {
            log_error("DiskTier", "failed to write %s", index_path().c_str());
            return false;
        }
        access_dirty_.store(false);
        return true;
    }

    void load_index_locked() {
        slots_.clear();
        bytes_ = 0;

        std::ifstream in(index_path());
        if (!in) return;  // Fresh tier

        uint64_t max_seq = 0;
        try {
            json index = json::parse(in);
            if (index.value("version", 0) != DISK_INDEX_VERSION) {
                log_warn("DiskTier", "index version mismatch in %s, starting empty",
                         index_path().c_str());
                return;
            }
            for (const auto& [key, e] : index.at("entries").items()) {
                auto slot = std::make_unique<Slot>();
                slot->blob = e.at("blob").get<std::string>();
                if (!std::filesystem::exists(blob_dir() + "/" + slot->blob)) {
                    log_warn("DiskTier", "index entry %s has no blob, skipping", key.c_str());
                    continue;
                }
                slot->state.byte_size = e.at("byte_size").get<size_t>();
                slot->state.created_at = e.value("created_at", Timestamp{0});
                slot->state.last_accessed.store(e.value("last_accessed", Timestamp{0}));
                slot->state.access_count.store(e.value("access_count", uint64_t{0}));
                uint64_t seq = e.value("sequence", uint64_t{0});
                slot->state.sequence.store(seq);
                slot->state.revision = e.value("revision", seq);
                slot->state.importance = e.value("importance", 0.0);
                slot->state.metadata = e.value("metadata", Metadata{});
                max_seq = std::max({max_seq, seq, slot->state.revision});
                bytes_ += slot->state.byte_size;
                slots_[key] = std::move(slot);
            }
        } catch (const json::exception& e) {
            log_warn("DiskTier", "unreadable index %s (%s), starting empty",
                     index_path().c_str(), e.what());
            slots_.clear();
            bytes_ = 0;
            return;
        }

        clock_.store(max_seq);

        // Budget may have shrunk since the index was written
        while (bytes_ > budget_) {
            auto victim = pick_victim(slots_, std::string());
            if (victim == slots_.end()) break;
            bytes_ -= victim->second->state.byte_size;
            slots_.erase(victim);
        }
    }

    void remove_orphans_locked() {
        std::unordered_map<std::string, bool> live;
        for (const auto& [key, slot] : slots_) live[slot->blob] = true;

        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(blob_dir(), ec)) {
            std::string name = entry.path().filename().string();
            if (live.find(name) == live.end()) {
                std::filesystem::remove(entry.path(), ec);
            }
        }
    }

    std::string dir_;
    size_t budget_;
    bool opened_ = false;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<Slot>> slots_;
    size_t bytes_ = 0;

    std::atomic<uint64_t> clock_{0};
    std::atomic<bool> access_dirty_{false};
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> rejected_{0};
};

} // namespace marga
