#pragma once
// ContextAssembler: token-bounded prompt context
//
// Fragments land in one of three priority buckets. When a new fragment
// does not fit, space is reclaimed from the low bucket first, then medium,
// then high, always dropping the least reliable fragment of the bucket.
// The sum of fragment costs never exceeds max_tokens - reserved_tokens.
//
// finalize() emits the query, then high, medium and low fragments. Which
// path lands in which bucket is a PlacementPolicy decision; the default
// BoundaryPlacement puts the most reliable path last, right before the
// model's answer boundary.

#include "log.hpp"
#include "token_counter.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace marga {

struct ContextBudget {
    size_t max_tokens = 4096;
    size_t reserved_tokens = 512;    // Prompt scaffolding + model response

    size_t limit() const {
        return max_tokens > reserved_tokens ? max_tokens - reserved_tokens : 0;
    }
};

enum class Priority { High = 0, Medium = 1, Low = 2 };

inline const char* priority_name(Priority p) {
    switch (p) {
        case Priority::High:   return "high";
        case Priority::Medium: return "medium";
        case Priority::Low:    return "low";
    }
    return "unknown";
}

struct Fragment {
    std::string text;
    Priority priority = Priority::Medium;
    double reliability = 0.0;
    size_t tokens = 0;
    uint64_t order = 0;   // Insertion order, for stable ties
};

class ContextAssembler {
public:
    explicit ContextAssembler(ContextBudget budget = {},
                              TokenCounter counter = word_token_counter())
        : budget_(budget), counter_(std::move(counter)) {
        if (!counter_) counter_ = word_token_counter();
    }

    // Add a fragment, evicting weaker ones as needed. False when the
    // fragment alone exceeds the budget; it is dropped.
    bool add(const std::string& text, Priority priority, double reliability = 0.0) {
        size_t cost = counter_(text);
        if (cost > budget_.limit()) {
            log_debug("ContextAssembler", "fragment of %zu tokens exceeds budget %zu, dropped",
                      cost, budget_.limit());
            return false;
        }

        for (Priority p : {Priority::Low, Priority::Medium, Priority::High}) {
            while (used_ + cost > budget_.limit() && evict_weakest(p)) {}
            if (used_ + cost <= budget_.limit()) break;
        }
        if (used_ + cost > budget_.limit()) return false;

        Fragment f;
        f.text = text;
        f.priority = priority;
        f.reliability = reliability;
        f.tokens = cost;
        f.order = next_order_++;
        bucket(priority).push_back(std::move(f));
        used_ += cost;
        return true;
    }

    // Query first, then high → medium → low, each bucket strongest first
    std::string finalize(const std::string& query) const {
        std::string out = query;
        for (Priority p : {Priority::High, Priority::Medium, Priority::Low}) {
            for (const auto& f : ordered(p)) {
                if (!out.empty()) out += '\n';
                out += f.text;
            }
        }
        return out;
    }

    std::vector<Fragment> ordered(Priority p) const {
        std::vector<Fragment> out = buckets_[static_cast<size_t>(p)];
        std::stable_sort(out.begin(), out.end(), [](const Fragment& a, const Fragment& b) {
            if (a.reliability != b.reliability) return a.reliability > b.reliability;
            return a.order < b.order;
        });
        return out;
    }

    size_t used_tokens() const { return used_; }
    size_t available_tokens() const { return budget_.limit() - used_; }
    const ContextBudget& budget() const { return budget_; }

    size_t fragment_count() const {
        return buckets_[0].size() + buckets_[1].size() + buckets_[2].size();
    }

    size_t evictions() const { return evictions_; }

    void reset() {
        for (auto& b : buckets_) b.clear();
        used_ = 0;
        evictions_ = 0;
    }

private:
    std::vector<Fragment>& bucket(Priority p) { return buckets_[static_cast<size_t>(p)]; }

    // Drop the least reliable fragment (latest added on ties)
    bool evict_weakest(Priority p) {
        auto& b = bucket(p);
        if (b.empty()) return false;
        auto victim = std::min_element(b.begin(), b.end(),
            [](const Fragment& a, const Fragment& c) {
                if (a.reliability != c.reliability) return a.reliability < c.reliability;
                return a.order > c.order;
            });
        log_debug("ContextAssembler", "evicting %s fragment (reliability %.3f, %zu tokens)",
                  priority_name(p), victim->reliability, victim->tokens);
        used_ -= victim->tokens;
        b.erase(victim);
        ++evictions_;
        return true;
    }

    ContextBudget budget_;
    TokenCounter counter_;
    std::vector<Fragment> buckets_[3];
    size_t used_ = 0;
    size_t evictions_ = 0;
    uint64_t next_order_ = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// Placement policies
// ═══════════════════════════════════════════════════════════════════════════

// Map ranked reliabilities (strongest first) to buckets
class PlacementPolicy {
public:
    virtual ~PlacementPolicy() = default;
    virtual std::vector<Priority> assign(const std::vector<double>& ranked) const = 0;
    virtual const char* name() const = 0;
};

// Strongest path at the end boundary, the next strongest at the start,
// the weakest in the middle:
//   rank 0             → low   (emitted last)
//   ranks 1..ceil(m/2) → high  (emitted first)
//   the rest           → medium
class BoundaryPlacement : public PlacementPolicy {
public:
    std::vector<Priority> assign(const std::vector<double>& ranked) const override {
        std::vector<Priority> out(ranked.size(), Priority::Medium);
        if (ranked.empty()) return out;
        out[0] = Priority::Low;
        size_t rest = ranked.size() - 1;
        size_t high = (rest + 1) / 2;
        for (size_t i = 1; i <= high; ++i) out[i] = Priority::High;
        return out;
    }
    const char* name() const override { return "boundary"; }
};

// Plain rank order: everything high, emitted strongest first
class RankOrderPlacement : public PlacementPolicy {
public:
    std::vector<Priority> assign(const std::vector<double>& ranked) const override {
        return std::vector<Priority>(ranked.size(), Priority::High);
    }
    const char* name() const override { return "rank"; }
};

} // namespace marga
