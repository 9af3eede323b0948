#pragma once
// GraphSource: the boundary to the graph store
//
// The core never speaks the store's query language. It sends one bounded
// traversal request per query and gets back raw paths, or a failure.
//
// MemoryGraphSource is the in-process reference store: dictionary-encoded
// edges, outbound adjacency lists, and a depth-bounded DFS that
// enumerates every simple path of 1..max_depth hops from the anchor.

#include "types.hpp"
#include "serialize.hpp"
#include "log.hpp"
#include <algorithm>
#include <fstream>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace marga {

struct TraversalRequest {
    std::string anchor;
    size_t max_depth = 3;
    std::optional<std::string> domain_filter;
    VersionConstraint constraint;
};

enum class TraversalStatus { Ok, Unavailable, Timeout };

// Result of one traversal: "zero paths" is Ok, not a failure
struct TraversalResult {
    TraversalStatus status = TraversalStatus::Ok;
    std::vector<Path> paths;
    std::string message;

    bool ok() const { return status == TraversalStatus::Ok; }

    static TraversalResult with_paths(std::vector<Path> p) {
        TraversalResult r;
        r.paths = std::move(p);
        return r;
    }
    static TraversalResult unavailable(std::string msg) {
        TraversalResult r;
        r.status = TraversalStatus::Unavailable;
        r.message = std::move(msg);
        return r;
    }
    static TraversalResult timeout(std::string msg) {
        TraversalResult r;
        r.status = TraversalStatus::Timeout;
        r.message = std::move(msg);
        return r;
    }
};

class GraphSource {
public:
    virtual ~GraphSource() = default;

    // May block. Implementations report failure through the result;
    // an exception escaping here is treated as Unavailable by the caller.
    virtual TraversalResult traverse(const TraversalRequest& request) = 0;

    virtual std::string name() const = 0;
};

// Edge visibility under a version/timestamp constraint.
// Versions compare lexicographically; unversioned edges are always visible.
inline bool edge_visible(const Edge& edge, const VersionConstraint& c) {
    if (c.version && !edge.version.empty() && edge.version > *c.version) return false;
    if (c.as_of && edge.created_at != 0 && edge.created_at > *c.as_of) return false;
    return true;
}

// Dictionary: bidirectional string ↔ index mapping
class Dictionary {
public:
    // Get or create index for string
    uint32_t get_or_create(const std::string& s) {
        auto it = str_to_idx_.find(s);
        if (it != str_to_idx_.end()) return it->second;

        uint32_t idx = static_cast<uint32_t>(idx_to_str_.size());
        idx_to_str_.push_back(s);
        str_to_idx_[s] = idx;
        return idx;
    }

    // Get index (returns -1 if not found)
    int64_t get(const std::string& s) const {
        auto it = str_to_idx_.find(s);
        if (it == str_to_idx_.end()) return -1;
        return static_cast<int64_t>(it->second);
    }

    size_t size() const { return idx_to_str_.size(); }

private:
    std::vector<std::string> idx_to_str_;
    std::unordered_map<std::string, uint32_t> str_to_idx_;
};

class MemoryGraphSource : public GraphSource {
public:
    static constexpr size_t DEFAULT_MAX_RESULTS = 10000;

    explicit MemoryGraphSource(size_t max_results = DEFAULT_MAX_RESULTS)
        : max_results_(max_results) {}

    // Insert or replace a node (thread-safe)
    void add_node(Node node) {
        std::unique_lock lock(mutex_);
        uint32_t idx = ensure_node(node.id);
        nodes_[idx] = std::move(node);
    }

    // Add a directed edge; unknown endpoints become bare nodes (thread-safe)
    void add_edge(Edge edge) {
        std::unique_lock lock(mutex_);
        uint32_t from = ensure_node(edge.from);
        ensure_node(edge.to);
        outgoing_[from].push_back(static_cast<uint32_t>(edges_.size()));
        predicates_.get_or_create(edge.relation);
        edges_.push_back(std::move(edge));
    }

    void add_edge(const std::string& from, const std::string& relation,
                  const std::string& to, double weight = 1.0) {
        add_edge(Edge(from, to, relation, weight));
    }

    TraversalResult traverse(const TraversalRequest& request) override {
        std::shared_lock lock(mutex_);

        int64_t anchor = entities_.get(request.anchor);
        if (anchor < 0) return TraversalResult::with_paths({});

        std::vector<Path> out;
        Path current;
        current.vertices.push_back(nodes_[anchor]);
        std::vector<uint32_t> on_path{static_cast<uint32_t>(anchor)};
        walk(static_cast<uint32_t>(anchor), request, current, on_path, out);

        log_debug("MemoryGraph", "anchor=%s depth=%zu paths=%zu",
                  request.anchor.c_str(), request.max_depth, out.size());
        return TraversalResult::with_paths(std::move(out));
    }

    std::string name() const override { return "memory"; }

    std::optional<Node> node(const std::string& id) const {
        std::shared_lock lock(mutex_);
        int64_t idx = entities_.get(id);
        if (idx < 0) return std::nullopt;
        return nodes_[idx];
    }

    size_t node_count() const {
        std::shared_lock lock(mutex_);
        return nodes_.size();
    }

    size_t edge_count() const {
        std::shared_lock lock(mutex_);
        return edges_.size();
    }

    size_t relation_count() const {
        std::shared_lock lock(mutex_);
        return predicates_.size();
    }

    // Graph snapshot: {"nodes": [...], "edges": [...]}
    json to_json_snapshot() const {
        std::shared_lock lock(mutex_);
        return json{{"nodes", nodes_}, {"edges", edges_}};
    }

    bool load_json(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            log_error("MemoryGraph", "cannot open %s", path.c_str());
            return false;
        }
        try {
            json j = json::parse(in);
            for (const auto& n : j.value("nodes", json::array())) {
                add_node(n.get<Node>());
            }
            for (const auto& e : j.value("edges", json::array())) {
                add_edge(e.get<Edge>());
            }
        } catch (const json::exception& e) {
            log_error("MemoryGraph", "invalid graph file %s: %s", path.c_str(), e.what());
            return false;
        }
        log_debug("MemoryGraph", "loaded %zu nodes, %zu edges from %s",
                  node_count(), edge_count(), path.c_str());
        return true;
    }

    bool save_json(const std::string& path) const {
        return safe_save_string(path, dump_text(to_json_snapshot(), 2) + "\n");
    }

private:
    uint32_t ensure_node(const std::string& id) {
        uint32_t idx = entities_.get_or_create(id);
        if (idx >= nodes_.size()) {
            nodes_.resize(idx + 1);
            nodes_[idx].id = id;
            nodes_[idx].type = "entity";
            outgoing_.resize(idx + 1);
        }
        return idx;
    }

    void walk(uint32_t at, const TraversalRequest& request, Path& current,
              std::vector<uint32_t>& on_path, std::vector<Path>& out) const {
        if (current.edges.size() >= request.max_depth) return;

        for (uint32_t edge_idx : outgoing_[at]) {
            if (out.size() >= max_results_) return;

            const Edge& edge = edges_[edge_idx];
            if (!edge_visible(edge, request.constraint)) continue;

            int64_t next = entities_.get(edge.to);
            if (next < 0) continue;
            uint32_t next_idx = static_cast<uint32_t>(next);

            // Simple paths only
            if (std::find(on_path.begin(), on_path.end(), next_idx) != on_path.end()) continue;

            const Node& target = nodes_[next_idx];
            if (request.domain_filter && target.domain != *request.domain_filter) continue;

            current.vertices.push_back(target);
            current.edges.push_back(edge);
            on_path.push_back(next_idx);

            out.push_back(current);
            walk(next_idx, request, current, on_path, out);

            on_path.pop_back();
            current.edges.pop_back();
            current.vertices.pop_back();
        }
    }

    mutable std::shared_mutex mutex_;

    Dictionary entities_;
    Dictionary predicates_;

    std::vector<Node> nodes_;                       // By entity index
    std::vector<Edge> edges_;
    std::vector<std::vector<uint32_t>> outgoing_;   // Entity index → edge indices

    size_t max_results_;
};

} // namespace marga
