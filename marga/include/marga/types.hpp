#pragma once
// Core types: nodes, edges and the paths that connect them
//
// A Path is what the graph store hands back for one traversal branch.
// Everything downstream (scoring, caching, context assembly) works on
// paths, never on the graph itself.

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <map>
#include <optional>
#include <string>
#include <vector>

// POSIX headers for atomic file persistence (must be outside namespace)
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

namespace marga {

// Timestamp as Unix millis
using Timestamp = int64_t;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

using Metadata = std::map<std::string, std::string>;

// Node: an entity in the knowledge graph
// Immutable within a graph snapshot; only the graph store writes nodes.
struct Node {
    std::string id;
    std::string type;                        // "entity", "concept", ...
    std::string domain;                      // "ml", "biology", ...
    std::vector<std::string> observations;   // Atomic facts about the node
    std::optional<std::string> embedding;    // Reference into a vector store
    Metadata metadata;

    Node() = default;
    explicit Node(std::string node_id, std::string node_type = "entity",
                  std::string node_domain = "")
        : id(std::move(node_id)), type(std::move(node_type)),
          domain(std::move(node_domain)) {}

    // Display name: explicit "name" metadata wins over the identifier
    const std::string& name() const {
        auto it = metadata.find("name");
        return it != metadata.end() ? it->second : id;
    }

    bool operator==(const Node& o) const {
        return id == o.id && type == o.type && domain == o.domain &&
               observations == o.observations && embedding == o.embedding &&
               metadata == o.metadata;
    }
    bool operator!=(const Node& o) const { return !(*this == o); }
};

// Edge: directed, typed, weighted relation
struct Edge {
    std::string from;
    std::string to;
    std::string relation;          // Active voice: "inhibits", "is_part_of"
    double weight = 1.0;           // Non-negative; primary scoring input
    std::string version;           // Graph version that introduced the edge
    Timestamp created_at = 0;
    Metadata metadata;

    Edge() = default;
    Edge(std::string src, std::string dst, std::string rel, double w = 1.0)
        : from(std::move(src)), to(std::move(dst)), relation(std::move(rel)),
          weight(w < 0.0 ? 0.0 : w) {}

    bool operator==(const Edge& o) const {
        return from == o.from && to == o.to && relation == o.relation &&
               weight == o.weight && version == o.version &&
               created_at == o.created_at && metadata == o.metadata;
    }
    bool operator!=(const Edge& o) const { return !(*this == o); }
};

// Path: vertices[0] is the source; edges[i] joins vertices[i] and vertices[i+1]
struct Path {
    std::vector<Node> vertices;
    std::vector<Edge> edges;

    size_t hop_count() const { return edges.size(); }
    bool empty() const { return vertices.empty(); }

    // A vertex-only path (no edge data) is acceptable; the scorer falls
    // back to a length heuristic for it. Any other count mismatch is not.
    bool well_formed() const {
        if (vertices.empty()) return false;
        if (edges.empty()) return true;
        return edges.size() == vertices.size() - 1;
    }

    // "A>B>C": stable identity used for deterministic tie-breaks
    std::string joined_names() const {
        std::string out;
        for (size_t i = 0; i < vertices.size(); ++i) {
            if (i > 0) out += '>';
            out += vertices[i].name();
        }
        return out;
    }

    // "A -[causes]-> B -[treats]-> C"
    std::string render() const {
        std::string out;
        for (size_t i = 0; i < vertices.size(); ++i) {
            if (i > 0) {
                if (i - 1 < edges.size() && !edges[i - 1].relation.empty()) {
                    out += " -[" + edges[i - 1].relation + "]-> ";
                } else {
                    out += " -> ";
                }
            }
            out += vertices[i].name();
        }
        return out;
    }

    bool operator==(const Path& o) const {
        return vertices == o.vertices && edges == o.edges;
    }
    bool operator!=(const Path& o) const { return !(*this == o); }
};

struct ScoredPath {
    Path path;
    double reliability = 0.0;   // [0,1]
    double decay_rate = 1.0;    // Decay used to produce the score

    bool operator==(const ScoredPath& o) const {
        return path == o.path && reliability == o.reliability &&
               decay_rate == o.decay_rate;
    }
    bool operator!=(const ScoredPath& o) const { return !(*this == o); }
};

// Caller-facing projection of a ScoredPath
struct RankedPath {
    std::string path_text;
    double reliability = 0.0;
};

// Opaque constraints resolved by the graph store, never by the core
struct VersionConstraint {
    std::optional<std::string> version;
    std::optional<Timestamp> as_of;

    bool empty() const { return !version && !as_of; }
};

// ═══════════════════════════════════════════════════════════════════════════
// Utility functions
// ═══════════════════════════════════════════════════════════════════════════

// FNV-1a 64-bit: stable across runs and platforms (std::hash is not)
inline uint64_t fnv1a64(const std::string& data) {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

inline std::string to_hex(uint64_t value) {
    char buf[17];
    snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(value));
    return buf;
}

// ═══════════════════════════════════════════════════════════════════════════
// Atomic file persistence: write temp → fsync → rename → fsync dir
// ═══════════════════════════════════════════════════════════════════════════

// Fsync parent directory for durability
inline bool fsync_dir(const std::string& path) {
    auto slash = path.find_last_of('/');
    std::string dir = (slash == std::string::npos) ? "." : path.substr(0, slash);
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd < 0) return false;
    int rc = ::fsync(dfd);
    ::close(dfd);
    return rc == 0;
}

// Atomic save: write to temp file, fsync, rename to final path
// Writer function takes FILE* and returns true on success
template <typename Writer>
bool safe_save(const std::string& path, Writer&& write_fn) {
    std::string tmp = path + ".tmp." + std::to_string(::getpid());
    FILE* f = ::fopen(tmp.c_str(), "wb");
    if (!f) return false;

    bool ok = write_fn(f);
    if (ok && ::fflush(f) == 0 && ::fsync(::fileno(f)) == 0) {
        ok = true;
    } else {
        ok = false;
    }

    ::fclose(f);
    if (!ok) { ::remove(tmp.c_str()); return false; }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        ::remove(tmp.c_str());
        return false;
    }

    fsync_dir(path);
    return true;
}

// Convenience: atomically replace a file with a string
inline bool safe_save_string(const std::string& path, const std::string& data) {
    return safe_save(path, [&](FILE* f) {
        return data.empty() || ::fwrite(data.data(), 1, data.size(), f) == data.size();
    });
}

} // namespace marga
