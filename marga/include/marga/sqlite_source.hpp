#pragma once
// SqliteGraphSource: traversal against an SQLite graph database
//
// Expected schema:
//   nodes(id TEXT PRIMARY KEY, type TEXT, domain TEXT, observations TEXT)
//   edges(source TEXT, target TEXT, relation TEXT, weight REAL,
//         version TEXT, created_at INTEGER)
//
// observations holds a JSON array of strings (plain text is accepted as a
// single observation). Any database error maps to Unavailable.

#include "graph_source.hpp"
#include "log.hpp"
#include <sqlite3.h>
#include <mutex>
#include <string>
#include <vector>

namespace marga {

// observations column: JSON array, or plain text as a single observation
inline std::vector<std::string> parse_observations(const std::string& raw) {
    if (raw.empty()) return {};
    try {
        json j = json::parse(raw);
        if (j.is_array()) return j.get<std::vector<std::string>>();
    } catch (const json::exception&) {
        // Not JSON
    }
    return {raw};
}

class SqliteGraphSource : public GraphSource {
public:
    explicit SqliteGraphSource(std::string path,
                               size_t max_results = MemoryGraphSource::DEFAULT_MAX_RESULTS)
        : path_(std::move(path)), max_results_(max_results) {}

    ~SqliteGraphSource() override { close(); }

    SqliteGraphSource(const SqliteGraphSource&) = delete;
    SqliteGraphSource& operator=(const SqliteGraphSource&) = delete;

    bool open() {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_locked();
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    TraversalResult traverse(const TraversalRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_ && !open_locked()) {
            return TraversalResult::unavailable("cannot open " + path_);
        }

        std::optional<Node> anchor;
        if (!load_node(request.anchor, anchor)) {
            return TraversalResult::unavailable(sqlite3_errmsg(db_));
        }
        if (!anchor) return TraversalResult::with_paths({});

        sqlite3_stmt* stmt = nullptr;
        const char* sql =
            "SELECT e.source, e.target, e.relation, e.weight, e.version, e.created_at, "
            "n.type, n.domain, n.observations "
            "FROM edges e LEFT JOIN nodes n ON n.id = e.target "
            "WHERE e.source = ? ORDER BY e.rowid";
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            std::string err = sqlite3_errmsg(db_);
            log_error("SqliteGraph", "prepare failed: %s", err.c_str());
            return TraversalResult::unavailable(err);
        }

        std::vector<Path> out;
        Path current;
        current.vertices.push_back(*anchor);
        bool ok = walk(stmt, request, current, out);
        sqlite3_finalize(stmt);

        if (!ok) return TraversalResult::unavailable(sqlite3_errmsg(db_));
        return TraversalResult::with_paths(std::move(out));
    }

    std::string name() const override { return "sqlite:" + path_; }

private:
    bool open_locked() {
        if (db_) return true;
        if (sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
            log_error("SqliteGraph", "cannot open %s: %s", path_.c_str(),
                      db_ ? sqlite3_errmsg(db_) : "out of memory");
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            return false;
        }
        return true;
    }

    static std::string column_text(sqlite3_stmt* stmt, int col) {
        const unsigned char* text = sqlite3_column_text(stmt, col);
        return text ? reinterpret_cast<const char*>(text) : "";
    }

    // Returns false on database error; node stays empty if absent
    bool load_node(const std::string& id, std::optional<Node>& node) {
        sqlite3_stmt* stmt = nullptr;
        const char* sql = "SELECT type, domain, observations FROM nodes WHERE id = ?";
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;
        sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            Node n(id, column_text(stmt, 0), column_text(stmt, 1));
            if (n.type.empty()) n.type = "entity";
            n.observations = parse_observations(column_text(stmt, 2));
            node = std::move(n);
        }
        sqlite3_finalize(stmt);
        return rc == SQLITE_ROW || rc == SQLITE_DONE;
    }

    struct Hop {
        Edge edge;
        Node target;
    };

    bool outgoing(sqlite3_stmt* stmt, const std::string& from, std::vector<Hop>& hops) {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        sqlite3_bind_text(stmt, 1, from.c_str(), -1, SQLITE_TRANSIENT);

        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            Hop hop;
            hop.edge.from = column_text(stmt, 0);
            hop.edge.to = column_text(stmt, 1);
            hop.edge.relation = column_text(stmt, 2);
            hop.edge.weight = sqlite3_column_type(stmt, 3) == SQLITE_NULL
                ? 1.0 : std::max(0.0, sqlite3_column_double(stmt, 3));
            hop.edge.version = column_text(stmt, 4);
            hop.edge.created_at = sqlite3_column_int64(stmt, 5);

            hop.target.id = hop.edge.to;
            hop.target.type = column_text(stmt, 6);
            if (hop.target.type.empty()) hop.target.type = "entity";
            hop.target.domain = column_text(stmt, 7);
            hop.target.observations = parse_observations(column_text(stmt, 8));
            hops.push_back(std::move(hop));
        }
        return rc == SQLITE_DONE;
    }

    bool walk(sqlite3_stmt* stmt, const TraversalRequest& request, Path& current,
              std::vector<Path>& out) {
        if (current.edges.size() >= request.max_depth) return true;

        std::vector<Hop> hops;
        if (!outgoing(stmt, current.vertices.back().id, hops)) return false;

        for (auto& hop : hops) {
            if (out.size() >= max_results_) return true;
            if (!edge_visible(hop.edge, request.constraint)) continue;
            if (request.domain_filter && hop.target.domain != *request.domain_filter) continue;

            bool seen = false;
            for (const auto& v : current.vertices) {
                if (v.id == hop.target.id) { seen = true; break; }
            }
            if (seen) continue;

            current.vertices.push_back(hop.target);
            current.edges.push_back(hop.edge);
            out.push_back(current);
            bool ok = walk(stmt, request, current, out);
            current.edges.pop_back();
            current.vertices.pop_back();
            if (!ok) return false;
        }
        return true;
    }

    std::string path_;
    size_t max_results_;
    std::mutex mutex_;
    sqlite3* db_ = nullptr;
};

} // namespace marga
