#pragma once
// SQLite graph import: nodes/edges tables → MemoryGraphSource
//
// Reads the schema served by SqliteGraphSource. Rows without an id (nodes)
// or without both endpoints (edges) are skipped and counted. Nodes are read
// first so edges attach to fully described endpoints.

#include "graph_source.hpp"
#include "sqlite_source.hpp"
#include <sqlite3.h>
#include <iostream>
#include <string>

namespace marga {

struct ImportStats {
    size_t nodes = 0;
    size_t edges = 0;
    size_t skipped = 0;
    size_t total() const { return nodes + edges; }
};

inline bool table_exists(sqlite3* db, const char* table) {
    const char* sql = "SELECT 1 FROM sqlite_master WHERE type='table' AND name=?";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;
    sqlite3_bind_text(stmt, 1, table, -1, SQLITE_STATIC);
    bool exists = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    return exists;
}

inline std::string import_text_at(sqlite3_stmt* stmt, int col) {
    const char* s = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return s ? s : "";
}

// 0 on success, -1 on a database error
inline int import_nodes(sqlite3* db, MemoryGraphSource& graph, ImportStats& stats,
                        bool verbose, bool dry_run) {
    if (!table_exists(db, "nodes")) {
        if (verbose) std::cerr << "  No nodes table found\n";
        return 0;
    }

    const char* sql = "SELECT id, type, domain, observations FROM nodes";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Error preparing nodes query: " << sqlite3_errmsg(db) << "\n";
        return -1;
    }

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Node node;
        node.id = import_text_at(stmt, 0);
        if (node.id.empty()) {
            stats.skipped++;
            continue;
        }
        node.type = import_text_at(stmt, 1);
        if (node.type.empty()) node.type = "entity";
        node.domain = import_text_at(stmt, 2);
        node.observations = parse_observations(import_text_at(stmt, 3));

        if (verbose && stats.nodes % 1000 == 0) {
            std::cerr << "  Nodes: " << stats.nodes << "...\n";
        }
        if (!dry_run) graph.add_node(std::move(node));
        stats.nodes++;
    }

    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        std::cerr << "Error reading nodes: " << sqlite3_errmsg(db) << "\n";
        return -1;
    }
    return 0;
}

inline int import_edges(sqlite3* db, MemoryGraphSource& graph, ImportStats& stats,
                        bool verbose, bool dry_run) {
    if (!table_exists(db, "edges")) {
        if (verbose) std::cerr << "  No edges table found\n";
        return 0;
    }

    const char* sql =
        "SELECT source, target, relation, weight, version, created_at FROM edges";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Error preparing edges query: " << sqlite3_errmsg(db) << "\n";
        return -1;
    }

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        std::string from = import_text_at(stmt, 0);
        std::string to = import_text_at(stmt, 1);
        if (from.empty() || to.empty()) {
            stats.skipped++;
            continue;
        }
        double weight = sqlite3_column_type(stmt, 3) == SQLITE_NULL
            ? 1.0 : sqlite3_column_double(stmt, 3);

        Edge edge(from, to, import_text_at(stmt, 2), weight);
        edge.version = import_text_at(stmt, 4);
        edge.created_at = sqlite3_column_int64(stmt, 5);

        if (verbose && stats.edges % 1000 == 0) {
            std::cerr << "  Edges: " << stats.edges << "...\n";
        }
        if (!dry_run) graph.add_edge(std::move(edge));
        stats.edges++;
    }

    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        std::cerr << "Error reading edges: " << sqlite3_errmsg(db) << "\n";
        return -1;
    }
    return 0;
}

// Open db_path read-only and import both tables. 0 on success.
inline int import_database(const std::string& db_path, MemoryGraphSource& graph,
                           ImportStats& stats, bool verbose = false, bool dry_run = false) {
    sqlite3* db = nullptr;
    if (sqlite3_open_v2(db_path.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
        std::cerr << "Error opening database: " << (db ? sqlite3_errmsg(db) : "out of memory") << "\n";
        if (db) sqlite3_close(db);
        return -1;
    }

    if (verbose) std::cout << "Importing nodes...\n";
    int rc = import_nodes(db, graph, stats, verbose, dry_run);
    if (rc == 0) {
        if (verbose) std::cout << "Importing edges...\n";
        rc = import_edges(db, graph, stats, verbose, dry_run);
    }

    sqlite3_close(db);
    return rc;
}

} // namespace marga
