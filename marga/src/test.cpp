#include <marga/marga.hpp>
#include <marga/sqlite_import.hpp>
#include <marga/sqlite_source.hpp>
#include <sqlite3.h>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

using namespace marga;
namespace fs = std::filesystem;

// ═══════════════════════════════════════════════════════════════════════════
// Fixtures
// ═══════════════════════════════════════════════════════════════════════════

// Linear path over ids with one edge weight per hop
Path make_path(const std::vector<std::string>& ids, const std::vector<double>& weights) {
    Path p;
    for (const auto& id : ids) p.vertices.emplace_back(id);
    for (size_t i = 0; i < weights.size() && i + 1 < ids.size(); ++i) {
        p.edges.emplace_back(ids[i], ids[i + 1], "rel", weights[i]);
    }
    return p;
}

bool near(double a, double b, double eps = 1e-9) { return std::abs(a - b) < eps; }

std::string temp_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / name;
    std::error_code ec;
    fs::remove_all(dir, ec);
    return dir.string();
}

// A → B (1.0), B → C (0.5)
std::shared_ptr<MemoryGraphSource> scenario_graph() {
    auto g = std::make_shared<MemoryGraphSource>();
    g->add_edge("A", "binds", "B", 1.0);
    g->add_edge("B", "inhibits", "C", 0.5);
    return g;
}

class CountingSource : public GraphSource {
public:
    explicit CountingSource(std::shared_ptr<GraphSource> inner, int delay_ms = 0)
        : inner_(std::move(inner)), delay_ms_(delay_ms) {}

    TraversalResult traverse(const TraversalRequest& request) override {
        calls.fetch_add(1);
        if (delay_ms_ > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
        return inner_->traverse(request);
    }
    std::string name() const override { return "counting"; }

    std::atomic<int> calls{0};

private:
    std::shared_ptr<GraphSource> inner_;
    int delay_ms_;
};

class FailingSource : public GraphSource {
public:
    TraversalResult traverse(const TraversalRequest&) override {
        calls.fetch_add(1);
        return TraversalResult::unavailable("connection refused");
    }
    std::string name() const override { return "failing"; }

    std::atomic<int> calls{0};
};

class ThrowingSource : public GraphSource {
public:
    TraversalResult traverse(const TraversalRequest&) override {
        throw std::runtime_error("driver exploded");
    }
    std::string name() const override { return "throwing"; }
};

// Returns a fixed set of raw paths regardless of the request
class StaticSource : public GraphSource {
public:
    explicit StaticSource(std::vector<Path> paths) : paths_(std::move(paths)) {}
    TraversalResult traverse(const TraversalRequest&) override {
        return TraversalResult::with_paths(paths_);
    }
    std::string name() const override { return "static"; }

private:
    std::vector<Path> paths_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Path scoring
// ═══════════════════════════════════════════════════════════════════════════

void test_path_scorer_scenario() {
    std::cout << "Testing PathScorer scenario..." << std::endl;

    Path p = make_path({"A", "B", "C"}, {1.0, 0.5});
    assert(near(score_path(p, 0.85), 0.7125));

    PathScorer scorer;
    ScoredPath sp = scorer.scored(p);
    assert(near(sp.reliability, 0.7125));
    assert(sp.decay_rate == 0.85);

    std::cout << "  PASS" << std::endl;
}

void test_path_scorer_edge_cases() {
    std::cout << "Testing PathScorer edge cases..." << std::endl;

    // Single vertex: fixed low constant
    Path single = make_path({"A"}, {});
    assert(near(score_path(single, 0.85), 0.1));
    assert(near(score_path(single, 0.2), 0.1));

    // Vertex-only path: length heuristic
    Path bare = make_path({"A", "B", "C"}, {});
    assert(near(score_path(bare, 0.85), 0.15));

    // Disconnected edge contributes nothing
    Path broken;
    broken.vertices = {Node("A"), Node("B")};
    broken.edges = {Edge("X", "B", "rel", 1.0)};
    assert(near(score_path(broken, 0.85), 0.0));

    // Heavy weights clamp at 1
    Path heavy = make_path({"A", "B", "C"}, {5.0, 5.0});
    double r = score_path(heavy, 0.9);
    assert(r >= 0.0 && r <= 1.0);
    assert(near(r, 1.0));

    assert(near(score_path(Path{}, 0.85), 0.0));

    std::cout << "  PASS" << std::endl;
}

void test_path_scorer_monotonic() {
    std::cout << "Testing PathScorer monotonicity..." << std::endl;

    std::vector<std::string> ids = {"n0", "n1", "n2", "n3", "n4", "n5", "n6", "n7"};

    double prev = 2.0;
    double prev_flat = 2.0;
    for (size_t hops = 1; hops <= 7; ++hops) {
        std::vector<std::string> v(ids.begin(), ids.begin() + hops + 1);
        Path p = make_path(v, std::vector<double>(hops, 1.0));

        double decayed = score_path(p, 0.85);
        assert(decayed < prev);  // Strictly decreasing with length
        prev = decayed;

        double flat = score_path(p, 1.0);
        assert(flat <= prev_flat);
        prev_flat = flat;
    }

    // Lower decay never scores higher
    Path p = make_path({"A", "B", "C", "D"}, {0.9, 0.8, 0.7});
    double last = 2.0;
    for (double decay : {1.0, 0.9, 0.7, 0.5, 0.3, 0.1}) {
        double s = score_path(p, decay);
        assert(s <= last);
        assert(s >= 0.0 && s <= 1.0);
        last = s;
    }

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Retrieval and pruning
// ═══════════════════════════════════════════════════════════════════════════

void test_prune_thresholds() {
    std::cout << "Testing prune thresholds..." << std::endl;

    PathRetriever retriever(nullptr);
    std::vector<Path> candidates = {
        make_path({"A", "B"}, {0.5}),
        make_path({"A", "C"}, {0.9}),
        make_path({"A", "D"}, {0.1}),
        make_path({"A", "E"}, {0.7}),
        make_path({"A", "F"}, {0.3}),
    };

    // Threshold 0: everything survives, re-sorted
    auto all = retriever.prune(candidates, 0.0, 10);
    assert(all.size() == 5);
    for (size_t i = 1; i < all.size(); ++i) {
        assert(all[i - 1].reliability >= all[i].reliability);
    }

    // Threshold 1: nothing scores a perfect 1.0 here
    assert(retriever.prune(candidates, 1.0, 10).empty());

    // max_paths = 2, threshold 0.2
    auto top = retriever.prune(candidates, 0.2, 2);
    assert(top.size() == 2);
    assert(near(top[0].reliability, 0.9));
    assert(near(top[1].reliability, 0.7));

    std::cout << "  PASS" << std::endl;
}

void test_prune_tie_break() {
    std::cout << "Testing prune tie-break..." << std::endl;

    ScorerConfig flat;
    flat.decay_rate = 1.0;
    PathRetriever retriever(nullptr, RetrieverConfig{}, flat);

    std::vector<Path> candidates = {
        make_path({"A", "B", "C"}, {0.5, 1.0}),   // (0.5 + 0.5) / 2 = 0.5, 2 hops
        make_path({"A", "Z"}, {0.5}),              // 0.5, 1 hop
        make_path({"A", "M"}, {0.5}),              // 0.5, 1 hop
    };

    auto ranked = retriever.prune(candidates, 0.0, 10);
    assert(ranked.size() == 3);
    assert(ranked[0].path.joined_names() == "A>M");
    assert(ranked[1].path.joined_names() == "A>Z");
    assert(ranked[2].path.joined_names() == "A>B>C");

    std::cout << "  PASS" << std::endl;
}

void test_prune_drops_malformed() {
    std::cout << "Testing prune drops malformed paths..." << std::endl;

    PathRetriever retriever(nullptr);

    Path malformed;
    malformed.vertices = {Node("A"), Node("B"), Node("C")};
    malformed.edges = {Edge("A", "B", "rel", 1.0)};
    assert(!malformed.well_formed());

    std::vector<Path> candidates = {malformed, Path{}, make_path({"A", "B"}, {0.8})};
    auto kept = retriever.prune(candidates, 0.01, 5);
    assert(kept.size() == 1);
    assert(kept[0].path.joined_names() == "A>B");

    std::cout << "  PASS" << std::endl;
}

void test_memory_graph_traversal() {
    std::cout << "Testing MemoryGraphSource traversal..." << std::endl;

    MemoryGraphSource g;
    g.add_node(Node("A", "entity", "bio"));
    g.add_node(Node("B", "entity", "bio"));
    g.add_node(Node("C", "entity", "chem"));
    g.add_node(Node("D", "entity", "bio"));
    g.add_edge("A", "binds", "B", 1.0);
    g.add_edge("B", "inhibits", "C", 0.5);
    g.add_edge("C", "activates", "A", 0.9);   // Cycle back to the anchor

    Edge late("A", "D", "cites", 0.4);
    late.version = "v2";
    late.created_at = 2000;
    g.add_edge(late);

    assert(g.node_count() == 4);
    assert(g.edge_count() == 4);
    assert(g.relation_count() == 4);

    TraversalRequest req;
    req.anchor = "A";
    req.max_depth = 3;
    auto r = g.traverse(req);
    assert(r.ok());
    assert(r.paths.size() == 3);   // A-B, A-B-C, A-D; the cycle is not followed
    for (const auto& p : r.paths) {
        assert(p.well_formed());
        assert(p.vertices.front().id == "A");
    }

    req.max_depth = 1;
    assert(g.traverse(req).paths.size() == 2);

    req.max_depth = 3;
    req.domain_filter = "bio";
    assert(g.traverse(req).paths.size() == 2);   // A-B, A-D
    req.domain_filter.reset();

    req.constraint.version = "v1";
    assert(g.traverse(req).paths.size() == 2);   // A-D hidden
    req.constraint = VersionConstraint{};
    req.constraint.as_of = 1000;
    assert(g.traverse(req).paths.size() == 2);

    req = TraversalRequest{};
    req.anchor = "nowhere";
    auto none = g.traverse(req);
    assert(none.ok());
    assert(none.paths.empty());
    assert(!g.node("nowhere").has_value());

    Dictionary dict;
    assert(dict.get_or_create("A") == 0);
    assert(dict.get("A") == 0);
    assert(dict.get("missing") == -1);

    std::cout << "  PASS" << std::endl;
}

void test_graph_snapshot() {
    std::cout << "Testing graph snapshot save/load..." << std::endl;

    std::string dir = temp_dir("marga_test_snapshot");
    fs::create_directories(dir);
    std::string file = dir + "/graph.json";

    auto g = scenario_graph();
    Node named("A");
    named.metadata["name"] = "Aspirin";
    named.observations = {"analgesic"};
    g->add_node(named);
    assert(g->save_json(file));

    MemoryGraphSource loaded;
    assert(loaded.load_json(file));
    assert(loaded.node_count() == 3);
    assert(loaded.edge_count() == 2);
    auto a = loaded.node("A");
    assert(a.has_value());
    assert(a->name() == "Aspirin");
    assert(a->observations.size() == 1);

    TraversalRequest req;
    req.anchor = "A";
    auto r = loaded.traverse(req);
    assert(r.paths.size() == 2);
    assert(r.paths[1].render() == "Aspirin -[binds]-> B -[inhibits]-> C");

    {
        std::ofstream bad(dir + "/bad.json");
        bad << "{\"nodes\": [";
    }
    // Invalid UTF-8 in store text is written with replacement characters
    MemoryGraphSource latin1;
    latin1.add_edge("caf\xe9", "serves", "B", 1.0);
    assert(latin1.save_json(dir + "/latin1.json"));
    MemoryGraphSource reread;
    assert(reread.load_json(dir + "/latin1.json"));
    assert(reread.edge_count() == 1);

    MemoryGraphSource broken;
    assert(!broken.load_json(dir + "/bad.json"));
    assert(!broken.load_json(dir + "/missing.json"));

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_retriever_failures() {
    std::cout << "Testing PathRetriever failure modes..." << std::endl;

    PathRetriever failing(std::make_shared<FailingSource>());
    auto r1 = failing.retrieve_candidates("A");
    assert(r1.status == TraversalStatus::Unavailable);

    PathRetriever throwing(std::make_shared<ThrowingSource>());
    auto r2 = throwing.retrieve_candidates("A");
    assert(r2.status == TraversalStatus::Unavailable);
    assert(r2.message == "driver exploded");

    auto slow = std::make_shared<CountingSource>(scenario_graph(), 300);
    PathRetriever retriever(slow);
    auto r3 = retriever.retrieve_candidates("A", 3, std::nullopt, {}, 20);
    assert(r3.status == TraversalStatus::Timeout);

    // Depth is clamped into [1,7]
    PathRetriever plain(scenario_graph());
    auto r4 = plain.retrieve_candidates("A", 0, std::nullopt, {});
    assert(r4.ok());
    assert(r4.paths.size() == 1);
    auto r5 = plain.retrieve_candidates("A", 50, std::nullopt, {}, 1000);
    assert(r5.ok());
    assert(r5.paths.size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_retriever_worker_cap() {
    std::cout << "Testing PathRetriever worker cap..." << std::endl;

    auto slow = std::make_shared<CountingSource>(scenario_graph(), 300);
    RetrieverConfig config;
    config.max_workers = 2;
    PathRetriever retriever(slow, config);

    auto r1 = retriever.retrieve_candidates("A", 3, std::nullopt, {}, 10);
    auto r2 = retriever.retrieve_candidates("A", 3, std::nullopt, {}, 10);
    assert(r1.status == TraversalStatus::Timeout);
    assert(r2.status == TraversalStatus::Timeout);
    assert(retriever.running_workers() == 2);

    // Both timed-out traversals still hold their slots
    auto r3 = retriever.retrieve_candidates("A", 3, std::nullopt, {}, 10);
    assert(r3.status == TraversalStatus::Unavailable);

    for (int i = 0; i < 200 && retriever.running_workers() > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(retriever.running_workers() == 0);
    assert(slow->calls == 2);

    auto r4 = retriever.retrieve_candidates("A", 3, std::nullopt, {}, 2000);
    assert(r4.ok());
    assert(r4.paths.size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_sqlite_source() {
    std::cout << "Testing SqliteGraphSource..." << std::endl;

    std::string dir = temp_dir("marga_test_sqlite");
    fs::create_directories(dir);
    std::string path = dir + "/graph.db";

    sqlite3* db = nullptr;
    assert(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
    const char* schema =
        "CREATE TABLE nodes(id TEXT PRIMARY KEY, type TEXT, domain TEXT, observations TEXT);"
        "CREATE TABLE edges(source TEXT, target TEXT, relation TEXT, weight REAL,"
        "                   version TEXT, created_at INTEGER);"
        "INSERT INTO nodes VALUES('A', 'drug', 'bio', '[\"first\", \"second\"]');"
        "INSERT INTO nodes VALUES('B', 'protein', 'bio', 'plain text');"
        "INSERT INTO nodes VALUES('C', 'compound', 'chem', NULL);"
        "INSERT INTO edges VALUES('A', 'B', 'binds', 1.0, 'v1', 100);"
        "INSERT INTO edges VALUES('B', 'C', 'inhibits', 0.5, 'v2', 200);";
    char* err = nullptr;
    int rc = sqlite3_exec(db, schema, nullptr, nullptr, &err);
    if (err) sqlite3_free(err);
    assert(rc == SQLITE_OK);
    sqlite3_close(db);

    SqliteGraphSource source(path);
    assert(source.open());

    TraversalRequest req;
    req.anchor = "A";
    req.max_depth = 3;
    auto r = source.traverse(req);
    assert(r.ok());
    assert(r.paths.size() == 2);
    assert(r.paths[0].vertices[0].observations.size() == 2);
    assert(r.paths[0].vertices[1].observations.size() == 1);
    assert(r.paths[0].vertices[1].observations[0] == "plain text");
    assert(r.paths[1].render() == "A -[binds]-> B -[inhibits]-> C");
    assert(near(score_path(r.paths[1], 0.85), 0.7125));

    req.domain_filter = "bio";
    assert(source.traverse(req).paths.size() == 1);
    req.domain_filter.reset();

    req.constraint.version = "v1";
    assert(source.traverse(req).paths.size() == 1);
    req.constraint = VersionConstraint{};
    req.constraint.as_of = 150;
    assert(source.traverse(req).paths.size() == 1);

    req = TraversalRequest{};
    req.anchor = "missing";
    auto none = source.traverse(req);
    assert(none.ok() && none.paths.empty());

    SqliteGraphSource absent(dir + "/no/such/dir/graph.db");
    req.anchor = "A";
    assert(absent.traverse(req).status == TraversalStatus::Unavailable);

    source.close();
    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_sqlite_import() {
    std::cout << "Testing SQLite import..." << std::endl;

    std::string dir = temp_dir("marga_test_import");
    fs::create_directories(dir);
    std::string path = dir + "/graph.db";

    sqlite3* db = nullptr;
    assert(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
    const char* schema =
        "CREATE TABLE nodes(id TEXT PRIMARY KEY, type TEXT, domain TEXT, observations TEXT);"
        "CREATE TABLE edges(source TEXT, target TEXT, relation TEXT, weight REAL,"
        "                   version TEXT, created_at INTEGER);"
        "INSERT INTO nodes VALUES('A', 'drug', 'bio', '[\"first\"]');"
        "INSERT INTO nodes VALUES('B', NULL, 'bio', NULL);"
        "INSERT INTO nodes VALUES('', 'ghost', 'bio', NULL);"
        "INSERT INTO edges VALUES('A', 'B', 'binds', 0.9, 'v1', 100);"
        "INSERT INTO edges VALUES('B', 'C', 'inhibits', NULL, NULL, NULL);"
        "INSERT INTO edges VALUES('', 'B', 'orphan', 1.0, NULL, NULL);";
    char* err = nullptr;
    int rc = sqlite3_exec(db, schema, nullptr, nullptr, &err);
    if (err) sqlite3_free(err);
    assert(rc == SQLITE_OK);
    sqlite3_close(db);

    MemoryGraphSource graph;
    ImportStats stats;
    assert(import_database(path, graph, stats) == 0);
    assert(stats.nodes == 2);
    assert(stats.edges == 2);
    assert(stats.skipped == 2);
    assert(stats.total() == 4);
    assert(graph.node_count() == 3);   // C arrives as a bare edge endpoint
    assert(graph.node("B")->type == "entity");

    std::string file = dir + "/graph.json";
    assert(graph.save_json(file));

    MemoryGraphSource loaded;
    assert(loaded.load_json(file));
    assert(loaded.node_count() == 3);
    assert(loaded.edge_count() == 2);
    auto a = loaded.node("A");
    assert(a.has_value());
    assert(a->domain == "bio");
    assert(a->observations == std::vector<std::string>{"first"});

    TraversalRequest req;
    req.anchor = "A";
    auto r = loaded.traverse(req);
    assert(r.paths.size() == 2);
    assert(r.paths[1].render() == "A -[binds]-> B -[inhibits]-> C");
    assert(r.paths[1].edges[0].version == "v1");
    assert(r.paths[1].edges[0].created_at == 100);
    assert(r.paths[1].edges[1].weight == 1.0);   // NULL weight defaults to 1

    // Dry run counts without building anything
    MemoryGraphSource untouched;
    ImportStats dry;
    assert(import_database(path, untouched, dry, false, true) == 0);
    assert(dry.nodes == 2 && dry.edges == 2 && dry.skipped == 2);
    assert(untouched.node_count() == 0);

    MemoryGraphSource nothing;
    ImportStats none;
    assert(import_database(dir + "/no/such/graph.db", nothing, none) != 0);

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Cache tiers
// ═══════════════════════════════════════════════════════════════════════════

CachePayload text_payload(char fill, size_t n = 100) {
    return CachePayload::of_text(std::string(n, fill));
}

CachePayload scenario_payload() {
    PathScorer scorer;
    return CachePayload::of_paths({scorer.scored(make_path({"A", "B", "C"}, {1.0, 0.5})),
                                   scorer.scored(make_path({"A", "B"}, {1.0}))});
}

void test_memory_tier() {
    std::cout << "Testing MemoryTier..." << std::endl;

    size_t entry = text_payload('a').byte_size();
    MemoryTier tier(3 * entry);

    // Round trip
    assert(tier.put("a", text_payload('a'), 0.5));
    auto hit = tier.get("a");
    assert(hit.has_value());
    assert(hit->payload == text_payload('a'));
    assert(hit->meta.access_count == 1);

    assert(tier.put("b", text_payload('b'), 0.5));
    assert(tier.put("c", text_payload('c'), 0.5));
    assert(tier.bytes() == 3 * entry);

    // Touch "a" so "b" is the least recently used
    assert(tier.get("a").has_value());
    assert(tier.put("d", text_payload('d'), 0.5));
    assert(tier.contains("a"));
    assert(!tier.contains("b"));
    assert(tier.contains("c"));
    assert(tier.bytes() <= tier.budget());
    assert(tier.stats().evictions == 1);

    // Larger than the whole budget: refused, nothing evicted
    assert(!tier.put("huge", text_payload('h', 4 * entry), 0.9));
    assert(tier.size() == 3);
    assert(tier.stats().rejected == 1);

    // Replacing keeps the byte count exact
    assert(tier.put("c", text_payload('C'), 0.5));
    assert(tier.bytes() == 3 * entry);

    for (int i = 0; i < 50; ++i) {
        assert(tier.put("k" + std::to_string(i), text_payload('x', 20 + i), 0.5));
        assert(tier.bytes() <= tier.budget());
    }

    assert(tier.erase("k49"));
    assert(!tier.erase("k49"));
    tier.clear();
    assert(tier.size() == 0 && tier.bytes() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_disk_tier_persistence() {
    std::cout << "Testing DiskTier persistence..." << std::endl;

    std::string dir = temp_dir("marga_test_disk");
    CachePayload paths = scenario_payload();

    {
        DiskTier tier(dir, 1 << 20);
        assert(tier.open());
        assert(tier.put("paths", paths, 0.7, {{"query", "A"}}));
        assert(tier.put("text", text_payload('t'), 0.2));
        assert(tier.get("paths").has_value());
        assert(tier.get("paths").has_value());
        assert(tier.flush());
    }

    {
        DiskTier tier(dir, 1 << 20);
        assert(tier.open());
        assert(tier.size() == 2);
        auto meta = tier.meta("paths");
        assert(meta.has_value());
        assert(meta->access_count == 2);
        assert(meta->metadata.at("query") == "A");
        assert(near(meta->importance, 0.7));

        auto hit = tier.get("paths");
        assert(hit.has_value());
        assert(hit->payload == paths);
        assert(near(hit->payload.paths[0].reliability, 0.7125));
    }

    // Stray blobs are cleaned up on open
    {
        std::ofstream stray(dir + "/blobs/stray.blob");
        stray << "{}";
    }
    {
        DiskTier tier(dir, 1 << 20);
        assert(tier.open());
        assert(!fs::exists(dir + "/blobs/stray.blob"));
        assert(tier.size() == 2);
    }

    // A missing blob drops only its entry
    {
        std::ifstream index(dir + "/index.json");
        json j = json::parse(index);
        std::string text_blob = j.at("entries").at("text").at("blob").get<std::string>();
        fs::remove(dir + "/blobs/" + text_blob);
    }
    {
        DiskTier tier(dir, 1 << 20);
        assert(tier.open());
        assert(tier.size() == 1);
        assert(tier.contains("paths"));
        assert(!tier.contains("text"));
    }

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_disk_tier_corruption() {
    std::cout << "Testing DiskTier corrupt index..." << std::endl;

    std::string dir = temp_dir("marga_test_corrupt");
    {
        DiskTier tier(dir, 1 << 20);
        assert(tier.open());
        assert(tier.put("a", text_payload('a'), 0.5));
    }
    {
        std::ofstream index(dir + "/index.json", std::ios::trunc);
        index << "{\"version\": 1, \"entries\": {\"a\": ";
    }
    {
        // Unreadable index is a full miss, never a crash
        DiskTier tier(dir, 1 << 20);
        assert(tier.open());
        assert(tier.size() == 0);
        assert(!tier.get("a").has_value());

        // Next write rebuilds it
        assert(tier.put("b", text_payload('b'), 0.5));
    }
    {
        DiskTier tier(dir, 1 << 20);
        assert(tier.open());
        assert(tier.size() == 1);
        assert(tier.get("b").has_value());
    }
    {
        std::ofstream index(dir + "/index.json", std::ios::trunc);
        index << "{\"version\": 99, \"entries\": {}}";
    }
    {
        DiskTier tier(dir, 1 << 20);
        assert(tier.open());
        assert(tier.size() == 0);
    }

    // Byte budget holds on disk too
    {
        size_t entry = json(text_payload('x')).dump().size();
        DiskTier tier(dir + "/small", 2 * entry);
        assert(tier.open());
        assert(tier.put("x1", text_payload('x'), 0.5));
        assert(tier.put("x2", text_payload('y'), 0.5));
        assert(tier.put("x3", text_payload('z'), 0.5));
        assert(tier.size() == 2);
        assert(!tier.contains("x1"));
        assert(tier.bytes() <= tier.budget());
        assert(!tier.put("big", text_payload('b', 3 * entry), 0.5));
    }

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Importance and tiered cache
// ═══════════════════════════════════════════════════════════════════════════

void test_disk_tier_invalid_text() {
    std::cout << "Testing DiskTier with invalid UTF-8..." << std::endl;

    std::string dir = temp_dir("marga_test_latin1_tier");
    {
        DiskTier tier(dir, 1 << 20);
        assert(tier.open());

        // Latin-1 bytes cannot round-trip through a JSON blob: refused, no throw
        assert(!tier.put("latin1", CachePayload::of_text("caf\xe9"), 0.5));
        assert(!tier.contains("latin1"));
        assert(!tier.put("caf\xe9", text_payload('x'), 0.5));
        assert(tier.stats().rejected == 2);
        assert(tier.size() == 0);

        // Metadata is informational and is stored with replacement characters
        Metadata meta;
        meta["query"] = "caf\xe9";
        assert(tier.put("ok", text_payload('x'), 0.5, meta));
    }
    {
        DiskTier tier(dir, 1 << 20);
        assert(tier.open());
        assert(tier.size() == 1);
        assert(tier.get("ok")->payload == text_payload('x'));
        assert(tier.meta("ok")->metadata.at("query") != "caf\xe9");
    }

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_importance() {
    std::cout << "Testing HeuristicImportance..." << std::endl;

    HeuristicImportance scorer;

    // Every signal neutral except richness (0)
    ImportanceInput neutral;
    assert(near(scorer.score(neutral), 0.4));

    Timestamp t = now();
    ImportanceInput rich;
    rich.now = t;
    rich.data_timestamp = t;
    rich.confidence = 1.0;
    rich.vertex_count = 6;
    rich.edge_count = 5;
    rich.text = "Aspirin -[binds]-> COX1";
    rich.recent_queries = {"aspirin"};
    assert(near(scorer.score(rich), 1.0));

    ImportanceInput old = rich;
    old.data_timestamp = t - 70LL * 86400000LL;
    assert(scorer.score(old) < scorer.score(rich));
    assert(near(scorer.recency(old), std::exp(-10 * 0.693), 1e-6));

    ImportanceInput half = rich;
    half.recent_queries = {"ASPIRIN", "ibuprofen"};
    assert(near(scorer.relevance(half), 0.5));

    ImportanceConfig zero;
    zero.recency_weight = zero.confidence_weight = zero.richness_weight = zero.relevance_weight = 0;
    assert(HeuristicImportance(zero).score(rich) == 0.0);

    std::cout << "  PASS" << std::endl;
}

void test_tiered_cache_placement() {
    std::cout << "Testing TieredCache placement..." << std::endl;

    TieredCache cache;
    assert(cache.open());

    CachePayload p = scenario_payload();
    assert(cache.put("hot", p, 0.9));
    assert(cache.tier_of("hot") == CacheTierKind::Fast);
    assert(cache.slow_tier().contains("hot"));   // Always persisted

    assert(cache.put("cold", p, 0.1));
    assert(cache.tier_of("cold") == CacheTierKind::Slow);

    assert(cache.tier_of("absent") == CacheTierKind::None);
    assert(!cache.get("absent").has_value());

    // Round trip before any eviction pressure
    auto got = cache.get("cold");
    assert(got.has_value());
    assert(*got == p);

    // A re-put of a fast entry refreshes the fast copy too
    CachePayload q = text_payload('q');
    assert(cache.put("hot", q, 0.1));
    assert(cache.tier_of("hot") == CacheTierKind::Fast);
    assert(*cache.get("hot") == q);

    assert(cache.erase("hot"));
    assert(!cache.contains("hot"));
    cache.clear();
    assert(!cache.contains("cold"));

    CacheStats s = cache.stats();
    assert(s.misses >= 1);
    assert(s.rejected_writes == 0);

    std::cout << "  PASS" << std::endl;
}

void test_tiered_cache_promotion() {
    std::cout << "Testing TieredCache promotion..." << std::endl;

    TieredCache cache;
    CachePayload p = text_payload('p', 10);
    assert(cache.put("k", p, 0.1));
    assert(cache.tier_of("k") == CacheTierKind::Slow);

    // Five reads stay in the slow tier; the sixth crosses the threshold
    for (int i = 0; i < 5; ++i) {
        assert(cache.get("k").has_value());
        assert(cache.tier_of("k") == CacheTierKind::Slow);
    }
    assert(cache.get("k").has_value());
    assert(cache.tier_of("k") == CacheTierKind::Fast);
    assert(cache.stats().promotions == 1);

    // Promoting a fast entry is a no-op
    assert(cache.promote("k"));
    assert(cache.promote("k"));
    assert(cache.stats().promotions == 1);
    assert(cache.tier_of("k") == CacheTierKind::Fast);
    assert(*cache.get("k") == p);

    // Explicit promotion of a slow entry
    assert(cache.put("m", p, 0.1));
    assert(cache.promote("m"));
    assert(cache.tier_of("m") == CacheTierKind::Fast);
    assert(cache.stats().promotions == 2);

    assert(!cache.promote("missing"));

    std::cout << "  PASS" << std::endl;
}

// Scores every hit as important, but the first time it is asked it also
// starts a writer that replaces "k" while the hit is being scored
class ReplacingImportance : public ImportanceScorer {
public:
    double score(const ImportanceInput&) const override {
        if (cache && !fired.exchange(true)) {
            writer = std::thread([c = cache, p = replacement]() { c->put("k", p, 0.1); });
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return 0.9;
    }

    TieredCache* cache = nullptr;
    CachePayload replacement;
    mutable std::atomic<bool> fired{false};
    mutable std::thread writer;
};

void test_tiered_cache_promotion_race() {
    std::cout << "Testing TieredCache promotion against a concurrent put..." << std::endl;

    CachePayload before = text_payload('o');
    CachePayload after = text_payload('n');

    for (int round = 0; round < 10; ++round) {
        auto scorer = std::make_unique<ReplacingImportance>();
        ReplacingImportance* replacing = scorer.get();
        TieredCache cache(CacheConfig{}, std::move(scorer));
        replacing->cache = &cache;
        replacing->replacement = after;

        assert(cache.put("k", before, 0.1));
        assert(cache.tier_of("k") == CacheTierKind::Slow);

        // The read itself happened before the replacement
        auto first = cache.get("k");
        replacing->writer.join();
        assert(first.has_value() && *first == before);

        // Whatever was promoted, the replacement is what every later read sees
        for (int i = 0; i < 3; ++i) {
            auto again = cache.get("k");
            assert(again.has_value() && *again == after);
        }
        assert(cache.tier_of("k") == CacheTierKind::Fast);
    }

    std::cout << "  PASS" << std::endl;
}

void test_tiered_cache_budget() {
    std::cout << "Testing TieredCache byte budgets..." << std::endl;

    size_t entry = text_payload('a').byte_size();
    CacheConfig config;
    config.fast_budget_bytes = 3 * entry;
    config.slow_budget_bytes = 8 * entry;
    TieredCache cache(config);

    for (int i = 0; i < 20; ++i) {
        assert(cache.put("k" + std::to_string(i), text_payload('a' + i % 26), 0.95));
        CacheStats s = cache.stats();
        assert(s.fast.bytes <= s.fast.budget);
        assert(s.slow.bytes <= s.slow.budget);
    }
    assert(cache.stats().fast.entries == 3);
    assert(cache.stats().slow.entries == 8);

    // Too large for either tier: best-effort write declined
    assert(!cache.put("huge", text_payload('h', 10 * entry), 0.95));
    assert(cache.stats().rejected_writes == 1);
    assert(!cache.contains("huge"));

    // Too large for the fast tier only: still cached in the slow tier
    assert(cache.put("wide", text_payload('w', 4 * entry), 0.95));
    assert(cache.tier_of("wide") == CacheTierKind::Slow);

    std::cout << "  PASS" << std::endl;
}

void test_tiered_cache_durable() {
    std::cout << "Testing TieredCache on disk..." << std::endl;

    std::string dir = temp_dir("marga_test_tiered");
    CacheConfig config;
    config.slow_dir = dir;
    CachePayload p = scenario_payload();

    {
        TieredCache cache(config);
        assert(cache.open());
        assert(cache.put("k", p, 0.9));
        assert(cache.tier_of("k") == CacheTierKind::Fast);
    }
    {
        // Fast tier is gone after restart; the slow tier still has it
        TieredCache cache(config);
        assert(cache.open());
        assert(cache.tier_of("k") == CacheTierKind::Slow);
        auto got = cache.get("k");
        assert(got.has_value());
        assert(*got == p);
    }

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_tiered_cache_concurrency() {
    std::cout << "Testing TieredCache concurrent access..." << std::endl;

    CacheConfig config;
    config.fast_budget_bytes = 16 * text_payload('a').byte_size();
    TieredCache cache(config);

    std::vector<std::thread> threads;
    std::atomic<int> mismatches{0};
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, &mismatches, t]() {
            for (int i = 0; i < 200; ++i) {
                std::string key = "k" + std::to_string(i % 32);
                char fill = static_cast<char>('a' + (i % 32) % 26);
                if ((i + t) % 3 == 0) {
                    cache.put(key, text_payload(fill), (i % 2) ? 0.9 : 0.1);
                } else if (auto got = cache.get(key)) {
                    if (got->text != std::string(100, fill)) mismatches.fetch_add(1);
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    assert(mismatches.load() == 0);
    CacheStats s = cache.stats();
    assert(s.fast.bytes <= s.fast.budget);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Context assembly
// ═══════════════════════════════════════════════════════════════════════════

void test_token_counter() {
    std::cout << "Testing word token counter..." << std::endl;

    TokenCounter counter = word_token_counter();
    assert(counter("") == 0);
    assert(counter("   ") == 0);
    assert(counter("a b c") == 4);                          // ceil(3.9)
    assert(counter("one two three four five six seven eight nine ten") == 13);
    assert(counter("A -[binds]-> B") == 4);

    TokenCounter words = word_token_counter(1.0);
    assert(words("x\ty\nz") == 3);

    std::cout << "  PASS" << std::endl;
}

std::string words(const std::string& tag, size_t n) {
    std::string out;
    for (size_t i = 0; i < n; ++i) {
        if (i) out += ' ';
        out += tag;
    }
    return out;
}

void test_context_assembler_budget() {
    std::cout << "Testing ContextAssembler budget..." << std::endl;

    ContextBudget budget;
    budget.max_tokens = 20;
    budget.reserved_tokens = 5;
    ContextAssembler ctx(budget, word_token_counter(1.0));
    assert(ctx.available_tokens() == 15);

    assert(ctx.add(words("l1", 5), Priority::Low, 0.2));
    assert(ctx.add(words("m1", 5), Priority::Medium, 0.5));
    assert(ctx.add(words("h1", 5), Priority::High, 0.8));
    assert(ctx.used_tokens() == 15);
    assert(ctx.available_tokens() == 0);

    // Low goes first
    assert(ctx.add(words("h2", 5), Priority::High, 0.9));
    assert(ctx.used_tokens() == 15);
    assert(ctx.finalize("").find("l1") == std::string::npos);

    // Then medium
    assert(ctx.add(words("h3", 5), Priority::High, 0.95));
    assert(ctx.finalize("").find("m1") == std::string::npos);

    // High only as a last resort, weakest first
    assert(ctx.add(words("h4", 5), Priority::High, 0.99));
    std::string out = ctx.finalize("Q");
    assert(out.find("h1") == std::string::npos);
    assert(out == "Q\n" + words("h4", 5) + "\n" + words("h3", 5) + "\n" + words("h2", 5));
    assert(ctx.used_tokens() <= budget.limit());
    assert(ctx.evictions() == 3);

    // Bigger than the whole budget: dropped, nothing evicted
    assert(!ctx.add(words("big", 16), Priority::High, 1.0));
    assert(ctx.fragment_count() == 3);

    ctx.reset();
    assert(ctx.used_tokens() == 0);
    assert(ctx.finalize("Q") == "Q");

    std::cout << "  PASS" << std::endl;
}

void test_context_assembler_ordering() {
    std::cout << "Testing ContextAssembler ordering..." << std::endl;

    ContextAssembler ctx(ContextBudget{}, word_token_counter());
    assert(ctx.add("low-weak", Priority::Low, 0.1));
    assert(ctx.add("medium", Priority::Medium, 0.5));
    assert(ctx.add("high-b", Priority::High, 0.6));
    assert(ctx.add("high-a", Priority::High, 0.7));
    assert(ctx.add("low-strong", Priority::Low, 0.9));
    assert(ctx.add("high-tie", Priority::High, 0.6));

    std::string out = ctx.finalize("Query: X");
    assert(out == "Query: X\nhigh-a\nhigh-b\nhigh-tie\nmedium\nlow-strong\nlow-weak");

    std::cout << "  PASS" << std::endl;
}

void test_boundary_placement() {
    std::cout << "Testing BoundaryPlacement..." << std::endl;

    BoundaryPlacement policy;
    assert(policy.assign({}).empty());
    assert(policy.assign({0.9}) == std::vector<Priority>{Priority::Low});
    assert((policy.assign({0.9, 0.5}) == std::vector<Priority>{Priority::Low, Priority::High}));

    auto five = policy.assign({0.9, 0.7, 0.5, 0.3, 0.1});
    std::vector<Priority> expected = {Priority::Low, Priority::High, Priority::High,
                                      Priority::Medium, Priority::Medium};
    assert(five == expected);

    RankOrderPlacement rank;
    auto all_high = rank.assign({0.9, 0.7});
    assert(all_high.size() == 2 && all_high[0] == Priority::High && all_high[1] == Priority::High);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Orchestrator
// ═══════════════════════════════════════════════════════════════════════════

void test_orchestrator_cache_hit() {
    std::cout << "Testing Orchestrator cache hit..." << std::endl;

    auto source = std::make_shared<CountingSource>(scenario_graph());
    Orchestrator orch(source);
    assert(orch.open());

    AnswerRequest req;
    req.anchor = "A";
    req.max_depth = 3;

    AnswerResult first = orch.answer_context(req);
    assert(first.ok());
    assert(!first.from_cache);
    assert(first.paths.size() == 2);
    assert(near(first.paths[0].reliability, 1.0));
    assert(near(first.paths[1].reliability, 0.7125));
    assert(first.ranked[1].path_text == "A -[binds]-> B -[inhibits]-> C");

    AnswerResult second = orch.answer_context(req);
    assert(second.ok());
    assert(second.from_cache);
    assert(second.paths == first.paths);
    assert(source->calls.load() == 1);

    // Different parameters, different key
    req.max_paths = 1;
    AnswerResult third = orch.answer_context(req);
    assert(!third.from_cache);
    assert(third.paths.size() == 1);
    assert(source->calls.load() == 2);
    assert(orch.cache_key(req) != orch.cache_key(AnswerRequest{"A"}));

    OrchestratorStats s = orch.stats();
    assert(s.requests == 3);
    assert(s.cache_hits == 1);
    assert(s.upstream_calls == 2);

    std::cout << "  PASS" << std::endl;
}

void test_orchestrator_failures() {
    std::cout << "Testing Orchestrator failures..." << std::endl;

    auto failing = std::make_shared<FailingSource>();
    Orchestrator orch(failing);

    AnswerRequest req;
    req.anchor = "A";
    AnswerResult r = orch.answer_context(req);
    assert(!r.ok());
    assert(r.error == RetrievalError::UpstreamUnavailable);

    // Failures are not cached
    orch.answer_context(req);
    assert(failing->calls.load() == 2);
    assert(!orch.cache().contains(orch.cache_key(req)));
    assert(orch.stats().failures == 2);

    // Throwing store maps to UpstreamUnavailable too
    Orchestrator throwing(std::make_shared<ThrowingSource>());
    assert(throwing.answer_context(req).error == RetrievalError::UpstreamUnavailable);

    // Invalid requests
    AnswerRequest empty_anchor;
    assert(orch.answer_context(empty_anchor).error == RetrievalError::InvalidArgument);
    AnswerRequest zero = req;
    zero.max_paths = 0;
    assert(orch.answer_context(zero).error == RetrievalError::InvalidArgument);

    OrchestratorConfig bad;
    bad.scorer.decay_rate = 0.0;
    Orchestrator bad_orch(scenario_graph(), bad);
    assert(bad_orch.answer_context(req).error == RetrievalError::InvalidArgument);

    std::cout << "  PASS" << std::endl;
}

void test_orchestrator_timeout() {
    std::cout << "Testing Orchestrator timeout..." << std::endl;

    auto slow = std::make_shared<CountingSource>(scenario_graph(), 300);
    Orchestrator orch(slow);

    AnswerRequest req;
    req.anchor = "A";
    req.timeout_ms = 20;

    AnswerResult r = orch.answer_context(req);
    assert(r.error == RetrievalError::Timeout);
    assert(!orch.cache().contains(orch.cache_key(req)));
    assert(orch.cache().stats().slow.entries == 0);
    assert(orch.cache().stats().fast.entries == 0);
    assert(orch.stats().timeouts == 1);

    std::cout << "  PASS" << std::endl;
}

void test_orchestrator_empty_result() {
    std::cout << "Testing Orchestrator empty result..." << std::endl;

    auto graph = scenario_graph();
    graph->add_node(Node("lonely"));
    auto source = std::make_shared<CountingSource>(graph);
    Orchestrator orch(source);

    AnswerRequest req;
    req.anchor = "lonely";
    AnswerResult r = orch.answer_context(req);
    assert(r.ok());
    assert(r.empty);
    assert(r.paths.empty());

    // Cached at low importance: slow tier only
    assert(orch.cache().tier_of(orch.cache_key(req)) == CacheTierKind::Slow);

    AnswerResult again = orch.answer_context(req);
    assert(again.ok() && again.empty && again.from_cache);
    assert(source->calls.load() == 1);

    // An anchor the graph has never seen is a successful empty result
    AnswerRequest unknown;
    unknown.anchor = "nowhere";
    AnswerResult u = orch.answer_context(unknown);
    assert(u.ok() && u.empty && !u.from_cache);
    assert(source->calls.load() == 2);

    // Everything pruned also counts as empty
    OrchestratorConfig strict;
    strict.retriever.pruning_threshold = 1.0;
    Orchestrator pruned(std::make_shared<StaticSource>(
        std::vector<Path>{make_path({"A", "B"}, {0.4})}), strict);
    req.anchor = "A";
    AnswerResult p = pruned.answer_context(req);
    assert(p.ok() && p.empty);

    std::cout << "  PASS" << std::endl;
}

void test_orchestrator_malformed_paths() {
    std::cout << "Testing Orchestrator with malformed paths..." << std::endl;

    Path malformed;
    malformed.vertices = {Node("A"), Node("B"), Node("C")};
    malformed.edges = {Edge("A", "B", "rel", 1.0)};

    Orchestrator orch(std::make_shared<StaticSource>(
        std::vector<Path>{malformed, make_path({"A", "D"}, {0.6})}));

    AnswerRequest req;
    req.anchor = "A";
    AnswerResult r = orch.answer_context(req);
    assert(r.ok());
    assert(r.paths.size() == 1);
    assert(r.ranked[0].path_text == "A -[rel]-> D");

    std::cout << "  PASS" << std::endl;
}

void test_orchestrator_format() {
    std::cout << "Testing Orchestrator formatted context..." << std::endl;

    auto graph = std::make_shared<MemoryGraphSource>();
    graph->add_edge("A", "treats", "B1", 0.9);
    graph->add_edge("A", "treats", "B2", 0.7);
    graph->add_edge("A", "treats", "B3", 0.5);
    Orchestrator orch(graph);

    AnswerRequest req;
    req.anchor = "A";
    req.format_for_output = true;
    AnswerResult r = orch.answer_context(req);
    assert(r.ok());
    assert(r.context.has_value());

    std::vector<std::string> lines;
    std::istringstream in(*r.context);
    for (std::string line; std::getline(in, line);) lines.push_back(line);

    // Query first, strongest path last
    assert(lines.size() == 4);
    assert(lines[0] == "Query: A");
    assert(lines[1] == "A -[treats]-> B2 (reliability 0.700)");
    assert(lines[2] == "A -[treats]-> B3 (reliability 0.500)");
    assert(lines[3] == "A -[treats]-> B1 (reliability 0.900)");

    AnswerResult cached = orch.answer_context(req);
    assert(cached.from_cache);
    assert(cached.context == r.context);

    // Tight budget keeps the strongest path
    OrchestratorConfig tight;
    tight.context.max_tokens = 12;
    tight.context.reserved_tokens = 2;
    Orchestrator small(graph, tight);
    AnswerResult s = small.answer_context(req);
    assert(s.ok());
    assert(s.context->find("B1 (reliability 0.900)") != std::string::npos);
    assert(word_token_counter()(*s.context) <= 10 + word_token_counter()("Query: A"));

    std::cout << "  PASS" << std::endl;
}

void test_orchestrator_single_flight() {
    std::cout << "Testing Orchestrator single-flight..." << std::endl;

    auto source = std::make_shared<CountingSource>(scenario_graph(), 100);
    Orchestrator orch(source);

    AnswerRequest req;
    req.anchor = "A";

    std::vector<std::thread> threads;
    std::vector<AnswerResult> results(4);
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&orch, &req, &results, i]() {
            results[i] = orch.answer_context(req);
        });
    }
    for (auto& t : threads) t.join();

    assert(source->calls.load() == 1);
    for (const auto& r : results) {
        assert(r.ok());
        assert(r.paths.size() == 2);
    }
    OrchestratorStats s = orch.stats();
    assert(s.upstream_calls == 1);
    assert(s.coalesced + s.cache_hits == 3);

    std::cout << "  PASS" << std::endl;
}

void test_orchestrator_invalid_utf8() {
    std::cout << "Testing Orchestrator with invalid UTF-8 text..." << std::endl;

    std::string dir = temp_dir("marga_test_latin1_orch");
    auto graph = std::make_shared<MemoryGraphSource>();
    graph->add_edge("caf\xe9", "serves", "cr\xe8me", 1.0);   // Latin-1 bytes
    auto source = std::make_shared<CountingSource>(graph);

    OrchestratorConfig config;
    config.cache.slow_dir = dir;
    Orchestrator orch(source, config);
    assert(orch.open());

    AnswerRequest req;
    req.anchor = "caf\xe9";

    // Distinct raw bytes give distinct keys
    AnswerRequest other = req;
    other.anchor = "caf\xea";
    assert(orch.cache_key(req) != orch.cache_key(other));

    // Retrieval succeeds; the disk tier refuses the entry, which is not an error
    AnswerResult r = orch.answer_context(req);
    assert(r.ok());
    assert(r.error == RetrievalError::None);
    assert(r.paths.size() == 1);
    assert(r.ranked[0].path_text == "caf\xe9 -[serves]-> cr\xe8me");
    assert(r.cache_write_rejected);
    assert(orch.stats().rejected_writes == 1);
    assert(orch.stats().cache.slow.rejected == 1);

    req.format_for_output = true;
    AnswerResult formatted = orch.answer_context(req);
    assert(formatted.ok());
    assert(formatted.context.has_value());
    assert(formatted.context->find("cr\xe8me") != std::string::npos);

    assert(orch.answer_context(other).ok());
    assert(orch.answer_context(other).empty);

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_orchestrator_restart() {
    std::cout << "Testing Orchestrator cache across restarts..." << std::endl;

    std::string dir = temp_dir("marga_test_restart");
    OrchestratorConfig config;
    config.cache.slow_dir = dir;

    AnswerRequest req;
    req.anchor = "A";

    {
        Orchestrator orch(scenario_graph(), config);
        assert(orch.open());
        assert(orch.answer_context(req).ok());
    }
    {
        auto source = std::make_shared<CountingSource>(scenario_graph());
        Orchestrator orch(source, config);
        assert(orch.open());
        AnswerResult r = orch.answer_context(req);
        assert(r.ok() && r.from_cache);
        assert(r.paths.size() == 2);
        assert(source->calls.load() == 0);
    }

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════════════

void test_config() {
    std::cout << "Testing configuration..." << std::endl;

    assert(validate(OrchestratorConfig{}).empty());

    std::string dir = temp_dir("marga_test_config");
    fs::create_directories(dir);
    {
        std::ofstream out(dir + "/marga.json");
        out << R"({"scorer": {"decay_rate": 0.5},
                  "retriever": {"max_paths": 3, "max_workers": 4},
                  "cache": {"slow_dir": "/tmp/marga-cache",
                            "importance": {"query_window": 4}},
                  "context": {"max_tokens": 1000}})";
    }
    auto loaded = load_config(dir + "/marga.json");
    assert(loaded.has_value());
    assert(loaded->scorer.decay_rate == 0.5);
    assert(loaded->retriever.max_paths == 3);
    assert(loaded->retriever.max_depth == 3);                 // Default kept
    assert(loaded->retriever.max_workers == 4);
    assert(loaded->cache.slow_dir == "/tmp/marga-cache");
    assert(loaded->cache.importance.query_window == 4);
    assert(loaded->cache.high_importance_threshold == 0.6);
    assert(loaded->context.max_tokens == 1000);

    // Round trip through JSON
    OrchestratorConfig again = config_from_json(config_to_json(*loaded));
    assert(again.scorer.decay_rate == 0.5);
    assert(again.retriever.max_workers == 4);
    assert(again.cache.slow_dir == "/tmp/marga-cache");

    {
        std::ofstream out(dir + "/broken.json");
        out << "{\"scorer\": ";
    }
    assert(!load_config(dir + "/broken.json").has_value());
    assert(!load_config(dir + "/missing.json").has_value());
    {
        std::ofstream out(dir + "/wrong.json");
        out << R"({"retriever": {"max_paths": "many"}})";
    }
    assert(!load_config(dir + "/wrong.json").has_value());

    OrchestratorConfig bad;
    bad.scorer.decay_rate = 1.5;
    bad.retriever.max_depth = 9;
    bad.context.reserved_tokens = bad.context.max_tokens;
    assert(validate(bad).size() == 3);

    ::setenv("MARGA_CACHE_DIR", "/tmp/marga-env-cache", 1);
    OrchestratorConfig env;
    apply_env(env);
    assert(env.cache.slow_dir == "/tmp/marga-env-cache");
    ::unsetenv("MARGA_CACHE_DIR");

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Marga C++ Tests ===" << std::endl;
    std::cout << "version " << MARGA_VERSION << std::endl;
    std::cout << std::endl;

    test_path_scorer_scenario();
    test_path_scorer_edge_cases();
    test_path_scorer_monotonic();

    test_prune_thresholds();
    test_prune_tie_break();
    test_prune_drops_malformed();
    test_memory_graph_traversal();
    test_graph_snapshot();
    test_retriever_failures();
    test_retriever_worker_cap();
    test_sqlite_source();
    test_sqlite_import();

    std::cout << std::endl;
    std::cout << "=== Cache Tests ===" << std::endl;
    test_memory_tier();
    test_disk_tier_persistence();
    test_disk_tier_corruption();
    test_disk_tier_invalid_text();
    test_importance();
    test_tiered_cache_placement();
    test_tiered_cache_promotion();
    test_tiered_cache_promotion_race();
    test_tiered_cache_budget();
    test_tiered_cache_durable();
    test_tiered_cache_concurrency();

    std::cout << std::endl;
    std::cout << "=== Context Tests ===" << std::endl;
    test_token_counter();
    test_context_assembler_budget();
    test_context_assembler_ordering();
    test_boundary_placement();

    std::cout << std::endl;
    std::cout << "=== Orchestrator Tests ===" << std::endl;
    test_orchestrator_cache_hit();
    test_orchestrator_failures();
    test_orchestrator_timeout();
    test_orchestrator_empty_result();
    test_orchestrator_malformed_paths();
    test_orchestrator_format();
    test_orchestrator_single_flight();
    test_orchestrator_invalid_utf8();
    test_orchestrator_restart();
    test_config();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
