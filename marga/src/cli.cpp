// marga: query a graph for ranked evidence paths
//
// Usage: marga <command> [options]
//
// Commands:
//   query <anchor>   Retrieve, score and rank paths from an anchor node
//   stats            Show cache statistics
//   clear            Drop every cached result
//   help             Show usage

#include <marga/marga.hpp>
#include <marga/sqlite_source.hpp>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

using namespace marga;

// Get program name from path
static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "marga " << MARGA_VERSION << " - graph path retrieval\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  query <anchor>     Ranked paths from an anchor node\n"
              << "  stats              Show cache statistics\n"
              << "  clear              Drop every cached result\n"
              << "  help               Show this help\n\n"
              << "Options:\n"
              << "  --graph FILE       JSON graph snapshot ({\"nodes\":[...],\"edges\":[...]})\n"
              << "  --db FILE          SQLite graph database\n"
              << "  --depth N          Traversal depth, 1-7 (default: 3)\n"
              << "  --max-paths N      Paths to return (default: 5)\n"
              << "  --domain D         Only traverse nodes in domain D\n"
              << "  --at-version V     Ignore edges newer than version V\n"
              << "  --as-of TS         Ignore edges created after TS (ms since epoch)\n"
              << "  --format           Assemble a token-bounded context\n"
              << "  --json             Output as JSON\n"
              << "  --cache-dir DIR    Persistent cache directory (default: ~/.cache/marga)\n"
              << "  --config FILE      JSON configuration file\n"
              << "  --timeout-ms N     Graph store timeout (default: none)\n"
              << "  --verbose          Enable verbose debug logging\n"
              << "  -v, --version      Show version\n";
}

// Each invocation is a fresh process, so only what the tiers hold
// (entries, bytes, budget) is meaningful here; hit counters start at 0.
static json stats_json(const OrchestratorStats& s) {
    auto tier = [](const TierStats& t) {
        return json{{"entries", t.entries}, {"bytes", t.bytes}, {"budget", t.budget}};
    };
    return json{
        {"version", MARGA_VERSION},
        {"cache", {
            {"fast", tier(s.cache.fast)},
            {"slow", tier(s.cache.slow)}
        }}
    };
}

int cmd_stats(Orchestrator& orch, bool json_output) {
    OrchestratorStats s = orch.stats();
    if (json_output) {
        std::cout << dump_text(stats_json(s)) << "\n";
        return 0;
    }

    std::cout << "Cache Statistics\n";
    std::cout << "═══════════════════════════════\n";
    std::cout << "Fast tier (" << orch.cache().fast_tier().name() << "):\n";
    std::cout << "  Entries:   " << s.cache.fast.entries << "\n";
    std::cout << "  Bytes:     " << s.cache.fast.bytes << " / " << s.cache.fast.budget << "\n";
    std::cout << "Slow tier (" << orch.cache().slow_tier().name() << "):\n";
    std::cout << "  Entries:   " << s.cache.slow.entries << "\n";
    std::cout << "  Bytes:     " << s.cache.slow.bytes << " / " << s.cache.slow.budget << "\n";
    return 0;
}

int cmd_query(Orchestrator& orch, const AnswerRequest& request, bool json_output) {
    AnswerResult result = orch.answer_context(request);

    if (json_output) {
        json out{{"ok", result.ok()},
                 {"anchor", request.anchor},
                 {"from_cache", result.from_cache},
                 {"empty", result.empty},
                 {"paths", result.ranked}};
        if (!result.ok()) {
            out["error"] = error_name(result.error);
            out["message"] = result.message;
        }
        if (result.context) out["context"] = *result.context;
        std::cout << dump_text(out, 2) << "\n";
        return result.ok() ? 0 : 1;
    }

    if (!result.ok()) {
        std::cerr << "Error (" << error_name(result.error) << "): " << result.message << "\n";
        return 1;
    }

    if (result.context) {
        std::cout << *result.context << "\n";
        return 0;
    }

    if (result.empty) {
        std::cout << "No paths from '" << request.anchor << "'\n";
        return 0;
    }

    size_t rank = 1;
    for (const auto& rp : result.ranked) {
        std::cout << rank++ << ". [" << format_reliability(rp.reliability) << "] "
                  << rp.path_text << "\n";
    }
    if (result.from_cache) std::cout << "(cached)\n";
    return 0;
}

int main(int argc, char* argv[]) {
    std::string command;
    std::string graph_path;
    std::string db_path;
    std::string cache_dir;
    std::string config_path;

    AnswerRequest request;
    bool json_output = false;

    try {
        for (int i = 1; i < argc; ++i) {
            if (strcmp(argv[i], "--graph") == 0 && i + 1 < argc) {
                graph_path = argv[++i];
            } else if (strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
                db_path = argv[++i];
            } else if (strcmp(argv[i], "--depth") == 0 && i + 1 < argc) {
                request.max_depth = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (strcmp(argv[i], "--max-paths") == 0 && i + 1 < argc) {
                request.max_paths = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (strcmp(argv[i], "--domain") == 0 && i + 1 < argc) {
                request.domain_filter = std::string(argv[++i]);
            } else if (strcmp(argv[i], "--at-version") == 0 && i + 1 < argc) {
                request.constraint.version = std::string(argv[++i]);
            } else if (strcmp(argv[i], "--as-of") == 0 && i + 1 < argc) {
                request.constraint.as_of = static_cast<Timestamp>(std::stoll(argv[++i]));
            } else if (strcmp(argv[i], "--format") == 0) {
                request.format_for_output = true;
            } else if (strcmp(argv[i], "--json") == 0) {
                json_output = true;
            } else if (strcmp(argv[i], "--cache-dir") == 0 && i + 1 < argc) {
                cache_dir = argv[++i];
            } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                config_path = argv[++i];
            } else if (strcmp(argv[i], "--timeout-ms") == 0 && i + 1 < argc) {
                request.timeout_ms = std::stoull(argv[++i]);
            } else if (strcmp(argv[i], "--verbose") == 0) {
                set_verbose(true);
            } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
                print_usage(argv[0]);
                return 0;
            } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
                std::cout << "marga " << MARGA_VERSION << "\n";
                return 0;
            } else if (argv[i][0] != '-') {
                if (command.empty()) {
                    command = argv[i];
                } else if (command == "query" && request.anchor.empty()) {
                    request.anchor = argv[i];
                }
            } else {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument value: " << e.what() << "\n";
        return 1;
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    // Configuration: file, then environment, then command line
    OrchestratorConfig config;
    if (!config_path.empty()) {
        auto loaded = load_config(config_path);
        if (!loaded) return 1;
        config = *loaded;
    }
    apply_env(config);
    if (!cache_dir.empty()) config.cache.slow_dir = cache_dir;
    if (config.cache.slow_dir.empty()) config.cache.slow_dir = default_cache_dir();

    auto problems = validate(config);
    if (!problems.empty()) {
        for (const auto& p : problems) std::cerr << "Config error: " << p << "\n";
        return 1;
    }

    std::shared_ptr<GraphSource> source;
    if (!db_path.empty()) {
        auto sqlite = std::make_shared<SqliteGraphSource>(db_path);
        if (!sqlite->open()) {
            std::cerr << "Error: Failed to open graph database " << db_path << "\n";
            return 1;
        }
        source = sqlite;
    } else if (!graph_path.empty()) {
        auto memory = std::make_shared<MemoryGraphSource>();
        if (!memory->load_json(graph_path)) return 1;
        source = memory;
    } else if (command == "query") {
        std::cerr << "Usage: marga query <anchor> (--graph FILE | --db FILE) [options]\n";
        return 1;
    }

    Orchestrator orch(source, config);
    if (!orch.open()) {
        std::cerr << "Error: Failed to open cache at " << config.cache.slow_dir << "\n";
        return 1;
    }
    log_debug("cli", "cache at %s, source %s", config.cache.slow_dir.c_str(),
              source ? source->name().c_str() : "none");

    int result = 0;
    if (command == "query") {
        if (request.anchor.empty()) {
            std::cerr << "Usage: marga query <anchor> (--graph FILE | --db FILE) [options]\n";
            result = 1;
        } else {
            result = cmd_query(orch, request, json_output);
        }
    } else if (command == "stats") {
        result = cmd_stats(orch, json_output);
    } else if (command == "clear") {
        orch.cache().clear();
        std::cout << "Cache cleared: " << config.cache.slow_dir << "\n";
    } else {
        std::cerr << "Unknown command: " << command << "\n\n";
        print_usage(argv[0]);
        result = 1;
    }

    return result;
}
