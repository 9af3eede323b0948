// marga-import: Convert an SQLite graph database into a JSON graph snapshot
//
// Usage: marga_import [OPTIONS]
//
// Options:
//   --db PATH         Path to the SQLite graph database
//   --output PATH     Path to the JSON snapshot (default: ./graph.json)
//   --dry-run         Count what would be imported
//   --verbose         Show detailed progress

#include <marga/marga.hpp>
#include <marga/sqlite_import.hpp>
#include <iostream>
#include <string>
#include <cstring>

using namespace marga;

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --db PATH         Path to the SQLite graph database\n"
              << "  --output PATH     Path to the JSON snapshot (default: ./graph.json)\n"
              << "  --dry-run         Count what would be imported\n"
              << "  --verbose, -v     Show detailed progress\n"
              << "  --help, -h        Show this help\n";
}

int main(int argc, char* argv[]) {
    std::string db_path;
    std::string output_path = "./graph.json";
    bool dry_run = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            db_path = argv[++i];
        } else if (strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
            output_path = argv[++i];
        } else if (strcmp(argv[i], "--dry-run") == 0) {
            dry_run = true;
        } else if (strcmp(argv[i], "--verbose") == 0 || strcmp(argv[i], "-v") == 0) {
            verbose = true;
            set_verbose(true);
        } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (db_path.empty()) {
        std::cerr << "Error: --db is required\n";
        print_usage(argv[0]);
        return 1;
    }

    std::cout << "Importing from: " << db_path << "\n";
    std::cout << "Output to: " << output_path << "\n";
    if (dry_run) std::cout << "(DRY RUN - no changes will be made)\n";
    std::cout << "\n";

    MemoryGraphSource graph;
    ImportStats stats;
    if (import_database(db_path, graph, stats, verbose, dry_run) != 0) return 1;

    if (!dry_run && !graph.save_json(output_path)) {
        std::cerr << "Error: Failed to write " << output_path << "\n";
        return 1;
    }

    std::cout << "Import " << (dry_run ? "would import" : "complete") << ":\n";
    std::cout << "  Nodes:     " << stats.nodes << "\n";
    std::cout << "  Edges:     " << stats.edges << "\n";
    std::cout << "  Skipped:   " << stats.skipped << "\n";
    std::cout << "  ───────────────────\n";
    std::cout << "  Total:     " << stats.total() << " records\n";
    if (!dry_run) {
        std::cout << "  Relations: " << graph.relation_count() << "\n";
        std::cout << "\nSaved to: " << output_path << "\n";
    }
    return 0;
}
