#pragma once
// Serialize: JSON encoding for graph and cache payload types
//
// Used by the persistent cache tier (one JSON blob per entry) and by the
// graph snapshot files read by MemoryGraphSource.

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace marga {

using json = nlohmann::json;

// Dump for output and bookkeeping files. Store text is not validated, so
// invalid UTF-8 is replaced instead of throwing.
inline std::string dump_text(const json& j, int indent = -1) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

inline void to_json(json& j, const Node& n) {
    j = json{{"id", n.id}, {"type", n.type}, {"domain", n.domain},
             {"observations", n.observations}};
    if (n.embedding) j["embedding"] = *n.embedding;
    if (!n.metadata.empty()) j["metadata"] = n.metadata;
}

inline void from_json(const json& j, Node& n) {
    n.id = j.at("id").get<std::string>();
    n.type = j.value("type", std::string("entity"));
    n.domain = j.value("domain", std::string());
    n.observations = j.value("observations", std::vector<std::string>{});
    if (j.contains("embedding") && j["embedding"].is_string()) {
        n.embedding = j["embedding"].get<std::string>();
    } else {
        n.embedding.reset();
    }
    n.metadata = j.value("metadata", Metadata{});
}

inline void to_json(json& j, const Edge& e) {
    j = json{{"from", e.from}, {"to", e.to}, {"relation", e.relation},
             {"weight", e.weight}};
    if (!e.version.empty()) j["version"] = e.version;
    if (e.created_at != 0) j["created_at"] = e.created_at;
    if (!e.metadata.empty()) j["metadata"] = e.metadata;
}

inline void from_json(const json& j, Edge& e) {
    e.from = j.at("from").get<std::string>();
    e.to = j.at("to").get<std::string>();
    e.relation = j.value("relation", std::string());
    e.weight = std::max(0.0, j.value("weight", 1.0));
    e.version = j.value("version", std::string());
    e.created_at = j.value("created_at", Timestamp{0});
    e.metadata = j.value("metadata", Metadata{});
}

inline void to_json(json& j, const Path& p) {
    j = json{{"vertices", p.vertices}, {"edges", p.edges}};
}

inline void from_json(const json& j, Path& p) {
    p.vertices = j.at("vertices").get<std::vector<Node>>();
    p.edges = j.value("edges", std::vector<Edge>{});
}

inline void to_json(json& j, const ScoredPath& sp) {
    j = json{{"path", sp.path}, {"reliability", sp.reliability},
             {"decay_rate", sp.decay_rate}};
}

inline void from_json(const json& j, ScoredPath& sp) {
    sp.path = j.at("path").get<Path>();
    sp.reliability = j.at("reliability").get<double>();
    sp.decay_rate = j.value("decay_rate", 1.0);
}

inline void to_json(json& j, const RankedPath& rp) {
    j = json{{"path_text", rp.path_text}, {"reliability", rp.reliability}};
}

} // namespace marga
