// NodeForge wire format
//
// Flattens the graph reachable from a root into
//   { "nodes":       [ { "id", "name", "data": { socket: EncodedValue } } ],
//     "connections": [ { "source", "sourceOutput", "target", "targetInput" } ] }
// and rebuilds nodes, connections and the root set from such a record.
#pragma once
#include "NodeForgeConfig.hpp"
#include "NodeForgeCore.hpp"
#include "NodeForgeRegistry.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>

namespace NodeForge {

// A single sink comes back as its handle, anything else as the list
using WireRoots = std::variant<NodeHandle, std::vector<NodeHandle>>;

struct SkippedEdge {
    std::size_t index = 0; // position in the "connections" array
    std::string source;
    std::string sourceOutput;
    std::string target;
    std::string targetInput;
    std::string reason;
};

struct LoadReport {
    std::vector<NodeHandle> nodes; // every node created by the load, in record order
    std::vector<SkippedEdge> skippedEdges;
    std::vector<std::string> valueFallbacks; // "<node id>.<socket>" restored via the list/primitive fallback
};

// Depth-first over input connections from root; each node is emitted once
// however many paths reach it
nlohmann::json toWire(const Graph& graph, NodeHandle root, const Settings& settings = Settings());
// Several roots in one record; shared upstream nodes and edges appear once
nlohmann::json toWire(const Graph& graph, const std::vector<NodeHandle>& roots, const Settings& settings = Settings());
// Serialized text, optionally wrapped as { wrapperName: graph }
std::string toWireString(const Graph& graph, NodeHandle root, const std::string& wrapperName = std::string(),
                         const Settings& settings = Settings());

// Node failures (unknown type, duplicate id, undecodable value) abort the load
// and remove everything it created. Bad edges are skipped and reported unless
// settings.strictEdges is set.
WireRoots fromWire(Graph& graph, const nlohmann::json& record, const NodeTypeRegistry& registry,
                   const Settings& settings = Settings(), LoadReport* report = nullptr);
WireRoots fromWireString(Graph& graph, const std::string& text, const NodeTypeRegistry& registry,
                         const Settings& settings = Settings(), LoadReport* report = nullptr);

std::vector<NodeHandle> rootList(const WireRoots& roots);

// Indented dump of id, type and per-socket state, recursing upstream
std::string inspect(const Graph& graph, NodeHandle root);

} // namespace NodeForge
