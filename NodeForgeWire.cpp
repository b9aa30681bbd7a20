// NodeForgeWire.cpp
//
// Graph traversal for serialization, reconstruction of topology and roots
// from flat node/edge records, and the inspect() debugging dump.
#include "NodeForgeWire.hpp"
#include "NodeForgeCodec.hpp"
#include "NodeForgeLog.hpp"
#include <fmt/core.h>
#include <unordered_map>
#include <unordered_set>

namespace NodeForge {

namespace {

void traverse(const Graph& graph, NodeHandle handle, std::unordered_set<NodeId>& visited, nlohmann::json& out,
              const Settings& settings) {
    const Node& n = graph.node(handle);
    if (!visited.insert(n.id()).second) return;

    nlohmann::json data = nlohmann::json::object();
    for (const auto& socket : n.inputs()) {
        // connected sockets are described by the edge records instead
        if (socket.hasConnections() || socket.value().isNone()) continue;
        data[socket.name()] = encodeValue(socket.value(), settings);
    }
    out["nodes"].push_back({{"id", n.id()}, {"name", n.typeName()}, {"data", std::move(data)}});

    for (const auto& socket : n.inputs()) {
        for (ConnectionHandle h : socket.connections()) {
            const Connection& c = graph.connection(h);
            const Node& src = graph.node(c.source);
            out["connections"].push_back({
                {"source", src.id()},
                {"sourceOutput", c.sourceOutput},
                {"target", n.id()},
                {"targetInput", c.targetInput},
            });
            traverse(graph, c.source, visited, out, settings);
        }
    }
}

const nlohmann::json& unwrapGraphRecord(const nlohmann::json& record) {
    if (record.is_object() && !record.contains("nodes") && record.size() == 1) {
        const auto& inner = record.begin().value();
        if (inner.is_object() && inner.contains("nodes")) return inner;
    }
    return record;
}

std::string stringField(const nlohmann::json& record, const char* key) {
    auto it = record.find(key);
    if (it == record.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

Value restoreValue(const Node& n, const std::string& socket, const nlohmann::json& encoded, LoadReport* report) {
    try {
        return decodeValue(encoded);
    } catch (const DecodeError& e) {
        if (encoded.is_object()) {
            throw DecodeError(fmt::format("Cannot restore '{}' on {} node '{}': {}", socket, n.typeName(), n.id(), e.what()));
        }
        // list-shaped data becomes a tuple, primitives are taken as they are
        logging::warn("restoring '{}' on {} node '{}' from raw data ({})", socket, n.typeName(), n.id(), e.what());
        if (report) report->valueFallbacks.push_back(n.id() + "." + socket);
        try {
            return decodePlainJson(encoded);
        } catch (const DecodeError& inner) {
            throw DecodeError(fmt::format("Cannot restore '{}' on {} node '{}': {}", socket, n.typeName(), n.id(), inner.what()));
        }
    }
}

void restoreNode(Graph& graph, const nlohmann::json& nodeRecord, std::size_t index, const NodeTypeRegistry& registry,
                 std::unordered_map<NodeId, NodeHandle>& byId, LoadReport& report) {
    if (!nodeRecord.is_object()) throw ConstructionError(fmt::format("Node record #{} is not an object", index));
    const std::string id = stringField(nodeRecord, "id");
    const std::string name = stringField(nodeRecord, "name");
    if (id.empty()) throw ConstructionError(fmt::format("Node record #{} has no string 'id'", index));
    if (name.empty()) throw ConstructionError(fmt::format("Node record '{}' has no string 'name'", id));

    const NodeHandle h = graph.addNode(registry.lookup(name), id);
    report.nodes.push_back(h);
    byId[id] = h;

    auto dataIt = nodeRecord.find("data");
    if (dataIt == nodeRecord.end() || dataIt->is_null()) return;
    if (!dataIt->is_object()) throw ConstructionError(fmt::format("{} node '{}' has a non-object 'data'", name, id));
    const Node& n = graph.node(h);
    for (const auto& item : dataIt->items()) {
        if (!n.hasInput(item.key())) {
            throw ConstructionError(fmt::format("{} node '{}' has no input socket '{}'", name, id, item.key()));
        }
        graph.setValue(h, item.key(), restoreValue(n, item.key(), item.value(), &report));
    }
}

void restoreEdge(Graph& graph, const nlohmann::json& edgeRecord, std::size_t index,
                 const std::unordered_map<NodeId, NodeHandle>& byId, const Settings& settings, LoadReport& report) {
    SkippedEdge edge;
    edge.index = index;
    if (edgeRecord.is_object()) {
        edge.source = stringField(edgeRecord, "source");
        edge.sourceOutput = stringField(edgeRecord, "sourceOutput");
        edge.target = stringField(edgeRecord, "target");
        edge.targetInput = stringField(edgeRecord, "targetInput");
    }

    if (!edgeRecord.is_object() || edge.source.empty() || edge.target.empty() || edge.sourceOutput.empty()
        || edge.targetInput.empty()) {
        edge.reason = "malformed connection record";
    } else {
        auto src = byId.find(edge.source);
        auto dst = byId.find(edge.target);
        if (src == byId.end()) {
            edge.reason = fmt::format("unknown source node '{}'", edge.source);
        } else if (dst == byId.end()) {
            edge.reason = fmt::format("unknown target node '{}'", edge.target);
        } else {
            try {
                graph.connect(src->second, edge.sourceOutput, dst->second, edge.targetInput);
                return;
            } catch (const ReferenceError& e) {
                edge.reason = e.what();
            }
        }
    }

    if (settings.strictEdges) {
        throw ReferenceError(fmt::format("Connection #{} {}:{} -> {}:{} rejected: {}", index, edge.source,
                                         edge.sourceOutput, edge.target, edge.targetInput, edge.reason));
    }
    logging::warn("skipping connection #{} {}:{} -> {}:{}: {}", index, edge.source, edge.sourceOutput, edge.target,
                  edge.targetInput, edge.reason);
    report.skippedEdges.push_back(std::move(edge));
}

void rollback(Graph& graph, const std::vector<NodeHandle>& created) {
    for (NodeHandle h : created) {
        if (graph.contains(h)) graph.disconnectAll(h);
    }
    for (NodeHandle h : created) {
        if (graph.contains(h)) graph.removeNode(h);
    }
}

void inspectInto(const Graph& graph, NodeHandle handle, int indent, std::unordered_set<NodeId>& visited, std::string& out) {
    const Node& n = graph.node(handle);
    if (!visited.insert(n.id()).second) return;
    const std::string pad(static_cast<std::size_t>(indent) * 2, ' ');
    const std::string padIn(static_cast<std::size_t>(indent + 1) * 2, ' ');
    out += fmt::format("{}Node: {} ({}){}\n", pad, n.id(), n.typeName(), n.isEvaluated() ? " [evaluated]" : "");
    for (const auto& socket : n.inputs()) {
        if (socket.hasConnections()) {
            for (ConnectionHandle h : socket.connections()) {
                const Connection& c = graph.connection(h);
                out += fmt::format("{}Input [{}] connected to Node {}:{}\n", padIn, socket.name(),
                                   graph.node(c.source).id(), c.sourceOutput);
                inspectInto(graph, c.source, indent + 2, visited, out);
            }
        } else if (!socket.value().isNone()) {
            out += fmt::format("{}Input [{}] has value: {}\n", padIn, socket.name(), socket.value().toString());
        } else {
            out += fmt::format("{}Input [{}] is unconnected\n", padIn, socket.name());
        }
    }
}

} // namespace

nlohmann::json toWire(const Graph& graph, NodeHandle root, const Settings& settings) {
    return toWire(graph, std::vector<NodeHandle>{root}, settings);
}

nlohmann::json toWire(const Graph& graph, const std::vector<NodeHandle>& roots, const Settings& settings) {
    nlohmann::json out = {{"nodes", nlohmann::json::array()}, {"connections", nlohmann::json::array()}};
    std::unordered_set<NodeId> visited;
    for (NodeHandle root : roots) traverse(graph, root, visited, out, settings);
    return out;
}

std::string toWireString(const Graph& graph, NodeHandle root, const std::string& wrapperName, const Settings& settings) {
    nlohmann::json j = toWire(graph, root, settings);
    if (!wrapperName.empty()) j = nlohmann::json{{wrapperName, std::move(j)}};
    return j.dump(settings.jsonIndent);
}

WireRoots fromWire(Graph& graph, const nlohmann::json& record, const NodeTypeRegistry& registry,
                   const Settings& settings, LoadReport* report) {
    const nlohmann::json& g = unwrapGraphRecord(record);
    if (!g.is_object() || !g.contains("nodes") || !g["nodes"].is_array()) {
        throw DecodeError("Graph record needs a 'nodes' array");
    }
    const nlohmann::json empty = nlohmann::json::array();
    auto connIt = g.find("connections");
    const nlohmann::json& edges = (connIt == g.end() || connIt->is_null()) ? empty : *connIt;
    if (!edges.is_array()) throw DecodeError("Graph record 'connections' must be an array");

    LoadReport local;
    LoadReport& rep = report ? *report : local;
    rep = LoadReport();
    std::unordered_map<NodeId, NodeHandle> byId;
    std::vector<NodeHandle> roots;
    try {
        std::size_t index = 0;
        for (const auto& nodeRecord : g["nodes"]) restoreNode(graph, nodeRecord, index++, registry, byId, rep);
        index = 0;
        for (const auto& edgeRecord : edges) restoreEdge(graph, edgeRecord, index++, byId, settings, rep);
        roots = graph.roots(rep.nodes);
    } catch (const GraphError& e) {
        logging::error("graph load aborted: {}", e.what());
        rollback(graph, rep.nodes);
        rep.nodes.clear();
        throw;
    }

    logging::info("loaded {} node(s), {} root(s), {} skipped connection(s)", rep.nodes.size(), roots.size(),
                  rep.skippedEdges.size());
    if (roots.size() == 1) return roots.front();
    return roots;
}

WireRoots fromWireString(Graph& graph, const std::string& text, const NodeTypeRegistry& registry,
                         const Settings& settings, LoadReport* report) {
    nlohmann::json record;
    try {
        record = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw DecodeError(std::string("Graph text is not valid JSON: ") + e.what());
    }
    return fromWire(graph, record, registry, settings, report);
}

std::vector<NodeHandle> rootList(const WireRoots& roots) {
    if (const NodeHandle* single = std::get_if<NodeHandle>(&roots)) return {*single};
    return std::get<std::vector<NodeHandle>>(roots);
}

std::string inspect(const Graph& graph, NodeHandle root) {
    std::string out;
    std::unordered_set<NodeId> visited;
    inspectInto(graph, root, 0, visited, out);
    return out;
}

} // namespace NodeForge
