// NodeForge node-type registry
//
// Explicit name -> NodeType table. Catalogues register their types once at
// startup; the wire loader is the only consumer of lookup().
#pragma once
#include "NodeForgeCore.hpp"
#include <map>
#include <string>
#include <vector>

namespace NodeForge {

class NodeTypeRegistry {
public:
    // Re-registering a name replaces the previous entry (nodes already
    // created keep the type they were built with)
    void registerType(NodeTypePtr type);
    void registerType(std::string name, NodeSchema schema, ExpressionBuilder builder, std::string description = {});

    bool contains(const std::string& name) const;
    // Throws RegistryLookupError
    const NodeTypePtr& lookup(const std::string& name) const;
    // Creates a node of a registered type in the graph
    NodeHandle create(Graph& graph, const std::string& name, const NodeId& id = NodeId()) const;

    std::vector<std::string> names() const;
    // Case-insensitive regular expression search over type names
    std::vector<std::string> search(const std::string& pattern) const;
    std::size_t size() const { return types_.size(); }

private:
    std::map<std::string, NodeTypePtr> types_;
};

// Multi-line summary of a type: name, inputs with type hints, outputs
std::string describeType(const NodeType& type);

} // namespace NodeForge
