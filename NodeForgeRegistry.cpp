// NodeForgeRegistry.cpp
#include "NodeForgeRegistry.hpp"
#include "NodeForgeLog.hpp"
#include <fmt/core.h>
#include <regex>

namespace NodeForge {

void NodeTypeRegistry::registerType(NodeTypePtr type) {
    if (!type) throw ConstructionError("Cannot register an empty node type");
    const std::string name = type->name;
    if (types_.count(name)) logging::info("replacing registered node type {}", name);
    types_[name] = std::move(type);
}

void NodeTypeRegistry::registerType(std::string name, NodeSchema schema, ExpressionBuilder builder, std::string description) {
    registerType(makeNodeType(std::move(name), std::move(schema), std::move(builder), std::move(description)));
}

bool NodeTypeRegistry::contains(const std::string& name) const {
    return types_.count(name) != 0;
}

const NodeTypePtr& NodeTypeRegistry::lookup(const std::string& name) const {
    auto it = types_.find(name);
    if (it == types_.end()) throw RegistryLookupError(name);
    return it->second;
}

NodeHandle NodeTypeRegistry::create(Graph& graph, const std::string& name, const NodeId& id) const {
    return graph.addNode(lookup(name), id);
}

std::vector<std::string> NodeTypeRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(types_.size());
    for (const auto& kv : types_) out.push_back(kv.first);
    return out;
}

std::vector<std::string> NodeTypeRegistry::search(const std::string& pattern) const {
    std::regex re;
    try {
        re = std::regex(pattern, std::regex::icase);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument(fmt::format("Invalid search pattern '{}': {}", pattern, e.what()));
    }
    std::vector<std::string> out;
    for (const auto& kv : types_) {
        if (std::regex_search(kv.first, re)) out.push_back(kv.first);
    }
    return out;
}

std::string describeType(const NodeType& type) {
    std::string s = type.name + "\n";
    if (!type.description.empty()) s += "  " + type.description + "\n";
    s += "  Inputs: [";
    for (std::size_t i = 0; i < type.schema.inputs.size(); ++i) {
        const auto& in = type.schema.inputs[i];
        if (i) s += ", ";
        s += in.name + ":" + in.typeHint;
        if (in.variadic) s += "...";
        if (!in.defaultValue.isNone()) s += "=" + in.defaultValue.toString();
    }
    s += "]\n  Outputs: [";
    for (std::size_t i = 0; i < type.schema.outputs.size(); ++i) {
        if (i) s += ", ";
        s += type.schema.outputs[i];
    }
    return s + "]\n";
}

} // namespace NodeForge
