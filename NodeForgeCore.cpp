// NodeForgeCore.cpp
//
// Implements the node/socket model: schema validation, socket state changes,
// connection bookkeeping, memoized evaluation and upstream invalidation.
#include "NodeForgeCore.hpp"
#include "NodeForgeLog.hpp"
#include <algorithm>
#include <fmt/core.h>
#include <random>
#include <set>

namespace NodeForge {

namespace {

const Value& noValue() {
    static const Value none;
    return none;
}

const InputSocket::Connections& noConnections() {
    static const InputSocket::Connections empty;
    return empty;
}

void validateSchema(const NodeType& type) {
    if (type.name.empty()) throw ConstructionError("Node type needs a name");
    if (!type.builder) throw ConstructionError(fmt::format("Node type {} has no expression builder", type.name));
    if (type.schema.outputs.empty()) throw ConstructionError(fmt::format("Node type {} declares no outputs", type.name));
    std::set<std::string> seen;
    int collectors = 0;
    for (const auto& in : type.schema.inputs) {
        if (in.name.empty()) throw ConstructionError(fmt::format("Node type {} has an unnamed input", type.name));
        if (!seen.insert(in.name).second) {
            throw ConstructionError(fmt::format("Node type {} declares input '{}' twice", type.name, in.name));
        }
        if (in.variadic) ++collectors;
    }
    if (collectors > 1) throw ConstructionError(fmt::format("Node type {} declares {} collector inputs", type.name, collectors));
    seen.clear();
    for (const auto& out : type.schema.outputs) {
        if (out.empty()) throw ConstructionError(fmt::format("Node type {} has an unnamed output", type.name));
        if (!seen.insert(out).second) {
            throw ConstructionError(fmt::format("Node type {} declares output '{}' twice", type.name, out));
        }
    }
}

void eraseHandle(std::vector<ConnectionHandle>& list, ConnectionHandle h) {
    list.erase(std::remove(list.begin(), list.end(), h), list.end());
}

} // namespace

const Value& BuildArgs::at(std::size_t index) const {
    if (index >= positional_.size()) {
        std::string param = nameAt(index);
        throw BuildError(param, fmt::format("missing argument #{} ({})", index, param));
    }
    return positional_[index];
}

std::string BuildArgs::nameAt(std::size_t index) const {
    if (index < names_.size()) return names_[index];
    const auto& inputs = node_.type().schema.inputs;
    if (index < inputs.size() && !inputs[index].variadic) return inputs[index].name;
    return fmt::format("arg{}", index);
}

const Value& BuildArgs::input(const std::string& name) const {
    const auto& resolved = node_.resolvedInputs();
    auto it = resolved.find(name);
    return it == resolved.end() ? noValue() : it->second;
}

NodeTypePtr makeNodeType(std::string name, NodeSchema schema, ExpressionBuilder builder, std::string description) {
    auto type = std::make_shared<NodeType>();
    type->name = std::move(name);
    type->schema = std::move(schema);
    type->builder = std::move(builder);
    type->description = std::move(description);
    validateSchema(*type);
    return type;
}

const Value& InputSocket::value() const {
    if (auto v = std::get_if<Value>(&state_)) return *v;
    return noValue();
}

const InputSocket::Connections& InputSocket::connections() const {
    if (auto c = std::get_if<Connections>(&state_)) return *c;
    return noConnections();
}

Node::Node(NodeId id, NodeHandle handle, NodeTypePtr type)
    : id_(std::move(id)), handle_(handle), type_(std::move(type)) {
    for (const auto& spec : type_->schema.inputs) {
        inputs_.emplace_back(spec.name, handle_, spec.variadic, spec.defaultValue);
    }
    for (const auto& name : type_->schema.outputs) {
        outputs_.emplace_back(name, handle_);
    }
}

bool Node::hasInput(const std::string& name) const {
    return std::any_of(inputs_.begin(), inputs_.end(), [&](const InputSocket& s) { return s.name() == name; });
}

bool Node::hasOutput(const std::string& name) const {
    return std::any_of(outputs_.begin(), outputs_.end(), [&](const OutputSocket& s) { return s.name() == name; });
}

const InputSocket& Node::input(const std::string& name) const {
    auto it = std::find_if(inputs_.begin(), inputs_.end(), [&](const InputSocket& s) { return s.name() == name; });
    if (it == inputs_.end()) {
        throw ReferenceError(fmt::format("{} node '{}' has no input socket '{}'", typeName(), id_, name));
    }
    return *it;
}

const OutputSocket& Node::output(const std::string& name) const {
    auto it = std::find_if(outputs_.begin(), outputs_.end(), [&](const OutputSocket& s) { return s.name() == name; });
    if (it == outputs_.end()) {
        throw ReferenceError(fmt::format("{} node '{}' has no output socket '{}'", typeName(), id_, name));
    }
    return *it;
}

InputSocket* Node::findInput(const std::string& name) {
    auto it = std::find_if(inputs_.begin(), inputs_.end(), [&](const InputSocket& s) { return s.name() == name; });
    return it == inputs_.end() ? nullptr : &*it;
}

OutputSocket* Node::findOutput(const std::string& name) {
    auto it = std::find_if(outputs_.begin(), outputs_.end(), [&](const OutputSocket& s) { return s.name() == name; });
    return it == outputs_.end() ? nullptr : &*it;
}

std::size_t Node::socketRequestCount(const std::string& name) const {
    return output(name).connections().size();
}

std::size_t Node::outboundConnectionCount() const {
    std::size_t count = 0;
    for (const auto& out : outputs_) count += out.connections().size();
    return count;
}

NodeHandle Graph::addNode(const NodeTypePtr& type, const NodeId& id) {
    if (!type) throw ConstructionError("Cannot create a node without a type");
    validateSchema(*type);
    NodeId nodeId = id.empty() ? generateNodeId() : id;
    if (idIndex_.count(nodeId)) {
        throw ConstructionError(fmt::format("Duplicate node id '{}' for {} node", nodeId, type->name));
    }
    const NodeHandle handle = static_cast<NodeHandle>(nodes_.size());
    nodes_.push_back(std::make_unique<Node>(nodeId, handle, type));
    idIndex_.emplace(std::move(nodeId), handle);
    return handle;
}

void Graph::removeNode(NodeHandle handle) {
    const Node& n = node(handle);
    std::size_t attached = n.outboundConnectionCount();
    for (const auto& in : n.inputs()) attached += in.connections().size();
    if (attached) {
        throw GraphError(fmt::format("{} node '{}' still has {} connection(s); disconnect them first",
                                     n.typeName(), n.id(), attached));
    }
    idIndex_.erase(n.id());
    nodes_[handle].reset();
}

bool Graph::contains(NodeHandle handle) const {
    return handle >= 0 && static_cast<std::size_t>(handle) < nodes_.size() && nodes_[handle];
}

const Node& Graph::node(NodeHandle handle) const {
    if (!contains(handle)) throw ReferenceError(fmt::format("Unknown node handle {}", handle));
    return *nodes_[handle];
}

Node& Graph::mutableNode(NodeHandle handle) {
    if (!contains(handle)) throw ReferenceError(fmt::format("Unknown node handle {}", handle));
    return *nodes_[handle];
}

NodeHandle Graph::findNode(const NodeId& id) const {
    auto it = idIndex_.find(id);
    return it == idIndex_.end() ? InvalidHandle : it->second;
}

std::vector<NodeHandle> Graph::nodeHandles() const {
    std::vector<NodeHandle> out;
    out.reserve(idIndex_.size());
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        if (nodes_[i]) out.push_back(static_cast<NodeHandle>(i));
    }
    return out;
}

void Graph::setValue(NodeHandle handle, const std::string& input, Value value) {
    Node& n = mutableNode(handle);
    InputSocket* socket = n.findInput(input);
    if (!socket) throw ReferenceError(fmt::format("{} node '{}' has no input socket '{}'", n.typeName(), n.id(), input));
    if (socket->hasConnections()) {
        // copy: disconnect() edits the list we iterate
        const InputSocket::Connections feeding = socket->connections();
        for (ConnectionHandle c : feeding) disconnect(c);
    }
    socket->state_ = std::move(value);
}

ConnectionHandle Graph::connect(NodeHandle source, const std::string& output, NodeHandle target, const std::string& input) {
    if (!contains(source)) throw ReferenceError(fmt::format("Connection source handle {} does not exist", source));
    if (!contains(target)) throw ReferenceError(fmt::format("Connection target handle {} does not exist", target));
    Node& src = *nodes_[source];
    Node& dst = *nodes_[target];
    OutputSocket* out = src.findOutput(output);
    if (!out) {
        throw ReferenceError(fmt::format("Output socket '{}' does not exist on {} node '{}'", output, src.typeName(), src.id()));
    }
    InputSocket* in = dst.findInput(input);
    if (!in) {
        throw ReferenceError(fmt::format("Input socket '{}' does not exist on {} node '{}'", input, dst.typeName(), dst.id()));
    }

    const ConnectionHandle handle = static_cast<ConnectionHandle>(connections_.size());
    connections_.push_back(Connection{source, output, target, input});
    out->connections_.push_back(handle);
    if (auto list = std::get_if<InputSocket::Connections>(&in->state_)) {
        list->push_back(handle);
    } else {
        // connections dominate a direct value
        in->state_ = InputSocket::Connections{handle};
    }
    logging::debug("connect {}:{} -> {}:{}", src.id(), output, dst.id(), input);
    return handle;
}

void Graph::disconnect(ConnectionHandle handle) {
    if (!hasConnection(handle)) throw ReferenceError(fmt::format("Unknown connection handle {}", handle));
    const Connection c = *connections_[handle];
    if (contains(c.source)) {
        if (OutputSocket* out = nodes_[c.source]->findOutput(c.sourceOutput)) eraseHandle(out->connections_, handle);
    }
    if (contains(c.target)) {
        if (InputSocket* in = nodes_[c.target]->findInput(c.targetInput)) {
            if (auto list = std::get_if<InputSocket::Connections>(&in->state_)) {
                eraseHandle(*list, handle);
                if (list->empty()) in->state_ = Value();
            }
        }
    }
    connections_[handle].reset();
}

void Graph::disconnectAll(NodeHandle handle) {
    const Node& n = node(handle);
    std::vector<ConnectionHandle> attached;
    for (const auto& in : n.inputs()) attached.insert(attached.end(), in.connections().begin(), in.connections().end());
    for (const auto& out : n.outputs()) attached.insert(attached.end(), out.connections().begin(), out.connections().end());
    std::sort(attached.begin(), attached.end());
    attached.erase(std::unique(attached.begin(), attached.end()), attached.end());
    for (ConnectionHandle c : attached) disconnect(c);
}

bool Graph::hasConnection(ConnectionHandle handle) const {
    return handle >= 0 && static_cast<std::size_t>(handle) < connections_.size() && connections_[handle].has_value();
}

const Connection& Graph::connection(ConnectionHandle handle) const {
    if (!hasConnection(handle)) throw ReferenceError(fmt::format("Unknown connection handle {}", handle));
    return *connections_[handle];
}

std::size_t Graph::connectionCount() const {
    return static_cast<std::size_t>(std::count_if(connections_.begin(), connections_.end(),
                                                  [](const std::optional<Connection>& c) { return c.has_value(); }));
}

Value Graph::resolve(const InputSocket& socket) {
    if (!socket.hasConnections()) return socket.value();
    Tuple gathered;
    for (ConnectionHandle h : socket.connections()) {
        const Connection& c = *connections_[h];
        const OutputMap& outs = evaluate(c.source);
        auto it = outs.find(c.sourceOutput);
        gathered.push_back(it == outs.end() ? Value() : it->second);
    }
    // fan-in of one passes the value through, more become an ordered tuple
    if (gathered.size() == 1) return std::move(gathered.front());
    return Value(std::move(gathered));
}

// Contiguous-prefix policy: arguments stop at the first missing input, and a
// collector drops every element from its first missing one onwards.
void Graph::gatherArguments(const Node& n, std::vector<Value>& positional, std::vector<std::string>& names) const {
    for (const auto& socket : n.inputs_) {
        auto it = n.resolved_.find(socket.name());
        if (it == n.resolved_.end()) return;
        const Value& v = it->second;
        if (!socket.variadic()) {
            positional.push_back(v);
            names.push_back(socket.name());
            continue;
        }
        const bool fannedIn = socket.connections().size() > 1;
        if (!fannedIn && !(socket.connections().empty() && v.is<Tuple>())) {
            positional.push_back(v);
            names.push_back(fmt::format("{}[0]", socket.name()));
            continue;
        }
        const Tuple& elements = v.as<Tuple>();
        for (std::size_t k = 0; k < elements.size(); ++k) {
            if (elements[k].isNone()) return;
            positional.push_back(elements[k]);
            names.push_back(fmt::format("{}[{}]", socket.name(), k));
        }
    }
}

const OutputMap& Graph::evaluate(NodeHandle handle) {
    Node& n = mutableNode(handle);
    n.clean_ = false;
    if (n.state_ == NodeState::Evaluated) return n.cache_;
    if (n.evaluating_) {
        throw EvaluationError(n.id(), n.typeName(), "", "cycle detected in graph wiring");
    }

    n.evaluating_ = true;
    try {
        n.resolved_.clear();
        for (const auto& socket : n.inputs_) {
            Value v = resolve(socket);
            if (!v.isNone()) n.resolved_[socket.name()] = std::move(v);
        }

        std::vector<Value> positional;
        std::vector<std::string> names;
        gatherArguments(n, positional, names);

        OutputMap produced;
        try {
            produced = n.type_->builder(BuildArgs(n, positional, names));
        } catch (const BuildError& e) {
            throw EvaluationError(n.id(), n.typeName(), e.parameter(), e.what());
        } catch (const EvaluationError&) {
            // already attributed to the node that failed
            throw;
        } catch (const std::exception& e) {
            throw EvaluationError(n.id(), n.typeName(), "", e.what());
        } catch (...) {
            throw EvaluationError(n.id(), n.typeName(), "", "expression builder threw a non-standard exception");
        }

        if (produced.empty()) throw EvaluationError(n.id(), n.typeName(), "", "expression builder produced no outputs");
        for (const auto& kv : produced) {
            if (!n.hasOutput(kv.first)) {
                throw EvaluationError(n.id(), n.typeName(), kv.first, "expression builder produced an undeclared output");
            }
        }
        n.cache_ = std::move(produced);
        n.state_ = NodeState::Evaluated;
    } catch (...) {
        n.evaluating_ = false;
        n.resolved_.clear();
        throw;
    }
    n.evaluating_ = false;
    logging::debug("evaluated {} node '{}'", n.typeName(), n.id());
    return n.cache_;
}

const Value& Graph::evaluateOutput(NodeHandle handle, const std::string& output) {
    const OutputMap& outs = evaluate(handle);
    auto it = outs.find(output);
    if (it == outs.end()) {
        const Node& n = node(handle);
        throw ReferenceError(fmt::format("{} node '{}' produced no output '{}'", n.typeName(), n.id(), output));
    }
    return it->second;
}

void Graph::cleanGraph(NodeHandle handle) {
    Node& n = mutableNode(handle);
    if (n.clean_) return;
    n.cache_.clear();
    n.resolved_.clear();
    n.state_ = NodeState::Unevaluated;
    n.clean_ = true;
    for (const auto& socket : n.inputs_) {
        for (ConnectionHandle h : socket.connections()) cleanGraph(connections_[h]->source);
    }
}

std::vector<NodeHandle> Graph::roots() const {
    return roots(nodeHandles());
}

std::vector<NodeHandle> Graph::roots(const std::vector<NodeHandle>& among) const {
    std::vector<NodeHandle> out;
    for (NodeHandle h : among) {
        if (node(h).outboundConnectionCount() == 0) out.push_back(h);
    }
    return out;
}

NodeId generateNodeId() {
    static std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<std::uint64_t> dist;
    std::uint64_t hi = dist(rng);
    std::uint64_t lo = dist(rng);
    hi = (hi & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull; // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull; // RFC 4122 variant
    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", hi >> 32, (hi >> 16) & 0xFFFF, hi & 0xFFFF, lo >> 48,
                       lo & 0xFFFFFFFFFFFFull);
}

} // namespace NodeForge
