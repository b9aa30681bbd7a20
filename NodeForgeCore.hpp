// NodeForge core types and graph arena
//
// This header defines the typed node/socket model (nodes, input and output
// sockets, connections) and the Graph arena that owns them. Nodes and
// connections are addressed by integer handles; sockets keep non-owning
// handles back to their node, so teardown order never matters. Evaluation is
// lazy and memoized: a node runs its expression builder at most once between
// two invalidations, however many downstream paths reach it.
#pragma once
#include "NodeForgeErrors.hpp"
#include "NodeForgeValue.hpp"
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace NodeForge {

using NodeId = std::string;
using NodeHandle = int;
using ConnectionHandle = int;
constexpr int InvalidHandle = -1;

using OutputMap = std::map<std::string, Value>;
using InputMap = std::map<std::string, Value>;

class Node;

// Arguments handed to an expression builder. positional() is the contiguous
// prefix of resolved inputs in schema order (a variadic collector contributes
// one entry per element); input() gives named access to the resolved table.
class BuildArgs {
public:
    BuildArgs(const Node& node, const std::vector<Value>& positional, const std::vector<std::string>& names)
        : node_(node), positional_(positional), names_(names) {}

    const Node& node() const { return node_; }
    const std::vector<Value>& positional() const { return positional_; }
    std::size_t size() const { return positional_.size(); }
    // Throws BuildError naming the missing parameter
    const Value& at(std::size_t index) const;
    // Name of the parameter at a positional index ("terms[2]" for collectors)
    std::string nameAt(std::size_t index) const;
    // Resolved input by socket name; none when unset
    const Value& input(const std::string& name) const;

private:
    const Node& node_;
    const std::vector<Value>& positional_;
    const std::vector<std::string>& names_;
};

using ExpressionBuilder = std::function<OutputMap(const BuildArgs&)>;

struct InputSpec {
    std::string name;
    std::string typeHint = "float";
    Value defaultValue;
    bool variadic = false; // collector socket accepting fan-in
};

struct NodeSchema {
    std::vector<InputSpec> inputs;
    std::vector<std::string> outputs;
};

struct NodeType {
    std::string name;
    NodeSchema schema;
    ExpressionBuilder builder;
    std::string description;
};

using NodeTypePtr = std::shared_ptr<const NodeType>;

// Validates the schema (unique socket names, at least one output, at most
// one collector, a builder) and throws ConstructionError otherwise
NodeTypePtr makeNodeType(std::string name, NodeSchema schema, ExpressionBuilder builder, std::string description = {});

struct Connection {
    NodeHandle source = InvalidHandle;
    std::string sourceOutput;
    NodeHandle target = InvalidHandle;
    std::string targetInput;
};

class InputSocket {
public:
    using Connections = std::vector<ConnectionHandle>;

    InputSocket(std::string name, NodeHandle owner, bool variadic, Value initial)
        : name_(std::move(name)), owner_(owner), variadic_(variadic), state_(std::move(initial)) {}

    const std::string& name() const { return name_; }
    NodeHandle owner() const { return owner_; }
    bool variadic() const { return variadic_; }
    bool hasConnections() const { return std::holds_alternative<Connections>(state_); }
    // Direct value; none when unset or when fed by connections
    const Value& value() const;
    // Feeding connections in connect order; empty when holding a value
    const Connections& connections() const;

private:
    friend class Graph;
    std::string name_;
    NodeHandle owner_;
    bool variadic_;
    std::variant<Value, Connections> state_;
};

class OutputSocket {
public:
    OutputSocket(std::string name, NodeHandle owner) : name_(std::move(name)), owner_(owner) {}

    const std::string& name() const { return name_; }
    NodeHandle owner() const { return owner_; }
    const std::vector<ConnectionHandle>& connections() const { return connections_; }

private:
    friend class Graph;
    std::string name_;
    NodeHandle owner_;
    std::vector<ConnectionHandle> connections_;
};

enum class NodeState { Unevaluated, Evaluated };

class Node {
public:
    Node(NodeId id, NodeHandle handle, NodeTypePtr type);

    const NodeId& id() const { return id_; }
    NodeHandle handle() const { return handle_; }
    const NodeType& type() const { return *type_; }
    const std::string& typeName() const { return type_->name; }

    const std::vector<InputSocket>& inputs() const { return inputs_; }
    const std::vector<OutputSocket>& outputs() const { return outputs_; }
    bool hasInput(const std::string& name) const;
    bool hasOutput(const std::string& name) const;
    // Throw ReferenceError for unknown names
    const InputSocket& input(const std::string& name) const;
    const OutputSocket& output(const std::string& name) const;

    NodeState state() const { return state_; }
    bool isEvaluated() const { return state_ == NodeState::Evaluated; }
    bool isClean() const { return clean_; }
    const OutputMap& cachedOutputs() const { return cache_; }
    const InputMap& resolvedInputs() const { return resolved_; }

    // Fan-out of one output socket / of all of them
    std::size_t socketRequestCount(const std::string& output) const;
    std::size_t outboundConnectionCount() const;

private:
    friend class Graph;
    InputSocket* findInput(const std::string& name);
    OutputSocket* findOutput(const std::string& name);

    NodeId id_;
    NodeHandle handle_;
    NodeTypePtr type_;
    std::vector<InputSocket> inputs_;
    std::vector<OutputSocket> outputs_;
    InputMap resolved_;
    OutputMap cache_;
    NodeState state_ = NodeState::Unevaluated;
    bool clean_ = true;
    bool evaluating_ = false;
};

// Graph owns the nodes and connections of a working set. It is an arena, not
// a topology: any node can act as a root and structure is read back through
// socket connections.
class Graph {
public:
    Graph() = default;
    Graph(const Graph&) = delete;
    Graph& operator=(const Graph&) = delete;
    Graph(Graph&&) = default;
    Graph& operator=(Graph&&) = default;

    // Creates a node with sockets and defaults from the type schema. An empty
    // id gets a fresh random UUID; a duplicate id throws ConstructionError.
    NodeHandle addNode(const NodeTypePtr& type, const NodeId& id = NodeId());
    // Refused with GraphError while any connection is still attached
    void removeNode(NodeHandle handle);

    bool contains(NodeHandle handle) const;
    const Node& node(NodeHandle handle) const;
    NodeHandle findNode(const NodeId& id) const;
    std::vector<NodeHandle> nodeHandles() const;
    std::size_t nodeCount() const { return idIndex_.size(); }

    // Replaces any feeding connections with a direct value
    void setValue(NodeHandle handle, const std::string& input, Value value);
    // Validates both sockets before registering anything (ReferenceError)
    ConnectionHandle connect(NodeHandle source, const std::string& output, NodeHandle target, const std::string& input);
    void disconnect(ConnectionHandle handle);
    // Removes every connection attached to the node
    void disconnectAll(NodeHandle handle);
    bool hasConnection(ConnectionHandle handle) const;
    const Connection& connection(ConnectionHandle handle) const;
    std::size_t connectionCount() const;

    // Memoized evaluation; returns the cached named outputs
    const OutputMap& evaluate(NodeHandle handle);
    // evaluate() and pick one output (ReferenceError if it was not produced)
    const Value& evaluateOutput(NodeHandle handle, const std::string& output);
    // Clears this node and everything upstream of it that is not clean yet
    void cleanGraph(NodeHandle handle);

    // Nodes without any outbound connection
    std::vector<NodeHandle> roots() const;
    std::vector<NodeHandle> roots(const std::vector<NodeHandle>& among) const;

private:
    Node& mutableNode(NodeHandle handle);
    Value resolve(const InputSocket& socket);
    void gatherArguments(const Node& node, std::vector<Value>& positional, std::vector<std::string>& names) const;

    std::vector<std::unique_ptr<Node>> nodes_;
    std::vector<std::optional<Connection>> connections_;
    std::unordered_map<NodeId, NodeHandle> idIndex_;
};

// Random RFC 4122 version 4 identifier
NodeId generateNodeId();

} // namespace NodeForge
