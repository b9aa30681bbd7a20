// NodeForge error taxonomy
//
// Every failure raised by the engine derives from GraphError so callers can
// catch the whole family at once. Messages always name the offending node
// id/type and socket where one is known.
#pragma once
#include <stdexcept>
#include <string>

namespace NodeForge {

class GraphError : public std::runtime_error {
public:
    explicit GraphError(const std::string& what) : std::runtime_error(what) {}
};

// Socket setup failed for a node type (bad schema, duplicate id, bad default)
class ConstructionError : public GraphError {
public:
    using GraphError::GraphError;
};

// A connection or lookup named a socket or node that does not exist
class ReferenceError : public GraphError {
public:
    using GraphError::GraphError;
};

// Deserialization asked for a type name nobody registered
class RegistryLookupError : public GraphError {
public:
    explicit RegistryLookupError(const std::string& typeName)
        : GraphError("Node type '" + typeName + "' is not registered"), typeName_(typeName) {}
    const std::string& typeName() const { return typeName_; }

private:
    std::string typeName_;
};

// Malformed or unsupported EncodedValue
class DecodeError : public GraphError {
public:
    using GraphError::GraphError;
};

// Thrown by expression builders to blame a specific parameter
class BuildError : public std::runtime_error {
public:
    BuildError(const std::string& parameter, const std::string& what)
        : std::runtime_error(what), parameter_(parameter) {}
    const std::string& parameter() const { return parameter_; }

private:
    std::string parameter_;
};

// Expression construction failed under evaluate(), attributed to a node
class EvaluationError : public GraphError {
public:
    EvaluationError(const std::string& nodeId, const std::string& typeName,
                    const std::string& parameter, const std::string& reason)
        : GraphError(format(nodeId, typeName, parameter, reason)),
          nodeId_(nodeId), typeName_(typeName), parameter_(parameter) {}

    const std::string& nodeId() const { return nodeId_; }
    const std::string& typeName() const { return typeName_; }
    const std::string& parameter() const { return parameter_; }

private:
    static std::string format(const std::string& nodeId, const std::string& typeName,
                              const std::string& parameter, const std::string& reason) {
        std::string s = "Evaluation of " + typeName + " node '" + nodeId + "' failed";
        if (!parameter.empty()) s += " at parameter '" + parameter + "'";
        return s + ": " + reason;
    }

    std::string nodeId_;
    std::string typeName_;
    std::string parameter_;
};

} // namespace NodeForge
