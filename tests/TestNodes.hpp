// Shared node types for the test suite
#pragma once
#include "NodeForgeBuiltins.hpp"
#include "NodeForgeRegistry.hpp"
#include <memory>
#include <stdexcept>

namespace NodeForgeTest {

using namespace NodeForge;

// Builder invocation counters, one per counting type
struct Counters {
    int constBuilds = 0;
    int addBuilds = 0;
};

// CountConst(value) -> out and CountAdd(a, b) -> out record every build
inline void registerCountingTypes(NodeTypeRegistry& registry, Counters& counters) {
    registry.registerType("CountConst", NodeSchema{{{"value", "any"}}, {"out"}},
                          [&counters](const BuildArgs& args) {
                              ++counters.constBuilds;
                              return OutputMap{{"out", args.at(0)}};
                          });
    registry.registerType("CountAdd", NodeSchema{{{"a", "float"}, {"b", "float"}}, {"out"}},
                          [&counters](const BuildArgs& args) {
                              ++counters.addBuilds;
                              return OutputMap{{"out", addValues(args.at(0), args.at(1))}};
                          });
}

// Boom() -> out always throws a plain exception
inline void registerFailingType(NodeTypeRegistry& registry) {
    registry.registerType("Boom", NodeSchema{{{"x", "float"}}, {"out"}},
                          [](const BuildArgs&) -> OutputMap { throw std::runtime_error("kaboom"); });
}

struct Fixture {
    Fixture() {
        registerBuiltins(registry);
        registerCountingTypes(registry, counters);
        registerFailingType(registry);
    }

    NodeHandle make(const std::string& type, const std::string& id) { return registry.create(graph, type, id); }

    Counters counters;
    NodeTypeRegistry registry;
    Graph graph;
};

} // namespace NodeForgeTest
