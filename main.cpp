// main.cpp
//
// nodeforge command line tool. Parses CLI (CLI11), loads a wire-format graph
// with the builtin node catalogue and then, as requested:
// - prints the inspect() dump of every root
// - evaluates every root and prints its named outputs
// - re-serializes the loaded graph to a file
#include "NodeForgeBuiltins.hpp"
#include "NodeForgeConfig.hpp"
#include "NodeForgeWire.hpp"
#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <fstream>
#include <nlohmann/json.hpp>

namespace {

// Looks next to the working directory first, then one and two levels up
nlohmann::json readGraphFile(const std::string& path) {
    for (const std::string prefix : {"", "../", "../../"}) {
        std::ifstream f(prefix + path);
        if (!f.good()) continue;
        try {
            nlohmann::json json;
            f >> json;
            return json;
        } catch (const nlohmann::json::parse_error& e) {
            throw NodeForge::DecodeError("Could not parse graph file " + prefix + path + ": " + e.what());
        }
    }
    throw NodeForge::ConstructionError("Could not find graph file: " + path);
}

} // namespace

int main(int argc, char** argv) {
    std::string graphPath;
    std::string configPath;
    std::string logLevel;
    std::string outPath;
    std::string wrapperName;
    std::string describe;
    bool doInspect = false;
    bool doEvaluate = false;
    bool listTypes = false;

    CLI::App app{"nodeforge"};
    try {
        app.add_option("--graph", graphPath, "Path to a wire-format graph JSON file");
        app.add_option("--config", configPath, "Path to a settings JSON file");
        app.add_option("--log-level", logLevel, "debug|info|warn|error|off (overrides the settings file)");
        app.add_flag("--inspect", doInspect, "Print the structure of every root");
        app.add_flag("--evaluate", doEvaluate, "Evaluate every root and print its outputs");
        app.add_option("--out", outPath, "Re-serialize the loaded graph to this file");
        app.add_option("--wrapper", wrapperName, "Wrap the re-serialized graph as { name: graph }");
        app.add_flag("--list-types", listTypes, "List the registered node types");
        app.add_option("--describe", describe, "Describe one registered node type");
        app.allow_extras(false);
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    try {
        NodeForge::Settings settings;
        if (!configPath.empty()) settings = NodeForge::loadSettingsFromJsonFile(configPath);
        if (!logLevel.empty()) settings.logLevel = NodeForge::logging::parseLevel(logLevel);
        NodeForge::applySettings(settings);

        NodeForge::NodeTypeRegistry registry;
        NodeForge::registerBuiltins(registry);

        if (listTypes) {
            for (const auto& name : registry.names()) fmt::print("{}\n", name);
        }
        if (!describe.empty()) {
            fmt::print("{}", NodeForge::describeType(*registry.lookup(describe)));
        }
        if (graphPath.empty()) {
            if (listTypes || !describe.empty()) return 0;
            fmt::print(stderr, "nothing to do: pass --graph (see --help)\n");
            return 2;
        }

        NodeForge::Graph graph;
        NodeForge::LoadReport report;
        auto roots = NodeForge::rootList(NodeForge::fromWire(graph, readGraphFile(graphPath), registry, settings, &report));
        fmt::print("loaded '{}': {} node(s), {} connection(s), {} root(s)\n", graphPath, graph.nodeCount(),
                   graph.connectionCount(), roots.size());
        for (const auto& skipped : report.skippedEdges) {
            fmt::print("  skipped connection #{}: {}\n", skipped.index, skipped.reason);
        }

        if (doInspect) {
            for (auto root : roots) fmt::print("{}", NodeForge::inspect(graph, root));
        }
        if (doEvaluate) {
            for (auto root : roots) {
                const auto& node = graph.node(root);
                for (const auto& kv : graph.evaluate(root)) {
                    fmt::print("{}:{}={}\n", node.id(), kv.first, kv.second.toString());
                }
            }
        }
        if (!outPath.empty()) {
            std::ofstream out(outPath);
            if (!out.is_open()) throw NodeForge::ConstructionError("Could not open output file: " + outPath);
            // every root goes into one record so the file loads back as is
            nlohmann::json record = NodeForge::toWire(graph, roots, settings);
            if (!wrapperName.empty()) record = nlohmann::json{{wrapperName, std::move(record)}};
            out << record.dump(settings.jsonIndent) << "\n";
            fmt::print("wrote {}\n", outPath);
        }
    } catch (const NodeForge::GraphError& e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    }
    return 0;
}
