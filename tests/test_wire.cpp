// nodeforge tests

#include <catch2/catch.hpp>

#include "NodeForgeCodec.hpp"
#include "NodeForgeWire.hpp"
#include "TestNodes.hpp"

#include <string>
#include <utility>
#include <vector>

using namespace NodeForgeTest;

namespace {

// Collects log lines for the lifetime of the object
struct LogCapture {
    LogCapture() {
        previous = logging::level();
        logging::setLevel(LogLevel::Warn);
        logging::setSink([this](LogLevel l, const std::string& message) { lines.emplace_back(l, message); });
    }
    ~LogCapture() {
        logging::setSink(logging::Sink());
        logging::setLevel(previous);
    }

    LogLevel previous;
    std::vector<std::pair<LogLevel, std::string>> lines;
};

NodeHandle buildSum(Fixture& f) {
    auto two = f.make("Const", "two");
    auto three = f.make("Const", "three");
    auto sum = f.make("Add", "sum");
    f.graph.setValue(two, "value", Value(2));
    f.graph.setValue(three, "value", Value(3));
    f.graph.connect(two, "out", sum, "a");
    f.graph.connect(three, "out", sum, "b");
    return sum;
}

const nlohmann::json* findNodeRecord(const nlohmann::json& wire, const std::string& id) {
    for (const auto& n : wire["nodes"]) {
        if (n["id"] == id) return &n;
    }
    return nullptr;
}

} // namespace

TEST_CASE("A serialized graph evaluates to the same result", "[wire]")
{
    Fixture f;
    auto sum = buildSum(f);
    CHECK(f.graph.evaluateOutput(sum, "out") == Value(5));

    const std::string text = toWireString(f.graph, sum);

    Graph restored;
    auto roots = fromWireString(restored, text, f.registry);
    REQUIRE(std::holds_alternative<NodeHandle>(roots));
    const NodeHandle root = std::get<NodeHandle>(roots);
    CHECK(restored.node(root).id() == "sum");
    CHECK(restored.nodeCount() == 3);
    CHECK(restored.connectionCount() == 2);
    CHECK(restored.evaluateOutput(root, "out") == Value(5));
}

TEST_CASE("Wire records follow the flat node and edge layout", "[wire]")
{
    Fixture f;
    auto sum = buildSum(f);
    const auto wire = toWire(f.graph, sum);

    REQUIRE(wire["nodes"].size() == 3);
    REQUIRE(wire["connections"].size() == 2);
    // the root comes first, then its inputs depth first
    CHECK(wire["nodes"][0]["id"] == "sum");
    CHECK(wire["nodes"][0]["name"] == "Add");
    CHECK(wire["nodes"][0]["data"] == nlohmann::json::object());
    CHECK(wire["nodes"][1]["id"] == "two");
    CHECK(wire["nodes"][2]["id"] == "three");

    const auto* two = findNodeRecord(wire, "two");
    REQUIRE(two != nullptr);
    CHECK((*two)["data"]["value"] == nlohmann::json({{"type", "tuple"}, {"data", {2}}}));

    CHECK(wire["connections"][0] == nlohmann::json({{"source", "two"}, {"sourceOutput", "out"},
                                                    {"target", "sum"}, {"targetInput", "a"}}));
    CHECK(wire["connections"][1]["source"] == "three");
    CHECK(wire["connections"][1]["targetInput"] == "b");
}

TEST_CASE("Shared upstream nodes are written once", "[wire]")
{
    Fixture f;
    auto a = f.make("CountConst", "A");
    auto b = f.make("CountAdd", "B");
    auto c = f.make("CountAdd", "C");
    auto d = f.make("CountAdd", "D");
    f.graph.setValue(a, "value", Value(2));
    f.graph.connect(a, "out", b, "a");
    f.graph.setValue(b, "b", Value(1));
    f.graph.connect(a, "out", c, "a");
    f.graph.setValue(c, "b", Value(10));
    f.graph.connect(b, "out", d, "a");
    f.graph.connect(c, "out", d, "b");

    const auto wire = toWire(f.graph, d);
    CHECK(wire["nodes"].size() == 4);
    CHECK(wire["connections"].size() == 4);

    Fixture g;
    auto root = std::get<NodeHandle>(fromWire(g.graph, wire, g.registry));
    CHECK(g.graph.evaluateOutput(root, "out") == Value(15));
    CHECK(g.counters.constBuilds == 1);
    CHECK(g.counters.addBuilds == 3);
}

TEST_CASE("Deserialization restores ids, types, values and edges", "[wire]")
{
    Fixture f;
    auto mul = f.make("Mul", "scale");
    auto name = f.make("Const", "label");
    auto flag = f.make("Const", "flag");
    auto pair = f.make("Split", "pair");
    f.graph.setValue(mul, "b", Value(2.5));
    f.graph.setValue(name, "value", Value("hello"));
    f.graph.setValue(flag, "value", Value(false));
    f.graph.setValue(pair, "expr", Value(Tuple{Value(4), Value("x")}));
    f.graph.connect(pair, "value_1", mul, "a");

    const auto wire = toWire(f.graph, mul);
    Graph restored;
    LoadReport report;
    fromWire(restored, wire, f.registry, Settings(), &report);
    CHECK(report.nodes.size() == 2);
    CHECK(report.skippedEdges.empty());
    CHECK(report.valueFallbacks.empty());

    const Node& m = restored.node(restored.findNode("scale"));
    CHECK(m.typeName() == "Mul");
    CHECK(m.input("b").value() == Value(Tuple{Value(2.5)}));
    REQUIRE(m.input("a").connections().size() == 1);
    const Connection& c = restored.connection(m.input("a").connections()[0]);
    CHECK(restored.node(c.source).id() == "pair");
    CHECK(c.sourceOutput == "value_1");

    const Node& p = restored.node(restored.findNode("pair"));
    CHECK(p.input("expr").value() == Value(Tuple{Value(4), Value("x")}));
    CHECK(restored.evaluateOutput(m.handle(), "out") == Value(10.0));

    // unreachable nodes stay behind
    CHECK(restored.findNode("label") == InvalidHandle);

    Graph strings;
    fromWire(strings, toWire(f.graph, name), f.registry);
    CHECK(strings.node(strings.findNode("label")).input("value").value() == Value("hello"));
    Graph flags;
    fromWire(flags, toWire(f.graph, flag), f.registry);
    CHECK(flags.node(flags.findNode("flag")).input("value").value() == Value(false));
}

TEST_CASE("Binary buffers travel through the graph", "[wire]")
{
    Fixture f;
    auto c = f.make("Const", "weights");
    Buffer b = Buffer::of(BufferKind::Tensor, {2, 2}, std::vector<float>{0.5f, -1.0f, 2.0f, 1.0e-3f});
    f.graph.setValue(c, "value", Value(b));

    Graph restored;
    auto root = std::get<NodeHandle>(fromWireString(restored, toWireString(f.graph, c), f.registry));
    const Value& out = restored.evaluateOutput(root, "out");
    REQUIRE(out.is<Buffer>());
    CHECK(out.as<Buffer>().bytes == b.bytes);
    CHECK(out.as<Buffer>().device == "cpu");
    CHECK(out == Value(b));
}

TEST_CASE("Several sinks come back as a list", "[wire]")
{
    Fixture f;
    const std::string text = R"({
        "nodes": [
            {"id": "src", "name": "Const", "data": {"value": {"type": "tuple", "data": [1]}}},
            {"id": "left", "name": "Add", "data": {"b": {"type": "tuple", "data": [10]}}},
            {"id": "right", "name": "Add", "data": {"b": {"type": "tuple", "data": [20]}}}
        ],
        "connections": [
            {"source": "src", "sourceOutput": "out", "target": "left", "targetInput": "a"},
            {"source": "src", "sourceOutput": "out", "target": "right", "targetInput": "a"}
        ]
    })";
    auto roots = fromWireString(f.graph, text, f.registry);
    REQUIRE(std::holds_alternative<std::vector<NodeHandle>>(roots));
    auto list = rootList(roots);
    REQUIRE(list.size() == 2);
    CHECK(f.graph.node(list[0]).id() == "left");
    CHECK(f.graph.node(list[1]).id() == "right");
    CHECK(f.graph.evaluateOutput(list[0], "out") == Value(11));
    CHECK(f.graph.evaluateOutput(list[1], "out") == Value(21));
}

TEST_CASE("Several roots share one record", "[wire]")
{
    Fixture f;
    auto src = f.make("Const", "src");
    auto left = f.make("Add", "left");
    auto right = f.make("Add", "right");
    f.graph.setValue(src, "value", Value(1));
    f.graph.setValue(left, "b", Value(10));
    f.graph.setValue(right, "b", Value(20));
    f.graph.connect(src, "out", left, "a");
    f.graph.connect(src, "out", right, "a");

    nlohmann::json wire = toWire(f.graph, std::vector<NodeHandle>{left, right});
    CHECK(wire["nodes"].size() == 3);
    CHECK(wire["connections"].size() == 2);
    CHECK(findNodeRecord(wire, "src") != nullptr);

    Graph restored;
    auto list = rootList(fromWire(restored, wire, f.registry));
    REQUIRE(list.size() == 2);
    CHECK(restored.evaluateOutput(restored.findNode("left"), "out") == Value(11));
    CHECK(restored.evaluateOutput(restored.findNode("right"), "out") == Value(21));

    // a single root is the same record restricted to its upstream
    CHECK(toWire(f.graph, left)["nodes"].size() == 2);
}

TEST_CASE("Bad edges are skipped and reported", "[wire]")
{
    Fixture f;
    nlohmann::json record = {
        {"nodes", {
            {{"id", "a"}, {"name", "Const"}, {"data", {{"value", {{"type", "tuple"}, {"data", {1}}}}}}},
            {{"id", "b"}, {"name", "Add"}, {"data", {{"b", {{"type", "tuple"}, {"data", {2}}}}}}},
        }},
        {"connections", {
            {{"source", "ghost"}, {"sourceOutput", "out"}, {"target", "b"}, {"targetInput", "a"}},
            {{"source", "a"}, {"sourceOutput", "nope"}, {"target", "b"}, {"targetInput", "a"}},
            {{"source", "a"}, {"sourceOutput", "out"}, {"target", "b"}, {"targetInput", "a"}},
        }},
    };

    SECTION("by default")
    {
        LogCapture log;
        LoadReport report;
        auto root = std::get<NodeHandle>(fromWire(f.graph, record, f.registry, Settings(), &report));
        CHECK(f.graph.node(root).id() == "b");
        REQUIRE(report.skippedEdges.size() == 2);
        CHECK(report.skippedEdges[0].index == 0);
        CHECK(report.skippedEdges[0].source == "ghost");
        CHECK(report.skippedEdges[0].reason.find("ghost") != std::string::npos);
        CHECK(report.skippedEdges[1].index == 1);
        CHECK(report.skippedEdges[1].sourceOutput == "nope");
        CHECK(f.graph.connectionCount() == 1);
        CHECK(f.graph.evaluateOutput(root, "out") == Value(3));
        CHECK(log.lines.size() == 2);
        CHECK(log.lines[0].first == LogLevel::Warn);
    }

    SECTION("with strict edges the load is undone")
    {
        Settings strict;
        strict.strictEdges = true;
        auto keep = f.make("Const", "existing");
        CHECK_THROWS_AS(fromWire(f.graph, record, f.registry, strict), ReferenceError);
        CHECK(f.graph.nodeCount() == 1);
        CHECK(f.graph.contains(keep));
        CHECK(f.graph.findNode("a") == InvalidHandle);
        CHECK(f.graph.connectionCount() == 0);
    }
}

TEST_CASE("Node failures abort the whole load", "[wire]")
{
    Fixture f;
    LogCapture log;
    auto keep = f.make("Const", "existing");

    SECTION("unregistered type")
    {
        nlohmann::json record = {
            {"nodes", {
                {{"id", "a"}, {"name", "Const"}, {"data", nlohmann::json::object()}},
                {{"id", "b"}, {"name", "Sphere3D"}, {"data", nlohmann::json::object()}},
            }},
            {"connections", nlohmann::json::array()},
        };
        try {
            fromWire(f.graph, record, f.registry);
            FAIL("expected RegistryLookupError");
        } catch (const RegistryLookupError& e) {
            CHECK(e.typeName() == "Sphere3D");
        }
    }

    SECTION("duplicate id")
    {
        nlohmann::json record = {
            {"nodes", {
                {{"id", "a"}, {"name", "Const"}},
                {{"id", "existing"}, {"name", "Const"}},
            }},
        };
        CHECK_THROWS_AS(fromWire(f.graph, record, f.registry), ConstructionError);
    }

    SECTION("undecodable value")
    {
        nlohmann::json record = {
            {"nodes", {
                {{"id", "a"}, {"name", "Const"}, {"data", {{"value", {{"type", "quaternion"}, {"data", 1}}}}}},
            }},
        };
        CHECK_THROWS_AS(fromWire(f.graph, record, f.registry), DecodeError);
    }

    SECTION("unknown data socket")
    {
        nlohmann::json record = {
            {"nodes", {
                {{"id", "a"}, {"name", "Const"}, {"data", {{"radius", {{"type", "none"}, {"data", nullptr}}}}}},
            }},
        };
        CHECK_THROWS_AS(fromWire(f.graph, record, f.registry), ConstructionError);
    }

    CHECK(f.graph.nodeCount() == 1);
    CHECK(f.graph.contains(keep));
    CHECK(f.graph.findNode("a") == InvalidHandle);
    REQUIRE_FALSE(log.lines.empty());
    CHECK(log.lines.back().first == LogLevel::Error);
}

TEST_CASE("Raw values fall back to plain JSON", "[wire]")
{
    Fixture f;
    LogCapture log;
    nlohmann::json record = {
        {"nodes", {
            {{"id", "list"}, {"name", "Const"}, {"data", {{"value", {1, 2.5, "x"}}}}},
            {{"id", "num"}, {"name", "Const"}, {"data", {{"value", 7}}}},
        }},
    };
    LoadReport report;
    auto roots = rootList(fromWire(f.graph, record, f.registry, Settings(), &report));
    CHECK(roots.size() == 2);
    CHECK(report.valueFallbacks == std::vector<std::string>{"list.value", "num.value"});
    CHECK(f.graph.evaluateOutput(f.graph.findNode("list"), "out") == Value(Tuple{Value(1), Value(2.5), Value("x")}));
    CHECK(f.graph.evaluateOutput(f.graph.findNode("num"), "out") == Value(7));
    CHECK(log.lines.size() == 2);
}

TEST_CASE("Wrapped graph records", "[wire]")
{
    Fixture f;
    auto sum = buildSum(f);
    const std::string text = toWireString(f.graph, sum, "scene");
    const auto parsed = nlohmann::json::parse(text);
    REQUIRE(parsed.contains("scene"));
    CHECK(parsed["scene"]["nodes"].size() == 3);

    Graph restored;
    auto root = std::get<NodeHandle>(fromWireString(restored, text, f.registry));
    CHECK(restored.evaluateOutput(root, "out") == Value(5));
}

TEST_CASE("Malformed graph records", "[wire]")
{
    Fixture f;
    CHECK_THROWS_AS(fromWireString(f.graph, "{not json", f.registry), DecodeError);
    CHECK_THROWS_AS(fromWire(f.graph, nlohmann::json::array(), f.registry), DecodeError);
    CHECK_THROWS_AS(fromWire(f.graph, nlohmann::json{{"connections", nlohmann::json::array()}}, f.registry), DecodeError);
    CHECK_THROWS_AS(fromWire(f.graph, nlohmann::json{{"nodes", nlohmann::json::array()}, {"connections", 3}}, f.registry),
                    DecodeError);
    CHECK(f.graph.nodeCount() == 0);
}

TEST_CASE("inspect prints the structure upstream of a node", "[wire][inspect]")
{
    Fixture f;
    auto sum = buildSum(f);
    auto lone = f.make("Mul", "lone");
    f.graph.connect(sum, "out", lone, "b");

    CHECK(inspect(f.graph, sum) ==
          "Node: sum (Add)\n"
          "  Input [a] connected to Node two:out\n"
          "    Node: two (Const)\n"
          "      Input [value] has value: 2\n"
          "  Input [b] connected to Node three:out\n"
          "    Node: three (Const)\n"
          "      Input [value] has value: 3\n");

    f.graph.evaluate(sum);
    const std::string dump = inspect(f.graph, lone);
    CHECK(dump.find("Node: lone (Mul)\n  Input [a] is unconnected\n") == 0);
    CHECK(dump.find("Node: sum (Add) [evaluated]") != std::string::npos);
}

TEST_CASE("inspect prints shared nodes once", "[wire][inspect]")
{
    Fixture f;
    auto a = f.make("Const", "A");
    auto b = f.make("Add", "B");
    f.graph.setValue(a, "value", Value("x"));
    f.graph.connect(a, "out", b, "a");
    f.graph.connect(a, "out", b, "b");

    const std::string dump = inspect(f.graph, b);
    CHECK(dump ==
          "Node: B (Add)\n"
          "  Input [a] connected to Node A:out\n"
          "    Node: A (Const)\n"
          "      Input [value] has value: 'x'\n"
          "  Input [b] connected to Node A:out\n");
    CHECK(f.graph.evaluateOutput(b, "out") == Value("xx"));
}
