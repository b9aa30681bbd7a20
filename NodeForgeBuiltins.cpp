// NodeForgeBuiltins.cpp
#include "NodeForgeBuiltins.hpp"
#include <fmt/core.h>
#include <stdexcept>

namespace NodeForge {

namespace {

// (2,) -> 2 so scalars survive a trip through the wire format
const Value& unwrapScalar(const Value& v) {
    if (v.is<Tuple>() && v.as<Tuple>().size() == 1 && v.as<Tuple>()[0].isNumber()) return v.as<Tuple>()[0];
    return v;
}

template <typename IntOp, typename FloatOp>
Value combine(const Value& lhs, const Value& rhs, const char* opName, IntOp intOp, FloatOp floatOp) {
    const Value& a = unwrapScalar(lhs);
    const Value& b = unwrapScalar(rhs);
    if (a.is<std::int64_t>() && b.is<std::int64_t>()) return Value(intOp(a.as<std::int64_t>(), b.as<std::int64_t>()));
    if (a.isNumber() && b.isNumber()) return Value(floatOp(a.toDouble(), b.toDouble()));
    if (a.is<Tuple>() && b.is<Tuple>() && a.as<Tuple>().size() == b.as<Tuple>().size()) {
        Tuple out;
        const Tuple& ta = a.as<Tuple>();
        const Tuple& tb = b.as<Tuple>();
        for (std::size_t i = 0; i < ta.size(); ++i) out.push_back(combine(ta[i], tb[i], opName, intOp, floatOp));
        return Value(std::move(out));
    }
    throw std::invalid_argument(fmt::format("cannot {} {} and {}", opName, a.toString(), b.toString()));
}

// Runs an arithmetic step and blames the given parameter on failure
template <typename Fn>
Value blame(const std::string& parameter, Fn fn) {
    try {
        return fn();
    } catch (const std::invalid_argument& e) {
        throw BuildError(parameter, e.what());
    }
}

OutputMap buildConst(const BuildArgs& args) {
    return {{"out", args.at(0)}};
}

OutputMap buildAdd(const BuildArgs& args) {
    const Value& a = args.at(0);
    const Value& b = args.at(1);
    return {{"out", blame(args.nameAt(1), [&] { return addValues(a, b); })}};
}

OutputMap buildMul(const BuildArgs& args) {
    const Value& a = args.at(0);
    const Value& b = args.at(1);
    return {{"out", blame(args.nameAt(1), [&] { return mulValues(a, b); })}};
}

OutputMap buildSum(const BuildArgs& args) {
    Value total(0);
    for (std::size_t i = 0; i < args.size(); ++i) {
        total = blame(args.nameAt(i), [&] { return addValues(total, args.at(i)); });
    }
    return {{"out", total}};
}

OutputMap buildSplit(const BuildArgs& args) {
    const Value& expr = args.at(0);
    if (!expr.is<Tuple>()) throw BuildError(args.nameAt(0), "expected a tuple, got " + expr.toString());
    const Tuple& t = expr.as<Tuple>();
    if (t.empty()) throw BuildError(args.nameAt(0), "cannot split an empty tuple");
    OutputMap out;
    out["value_1"] = t[0];
    if (t.size() > 1) out["value_2"] = t[1];
    return out;
}

} // namespace

Value addValues(const Value& lhs, const Value& rhs) {
    const Value& a = unwrapScalar(lhs);
    const Value& b = unwrapScalar(rhs);
    if (a.is<std::string>() && b.is<std::string>()) return Value(a.as<std::string>() + b.as<std::string>());
    return combine(a, b, "add",
                   [](std::int64_t x, std::int64_t y) {
                       std::int64_t r;
                       if (__builtin_add_overflow(x, y, &r)) throw std::invalid_argument(fmt::format("{} + {} overflows int64", x, y));
                       return r;
                   },
                   [](double x, double y) { return x + y; });
}

Value mulValues(const Value& a, const Value& b) {
    return combine(a, b, "multiply",
                   [](std::int64_t x, std::int64_t y) {
                       std::int64_t r;
                       if (__builtin_mul_overflow(x, y, &r)) throw std::invalid_argument(fmt::format("{} * {} overflows int64", x, y));
                       return r;
                   },
                   [](double x, double y) { return x * y; });
}

void registerBuiltins(NodeTypeRegistry& registry) {
    registry.registerType("Const", NodeSchema{{{"value", "any"}}, {"out"}}, buildConst, "Passes its literal value through");
    registry.registerType("Add", NodeSchema{{{"a", "float"}, {"b", "float"}}, {"out"}}, buildAdd, "a + b");
    registry.registerType("Mul", NodeSchema{{{"a", "float"}, {"b", "float", Value(1)}}, {"out"}}, buildMul, "a * b");
    registry.registerType("Sum", NodeSchema{{{"terms", "float", Value(), true}}, {"out"}}, buildSum,
                          "Sum of every connected term, stopping at the first missing one");
    registry.registerType("Split", NodeSchema{{{"expr", "tuple"}}, {"value_1", "value_2"}}, buildSplit,
                          "First two elements of a tuple");
}

} // namespace NodeForge
