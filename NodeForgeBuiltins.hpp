// NodeForge builtin catalogue
//
// A small arithmetic node set used by the nodeforge tool and the tests:
//   Const(value) -> out          Add(a, b) -> out        Mul(a, b) -> out
//   Sum(terms...) -> out         Split(expr) -> value_1, value_2
// Numbers may arrive as 1-element tuples (the wire format stores scalars
// that way) and are unwrapped before arithmetic.
#pragma once
#include "NodeForgeRegistry.hpp"

namespace NodeForge {

void registerBuiltins(NodeTypeRegistry& registry);

// Arithmetic used by the builders: int op int stays int, mixed numbers give
// float, equal-length tuples combine element-wise, Add concatenates strings.
// Throws std::invalid_argument on incompatible operands and on int64 overflow.
Value addValues(const Value& a, const Value& b);
Value mulValues(const Value& a, const Value& b);

} // namespace NodeForge
