// NodeForgeValue.cpp
//
// Value helpers: equality, rendering, numeric views and the dtype table
// shared by the codec and the builtin catalogue.
#include "NodeForgeValue.hpp"
#include "NodeForgeErrors.hpp"
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <cstdint>
#include <stdexcept>
#include <unordered_map>

namespace NodeForge {

namespace {

const std::unordered_map<std::string, std::size_t>& dtypeTable() {
    static const std::unordered_map<std::string, std::size_t> table = {
        {"bool", 1},    {"int8", 1},    {"uint8", 1},
        {"int16", 2},   {"uint16", 2},  {"float16", 2},
        {"int32", 4},   {"uint32", 4},  {"float32", 4},
        {"int64", 8},   {"uint64", 8},  {"float64", 8},
    };
    return table;
}

std::string stripDtypePrefix(const std::string& dtype) {
    static const std::string torchPrefix = "torch.";
    if (dtype.compare(0, torchPrefix.size(), torchPrefix) == 0) return dtype.substr(torchPrefix.size());
    return dtype;
}

} // namespace

std::size_t Buffer::elementCount() const {
    std::size_t n = 1;
    for (auto dim : shape) {
        const std::size_t d = static_cast<std::size_t>(dim < 0 ? 0 : dim);
        if (d != 0 && n > SIZE_MAX / d) {
            throw std::overflow_error(fmt::format("shape [{}] overflows the element count", fmt::join(shape, ", ")));
        }
        n *= d;
    }
    return n;
}

std::size_t Buffer::byteSize() const {
    const std::size_t n = elementCount();
    const std::size_t itemSize = dtypeSize(dtype);
    if (itemSize != 0 && n > SIZE_MAX / itemSize) {
        throw std::overflow_error(fmt::format("shape [{}] of {} overflows the byte size", fmt::join(shape, ", "), dtype));
    }
    return n * itemSize;
}

bool operator==(const Buffer& a, const Buffer& b) {
    return a.kind == b.kind && a.shape == b.shape
        && canonicalDtype(a.dtype) == canonicalDtype(b.dtype) && a.bytes == b.bytes;
}

const char* valueKindName(ValueKind kind) {
    switch (kind) {
    case ValueKind::None: return "none";
    case ValueKind::Bool: return "bool";
    case ValueKind::Int: return "int";
    case ValueKind::Float: return "float";
    case ValueKind::String: return "string";
    case ValueKind::Tuple: return "tuple";
    case ValueKind::Buffer: return "buffer";
    case ValueKind::Opaque: return "other";
    }
    return "unknown";
}

bool operator==(const Value& a, const Value& b) {
    return a.data == b.data;
}

double Value::toDouble() const {
    switch (kind()) {
    case ValueKind::Int: return static_cast<double>(std::get<std::int64_t>(data));
    case ValueKind::Float: return std::get<double>(data);
    case ValueKind::Bool: return std::get<bool>(data) ? 1.0 : 0.0;
    case ValueKind::Tuple: {
        const auto& t = std::get<Tuple>(data);
        if (t.size() == 1 && t[0].isNumber()) return t[0].toDouble();
        break;
    }
    default: break;
    }
    throw std::invalid_argument(fmt::format("{} value {} is not numeric", valueKindName(kind()), toString()));
}

std::string Value::toString() const {
    switch (kind()) {
    case ValueKind::None: return "None";
    case ValueKind::Bool: return std::get<bool>(data) ? "true" : "false";
    case ValueKind::Int: return fmt::format("{}", std::get<std::int64_t>(data));
    case ValueKind::Float: return fmt::format("{}", std::get<double>(data));
    case ValueKind::String: return "'" + std::get<std::string>(data) + "'";
    case ValueKind::Tuple: {
        const auto& t = std::get<Tuple>(data);
        std::string s = "(";
        for (std::size_t i = 0; i < t.size(); ++i) {
            if (i) s += ", ";
            s += t[i].toString();
        }
        if (t.size() == 1) s += ",";
        return s + ")";
    }
    case ValueKind::Buffer: {
        const auto& b = std::get<Buffer>(data);
        return fmt::format("<{} {} [{}]{}>", b.kind == BufferKind::Tensor ? "tensor" : "array", b.dtype,
                           fmt::join(b.shape, ", "), b.device.empty() ? "" : " on " + b.device);
    }
    case ValueKind::Opaque: return std::get<Opaque>(data).text;
    }
    return {};
}

std::size_t dtypeSize(const std::string& dtype) {
    auto it = dtypeTable().find(stripDtypePrefix(dtype));
    return it == dtypeTable().end() ? 0 : it->second;
}

std::string canonicalDtype(const std::string& dtype) {
    std::string bare = stripDtypePrefix(dtype);
    return dtypeTable().count(bare) ? bare : std::string();
}

} // namespace NodeForge
