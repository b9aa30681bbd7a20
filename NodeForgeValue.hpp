// NodeForge values
//
// Value is the closed sum type carried by sockets: literal parameters set on
// input sockets and the named outputs produced by expression builders. The
// Opaque alternative is the explicit fallback for anything that only has a
// string rendering.
#pragma once
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <variant>
#include <vector>

namespace NodeForge {

struct Value;
using Tuple = std::vector<Value>;

enum class BufferKind { Tensor, Array };

// Raw little-endian element bytes plus the metadata needed to rebuild them
struct Buffer {
    BufferKind kind = BufferKind::Array;
    std::vector<std::int64_t> shape;
    std::string dtype = "float32";
    std::string device; // tensors only, informational
    std::vector<std::uint8_t> bytes;

    // Product of the shape (1 for a 0-d buffer). Both throw
    // std::overflow_error when the result does not fit in size_t.
    std::size_t elementCount() const;
    // elementCount() times the dtype size
    std::size_t byteSize() const;

    template <typename T>
    static Buffer of(BufferKind kind, std::vector<std::int64_t> shape, const std::vector<T>& elements);
};

// Device tag is informational and does not take part in equality
bool operator==(const Buffer& a, const Buffer& b);
inline bool operator!=(const Buffer& a, const Buffer& b) { return !(a == b); }

struct Opaque {
    std::string text;
};

inline bool operator==(const Opaque& a, const Opaque& b) { return a.text == b.text; }
inline bool operator!=(const Opaque& a, const Opaque& b) { return !(a == b); }

enum class ValueKind { None, Bool, Int, Float, String, Tuple, Buffer, Opaque };

const char* valueKindName(ValueKind kind);

struct Value {
    using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::string, Tuple, Buffer, Opaque>;

    Value() = default;
    Value(bool b) : data(b) {}
    Value(int i) : data(static_cast<std::int64_t>(i)) {}
    Value(std::int64_t i) : data(i) {}
    Value(double d) : data(d) {}
    Value(const char* s) : data(std::string(s)) {}
    Value(std::string s) : data(std::move(s)) {}
    Value(Tuple t) : data(std::move(t)) {}
    Value(Buffer b) : data(std::move(b)) {}
    Value(Opaque o) : data(std::move(o)) {}

    ValueKind kind() const { return static_cast<ValueKind>(data.index()); }
    bool isNone() const { return std::holds_alternative<std::monostate>(data); }
    bool isNumber() const { return kind() == ValueKind::Int || kind() == ValueKind::Float; }

    template <typename T>
    bool is() const { return std::holds_alternative<T>(data); }
    template <typename T>
    const T& as() const { return std::get<T>(data); }

    // Numeric view of int, float and 1-element numeric tuples; throws otherwise
    double toDouble() const;

    // Human readable rendering used by inspect() and the opaque fallback
    std::string toString() const;

    Storage data;
};

bool operator==(const Value& a, const Value& b);
inline bool operator!=(const Value& a, const Value& b) { return !(a == b); }

// Element size in bytes for a dtype name, 0 when unknown. Accepts the
// "torch.float32" spelling as well as the bare one.
std::size_t dtypeSize(const std::string& dtype);
// Canonical dtype spelling ("torch.int64" -> "int64"), empty when unknown
std::string canonicalDtype(const std::string& dtype);

template <typename T> struct DtypeName;
template <> struct DtypeName<bool> { static constexpr const char* value = "bool"; };
template <> struct DtypeName<std::int8_t> { static constexpr const char* value = "int8"; };
template <> struct DtypeName<std::uint8_t> { static constexpr const char* value = "uint8"; };
template <> struct DtypeName<std::int16_t> { static constexpr const char* value = "int16"; };
template <> struct DtypeName<std::uint16_t> { static constexpr const char* value = "uint16"; };
template <> struct DtypeName<std::int32_t> { static constexpr const char* value = "int32"; };
template <> struct DtypeName<std::uint32_t> { static constexpr const char* value = "uint32"; };
template <> struct DtypeName<std::int64_t> { static constexpr const char* value = "int64"; };
template <> struct DtypeName<std::uint64_t> { static constexpr const char* value = "uint64"; };
template <> struct DtypeName<float> { static constexpr const char* value = "float32"; };
template <> struct DtypeName<double> { static constexpr const char* value = "float64"; };

template <typename T>
Buffer Buffer::of(BufferKind kind, std::vector<std::int64_t> shape, const std::vector<T>& elements) {
    Buffer b;
    b.kind = kind;
    b.shape = std::move(shape);
    b.dtype = DtypeName<T>::value;
    if (kind == BufferKind::Tensor) b.device = "cpu";
    b.bytes.resize(elements.size() * sizeof(T));
    if (!elements.empty()) std::memcpy(b.bytes.data(), elements.data(), b.bytes.size());
    return b;
}

} // namespace NodeForge
