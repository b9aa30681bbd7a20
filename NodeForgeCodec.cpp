// NodeForgeCodec.cpp
//
// Encode/decode of socket values for the wire format, plus the byte armor
// (zlib gzip stream + base64) used for binary buffers.
#include "NodeForgeCodec.hpp"
#include "NodeForgeErrors.hpp"
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <stdexcept>
#include <zlib.h>

namespace NodeForge {

namespace {

constexpr std::size_t ZChunk = 16384;
constexpr char Base64Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::vector<std::uint8_t> gzipCompress(const std::vector<std::uint8_t>& in, int level) {
    z_stream zs{};
    // 15 window bits + 16 selects the gzip wrapper
    if (deflateInit2(&zs, level, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw GraphError(fmt::format("deflateInit2 failed for level {}", level));
    }
    zs.next_in = const_cast<Bytef*>(in.data());
    zs.avail_in = static_cast<uInt>(in.size());
    std::vector<std::uint8_t> out;
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        out.resize(zs.total_out + ZChunk);
        zs.next_out = out.data() + zs.total_out;
        zs.avail_out = static_cast<uInt>(ZChunk);
        rc = deflate(&zs, Z_FINISH);
        if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
            deflateEnd(&zs);
            throw GraphError(fmt::format("deflate failed ({})", rc));
        }
    }
    out.resize(zs.total_out);
    deflateEnd(&zs);
    return out;
}

std::vector<std::uint8_t> gzipDecompress(const std::vector<std::uint8_t>& in) {
    z_stream zs{};
    // 15 window bits + 32 accepts both gzip and zlib headers
    if (inflateInit2(&zs, 15 + 32) != Z_OK) throw DecodeError("inflateInit2 failed");
    zs.next_in = const_cast<Bytef*>(in.data());
    zs.avail_in = static_cast<uInt>(in.size());
    std::vector<std::uint8_t> out;
    for (;;) {
        out.resize(zs.total_out + ZChunk);
        zs.next_out = out.data() + zs.total_out;
        zs.avail_out = static_cast<uInt>(ZChunk);
        int rc = inflate(&zs, Z_NO_FLUSH);
        if (rc == Z_STREAM_END) break;
        if (rc == Z_OK) continue;
        std::string reason = zs.msg ? zs.msg : (rc == Z_BUF_ERROR ? "truncated stream" : "inflate error");
        inflateEnd(&zs);
        throw DecodeError("Corrupt compressed payload: " + reason);
    }
    out.resize(zs.total_out);
    inflateEnd(&zs);
    return out;
}

int base64Index(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

nlohmann::json encodeTupleItem(const Value& v, const Settings& settings) {
    switch (v.kind()) {
    case ValueKind::None: return nullptr;
    case ValueKind::Bool: return v.as<bool>();
    case ValueKind::Int: return v.as<std::int64_t>();
    case ValueKind::Float: return v.as<double>();
    case ValueKind::String: return v.as<std::string>();
    case ValueKind::Tuple: {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& item : v.as<Tuple>()) arr.push_back(encodeTupleItem(item, settings));
        return arr;
    }
    case ValueKind::Buffer:
    case ValueKind::Opaque:
        return encodeValue(v, settings);
    }
    return nullptr;
}

const nlohmann::json& requireField(const nlohmann::json& record, const char* key, const std::string& tag) {
    auto it = record.find(key);
    if (it == record.end()) throw DecodeError(fmt::format("'{}' record is missing '{}'", tag, key));
    return *it;
}

Value decodeBuffer(const nlohmann::json& record, const std::string& tag) {
    const auto& data = requireField(record, "data", tag);
    const auto& shape = requireField(record, "shape", tag);
    const auto& dtype = requireField(record, "dtype", tag);
    if (!data.is_string()) throw DecodeError(fmt::format("'{}' data must be a base64 string", tag));
    if (!shape.is_array()) throw DecodeError(fmt::format("'{}' shape must be an array", tag));
    if (!dtype.is_string()) throw DecodeError(fmt::format("'{}' dtype must be a string", tag));

    Buffer b;
    b.kind = tag == WireTag::BinaryTensor ? BufferKind::Tensor : BufferKind::Array;
    for (const auto& dim : shape) {
        if (!dim.is_number_integer() || dim.get<std::int64_t>() < 0) {
            throw DecodeError(fmt::format("'{}' shape has an invalid dimension: {}", tag, dim.dump()));
        }
        b.shape.push_back(dim.get<std::int64_t>());
    }
    b.dtype = canonicalDtype(dtype.get<std::string>());
    if (b.dtype.empty()) throw DecodeError(fmt::format("'{}' has unknown dtype '{}'", tag, dtype.get<std::string>()));
    if (b.kind == BufferKind::Tensor) {
        auto dev = record.find("device");
        if (dev != record.end() && dev->is_string()) b.device = dev->get<std::string>();
    }
    std::size_t expected = 0;
    try {
        expected = b.byteSize();
    } catch (const std::overflow_error& e) {
        throw DecodeError(fmt::format("'{}' {}", tag, e.what()));
    }
    b.bytes = unarmorBytes(data.get<std::string>());

    if (b.bytes.size() != expected) {
        throw DecodeError(fmt::format("'{}' payload is {} bytes but shape [{}] of {} needs {}", tag, b.bytes.size(),
                                      shape.dump(), b.dtype, expected));
    }
    return Value(std::move(b));
}

} // namespace

Value decodePlainJson(const nlohmann::json& j) {
    switch (j.type()) {
    case nlohmann::json::value_t::null: return Value();
    case nlohmann::json::value_t::boolean: return Value(j.get<bool>());
    case nlohmann::json::value_t::number_integer: return Value(j.get<std::int64_t>());
    case nlohmann::json::value_t::number_unsigned: return Value(static_cast<std::int64_t>(j.get<std::uint64_t>()));
    case nlohmann::json::value_t::number_float: return Value(j.get<double>());
    case nlohmann::json::value_t::string: return Value(j.get<std::string>());
    case nlohmann::json::value_t::array: {
        Tuple t;
        t.reserve(j.size());
        for (const auto& item : j) t.push_back(decodePlainJson(item));
        return Value(std::move(t));
    }
    case nlohmann::json::value_t::object: return decodeValue(j);
    default: break;
    }
    throw DecodeError(fmt::format("Unsupported JSON item in tuple: {}", j.dump()));
}

std::string base64Encode(const std::vector<std::uint8_t>& bytes) {
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);
    std::size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        std::uint32_t n = (bytes[i] << 16) | (bytes[i + 1] << 8) | bytes[i + 2];
        out.push_back(Base64Alphabet[(n >> 18) & 63]);
        out.push_back(Base64Alphabet[(n >> 12) & 63]);
        out.push_back(Base64Alphabet[(n >> 6) & 63]);
        out.push_back(Base64Alphabet[n & 63]);
    }
    const std::size_t rest = bytes.size() - i;
    if (rest == 1) {
        std::uint32_t n = bytes[i] << 16;
        out.push_back(Base64Alphabet[(n >> 18) & 63]);
        out.push_back(Base64Alphabet[(n >> 12) & 63]);
        out += "==";
    } else if (rest == 2) {
        std::uint32_t n = (bytes[i] << 16) | (bytes[i + 1] << 8);
        out.push_back(Base64Alphabet[(n >> 18) & 63]);
        out.push_back(Base64Alphabet[(n >> 12) & 63]);
        out.push_back(Base64Alphabet[(n >> 6) & 63]);
        out.push_back('=');
    }
    return out;
}

std::vector<std::uint8_t> base64Decode(const std::string& text) {
    std::vector<std::uint8_t> out;
    out.reserve(text.size() / 4 * 3);
    std::uint32_t acc = 0;
    int bits = 0;
    std::size_t padding = 0;
    std::size_t symbols = 0;
    for (char c : text) {
        if (c == '\n' || c == '\r' || c == ' ' || c == '\t') continue;
        if (c == '=') {
            ++padding;
            ++symbols;
            continue;
        }
        if (padding) throw DecodeError("Invalid base64: data after padding");
        int idx = base64Index(c);
        if (idx < 0) throw DecodeError(fmt::format("Invalid base64 character '{}'", c));
        ++symbols;
        acc = (acc << 6) | static_cast<std::uint32_t>(idx);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFF));
        }
    }
    if (symbols % 4 != 0 || padding > 2) throw DecodeError("Invalid base64: bad length or padding");
    return out;
}

std::string armorBytes(const std::vector<std::uint8_t>& bytes, int compressionLevel) {
    return base64Encode(gzipCompress(bytes, compressionLevel));
}

std::vector<std::uint8_t> unarmorBytes(const std::string& text) {
    return gzipDecompress(base64Decode(text));
}

nlohmann::json encodeValue(const Value& value, const Settings& settings) {
    switch (value.kind()) {
    case ValueKind::None:
        return {{"type", WireTag::None}, {"data", nullptr}};
    case ValueKind::Bool:
        return {{"type", WireTag::Bool}, {"data", value.as<bool>()}};
    case ValueKind::String:
        return {{"type", WireTag::String}, {"data", value.as<std::string>()}};
    case ValueKind::Int:
    case ValueKind::Float:
        // scalars share the tuple shape family
        return {{"type", WireTag::Tuple}, {"data", nlohmann::json::array({encodeTupleItem(value, settings)})}};
    case ValueKind::Tuple:
        return {{"type", WireTag::Tuple}, {"data", encodeTupleItem(value, settings)}};
    case ValueKind::Buffer: {
        const auto& b = value.as<Buffer>();
        const std::size_t itemSize = dtypeSize(b.dtype);
        if (itemSize == 0) throw GraphError(fmt::format("Cannot encode buffer with unknown dtype '{}'", b.dtype));
        std::size_t expected = 0;
        try {
            expected = b.byteSize();
        } catch (const std::overflow_error& e) {
            throw GraphError(std::string("Cannot encode buffer: ") + e.what());
        }
        if (b.bytes.size() != expected) {
            throw GraphError(fmt::format("Cannot encode buffer: {} bytes do not match [{}] of {}", b.bytes.size(),
                                         fmt::join(b.shape, ", "), b.dtype));
        }
        nlohmann::json j = {
            {"type", b.kind == BufferKind::Tensor ? WireTag::BinaryTensor : WireTag::BinaryArray},
            {"data", armorBytes(b.bytes, settings.compressionLevel)},
            {"shape", b.shape},
            {"dtype", canonicalDtype(b.dtype)},
        };
        if (b.kind == BufferKind::Tensor) j["device"] = b.device.empty() ? settings.device : b.device;
        return j;
    }
    case ValueKind::Opaque:
        return {{"type", WireTag::Other}, {"data", value.as<Opaque>().text}};
    }
    return nullptr;
}

Value decodeValue(const nlohmann::json& record) {
    if (!record.is_object()) throw DecodeError(fmt::format("Encoded value must be an object, got {}", record.dump()));
    auto typeIt = record.find("type");
    if (typeIt == record.end() || !typeIt->is_string()) throw DecodeError("Encoded value has no 'type' tag");
    const std::string tag = typeIt->get<std::string>();

    if (tag == WireTag::None) return Value();
    if (tag == WireTag::BinaryTensor || tag == WireTag::BinaryArray) return decodeBuffer(record, tag);
    if (tag != WireTag::Bool && tag != WireTag::String && tag != WireTag::Tuple && tag != WireTag::Other) {
        throw DecodeError(fmt::format("Unknown value type tag '{}'", tag));
    }

    const auto& data = requireField(record, "data", tag);
    if (tag == WireTag::Bool) {
        if (!data.is_boolean()) throw DecodeError(fmt::format("'bool' data must be a boolean, got {}", data.dump()));
        return Value(data.get<bool>());
    }
    if (tag == WireTag::String) {
        if (!data.is_string()) throw DecodeError(fmt::format("'string' data must be a string, got {}", data.dump()));
        return Value(data.get<std::string>());
    }
    if (tag == WireTag::Tuple) {
        if (!data.is_array()) throw DecodeError(fmt::format("'tuple' data must be an array, got {}", data.dump()));
        return decodePlainJson(data);
    }
    // "other"
    if (!data.is_string()) return decodePlainJson(data);
    auto parsed = nlohmann::json::parse(data.get<std::string>(), nullptr, false);
    if (parsed.is_discarded() || parsed.is_object()) return Value(Opaque{data.get<std::string>()});
    return decodePlainJson(parsed);
}

} // namespace NodeForge
