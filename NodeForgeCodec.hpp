// NodeForge value codec
//
// Type-tagged encoding of socket values into JSON-safe records:
//   { "type": "none"|"bool"|"string"|"tuple"|"binary_tensor"|"binary_array"|"other",
//     "data": ..., ["shape": [int,...], "dtype": string, "device": string] }
// Numeric scalars are written as 1-element tuples and come back that way.
// Binary payloads are gzip-compressed and base64-armored.
#pragma once
#include "NodeForgeConfig.hpp"
#include "NodeForgeValue.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace NodeForge {

namespace WireTag {
constexpr const char* None = "none";
constexpr const char* Bool = "bool";
constexpr const char* String = "string";
constexpr const char* Tuple = "tuple";
constexpr const char* BinaryTensor = "binary_tensor";
constexpr const char* BinaryArray = "binary_array";
constexpr const char* Other = "other";
} // namespace WireTag

nlohmann::json encodeValue(const Value& value, const Settings& settings = Settings());

// Throws DecodeError on an unknown tag, missing fields, or buffer metadata
// that disagrees with the payload length. "other" records are re-parsed as
// a JSON literal when possible, which may not give back the value that was encoded.
Value decodeValue(const nlohmann::json& record);

// Plain JSON (null, bool, number, string, array) to a Value; arrays become
// tuples and nested objects are decoded as EncodedValues
Value decodePlainJson(const nlohmann::json& json);

// raw bytes -> gzip -> base64 and back
std::string armorBytes(const std::vector<std::uint8_t>& bytes, int compressionLevel);
std::vector<std::uint8_t> unarmorBytes(const std::string& text);

std::string base64Encode(const std::vector<std::uint8_t>& bytes);
std::vector<std::uint8_t> base64Decode(const std::string& text);

} // namespace NodeForge
