// NodeForge settings
//
// Process-wide knobs for the codec, the wire loader and logging. Settings
// are plain values; load them from a JSON document such as
//   { "logLevel": "info", "compressionLevel": 9, "strictEdges": true }
#pragma once
#include "NodeForgeLog.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace NodeForge {

struct Settings {
    LogLevel logLevel = LogLevel::Warn;
    int compressionLevel = 6;   // zlib level 0..9 for binary payloads
    std::string device = "cpu"; // device tag written on tensor buffers without one
    bool strictEdges = false;   // abort fromWire on a bad edge instead of skipping it
    int jsonIndent = -1;        // -1 writes compact JSON
};

// Unknown keys are ignored; present keys of the wrong type or out of range
// raise ConstructionError
Settings loadSettingsFromJson(const nlohmann::json& json);
Settings loadSettingsFromJsonFile(const std::string& path);
nlohmann::json settingsToJson(const Settings& settings);

// Installs the process-wide parts (log level)
void applySettings(const Settings& settings);

} // namespace NodeForge
