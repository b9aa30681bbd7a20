// NodeForgeConfig.cpp
#include "NodeForgeConfig.hpp"
#include "NodeForgeErrors.hpp"
#include <fstream>

namespace NodeForge {

namespace {

template <typename T>
bool readKey(const nlohmann::json& json, const char* key, T& out) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) return false;
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConstructionError(std::string("Invalid settings key '") + key + "': " + e.what());
    }
    return true;
}

} // namespace

Settings loadSettingsFromJson(const nlohmann::json& json) {
    if (!json.is_object()) throw ConstructionError("Settings must be a JSON object");
    Settings s;
    std::string levelName;
    if (readKey(json, "logLevel", levelName)) {
        try {
            s.logLevel = logging::parseLevel(levelName);
        } catch (const std::invalid_argument& e) {
            throw ConstructionError(std::string("Invalid settings key 'logLevel': ") + e.what());
        }
    }
    if (json.contains("compressionLevel") && !json["compressionLevel"].is_number_integer())
        throw ConstructionError("Invalid settings key 'compressionLevel': expected an integer");
    readKey(json, "compressionLevel", s.compressionLevel);
    if (s.compressionLevel < 0 || s.compressionLevel > 9)
        throw ConstructionError("Invalid settings key 'compressionLevel': must be within 0..9");
    readKey(json, "device", s.device);
    readKey(json, "strictEdges", s.strictEdges);
    readKey(json, "jsonIndent", s.jsonIndent);
    return s;
}

Settings loadSettingsFromJsonFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.good()) throw ConstructionError("Could not open settings file: " + path);
    nlohmann::json json;
    try {
        f >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConstructionError("Could not parse settings file " + path + ": " + e.what());
    }
    return loadSettingsFromJson(json);
}

nlohmann::json settingsToJson(const Settings& s) {
    return {
        {"logLevel", logging::levelName(s.logLevel)},
        {"compressionLevel", s.compressionLevel},
        {"device", s.device},
        {"strictEdges", s.strictEdges},
        {"jsonIndent", s.jsonIndent},
    };
}

void applySettings(const Settings& s) {
    logging::setLevel(s.logLevel);
}

} // namespace NodeForge
