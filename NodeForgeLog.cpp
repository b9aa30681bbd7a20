// NodeForgeLog.cpp
#include "NodeForgeLog.hpp"
#include <cstdio>
#include <stdexcept>

namespace NodeForge {
namespace logging {

namespace {
LogLevel currentLevel = LogLevel::Warn;
Sink currentSink;
} // namespace

void setLevel(LogLevel l) { currentLevel = l; }
LogLevel level() { return currentLevel; }

void setSink(Sink sink) { currentSink = std::move(sink); }

void write(LogLevel l, const std::string& message) {
    if (currentSink) {
        currentSink(l, message);
        return;
    }
    fmt::print(stderr, "[nodeforge] {}: {}\n", levelName(l), message);
}

const char* levelName(LogLevel l) {
    switch (l) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info: return "info";
    case LogLevel::Warn: return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Off: return "off";
    }
    return "unknown";
}

LogLevel parseLevel(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "off") return LogLevel::Off;
    throw std::invalid_argument("Unknown log level: " + name);
}

} // namespace logging
} // namespace NodeForge
