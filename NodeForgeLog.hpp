// NodeForge logging
//
// Tagged single-line diagnostics formatted with fmt. Lines go to stderr as
// "[nodeforge] <level>: <message>" unless a sink is installed (the CLI and
// tests use that to capture output).
#pragma once
#include <fmt/core.h>
#include <functional>
#include <string>
#include <utility>

namespace NodeForge {

enum class LogLevel { Debug, Info, Warn, Error, Off };

namespace logging {

using Sink = std::function<void(LogLevel, const std::string&)>;

void setLevel(LogLevel level);
LogLevel level();
inline bool enabled(LogLevel l) { return l >= level() && l != LogLevel::Off; }

// Pass an empty function to restore the stderr sink
void setSink(Sink sink);
void write(LogLevel level, const std::string& message);

const char* levelName(LogLevel level);
// "debug" | "info" | "warn" | "error" | "off"; throws std::invalid_argument
LogLevel parseLevel(const std::string& name);

template <typename... Args>
void debug(fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(LogLevel::Debug)) write(LogLevel::Debug, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void info(fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(LogLevel::Info)) write(LogLevel::Info, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(LogLevel::Warn)) write(LogLevel::Warn, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void error(fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(LogLevel::Error)) write(LogLevel::Error, fmt::format(f, std::forward<Args>(args)...));
}

} // namespace logging
} // namespace NodeForge
