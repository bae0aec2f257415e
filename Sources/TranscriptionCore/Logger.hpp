#pragma once

#include <functional>
#include <mutex>
#include <string>

namespace vnt {

enum class LogLevel {
    debug = 0,
    info  = 1,
    warn  = 2,
    error = 3
};

/// Parse "debug" / "info" / "warn" / "error" (case-insensitive).
/// Unrecognised values map to LogLevel::info.
LogLevel log_level_from_string(const std::string& s);

/// Process-wide logger.  Messages below the minimum level are dropped.
/// Default sink writes to stdout (stderr for errors).
class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static void set_level(LogLevel level);
    static LogLevel level();

    /// Replace the output sink.  Passing nullptr restores the console sink.
    static void set_sink(Sink sink);

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

private:
    static void write(LogLevel level, const std::string& message);

    static std::mutex mu_;
    static LogLevel   level_;
    static Sink       sink_;
};

} // namespace vnt
