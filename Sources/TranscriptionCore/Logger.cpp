#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace vnt {

std::mutex       Logger::mu_;
LogLevel         Logger::level_ = LogLevel::info;
Logger::Sink     Logger::sink_;

namespace {

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::debug: return "[DEBUG]";
        case LogLevel::info:  return "[INFO]";
        case LogLevel::warn:  return "[WARN]";
        case LogLevel::error: return "[ERROR]";
    }
    return "[INFO]";
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%H:%M:%S");
    return ss.str();
}

} // namespace

LogLevel log_level_from_string(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::debug;
    if (lower == "warn" || lower == "warning") return LogLevel::warn;
    if (lower == "error") return LogLevel::error;
    return LogLevel::info;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mu_);
    level_ = level;
}

LogLevel Logger::level() {
    std::lock_guard<std::mutex> lock(mu_);
    return level_;
}

void Logger::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mu_);
    sink_ = std::move(sink);
}

void Logger::debug(const std::string& message) { write(LogLevel::debug, message); }
void Logger::info(const std::string& message)  { write(LogLevel::info, message); }
void Logger::warn(const std::string& message)  { write(LogLevel::warn, message); }
void Logger::error(const std::string& message) { write(LogLevel::error, message); }

void Logger::write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mu_);
    if (static_cast<int>(level) < static_cast<int>(level_)) {
        return;
    }
    if (sink_) {
        sink_(level, message);
        return;
    }
    std::ostream& out = level == LogLevel::error ? std::cerr : std::cout;
    out << timestamp() << " " << level_tag(level) << " " << message << std::endl;
}

} // namespace vnt
