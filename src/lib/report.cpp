#include "report.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace report {

namespace {

std::string timestamp() {
    auto now = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::now());
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // namespace

const char *level_name(Level level) {
    switch (level) {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARNING";
    case Level::Error:
        return "ERROR";
    }
    return "UNKNOWN";
}

Level parse_level(const std::string &name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warning" || lower == "warn") return Level::Warning;
    if (lower == "error") return Level::Error;
    throw errors::ConfigurationError("Invalid log level: " + name);
}

Reporter console(Level min_level) {
    return [min_level](Level level, const std::string &message) {
        if (level < min_level) return;
        std::cerr << timestamp() << " - " << level_name(level) << " - "
                  << message << std::endl;
    };
}

Reporter silent() {
    return [](Level, const std::string &) {};
}

} // namespace report
