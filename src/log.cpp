#include "../include/lookout/log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace lookout::log {

namespace {

std::atomic<Level> g_level{Level::Info};

std::mutex& output_mutex() {
    static std::mutex mutex;
    return mutex;
}

const char* level_name(Level level) {
    switch (level) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    }
    return "INFO";
}

} // namespace

void set_level(Level level) {
    g_level.store(level);
}

Level level() {
    return g_level.load();
}

Level parse_level(std::string_view name) {
    if (name == "debug") return Level::Debug;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    return Level::Info;
}

std::string timestamp_now() {
    using clock = std::chrono::system_clock;
    const auto now = clock::now();
    const auto time = clock::to_time_t(now);
    std::tm tm {};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << milliseconds.count();
    return oss.str();
}

// stdout carries the request protocol, so log lines go to stderr.
void write(Level level, std::string_view component, std::string_view message) {
    if (static_cast<int>(level) < static_cast<int>(g_level.load())) {
        return;
    }
    std::ostringstream line;
    line << '[' << component << ' ' << timestamp_now() << "] " << level_name(level) << ' ' << message;
    std::scoped_lock lock(output_mutex());
    std::cerr << line.str() << std::endl;
}

} // namespace lookout::log
