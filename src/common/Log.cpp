#include "common/Log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace tape::log {
namespace {

std::atomic<int> g_threshold{static_cast<int>(Level::Info)};

std::mutex& outputMutex() {
    static std::mutex mutex;
    return mutex;
}

// "2024-01-01T00:00:00.000Z"
std::string utcStamp(std::chrono::system_clock::time_point when) {
    const auto sinceEpoch = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch());
    const std::time_t seconds = static_cast<std::time_t>(sinceEpoch.count() / 1000);
    const int millis = static_cast<int>(sinceEpoch.count() % 1000);

    std::tm tm{};
    gmtime_r(&seconds, &tm);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900, tm.tm_mon + 1,
                  tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    return buffer;
}

const std::string& threadTag() {
    thread_local const std::string tag = [] {
        std::ostringstream oss;
        oss << std::this_thread::get_id();
        return oss.str();
    }();
    return tag;
}

}  // namespace

void setLevel(Level level) noexcept {
    g_threshold.store(static_cast<int>(level), std::memory_order_relaxed);
}

Level getLevel() noexcept {
    return static_cast<Level>(g_threshold.load(std::memory_order_relaxed));
}

bool shouldLog(Level level) noexcept {
    return static_cast<int>(level) >= g_threshold.load(std::memory_order_relaxed);
}

void log(Level level, const std::string& message) {
    const auto stamp = utcStamp(std::chrono::system_clock::now());
    const bool toStderr = level == Level::Warn || level == Level::Error;

    std::lock_guard<std::mutex> lock(outputMutex());
    auto& out = toStderr ? std::cerr : std::cout;
    out << '[' << stamp << "] [" << levelToString(level) << "] [thread " << threadTag() << "] " << message << '\n';
    out.flush();
}

const char* levelToString(Level level) noexcept {
    switch (level) {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warn:
        return "WARN";
    case Level::Error:
        return "ERROR";
    }
    return "INFO";
}

Level levelFromString(std::string_view text) {
    std::string name{text};
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (name == "trace" || name == "debug") {
        return Level::Debug;
    }
    if (name == "info") {
        return Level::Info;
    }
    if (name == "warning" || name == "warn") {
        return Level::Warn;
    }
    if (name == "error" || name == "err") {
        return Level::Error;
    }
    throw std::invalid_argument("Unknown log level: " + name);
}

}  // namespace tape::log
