#pragma once

#include <sstream>
#include <string>
#include <string_view>

namespace tape::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void log(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

}  // namespace tape::log

#define TAPE_LOG_IMPL(level, expr)                                                         \
    do {                                                                                   \
        if (::tape::log::shouldLog(level)) {                                               \
            std::ostringstream tape_log_stream__;                                          \
            tape_log_stream__ << expr;                                                     \
            ::tape::log::log(level, tape_log_stream__.str());                              \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) TAPE_LOG_IMPL(::tape::log::Level::Debug, expr)
#define LOG_INFO(expr) TAPE_LOG_IMPL(::tape::log::Level::Info, expr)
#define LOG_WARN(expr) TAPE_LOG_IMPL(::tape::log::Level::Warn, expr)
#define LOG_ERR(expr) TAPE_LOG_IMPL(::tape::log::Level::Error, expr)
