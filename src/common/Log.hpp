#pragma once

#include <functional>
#include <sstream>
#include <string>
#include <string_view>

namespace phub::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// Receives every line that passes the level filter, already formatted without the header.
using Sink = std::function<void(Level, const std::string&)>;

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void log(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

// Replaces console output; an empty sink restores it.
void setSink(Sink sink);

}  // namespace phub::log

#define PHUB_LOG_IMPL(level, expr)                                                         \
    do {                                                                                   \
        if (::phub::log::shouldLog(level)) {                                               \
            std::ostringstream phub_log_stream__;                                          \
            phub_log_stream__ << expr;                                                     \
            ::phub::log::log(level, phub_log_stream__.str());                              \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) PHUB_LOG_IMPL(::phub::log::Level::Debug, expr)
#define LOG_INFO(expr) PHUB_LOG_IMPL(::phub::log::Level::Info, expr)
#define LOG_WARN(expr) PHUB_LOG_IMPL(::phub::log::Level::Warn, expr)
#define LOG_ERR(expr) PHUB_LOG_IMPL(::phub::log::Level::Error, expr)
