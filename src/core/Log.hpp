// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <string>
#include <string_view>

namespace speakstream::log
{

/// @brief Verbosity level for log messages.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Sets the global log verbosity level.
void setLevel(Level level);

[[nodiscard]] auto getLevel() -> Level;

/// @brief Returns true if messages at level are currently written.
[[nodiscard]] inline auto enabled(Level level) -> bool
{
    return level <= getLevel();
}

/// @brief Parses a level name ("error", "warning", "info", "debug", "trace").
/// @param fallback Returned when the name is not recognized.
[[nodiscard]] auto levelFromString(std::string_view name, Level fallback = Level::Info) -> Level;

/// @brief Names the calling thread in every line it logs (e.g. "feeder", "worker-2").
///
/// Threads that never set a name are tagged "main".
void setThreadName(std::string name);

[[nodiscard]] auto threadName() -> std::string_view;

/// @brief Writes one line to stderr: elapsed time, level, thread name, message.
///
/// Lines from concurrent threads never interleave.
void write(Level level, std::string_view message);

/// @brief Formats and writes a message if level is enabled.
template <typename... Args>
void message(Level level, std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(level))
        write(level, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    message(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    message(Level::Warning, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    message(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    message(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    message(Level::Trace, fmt, std::forward<Args>(args)...);
}

} // namespace speakstream::log
