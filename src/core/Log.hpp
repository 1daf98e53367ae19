// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <format>
#include <functional>
#include <optional>
#include <string_view>

namespace bufstack::log
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

/// @brief Callback type that receives all log messages.
/// @param level The log level of the message.
/// @param message The formatted log message text (without level prefix).
using LogCallback = std::function<void(Level level, std::string_view message)>;

/// @brief Sets a callback that receives all log messages.
///
/// A callback takes precedence over the log file and over stderr.
/// Pass an empty callback to remove it again.
void setCallback(LogCallback callback);

/// @brief Routes log output to a file, appending to it.
///
/// While the screen layer owns the terminal nothing may be written to stderr,
/// so interactive sessions log to a file instead.
/// @param path The file to append to. Parent directories are created.
/// @return Success or an IoError if the file cannot be opened.
[[nodiscard]] auto setLogFile(std::string_view path) -> VoidResult;

/// @brief Closes the log file, reverting to stderr output.
void closeLogFile();

/// @brief Sets the global log verbosity level.
void setLevel(Level level);

/// @brief Returns the current global log verbosity level.
[[nodiscard]] auto getLevel() -> Level;

/// @brief Parses a level name (error, warning, info, debug, trace).
/// @return The level, or std::nullopt for an unknown name.
[[nodiscard]] auto levelFromString(std::string_view name) -> std::optional<Level>;

/// @brief Returns the five-character prefix used for a level.
[[nodiscard]] auto levelPrefix(Level level) -> std::string_view;

/// @brief Writes a log message at the given level.
void write(Level level, std::string_view message);

/// @brief Logs an error message.
template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs a warning message.
template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs an info message.
template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs a debug message.
template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Debug)
        write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs a trace message.
template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Trace)
        write(Level::Trace, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace bufstack::log
