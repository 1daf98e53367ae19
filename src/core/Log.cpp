// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <ostream>
#include <print>

namespace bufstack::log
{

namespace
{
    auto globalLevel = Level::Info;
    auto globalCallback = LogCallback {};
    auto globalFile = std::ofstream {};
    auto globalMutex = std::mutex {};
} // namespace

void setCallback(LogCallback callback)
{
    auto const lock = std::lock_guard(globalMutex);
    globalCallback = std::move(callback);
}

auto setLogFile(std::string_view path) -> VoidResult
{
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(ErrorCode::IoError,
                             std::format("Failed to create log directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path), std::ios::app);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open log file: {}", path));

    auto const lock = std::lock_guard(globalMutex);
    globalFile = std::move(file);
    return {};
}

void closeLogFile()
{
    auto const lock = std::lock_guard(globalMutex);
    if (globalFile.is_open())
        globalFile.close();
}

void setLevel(Level level)
{
    globalLevel = level;
}

auto getLevel() -> Level
{
    return globalLevel;
}

auto levelFromString(std::string_view name) -> std::optional<Level>
{
    if (name == "error")
        return Level::Error;
    if (name == "warning" || name == "warn")
        return Level::Warning;
    if (name == "info")
        return Level::Info;
    if (name == "debug")
        return Level::Debug;
    if (name == "trace")
        return Level::Trace;
    return std::nullopt;
}

auto levelPrefix(Level level) -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "ERROR";
        case Level::Warning: return "WARN ";
        case Level::Info: return "INFO ";
        case Level::Debug: return "DEBUG";
        case Level::Trace: return "TRACE";
    }
    return "?????";
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel)
        return;

    auto const lock = std::lock_guard(globalMutex);

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    if (globalFile.is_open())
    {
        auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
        std::println(globalFile, "{:%F %T} [{}] {}", now, levelPrefix(level), message);
        globalFile.flush();
        return;
    }

    std::println(stderr, "[{}] {}", levelPrefix(level), message);
}

} // namespace bufstack::log
