// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <screen/ScreenConfig.hpp>
#include <tui/Theme.hpp>

#include <string>
#include <string_view>

namespace bufstack
{

/// @brief Logging configuration section.
struct LogConfig
{
    log::Level level = log::Level::Info;

    /// @brief Log file path. Empty selects defaultLogPath().
    std::string file;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    ScreenConfig screen;
    tui::Theme theme = tui::defaultTheme();
    LogConfig log;

    /// @brief Directory the demo starts browsing in (set via the positional CLI argument).
    std::string startDirectory;
};

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses a configuration document. Missing keys keep their defaults.
[[nodiscard]] auto parseConfig(std::string_view content) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory: $XDG_CONFIG_HOME/bufstack or ~/.config/bufstack.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns the default log file: $XDG_STATE_HOME/bufstack/bufstack.log or ~/.local/state/bufstack/bufstack.log.
[[nodiscard]] auto defaultLogPath() -> std::string;

} // namespace bufstack
