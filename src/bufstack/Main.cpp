// SPDX-License-Identifier: Apache-2.0
#include <bufstack/App.hpp>
#include <bufstack/Config.hpp>
#include <core/Log.hpp>

#include <CLI/CLI.hpp>

#include <format>
#include <print>

int main(int argc, char** argv)
{
    auto app = CLI::App { "bufstack - stacked full-screen buffers on one terminal" };

    auto configPath = std::string {};
    auto logFile = std::string {};
    auto logLevel = std::string {};
    auto startDirectory = std::string {};
    auto verbose = false;
    auto writeDefaultConfig = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--log-file", logFile, "Write the log to this file");
    app.add_option("--log-level", logLevel, "Log level (error|warning|info|debug|trace)");
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");
    app.add_flag("--write-default-config", writeDefaultConfig, "Write the default config file and exit");
    app.add_option("directory", startDirectory, "Directory to start browsing in")->check(CLI::ExistingDirectory);

    CLI11_PARSE(app, argc, argv);

    if (writeDefaultConfig)
    {
        auto const path = configPath.empty() ? bufstack::defaultConfigPath() : configPath;
        if (auto saved = bufstack::saveConfigToFile(path, bufstack::AppConfig {}); !saved)
        {
            bufstack::log::error("Failed to write config: {}", saved.error().message);
            return 1;
        }
        std::println("Wrote {}", path);
        return 0;
    }

    // Load config
    auto configResult = configPath.empty() ? bufstack::loadConfig() : bufstack::loadConfigFromFile(configPath);

    if (!configResult)
    {
        bufstack::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!logFile.empty())
        config.log.file = logFile;
    if (!logLevel.empty())
    {
        auto level = bufstack::log::levelFromString(logLevel);
        if (!level)
        {
            bufstack::log::error("Unknown log level: {}", logLevel);
            return 1;
        }
        config.log.level = *level;
    }
    if (verbose)
        config.log.level = bufstack::log::Level::Debug;
    if (!startDirectory.empty())
        config.startDirectory = startDirectory;

    auto application = bufstack::App(std::move(config));
    auto initResult = application.initialize();
    if (!initResult)
    {
        // Report on stderr rather than in the log file nobody is watching yet
        bufstack::log::closeLogFile();
        bufstack::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}
