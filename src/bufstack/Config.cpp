// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <tui/Key.hpp>

#include <nlohmann/json.hpp>

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace bufstack
{

namespace
{
    constexpr auto levelName(log::Level level) -> std::string_view
    {
        switch (level)
        {
            case log::Level::Error: return "error";
            case log::Level::Warning: return "warning";
            case log::Level::Info: return "info";
            case log::Level::Debug: return "debug";
            case log::Level::Trace: return "trace";
        }
        return "info";
    }

    /// @brief Reads a color given either as a palette index (0-255) or as "#rrggbb".
    auto parseColor(const nlohmann::json& value) -> std::optional<tui::Color>
    {
        if (value.is_number_integer())
        {
            auto const index = value.get<int>();
            if (index < 0 || index > 255)
                return std::nullopt;
            return tui::Color { static_cast<std::uint8_t>(index) };
        }

        if (value.is_string())
        {
            auto const text = value.get<std::string>();
            if (text.size() != 7 || text[0] != '#')
                return std::nullopt;

            auto rgb = std::uint32_t { 0 };
            auto const [end, ec] = std::from_chars(text.data() + 1, text.data() + text.size(), rgb, 16);
            if (ec != std::errc {} || end != text.data() + text.size())
                return std::nullopt;

            return tui::Color { tui::RgbColor {
                .r = static_cast<std::uint8_t>((rgb >> 16) & 0xFF),
                .g = static_cast<std::uint8_t>((rgb >> 8) & 0xFF),
                .b = static_cast<std::uint8_t>(rgb & 0xFF),
            } };
        }

        return std::nullopt;
    }

    auto colorToJson(tui::Color const& color) -> nlohmann::json
    {
        if (auto const* index = std::get_if<std::uint8_t>(&color))
            return static_cast<int>(*index);
        if (auto const* rgb = std::get_if<tui::RgbColor>(&color))
            return std::format("#{:02x}{:02x}{:02x}", rgb->r, rgb->g, rgb->b);
        return nullptr;
    }

    auto parseStyle(std::string_view role, const nlohmann::json& obj, tui::Style style) -> tui::Style
    {
        for (auto const* key: { "fg", "bg" })
        {
            if (!obj.contains(key))
                continue;
            auto color = parseColor(obj[key]);
            if (!color)
            {
                log::warning("Ignoring invalid color colors.{}.{}", role, key);
                continue;
            }
            (std::string_view(key) == "fg" ? style.fg : style.bg) = *color;
        }

        style.bold = json::getBoolOr(obj, "bold", style.bold);
        style.underline = json::getBoolOr(obj, "underline", style.underline);
        style.dim = json::getBoolOr(obj, "dim", style.dim);
        style.inverse = json::getBoolOr(obj, "inverse", style.inverse);
        return style;
    }
} // namespace

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/bufstack";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/bufstack";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto defaultLogPath() -> std::string
{
    auto const* const xdgState = std::getenv("XDG_STATE_HOME");
    if (xdgState && *xdgState)
        return std::string(xdgState) + "/bufstack/bufstack.log";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.local/state/bufstack/bufstack.log";
    return "bufstack.log";
}

auto parseConfig(std::string_view content) -> Result<AppConfig>
{
    auto parseResult = json::parse(content);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be a JSON object");

    auto config = AppConfig {};

    // Input section
    if (root.contains("input"))
    {
        auto const input = json::getObject(root, "input");
        config.screen.pollTimeoutMs = json::getIntOr(input, "pollTimeoutMs", config.screen.pollTimeoutMs);
        if (config.screen.pollTimeoutMs <= 0)
            return makeError(ErrorCode::ConfigError, "input.pollTimeoutMs must be positive");

        auto const cancelKey = json::getStringOr(input, "cancelKey", "C-g");
        auto parsed = tui::parseKey(cancelKey);
        if (!parsed)
            return makeError(ErrorCode::ConfigError, std::format("input.cancelKey: unknown key '{}'", cancelKey));
        config.screen.cancelKey = *parsed;
    }

    // Prompt section
    if (root.contains("prompt"))
    {
        auto const prompt = json::getObject(root, "prompt");
        config.screen.completionRows = json::getIntOr(prompt, "completionRows", config.screen.completionRows);
        if (config.screen.completionRows < 2)
            return makeError(ErrorCode::ConfigError, "prompt.completionRows must be at least 2");

        auto const historySize = json::getIntOr(prompt, "historySize", static_cast<int>(config.screen.historySize));
        if (historySize < 0)
            return makeError(ErrorCode::ConfigError, "prompt.historySize must not be negative");
        config.screen.historySize = static_cast<std::size_t>(historySize);
    }

    // Colors section: each role overrides the built-in palette
    if (root.contains("colors") && root["colors"].is_object())
    {
        for (const auto& [role, styleJson]: root["colors"].items())
        {
            if (!styleJson.is_object())
            {
                log::warning("Ignoring colors.{}: expected an object", role);
                continue;
            }
            config.theme.set(role, parseStyle(role, styleJson, config.theme.style(role)));
        }
    }

    // Log section
    if (root.contains("log"))
    {
        auto const logJson = json::getObject(root, "log");
        auto const levelStr = json::getStringOr(logJson, "level", "info");
        auto level = log::levelFromString(levelStr);
        if (!level)
            return makeError(ErrorCode::ConfigError, std::format("log.level: unknown level '{}'", levelStr));
        config.log.level = *level;
        config.log.file = json::getStringOr(logJson, "file", "");
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto config = parseConfig(ss.str());
    if (!config)
        return makeError(config.error().code, std::format("{}: {}", path, config.error().message));
    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    // Input section
    auto input = nlohmann::json::object();
    input["pollTimeoutMs"] = config.screen.pollTimeoutMs;
    input["cancelKey"] = tui::describeKey(config.screen.cancelKey);
    root["input"] = std::move(input);

    // Prompt section
    auto prompt = nlohmann::json::object();
    prompt["completionRows"] = config.screen.completionRows;
    prompt["historySize"] = config.screen.historySize;
    root["prompt"] = std::move(prompt);

    // Colors section
    auto colors = nlohmann::json::object();
    for (const auto& [role, style]: config.theme.roles())
    {
        auto entry = nlohmann::json::object();
        if (auto fg = colorToJson(style.fg); !fg.is_null())
            entry["fg"] = std::move(fg);
        if (auto bg = colorToJson(style.bg); !bg.is_null())
            entry["bg"] = std::move(bg);
        entry["bold"] = style.bold;
        entry["underline"] = style.underline;
        entry["dim"] = style.dim;
        entry["inverse"] = style.inverse;
        colors[role] = std::move(entry);
    }
    root["colors"] = std::move(colors);

    // Log section
    auto logJson = nlohmann::json::object();
    logJson["level"] = levelName(config.log.level);
    if (!config.log.file.empty())
        logJson["file"] = config.log.file;
    root["log"] = std::move(logJson);

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace bufstack
