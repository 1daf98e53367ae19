// SPDX-License-Identifier: Apache-2.0
#include "Theme.hpp"

namespace bufstack::tui
{

auto Theme::style(std::string_view role, bool highlight) const -> Style
{
    auto it = _roles.find(role);
    if (it == _roles.end())
        it = _roles.find(std::string_view { "none" });

    auto result = (it != _roles.end()) ? it->second : Style {};
    if (highlight)
    {
        result.inverse = !result.inverse;
        result.bold = true;
    }
    return result;
}

void Theme::set(std::string role, Style style)
{
    _roles.insert_or_assign(std::move(role), style);
}

auto Theme::contains(std::string_view role) const -> bool
{
    return _roles.find(role) != _roles.end();
}

auto defaultTheme() -> Theme
{
    auto theme = Theme {};

    theme.set("none", Style {});

    // Buffer status line: light gray on dark gray
    auto status = Style {};
    status.fg = static_cast<std::uint8_t>(252);
    status.bg = static_cast<std::uint8_t>(236);
    theme.set("status", status);

    auto header = Style {};
    header.bold = true;
    theme.set("header", header);

    // Already typed part of a completion candidate
    auto completion = Style {};
    completion.fg = static_cast<std::uint8_t>(6);
    completion.bold = true;
    theme.set("completion", completion);

    auto directory = Style {};
    directory.fg = RgbColor { .r = 130, .g = 180, .b = 255 }; // Light blue
    directory.bold = true;
    theme.set("directory", directory);

    auto tagged = Style {};
    tagged.fg = RgbColor { .r = 255, .g = 184, .b = 108 }; // Orange
    theme.set("tagged", tagged);

    auto muted = Style {};
    muted.fg = static_cast<std::uint8_t>(8);
    theme.set("muted", muted);

    auto error = Style {};
    error.fg = RgbColor { .r = 255, .g = 85, .b = 85 };
    theme.set("error", error);

    return theme;
}

} // namespace bufstack::tui
