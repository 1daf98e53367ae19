// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/Style.hpp>

#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace bufstack::tui
{

/// @brief Maps color role names to styles.
///
/// Views paint with role names ("none", "status", "directory", ...) rather than
/// concrete colors, so that the palette can be configured in one place. Every
/// role has a highlighted variant, used for selections and matched prefixes.
class Theme
{
  public:
    /// @brief Returns the style of a role, falling back to "none" for unknown roles.
    /// @param role The color role.
    /// @param highlight Whether to return the highlighted variant.
    [[nodiscard]] auto style(std::string_view role, bool highlight = false) const -> Style;

    /// @brief Sets or replaces the style of a role.
    void set(std::string role, Style style);

    /// @brief Returns true if the role has been defined.
    [[nodiscard]] auto contains(std::string_view role) const -> bool;

    /// @brief Returns every defined role, sorted by name.
    [[nodiscard]] auto roles() const noexcept -> std::map<std::string, Style, std::less<>> const& { return _roles; }

  private:
    std::map<std::string, Style, std::less<>> _roles;
};

/// @brief Returns the built-in palette.
[[nodiscard]] auto defaultTheme() -> Theme;

} // namespace bufstack::tui
