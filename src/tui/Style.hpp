// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <variant>

namespace bufstack::tui
{

/// @brief RGB color representation.
struct RgbColor
{
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    auto operator==(RgbColor const&) const -> bool = default;
};

/// @brief Color representation: default, 256-color index, or true color (RGB).
using Color = std::variant<std::monostate, std::uint8_t, RgbColor>;

/// @brief Text attributes of a screen cell.
struct Style
{
    Color fg;               ///< Foreground color.
    Color bg;               ///< Background color.
    bool bold = false;      ///< Bold text.
    bool underline = false; ///< Underlined text.
    bool dim = false;       ///< Dim/faint text.
    bool inverse = false;   ///< Inverse/reverse video.

    auto operator==(Style const&) const -> bool = default;
};

} // namespace bufstack::tui
