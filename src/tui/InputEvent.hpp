// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <variant>

#include <tui/Key.hpp>

namespace bufstack::tui
{

/// @brief Terminal resize event.
struct ResizeEvent
{
    int columns; ///< New terminal width in columns.
    int rows;    ///< New terminal height in rows.
};

/// @brief Discriminated union of the input events a Surface delivers.
using InputEvent = std::variant<KeyEvent, ResizeEvent>;

} // namespace bufstack::tui
