// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace bufstack::tui
{

/// @brief Returns the display width of a string (one column per codepoint).
[[nodiscard]] auto displayWidth(std::string_view text) -> int;

/// @brief Returns the longest prefix of text that fits into the given number of columns.
///
/// Never splits a UTF-8 sequence.
[[nodiscard]] auto clipToWidth(std::string_view text, int width) -> std::string_view;

/// @brief Truncates a string to fit within the given width, adding an ellipsis if needed.
[[nodiscard]] auto truncate(std::string_view text, int width) -> std::string;

/// @brief Returns text followed by enough spaces to fill the given width.
[[nodiscard]] auto padRight(std::string_view text, int width) -> std::string;

/// @brief Splits text into lines at '\n'. A trailing newline does not produce an empty line.
[[nodiscard]] auto splitLines(std::string_view text) -> std::vector<std::string_view>;

} // namespace bufstack::tui
