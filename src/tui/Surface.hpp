// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string_view>

#include <tui/InputEvent.hpp>
#include <tui/Style.hpp>

namespace bufstack::tui
{

/// @brief The character-grid terminal the screen layer paints on.
///
/// Coordinates are 0-based. Output is staged in three steps modelled on curses:
/// put() writes into an offscreen grid, commit() marks what has been written as
/// ready for output, flush() sends everything committed to the terminal in one
/// batched update. refresh() is commit() followed by flush().
///
/// A Surface is not synchronized; callers serialize access (see Compositor).
class Surface
{
  public:
    virtual ~Surface() = default;

    /// @brief Returns the terminal height in rows.
    [[nodiscard]] virtual auto rows() const noexcept -> int = 0;

    /// @brief Returns the terminal width in columns.
    [[nodiscard]] virtual auto columns() const noexcept -> int = 0;

    /// @brief Writes a single line of text, clipped at the right edge of the screen.
    ///
    /// One codepoint occupies one column. Writes outside the grid are dropped.
    virtual void put(int row, int col, std::string_view text, Style const& style) = 0;

    /// @brief Moves the hardware cursor.
    virtual void moveCursor(int row, int col) = 0;

    /// @brief Shows or hides the hardware cursor.
    virtual void setCursorVisible(bool visible) = 0;

    /// @brief Marks everything put() so far as ready for output.
    virtual void commit() = 0;

    /// @brief Sends all committed content to the terminal in one update.
    virtual void flush() = 0;

    /// @brief Commits and flushes immediately.
    virtual void refresh() = 0;

    /// @brief Blanks the grid and forces the next flush to repaint every cell.
    virtual void clear() = 0;

    /// @brief Waits up to timeoutMs for the next input event.
    /// @return The event, or std::nullopt if nothing arrived in time.
    [[nodiscard]] virtual auto poll(int timeoutMs) -> std::optional<InputEvent> = 0;

    /// @brief Hands the terminal back to cooked mode, e.g. for running a child process.
    virtual void suspend() = 0;

    /// @brief Reclaims the terminal after suspend(). The next flush repaints everything.
    virtual void resume() = 0;
};

} // namespace bufstack::tui
