// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <deque>
#include <string>
#include <vector>

#include <termios.h>

#include <tui/KeyDecoder.hpp>
#include <tui/Surface.hpp>

namespace bufstack::tui
{

/// @brief Surface implementation on a POSIX terminal.
///
/// Puts stdin into raw mode and switches to the alternate screen. Keeps three
/// cell grids: the back grid written by put(), the staged grid updated by
/// commit(), and the physical grid mirroring what the terminal shows. flush()
/// emits only the cells that differ between the staged and physical grids,
/// wrapped in synchronized-output mode to prevent tearing.
///
/// SIGWINCH is delivered through a self-pipe and surfaces as a ResizeEvent from
/// poll(). Only one TerminalSurface may be initialized at a time.
class TerminalSurface final: public Surface
{
  public:
    TerminalSurface();
    ~TerminalSurface() override;

    TerminalSurface(TerminalSurface const&) = delete;
    auto operator=(TerminalSurface const&) -> TerminalSurface& = delete;
    TerminalSurface(TerminalSurface&&) = delete;
    auto operator=(TerminalSurface&&) -> TerminalSurface& = delete;

    /// @brief Enters raw mode and the alternate screen, installs the SIGWINCH handler.
    /// @return Success or an IoError.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Restores the terminal and the previous SIGWINCH handler.
    void shutdown();

    [[nodiscard]] auto rows() const noexcept -> int override;
    [[nodiscard]] auto columns() const noexcept -> int override;
    void put(int row, int col, std::string_view text, Style const& style) override;
    void moveCursor(int row, int col) override;
    void setCursorVisible(bool visible) override;
    void commit() override;
    void flush() override;
    void refresh() override;
    void clear() override;
    [[nodiscard]] auto poll(int timeoutMs) -> std::optional<InputEvent> override;
    void suspend() override;
    void resume() override;

  private:
    struct Cell
    {
        std::string glyph = " ";
        Style style;

        auto operator==(Cell const&) const -> bool = default;
    };

    using Grid = std::vector<Cell>;

    int _fd = 0; // STDIN_FILENO
    struct termios _origTermios {};
    bool _rawMode = false;
    bool _initialized = false;
    int _resizePipe[2] = { -1, -1 }; ///< Self-pipe for SIGWINCH.

    KeyDecoder _decoder;
    std::deque<InputEvent> _pending;

    int _rows = 24;
    int _cols = 80;
    Grid _back;
    Grid _staged;
    Grid _physical;
    bool _repaintAll = true;

    int _cursorRow = 0;
    int _cursorCol = 0;
    bool _cursorVisible = false;

    std::string _out; ///< Escape sequences accumulated by flush().

    void enableRawMode();
    void disableRawMode();
    void updateDimensions();
    void resizeGrids();
    void readInput(bool resized, bool readable);
    void appendSgr(Style const& style);
    void writeOut(std::string_view bytes) const;
};

} // namespace bufstack::tui
