// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/Key.hpp>
#include <tui/Surface.hpp>

#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bufstack::test
{

/// @brief An in-memory Surface with a scripted input queue.
///
/// Once the queue runs dry, poll() returns the cancel key, so every input loop
/// under test terminates. A std::nullopt entry in the queue simulates a poll
/// timeout; a ResizeEvent entry also changes the grid size when it is polled.
class FakeSurface final: public tui::Surface
{
  public:
    explicit FakeSurface(int rows = 24, int columns = 80): _rows { rows }, _columns { columns } { resizeGrid(); }

    [[nodiscard]] auto rows() const noexcept -> int override { return _rows; }
    [[nodiscard]] auto columns() const noexcept -> int override { return _columns; }

    void put(int row, int col, std::string_view text, tui::Style const& style) override
    {
        if (row < 0 || row >= _rows)
            return;
        ++puts;
        auto i = std::size_t { 0 };
        while (i < text.size() && col < _columns)
        {
            auto length = std::size_t { 1 };
            auto const lead = static_cast<unsigned char>(text[i]);
            if ((lead & 0xE0) == 0xC0)
                length = 2;
            else if ((lead & 0xF0) == 0xE0)
                length = 3;
            else if ((lead & 0xF8) == 0xF0)
                length = 4;
            if (col >= 0)
            {
                auto& cell = _cells[static_cast<std::size_t>(row)][static_cast<std::size_t>(col)];
                cell.glyph = std::string(text.substr(i, length));
                cell.style = style;
            }
            i += length;
            ++col;
        }
    }

    void moveCursor(int row, int col) override
    {
        cursorRow = row;
        cursorCol = col;
    }

    void setCursorVisible(bool visible) override { cursorVisible = visible; }
    void commit() override { ++commits; }
    void flush() override { ++flushes; }
    void refresh() override { ++refreshes; }

    void clear() override
    {
        ++clears;
        resizeGrid();
    }

    [[nodiscard]] auto poll(int timeoutMs) -> std::optional<tui::InputEvent> override
    {
        lastTimeoutMs = timeoutMs;
        ++polls;
        if (onPoll)
            onPoll();
        if (_queue.empty())
            return tui::InputEvent { cancelKey };

        auto event = _queue.front();
        _queue.pop_front();
        if (event)
        {
            if (auto const* resize = std::get_if<tui::ResizeEvent>(&*event))
            {
                _rows = resize->rows;
                _columns = resize->columns;
                resizeGrid();
            }
        }
        return event;
    }

    void suspend() override
    {
        ++suspends;
        suspended = true;
    }

    void resume() override
    {
        ++resumes;
        suspended = false;
    }

    // Scripting

    void pushKey(tui::KeyEvent key) { _queue.emplace_back(tui::InputEvent { key }); }
    void pushTimeout() { _queue.emplace_back(std::nullopt); }
    void pushResize(int rows, int columns)
    {
        _queue.emplace_back(tui::InputEvent { tui::ResizeEvent { .columns = columns, .rows = rows } });
    }

    /// @brief Queues one unmodified key per character of @p text (ASCII only).
    void type(std::string_view text)
    {
        for (auto const ch: text)
            pushKey(tui::charKey(static_cast<char32_t>(ch)));
    }

    void pushEnter() { pushKey(tui::specialKey(tui::KeyCode::Enter)); }
    void pushTab() { pushKey(tui::specialKey(tui::KeyCode::Tab)); }

    [[nodiscard]] auto pending() const noexcept -> std::size_t { return _queue.size(); }

    // Inspection

    /// @brief Returns the text of a row with trailing blanks removed.
    [[nodiscard]] auto row(int r) const -> std::string
    {
        auto text = std::string {};
        for (auto const& cell: _cells.at(static_cast<std::size_t>(r)))
            text += cell.glyph;
        while (!text.empty() && text.back() == ' ')
            text.pop_back();
        return text;
    }

    [[nodiscard]] auto styleAt(int r, int c) const -> tui::Style
    {
        return _cells.at(static_cast<std::size_t>(r)).at(static_cast<std::size_t>(c)).style;
    }

    /// @brief Runs at the start of every poll(), to inspect the screen while a loop waits.
    std::function<void()> onPoll;

    tui::KeyEvent cancelKey = tui::ctrlKey('g');
    int cursorRow = 0;
    int cursorCol = 0;
    bool cursorVisible = false;
    bool suspended = false;
    int lastTimeoutMs = 0;
    int puts = 0;
    int commits = 0;
    int flushes = 0;
    int refreshes = 0;
    int clears = 0;
    int polls = 0;
    int suspends = 0;
    int resumes = 0;

  private:
    struct Cell
    {
        std::string glyph = " ";
        tui::Style style;
    };

    void resizeGrid()
    {
        _cells.assign(static_cast<std::size_t>(_rows), std::vector<Cell>(static_cast<std::size_t>(_columns)));
    }

    int _rows;
    int _columns;
    std::vector<std::vector<Cell>> _cells;
    std::deque<std::optional<tui::InputEvent>> _queue;
};

} // namespace bufstack::test
