// SPDX-License-Identifier: Apache-2.0
#include "Views.hpp"

#include <core/Log.hpp>
#include <screen/Buffer.hpp>
#include <screen/BufferStack.hpp>
#include <tui/Key.hpp>

#include <algorithm>
#include <array>
#include <format>
#include <fstream>

namespace bufstack
{

namespace
{
    constexpr auto HelpLines = std::array<std::string_view, 10> {
        "  b / B    roll buffers forwards / backwards",
        "  x        kill the focused buffer",
        "  o        open files",
        "  s        add a status line",
        "  c        clear the newest status line",
        "  f        flash a message",
        "  l        count the entries of the current directory",
        "  !        run a shell command",
        "  C-l      redraw the screen",
        "  q        quit",
    };
} // namespace

HomeView::HomeView(BufferStack const& stack): _stack { stack }
{
}

void HomeView::draw(Buffer& buffer)
{
    auto row = 0;
    buffer.write(row++, 0, "Buffers", WriteOptions { .color = "header" });

    auto const buffers = _stack.buffers();
    for (auto it = buffers.rbegin(); it != buffers.rend() && row < buffer.contentHeight(); ++it)
    {
        auto const* entry = *it;
        auto const marker = entry->focused() ? '*' : ' ';
        auto const line = std::format(" {} {}  [{}]", marker, entry->title(), entry->view().name());
        buffer.write(row++, 0, line, WriteOptions { .color = entry == &buffer ? "muted" : "none" });
    }

    if (row < buffer.contentHeight())
        buffer.write(row++, 0, {});
    if (row < buffer.contentHeight())
        buffer.write(row++, 0, "Keys", WriteOptions { .color = "header" });
    for (auto const& help: HelpLines)
    {
        if (row >= buffer.contentHeight())
            break;
        buffer.write(row++, 0, help);
    }

    while (row < buffer.contentHeight())
        buffer.write(row++, 0, {});
}

auto HomeView::handleInput(tui::KeyEvent const& key) -> bool
{
    (void) key;
    return false;
}

auto HomeView::status() const -> std::string
{
    return std::format("{} buffers", _stack.size());
}

auto TextFileView::load(std::string path) -> Result<std::unique_ptr<TextFileView>>
{
    auto file = std::ifstream(path);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open file: {}", path));

    auto lines = std::vector<std::string> {};
    for (auto line = std::string {}; std::getline(file, line);)
    {
        // Tabs and carriage returns would break the one-codepoint-per-column layout
        std::ranges::replace(line, '\t', ' ');
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(std::move(line));
    }
    if (file.bad())
        return makeError(ErrorCode::IoError, std::format("Error reading file: {}", path));

    log::debug("Loaded {} lines from {}", lines.size(), path);
    return std::make_unique<TextFileView>(std::move(path), std::move(lines));
}

TextFileView::TextFileView(std::string path, std::vector<std::string> lines):
    _path { std::move(path) }, _lines { std::move(lines) }
{
}

void TextFileView::draw(Buffer& buffer)
{
    _contentRows = std::max(1, buffer.contentHeight());
    for (auto row = 0; row < buffer.contentHeight(); ++row)
    {
        auto const index = static_cast<std::size_t>(_topLine + row);
        if (index < _lines.size())
            buffer.write(row, 0, _lines[index]);
        else
            buffer.write(row, 0, "~", WriteOptions { .color = "muted" });
    }
}

void TextFileView::resize(int rows, int cols)
{
    (void) cols;
    _contentRows = std::max(1, rows - 1);
    scroll(0);
}

auto TextFileView::handleInput(tui::KeyEvent const& key) -> bool
{
    using tui::KeyCode;

    if (key.key == KeyCode::Down || tui::isChar(key, 'j'))
        scroll(1);
    else if (key.key == KeyCode::Up || tui::isChar(key, 'k'))
        scroll(-1);
    else if (key.key == KeyCode::PageDown || tui::isChar(key, ' '))
        scroll(_contentRows);
    else if (key.key == KeyCode::PageUp)
        scroll(-_contentRows);
    else if (key.key == KeyCode::Home)
        _topLine = 0;
    else if (key.key == KeyCode::End)
        scroll(static_cast<int>(_lines.size()));
    else
        return false;
    return true;
}

void TextFileView::cleanup()
{
    log::debug("Closing {}", _path);
    _lines.clear();
}

auto TextFileView::status() const -> std::string
{
    return std::format("line {}/{}", std::min(_topLine + 1, static_cast<int>(_lines.size())), _lines.size());
}

void TextFileView::scroll(int delta)
{
    auto const lastTop = std::max(0, static_cast<int>(_lines.size()) - _contentRows);
    _topLine = std::clamp(_topLine + delta, 0, lastTop);
}

} // namespace bufstack
