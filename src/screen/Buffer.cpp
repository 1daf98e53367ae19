// SPDX-License-Identifier: Apache-2.0
#include "Buffer.hpp"

#include <tui/Surface.hpp>
#include <tui/Text.hpp>
#include <tui/Theme.hpp>

#include <algorithm>
#include <format>

namespace bufstack
{

Buffer::Buffer(tui::Surface& surface,
               tui::Theme const& theme,
               std::unique_ptr<View> view,
               std::string title,
               int width,
               int height,
               bool forceToTop):
    _surface { surface },
    _theme { theme },
    _view { std::move(view) },
    _title { std::move(title) },
    _width { std::max(width, 0) },
    _height { std::max(height, 1) },
    _forceToTop { forceToTop }
{
}

void Buffer::resize(int rows, int cols)
{
    rows = std::max(rows, 1);
    cols = std::max(cols, 0);
    if (rows == _height && cols == _width)
        return;

    _width = cols;
    _height = rows;
    _dirty = true;
    _view->resize(rows, cols);
}

void Buffer::redraw()
{
    if (_dirty)
        draw();
    else
    {
        drawStatus();
        commit();
    }
}

void Buffer::draw()
{
    _view->draw(*this);
    drawStatus();
    commit();
}

void Buffer::commit()
{
    _dirty = false;
    _surface.commit();
}

void Buffer::write(int row, int col, std::string_view text, WriteOptions const& options)
{
    if (row < 0 || col < 0 || row >= _height || col >= _width)
        return;

    auto const available = _width - col;
    auto const clipped = tui::clipToWidth(text, available);
    auto const style = _theme.style(options.color, options.highlight);

    _surface.put(_y + row, _x + col, clipped, style);

    auto const written = tui::displayWidth(clipped);
    if (!options.noFill && written < available)
        _surface.put(_y + row, _x + col + written, std::string(static_cast<std::size_t>(available - written), ' '), style);
}

void Buffer::clear()
{
    for (auto row = 0; row < contentHeight(); ++row)
        write(row, 0, {});
}

auto Buffer::statusText() const -> std::string
{
    return std::format(" [{}] {}   {}", _view->name(), _title, _view->status());
}

void Buffer::drawStatus()
{
    write(_height - 1, 0, statusText(), WriteOptions { .color = "status" });
}

void Buffer::focus()
{
    _focused = true;
    _dirty = true;
    _view->focus();
}

void Buffer::blur()
{
    _focused = false;
    _dirty = true;
    _view->blur();
}

} // namespace bufstack
