// SPDX-License-Identifier: Apache-2.0
#include "Compositor.hpp"

#include <screen/BufferStack.hpp>
#include <screen/Minibuffer.hpp>
#include <tui/Surface.hpp>
#include <tui/Text.hpp>
#include <tui/Theme.hpp>

#include <algorithm>

namespace bufstack
{

Compositor::Compositor(tui::Surface& surface, tui::Theme const& theme, BufferStack& stack, Minibuffer& minibuffer):
    _surface { surface }, _theme { theme }, _stack { stack }, _minibuffer { minibuffer }
{
}

void Compositor::drawScreen(DrawOptions const& options)
{
    if (_suspended)
        return;

    auto lock = options.lockHeld ? std::unique_lock<std::mutex> {} : std::unique_lock(_paintMutex);

    if (auto* top = _stack.top())
    {
        top->resize(_surface.rows() - _minibuffer.lineCount(), _surface.columns());
        if (_stack.dirty())
            top->draw();
        else
            top->redraw();
    }

    if (!options.skipMinibuffer)
        paintMinibuffer();

    _stack.clearDirty();
    ++_passes;

    _surface.flush();
    if (options.refresh)
        _surface.refresh();
}

void Compositor::completelyRedrawScreen()
{
    if (_suspended)
        return;

    auto const lock = std::lock_guard(_paintMutex);
    _stack.markDirty();
    _surface.clear();
    drawScreen(DrawOptions { .lockHeld = true });
}

void Compositor::drawMinibuffer(DrawOptions const& options)
{
    if (_suspended)
        return;

    auto lock = options.lockHeld ? std::unique_lock<std::mutex> {} : std::unique_lock(_paintMutex);
    paintMinibuffer();
    _surface.flush();
    if (options.refresh)
        _surface.refresh();
}

auto Compositor::lock() -> std::unique_lock<std::mutex>
{
    return std::unique_lock(_paintMutex);
}

void Compositor::paintMinibuffer()
{
    auto const lines = _minibuffer.lines();
    auto const promptRows = _minibuffer.promptActive() ? 1 : 0;
    auto const width = _surface.columns();
    auto const style = _theme.style("none");

    auto row = _surface.rows() - promptRows - static_cast<int>(lines.size());
    for (auto const& line: lines)
    {
        if (row >= 0)
            _surface.put(row, 0, tui::padRight(tui::clipToWidth(line, width), width), style);
        ++row;
    }
    _surface.commit();
}

} // namespace bufstack
