// SPDX-License-Identifier: Apache-2.0
#include "CompletionView.hpp"

#include <screen/Buffer.hpp>
#include <tui/Text.hpp>

#include <algorithm>
#include <format>

namespace bufstack
{

namespace
{
    constexpr auto Interstitial = 2;
} // namespace

CompletionView::CompletionView(std::vector<std::string> labels, std::string header, std::size_t prefixLen):
    _labels { std::move(labels) }, _header { std::move(header) }, _prefixLen { prefixLen }
{
    for (auto const& label: _labels)
        _maxLabelWidth = std::max(_maxLabelWidth, tui::displayWidth(label));
}

void CompletionView::draw(Buffer& buffer)
{
    _rows = buffer.height();
    _cols = buffer.width();

    buffer.write(0, 0, _header, WriteOptions { .color = "header" });

    auto const perRow = columnsPerRow();
    auto const cellWidth = _maxLabelWidth + Interstitial;
    for (auto screenRow = 1; screenRow < buffer.contentHeight(); ++screenRow)
    {
        buffer.write(screenRow, 0, {});
        auto const row = _topRow + screenRow - 1;
        for (auto column = 0; column < perRow; ++column)
        {
            auto const index = static_cast<std::size_t>(row * perRow + column);
            if (index >= _labels.size())
                break;

            auto const& label = _labels[index];
            auto const prefix = tui::clipToWidth(label, static_cast<int>(_prefixLen));
            auto const rest = std::string_view(label).substr(prefix.size());
            auto const col = column * cellWidth;

            buffer.write(screenRow, col, prefix, WriteOptions { .color = "completion", .noFill = true });
            buffer.write(screenRow, col + tui::displayWidth(prefix), rest, WriteOptions { .noFill = true });
        }
    }
}

void CompletionView::resize(int rows, int cols)
{
    _rows = rows;
    _cols = cols;
    _topRow = std::min(_topRow, std::max(0, rowCount() - 1));
}

auto CompletionView::handleInput(tui::KeyEvent const& key) -> bool
{
    if (tui::isChar(key, ' ') || key.key == tui::KeyCode::PageDown)
    {
        roll();
        return true;
    }
    return false;
}

auto CompletionView::status() const -> std::string
{
    return std::format("{} candidates", _labels.size());
}

void CompletionView::roll()
{
    auto const page = pageRows();
    if (_topRow + page >= rowCount())
        _topRow = 0;
    else
        _topRow += page;
}

auto CompletionView::rowCount() const -> int
{
    auto const perRow = columnsPerRow();
    return (static_cast<int>(_labels.size()) + perRow - 1) / perRow;
}

auto CompletionView::columnsPerRow() const -> int
{
    return std::max(1, _cols / (_maxLabelWidth + Interstitial));
}

auto CompletionView::pageRows() const -> int
{
    // Content rows minus the header line
    return std::max(1, _rows - 2);
}

} // namespace bufstack
