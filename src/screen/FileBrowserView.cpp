// SPDX-License-Identifier: Apache-2.0
#include "FileBrowserView.hpp"

#include <core/Log.hpp>
#include <screen/Buffer.hpp>

#include <algorithm>
#include <filesystem>
#include <format>

namespace bufstack
{

namespace
{
    auto normalizeDirectory(std::string const& directory) -> std::string
    {
        auto normalized = std::filesystem::path(directory).lexically_normal().string();
        while (normalized.size() > 1 && normalized.ends_with('/'))
            normalized.pop_back();
        return normalized.empty() ? std::string(".") : normalized;
    }
} // namespace

FileBrowserView::FileBrowserView(os::FileSystem const& fileSystem, std::string directory): _fileSystem { fileSystem }
{
    load(directory.empty() ? _fileSystem.currentDirectory() : std::move(directory));
}

void FileBrowserView::draw(Buffer& buffer)
{
    _contentRows = std::max(1, buffer.contentHeight());

    auto const selected = static_cast<int>(_cursor);
    if (selected < _topRow)
        _topRow = selected;
    else if (selected >= _topRow + _contentRows)
        _topRow = selected - _contentRows + 1;

    auto row = 0;
    if (_loadError)
        buffer.write(row++, 0, *_loadError, WriteOptions { .color = "error" });

    for (auto index = static_cast<std::size_t>(_topRow); index < _entries.size() && row < _contentRows; ++index, ++row)
    {
        auto const& entry = _entries[index];
        auto const tagged = !entry.directory && isTagged(pathOf(entry));
        auto const color = entry.directory ? "directory" : tagged ? "tagged" : "none";
        auto const label = std::format("{} {}{}", tagged ? '*' : ' ', entry.name, entry.directory ? "/" : "");
        buffer.write(row, 0, label, WriteOptions { .color = color, .highlight = index == _cursor });
    }

    for (; row < _contentRows; ++row)
        buffer.write(row, 0, {});
}

void FileBrowserView::resize(int rows, int cols)
{
    (void) cols;
    _contentRows = std::max(1, rows - 1);
}

auto FileBrowserView::handleInput(tui::KeyEvent const& key) -> bool
{
    using tui::KeyCode;

    if (key.key == KeyCode::Up || tui::isChar(key, 'k'))
        moveCursor(-1);
    else if (key.key == KeyCode::Down || tui::isChar(key, 'j'))
        moveCursor(1);
    else if (key.key == KeyCode::PageUp)
        moveCursor(-_contentRows);
    else if (key.key == KeyCode::PageDown)
        moveCursor(_contentRows);
    else if (key.key == KeyCode::Home)
        _cursor = 0;
    else if (key.key == KeyCode::End)
        _cursor = _entries.empty() ? 0 : _entries.size() - 1;
    else if (key.key == KeyCode::Enter)
        activate();
    else if (tui::isChar(key, ' '))
        toggleTag();
    else
        return false;
    return true;
}

auto FileBrowserView::status() const -> std::string
{
    if (_tagged.empty())
        return _directory;
    return std::format("{}  ({} tagged)", _directory, _tagged.size());
}

auto FileBrowserView::value() -> std::vector<std::string>
{
    return _value;
}

void FileBrowserView::load(std::string directory)
{
    _directory = normalizeDirectory(directory);
    _entries.clear();
    _entries.push_back(os::DirectoryEntry { .name = "..", .directory = true });
    _loadError.reset();
    _cursor = 0;
    _topRow = 0;

    auto listing = _fileSystem.listDirectory(_directory);
    if (!listing)
    {
        log::warning("File browser: {}", listing.error());
        _loadError = listing.error().message;
        return;
    }
    _entries.insert(_entries.end(), listing->begin(), listing->end());
}

void FileBrowserView::moveCursor(long delta)
{
    if (_entries.empty())
        return;
    auto const last = static_cast<long>(_entries.size()) - 1;
    _cursor = static_cast<std::size_t>(std::clamp(static_cast<long>(_cursor) + delta, 0L, last));
}

void FileBrowserView::activate()
{
    if (_cursor >= _entries.size())
        return;

    auto const& entry = _entries[_cursor];
    if (entry.directory)
    {
        load(pathOf(entry));
        return;
    }

    _value = _tagged.empty() ? std::vector { pathOf(entry) } : _tagged;
    _done = true;
}

void FileBrowserView::toggleTag()
{
    if (_cursor >= _entries.size() || _entries[_cursor].directory)
        return;

    auto const path = pathOf(_entries[_cursor]);
    if (auto const it = std::ranges::find(_tagged, path); it != _tagged.end())
        _tagged.erase(it);
    else
        _tagged.push_back(path);
    moveCursor(1);
}

auto FileBrowserView::pathOf(os::DirectoryEntry const& entry) const -> std::string
{
    if (entry.name == "..")
        return normalizeDirectory(os::joinPath(_directory, ".."));
    return os::joinPath(_directory, entry.name);
}

auto FileBrowserView::isTagged(std::string const& path) const -> bool
{
    return std::ranges::find(_tagged, path) != _tagged.end();
}

} // namespace bufstack
