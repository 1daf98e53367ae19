// SPDX-License-Identifier: Apache-2.0
#include "Minibuffer.hpp"

#include <algorithm>

namespace bufstack
{

auto Minibuffer::say(std::string text) -> StatusHandle
{
    auto const lock = std::lock_guard(_mutex);
    auto const slot = _nextSlot++;
    _status[slot] = std::move(text);
    return StatusHandle { slot };
}

void Minibuffer::say(StatusHandle handle, std::string text)
{
    auto const lock = std::lock_guard(_mutex);
    auto const slot = static_cast<std::size_t>(handle);
    _status[slot] = std::move(text);
    _nextSlot = std::max(_nextSlot, slot + 1);
}

void Minibuffer::clear(StatusHandle handle)
{
    auto const lock = std::lock_guard(_mutex);
    auto const slot = static_cast<std::size_t>(handle);
    _status.erase(slot);

    if (slot + 1 == _nextSlot)
        _nextSlot = _status.empty() ? 0 : _status.rbegin()->first + 1;
}

void Minibuffer::flash(std::string text)
{
    auto const lock = std::lock_guard(_mutex);
    _flash = std::move(text);
}

void Minibuffer::eraseFlash()
{
    auto const lock = std::lock_guard(_mutex);
    _flash.reset();
}

auto Minibuffer::flashText() const -> std::optional<std::string>
{
    auto const lock = std::lock_guard(_mutex);
    return _flash;
}

void Minibuffer::setPromptActive(bool active)
{
    auto const lock = std::lock_guard(_mutex);
    _promptActive = active;
}

auto Minibuffer::promptActive() const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return _promptActive;
}

auto Minibuffer::lineCount() const -> int
{
    auto const lock = std::lock_guard(_mutex);
    auto const count = (_flash ? 1 : 0) + (_promptActive ? 1 : 0) + static_cast<int>(_status.size());
    return std::max(1, count);
}

auto Minibuffer::lines() const -> std::vector<std::string>
{
    auto const lock = std::lock_guard(_mutex);
    auto result = std::vector<std::string> {};
    result.reserve(_status.size() + 1);
    if (_flash)
        result.push_back(*_flash);
    for (auto it = _status.rbegin(); it != _status.rend(); ++it)
        result.push_back(it->second);
    if (result.empty() && !_promptActive)
        result.emplace_back();
    return result;
}

auto Minibuffer::slots() const -> std::vector<std::optional<std::string>>
{
    auto const lock = std::lock_guard(_mutex);
    auto result = std::vector<std::optional<std::string>>(_nextSlot);
    for (auto const& [slot, text]: _status)
        result[slot] = text;
    return result;
}

} // namespace bufstack
