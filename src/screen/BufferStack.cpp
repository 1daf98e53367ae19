// SPDX-License-Identifier: Apache-2.0
#include "BufferStack.hpp"

#include <core/Log.hpp>
#include <tui/Key.hpp>
#include <tui/Surface.hpp>

#include <algorithm>
#include <format>

namespace bufstack
{

BufferStack::BufferStack(tui::Surface& surface, tui::Theme const& theme): _surface { surface }, _theme { theme }
{
}

BufferStack::~BufferStack()
{
    killAllBuffers();
}

auto BufferStack::spawn(std::string_view title, std::unique_ptr<View> view, SpawnOptions const& options)
    -> Result<Buffer*>
{
    if (!view)
    {
        log::error("spawn('{}'): no view given", title);
        return makeError(ErrorCode::InvalidArgument, std::format("Cannot spawn buffer '{}' without a view", title));
    }

    auto realTitle = uniqueTitle(title);
    auto const width = options.width.value_or(_surface.columns());
    auto const height = options.height.value_or(_surface.rows() - 1);

    auto buffer = std::make_unique<Buffer>(
        _surface, _theme, std::move(view), std::move(realTitle), width, height, options.forceToTop);
    auto* raw = buffer.get();

    if (auto registered = registerTitle(*raw); !registered)
        return std::unexpected(registered.error());

    _buffers.insert(_buffers.begin(), std::move(buffer));
    log::debug("Spawned buffer '{}' ({}x{}{})", raw->title(), width, height, options.hidden ? ", hidden" : "");

    if (options.hidden)
    {
        if (!_focused)
            (void) focusOn(*raw);
    }
    else if (auto raised = raiseToFront(*raw); !raised)
        return std::unexpected(raised.error());

    return raw;
}

auto BufferStack::spawnUnlessExists(std::string_view title, SpawnOptions const& options, ViewFactory const& factory)
    -> Result<Buffer*>
{
    if (auto* existing = find(title))
    {
        if (!options.hidden)
        {
            if (auto raised = raiseToFront(*existing); !raised)
                return std::unexpected(raised.error());
        }
        return existing;
    }

    auto view = factory ? factory() : nullptr;
    if (!view)
    {
        log::debug("spawnUnlessExists('{}'): no view to show", title);
        return nullptr;
    }
    return spawn(title, std::move(view), options);
}

auto BufferStack::raiseToFront(Buffer& buffer) -> VoidResult
{
    auto const index = indexOf(buffer);
    if (!index)
        return notOnStack("raiseToFront", buffer);

    auto owned = std::move(_buffers[*index]);
    _buffers.erase(_buffers.begin() + static_cast<std::ptrdiff_t>(*index));

    _dirty = true;

    // A pinned top keeps both its place and the focus.
    if (!_buffers.empty() && _buffers.back()->forceToTop())
    {
        _buffers.insert(_buffers.end() - 1, std::move(owned));
        return {};
    }

    _buffers.push_back(std::move(owned));
    return focusOn(*_buffers.back());
}

auto BufferStack::focusOn(Buffer& buffer) -> VoidResult
{
    if (!contains(buffer))
        return notOnStack("focusOn", buffer);
    if (&buffer == _focused)
        return {};

    if (_focused)
        _focused->blur();
    _focused = &buffer;
    _focused->focus();
    return {};
}

void BufferStack::rollBuffers()
{
    if (_buffers.empty())
        return;

    _buffers.back()->setForceToTop(false);
    (void) raiseToFront(*_buffers.front());
}

void BufferStack::rollBuffersBackwards()
{
    if (_buffers.size() < 2)
        return;

    _buffers.back()->setForceToTop(false);
    (void) raiseToFront(*_buffers[_buffers.size() - 2]);
}

auto BufferStack::killBuffer(Buffer& buffer) -> VoidResult
{
    auto const index = indexOf(buffer);
    if (!index)
        return notOnStack("killBuffer", buffer);

    log::debug("Killing buffer '{}'", buffer.title());
    buffer.view().cleanup();

    _byTitle.erase(buffer.title());
    if (_focused == &buffer)
        _focused = nullptr;
    _buffers.erase(_buffers.begin() + static_cast<std::ptrdiff_t>(*index));
    _dirty = true;

    if (_buffers.empty())
        return {};

    return raiseToFront(*_buffers.back());
}

auto BufferStack::killBufferSafely(Buffer& buffer) -> Result<bool>
{
    if (!contains(buffer))
        return notOnStack("killBufferSafely", buffer);
    if (!buffer.view().killable())
        return false;

    if (auto killed = killBuffer(buffer); !killed)
        return std::unexpected(killed.error());
    return true;
}

auto BufferStack::killAllBuffersSafely() -> bool
{
    while (!_buffers.empty())
    {
        auto& top = *_buffers.back();
        if (!top.view().alwaysPresent() && !top.view().killable())
        {
            log::debug("Buffer '{}' refused to be killed", top.title());
            return false;
        }
        (void) killBuffer(top);
    }
    return true;
}

void BufferStack::killAllBuffers()
{
    while (!_buffers.empty())
        (void) killBuffer(*_buffers.front());
}

auto BufferStack::find(std::string_view title) const -> Buffer*
{
    auto const it = _byTitle.find(std::string(title));
    return it != _byTitle.end() ? it->second : nullptr;
}

auto BufferStack::exists(std::string_view title) const -> bool
{
    return find(title) != nullptr;
}

auto BufferStack::contains(Buffer const& buffer) const -> bool
{
    return indexOf(buffer).has_value();
}

auto BufferStack::top() const -> Buffer*
{
    return _buffers.empty() ? nullptr : _buffers.back().get();
}

auto BufferStack::buffers() const -> std::vector<Buffer*>
{
    auto result = std::vector<Buffer*> {};
    result.reserve(_buffers.size());
    for (auto const& buffer: _buffers)
        result.push_back(buffer.get());
    return result;
}

auto BufferStack::handleInput(tui::KeyEvent const& key) -> bool
{
    if (!_focused)
        return false;

    if (!_focused->view().handleInput(key))
        return false;

    _focused->markDirty();
    return true;
}

auto BufferStack::uniqueTitle(std::string_view title) const -> std::string
{
    auto realTitle = std::string(title);
    for (auto n = 2; _byTitle.contains(realTitle); ++n)
        realTitle = std::format("{} <{}>", title, n);
    return realTitle;
}

auto BufferStack::registerTitle(Buffer& buffer) -> VoidResult
{
    auto const [it, inserted] = _byTitle.emplace(buffer.title(), &buffer);
    if (!inserted)
    {
        log::error("Buffer title '{}' is already taken", buffer.title());
        return makeError(ErrorCode::DuplicateTitle, std::format("Duplicate buffer title '{}'", buffer.title()));
    }
    return {};
}

auto BufferStack::indexOf(Buffer const& buffer) const -> std::optional<std::size_t>
{
    auto const it = std::ranges::find_if(_buffers, [&](auto const& b) { return b.get() == &buffer; });
    if (it == _buffers.end())
        return std::nullopt;
    return static_cast<std::size_t>(it - _buffers.begin());
}

auto BufferStack::notOnStack(std::string_view operation, Buffer const& buffer) const -> std::unexpected<Error>
{
    // The buffer may already be destroyed; only its address is safe to report.
    log::error("{}: buffer {} is not on the stack", operation, static_cast<void const*>(&buffer));
    return makeError(ErrorCode::NotOnStack,
                     std::format("{}: buffer {} is not on the stack", operation, static_cast<void const*>(&buffer)));
}

} // namespace bufstack
