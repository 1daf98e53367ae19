// SPDX-License-Identifier: Apache-2.0
#include "ScreenSession.hpp"

#include <core/Log.hpp>
#include <os/Shell.hpp>
#include <tui/Surface.hpp>

namespace bufstack
{

ScreenSession::ScreenSession(tui::Surface& surface,
                             tui::Theme theme,
                             ScreenConfig config,
                             os::FileSystem const& fileSystem,
                             os::Accounts& accounts):
    _surface { surface },
    _theme { std::move(theme) },
    _config { std::move(config) },
    _stack { _surface, _theme },
    _compositor { _surface, _theme, _stack, _minibuffer },
    _prompts { loopContext(), _theme, fileSystem, accounts }
{
}

auto ScreenSession::loopContext() -> LoopContext
{
    return LoopContext {
        .surface = _surface,
        .stack = _stack,
        .minibuffer = _minibuffer,
        .compositor = _compositor,
        .config = _config,
    };
}

auto ScreenSession::say(std::string text) -> StatusHandle
{
    auto const handle = _minibuffer.say(std::move(text));
    _compositor.drawScreen(DrawOptions { .refresh = true });
    return handle;
}

void ScreenSession::say(StatusHandle handle, std::string text)
{
    _minibuffer.say(handle, std::move(text));
    _compositor.drawMinibuffer(DrawOptions { .refresh = true });
}

auto ScreenSession::say(std::string text, std::function<void(StatusHandle)> const& body) -> StatusHandle
{
    auto const status = ScopedStatus(*this, std::move(text));
    if (body)
        body(status.handle());
    return status.handle();
}

void ScreenSession::clear(StatusHandle handle)
{
    _minibuffer.clear(handle);
    _compositor.drawScreen(DrawOptions { .refresh = true });
}

void ScreenSession::flash(std::string text)
{
    _minibuffer.flash(std::move(text));
    _compositor.drawScreen(DrawOptions { .refresh = true });
}

void ScreenSession::eraseFlash()
{
    _minibuffer.eraseFlash();
}

void ScreenSession::drawScreen(DrawOptions const& options)
{
    _compositor.drawScreen(options);
}

void ScreenSession::completelyRedrawScreen()
{
    _compositor.completelyRedrawScreen();
}

auto ScreenSession::handleInput(tui::KeyEvent const& key) -> bool
{
    return _stack.handleInput(key);
}

auto ScreenSession::shellOut(std::string_view command) -> Result<int>
{
    auto result = Result<int> {};
    {
        auto const lock = _compositor.lock();
        _compositor.setSuspended(true);
        _surface.suspend();
        log::info("Shelling out: {}", command);
        result = os::runShellCommand(command);
        _surface.resume();
        _compositor.setSuspended(false);
    }

    if (result)
        log::info("Shell command exited with status {}", *result);
    else
        log::error("Shell command failed: {}", result.error());

    completelyRedrawScreen();
    return result;
}

auto ScreenSession::ask(std::string_view domain,
                        std::string_view question,
                        std::string_view defaultValue,
                        tui::CompletionProvider provider) -> Result<std::optional<std::string>>
{
    return _prompts.ask(domain, question, defaultValue, std::move(provider));
}

auto ScreenSession::askForFilenames(std::string_view domain, std::string_view question, std::string_view defaultValue)
    -> Result<std::vector<std::string>>
{
    return _prompts.askForFilenames(domain, question, defaultValue);
}

auto ScreenSession::askGetch(std::string_view question, std::string_view accept)
    -> Result<std::optional<tui::KeyEvent>>
{
    return _prompts.askGetch(question, accept);
}

auto ScreenSession::askYesOrNo(std::string_view question) -> Result<std::optional<bool>>
{
    return _prompts.askYesOrNo(question);
}

ScopedStatus::ScopedStatus(ScreenSession& session, std::string text):
    _session { session }, _handle { session.say(std::move(text)) }
{
}

ScopedStatus::~ScopedStatus()
{
    _session.clear(_handle);
}

void ScopedStatus::update(std::string text)
{
    _session.say(_handle, std::move(text));
}

} // namespace bufstack
