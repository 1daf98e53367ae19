// SPDX-License-Identifier: Apache-2.0
#include "PromptSession.hpp"

#include <core/Log.hpp>
#include <os/FileSystem.hpp>
#include <screen/CompletionView.hpp>
#include <screen/FileBrowserView.hpp>
#include <screen/FileCompletion.hpp>
#include <tui/KeyDecoder.hpp>
#include <tui/Text.hpp>
#include <tui/Theme.hpp>

#include <algorithm>
#include <format>

namespace bufstack
{

namespace
{
    constexpr auto CompletionsTitle = std::string_view { "<completions>" };
} // namespace

PromptSession::PromptSession(LoopContext context,
                             tui::Theme const& theme,
                             os::FileSystem const& fileSystem,
                             os::Accounts& accounts):
    _context { context }, _theme { theme }, _fileSystem { fileSystem }, _accounts { accounts }
{
}

auto PromptSession::ask(std::string_view domain,
                        std::string_view question,
                        std::string_view defaultValue,
                        tui::CompletionProvider provider) -> Result<std::optional<std::string>>
{
    if (_active)
        return rejectNested("ask");
    _active = true;

    log::debug("Prompt [{}]: {}", domain, question);

    auto& line = inputLineFor(domain);
    line.activate(std::string(question), defaultValue, std::move(provider));
    _context.minibuffer.setPromptActive(true);

    {
        auto const lock = _context.compositor.lock();
        _context.stack.markDirty();
        _context.compositor.drawScreen(DrawOptions { .lockHeld = true });
        _context.surface.setCursorVisible(true);
        paintPrompt(line);
    }

    while (true)
    {
        auto const event = _context.surface.poll(_context.config.pollTimeoutMs);
        if (!event)
            continue;

        if (std::holds_alternative<tui::ResizeEvent>(*event))
        {
            auto const lock = _context.compositor.lock();
            _context.stack.markDirty();
            _context.compositor.drawScreen(DrawOptions { .lockHeld = true });
            paintPrompt(line);
            continue;
        }

        auto const action = line.processKey(std::get<tui::KeyEvent>(*event));
        if (action == tui::InputLineAction::Accept || action == tui::InputLineAction::Cancel)
            break;

        auto const lock = _context.compositor.lock();
        if (line.takeNewCompletions())
        {
            showCompletions(line);
            _context.compositor.drawScreen(DrawOptions { .lockHeld = true, .skipMinibuffer = true });
        }
        else if (line.takeRollCompletions() && _completionView)
        {
            _completionView->roll();
            _completionBuffer->markDirty();
            _context.compositor.drawScreen(DrawOptions { .lockHeld = true, .skipMinibuffer = true });
        }
        paintPrompt(line);
    }

    auto answer = line.value();
    if (answer)
        line.addHistory(*answer);
    line.deactivate();
    killCompletions();
    _context.minibuffer.setPromptActive(false);
    _active = false;

    {
        auto const lock = _context.compositor.lock();
        _context.stack.markDirty();
        _context.compositor.drawScreen(DrawOptions { .lockHeld = true });
        _context.surface.setCursorVisible(false);
        _context.surface.refresh();
    }

    log::debug("Prompt [{}] {}", domain, answer ? "answered" : "cancelled");
    return answer;
}

auto PromptSession::askForFilenames(std::string_view domain, std::string_view question, std::string_view defaultValue)
    -> Result<std::vector<std::string>>
{
    auto answer = ask(domain, question, defaultValue, makeFilenameCompleter(_fileSystem, _accounts));
    if (!answer)
        return std::unexpected(answer.error());
    if (!*answer)
        return std::vector<std::string> {};

    auto const& path = **answer;
    if (path.empty() || _fileSystem.isDirectory(path))
    {
        return runModal<std::vector<std::string>>(
            _context, "file browser", std::make_unique<FileBrowserView>(_fileSystem, path));
    }

    return std::vector { path };
}

auto PromptSession::askGetch(std::string_view question, std::string_view accept)
    -> Result<std::optional<tui::KeyEvent>>
{
    if (_active)
        return rejectNested("askGetch");

    auto decoder = tui::KeyDecoder {};
    auto const accepted = decoder.feed(accept);

    _context.minibuffer.flash(std::string(question));
    _context.compositor.drawScreen(DrawOptions { .refresh = true });
    {
        auto const lock = _context.compositor.lock();
        _context.surface.setCursorVisible(true);
        // The flash is the topmost minibuffer line.
        auto const row = _context.surface.rows() - _context.minibuffer.lineCount();
        _context.surface.moveCursor(row, tui::displayWidth(question));
        _context.surface.refresh();
    }

    // Nothing else may paint while the cursor sits behind the question.
    _active = true;
    _context.compositor.setSuspended(true);

    auto result = std::optional<tui::KeyEvent> {};
    while (true)
    {
        auto const event = _context.surface.poll(_context.config.pollTimeoutMs);
        if (!event || !std::holds_alternative<tui::KeyEvent>(*event))
            continue;

        auto const& key = std::get<tui::KeyEvent>(*event);
        if (key == _context.config.cancelKey)
            break;

        auto const matches = accepted.empty()
                             || std::ranges::any_of(accepted, [&](auto const& a) { return tui::isChar(key, a.codepoint); });
        if (matches)
        {
            result = key;
            break;
        }
    }

    _context.compositor.setSuspended(false);
    _active = false;

    {
        auto const lock = _context.compositor.lock();
        _context.surface.setCursorVisible(false);
        _context.minibuffer.eraseFlash();
        _context.stack.markDirty();
        _context.compositor.drawScreen(DrawOptions { .lockHeld = true, .refresh = true });
    }
    return result;
}

auto PromptSession::askYesOrNo(std::string_view question) -> Result<std::optional<bool>>
{
    auto const key = askGetch(question, "ynYN");
    if (!key)
        return std::unexpected(key.error());
    if (!*key)
        return std::nullopt;
    return tui::isChar(**key, 'y') || tui::isChar(**key, 'Y');
}

auto PromptSession::inputLine(std::string_view domain) const -> tui::InputLine const*
{
    auto const it = _inputLines.find(domain);
    return it != _inputLines.end() ? &it->second : nullptr;
}

auto PromptSession::inputLineFor(std::string_view domain) -> tui::InputLine&
{
    auto it = _inputLines.find(domain);
    if (it == _inputLines.end())
    {
        it = _inputLines.emplace(std::string(domain), tui::InputLine {}).first;
        it->second.setCancelKey(_context.config.cancelKey);
        it->second.setMaxHistory(_context.config.historySize);
    }
    return it->second;
}

auto PromptSession::rejectNested(std::string_view what) const -> std::unexpected<Error>
{
    log::error("{}: another prompt is already active", what);
    return makeError(ErrorCode::PromptActive, std::format("{}: another prompt is already active", what));
}

void PromptSession::paintPrompt(tui::InputLine& line)
{
    auto const row = _context.surface.rows() - 1;
    line.paint(_context.surface, row, _theme.style("none"));
    line.positionCursor(_context.surface, row);
    _context.surface.refresh();
}

void PromptSession::showCompletions(tui::InputLine& line)
{
    killCompletions();
    if (line.completions().empty())
        return;

    auto labels = std::vector<std::string> {};
    auto labelCandidates = std::vector<tui::Completion> {};
    for (auto const& completion: line.completions())
    {
        labels.push_back(completion.label);
        labelCandidates.push_back(tui::Completion { .value = completion.label });
    }
    auto const prefixLen = static_cast<std::size_t>(tui::displayWidth(tui::commonPrefix(labelCandidates)));

    auto view = std::make_unique<CompletionView>(
        std::move(labels), std::format("Possible completions for \"{}\": ", line.text()), prefixLen);
    auto* rawView = view.get();

    auto spawned = _context.stack.spawn(
        CompletionsTitle, std::move(view), SpawnOptions { .height = _context.config.completionRows });
    if (!spawned)
    {
        log::error("Cannot show completions: {}", spawned.error());
        return;
    }
    _completionBuffer = *spawned;
    _completionView = rawView;
}

void PromptSession::killCompletions()
{
    if (!_completionBuffer)
        return;

    if (auto killed = _context.stack.killBuffer(*_completionBuffer); !killed)
        log::error("Cannot remove completion list: {}", killed.error());
    _completionBuffer = nullptr;
    _completionView = nullptr;
}

} // namespace bufstack
