// SPDX-License-Identifier: Apache-2.0
#include <algorithm>
#include <string>
#include <utility>

#include <libunicode/utf8_grapheme_segmenter.h>
#include <tui/InputLine.hpp>
#include <tui/Surface.hpp>
#include <tui/Text.hpp>

namespace bufstack::tui
{

namespace
{
    /// @brief Advances past one UTF-8 codepoint.
    auto nextUtf8(std::string_view s, std::size_t pos) -> std::size_t
    {
        if (pos >= s.size())
            return pos;
        ++pos;
        while (pos < s.size() && (static_cast<unsigned char>(s[pos]) & 0xC0) == 0x80)
            ++pos;
        return pos;
    }

    /// @brief Moves back one UTF-8 codepoint.
    auto prevUtf8(std::string_view s, std::size_t pos) -> std::size_t
    {
        if (pos == 0)
            return 0;
        --pos;
        while (pos > 0 && (static_cast<unsigned char>(s[pos]) & 0xC0) == 0x80)
            --pos;
        return pos;
    }
} // namespace

void InputLine::activate(std::string question, std::string_view defaultValue, CompletionProvider provider)
{
    _question = std::move(question);
    _buffer = std::string(defaultValue);
    _cursor = _buffer.size();
    _provider = std::move(provider);
    _completions.clear();
    _completionsShown = false;
    _newCompletions = false;
    _rollCompletions = false;
    _lastWasComplete = false;
    _lastWasKill = false;
    _historyIndex = _history.size();
    _scrollOffset = 0;
    _cancelled = false;
    _active = true;
}

void InputLine::deactivate()
{
    _active = false;
    _provider = {};
    _completions.clear();
    _completionsShown = false;
    _newCompletions = false;
    _rollCompletions = false;
}

auto InputLine::active() const noexcept -> bool
{
    return _active;
}

auto InputLine::processKey(KeyEvent const& key) -> InputLineAction
{
    if (key == _cancelKey)
    {
        _cancelled = true;
        return InputLineAction::Cancel;
    }

    if (key.key == KeyCode::Enter)
        return InputLineAction::Accept;

    if (key.key == KeyCode::Tab && key.modifiers == Modifier::None)
    {
        if (_lastWasComplete && _completionsShown)
            _rollCompletions = true;
        else
            complete();
        _lastWasComplete = true;
        _lastWasKill = false;
        return InputLineAction::Complete;
    }
    _lastWasComplete = false;

    auto const before = _buffer;
    auto const action = handleEdit(key);
    if (action == InputLineAction::Changed && _completionsShown && _buffer != before)
        refreshCompletions();
    return action;
}

auto InputLine::value() const -> std::optional<std::string>
{
    if (_cancelled)
        return std::nullopt;
    return _buffer;
}

auto InputLine::text() const noexcept -> std::string_view
{
    return _buffer;
}

auto InputLine::cursor() const noexcept -> std::size_t
{
    return _cursor;
}

auto InputLine::question() const noexcept -> std::string_view
{
    return _question;
}

void InputLine::setText(std::string_view text)
{
    _buffer = std::string(text);
    _cursor = _buffer.size();
}

auto InputLine::completions() const noexcept -> std::vector<Completion> const&
{
    return _completions;
}

auto InputLine::takeNewCompletions() -> bool
{
    return std::exchange(_newCompletions, false);
}

auto InputLine::takeRollCompletions() -> bool
{
    return std::exchange(_rollCompletions, false);
}

void InputLine::setCancelKey(KeyEvent key)
{
    _cancelKey = key;
}

void InputLine::addHistory(std::string entry)
{
    if (entry.empty())
        return;
    if (!_history.empty() && _history.back() == entry)
        return;
    _history.push_back(std::move(entry));
    if (_history.size() > _maxHistory)
        _history.erase(_history.begin());
    _historyIndex = _history.size();
}

void InputLine::setMaxHistory(std::size_t n)
{
    _maxHistory = n;
    while (_history.size() > _maxHistory)
        _history.erase(_history.begin());
    _historyIndex = _history.size();
}

auto InputLine::history() const noexcept -> std::vector<std::string> const&
{
    return _history;
}

void InputLine::paint(Surface& surface, int row, Style const& style)
{
    auto const width = surface.columns();
    auto const questionCols = displayWidth(_question);
    auto const available = width - questionCols;

    surface.put(row, 0, std::string(static_cast<std::size_t>(std::max(width, 0)), ' '), style);
    surface.put(row, 0, _question, style);
    if (available <= 0)
        return;

    auto const cursorCol = countColumns(0, _cursor);
    if (cursorCol < _scrollOffset)
        _scrollOffset = cursorCol;
    else if (cursorCol - _scrollOffset >= available)
        _scrollOffset = cursorCol - available + 1;

    auto const start = byteOffsetOfColumn(_scrollOffset);
    surface.put(row, questionCols, std::string_view(_buffer).substr(start), style);
}

void InputLine::positionCursor(Surface& surface, int row) const
{
    auto const col = displayWidth(_question) + countColumns(0, _cursor) - _scrollOffset;
    surface.moveCursor(row, col);
}

auto InputLine::handleEdit(KeyEvent const& key) -> InputLineAction
{
    auto const ctrl = hasModifier(key.modifiers, Modifier::Ctrl);
    auto const alt = hasModifier(key.modifiers, Modifier::Alt);

    switch (key.key)
    {
        case KeyCode::Backspace:
            if (ctrl || alt)
            {
                killWordBackward();
                return InputLineAction::Changed;
            }
            deleteCharBackward();
            _lastWasKill = false;
            return InputLineAction::Changed;
        case KeyCode::Delete:
            deleteChar();
            _lastWasKill = false;
            return InputLineAction::Changed;
        case KeyCode::Up:
            historyPrev();
            _lastWasKill = false;
            return InputLineAction::Changed;
        case KeyCode::Down:
            historyNext();
            _lastWasKill = false;
            return InputLineAction::Changed;
        case KeyCode::Left:
            ctrl ? moveBackwardWord() : moveBackwardChar();
            _lastWasKill = false;
            return InputLineAction::Changed;
        case KeyCode::Right:
            ctrl ? moveForwardWord() : moveForwardChar();
            _lastWasKill = false;
            return InputLineAction::Changed;
        case KeyCode::Home:
            _cursor = 0;
            _lastWasKill = false;
            return InputLineAction::Changed;
        case KeyCode::End:
            _cursor = _buffer.size();
            _lastWasKill = false;
            return InputLineAction::Changed;
        default: break;
    }

    if (ctrl && key.codepoint != 0)
    {
        switch (key.codepoint)
        {
            case 'a': _cursor = 0; break;
            case 'e': _cursor = _buffer.size(); break;
            case 'f': moveForwardChar(); break;
            case 'b': moveBackwardChar(); break;
            case 'p': historyPrev(); break;
            case 'n': historyNext(); break;
            case 'k': killToEnd(); return InputLineAction::Changed;
            case 'u': killToStart(); return InputLineAction::Changed;
            case 'w': killWordBackward(); return InputLineAction::Changed;
            case 'y': yank(); break;
            case 't': transpose(); break;
            case 'd': deleteChar(); break;
            default: return InputLineAction::None;
        }
        _lastWasKill = false;
        return InputLineAction::Changed;
    }

    if (alt && key.codepoint != 0)
    {
        switch (key.codepoint)
        {
            case 'f': moveForwardWord(); break;
            case 'b': moveBackwardWord(); break;
            case 'd': killWord(); return InputLineAction::Changed;
            case 'y': yankPop(); break;
            default: return InputLineAction::None;
        }
        _lastWasKill = false;
        return InputLineAction::Changed;
    }

    if (key.codepoint != 0 && isPrintable(key.key))
    {
        insertText(encodeUtf8(key.codepoint));
        _lastWasKill = false;
        return InputLineAction::Changed;
    }

    return InputLineAction::None;
}

void InputLine::complete()
{
    if (!_provider)
        return;

    auto candidates = _provider(_buffer);
    if (candidates.empty())
    {
        if (_completionsShown)
            _newCompletions = true;
        _completions.clear();
        _completionsShown = false;
        return;
    }

    if (candidates.size() == 1)
    {
        setText(candidates.front().value);
        if (_completionsShown)
            _newCompletions = true;
        _completions.clear();
        _completionsShown = false;
        return;
    }

    auto const prefix = commonPrefix(candidates);
    if (prefix.size() > _buffer.size() && prefix.starts_with(_buffer))
        setText(prefix);

    _completions = std::move(candidates);
    _completionsShown = true;
    _newCompletions = true;
}

void InputLine::refreshCompletions()
{
    auto candidates = _provider ? _provider(_buffer) : std::vector<Completion> {};
    if (candidates == _completions)
        return;

    _completions = std::move(candidates);
    _completionsShown = !_completions.empty();
    _newCompletions = true;
}

void InputLine::killToEnd()
{
    if (_cursor < _buffer.size())
    {
        auto killed = _buffer.substr(_cursor);
        _buffer.erase(_cursor);
        pushKillRing(std::move(killed));
    }
    _lastWasKill = true;
}

void InputLine::killToStart()
{
    if (_cursor > 0)
    {
        auto killed = _buffer.substr(0, _cursor);
        _buffer.erase(0, _cursor);
        _cursor = 0;
        pushKillRing(std::move(killed));
    }
    _lastWasKill = true;
}

void InputLine::killWord()
{
    auto const start = _cursor;
    moveForwardWord();
    if (_cursor > start)
    {
        auto killed = _buffer.substr(start, _cursor - start);
        _buffer.erase(start, _cursor - start);
        _cursor = start;
        pushKillRing(std::move(killed));
    }
    _lastWasKill = true;
}

void InputLine::killWordBackward()
{
    auto const end = _cursor;
    moveBackwardWord();
    if (_cursor < end)
    {
        auto killed = _buffer.substr(_cursor, end - _cursor);
        _buffer.erase(_cursor, end - _cursor);
        pushKillRing(std::move(killed));
    }
    _lastWasKill = true;
}

void InputLine::yank()
{
    if (_killRing.empty())
        return;
    _killRingIndex = _killRing.size() - 1;
    insertText(_killRing[_killRingIndex]);
}

void InputLine::yankPop()
{
    if (_killRing.empty() || _killRingIndex >= _killRing.size())
        return;

    // Replace the previously yanked text with the next older entry
    auto const& prev = _killRing[_killRingIndex];
    if (_cursor >= prev.size())
    {
        _buffer.erase(_cursor - prev.size(), prev.size());
        _cursor -= prev.size();
    }
    _killRingIndex = (_killRingIndex == 0) ? _killRing.size() - 1 : _killRingIndex - 1;
    insertText(_killRing[_killRingIndex]);
}

void InputLine::deleteChar()
{
    if (_cursor >= _buffer.size())
        return;
    auto const next = nextGraphemeCluster(_cursor);
    _buffer.erase(_cursor, next - _cursor);
}

void InputLine::deleteCharBackward()
{
    if (_cursor == 0)
        return;
    auto const prev = prevGraphemeCluster(_cursor);
    _buffer.erase(prev, _cursor - prev);
    _cursor = prev;
}

void InputLine::moveForwardChar()
{
    _cursor = nextGraphemeCluster(_cursor);
}

void InputLine::moveBackwardChar()
{
    _cursor = prevGraphemeCluster(_cursor);
}

void InputLine::moveForwardWord()
{
    auto const size = _buffer.size();
    while (_cursor < size && !isWordCharAt(_buffer[_cursor]))
        _cursor = nextUtf8(_buffer, _cursor);
    while (_cursor < size && isWordCharAt(_buffer[_cursor]))
        _cursor = nextUtf8(_buffer, _cursor);
}

void InputLine::moveBackwardWord()
{
    while (_cursor > 0 && !isWordCharAt(_buffer[prevUtf8(_buffer, _cursor)]))
        _cursor = prevUtf8(_buffer, _cursor);
    while (_cursor > 0 && isWordCharAt(_buffer[prevUtf8(_buffer, _cursor)]))
        _cursor = prevUtf8(_buffer, _cursor);
}

void InputLine::historyPrev()
{
    if (_history.empty())
        return;
    if (_historyIndex == _history.size())
        _savedLine = _buffer;
    if (_historyIndex > 0)
    {
        --_historyIndex;
        setText(_history[_historyIndex]);
    }
}

void InputLine::historyNext()
{
    if (_historyIndex >= _history.size())
        return;
    ++_historyIndex;
    if (_historyIndex == _history.size())
    {
        setText(_savedLine);
        _savedLine.clear();
    }
    else
    {
        setText(_history[_historyIndex]);
    }
}

void InputLine::transpose()
{
    if (_cursor == 0 || _buffer.size() < 2)
        return;
    auto pos = _cursor;
    if (pos == _buffer.size())
        pos = prevGraphemeCluster(pos);
    auto const prevPos = prevGraphemeCluster(pos);
    auto const nextPos = nextGraphemeCluster(pos);

    auto first = _buffer.substr(prevPos, pos - prevPos);
    auto second = _buffer.substr(pos, nextPos - pos);

    _buffer.replace(prevPos, nextPos - prevPos, second + first);
    _cursor = nextPos;
}

void InputLine::pushKillRing(std::string text)
{
    if (text.empty())
        return;
    if (_lastWasKill && !_killRing.empty())
    {
        _killRing.back() += text;
    }
    else
    {
        _killRing.push_back(std::move(text));
        if (_killRing.size() > MaxKillRing)
            _killRing.erase(_killRing.begin());
    }
}

void InputLine::insertText(std::string_view text)
{
    _buffer.insert(_cursor, text);
    _cursor += text.size();
}

auto InputLine::countColumns(std::size_t start, std::size_t end) const -> int
{
    return displayWidth(std::string_view(_buffer).substr(start, end - start));
}

auto InputLine::byteOffsetOfColumn(int column) const -> std::size_t
{
    auto pos = std::size_t { 0 };
    for (auto i = 0; i < column && pos < _buffer.size(); ++i)
        pos = nextUtf8(_buffer, pos);
    return pos;
}

auto InputLine::nextGraphemeCluster(std::size_t pos) const -> std::size_t
{
    if (pos >= _buffer.size())
        return pos;

    // The segmenter iterator's _clusterStart points into the segmented string_view.
    auto const sv = std::string_view(_buffer).substr(pos);
    auto segmenter = unicode::utf8_grapheme_segmenter(sv);
    auto it = segmenter.begin();
    if (it == segmenter.end())
        return nextUtf8(_buffer, pos);

    ++it;
    if (it != segmenter.end())
        return pos + static_cast<std::size_t>(it._clusterStart - sv.data());

    return _buffer.size();
}

auto InputLine::prevGraphemeCluster(std::size_t pos) const -> std::size_t
{
    if (pos == 0)
        return 0;

    auto const sv = std::string_view(_buffer).substr(0, pos);
    auto segmenter = unicode::utf8_grapheme_segmenter(sv);

    auto lastBoundaryOffset = std::size_t { 0 };
    for (auto it = segmenter.begin(); it != segmenter.end(); ++it)
        lastBoundaryOffset = static_cast<std::size_t>(it._clusterStart - sv.data());

    return lastBoundaryOffset;
}

auto InputLine::isWordCharAt(char c) -> bool
{
    // '/' separates words so that C-w removes one path component at a time
    return c != ' ' && c != '\t' && c != '/';
}

auto commonPrefix(std::vector<Completion> const& candidates) -> std::string
{
    if (candidates.empty())
        return {};

    auto prefix = std::string_view(candidates.front().value);
    for (auto const& candidate: candidates)
    {
        auto const mismatch = std::ranges::mismatch(prefix, candidate.value);
        prefix = prefix.substr(0, static_cast<std::size_t>(mismatch.in1 - prefix.begin()));
    }

    // Never cut a UTF-8 sequence in half
    while (!prefix.empty() && (static_cast<unsigned char>(prefix.back()) & 0x80) != 0)
    {
        auto const lead = prevUtf8(prefix, prefix.size());
        auto const length = nextUtf8(prefix, lead) - lead;
        auto const leadByte = static_cast<unsigned char>(prefix[lead]);
        auto const expected = (leadByte & 0xE0) == 0xC0 ? 2u : (leadByte & 0xF0) == 0xE0 ? 3u : 4u;
        if (length == expected)
            break;
        prefix = prefix.substr(0, lead);
    }
    return std::string(prefix);
}

} // namespace bufstack::tui
