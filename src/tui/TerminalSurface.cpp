// SPDX-License-Identifier: Apache-2.0
#include <sys/ioctl.h>

#include <algorithm>
#include <array>
#include <csignal>
#include <format>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <tui/TerminalSurface.hpp>

namespace bufstack::tui
{

namespace
{
    constexpr auto EnterAltScreen = std::string_view { "\033[?1049h" };
    constexpr auto LeaveAltScreen = std::string_view { "\033[?1049l" };
    constexpr auto BeginSync = std::string_view { "\033[?2026h" };
    constexpr auto EndSync = std::string_view { "\033[?2026l" };
    constexpr auto HideCursor = std::string_view { "\033[?25l" };
    constexpr auto ShowCursor = std::string_view { "\033[?25h" };
    constexpr auto ClearAll = std::string_view { "\033[m\033[2J\033[H" };

    // Written from the SIGWINCH handler. Only one surface is active at a time.
    int gResizeWriteFd = -1;            // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
    struct sigaction gPrevSigwinch {}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

    void sigwinchHandler(int /*sig*/)
    {
        if (gResizeWriteFd != -1)
        {
            auto const byte = char { 1 };
            static_cast<void>(::write(gResizeWriteFd, &byte, 1));
        }
    }

    /// @brief Splits UTF-8 text into one string per codepoint.
    auto splitCodepoints(std::string_view text) -> std::vector<std::string_view>
    {
        auto result = std::vector<std::string_view> {};
        auto pos = std::size_t { 0 };
        while (pos < text.size())
        {
            auto end = pos + 1;
            while (end < text.size() && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80)
                ++end;
            result.push_back(text.substr(pos, end - pos));
            pos = end;
        }
        return result;
    }
} // namespace

TerminalSurface::TerminalSurface()
{
    resizeGrids();
}

TerminalSurface::~TerminalSurface()
{
    shutdown();
}

auto TerminalSurface::initialize() -> VoidResult
{
    if (_initialized)
        return {};

    _fd = STDIN_FILENO;
    if (isatty(_fd) == 0)
        return makeError(ErrorCode::IoError, "Standard input is not a terminal");

    if (pipe(_resizePipe) == -1)
        return makeError(ErrorCode::IoError, "Failed to create resize notification pipe");

    for (auto const fd: _resizePipe)
    {
        auto const flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }

    updateDimensions();
    resizeGrids();
    enableRawMode();
    writeOut(EnterAltScreen);
    writeOut(HideCursor);

    gResizeWriteFd = _resizePipe[1];
    struct sigaction sa {};
    sa.sa_handler = sigwinchHandler;
    sa.sa_flags = SA_RESTART;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGWINCH, &sa, &gPrevSigwinch);

    _repaintAll = true;
    _initialized = true;
    return {};
}

void TerminalSurface::shutdown()
{
    if (!_initialized)
        return;

    sigaction(SIGWINCH, &gPrevSigwinch, nullptr);
    gResizeWriteFd = -1;

    writeOut("\033[m");
    writeOut(ShowCursor);
    writeOut(LeaveAltScreen);
    disableRawMode();

    close(_resizePipe[0]);
    close(_resizePipe[1]);
    _resizePipe[0] = -1;
    _resizePipe[1] = -1;
    _initialized = false;
}

auto TerminalSurface::rows() const noexcept -> int
{
    return _rows;
}

auto TerminalSurface::columns() const noexcept -> int
{
    return _cols;
}

void TerminalSurface::put(int row, int col, std::string_view text, Style const& style)
{
    if (row < 0 || row >= _rows || col < 0 || col >= _cols)
        return;

    auto const base = static_cast<std::size_t>(row) * static_cast<std::size_t>(_cols);
    for (auto const glyph: splitCodepoints(text))
    {
        if (col >= _cols)
            break;
        auto& cell = _back[base + static_cast<std::size_t>(col)];
        // Control characters would move the real cursor; show them as '?'
        cell.glyph = (glyph.size() == 1 && static_cast<unsigned char>(glyph[0]) < 0x20) ? "?" : std::string(glyph);
        cell.style = style;
        ++col;
    }
}

void TerminalSurface::moveCursor(int row, int col)
{
    _cursorRow = std::clamp(row, 0, std::max(0, _rows - 1));
    _cursorCol = std::clamp(col, 0, std::max(0, _cols - 1));
}

void TerminalSurface::setCursorVisible(bool visible)
{
    _cursorVisible = visible;
}

void TerminalSurface::commit()
{
    _staged = _back;
}

void TerminalSurface::flush()
{
    if (!_initialized)
        return;

    _out.clear();
    _out += BeginSync;
    _out += HideCursor;
    if (_repaintAll)
        _out += ClearAll;

    auto current = Style {};
    _out += "\033[m";

    for (auto row = 0; row < _rows; ++row)
    {
        auto cursorAt = -1; // column the terminal cursor is known to sit at on this row
        for (auto col = 0; col < _cols; ++col)
        {
            auto const index = static_cast<std::size_t>(row) * static_cast<std::size_t>(_cols)
                               + static_cast<std::size_t>(col);
            auto const& cell = _staged[index];
            if (!_repaintAll && cell == _physical[index])
                continue;

            // The bottom-right cell would scroll the screen on some terminals
            if (row == _rows - 1 && col == _cols - 1)
                continue;

            if (cursorAt != col)
                _out += std::format("\033[{};{}H", row + 1, col + 1);
            if (cell.style != current)
            {
                _out += "\033[m";
                appendSgr(cell.style);
                current = cell.style;
            }
            _out += cell.glyph;
            cursorAt = col + 1;
        }
    }

    _out += "\033[m";
    _out += std::format("\033[{};{}H", _cursorRow + 1, _cursorCol + 1);
    if (_cursorVisible)
        _out += ShowCursor;
    _out += EndSync;

    writeOut(_out);
    _physical = _staged;
    _repaintAll = false;
}

void TerminalSurface::refresh()
{
    commit();
    flush();
}

void TerminalSurface::clear()
{
    for (auto& cell: _back)
        cell = Cell {};
    _staged = _back;
    _repaintAll = true;
}

auto TerminalSurface::poll(int timeoutMs) -> std::optional<InputEvent>
{
    if (_pending.empty())
    {
        auto fds = std::array<struct pollfd, 2> {};
        fds[0] = { .fd = _fd, .events = POLLIN, .revents = 0 };
        fds[1] = { .fd = _resizePipe[0], .events = POLLIN, .revents = 0 };

        auto const nfds = (_resizePipe[0] != -1) ? 2 : 1;
        auto const pollResult = ::poll(fds.data(), static_cast<nfds_t>(nfds), timeoutMs);

        if (pollResult == 0)
        {
            // Quiet period: a pending ESC was a bare Escape key
            for (auto const& key: _decoder.timeout())
                _pending.emplace_back(key);
        }
        else if (pollResult > 0)
        {
            readInput(nfds >= 2 && (fds[1].revents & POLLIN) != 0, (fds[0].revents & POLLIN) != 0);
        }
    }

    if (_pending.empty())
        return std::nullopt;

    auto event = std::move(_pending.front());
    _pending.pop_front();
    return event;
}

void TerminalSurface::suspend()
{
    if (!_initialized)
        return;
    writeOut("\033[m");
    writeOut(ShowCursor);
    writeOut(LeaveAltScreen);
    disableRawMode();
}

void TerminalSurface::resume()
{
    if (!_initialized)
        return;
    enableRawMode();
    writeOut(EnterAltScreen);
    writeOut(HideCursor);
    updateDimensions();
    resizeGrids();
    _cursorVisible = false;
    _repaintAll = true;
}

void TerminalSurface::enableRawMode()
{
    tcgetattr(_fd, &_origTermios);
    auto raw = _origTermios;
    raw.c_iflag &= ~static_cast<tcflag_t>(IXON | ICRNL);
    raw.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO | ISIG | IEXTEN);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    tcsetattr(_fd, TCSAFLUSH, &raw);
    _rawMode = true;
}

void TerminalSurface::disableRawMode()
{
    if (_rawMode)
    {
        tcsetattr(_fd, TCSAFLUSH, &_origTermios);
        _rawMode = false;
    }
}

void TerminalSurface::updateDimensions()
{
    auto ws = winsize {};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0 && ws.ws_col > 0)
    {
        _cols = ws.ws_col;
        _rows = ws.ws_row;
    }
}

void TerminalSurface::resizeGrids()
{
    auto const cells = static_cast<std::size_t>(_rows) * static_cast<std::size_t>(_cols);
    _back.assign(cells, Cell {});
    _staged.assign(cells, Cell {});
    _physical.assign(cells, Cell {});
    _repaintAll = true;
}

void TerminalSurface::readInput(bool resized, bool readable)
{
    if (resized)
    {
        auto buf = char {};
        while (read(_resizePipe[0], &buf, 1) > 0)
            ;

        updateDimensions();
        resizeGrids();
        _pending.emplace_back(ResizeEvent { .columns = _cols, .rows = _rows });
    }

    if (readable)
    {
        auto buf = std::array<char, 512> {};
        auto const n = read(_fd, buf.data(), buf.size());
        if (n > 0)
        {
            for (auto const& key: _decoder.feed(std::string_view(buf.data(), static_cast<std::size_t>(n))))
                _pending.emplace_back(key);
        }
    }
}

void TerminalSurface::appendSgr(Style const& style)
{
    if (style == Style {})
        return;

    _out += "\033[";
    auto needSemicolon = false;
    auto const appendSep = [&]() {
        if (needSemicolon)
            _out += ';';
        needSemicolon = true;
    };

    if (style.bold)
    {
        appendSep();
        _out += '1';
    }
    if (style.dim)
    {
        appendSep();
        _out += '2';
    }
    if (style.underline)
    {
        appendSep();
        _out += '4';
    }
    if (style.inverse)
    {
        appendSep();
        _out += '7';
    }

    if (auto const* idx = std::get_if<std::uint8_t>(&style.fg))
    {
        appendSep();
        _out += std::format("38;5;{}", *idx);
    }
    else if (auto const* rgb = std::get_if<RgbColor>(&style.fg))
    {
        appendSep();
        _out += std::format("38;2;{};{};{}", rgb->r, rgb->g, rgb->b);
    }

    if (auto const* idx = std::get_if<std::uint8_t>(&style.bg))
    {
        appendSep();
        _out += std::format("48;5;{}", *idx);
    }
    else if (auto const* rgb = std::get_if<RgbColor>(&style.bg))
    {
        appendSep();
        _out += std::format("48;2;{};{};{}", rgb->r, rgb->g, rgb->b);
    }

    _out += 'm';
}

void TerminalSurface::writeOut(std::string_view bytes) const
{
    auto remaining = bytes;
    while (!remaining.empty())
    {
        auto const n = ::write(STDOUT_FILENO, remaining.data(), remaining.size());
        if (n <= 0)
            return;
        remaining.remove_prefix(static_cast<std::size_t>(n));
    }
}

} // namespace bufstack::tui
