// SPDX-License-Identifier: Apache-2.0
#include <charconv>
#include <optional>
#include <ranges>

#include <tui/KeyDecoder.hpp>

namespace bufstack::tui
{

namespace
{
    /// @brief Splits "1;5" into integer parameters; missing values read as 0.
    auto parseParams(std::string_view buf) -> std::vector<int>
    {
        auto result = std::vector<int> {};
        for (auto const part: buf | std::views::split(';'))
        {
            auto const sv = std::string_view(part.begin(), part.end());
            auto value = 0;
            if (auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value); ec != std::errc {})
                value = 0;
            result.push_back(value);
        }
        return result;
    }

    /// @brief xterm encodes modifiers as 1 + shift + 2*alt + 4*ctrl.
    constexpr auto decodeModifiers(int param) -> Modifier
    {
        if (param <= 1)
            return Modifier::None;
        auto const bits = param - 1;
        auto mods = Modifier::None;
        if ((bits & 1) != 0)
            mods |= Modifier::Shift;
        if ((bits & 2) != 0)
            mods |= Modifier::Alt;
        if ((bits & 4) != 0)
            mods |= Modifier::Ctrl;
        return mods;
    }

    auto letterKey(char finalByte) -> std::optional<KeyCode>
    {
        switch (finalByte)
        {
            case 'A': return KeyCode::Up;
            case 'B': return KeyCode::Down;
            case 'C': return KeyCode::Right;
            case 'D': return KeyCode::Left;
            case 'H': return KeyCode::Home;
            case 'F': return KeyCode::End;
            case 'P': return KeyCode::F1;
            case 'Q': return KeyCode::F2;
            case 'R': return KeyCode::F3;
            case 'S': return KeyCode::F4;
            default: return std::nullopt;
        }
    }

    auto tildeKey(int number) -> std::optional<KeyCode>
    {
        switch (number)
        {
            case 1:
            case 7: return KeyCode::Home;
            case 2: return KeyCode::Insert;
            case 3: return KeyCode::Delete;
            case 4:
            case 8: return KeyCode::End;
            case 5: return KeyCode::PageUp;
            case 6: return KeyCode::PageDown;
            case 11: return KeyCode::F1;
            case 12: return KeyCode::F2;
            case 13: return KeyCode::F3;
            case 14: return KeyCode::F4;
            case 15: return KeyCode::F5;
            case 17: return KeyCode::F6;
            case 18: return KeyCode::F7;
            case 19: return KeyCode::F8;
            case 20: return KeyCode::F9;
            case 21: return KeyCode::F10;
            case 23: return KeyCode::F11;
            case 24: return KeyCode::F12;
            default: return std::nullopt;
        }
    }
} // namespace

auto KeyDecoder::feed(std::string_view data) -> std::vector<KeyEvent>
{
    auto out = std::vector<KeyEvent> {};
    for (auto const ch: data)
    {
        auto const byte = static_cast<std::uint8_t>(ch);
        switch (_state)
        {
            case State::Ground: ground(byte, out); break;
            case State::Escape: escape(byte, out); break;
            case State::Csi: csi(byte, out); break;
            case State::Ss3: ss3(byte, out); break;
            case State::Utf8: utf8(byte, out); break;
        }
    }
    return out;
}

auto KeyDecoder::timeout() -> std::vector<KeyEvent>
{
    auto out = std::vector<KeyEvent> {};
    if (_state == State::Escape)
        out.push_back(specialKey(KeyCode::Escape));
    _state = State::Ground;
    _altPending = false;
    return out;
}

void KeyDecoder::ground(std::uint8_t byte, std::vector<KeyEvent>& out)
{
    if (byte == 0x1B)
    {
        _state = State::Escape;
        return;
    }

    if (byte < 0x20 || byte == 0x7F)
    {
        out.push_back(controlKey(byte));
        return;
    }

    if ((byte & 0x80) != 0)
    {
        if (beginUtf8(byte))
            _state = State::Utf8;
        return;
    }

    out.push_back(charKey(byte));
}

void KeyDecoder::escape(std::uint8_t byte, std::vector<KeyEvent>& out)
{
    switch (byte)
    {
        case '[':
            _params.clear();
            _state = State::Csi;
            return;
        case 'O':
            _state = State::Ss3;
            return;
        case 0x1B:
            // ESC ESC: the first one was a bare Escape
            out.push_back(specialKey(KeyCode::Escape));
            return;
        default: break;
    }

    _state = State::Ground;

    if (byte < 0x20 || byte == 0x7F)
    {
        auto key = controlKey(byte);
        key.modifiers |= Modifier::Alt;
        out.push_back(key);
        return;
    }

    if ((byte & 0x80) != 0)
    {
        if (beginUtf8(byte))
        {
            _altPending = true;
            _state = State::Utf8;
        }
        return;
    }

    auto key = charKey(byte);
    key.modifiers = Modifier::Alt;
    out.push_back(key);
}

void KeyDecoder::csi(std::uint8_t byte, std::vector<KeyEvent>& out)
{
    // Parameter and intermediate bytes
    if (byte >= 0x20 && byte <= 0x3F)
    {
        _params += static_cast<char>(byte);
        return;
    }

    _state = State::Ground;
    auto const params = parseParams(_params);
    auto const finalByte = static_cast<char>(byte);

    if (finalByte == '~')
    {
        if (params.empty())
            return;
        auto const mods = params.size() >= 2 ? decodeModifiers(params[1]) : Modifier::None;
        if (auto const code = tildeKey(params[0]))
            out.push_back(specialKey(*code, mods));
        return;
    }

    if (finalByte == 'Z')
    {
        out.push_back(specialKey(KeyCode::Tab, Modifier::Shift));
        return;
    }

    if (auto const code = letterKey(finalByte))
    {
        auto const mods = params.size() >= 2 ? decodeModifiers(params[1]) : Modifier::None;
        out.push_back(specialKey(*code, mods));
    }
}

void KeyDecoder::ss3(std::uint8_t byte, std::vector<KeyEvent>& out)
{
    _state = State::Ground;
    if (auto const code = letterKey(static_cast<char>(byte)))
        out.push_back(specialKey(*code));
}

void KeyDecoder::utf8(std::uint8_t byte, std::vector<KeyEvent>& out)
{
    if ((byte & 0xC0) != 0x80)
    {
        // Truncated sequence; reprocess this byte from scratch
        _state = State::Ground;
        _altPending = false;
        ground(byte, out);
        return;
    }

    _utf8Value = (_utf8Value << 6) | (byte & 0x3F);
    if (--_utf8Remaining > 0)
        return;

    auto key = charKey(_utf8Value);
    if (_altPending)
        key.modifiers = Modifier::Alt;
    out.push_back(key);
    _altPending = false;
    _state = State::Ground;
}

auto KeyDecoder::beginUtf8(std::uint8_t lead) -> bool
{
    if ((lead & 0xE0) == 0xC0)
    {
        _utf8Value = lead & 0x1F;
        _utf8Remaining = 1;
    }
    else if ((lead & 0xF0) == 0xE0)
    {
        _utf8Value = lead & 0x0F;
        _utf8Remaining = 2;
    }
    else if ((lead & 0xF8) == 0xF0)
    {
        _utf8Value = lead & 0x07;
        _utf8Remaining = 3;
    }
    else
        return false;
    return true;
}

auto KeyDecoder::controlKey(std::uint8_t byte) -> KeyEvent
{
    switch (byte)
    {
        case '\r':
        case '\n': return specialKey(KeyCode::Enter);
        case '\t': return specialKey(KeyCode::Tab);
        case 0x08:
        case 0x7F: return specialKey(KeyCode::Backspace);
        case 0x00: return ctrlKey(' ');
        default: break;
    }
    // Ctrl+letter: byte = letter - 'a' + 1
    return ctrlKey(static_cast<char>(byte + 'a' - 1));
}

} // namespace bufstack::tui
