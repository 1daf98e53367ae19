// SPDX-License-Identifier: Apache-2.0
#include <array>
#include <utility>

#include <tui/Key.hpp>

namespace bufstack::tui
{

namespace
{
    constexpr auto NamedKeys = std::array<std::pair<std::string_view, KeyCode>, 26> { {
        { "Enter", KeyCode::Enter },
        { "Tab", KeyCode::Tab },
        { "Backspace", KeyCode::Backspace },
        { "Delete", KeyCode::Delete },
        { "Esc", KeyCode::Escape },
        { "Up", KeyCode::Up },
        { "Down", KeyCode::Down },
        { "Left", KeyCode::Left },
        { "Right", KeyCode::Right },
        { "Home", KeyCode::Home },
        { "End", KeyCode::End },
        { "PageUp", KeyCode::PageUp },
        { "PageDown", KeyCode::PageDown },
        { "Insert", KeyCode::Insert },
        { "F1", KeyCode::F1 },
        { "F2", KeyCode::F2 },
        { "F3", KeyCode::F3 },
        { "F4", KeyCode::F4 },
        { "F5", KeyCode::F5 },
        { "F6", KeyCode::F6 },
        { "F7", KeyCode::F7 },
        { "F8", KeyCode::F8 },
        { "F9", KeyCode::F9 },
        { "F10", KeyCode::F10 },
        { "F11", KeyCode::F11 },
        { "F12", KeyCode::F12 },
    } };

    /// @brief Decodes a string holding exactly one UTF-8 codepoint.
    auto singleCodepoint(std::string_view s) -> std::optional<char32_t>
    {
        if (s.empty())
            return std::nullopt;

        auto const lead = static_cast<unsigned char>(s[0]);
        auto length = std::size_t { 1 };
        auto cp = char32_t { lead };
        if ((lead & 0xE0) == 0xC0)
        {
            length = 2;
            cp = lead & 0x1F;
        }
        else if ((lead & 0xF0) == 0xE0)
        {
            length = 3;
            cp = lead & 0x0F;
        }
        else if ((lead & 0xF8) == 0xF0)
        {
            length = 4;
            cp = lead & 0x07;
        }
        else if ((lead & 0x80) != 0)
            return std::nullopt;

        if (s.size() != length)
            return std::nullopt;

        for (auto i = std::size_t { 1 }; i < length; ++i)
            cp = (cp << 6) | (static_cast<unsigned char>(s[i]) & 0x3F);
        return cp;
    }
} // namespace

auto parseKey(std::string_view text) -> std::optional<KeyEvent>
{
    auto mods = Modifier::None;
    while (text.size() > 2 && text[1] == '-')
    {
        switch (text[0])
        {
            case 'C': mods |= Modifier::Ctrl; break;
            case 'M': mods |= Modifier::Alt; break;
            case 'S': mods |= Modifier::Shift; break;
            default: return std::nullopt;
        }
        text.remove_prefix(2);
    }

    for (auto const& [name, code]: NamedKeys)
    {
        if (text == name)
            return specialKey(code, mods);
    }

    auto const cp = singleCodepoint(text);
    if (!cp || *cp < 32)
        return std::nullopt;

    auto event = charKey(*cp);
    event.modifiers = mods;
    return event;
}

auto describeKey(KeyEvent const& event) -> std::string
{
    auto result = std::string {};
    if (hasModifier(event.modifiers, Modifier::Ctrl))
        result += "C-";
    if (hasModifier(event.modifiers, Modifier::Alt))
        result += "M-";
    if (hasModifier(event.modifiers, Modifier::Shift))
        result += "S-";

    if (event.codepoint != 0)
        return result + encodeUtf8(event.codepoint);

    for (auto const& [name, code]: NamedKeys)
    {
        if (event.key == code)
            return result + std::string(name);
    }
    return result + "?";
}

auto encodeUtf8(char32_t cp) -> std::string
{
    auto result = std::string {};
    if (cp < 0x80)
    {
        result += static_cast<char>(cp);
    }
    else if (cp < 0x800)
    {
        result += static_cast<char>(0xC0 | (cp >> 6));
        result += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x10000)
    {
        result += static_cast<char>(0xE0 | (cp >> 12));
        result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        result += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x110000)
    {
        result += static_cast<char>(0xF0 | (cp >> 18));
        result += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        result += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return result;
}

} // namespace bufstack::tui
