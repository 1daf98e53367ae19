// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace bufstack::tui
{

/// @brief Key codes for keyboard events.
///
/// Printable characters use their Unicode codepoint directly (cast to KeyCode).
/// Non-printable keys use values in the 0x10000+ range to avoid collision.
enum class KeyCode : std::uint32_t
{
    Enter = 0x10000,
    Tab,
    Backspace,
    Delete,
    Escape,
    Up,
    Down,
    Left,
    Right,
    Home,
    End,
    PageUp,
    PageDown,
    Insert,
    F1,
    F2,
    F3,
    F4,
    F5,
    F6,
    F7,
    F8,
    F9,
    F10,
    F11,
    F12,
};

/// @brief Bitmask enumeration for keyboard modifier keys.
enum class Modifier : std::uint8_t
{
    None = 0,
    Shift = 1 << 0,
    Alt = 1 << 1,
    Ctrl = 1 << 2,
};

[[nodiscard]] constexpr auto operator|(Modifier lhs, Modifier rhs) noexcept -> Modifier
{
    return static_cast<Modifier>(static_cast<std::uint8_t>(lhs) | static_cast<std::uint8_t>(rhs));
}

[[nodiscard]] constexpr auto operator&(Modifier lhs, Modifier rhs) noexcept -> Modifier
{
    return static_cast<Modifier>(static_cast<std::uint8_t>(lhs) & static_cast<std::uint8_t>(rhs));
}

constexpr auto operator|=(Modifier& lhs, Modifier rhs) noexcept -> Modifier&
{
    lhs = lhs | rhs;
    return lhs;
}

/// @brief Tests whether a modifier flag is set.
[[nodiscard]] constexpr auto hasModifier(Modifier mods, Modifier flag) noexcept -> bool
{
    return (mods & flag) != Modifier::None;
}

/// @brief A single keystroke.
///
/// Ctrl+letter is reported as the lowercase letter with Modifier::Ctrl, Alt+key
/// (ESC prefix) as the key with Modifier::Alt.
struct KeyEvent
{
    KeyCode key {};                      ///< Key code (printable uses codepoint, special keys use enum).
    Modifier modifiers = Modifier::None; ///< Active modifier keys.
    char32_t codepoint = 0;              ///< Original Unicode codepoint (0 for non-printable keys).

    auto operator==(KeyEvent const&) const -> bool = default;
};

/// @brief Checks whether a key code represents a printable Unicode character.
[[nodiscard]] constexpr auto isPrintable(KeyCode key) noexcept -> bool
{
    return static_cast<std::uint32_t>(key) < 0x10000 && static_cast<std::uint32_t>(key) >= 32;
}

/// @brief Converts a Unicode codepoint to a KeyCode.
[[nodiscard]] constexpr auto keyCodeFromCodepoint(char32_t codepoint) noexcept -> KeyCode
{
    return static_cast<KeyCode>(codepoint);
}

/// @brief Builds the event of an unmodified character key.
[[nodiscard]] constexpr auto charKey(char32_t codepoint) noexcept -> KeyEvent
{
    return KeyEvent { .key = keyCodeFromCodepoint(codepoint), .codepoint = codepoint };
}

/// @brief Builds the event of Ctrl+letter.
[[nodiscard]] constexpr auto ctrlKey(char letter) noexcept -> KeyEvent
{
    auto const cp = static_cast<char32_t>(letter);
    return KeyEvent { .key = keyCodeFromCodepoint(cp), .modifiers = Modifier::Ctrl, .codepoint = cp };
}

/// @brief Builds the event of Alt+letter.
[[nodiscard]] constexpr auto altKey(char letter) noexcept -> KeyEvent
{
    auto const cp = static_cast<char32_t>(letter);
    return KeyEvent { .key = keyCodeFromCodepoint(cp), .modifiers = Modifier::Alt, .codepoint = cp };
}

/// @brief Builds the event of a special (non-printable) key.
[[nodiscard]] constexpr auto specialKey(KeyCode key, Modifier mods = Modifier::None) noexcept -> KeyEvent
{
    return KeyEvent { .key = key, .modifiers = mods };
}

/// @brief Returns true if the event is the given character without Ctrl or Alt.
[[nodiscard]] constexpr auto isChar(KeyEvent const& event, char32_t codepoint) noexcept -> bool
{
    return event.codepoint == codepoint && !hasModifier(event.modifiers, Modifier::Ctrl)
           && !hasModifier(event.modifiers, Modifier::Alt);
}

/// @brief Parses a key description such as "C-g", "M-f", "Tab", "PageDown" or "q".
///
/// Emacs notation is used for modifiers: "C-" for Ctrl, "M-" for Alt, "S-" for Shift.
/// @return The key, or std::nullopt if the description is not understood.
[[nodiscard]] auto parseKey(std::string_view text) -> std::optional<KeyEvent>;

/// @brief Renders a key in the notation accepted by parseKey().
[[nodiscard]] auto describeKey(KeyEvent const& event) -> std::string;

/// @brief Encodes a Unicode codepoint as UTF-8.
[[nodiscard]] auto encodeUtf8(char32_t cp) -> std::string;

} // namespace bufstack::tui
