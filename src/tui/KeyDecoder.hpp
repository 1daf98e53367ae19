// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <tui/Key.hpp>

namespace bufstack::tui
{

/// @brief Incremental decoder turning raw terminal bytes into keystrokes.
///
/// Understands UTF-8, C0 control characters (reported as Ctrl+letter),
/// ESC-prefixed Alt keys, and the CSI / SS3 sequences xterm-compatible
/// terminals send for cursor, editing and function keys. A lone ESC is
/// ambiguous until more bytes arrive; timeout() resolves it.
class KeyDecoder
{
  public:
    /// @brief Feeds raw bytes and produces zero or more keystrokes.
    [[nodiscard]] auto feed(std::string_view data) -> std::vector<KeyEvent>;

    /// @brief Resolves pending state after the input went quiet.
    /// @return A bare Escape if one was pending, otherwise nothing.
    [[nodiscard]] auto timeout() -> std::vector<KeyEvent>;

  private:
    enum class State : std::uint8_t
    {
        Ground,
        Escape,
        Csi,
        Ss3,
        Utf8,
    };

    State _state = State::Ground;
    std::string _params;
    char32_t _utf8Value = 0;
    int _utf8Remaining = 0;
    bool _altPending = false; ///< The UTF-8 sequence being collected was ESC-prefixed.

    void ground(std::uint8_t byte, std::vector<KeyEvent>& out);
    void escape(std::uint8_t byte, std::vector<KeyEvent>& out);
    void csi(std::uint8_t byte, std::vector<KeyEvent>& out);
    void ss3(std::uint8_t byte, std::vector<KeyEvent>& out);
    void utf8(std::uint8_t byte, std::vector<KeyEvent>& out);

    /// @brief Starts a UTF-8 multi-byte sequence. Returns false for an invalid lead byte.
    auto beginUtf8(std::uint8_t lead) -> bool;

    [[nodiscard]] static auto controlKey(std::uint8_t byte) -> KeyEvent;
};

} // namespace bufstack::tui
