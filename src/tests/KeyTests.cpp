// SPDX-License-Identifier: Apache-2.0
#include <tui/Key.hpp>
#include <tui/KeyDecoder.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace bufstack::tui;

// =============================================================================
// parseKey / describeKey
// =============================================================================

TEST_CASE("parseKey: plain characters", "[tui][key]")
{
    CHECK(parseKey("q") == charKey('q'));
    CHECK(parseKey("!") == charKey('!'));
    CHECK(parseKey("ä") == charKey(U'ä'));
}

TEST_CASE("parseKey: modifier prefixes", "[tui][key]")
{
    CHECK(parseKey("C-g") == ctrlKey('g'));
    CHECK(parseKey("M-f") == altKey('f'));

    auto const both = parseKey("C-M-x");
    REQUIRE(both.has_value());
    CHECK(hasModifier(both->modifiers, Modifier::Ctrl));
    CHECK(hasModifier(both->modifiers, Modifier::Alt));
    CHECK(both->codepoint == U'x');
}

TEST_CASE("parseKey: named keys", "[tui][key]")
{
    CHECK(parseKey("Enter") == specialKey(KeyCode::Enter));
    CHECK(parseKey("Tab") == specialKey(KeyCode::Tab));
    CHECK(parseKey("PageDown") == specialKey(KeyCode::PageDown));
    CHECK(parseKey("F12") == specialKey(KeyCode::F12));
    CHECK(parseKey("S-Tab") == specialKey(KeyCode::Tab, Modifier::Shift));
}

TEST_CASE("parseKey: rejects garbage", "[tui][key]")
{
    CHECK_FALSE(parseKey("").has_value());
    CHECK_FALSE(parseKey("X-a").has_value());
    CHECK_FALSE(parseKey("Bogus").has_value());
    CHECK_FALSE(parseKey("ab").has_value());
}

TEST_CASE("describeKey is the inverse of parseKey", "[tui][key]")
{
    for (auto const* text: { "C-g", "M-f", "q", "Enter", "PageUp", "S-Tab", "C-Left" })
    {
        auto const key = parseKey(text);
        REQUIRE(key.has_value());
        CHECK(describeKey(*key) == text);
    }
}

TEST_CASE("isChar ignores Shift but not Ctrl or Alt", "[tui][key]")
{
    auto shifted = charKey('Y');
    shifted.modifiers = Modifier::Shift;
    CHECK(isChar(shifted, 'Y'));
    CHECK_FALSE(isChar(ctrlKey('y'), 'y'));
    CHECK_FALSE(isChar(altKey('y'), 'y'));
}

// =============================================================================
// KeyDecoder
// =============================================================================

TEST_CASE("KeyDecoder: printable ASCII", "[tui][keydecoder]")
{
    auto decoder = KeyDecoder {};
    auto const keys = decoder.feed("ab");
    REQUIRE(keys.size() == 2);
    CHECK(keys[0] == charKey('a'));
    CHECK(keys[1] == charKey('b'));
}

TEST_CASE("KeyDecoder: control characters", "[tui][keydecoder]")
{
    auto decoder = KeyDecoder {};

    SECTION("BEL is Ctrl+g")
    {
        auto const keys = decoder.feed("\x07");
        REQUIRE(keys.size() == 1);
        CHECK(keys[0] == ctrlKey('g'));
    }

    SECTION("CR and LF are Enter")
    {
        auto const keys = decoder.feed("\r\n");
        REQUIRE(keys.size() == 2);
        CHECK(keys[0] == specialKey(KeyCode::Enter));
        CHECK(keys[1] == specialKey(KeyCode::Enter));
    }

    SECTION("TAB and DEL")
    {
        auto const keys = decoder.feed("\t\x7F");
        REQUIRE(keys.size() == 2);
        CHECK(keys[0] == specialKey(KeyCode::Tab));
        CHECK(keys[1] == specialKey(KeyCode::Backspace));
    }
}

TEST_CASE("KeyDecoder: UTF-8 split across reads", "[tui][keydecoder]")
{
    auto decoder = KeyDecoder {};
    CHECK(decoder.feed("\xC3").empty());
    auto const keys = decoder.feed("\xA4");
    REQUIRE(keys.size() == 1);
    CHECK(keys[0] == charKey(U'ä'));
}

TEST_CASE("KeyDecoder: Alt via ESC prefix", "[tui][keydecoder]")
{
    auto decoder = KeyDecoder {};
    auto const keys = decoder.feed("\x1B" "f");
    REQUIRE(keys.size() == 1);
    CHECK(keys[0] == altKey('f'));
}

TEST_CASE("KeyDecoder: lone ESC resolves on timeout", "[tui][keydecoder]")
{
    auto decoder = KeyDecoder {};
    CHECK(decoder.feed("\x1B").empty());
    auto const keys = decoder.timeout();
    REQUIRE(keys.size() == 1);
    CHECK(keys[0] == specialKey(KeyCode::Escape));
    CHECK(decoder.timeout().empty());
}

TEST_CASE("KeyDecoder: CSI cursor and editing keys", "[tui][keydecoder]")
{
    auto decoder = KeyDecoder {};

    SECTION("arrows")
    {
        auto const keys = decoder.feed("\x1B[A\x1B[D");
        REQUIRE(keys.size() == 2);
        CHECK(keys[0] == specialKey(KeyCode::Up));
        CHECK(keys[1] == specialKey(KeyCode::Left));
    }

    SECTION("xterm modifier parameter")
    {
        auto const keys = decoder.feed("\x1B[1;5C");
        REQUIRE(keys.size() == 1);
        CHECK(keys[0] == specialKey(KeyCode::Right, Modifier::Ctrl));
    }

    SECTION("tilde codes")
    {
        auto const keys = decoder.feed("\x1B[3~\x1B[6~");
        REQUIRE(keys.size() == 2);
        CHECK(keys[0] == specialKey(KeyCode::Delete));
        CHECK(keys[1] == specialKey(KeyCode::PageDown));
    }

    SECTION("back-tab")
    {
        auto const keys = decoder.feed("\x1B[Z");
        REQUIRE(keys.size() == 1);
        CHECK(keys[0] == specialKey(KeyCode::Tab, Modifier::Shift));
    }
}

TEST_CASE("KeyDecoder: SS3 function keys", "[tui][keydecoder]")
{
    auto decoder = KeyDecoder {};
    auto const keys = decoder.feed("\x1BOP");
    REQUIRE(keys.size() == 1);
    CHECK(keys[0] == specialKey(KeyCode::F1));
}
