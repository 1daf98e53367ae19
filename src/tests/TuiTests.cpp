// SPDX-License-Identifier: Apache-2.0
#include <tui/TerminalSurface.hpp>
#include <tui/Text.hpp>
#include <tui/Theme.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace bufstack::tui;

// =============================================================================
// Text helpers
// =============================================================================

TEST_CASE("Text: displayWidth counts codepoints", "[tui][text]")
{
    CHECK(displayWidth("") == 0);
    CHECK(displayWidth("hello") == 5);
    CHECK(displayWidth("größe") == 5);
    CHECK(displayWidth("…") == 1);
}

TEST_CASE("Text: clipToWidth never splits a codepoint", "[tui][text]")
{
    CHECK(clipToWidth("hello", 3) == "hel");
    CHECK(clipToWidth("hello", 10) == "hello");
    CHECK(clipToWidth("hello", 0).empty());
    CHECK(clipToWidth("äöü", 2) == "äö");
}

TEST_CASE("Text: truncate adds an ellipsis", "[tui][text]")
{
    CHECK(truncate("short", 10) == "short");
    CHECK(truncate("a long title", 6) == "a lon…");
    CHECK(truncate("abcdef", 2) == "..");
    CHECK(truncate("abc", 0).empty());
}

TEST_CASE("Text: padRight", "[tui][text]")
{
    CHECK(padRight("ab", 4) == "ab  ");
    CHECK(padRight("äb", 3) == "äb ");
    CHECK(padRight("abcdef", 3) == "abcdef");
}

TEST_CASE("Text: splitLines", "[tui][text]")
{
    CHECK(splitLines("").empty());
    CHECK(splitLines("one") == std::vector<std::string_view> { "one" });
    CHECK(splitLines("one\ntwo\n") == std::vector<std::string_view> { "one", "two" });
    CHECK(splitLines("a\n\nb") == std::vector<std::string_view> { "a", "", "b" });
}

// =============================================================================
// Theme
// =============================================================================

TEST_CASE("Theme: default roles", "[tui][theme]")
{
    auto const theme = defaultTheme();
    for (auto const* role: { "none", "status", "header", "completion", "directory", "tagged", "muted", "error" })
    {
        INFO(role);
        CHECK(theme.contains(role));
    }
}

TEST_CASE("Theme: unknown roles fall back to none", "[tui][theme]")
{
    auto theme = defaultTheme();
    auto plain = Style {};
    plain.underline = true;
    theme.set("none", plain);

    CHECK(theme.style("no-such-role") == plain);
}

TEST_CASE("Theme: highlight inverts and emboldens", "[tui][theme]")
{
    auto const theme = defaultTheme();
    auto const normal = theme.style("tagged");
    auto const highlighted = theme.style("tagged", true);

    CHECK(highlighted.inverse != normal.inverse);
    CHECK(highlighted.bold);
    CHECK(highlighted.fg == normal.fg);
}

// =============================================================================
// TerminalSurface (non-interactive)
// =============================================================================

TEST_CASE("TerminalSurface: dimensions default", "[tui][surface]")
{
    auto surface = TerminalSurface {};
    CHECK(surface.columns() > 0);
    CHECK(surface.rows() > 0);
}

TEST_CASE("TerminalSurface: drawing before initialize is harmless", "[tui][surface]")
{
    auto surface = TerminalSurface {};
    surface.put(0, 0, "hello", Style {});
    surface.put(-1, 0, "ignored", Style {});
    surface.put(0, surface.columns(), "ignored", Style {});
    surface.moveCursor(1000, 1000);
    surface.commit();
    surface.shutdown();
    // Verify no crash (nothing is written to the terminal before initialize)
}
