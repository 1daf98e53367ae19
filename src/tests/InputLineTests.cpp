// SPDX-License-Identifier: Apache-2.0
#include <tui/InputLine.hpp>
#include <tui/Key.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "FakeSurface.hpp"

using namespace bufstack::tui;

namespace
{
/// @brief Feeds every character of @p text as an unmodified keystroke.
void typeText(InputLine& line, std::string_view text)
{
    for (auto const ch: text)
        (void) line.processKey(charKey(static_cast<char32_t>(ch)));
}

auto tab() -> KeyEvent
{
    return specialKey(KeyCode::Tab);
}

/// @brief A provider completing against a fixed word list.
auto wordProvider(std::vector<std::string> words, int* calls = nullptr) -> CompletionProvider
{
    return [words = std::move(words), calls](std::string_view text) {
        if (calls)
            ++*calls;
        auto result = std::vector<Completion> {};
        for (auto const& word: words)
        {
            if (word.starts_with(text))
                result.push_back(Completion { .value = word, .label = word });
        }
        return result;
    };
}
} // namespace

// ===== Editing =====

TEST_CASE("InputLine: typing and accepting", "[tui][inputline]")
{
    auto line = InputLine {};
    line.activate("Name: ", "", {});
    CHECK(line.active());

    typeText(line, "hello");
    CHECK(line.text() == "hello");
    CHECK(line.cursor() == 5);

    CHECK(line.processKey(specialKey(KeyCode::Enter)) == InputLineAction::Accept);
    REQUIRE(line.value().has_value());
    CHECK(*line.value() == "hello");
}

TEST_CASE("InputLine: default value places the cursor at the end", "[tui][inputline]")
{
    auto line = InputLine {};
    line.activate("File: ", "/tmp/", {});
    CHECK(line.text() == "/tmp/");
    CHECK(line.cursor() == 5);
}

TEST_CASE("InputLine: cancel key yields no value", "[tui][inputline]")
{
    auto line = InputLine {};
    line.activate("Q: ", "draft", {});

    SECTION("default cancel key")
    {
        CHECK(line.processKey(ctrlKey('g')) == InputLineAction::Cancel);
        CHECK_FALSE(line.value().has_value());
    }

    SECTION("configured cancel key")
    {
        line.setCancelKey(specialKey(KeyCode::Escape));
        CHECK(line.processKey(ctrlKey('g')) != InputLineAction::Cancel);
        CHECK(line.processKey(specialKey(KeyCode::Escape)) == InputLineAction::Cancel);
        CHECK_FALSE(line.value().has_value());
    }
}

TEST_CASE("InputLine: Emacs movement and deletion", "[tui][inputline]")
{
    auto line = InputLine {};
    line.activate("", "foo bar", {});

    SECTION("C-a and C-e")
    {
        (void) line.processKey(ctrlKey('a'));
        CHECK(line.cursor() == 0);
        (void) line.processKey(ctrlKey('e'));
        CHECK(line.cursor() == 7);
    }

    SECTION("C-w kills the previous word")
    {
        (void) line.processKey(ctrlKey('w'));
        CHECK(line.text() == "foo ");
    }

    SECTION("C-u kills to the start, C-y yanks it back")
    {
        (void) line.processKey(ctrlKey('b'));
        (void) line.processKey(ctrlKey('u'));
        CHECK(line.text() == "r");
        (void) line.processKey(ctrlKey('e'));
        (void) line.processKey(ctrlKey('y'));
        CHECK(line.text() == "rfoo ba");
    }

    SECTION("Backspace and Delete")
    {
        (void) line.processKey(specialKey(KeyCode::Backspace));
        CHECK(line.text() == "foo ba");
        (void) line.processKey(specialKey(KeyCode::Home));
        (void) line.processKey(specialKey(KeyCode::Delete));
        CHECK(line.text() == "oo ba");
    }

    SECTION("M-b moves back a word")
    {
        (void) line.processKey(altKey('b'));
        CHECK(line.cursor() == 4);
    }
}

TEST_CASE("InputLine: multi-byte characters move as a unit", "[tui][inputline]")
{
    auto line = InputLine {};
    line.activate("", "aäb", {});
    (void) line.processKey(specialKey(KeyCode::Left));
    (void) line.processKey(specialKey(KeyCode::Left));
    CHECK(line.cursor() == 1);
    (void) line.processKey(specialKey(KeyCode::Delete));
    CHECK(line.text() == "ab");
}

TEST_CASE("InputLine: unhandled keys are not consumed", "[tui][inputline]")
{
    auto line = InputLine {};
    line.activate("", "", {});
    CHECK(line.processKey(specialKey(KeyCode::F5)) == InputLineAction::None);
}

// ===== History =====

TEST_CASE("InputLine: history skips empties and repeats", "[tui][inputline]")
{
    auto line = InputLine {};
    line.addHistory("one");
    line.addHistory("");
    line.addHistory("two");
    line.addHistory("two");
    CHECK(line.history() == std::vector<std::string> { "one", "two" });
}

TEST_CASE("InputLine: history is capped", "[tui][inputline]")
{
    auto line = InputLine {};
    line.setMaxHistory(2);
    line.addHistory("a");
    line.addHistory("b");
    line.addHistory("c");
    CHECK(line.history() == std::vector<std::string> { "b", "c" });
}

TEST_CASE("InputLine: Up recalls previous answers", "[tui][inputline]")
{
    auto line = InputLine {};
    line.addHistory("first");
    line.addHistory("second");
    line.activate("", "", {});

    (void) line.processKey(specialKey(KeyCode::Up));
    CHECK(line.text() == "second");
    (void) line.processKey(specialKey(KeyCode::Up));
    CHECK(line.text() == "first");
    (void) line.processKey(specialKey(KeyCode::Down));
    CHECK(line.text() == "second");
}

// ===== Completion =====

TEST_CASE("InputLine: single candidate is inserted", "[tui][inputline][completion]")
{
    auto line = InputLine {};
    line.activate("", "ba", wordProvider({ "banana", "cherry" }));

    CHECK(line.processKey(tab()) == InputLineAction::Complete);
    CHECK(line.text() == "banana");
    CHECK(line.completions().empty());
    CHECK_FALSE(line.takeNewCompletions());
}

TEST_CASE("InputLine: several candidates insert their common prefix", "[tui][inputline][completion]")
{
    auto line = InputLine {};
    line.activate("", "a", wordProvider({ "apple", "apricot", "banana" }));

    (void) line.processKey(tab());
    CHECK(line.text() == "ap");
    CHECK(line.completions().size() == 2);
    CHECK(line.takeNewCompletions());
    CHECK_FALSE(line.takeNewCompletions());
}

TEST_CASE("InputLine: second Tab rolls the shown list", "[tui][inputline][completion]")
{
    auto calls = 0;
    auto line = InputLine {};
    line.activate("", "a", wordProvider({ "apple", "apricot" }, &calls));

    (void) line.processKey(tab());
    CHECK(line.takeNewCompletions());
    (void) line.processKey(tab());
    CHECK(line.takeRollCompletions());
    CHECK_FALSE(line.takeNewCompletions());
    CHECK(calls == 1);
}

TEST_CASE("InputLine: editing refreshes a shown list", "[tui][inputline][completion]")
{
    auto line = InputLine {};
    line.activate("", "a", wordProvider({ "apple", "apricot" }));

    (void) line.processKey(tab());
    REQUIRE(line.takeNewCompletions());

    typeText(line, "r");
    CHECK(line.text() == "apr");
    REQUIRE(line.completions().size() == 1);
    CHECK(line.completions().front().value == "apricot");
    CHECK(line.takeNewCompletions());

    typeText(line, "x");
    CHECK(line.completions().empty());
    CHECK(line.takeNewCompletions());
}

TEST_CASE("InputLine: no provider, no completion", "[tui][inputline][completion]")
{
    auto line = InputLine {};
    line.activate("", "x", {});
    CHECK(line.processKey(tab()) == InputLineAction::Complete);
    CHECK(line.text() == "x");
    CHECK_FALSE(line.takeNewCompletions());
}

TEST_CASE("commonPrefix", "[tui][inputline][completion]")
{
    CHECK(commonPrefix({}).empty());
    CHECK(commonPrefix({ { .value = "abc" } }) == "abc");
    CHECK(commonPrefix({ { .value = "docs/a" }, { .value = "docs/b" } }) == "docs/");
    // "ä" and "ö" share their UTF-8 lead byte; the prefix must not split it.
    CHECK(commonPrefix({ { .value = "xä" }, { .value = "xö" } }) == "x");
}

// ===== Painting =====

TEST_CASE("InputLine: paint shows question and text", "[tui][inputline]")
{
    auto surface = bufstack::test::FakeSurface(5, 20);
    auto line = InputLine {};
    line.activate("Open: ", "notes", {});

    line.paint(surface, 4, Style {});
    line.positionCursor(surface, 4);
    CHECK(surface.row(4) == "Open: notes");
    CHECK(surface.cursorRow == 4);
    CHECK(surface.cursorCol == 11);
}

TEST_CASE("InputLine: long text scrolls to keep the cursor visible", "[tui][inputline]")
{
    auto surface = bufstack::test::FakeSurface(2, 10);
    auto line = InputLine {};
    line.activate("> ", "0123456789abc", {});

    line.paint(surface, 1, Style {});
    line.positionCursor(surface, 1);
    CHECK(surface.cursorCol < 10);
    CHECK(surface.row(1).ends_with("abc"));
}
