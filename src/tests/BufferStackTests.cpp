// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <screen/BufferStack.hpp>
#include <tui/Theme.hpp>

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "FakeSurface.hpp"
#include "Fakes.hpp"

using namespace bufstack;
using bufstack::test::FakeSurface;
using bufstack::test::RecordingView;
using bufstack::test::ViewLog;

namespace
{
struct StackFixture
{
    FakeSurface surface { 24, 80 };
    tui::Theme theme = tui::defaultTheme();
    BufferStack stack { surface, theme };

    auto spawn(std::string_view title, std::shared_ptr<ViewLog> log = std::make_shared<ViewLog>(), SpawnOptions const& options = {})
        -> Buffer*
    {
        auto spawned = stack.spawn(title, std::make_unique<RecordingView>(std::string(title), std::move(log)), options);
        REQUIRE(spawned.has_value());
        return *spawned;
    }

    /// @brief Titles bottom first.
    auto titles() const -> std::vector<std::string>
    {
        auto result = std::vector<std::string> {};
        for (auto const* buffer: stack.buffers())
            result.push_back(buffer->title());
        return result;
    }
};
} // namespace

// ===== Spawning =====

TEST_CASE("BufferStack: spawn raises and focuses the new buffer", "[screen][stack]")
{
    auto fixture = StackFixture {};
    auto* first = fixture.spawn("first");
    auto* second = fixture.spawn("second");

    CHECK(fixture.stack.top() == second);
    CHECK(fixture.stack.focused() == second);
    CHECK(second->focused());
    CHECK_FALSE(first->focused());
    CHECK(fixture.titles() == std::vector<std::string> { "first", "second" });
    CHECK(fixture.stack.dirty());
}

TEST_CASE("BufferStack: default geometry leaves one row for the minibuffer", "[screen][stack]")
{
    auto fixture = StackFixture {};
    auto* buffer = fixture.spawn("main");
    CHECK(buffer->width() == 80);
    CHECK(buffer->height() == 23);

    auto* small = fixture.spawn("small", std::make_shared<ViewLog>(), SpawnOptions { .width = 40, .height = 5 });
    CHECK(small->width() == 40);
    CHECK(small->height() == 5);
}

TEST_CASE("BufferStack: colliding titles get numbered suffixes", "[screen][stack]")
{
    auto fixture = StackFixture {};
    fixture.spawn("inbox");
    fixture.spawn("inbox");
    fixture.spawn("inbox");

    CHECK(fixture.stack.exists("inbox"));
    CHECK(fixture.stack.exists("inbox <2>"));
    CHECK(fixture.stack.exists("inbox <3>"));
    CHECK(fixture.stack.size() == 3);
}

TEST_CASE("BufferStack: killing the second inbox leaves the first focused", "[screen][stack]")
{
    auto fixture = StackFixture {};
    auto* inbox = fixture.spawn("inbox");
    auto* second = fixture.spawn("inbox");
    REQUIRE(second->title() == "inbox <2>");

    REQUIRE(fixture.stack.killBuffer(*second).has_value());
    CHECK(fixture.stack.size() == 1);
    CHECK(fixture.stack.focused() == inbox);
    CHECK(fixture.stack.top() == inbox);
    CHECK_FALSE(fixture.stack.exists("inbox <2>"));

    // The freed title is available again.
    CHECK(fixture.spawn("inbox")->title() == "inbox <2>");
}

TEST_CASE("BufferStack: spawn without a view is rejected", "[screen][stack]")
{
    auto fixture = StackFixture {};
    auto const result = fixture.stack.spawn("empty", nullptr);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidArgument);
    CHECK(fixture.stack.empty());
}

TEST_CASE("BufferStack: hidden buffers go to the bottom", "[screen][stack]")
{
    auto fixture = StackFixture {};

    SECTION("focus is taken only if nothing is focused")
    {
        auto* hidden = fixture.spawn("hidden", std::make_shared<ViewLog>(), SpawnOptions { .hidden = true });
        CHECK(fixture.stack.focused() == hidden);
    }

    SECTION("an existing focus is kept")
    {
        auto* visible = fixture.spawn("visible");
        fixture.spawn("hidden", std::make_shared<ViewLog>(), SpawnOptions { .hidden = true });
        CHECK(fixture.stack.focused() == visible);
        CHECK(fixture.stack.top() == visible);
        CHECK(fixture.titles() == std::vector<std::string> { "hidden", "visible" });
    }
}

TEST_CASE("BufferStack: spawnUnlessExists builds the view lazily", "[screen][stack]")
{
    auto fixture = StackFixture {};
    auto calls = 0;
    auto factory = [&]() -> std::unique_ptr<View> {
        ++calls;
        return std::make_unique<RecordingView>("log");
    };

    auto first = fixture.stack.spawnUnlessExists("log", {}, factory);
    REQUIRE(first.has_value());
    fixture.spawn("other");

    auto again = fixture.stack.spawnUnlessExists("log", {}, factory);
    REQUIRE(again.has_value());
    CHECK(*again == *first);
    CHECK(calls == 1);
    CHECK(fixture.stack.top() == *first);
    CHECK(fixture.stack.size() == 2);
}

TEST_CASE("BufferStack: spawnUnlessExists with a factory that yields nothing", "[screen][stack]")
{
    auto fixture = StackFixture {};
    fixture.spawn("main");

    auto errors = 0;
    log::setCallback([&](log::Level level, std::string_view) {
        if (level == log::Level::Error)
            ++errors;
    });

    auto const spawned = fixture.stack.spawnUnlessExists("missing.txt", {}, []() -> std::unique_ptr<View> {
        return nullptr;
    });
    log::setCallback({});

    REQUIRE(spawned.has_value());
    CHECK(*spawned == nullptr);
    CHECK(errors == 0);
    CHECK_FALSE(fixture.stack.exists("missing.txt"));
    CHECK(fixture.stack.size() == 1);
    CHECK(fixture.stack.focused() == fixture.stack.find("main"));
}

// ===== Ordering =====

TEST_CASE("BufferStack: raiseToFront and focusOn", "[screen][stack]")
{
    auto fixture = StackFixture {};
    auto* a = fixture.spawn("a");
    fixture.spawn("b");

    REQUIRE(fixture.stack.raiseToFront(*a).has_value());
    CHECK(fixture.stack.top() == a);
    CHECK(fixture.stack.focused() == a);

    auto* b = fixture.stack.find("b");
    REQUIRE(fixture.stack.focusOn(*b).has_value());
    CHECK(fixture.stack.focused() == b);
    CHECK(fixture.stack.top() == a);
}

TEST_CASE("BufferStack: a pinned buffer stays on top", "[screen][stack]")
{
    auto fixture = StackFixture {};
    auto* pinned = fixture.spawn("pinned", std::make_shared<ViewLog>(), SpawnOptions { .forceToTop = true });
    auto* a = fixture.spawn("a");
    auto* b = fixture.spawn("b");

    CHECK(fixture.stack.top() == pinned);
    REQUIRE(fixture.stack.raiseToFront(*a).has_value());
    CHECK(fixture.stack.top() == pinned);
    REQUIRE(fixture.stack.raiseToFront(*b).has_value());
    CHECK(fixture.stack.top() == pinned);
    CHECK(fixture.titles() == std::vector<std::string> { "a", "b", "pinned" });

    SECTION("rolling unpins it")
    {
        fixture.stack.rollBuffers();
        CHECK_FALSE(pinned->forceToTop());
        CHECK(fixture.stack.top() == a);
        CHECK(fixture.stack.focused() == a);
    }
}

TEST_CASE("BufferStack: raising below a pinned buffer keeps the focus", "[screen][stack]")
{
    auto fixture = StackFixture {};
    auto* pinned = fixture.spawn("pinned", std::make_shared<ViewLog>(), SpawnOptions { .forceToTop = true });
    auto aLog = std::make_shared<ViewLog>();
    auto* a = fixture.spawn("a", aLog);

    // Spawning below the pinned buffer does not steal its focus.
    CHECK(fixture.stack.focused() == pinned);

    REQUIRE(fixture.stack.focusOn(*a).has_value());
    auto const blurs = aLog->blurs;

    REQUIRE(fixture.stack.raiseToFront(*a).has_value());
    CHECK(fixture.stack.top() == pinned);
    CHECK(fixture.titles() == std::vector<std::string> { "a", "pinned" });
    CHECK(fixture.stack.focused() == a);
    CHECK(a->focused());
    CHECK_FALSE(pinned->focused());
    CHECK(aLog->blurs == blurs);
}

TEST_CASE("BufferStack: rolling a single buffer changes nothing", "[screen][stack]")
{
    auto fixture = StackFixture {};
    auto* only = fixture.spawn("only");

    fixture.stack.rollBuffers();
    fixture.stack.rollBuffersBackwards();
    CHECK(fixture.stack.top() == only);
    CHECK(fixture.stack.focused() == only);

    auto empty = StackFixture {};
    empty.stack.rollBuffers();
    CHECK(empty.stack.empty());
}

TEST_CASE("BufferStack: N rolls return focus to where it started", "[screen][stack]")
{
    auto fixture = StackFixture {};
    fixture.spawn("a");
    fixture.spawn("b");
    fixture.spawn("c");
    fixture.spawn("d");

    auto* start = fixture.stack.focused();
    auto const order = fixture.titles();

    for (auto i = std::size_t { 0 }; i < fixture.stack.size(); ++i)
    {
        fixture.stack.rollBuffers();
        if (i + 1 < fixture.stack.size())
            CHECK(fixture.stack.focused() != start);
    }
    CHECK(fixture.stack.focused() == start);
    CHECK(fixture.titles() == order);
}

TEST_CASE("BufferStack: rollBuffersBackwards raises the buffer below the top", "[screen][stack]")
{
    auto fixture = StackFixture {};
    fixture.spawn("a");
    fixture.spawn("b");
    fixture.spawn("c");

    fixture.stack.rollBuffersBackwards();
    CHECK(fixture.titles() == std::vector<std::string> { "a", "c", "b" });
    CHECK(fixture.stack.focused()->title() == "b");
}

// ===== Killing =====

TEST_CASE("BufferStack: kill runs cleanup exactly once", "[screen][stack]")
{
    auto fixture = StackFixture {};
    auto log = std::make_shared<ViewLog>();
    fixture.spawn("keep");
    auto* doomed = fixture.spawn("doomed", log);

    REQUIRE(fixture.stack.killBuffer(*doomed).has_value());
    CHECK(log->cleanups == 1);
    CHECK_FALSE(fixture.stack.exists("doomed"));
    CHECK(fixture.stack.find("doomed") == nullptr);
    CHECK(fixture.stack.size() == 1);
    CHECK(fixture.stack.focused()->title() == "keep");
}

TEST_CASE("BufferStack: killing the last buffer empties the stack", "[screen][stack]")
{
    auto fixture = StackFixture {};
    auto* only = fixture.spawn("only");
    REQUIRE(fixture.stack.killBuffer(*only).has_value());
    CHECK(fixture.stack.empty());
    CHECK(fixture.stack.top() == nullptr);
    CHECK(fixture.stack.focused() == nullptr);
}

TEST_CASE("BufferStack: buffers not on the stack are rejected", "[screen][stack]")
{
    auto fixture = StackFixture {};
    fixture.spawn("member");
    auto stranger = Buffer(fixture.surface, fixture.theme, std::make_unique<RecordingView>("x"), "stranger", 10, 5, false);

    CHECK(fixture.stack.raiseToFront(stranger).error().code == ErrorCode::NotOnStack);
    CHECK(fixture.stack.focusOn(stranger).error().code == ErrorCode::NotOnStack);
    CHECK(fixture.stack.killBuffer(stranger).error().code == ErrorCode::NotOnStack);
    CHECK(fixture.stack.killBufferSafely(stranger).error().code == ErrorCode::NotOnStack);
    CHECK(fixture.stack.size() == 1);
}

TEST_CASE("BufferStack: killBufferSafely respects killable", "[screen][stack]")
{
    auto fixture = StackFixture {};
    auto log = std::make_shared<ViewLog>();
    auto spawned = fixture.stack.spawn("sticky", std::make_unique<RecordingView>("sticky", log, false));
    REQUIRE(spawned.has_value());

    auto const killed = fixture.stack.killBufferSafely(**spawned);
    REQUIRE(killed.has_value());
    CHECK_FALSE(*killed);
    CHECK(fixture.stack.exists("sticky"));
    CHECK(log->cleanups == 0);

    auto* plain = fixture.spawn("plain");
    auto const plainKilled = fixture.stack.killBufferSafely(*plain);
    REQUIRE(plainKilled.has_value());
    CHECK(*plainKilled);
}

TEST_CASE("BufferStack: killAllBuffersSafely", "[screen][stack]")
{
    auto fixture = StackFixture {};
    auto homeLog = std::make_shared<ViewLog>();
    REQUIRE(fixture.stack.spawn("home", std::make_unique<RecordingView>("home", homeLog, false, true)).has_value());

    SECTION("the home view does not block the batch")
    {
        fixture.spawn("a");
        fixture.spawn("b");
        CHECK(fixture.stack.killAllBuffersSafely());
        CHECK(fixture.stack.empty());
        CHECK(homeLog->cleanups == 1);
    }

    SECTION("an unkillable view stops the batch")
    {
        fixture.spawn("a");
        REQUIRE(fixture.stack.spawn("sticky", std::make_unique<RecordingView>("sticky", std::make_shared<ViewLog>(), false))
                    .has_value());
        fixture.spawn("b");

        CHECK_FALSE(fixture.stack.killAllBuffersSafely());
        CHECK(fixture.stack.top()->title() == "sticky");
        CHECK(fixture.stack.size() == 3);
    }
}

TEST_CASE("BufferStack: destruction cleans up every view", "[screen][stack]")
{
    auto log = std::make_shared<ViewLog>();
    {
        auto fixture = StackFixture {};
        fixture.spawn("a", log);
        fixture.spawn("b", log);
    }
    CHECK(log->cleanups == 2);
}

// ===== Input routing =====

TEST_CASE("BufferStack: handleInput reaches the focused view", "[screen][stack]")
{
    auto fixture = StackFixture {};
    auto backLog = std::make_shared<ViewLog>();
    auto frontLog = std::make_shared<ViewLog>();
    fixture.spawn("back", backLog);
    auto* front = fixture.spawn("front", frontLog);
    front->commit();

    CHECK(fixture.stack.handleInput(tui::charKey('j')));
    CHECK(front->dirty());
    CHECK(frontLog->keys.size() == 1);
    CHECK(backLog->keys.empty());

    front->commit();
    CHECK_FALSE(fixture.stack.handleInput(tui::charKey('?')));
    CHECK_FALSE(front->dirty());
}

TEST_CASE("BufferStack: handleInput with nothing focused", "[screen][stack]")
{
    auto fixture = StackFixture {};
    CHECK_FALSE(fixture.stack.handleInput(tui::charKey('j')));
}
