// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <screen/BufferStack.hpp>
#include <screen/Compositor.hpp>
#include <screen/Minibuffer.hpp>
#include <screen/Modal.hpp>
#include <screen/PromptSession.hpp>
#include <screen/ScreenConfig.hpp>
#include <tui/Theme.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bufstack
{

namespace os
{
    class Accounts;
    class FileSystem;
} // namespace os

namespace tui
{
    class Surface;
} // namespace tui

/// @brief The screen layer of one terminal: buffers, minibuffer, compositor and prompts.
///
/// Created once at startup and passed by reference to everything that needs
/// to talk to the screen. All calls are made from the foreground loop or from
/// loops nested inside it.
class ScreenSession
{
  public:
    ScreenSession(tui::Surface& surface,
                  tui::Theme theme,
                  ScreenConfig config,
                  os::FileSystem const& fileSystem,
                  os::Accounts& accounts);

    ScreenSession(ScreenSession const&) = delete;
    ScreenSession& operator=(ScreenSession const&) = delete;

    [[nodiscard]] auto surface() noexcept -> tui::Surface& { return _surface; }
    [[nodiscard]] auto theme() const noexcept -> tui::Theme const& { return _theme; }
    [[nodiscard]] auto config() const noexcept -> ScreenConfig const& { return _config; }
    [[nodiscard]] auto stack() noexcept -> BufferStack& { return _stack; }
    [[nodiscard]] auto minibuffer() noexcept -> Minibuffer& { return _minibuffer; }
    [[nodiscard]] auto compositor() noexcept -> Compositor& { return _compositor; }
    [[nodiscard]] auto prompts() noexcept -> PromptSession& { return _prompts; }
    [[nodiscard]] auto loopContext() -> LoopContext;

    /// @brief Adds a status line and repaints the whole screen, since the layout may change.
    [[nodiscard]] auto say(std::string text) -> StatusHandle;

    /// @brief Replaces the status line behind @p handle and repaints only the minibuffer.
    void say(StatusHandle handle, std::string text);

    /// @brief Shows a status line while @p body runs and clears it afterwards, also if @p body throws.
    auto say(std::string text, std::function<void(StatusHandle)> const& body) -> StatusHandle;

    /// @brief Removes a status line and repaints the screen.
    void clear(StatusHandle handle);

    /// @brief Shows a transient message and repaints the screen.
    void flash(std::string text);

    /// @brief Drops the transient message. The next pass no longer shows it.
    void eraseFlash();

    void drawScreen(DrawOptions const& options = {});
    void completelyRedrawScreen();

    /// @brief Routes a keystroke to the focused buffer's view.
    [[nodiscard]] auto handleInput(tui::KeyEvent const& key) -> bool;

    /// @brief Hands the terminal to `/bin/sh -c command` and reclaims it afterwards.
    /// @return The command's exit status.
    [[nodiscard]] auto shellOut(std::string_view command) -> Result<int>;

    /// @brief Runs a modal loop for @p view, see runModal().
    template <typename T>
    [[nodiscard]] auto spawnModal(std::string_view title,
                                  std::unique_ptr<ModalView<T>> view,
                                  SpawnOptions const& options = {}) -> Result<T>
    {
        return runModal<T>(loopContext(), title, std::move(view), options);
    }

    [[nodiscard]] auto ask(std::string_view domain,
                           std::string_view question,
                           std::string_view defaultValue = {},
                           tui::CompletionProvider provider = {}) -> Result<std::optional<std::string>>;
    [[nodiscard]] auto askForFilenames(std::string_view domain,
                                       std::string_view question,
                                       std::string_view defaultValue = {}) -> Result<std::vector<std::string>>;
    [[nodiscard]] auto askGetch(std::string_view question, std::string_view accept = {})
        -> Result<std::optional<tui::KeyEvent>>;
    [[nodiscard]] auto askYesOrNo(std::string_view question) -> Result<std::optional<bool>>;

  private:
    tui::Surface& _surface;
    tui::Theme _theme;
    ScreenConfig _config;
    BufferStack _stack;
    Minibuffer _minibuffer;
    Compositor _compositor;
    PromptSession _prompts;
};

/// @brief A status line that lives as long as this object.
class ScopedStatus
{
  public:
    ScopedStatus(ScreenSession& session, std::string text);
    ~ScopedStatus();

    ScopedStatus(ScopedStatus const&) = delete;
    ScopedStatus& operator=(ScopedStatus const&) = delete;

    [[nodiscard]] auto handle() const noexcept -> StatusHandle { return _handle; }

    /// @brief Replaces the text of the line.
    void update(std::string text);

  private:
    ScreenSession& _session;
    StatusHandle _handle;
};

} // namespace bufstack
