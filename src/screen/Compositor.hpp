// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mutex>

namespace bufstack
{

namespace tui
{
    class Surface;
    class Theme;
} // namespace tui

class BufferStack;
class Minibuffer;

/// @brief Options of Compositor::drawScreen().
struct DrawOptions
{
    bool lockHeld = false;       ///< The caller already holds the paint lock.
    bool skipMinibuffer = false; ///< Leave the minibuffer rows untouched.
    bool refresh = false;        ///< Force an immediate hardware refresh after the flush.
};

/// @brief Paints the visible buffer and the minibuffer onto the surface.
///
/// Owns the paint lock: every compositor pass and every direct surface
/// mutation (cursor moves, prompt painting, refresh) happens under it. Nested
/// callers that already hold it pass DrawOptions::lockHeld instead of relying
/// on a recursive mutex.
///
/// Only the topmost buffer is rendered; buffers below it are not visible.
class Compositor
{
  public:
    Compositor(tui::Surface& surface, tui::Theme const& theme, BufferStack& stack, Minibuffer& minibuffer);

    /// @brief Runs one compositor pass. No-op while suspended.
    void drawScreen(DrawOptions const& options = {});

    /// @brief Clears the physical terminal and repaints everything.
    void completelyRedrawScreen();

    /// @brief Repaints only the minibuffer rows and flushes.
    void drawMinibuffer(DrawOptions const& options = {});

    /// @brief Acquires the paint lock.
    [[nodiscard]] auto lock() -> std::unique_lock<std::mutex>;

    /// @brief While suspended (e.g. shelled out) every pass is skipped.
    void setSuspended(bool suspended) noexcept { _suspended = suspended; }
    [[nodiscard]] auto suspended() const noexcept -> bool { return _suspended; }

    /// @brief Number of passes that actually painted, for diagnostics.
    [[nodiscard]] auto passes() const noexcept -> unsigned { return _passes; }

  private:
    void paintMinibuffer();

    tui::Surface& _surface;
    tui::Theme const& _theme;
    BufferStack& _stack;
    Minibuffer& _minibuffer;
    std::mutex _paintMutex;
    bool _suspended = false;
    unsigned _passes = 0;
};

} // namespace bufstack
