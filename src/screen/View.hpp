// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/Key.hpp>

#include <string>

namespace bufstack
{

class Buffer;

/// @brief The pluggable content of a Buffer: rendering, input handling and lifecycle hooks.
///
/// A View is owned by exactly one Buffer. All hooks are called with the
/// compositor's paint lock held, except handleInput() and cleanup().
class View
{
  public:
    virtual ~View() = default;

    /// @brief Paints the content area of the hosting buffer (rows 0 .. contentHeight()-1).
    virtual void draw(Buffer& buffer) = 0;

    /// @brief Called when the hosting buffer changed its size. @p rows includes the status line.
    virtual void resize(int rows, int cols)
    {
        (void) rows;
        (void) cols;
    }

    virtual void focus() {}
    virtual void blur() {}

    /// @brief Handles a keystroke routed to the focused buffer.
    /// @return true if the keystroke was consumed.
    [[nodiscard]] virtual auto handleInput(tui::KeyEvent const& key) -> bool = 0;

    /// @brief Called exactly once, right before the hosting buffer is destroyed.
    virtual void cleanup() {}

    /// @brief Whether the "safe" kill operations may remove this view.
    [[nodiscard]] virtual auto killable() const -> bool { return true; }

    /// @brief Marks the application's home view.
    ///
    /// Such a view is never killable on its own, but it does not block
    /// BufferStack::killAllBuffersSafely() from tearing everything down.
    [[nodiscard]] virtual auto alwaysPresent() const -> bool { return false; }

    /// @brief Short identifier shown in the status line, e.g. "file-browser".
    [[nodiscard]] virtual auto name() const -> std::string = 0;

    /// @brief Free-form status text shown at the right of the status line.
    [[nodiscard]] virtual auto status() const -> std::string { return {}; }
};

/// @brief A view driven by a modal loop until it reports completion.
/// @tparam T The result type handed back to the caller of the modal loop.
template <typename T>
class ModalView: public View
{
  public:
    using ValueType = T;

    /// @brief Returns true once the view has produced its result.
    [[nodiscard]] virtual auto done() const -> bool = 0;

    /// @brief Returns the result. Also called when the loop was cancelled.
    [[nodiscard]] virtual auto value() -> T = 0;
};

} // namespace bufstack
