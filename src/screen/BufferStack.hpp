// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <screen/Buffer.hpp>
#include <screen/View.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace bufstack
{

namespace tui
{
    class Surface;
    class Theme;
    struct KeyEvent;
} // namespace tui

/// @brief Options for BufferStack::spawn().
struct SpawnOptions
{
    std::optional<int> width;  ///< Defaults to the screen width.
    std::optional<int> height; ///< Defaults to the screen height minus one row.
    bool hidden = false;       ///< Do not raise the new buffer to the top.
    bool forceToTop = false;   ///< Keep the buffer above everything raised after it.
};

/// @brief Produces a view on demand, see BufferStack::spawnUnlessExists().
using ViewFactory = std::function<std::unique_ptr<View>()>;

/// @brief The ordered set of buffers and the single focused buffer.
///
/// Order is z-order: the last buffer is the topmost, visible one. Titles are
/// unique; spawn() resolves collisions by appending " <2>", " <3>", ...
///
/// Operations naming a buffer that is not on the stack are caller bugs: they
/// are logged at error level and reported as ErrorCode::NotOnStack.
///
/// The stack is not synchronized. It is mutated from the foreground loop only
/// and read by the Compositor under its paint lock.
class BufferStack
{
  public:
    BufferStack(tui::Surface& surface, tui::Theme const& theme);

    /// @brief Kills every remaining buffer, running each view's cleanup hook.
    ~BufferStack();

    BufferStack(BufferStack const&) = delete;
    BufferStack& operator=(BufferStack const&) = delete;

    /// @brief Creates a buffer for @p view, inserts it at the bottom and raises it unless hidden.
    ///
    /// A hidden buffer receives focus if nothing is focused yet.
    [[nodiscard]] auto spawn(std::string_view title, std::unique_ptr<View> view, SpawnOptions const& options = {})
        -> Result<Buffer*>;

    /// @brief Returns the buffer titled @p title, raising it unless hidden; spawns it via @p factory if absent.
    /// @return nullptr if the factory produced no view.
    [[nodiscard]] auto spawnUnlessExists(std::string_view title,
                                         SpawnOptions const& options,
                                         ViewFactory const& factory) -> Result<Buffer*>;

    /// @brief Moves @p buffer to the top and focuses the new top.
    ///
    /// If the current top is pinned (forceToTop), the buffer lands just below it instead
    /// and the focus stays where it is.
    [[nodiscard]] auto raiseToFront(Buffer& buffer) -> VoidResult;

    /// @brief Blurs the focused buffer and focuses @p buffer. No-op if already focused.
    [[nodiscard]] auto focusOn(Buffer& buffer) -> VoidResult;

    /// @brief Unpins the top and raises the bottom buffer.
    void rollBuffers();

    /// @brief Unpins the top and raises the buffer just below it.
    void rollBuffersBackwards();

    /// @brief Runs the view's cleanup hook and destroys the buffer. The new top gets raised.
    [[nodiscard]] auto killBuffer(Buffer& buffer) -> VoidResult;

    /// @brief Kills the buffer if its view is killable.
    /// @return false if the view refused.
    [[nodiscard]] auto killBufferSafely(Buffer& buffer) -> Result<bool>;

    /// @brief Kills buffers from the top down, stopping at the first view that is not killable.
    ///
    /// The always-present home view never stops the batch.
    /// @return true if the stack ended up empty.
    [[nodiscard]] auto killAllBuffersSafely() -> bool;

    /// @brief Kills every buffer unconditionally, bottom first.
    void killAllBuffers();

    /// @brief Returns the buffer with the given realized title, or nullptr.
    [[nodiscard]] auto find(std::string_view title) const -> Buffer*;

    [[nodiscard]] auto exists(std::string_view title) const -> bool;

    [[nodiscard]] auto contains(Buffer const& buffer) const -> bool;

    /// @brief Returns the topmost buffer, or nullptr if the stack is empty.
    [[nodiscard]] auto top() const -> Buffer*;

    [[nodiscard]] auto focused() const noexcept -> Buffer* { return _focused; }

    /// @brief Returns the buffers in stack order, bottom first.
    [[nodiscard]] auto buffers() const -> std::vector<Buffer*>;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return _buffers.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return _buffers.empty(); }

    /// @brief Routes a keystroke to the focused view and marks its buffer dirty if consumed.
    [[nodiscard]] auto handleInput(tui::KeyEvent const& key) -> bool;

    /// @brief Whether the stack order changed since the last compositor pass.
    [[nodiscard]] auto dirty() const noexcept -> bool { return _dirty; }
    void markDirty() noexcept { _dirty = true; }
    void clearDirty() noexcept { _dirty = false; }

  private:
    [[nodiscard]] auto uniqueTitle(std::string_view title) const -> std::string;
    [[nodiscard]] auto registerTitle(Buffer& buffer) -> VoidResult;
    [[nodiscard]] auto indexOf(Buffer const& buffer) const -> std::optional<std::size_t>;
    [[nodiscard]] auto notOnStack(std::string_view operation, Buffer const& buffer) const -> std::unexpected<Error>;

    tui::Surface& _surface;
    tui::Theme const& _theme;
    std::vector<std::unique_ptr<Buffer>> _buffers;
    std::unordered_map<std::string, Buffer*> _byTitle;
    Buffer* _focused = nullptr;
    bool _dirty = false;
};

} // namespace bufstack
