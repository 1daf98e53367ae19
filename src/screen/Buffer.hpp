// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <screen/View.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace bufstack
{

namespace tui
{
    class Surface;
    class Theme;
} // namespace tui

/// @brief Presentation options of Buffer::write().
struct WriteOptions
{
    std::string_view color = "none"; ///< Theme role.
    bool highlight = false;          ///< Use the role's highlighted variant.
    bool noFill = false;             ///< Do not erase the rest of the row.
};

/// @brief A stacked full-screen slot pairing a View with its geometry and presentation state.
///
/// The last row of a buffer is its status line; the content area is
/// height() - 1 rows. Buffers are created and destroyed by the BufferStack only.
class Buffer
{
  public:
    Buffer(tui::Surface& surface,
           tui::Theme const& theme,
           std::unique_ptr<View> view,
           std::string title,
           int width,
           int height,
           bool forceToTop);

    Buffer(Buffer const&) = delete;
    Buffer& operator=(Buffer const&) = delete;

    [[nodiscard]] auto title() const noexcept -> std::string const& { return _title; }
    [[nodiscard]] auto view() noexcept -> View& { return *_view; }
    [[nodiscard]] auto view() const noexcept -> View const& { return *_view; }

    [[nodiscard]] auto x() const noexcept -> int { return _x; }
    [[nodiscard]] auto y() const noexcept -> int { return _y; }
    [[nodiscard]] auto width() const noexcept -> int { return _width; }
    [[nodiscard]] auto height() const noexcept -> int { return _height; }
    [[nodiscard]] auto contentHeight() const noexcept -> int { return _height - 1; }

    [[nodiscard]] auto dirty() const noexcept -> bool { return _dirty; }
    void markDirty() noexcept { _dirty = true; }

    [[nodiscard]] auto focused() const noexcept -> bool { return _focused; }

    [[nodiscard]] auto forceToTop() const noexcept -> bool { return _forceToTop; }
    void setForceToTop(bool value) noexcept { _forceToTop = value; }

    /// @brief Changes the geometry. No-op if unchanged; otherwise marks dirty and notifies the view.
    void resize(int rows, int cols);

    /// @brief Full draw if dirty, otherwise only the status line; then commits.
    void redraw();

    /// @brief Paints content and status line unconditionally, then commits.
    void draw();

    /// @brief Clears the dirty flag and stages the region for the next flush.
    void commit();

    /// @brief Paints one line of text into the buffer, clipped to its width.
    ///
    /// No-op if the start position lies outside the buffer. Unless
    /// options.noFill is set, the rest of the row is padded with spaces.
    void write(int row, int col, std::string_view text, WriteOptions const& options = {});

    /// @brief Blanks the content area.
    void clear();

    /// @brief Returns " [<view-name>] <title>   <view-status>".
    [[nodiscard]] auto statusText() const -> std::string;

    void drawStatus();

    void focus();
    void blur();

  private:
    tui::Surface& _surface;
    tui::Theme const& _theme;
    std::unique_ptr<View> _view;
    std::string _title;
    int _x = 0;
    int _y = 0;
    int _width = 0;
    int _height = 1;
    bool _dirty = true;
    bool _focused = false;
    bool _forceToTop = false;
};

} // namespace bufstack
