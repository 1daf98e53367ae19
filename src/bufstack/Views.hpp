// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <screen/View.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace bufstack
{

class BufferStack;

/// @brief The home buffer: lists all buffers and the global keys.
///
/// It is the always-present view of the application and refuses to be killed.
class HomeView final: public View
{
  public:
    explicit HomeView(BufferStack const& stack);

    void draw(Buffer& buffer) override;
    [[nodiscard]] auto handleInput(tui::KeyEvent const& key) -> bool override;
    [[nodiscard]] auto killable() const -> bool override { return false; }
    [[nodiscard]] auto alwaysPresent() const -> bool override { return true; }
    [[nodiscard]] auto name() const -> std::string override { return "home"; }
    [[nodiscard]] auto status() const -> std::string override;

  private:
    BufferStack const& _stack;
};

/// @brief Shows the lines of a text file, scrollable.
class TextFileView final: public View
{
  public:
    /// @brief Reads @p path into a new view.
    [[nodiscard]] static auto load(std::string path) -> Result<std::unique_ptr<TextFileView>>;

    TextFileView(std::string path, std::vector<std::string> lines);

    void draw(Buffer& buffer) override;
    void resize(int rows, int cols) override;
    [[nodiscard]] auto handleInput(tui::KeyEvent const& key) -> bool override;
    void cleanup() override;
    [[nodiscard]] auto name() const -> std::string override { return "text"; }
    [[nodiscard]] auto status() const -> std::string override;

    [[nodiscard]] auto topLine() const noexcept -> int { return _topLine; }

  private:
    void scroll(int delta);

    std::string _path;
    std::vector<std::string> _lines;
    int _topLine = 0;
    int _contentRows = 1;
};

} // namespace bufstack
