// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <screen/View.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace bufstack
{

/// @brief Shows completion candidates in columns below a header line.
///
/// The first prefixLen characters of every label are painted in the
/// "completion" color so the part the user already typed stands out. When the
/// list is taller than the buffer, roll() pages through it and wraps around.
class CompletionView final: public View
{
  public:
    CompletionView(std::vector<std::string> labels, std::string header, std::size_t prefixLen);

    void draw(Buffer& buffer) override;
    void resize(int rows, int cols) override;
    [[nodiscard]] auto handleInput(tui::KeyEvent const& key) -> bool override;
    [[nodiscard]] auto name() const -> std::string override { return "completions"; }
    [[nodiscard]] auto status() const -> std::string override;

    /// @brief Pages down, or back to the first page when the last one is shown.
    void roll();

    /// @brief Index of the first visible candidate row.
    [[nodiscard]] auto topRow() const noexcept -> int { return _topRow; }

    /// @brief Number of candidate rows for the current width.
    [[nodiscard]] auto rowCount() const -> int;

  private:
    [[nodiscard]] auto columnsPerRow() const -> int;
    [[nodiscard]] auto pageRows() const -> int;

    std::vector<std::string> _labels;
    std::string _header;
    std::size_t _prefixLen = 0;
    int _maxLabelWidth = 0;
    int _rows = 1;
    int _cols = 80;
    int _topRow = 0;
};

} // namespace bufstack
