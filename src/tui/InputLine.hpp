// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <tui/Key.hpp>
#include <tui/Style.hpp>

namespace bufstack::tui
{

class Surface;

/// @brief A completion candidate: the full value to insert and a short display label.
struct Completion
{
    std::string value;
    std::string label;

    auto operator==(Completion const&) const -> bool = default;
};

/// @brief Produces ranked completion candidates for the current input text.
using CompletionProvider = std::function<std::vector<Completion>(std::string_view text)>;

/// @brief Result of feeding a keystroke to an InputLine.
enum class InputLineAction : std::uint8_t
{
    Changed,  ///< Text or cursor changed; repaint.
    Complete, ///< The completion key was handled; check the completion flags.
    None,     ///< Keystroke not consumed.
    Accept,   ///< Enter: the session ends with the current text.
    Cancel,   ///< Cancel key: the session ends without a value.
};

/// @brief A reusable single-line editor for one prompt domain.
///
/// Holds the text, the cursor, a per-domain history and the completion state of
/// the question being asked. Emacs keybindings operate on grapheme cluster
/// boundaries using libunicode. The caller owns the input loop; this class only
/// reacts to keystrokes and paints itself.
///
/// Completion: the first completion key runs the provider. A single candidate is
/// inserted; several candidates insert their common prefix and are published
/// through takeNewCompletions(). Pressing the completion key again while the list
/// is shown requests a roll of the list instead. Edits made while the list is
/// shown re-run the provider so the list follows the text.
class InputLine
{
  public:
    /// @brief Starts a question.
    /// @param question Text displayed in front of the input.
    /// @param defaultValue Initial text; the cursor is placed at its end.
    /// @param provider Completion provider, may be empty.
    void activate(std::string question, std::string_view defaultValue, CompletionProvider provider);

    /// @brief Ends the question and drops its completion state. History is kept.
    void deactivate();

    [[nodiscard]] auto active() const noexcept -> bool;

    /// @brief Processes one keystroke.
    [[nodiscard]] auto processKey(KeyEvent const& key) -> InputLineAction;

    /// @brief Returns the final value, or std::nullopt if the question was cancelled.
    [[nodiscard]] auto value() const -> std::optional<std::string>;

    [[nodiscard]] auto text() const noexcept -> std::string_view;

    /// @brief Returns the cursor position as a byte offset into text().
    [[nodiscard]] auto cursor() const noexcept -> std::size_t;

    [[nodiscard]] auto question() const noexcept -> std::string_view;

    /// @brief Replaces the text and moves the cursor to its end.
    void setText(std::string_view text);

    /// @brief Returns the candidates of the last completion run.
    [[nodiscard]] auto completions() const noexcept -> std::vector<Completion> const&;

    /// @brief Returns true once after the candidate list changed.
    [[nodiscard]] auto takeNewCompletions() -> bool;

    /// @brief Returns true once after the user asked to cycle the shown candidates.
    [[nodiscard]] auto takeRollCompletions() -> bool;

    /// @brief Sets the keystroke that cancels the question.
    void setCancelKey(KeyEvent key);

    /// @brief Adds an entry to the history ring.
    void addHistory(std::string entry);

    /// @brief Sets the maximum number of history entries to retain.
    void setMaxHistory(std::size_t n);

    [[nodiscard]] auto history() const noexcept -> std::vector<std::string> const&;

    /// @brief Paints the question and the visible part of the text on a screen row.
    void paint(Surface& surface, int row, Style const& style);

    /// @brief Moves the hardware cursor to the text cursor on the given row.
    void positionCursor(Surface& surface, int row) const;

  private:
    std::string _buffer;
    std::size_t _cursor = 0;
    std::string _question;
    bool _active = false;
    bool _cancelled = false;
    KeyEvent _cancelKey = ctrlKey('g');

    // Completion
    CompletionProvider _provider;
    std::vector<Completion> _completions;
    bool _completionsShown = false;
    bool _newCompletions = false;
    bool _rollCompletions = false;
    bool _lastWasComplete = false;

    // History
    std::vector<std::string> _history;
    std::size_t _historyIndex = 0;
    std::string _savedLine;
    std::size_t _maxHistory = 100;

    // Kill ring (Emacs-style)
    std::vector<std::string> _killRing;
    std::size_t _killRingIndex = 0;
    static constexpr std::size_t MaxKillRing = 16;
    bool _lastWasKill = false;

    int _scrollOffset = 0; ///< First visible column when the text is wider than the row.

    [[nodiscard]] auto handleEdit(KeyEvent const& key) -> InputLineAction;
    void complete();
    void refreshCompletions();

    void killToEnd();
    void killToStart();
    void killWord();
    void killWordBackward();
    void yank();
    void yankPop();
    void deleteChar();
    void deleteCharBackward();
    void moveForwardChar();
    void moveBackwardChar();
    void moveForwardWord();
    void moveBackwardWord();
    void historyPrev();
    void historyNext();
    void transpose();
    void pushKillRing(std::string text);
    void insertText(std::string_view text);

    [[nodiscard]] auto countColumns(std::size_t start, std::size_t end) const -> int;
    [[nodiscard]] auto byteOffsetOfColumn(int column) const -> std::size_t;
    [[nodiscard]] auto nextGraphemeCluster(std::size_t pos) const -> std::size_t;
    [[nodiscard]] auto prevGraphemeCluster(std::size_t pos) const -> std::size_t;
    [[nodiscard]] static auto isWordCharAt(char c) -> bool;
};

/// @brief Returns the longest common prefix of all candidate values.
[[nodiscard]] auto commonPrefix(std::vector<Completion> const& candidates) -> std::string;

} // namespace bufstack::tui
