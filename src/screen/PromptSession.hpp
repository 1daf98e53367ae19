// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <screen/Modal.hpp>
#include <tui/InputLine.hpp>
#include <tui/Key.hpp>

#include <functional>
#include <map>
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
    class Theme;
} // namespace tui

class Buffer;
class CompletionView;

/// @brief Drives question/answer sessions on the bottom row of the screen.
///
/// Every semantic domain ("filename", "search", ...) keeps its own input line,
/// so text history survives between questions of the same kind. Only one
/// session runs at a time: starting a second one while a question is pending
/// is a caller bug and fails with ErrorCode::PromptActive.
class PromptSession
{
  public:
    PromptSession(LoopContext context, tui::Theme const& theme, os::FileSystem const& fileSystem, os::Accounts& accounts);

    /// @brief Asks a question and blocks until it is answered or cancelled.
    ///
    /// While the user types, candidates from @p provider are shown in a
    /// "<completions>" buffer that is replaced whenever they change.
    ///
    /// @return The answer, or std::nullopt if the cancel key was hit.
    [[nodiscard]] auto ask(std::string_view domain,
                           std::string_view question,
                           std::string_view defaultValue = {},
                           tui::CompletionProvider provider = {}) -> Result<std::optional<std::string>>;

    /// @brief Asks for a path with filename completion.
    ///
    /// An empty answer or a directory opens a file browser whose selection is
    /// returned instead. A cancelled question yields an empty list.
    [[nodiscard]] auto askForFilenames(std::string_view domain,
                                       std::string_view question,
                                       std::string_view defaultValue = {}) -> Result<std::vector<std::string>>;

    /// @brief Flashes @p question and waits for a single keystroke. The flash is gone on return.
    /// @param accept Characters that end the wait; empty means any key does.
    /// @return The keystroke, or std::nullopt if the cancel key was hit.
    [[nodiscard]] auto askGetch(std::string_view question, std::string_view accept = {})
        -> Result<std::optional<tui::KeyEvent>>;

    /// @brief y/Y yields true, n/N false, the cancel key std::nullopt.
    [[nodiscard]] auto askYesOrNo(std::string_view question) -> Result<std::optional<bool>>;

    [[nodiscard]] auto active() const noexcept -> bool { return _active; }

    /// @brief Returns the input line of a domain, or nullptr if it was never asked.
    [[nodiscard]] auto inputLine(std::string_view domain) const -> tui::InputLine const*;

  private:
    [[nodiscard]] auto inputLineFor(std::string_view domain) -> tui::InputLine&;
    [[nodiscard]] auto rejectNested(std::string_view what) const -> std::unexpected<Error>;
    void paintPrompt(tui::InputLine& line);
    void showCompletions(tui::InputLine& line);
    void killCompletions();

    LoopContext _context;
    tui::Theme const& _theme;
    os::FileSystem const& _fileSystem;
    os::Accounts& _accounts;
    std::map<std::string, tui::InputLine, std::less<>> _inputLines;
    Buffer* _completionBuffer = nullptr;
    CompletionView* _completionView = nullptr;
    bool _active = false;
};

} // namespace bufstack
