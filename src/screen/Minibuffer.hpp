// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bufstack
{

/// @brief Stable identifier of a status line in the minibuffer.
enum class StatusHandle : std::size_t
{
};

/// @brief Composes the minibuffer from a flash message, the prompt row and the status lines.
///
/// Status lines live in numbered slots. A new line takes the slot after the
/// highest one in use, so handles stay stable while other lines come and go.
/// Clearing a slot in the middle leaves a hole; clearing the highest slot
/// shrinks the slot range down to the next line still in use.
///
/// Layout, top to bottom: the flash message, the status lines from the highest
/// slot down to slot 0, then the prompt row. Slot 0 thus sits right above the
/// prompt row. If neither a prompt nor any line is present, a single blank line
/// is shown.
///
/// All members are thread-safe. When both are needed, take the compositor's
/// paint lock before calling into the minibuffer.
class Minibuffer
{
  public:
    /// @brief Adds a status line in the next free slot.
    [[nodiscard]] auto say(std::string text) -> StatusHandle;

    /// @brief Replaces (or creates) the status line in the given slot.
    void say(StatusHandle handle, std::string text);

    /// @brief Removes a status line. Unknown handles are ignored.
    void clear(StatusHandle handle);

    /// @brief Sets the transient flash message.
    void flash(std::string text);

    /// @brief Drops the flash message.
    void eraseFlash();

    [[nodiscard]] auto flashText() const -> std::optional<std::string>;

    void setPromptActive(bool active);
    [[nodiscard]] auto promptActive() const -> bool;

    /// @brief Returns max(1, flash + prompt + number of status lines).
    [[nodiscard]] auto lineCount() const -> int;

    /// @brief Returns the text rows above the prompt row, top to bottom.
    [[nodiscard]] auto lines() const -> std::vector<std::string>;

    /// @brief Returns the slot sequence, holes included, up to the highest slot in use.
    [[nodiscard]] auto slots() const -> std::vector<std::optional<std::string>>;

  private:
    mutable std::mutex _mutex;
    std::optional<std::string> _flash;
    bool _promptActive = false;
    std::map<std::size_t, std::string> _status;
    std::size_t _nextSlot = 0;
};

} // namespace bufstack
