// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/Key.hpp>

#include <cstddef>

namespace bufstack
{

/// @brief Tunables of the screen layer's input loops.
struct ScreenConfig
{
    /// @brief Timeout of every input poll; a quiet poll is "no event yet", never an error.
    int pollTimeoutMs = 1000;

    /// @brief The keystroke that terminates modal loops, prompts and single-key questions.
    tui::KeyEvent cancelKey = tui::ctrlKey('g');

    /// @brief Height of the completion list buffer.
    int completionRows = 10;

    /// @brief Number of history entries kept per prompt domain.
    std::size_t historySize = 100;
};

} // namespace bufstack
