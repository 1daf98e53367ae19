// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <string_view>

namespace bufstack::os
{

/// @brief Runs a command line through /bin/sh and waits for it to finish.
///
/// The child inherits the controlling terminal. The caller is responsible for
/// handing the terminal over first (see Surface::suspend()).
///
/// @return The child's exit status, or 128 + signal number if it was killed.
[[nodiscard]] auto runShellCommand(std::string_view command) -> Result<int>;

} // namespace bufstack::os
