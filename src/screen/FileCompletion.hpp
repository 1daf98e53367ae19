// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/InputLine.hpp>

#include <string_view>
#include <vector>

namespace bufstack
{

namespace os
{
    class Accounts;
    class FileSystem;
} // namespace os

/// @brief Completes filenames and "~user" home directory references.
///
/// A "~name" in the text (name may be empty, meaning the login user) is
/// replaced by that user's home directory when the account exists; otherwise
/// every account name starting with name is offered. Any other text is
/// completed against the file system, with a trailing '/' on directories.
[[nodiscard]] auto completeFilename(std::string_view text, os::FileSystem const& fileSystem, os::Accounts& accounts)
    -> std::vector<tui::Completion>;

/// @brief Binds completeFilename() to its collaborators. Both must outlive the provider.
[[nodiscard]] auto makeFilenameCompleter(os::FileSystem const& fileSystem, os::Accounts& accounts)
    -> tui::CompletionProvider;

} // namespace bufstack
