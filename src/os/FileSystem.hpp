// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace bufstack::os
{

/// @brief A directory entry as seen by the file browser.
struct DirectoryEntry
{
    std::string name;
    bool directory = false;
};

/// @brief The slice of the file system the prompts need.
class FileSystem
{
  public:
    virtual ~FileSystem() = default;

    /// @brief Returns every path that starts with the given text, sorted.
    ///
    /// The text is split at its last '/': the head names the directory to
    /// scan, the tail is the name prefix. Hidden entries are only listed when
    /// the name prefix itself starts with '.'.
    [[nodiscard]] virtual auto listPrefix(std::string_view prefix) const -> std::vector<std::string> = 0;

    [[nodiscard]] virtual auto isDirectory(std::string_view path) const -> bool = 0;

    /// @brief Lists a directory, directories first, each group sorted by name.
    [[nodiscard]] virtual auto listDirectory(std::string_view path) const
        -> Result<std::vector<DirectoryEntry>> = 0;

    /// @brief Returns the current working directory.
    [[nodiscard]] virtual auto currentDirectory() const -> std::string = 0;
};

/// @brief FileSystem backed by std::filesystem.
class LocalFileSystem final: public FileSystem
{
  public:
    [[nodiscard]] auto listPrefix(std::string_view prefix) const -> std::vector<std::string> override;
    [[nodiscard]] auto isDirectory(std::string_view path) const -> bool override;
    [[nodiscard]] auto listDirectory(std::string_view path) const -> Result<std::vector<DirectoryEntry>> override;
    [[nodiscard]] auto currentDirectory() const -> std::string override;
};

/// @brief Joins a directory and an entry name with exactly one '/' between them.
[[nodiscard]] auto joinPath(std::string_view directory, std::string_view name) -> std::string;

} // namespace bufstack::os
