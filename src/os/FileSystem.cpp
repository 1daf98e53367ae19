// SPDX-License-Identifier: Apache-2.0
#include "FileSystem.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <filesystem>
#include <format>

namespace fs = std::filesystem;

namespace bufstack::os
{

auto joinPath(std::string_view directory, std::string_view name) -> std::string
{
    if (directory.empty())
        return std::string(name);
    if (directory.ends_with('/'))
        return std::format("{}{}", directory, name);
    return std::format("{}/{}", directory, name);
}

auto LocalFileSystem::listPrefix(std::string_view prefix) const -> std::vector<std::string>
{
    auto const slash = prefix.rfind('/');
    auto const head = slash == std::string_view::npos ? std::string_view {} : prefix.substr(0, slash + 1);
    auto const tail = slash == std::string_view::npos ? prefix : prefix.substr(slash + 1);
    auto const scanDir = head.empty() ? fs::path(".") : fs::path(std::string(head));
    auto const showHidden = tail.starts_with('.');

    auto result = std::vector<std::string> {};
    auto ec = std::error_code {};
    for (auto it = fs::directory_iterator(scanDir, ec); !ec && it != fs::directory_iterator(); it.increment(ec))
    {
        auto const name = it->path().filename().string();
        if (!name.starts_with(tail))
            continue;
        if (name.starts_with('.') && !showHidden)
            continue;
        result.push_back(std::format("{}{}", head, name));
    }
    if (ec)
        log::debug("Cannot list '{}': {}", scanDir.string(), ec.message());

    std::ranges::sort(result);
    return result;
}

auto LocalFileSystem::isDirectory(std::string_view path) const -> bool
{
    auto ec = std::error_code {};
    return fs::is_directory(fs::path(std::string(path)), ec);
}

auto LocalFileSystem::listDirectory(std::string_view path) const -> Result<std::vector<DirectoryEntry>>
{
    auto entries = std::vector<DirectoryEntry> {};
    auto ec = std::error_code {};
    auto it = fs::directory_iterator(fs::path(std::string(path)), ec);
    if (ec)
        return makeError(ErrorCode::IoError, std::format("Cannot open directory '{}': {}", path, ec.message()));

    for (; it != fs::directory_iterator(); it.increment(ec))
    {
        if (ec)
            return makeError(ErrorCode::IoError, std::format("Cannot read directory '{}': {}", path, ec.message()));
        auto dirEc = std::error_code {};
        entries.push_back(DirectoryEntry {
            .name = it->path().filename().string(),
            .directory = it->is_directory(dirEc),
        });
    }

    std::ranges::sort(entries, [](DirectoryEntry const& a, DirectoryEntry const& b) {
        if (a.directory != b.directory)
            return a.directory;
        return a.name < b.name;
    });
    return entries;
}

auto LocalFileSystem::currentDirectory() const -> std::string
{
    auto ec = std::error_code {};
    auto cwd = fs::current_path(ec);
    if (ec)
        return ".";
    return cwd.string();
}

} // namespace bufstack::os
