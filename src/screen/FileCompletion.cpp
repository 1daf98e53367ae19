// SPDX-License-Identifier: Apache-2.0
#include "FileCompletion.hpp"

#include <os/Accounts.hpp>
#include <os/FileSystem.hpp>

#include <format>
#include <optional>
#include <string>

namespace bufstack
{

namespace
{
    struct TildeReference
    {
        std::size_t start = 0;  ///< Offset of the '~'.
        std::size_t length = 0; ///< Length including the '~'.
        std::string_view name;
    };

    /// @brief Finds the first "~name" where name runs up to whitespace or '/'.
    auto findTilde(std::string_view text) -> std::optional<TildeReference>
    {
        auto const start = text.find('~');
        if (start == std::string_view::npos)
            return std::nullopt;

        auto end = start + 1;
        while (end < text.size() && text[end] != '/' && text[end] != ' ' && text[end] != '\t')
            ++end;

        return TildeReference { .start = start, .length = end - start, .name = text.substr(start + 1, end - start - 1) };
    }

    auto replaced(std::string_view text, std::size_t start, std::size_t length, std::string_view replacement)
        -> std::string
    {
        auto result = std::string(text);
        result.replace(start, length, replacement);
        return result;
    }

    auto basename(std::string_view path) -> std::string_view
    {
        auto const slash = path.rfind('/');
        return slash == std::string_view::npos ? path : path.substr(slash + 1);
    }
} // namespace

auto completeFilename(std::string_view text, os::FileSystem const& fileSystem, os::Accounts& accounts)
    -> std::vector<tui::Completion>
{
    auto result = std::vector<tui::Completion> {};

    if (auto const tilde = findTilde(text))
    {
        auto const name = tilde->name.empty() ? accounts.loginName() : std::string(tilde->name);
        if (auto const home = accounts.homeDirectory(name))
        {
            result.push_back(tui::Completion {
                .value = replaced(text, tilde->start, tilde->length, *home),
                .label = std::format("~{}", name),
            });
            return result;
        }

        for (auto const& account: accounts.names())
        {
            if (!account.starts_with(name))
                continue;
            auto const reference = std::format("~{}", account);
            result.push_back(tui::Completion {
                .value = replaced(text, tilde->start, tilde->length, reference),
                .label = reference,
            });
        }
        return result;
    }

    for (auto const& path: fileSystem.listPrefix(text))
    {
        auto const suffix = fileSystem.isDirectory(path) ? "/" : "";
        result.push_back(tui::Completion {
            .value = std::format("{}{}", path, suffix),
            .label = std::format("{}{}", basename(path), suffix),
        });
    }
    return result;
}

auto makeFilenameCompleter(os::FileSystem const& fileSystem, os::Accounts& accounts) -> tui::CompletionProvider
{
    return [&fileSystem, &accounts](std::string_view text) {
        return completeFilename(text, fileSystem, accounts);
    };
}

} // namespace bufstack
