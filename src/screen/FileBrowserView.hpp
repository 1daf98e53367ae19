// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <os/FileSystem.hpp>
#include <screen/View.hpp>

#include <optional>
#include <string>
#include <vector>

namespace bufstack
{

/// @brief A modal directory browser whose value is the list of chosen paths.
///
/// Enter on a directory descends into it, Enter on a file finishes the
/// browser. Space tags and untags files; if any file is tagged when the
/// browser finishes, the tagged files (in tagging order) are the result,
/// otherwise the file under the cursor is. Cancelling yields an empty list.
class FileBrowserView final: public ModalView<std::vector<std::string>>
{
  public:
    FileBrowserView(os::FileSystem const& fileSystem, std::string directory);

    void draw(Buffer& buffer) override;
    void resize(int rows, int cols) override;
    [[nodiscard]] auto handleInput(tui::KeyEvent const& key) -> bool override;
    [[nodiscard]] auto name() const -> std::string override { return "file-browser"; }
    [[nodiscard]] auto status() const -> std::string override;

    [[nodiscard]] auto done() const -> bool override { return _done; }
    [[nodiscard]] auto value() -> std::vector<std::string> override;

    [[nodiscard]] auto directory() const noexcept -> std::string const& { return _directory; }
    [[nodiscard]] auto cursor() const noexcept -> std::size_t { return _cursor; }
    [[nodiscard]] auto entries() const noexcept -> std::vector<os::DirectoryEntry> const& { return _entries; }
    [[nodiscard]] auto tagged() const noexcept -> std::vector<std::string> const& { return _tagged; }

  private:
    void load(std::string directory);
    void moveCursor(long delta);
    void activate();
    void toggleTag();
    [[nodiscard]] auto pathOf(os::DirectoryEntry const& entry) const -> std::string;
    [[nodiscard]] auto isTagged(std::string const& path) const -> bool;

    os::FileSystem const& _fileSystem;
    std::string _directory;
    std::vector<os::DirectoryEntry> _entries;
    std::optional<std::string> _loadError;
    std::vector<std::string> _tagged;
    std::vector<std::string> _value;
    std::size_t _cursor = 0;
    int _topRow = 0;
    int _contentRows = 1;
    bool _done = false;
};

} // namespace bufstack
