// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bufstack::os
{

/// @brief Read access to the local user account database.
class Accounts
{
  public:
    virtual ~Accounts() = default;

    /// @brief Returns the name of the user running the process, or an empty string if unknown.
    [[nodiscard]] virtual auto loginName() const -> std::string = 0;

    /// @brief Returns the home directory of the named user, or std::nullopt if no such user exists.
    [[nodiscard]] virtual auto homeDirectory(std::string_view name) const -> std::optional<std::string> = 0;

    /// @brief Returns all account names, in database order.
    [[nodiscard]] virtual auto names() -> std::vector<std::string> const& = 0;
};

/// @brief Accounts backed by getpwnam(3)/getpwent(3).
///
/// The account list is read once on first use and cached for the lifetime of the object.
class PosixAccounts final: public Accounts
{
  public:
    [[nodiscard]] auto loginName() const -> std::string override;
    [[nodiscard]] auto homeDirectory(std::string_view name) const -> std::optional<std::string> override;
    [[nodiscard]] auto names() -> std::vector<std::string> const& override;

  private:
    std::optional<std::vector<std::string>> _names;
};

} // namespace bufstack::os
