// SPDX-License-Identifier: Apache-2.0
#include "Accounts.hpp"

#include <core/Log.hpp>

#include <cstdlib>

#include <pwd.h>
#include <unistd.h>

namespace bufstack::os
{

auto PosixAccounts::loginName() const -> std::string
{
    if (auto const* name = ::getlogin(); name && *name)
        return name;
    if (auto const* pw = ::getpwuid(::getuid()); pw && pw->pw_name)
        return pw->pw_name;
    if (auto const* user = std::getenv("USER"); user)
        return user;
    return {};
}

auto PosixAccounts::homeDirectory(std::string_view name) const -> std::optional<std::string>
{
    if (name.empty())
        return std::nullopt;

    auto const key = std::string(name);
    auto const* pw = ::getpwnam(key.c_str());
    if (!pw || !pw->pw_dir)
        return std::nullopt;
    return std::string(pw->pw_dir);
}

auto PosixAccounts::names() -> std::vector<std::string> const&
{
    if (!_names)
    {
        auto list = std::vector<std::string> {};
        ::setpwent();
        while (auto const* pw = ::getpwent())
        {
            if (pw->pw_name)
                list.emplace_back(pw->pw_name);
        }
        ::endpwent();
        log::debug("Loaded {} user accounts", list.size());
        _names = std::move(list);
    }
    return *_names;
}

} // namespace bufstack::os
