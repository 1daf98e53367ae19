// SPDX-License-Identifier: Apache-2.0
#include "Shell.hpp"

#include <core/Log.hpp>

#include <cerrno>
#include <cstring>
#include <format>
#include <string>

#include <sys/wait.h>

#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace bufstack::os
{

auto runShellCommand(std::string_view command) -> Result<int>
{
    auto shell = std::string("/bin/sh");
    auto flag = std::string("-c");
    auto commandCopy = std::string(command);
    char* argv[] = { shell.data(), flag.data(), commandCopy.data(), nullptr };

    pid_t pid;
    auto const status = posix_spawn(&pid, shell.c_str(), nullptr, nullptr, argv, environ);
    if (status != 0)
        return makeError(ErrorCode::ProcessError,
                         std::format("Failed to spawn '{}': {}", command, std::strerror(status)));

    log::debug("Spawned shell command (pid {}): {}", pid, command);

    auto waitStatus = 0;
    while (::waitpid(pid, &waitStatus, 0) < 0)
    {
        if (errno != EINTR)
            return makeError(ErrorCode::ProcessError,
                             std::format("waitpid failed for '{}': {}", command, std::strerror(errno)));
    }

    if (WIFEXITED(waitStatus))
        return WEXITSTATUS(waitStatus);
    if (WIFSIGNALED(waitStatus))
        return 128 + WTERMSIG(waitStatus);
    return 0;
}

} // namespace bufstack::os
