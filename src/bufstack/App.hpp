// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <bufstack/Config.hpp>
#include <core/Error.hpp>

#include <memory>

namespace bufstack
{

/// @brief The demo application: a home buffer plus text file buffers on one terminal.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Opens the log file, takes over the terminal and spawns the home buffer.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs the main interactive loop.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace bufstack
