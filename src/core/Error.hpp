// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>

namespace bufstack
{

/// @brief Error codes for categorizing failures across the screen layer.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    NotOnStack,     ///< A buffer operation named a buffer that is not on the stack.
    DuplicateTitle, ///< A title was registered twice.
    PromptActive,   ///< A prompt session was started while another one is active.
    ProcessError,
};

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

/// @brief Returns a short name for an error code, used in log lines.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid-argument";
        case ErrorCode::IoError: return "io";
        case ErrorCode::ConfigError: return "config";
        case ErrorCode::NotOnStack: return "not-on-stack";
        case ErrorCode::DuplicateTitle: return "duplicate-title";
        case ErrorCode::PromptActive: return "prompt-active";
        case ErrorCode::ProcessError: return "process";
    }
    return "unknown";
}

} // namespace bufstack

template <>
struct std::formatter<bufstack::Error>: std::formatter<std::string>
{
    auto format(const bufstack::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", bufstack::errorCodeName(error.code), error.message), ctx);
    }
};
