// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace mcpbridge
{

/// @brief Error codes for categorizing failures across the bridge.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    InvalidState,
    IoError,
    ConfigError,
    ProtocolError,

    // Backend connection failures.
    SpawnFailure,
    HandshakeFailure,
    Timeout,
    ConnectionClosed,
    BackendCallFailure,
    MalformedLine,

    // Registry / routing failures.
    InvalidToolName,
    InvalidBackendName,
    BackendNotFound,
    DuplicateBackend,
};

/// @brief Returns a stable, human-readable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::SpawnFailure: return "SpawnFailure";
        case ErrorCode::HandshakeFailure: return "HandshakeFailure";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::ConnectionClosed: return "ConnectionClosed";
        case ErrorCode::BackendCallFailure: return "BackendCallFailure";
        case ErrorCode::MalformedLine: return "MalformedLine";
        case ErrorCode::InvalidToolName: return "InvalidToolName";
        case ErrorCode::InvalidBackendName: return "InvalidBackendName";
        case ErrorCode::BackendNotFound: return "BackendNotFound";
        case ErrorCode::DuplicateBackend: return "DuplicateBackend";
    }
    return "Unknown";
}

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

} // namespace mcpbridge

template <>
struct std::formatter<mcpbridge::Error>: std::formatter<std::string>
{
    auto format(const mcpbridge::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", mcpbridge::errorCodeName(error.code), error.message), ctx);
    }
};
