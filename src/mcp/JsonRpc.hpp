// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mcpbridge::jsonrpc
{

/// @brief Standard JSON-RPC 2.0 error codes.
namespace ErrorCodes
{
    constexpr auto ParseError = -32700;
    constexpr auto InvalidRequest = -32600;
    constexpr auto MethodNotFound = -32601;
    constexpr auto InvalidParams = -32602;
    constexpr auto InternalError = -32603;
} // namespace ErrorCodes

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief Represents a parsed JSON-RPC 2.0 response.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }

    /// @brief Returns the numeric id, if the id is an integer.
    [[nodiscard]] auto numericId() const -> std::optional<int64_t>
    {
        if (id.is_number_integer())
            return id.get<int64_t>();
        return std::nullopt;
    }
};

/// @brief Represents a parsed JSON-RPC 2.0 request or notification.
struct Request
{
    std::optional<nlohmann::json> id; // Absent for notifications.
    std::string method;
    std::optional<nlohmann::json> params;

    /// @brief Returns true if this request carries no id and therefore expects no response.
    [[nodiscard]] auto isNotification() const -> bool { return !id.has_value(); }
};

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a success response echoing the given request id.
[[nodiscard]] auto makeSuccessResponse(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json;

/// @brief Builds an error response echoing the given request id (null if unknown).
[[nodiscard]] auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message)
    -> nlohmann::json;

/// @brief Serializes a message as one compact line.
///
/// Invalid UTF-8 inside strings (parser diagnostics may quote raw input bytes)
/// is replaced by U+FFFD instead of throwing.
[[nodiscard]] auto serialize(const nlohmann::json& message) -> std::string;

/// @brief Parses a JSON-RPC 2.0 response.
///
/// A well-formed response carries exactly one of "result" or "error".
/// @param message The JSON message to parse.
/// @return The parsed response or a ProtocolError.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

/// @brief Parses an incoming JSON-RPC 2.0 request or notification.
/// @param message The JSON message to parse.
/// @return The parsed request, or a ProtocolError if the message is not a valid
///         JSON-RPC 2.0 request object (including a missing or wrong "jsonrpc" member).
[[nodiscard]] auto parseRequest(const nlohmann::json& message) -> Result<Request>;

} // namespace mcpbridge::jsonrpc
