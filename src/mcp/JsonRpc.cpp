// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <format>

namespace mcpbridge::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeSuccessResponse(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "result", std::move(result) },
    };
}

auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error",
          {
              { "code", code },
              { "message", message },
          } },
    };
}

auto serialize(const nlohmann::json& message) -> std::string
{
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    if (message.contains("method"))
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message is a request, not a response");

    auto const hasResult = message.contains("result");
    auto const hasError = message.contains("error");
    if (hasResult == hasError)
        return makeError(ErrorCode::ProtocolError, "JSON-RPC response must carry exactly one of result or error");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (hasResult)
    {
        response.result = message["result"];
    }
    else
    {
        auto const& err = message["error"];
        if (!err.is_object())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC error member is not an object");

        response.error = RpcError {
            .code = err.contains("code") && err["code"].is_number_integer() ? err["code"].get<int>() : 0,
            .message = err.contains("message") && err["message"].is_string() ? err["message"].get<std::string>()
                                                                               : "Unknown error",
            .data = err.contains("data") ? err["data"] : nlohmann::json {},
        };
    }

    return response;
}

auto parseRequest(const nlohmann::json& message) -> Result<Request>
{
    if (!message.is_object())
        return makeError(ErrorCode::ProtocolError, "JSON-RPC request must be an object");

    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "JSON-RPC request must declare \"jsonrpc\": \"2.0\"");

    if (!message.contains("method") || !message["method"].is_string())
        return makeError(ErrorCode::ProtocolError, "JSON-RPC request is missing a string 'method'");

    auto request = Request {};
    request.method = message["method"].get<std::string>();

    if (message.contains("id"))
    {
        auto const& id = message["id"];
        if (!id.is_number_integer() && !id.is_string() && !id.is_null())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC id must be a number or string");
        request.id = id;
    }

    if (message.contains("params") && !message["params"].is_null())
        request.params = message["params"];

    return request;
}

} // namespace mcpbridge::jsonrpc
