// SPDX-License-Identifier: Apache-2.0
#include "Router.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/Protocol.hpp>

#include <format>

namespace mcpbridge
{

using jsonrpc::ErrorCodes::InternalError;
using jsonrpc::ErrorCodes::InvalidParams;
using jsonrpc::ErrorCodes::InvalidRequest;
using jsonrpc::ErrorCodes::MethodNotFound;
using jsonrpc::ErrorCodes::ParseError;

Router::Router(ConnectionRegistry& registry, ToolCallObserver observer):
    _registry(registry), _observer(std::move(observer))
{
}

auto Router::handleRequest(const jsonrpc::Request& request) -> nlohmann::json
{
    auto const id = request.id.value_or(nullptr);
    auto const& method = request.method;

    if (method == protocol::Methods::Initialize)
        return jsonrpc::makeSuccessResponse(id, protocol::makeBridgeInitializeResult());

    if (method == protocol::Methods::Initialized || method == protocol::Methods::Ping)
        return jsonrpc::makeSuccessResponse(id, nlohmann::json::object());

    if (method == protocol::Methods::ToolsList)
        return jsonrpc::makeSuccessResponse(id, { { "tools", protocol::toJson(_registry.listAllTools()) } });

    if (method == protocol::Methods::ToolsCall)
        return handleToolsCall(id, request.params);

    return jsonrpc::makeErrorResponse(id, MethodNotFound, std::format("Method not found: {}", method));
}

auto Router::handleMessage(const nlohmann::json& message) -> std::optional<nlohmann::json>
{
    auto request = jsonrpc::parseRequest(message);
    if (!request)
    {
        auto const id = message.is_object() && message.contains("id") ? message["id"] : nlohmann::json(nullptr);
        return jsonrpc::makeErrorResponse(id, InvalidRequest, request.error().message);
    }

    auto response = handleRequest(*request);
    if (request->isNotification())
        return std::nullopt;
    return response;
}

auto Router::handleLine(std::string_view line) -> std::optional<nlohmann::json>
{
    auto message = json::parse(line);
    if (!message)
    {
        log::error("Failed to parse request: {}", message.error().message);
        return jsonrpc::makeErrorResponse(nullptr, ParseError, std::format("Parse error: {}", message.error().message));
    }
    return handleMessage(*message);
}

auto Router::handleToolsCall(const nlohmann::json& id, const std::optional<nlohmann::json>& params)
    -> nlohmann::json
{
    if (!params || !params->is_object())
        return jsonrpc::makeErrorResponse(id, InvalidParams, "Missing params for tools/call");

    auto name = json::getString(*params, "name");
    if (!name)
        return jsonrpc::makeErrorResponse(id, InvalidParams, "Missing 'name' in tools/call params");

    auto arguments = params->contains("arguments") && !(*params)["arguments"].is_null() ? (*params)["arguments"]
                                                                                         : nlohmann::json::object();
    if (!arguments.is_object())
        return jsonrpc::makeErrorResponse(id, InvalidParams, "'arguments' in tools/call params must be an object");

    auto const start = std::chrono::steady_clock::now();
    auto result = _registry.callTool(*name, arguments);
    auto const duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    if (_observer)
    {
        _observer(ToolCallRecord {
            .namespacedName = *name,
            .arguments = arguments,
            .duration = duration,
            .error = result ? std::nullopt : std::optional<Error> { result.error() },
        });
    }

    if (!result)
    {
        log::warning("tools/call '{}' failed: {}", *name, result.error());
        return jsonrpc::makeErrorResponse(id, InternalError, result.error().message);
    }

    return jsonrpc::makeSuccessResponse(id, protocol::toJson(*result));
}

} // namespace mcpbridge
