// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ConnectionRegistry.hpp>
#include <mcp/JsonRpc.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace mcpbridge
{

/// @brief Outcome of one routed tools/call, reported to the optional observer.
struct ToolCallRecord
{
    std::string namespacedName;
    nlohmann::json arguments;
    std::chrono::milliseconds duration {};
    std::optional<Error> error; // Empty on success.
};

/// @brief Receives a record for every tools/call the router forwards.
using ToolCallObserver = std::function<void(const ToolCallRecord&)>;

/// @brief Translates the bridge's unified request surface into registry operations.
///
/// Answers handshake and ping locally; forwards tools/list and tools/call to
/// the registry. Holds no state of its own besides the registry reference and
/// the observer.
class Router
{
  public:
    explicit Router(ConnectionRegistry& registry, ToolCallObserver observer = {});

    /// @brief Handles one parsed request and returns the JSON-RPC response object.
    ///
    /// A response is produced for notifications too; the front-end decides whether to send it.
    [[nodiscard]] auto handleRequest(const jsonrpc::Request& request) -> nlohmann::json;

    /// @brief Parses and handles one raw JSON value.
    /// @return The response, ParseError/InvalidRequest responses for malformed input,
    ///         or std::nullopt for a well-formed notification.
    [[nodiscard]] auto handleMessage(const nlohmann::json& message) -> std::optional<nlohmann::json>;

    /// @brief Parses and handles one raw line of text (see handleMessage()).
    [[nodiscard]] auto handleLine(std::string_view line) -> std::optional<nlohmann::json>;

  private:
    [[nodiscard]] auto handleToolsCall(const nlohmann::json& id, const std::optional<nlohmann::json>& params)
        -> nlohmann::json;

    ConnectionRegistry& _registry;
    ToolCallObserver _observer;
};

} // namespace mcpbridge
