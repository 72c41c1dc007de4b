// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mcpbridge::protocol
{

/// @brief Protocol revision spoken on both sides of the bridge.
constexpr auto ProtocolVersion = std::string_view { "2024-11-05" };

/// @brief Identity the bridge presents to backends and to its own clients.
constexpr auto BridgeName = std::string_view { "mcp-bridge" };
constexpr auto BridgeVersion = std::string_view { "0.1.0" };

/// @brief Separator between backend name and local tool name in a namespaced tool name.
constexpr auto NamespaceSeparator = std::string_view { "__" };

namespace Methods
{
    constexpr auto Initialize = std::string_view { "initialize" };
    constexpr auto Initialized = std::string_view { "notifications/initialized" };
    constexpr auto Cancelled = std::string_view { "notifications/cancelled" };
    constexpr auto ToolsList = std::string_view { "tools/list" };
    constexpr auto ToolsCall = std::string_view { "tools/call" };
    constexpr auto Ping = std::string_view { "ping" };
} // namespace Methods

/// @brief Builds "backend__tool".
[[nodiscard]] auto namespaceToolName(std::string_view backendName, std::string_view toolName) -> std::string;

/// @brief Splits a namespaced tool name at the first separator.
/// @return (backend, local tool), or InvalidToolName if no separator is present.
[[nodiscard]] auto splitNamespacedToolName(std::string_view namespacedName)
    -> Result<std::pair<std::string, std::string>>;

/// @brief Returns true if @p name can be used as a backend name without making tool names ambiguous.
[[nodiscard]] auto isValidBackendName(std::string_view name) -> bool;

/// @brief Params for the initialize request sent to every backend.
[[nodiscard]] auto makeInitializeParams() -> nlohmann::json;

/// @brief The initialize result the bridge answers its own clients with.
[[nodiscard]] auto makeBridgeInitializeResult() -> nlohmann::json;

/// @brief Validates and decodes an initialize result.
[[nodiscard]] auto parseInitializeResult(const nlohmann::json& result) -> Result<InitializeResult>;

/// @brief Validates and decodes a tools/list result ({tools:[...]}).
[[nodiscard]] auto parseToolsList(const nlohmann::json& result) -> Result<std::vector<Tool>>;

/// @brief Validates and decodes a tools/call result ({content:[...], isError?}).
[[nodiscard]] auto parseToolCallResult(const nlohmann::json& result) -> Result<ToolCallResult>;

[[nodiscard]] auto toJson(const Tool& tool) -> nlohmann::json;
[[nodiscard]] auto toJson(const std::vector<Tool>& tools) -> nlohmann::json;
[[nodiscard]] auto toJson(const ToolContent& content) -> nlohmann::json;
[[nodiscard]] auto toJson(const ToolCallResult& result) -> nlohmann::json;

} // namespace mcpbridge::protocol
