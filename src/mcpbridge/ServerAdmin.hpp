// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/ConnectionRegistry.hpp>
#include <mcpbridge/Config.hpp>
#include <mcpbridge/UsageLog.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mcpbridge
{

/// @brief A configured server together with its live connection status.
struct ServerStatus
{
    ServerDescriptor descriptor;
    bool connected = false;
};

/// @brief Management operations of a running bridge, backed by its config file.
///
/// Edits are written to the config file immediately and take effect on the
/// running backends with the next reload(). Config edits are serialized.
class ServerAdmin
{
  public:
    ServerAdmin(std::filesystem::path configPath, ConnectionRegistry& registry, const UsageLog& usageLog);

    /// @brief Returns every configured server, flagged with whether it is currently connected.
    [[nodiscard]] auto listServers() const -> Result<std::vector<ServerStatus>>;

    /// @brief Adds a server to the config file.
    [[nodiscard]] auto addServer(ServerDescriptor server) -> Result<ServerDescriptor>;

    /// @brief Removes a server from the config file.
    [[nodiscard]] auto removeServer(std::string_view name) -> Result<ServerDescriptor>;

    /// @brief Changes a server in the config file.
    [[nodiscard]] auto updateServer(std::string_view name, const ServerUpdate& update) -> Result<ServerDescriptor>;

    /// @brief Shuts down every backend, re-reads the config file and connects its enabled servers.
    /// @return The names connected afterwards, or the config error (all backends are then down).
    [[nodiscard]] auto reload() -> Result<std::vector<std::string>>;

    /// @brief Queries the tool usage log.
    [[nodiscard]] auto logs(const UsageQuery& query) const -> Result<UsagePage>;

  private:
    std::filesystem::path _configPath;
    ConnectionRegistry& _registry;
    const UsageLog& _usageLog;
    mutable std::mutex _configMutex;
};

/// @brief Converts a server status to its API representation (the descriptor plus "connected").
[[nodiscard]] auto toJson(const ServerStatus& status) -> nlohmann::json;

} // namespace mcpbridge
