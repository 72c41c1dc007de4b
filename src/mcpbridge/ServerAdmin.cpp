// SPDX-License-Identifier: Apache-2.0
#include "ServerAdmin.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>

namespace mcpbridge
{

ServerAdmin::ServerAdmin(std::filesystem::path configPath, ConnectionRegistry& registry, const UsageLog& usageLog):
    _configPath(std::move(configPath)), _registry(registry), _usageLog(usageLog)
{
}

auto ServerAdmin::listServers() const -> Result<std::vector<ServerStatus>>
{
    auto config = [this] {
        auto lock = std::lock_guard(_configMutex);
        return loadConfigOrDefaults(_configPath.string());
    }();
    if (!config)
        return std::unexpected(config.error());

    auto const connected = _registry.connectedNames();

    auto servers = std::vector<ServerStatus> {};
    for (auto& server: config->servers)
    {
        auto const isConnected = std::ranges::find(connected, server.name) != connected.end();
        servers.push_back(ServerStatus { .descriptor = std::move(server), .connected = isConnected });
    }
    return servers;
}

auto ServerAdmin::addServer(ServerDescriptor server) -> Result<ServerDescriptor>
{
    auto lock = std::lock_guard(_configMutex);

    auto config = loadConfigOrDefaults(_configPath.string());
    if (!config)
        return std::unexpected(config.error());

    auto added = server;
    if (auto result = mcpbridge::addServer(*config, std::move(server)); !result)
        return std::unexpected(result.error());

    if (auto saved = saveConfigToFile(_configPath.string(), *config); !saved)
        return std::unexpected(saved.error());

    log::info("Added MCP server '{}'", added.name);
    return added;
}

auto ServerAdmin::removeServer(std::string_view name) -> Result<ServerDescriptor>
{
    auto lock = std::lock_guard(_configMutex);

    auto config = loadConfigOrDefaults(_configPath.string());
    if (!config)
        return std::unexpected(config.error());

    auto removed = mcpbridge::removeServer(*config, name);
    if (!removed)
        return std::unexpected(removed.error());

    if (auto saved = saveConfigToFile(_configPath.string(), *config); !saved)
        return std::unexpected(saved.error());

    log::info("Removed MCP server '{}'", name);
    return removed;
}

auto ServerAdmin::updateServer(std::string_view name, const ServerUpdate& update) -> Result<ServerDescriptor>
{
    auto lock = std::lock_guard(_configMutex);

    auto config = loadConfigOrDefaults(_configPath.string());
    if (!config)
        return std::unexpected(config.error());

    auto updated = mcpbridge::updateServer(*config, name, update);
    if (!updated)
        return std::unexpected(updated.error());

    if (auto saved = saveConfigToFile(_configPath.string(), *config); !saved)
        return std::unexpected(saved.error());

    log::info("Updated MCP server '{}'", name);
    return updated;
}

auto ServerAdmin::reload() -> Result<std::vector<std::string>>
{
    log::info("Reloading MCP servers from {}", _configPath.string());
    _registry.shutdownAll();

    auto config = [this] {
        auto lock = std::lock_guard(_configMutex);
        return loadConfigOrDefaults(_configPath.string());
    }();
    if (!config)
        return std::unexpected(config.error());

    _registry.connectAll(enabledServers(*config));

    auto connected = _registry.connectedNames();
    log::info("Reconnected to {} MCP server(s)", connected.size());
    return connected;
}

auto ServerAdmin::logs(const UsageQuery& query) const -> Result<UsagePage>
{
    return _usageLog.query(query);
}

auto toJson(const ServerStatus& status) -> nlohmann::json
{
    auto obj = toJson(status.descriptor);
    obj["connected"] = status.connected;
    return obj;
}

} // namespace mcpbridge
