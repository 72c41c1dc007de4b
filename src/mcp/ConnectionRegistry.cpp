// SPDX-License-Identifier: Apache-2.0
#include "ConnectionRegistry.hpp"

#include <core/Log.hpp>
#include <mcp/Protocol.hpp>

#include <algorithm>
#include <format>
#include <mutex>

namespace mcpbridge
{

ConnectionRegistry::ConnectionRegistry(ConnectionOptions options):
    ConnectionRegistry(options, [](const ServerDescriptor& descriptor, const ConnectionOptions& connectionOptions) {
        return BackendConnection::spawn(descriptor, connectionOptions);
    })
{
}

ConnectionRegistry::ConnectionRegistry(ConnectionOptions options, ConnectionFactory factory):
    _options(options), _factory(std::move(factory))
{
}

ConnectionRegistry::~ConnectionRegistry()
{
    shutdownAll();
}

void ConnectionRegistry::connectAll(const std::vector<ServerDescriptor>& descriptors)
{
    for (const auto& descriptor: descriptors)
    {
        if (!descriptor.enabled)
        {
            log::debug("Skipping disabled MCP server '{}'", descriptor.name);
            continue;
        }

        if (auto result = connect(descriptor); !result)
            log::error("Failed to connect to '{}': {}", descriptor.name, result.error());
    }
}

auto ConnectionRegistry::connect(const ServerDescriptor& descriptor) -> VoidResult
{
    if (!protocol::isValidBackendName(descriptor.name))
        return makeError(ErrorCode::InvalidBackendName,
                         std::format("Invalid server name '{}': must be non-empty and must not contain '{}'",
                                     descriptor.name,
                                     protocol::NamespaceSeparator));

    pruneDisconnected();

    if (find(descriptor.name))
        return makeError(ErrorCode::DuplicateBackend,
                         std::format("MCP server '{}' is already connected", descriptor.name));

    log::info("Connecting to MCP server: {}", descriptor.name);

    auto connection = _factory(descriptor, _options);
    if (!connection)
        return std::unexpected(connection.error());

    // Any early return below destroys the connection, which terminates the process.
    auto initResult = (*connection)->initialize();
    if (!initResult)
        return std::unexpected(initResult.error());

    auto tools = (*connection)->listTools();
    if (!tools)
        return std::unexpected(tools.error());

    log::info("{} provides {} tools", descriptor.name, tools->size());

    auto shared = std::shared_ptr<BackendConnection>(std::move(*connection));
    {
        auto lock = std::unique_lock(_mutex);
        auto const [it, inserted] = _connections.try_emplace(descriptor.name, shared);
        if (inserted)
        {
            _order.push_back(descriptor.name);
            return {};
        }
    }

    shared->shutdown();
    return makeError(ErrorCode::DuplicateBackend,
                     std::format("MCP server '{}' is already connected", descriptor.name));
}

void ConnectionRegistry::disconnect(std::string_view name)
{
    auto connection = std::shared_ptr<BackendConnection> {};
    {
        auto lock = std::unique_lock(_mutex);
        auto const it = _connections.find(name);
        if (it == _connections.end())
            return;
        connection = std::move(it->second);
        _connections.erase(it);
        std::erase(_order, name);
    }

    log::info("Disconnecting from {}", name);
    connection->shutdown();
}

auto ConnectionRegistry::liveSnapshot() const -> std::vector<std::shared_ptr<BackendConnection>>
{
    auto lock = std::shared_lock(_mutex);
    auto snapshot = std::vector<std::shared_ptr<BackendConnection>> {};
    snapshot.reserve(_order.size());
    for (const auto& name: _order)
    {
        auto const& connection = _connections.find(name)->second;
        if (connection->isConnected())
            snapshot.push_back(connection);
    }
    return snapshot;
}

auto ConnectionRegistry::listAllTools() const -> std::vector<Tool>
{
    auto result = std::vector<Tool> {};
    for (const auto& connection: liveSnapshot())
    {
        auto const& backendName = connection->name();
        for (auto& tool: connection->tools())
        {
            result.push_back(Tool {
                .name = protocol::namespaceToolName(backendName, tool.name),
                .description = tool.description.transform(
                    [&](const std::string& description) { return std::format("[{}] {}", backendName, description); }),
                .inputSchema = std::move(tool.inputSchema),
            });
        }
    }
    return result;
}

auto ConnectionRegistry::callTool(std::string_view namespacedName, const nlohmann::json& arguments)
    -> Result<ToolCallResult>
{
    auto split = protocol::splitNamespacedToolName(namespacedName);
    if (!split)
        return std::unexpected(split.error());

    auto const& [backendName, toolName] = *split;

    auto connection = std::shared_ptr<BackendConnection> {};
    {
        auto lock = std::shared_lock(_mutex);
        if (auto const it = _connections.find(backendName); it != _connections.end())
            connection = it->second;
    }
    if (!connection)
        return makeError(ErrorCode::BackendNotFound, std::format("MCP server '{}' not connected", backendName));

    auto result = connection->callTool(toolName, arguments);
    if (!result && result.error().code == ErrorCode::ConnectionClosed)
        pruneDisconnected();
    return result;
}

auto ConnectionRegistry::find(std::string_view name) const -> std::shared_ptr<BackendConnection>
{
    auto lock = std::shared_lock(_mutex);
    auto const it = _connections.find(name);
    if (it == _connections.end() || !it->second->isConnected())
        return nullptr;
    return it->second;
}

auto ConnectionRegistry::connectedNames() const -> std::vector<std::string>
{
    auto names = std::vector<std::string> {};
    for (const auto& connection: liveSnapshot())
        names.push_back(connection->name());
    return names;
}

auto ConnectionRegistry::size() const -> size_t
{
    return liveSnapshot().size();
}

auto ConnectionRegistry::pruneDisconnected() -> std::vector<std::string>
{
    auto dead = std::vector<std::shared_ptr<BackendConnection>> {};
    {
        auto lock = std::unique_lock(_mutex);
        std::erase_if(_order, [&](const std::string& name) {
            auto const it = _connections.find(name);
            if (it->second->isConnected())
                return false;
            dead.push_back(std::move(it->second));
            _connections.erase(it);
            return true;
        });
    }

    auto names = std::vector<std::string> {};
    for (const auto& connection: dead)
    {
        log::warning("MCP server '{}' disconnected unexpectedly", connection->name());
        connection->shutdown();
        names.push_back(connection->name());
    }
    return names;
}

void ConnectionRegistry::shutdownAll()
{
    auto drained = std::vector<std::shared_ptr<BackendConnection>> {};
    {
        auto lock = std::unique_lock(_mutex);
        for (const auto& name: _order)
            drained.push_back(std::move(_connections[name]));
        _connections.clear();
        _order.clear();
    }

    for (const auto& connection: drained)
    {
        log::info("Shutting down {}", connection->name());
        connection->shutdown();
    }
}

} // namespace mcpbridge
