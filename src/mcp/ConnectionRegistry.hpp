// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/BackendConnection.hpp>

#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mcpbridge
{

/// @brief Creates the (not yet initialized) connection for a descriptor.
using ConnectionFactory =
    std::function<Result<std::unique_ptr<BackendConnection>>(const ServerDescriptor&, const ConnectionOptions&)>;

/// @brief Owns the set of live backend connections and routes namespaced tool calls to them.
///
/// The name -> connection map is guarded by a reader/writer lock. Lookups hold
/// the shared lock only long enough to copy out a connection handle and then
/// talk to that connection without the registry lock, so a slow backend never
/// blocks operations on another. Insert, remove and drain take the exclusive
/// lock for the structural change only; handshakes and shutdowns happen outside it.
///
/// A backend whose output stream has ended is no longer reported by the query
/// functions. It is unregistered and shut down by the next connect(), callTool()
/// or pruneDisconnected().
class ConnectionRegistry
{
  public:
    /// @brief Constructs a registry that spawns real backend processes.
    explicit ConnectionRegistry(ConnectionOptions options = {});

    /// @brief Constructs a registry that obtains connections from @p factory.
    ConnectionRegistry(ConnectionOptions options, ConnectionFactory factory);

    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /// @brief Connects every enabled descriptor. Failures are logged and skipped.
    void connectAll(const std::vector<ServerDescriptor>& descriptors);

    /// @brief Spawns, initializes and lists tools for one backend, then registers it.
    /// @return Success, or the first failing step's error; nothing is registered on failure.
    [[nodiscard]] auto connect(const ServerDescriptor& descriptor) -> VoidResult;

    /// @brief Unregisters and shuts down the named backend. No-op if absent.
    void disconnect(std::string_view name);

    /// @brief Returns every backend's cached tools, namespaced, in connection order.
    [[nodiscard]] auto listAllTools() const -> std::vector<Tool>;

    /// @brief Routes a namespaced tool call to its backend.
    /// @return The backend's result, or InvalidToolName / BackendNotFound / the backend's error.
    [[nodiscard]] auto callTool(std::string_view namespacedName, const nlohmann::json& arguments)
        -> Result<ToolCallResult>;

    /// @brief Returns a shared handle to the named connection while it is connected, or nullptr.
    [[nodiscard]] auto find(std::string_view name) const -> std::shared_ptr<BackendConnection>;

    /// @brief Returns the names of the registered backends, in connection order.
    [[nodiscard]] auto connectedNames() const -> std::vector<std::string>;

    /// @brief Returns the number of registered backends.
    [[nodiscard]] auto size() const -> size_t;

    /// @brief Unregisters and shuts down every backend that is no longer connected.
    /// @return The names of the removed backends.
    auto pruneDisconnected() -> std::vector<std::string>;

    /// @brief Unregisters and shuts down every backend.
    void shutdownAll();

  private:
    [[nodiscard]] auto liveSnapshot() const -> std::vector<std::shared_ptr<BackendConnection>>;

    ConnectionOptions _options;
    ConnectionFactory _factory;

    mutable std::shared_mutex _mutex;
    std::map<std::string, std::shared_ptr<BackendConnection>, std::less<>> _connections;
    std::vector<std::string> _order; // Connection order of the keys in _connections.
};

} // namespace mcpbridge
