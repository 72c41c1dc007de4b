// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/PendingRequests.hpp>
#include <mcp/Transport.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace mcpbridge
{

/// @brief Lifecycle of a backend connection.
enum class ConnectionState
{
    Spawned,
    Initializing,
    Ready,
    ShuttingDown,
    Terminated,
};

[[nodiscard]] constexpr auto connectionStateName(ConnectionState state) -> std::string_view
{
    switch (state)
    {
        case ConnectionState::Spawned: return "spawned";
        case ConnectionState::Initializing: return "initializing";
        case ConnectionState::Ready: return "ready";
        case ConnectionState::ShuttingDown: return "shutting down";
        case ConnectionState::Terminated: return "terminated";
    }
    return "unknown";
}

/// @brief Tunables shared by all backend connections.
struct ConnectionOptions
{
    /// @brief Absolute per-request deadline.
    std::chrono::milliseconds requestTimeout { 30000 };

    /// @brief Grace period between SIGTERM and SIGKILL when terminating a backend process.
    std::chrono::milliseconds terminateGrace { 2000 };
};

/// @brief One backend process and its framed JSON-RPC exchange.
///
/// Any number of threads may issue requests concurrently. A background reader
/// thread drains the transport and completes outstanding requests by id; it
/// shares only the transport and the pending table with this object, never
/// the connection itself. The backend is terminated by shutdown() or, at the
/// latest, by the destructor.
class BackendConnection
{
  public:
    /// @brief Launches the descriptor's process and wraps it in a connection (state Spawned).
    /// @return The connection or a SpawnFailure.
    [[nodiscard]] static auto spawn(const ServerDescriptor& descriptor, const ConnectionOptions& options = {})
        -> Result<std::unique_ptr<BackendConnection>>;

    /// @brief Constructs a connection over an already-open transport and starts the reader thread.
    /// @param name The backend name.
    /// @param transport The transport to use for communication.
    /// @param options Request timeout and termination settings.
    BackendConnection(std::string name, std::shared_ptr<Transport> transport, ConnectionOptions options = {});
    ~BackendConnection();

    BackendConnection(const BackendConnection&) = delete;
    BackendConnection& operator=(const BackendConnection&) = delete;

    /// @brief Performs the initialize handshake, then sends the initialized notification.
    /// @return The backend's identity and capabilities, or HandshakeFailure / Timeout / ConnectionClosed.
    [[nodiscard]] auto initialize() -> Result<InitializeResult>;

    /// @brief Fetches the backend's tools and replaces the cached tool list.
    ///
    /// The first successful listing after initialize() makes the connection Ready.
    [[nodiscard]] auto listTools() -> Result<std::vector<Tool>>;

    /// @brief Invokes a tool by its local (non-namespaced) name.
    /// @param name The local tool name.
    /// @param arguments The argument object; null is sent as an empty object.
    /// @return The structured result or BackendCallFailure / Timeout / ConnectionClosed.
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& arguments) -> Result<ToolCallResult>;

    /// @brief Sends a request and blocks until its response arrives or the deadline passes.
    [[nodiscard]] auto request(std::string_view method, nlohmann::json params = nullptr)
        -> Result<jsonrpc::Response>;

    /// @brief Sends a one-way notification; no response is registered or awaited.
    [[nodiscard]] auto notify(std::string_view method, nlohmann::json params = nullptr) -> VoidResult;

    /// @brief Sends an advisory cancellation notification and terminates the backend.
    void shutdown();

    /// @brief Non-blocking liveness probe of the backend process.
    [[nodiscard]] auto isRunning() const -> bool;

    /// @brief True while the connection is Ready and the backend's output stream is still open.
    [[nodiscard]] auto isConnected() const -> bool;

    [[nodiscard]] auto name() const -> const std::string& { return _name; }
    [[nodiscard]] auto state() const -> ConnectionState;

    /// @brief Returns the handshake result, once initialize() has succeeded.
    [[nodiscard]] auto serverInfo() const -> std::optional<InitializeResult>;

    /// @brief Returns the tools cached by the most recent successful listTools().
    [[nodiscard]] auto tools() const -> std::vector<Tool>;

    /// @brief Returns the number of requests still awaiting a response.
    [[nodiscard]] auto pendingCount() const -> size_t;

  private:
    [[nodiscard]] auto requireState(std::initializer_list<ConnectionState> allowed, std::string_view operation) const
        -> VoidResult;
    [[nodiscard]] auto write(const nlohmann::json& message) -> VoidResult;

    std::string _name;
    ConnectionOptions _options;
    std::shared_ptr<Transport> _transport;
    std::shared_ptr<PendingRequests> _pending;
    std::atomic<int64_t> _nextId { 1 };
    std::mutex _writeMutex;

    mutable std::mutex _stateMutex;
    ConnectionState _state = ConnectionState::Spawned;
    std::optional<InitializeResult> _serverInfo;
    std::vector<Tool> _tools;

    std::jthread _reader;
};

} // namespace mcpbridge
