// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ConnectionRegistry.hpp>
#include <mcp/Router.hpp>
#include <mcpbridge/ServerAdmin.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace mcpbridge
{

/// @brief HTTP front-end exposing the router.
///
/// Endpoints:
///   GET    /health              service status and the connected backend names
///   POST   /mcp                 one JSON-RPC message per request body
///   GET    /tools               the aggregated tool catalog
///   GET    /api/servers         configured servers with their connection status
///   POST   /api/servers         add a server to the config file
///   PATCH  /api/servers/<name>  change a configured server
///   DELETE /api/servers/<name>  remove a configured server
///   POST   /api/reload          reconnect all backends from the config file
///   GET    /api/logs            tool usage (query: limit, offset, mcp, success)
class HttpServer
{
  public:
    HttpServer(Router& router, ConnectionRegistry& registry, ServerAdmin& admin);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// @brief Binds the listening socket. A @p port of 0 picks a free port.
    /// @return The bound port, or an IoError.
    [[nodiscard]] auto bind(const std::string& host, uint16_t port) -> Result<uint16_t>;

    /// @brief Serves requests on the bound socket until stop() is called.
    [[nodiscard]] auto run() -> VoidResult;

    /// @brief Stops a running server. Safe to call from any thread.
    void stop();

    /// @brief Blocks until run() is accepting connections.
    void waitUntilReady() const;

    [[nodiscard]] auto isRunning() const -> bool;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpbridge
