// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mcpbridge
{

/// @brief Configuration for spawning a backend process.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env; // Overrides on top of the inherited environment.

    /// @brief How long close() waits after SIGTERM before resorting to SIGKILL.
    std::chrono::milliseconds terminateGrace { 2000 };

    /// @brief How long send() may wait for a backend that is not draining its stdin.
    std::chrono::milliseconds writeTimeout { 30000 };
};

/// @brief Transport that communicates with a backend process via stdio pipes.
///
/// Spawns a child process and communicates via its stdin/stdout; the child's
/// stderr is inherited. The child is terminated and reaped by close() or, at
/// the latest, by the destructor.
class StdioTransport: public Transport
{
  public:
    StdioTransport();
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// @brief Starts the backend process.
    /// @param config The process configuration.
    /// @return Success or a SpawnFailure.
    [[nodiscard]] auto start(const StdioTransportConfig& config) -> VoidResult;

    /// @brief Writes one line. Fails with Timeout if the child stops reading for
    /// longer than writeTimeout, and with ConnectionClosed once close() is called.
    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive() -> Result<nlohmann::json> override;
    void close() override;
    [[nodiscard]] auto isRunning() const -> bool override;

    /// @brief Returns the child's process id, or -1 if not started.
    [[nodiscard]] auto pid() const -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpbridge
