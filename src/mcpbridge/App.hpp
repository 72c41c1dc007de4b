// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcpbridge/Config.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>

namespace mcpbridge
{

/// @brief Wires configuration, backend registry, router and a front-end together.
class App
{
  public:
    /// @brief Constructs the application.
    /// @param config The loaded configuration.
    /// @param configPath The file @p config was loaded from; management edits and reloads use it.
    /// @param usageLogPath Where routed tool calls are recorded.
    App(AppConfig config, std::filesystem::path configPath, std::filesystem::path usageLogPath);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Connects the enabled backends and serves MCP over stdin/stdout until EOF.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto serve() -> int;

    /// @brief Connects the enabled backends and serves MCP plus the management API over HTTP
    ///        until SIGINT/SIGTERM.
    /// @param port Overrides the configured daemon port.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto daemon(std::optional<uint16_t> port) -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpbridge
