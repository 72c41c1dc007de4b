// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpbridge
{

/// @brief Global settings section.
struct Settings
{
    /// @brief Log level name (error, warn, info, debug, trace).
    std::string logLevel = "info";

    /// @brief Port for the HTTP daemon.
    uint16_t daemonPort = 3000;

    /// @brief Address the HTTP daemon binds to.
    std::string daemonHost = "127.0.0.1";

    /// @brief Per-request deadline for backend calls.
    int requestTimeoutMs = 30000;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    Settings settings;
    std::vector<ServerDescriptor> servers;
};

/// @brief Partial change to a configured server; unset members are left as they are.
struct ServerUpdate
{
    std::optional<std::string> command;
    std::optional<std::vector<std::string>> args;
    std::optional<std::map<std::string, std::string>> env;
    std::optional<bool> enabled;
};

/// @brief Loads the configuration from the default config path (defaults if the file is missing).
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Loads the configuration from @p path, or the defaults if no such file exists.
[[nodiscard]] auto loadConfigOrDefaults(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the configuration to a file, creating parent directories as needed.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
/// On Linux: $XDG_CONFIG_HOME/mcpbridge or ~/.config/mcpbridge
/// On macOS: ~/Library/Application Support/mcpbridge
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Adds a server; fails with DuplicateBackend or InvalidBackendName on a taken or unusable name.
[[nodiscard]] auto addServer(AppConfig& config, ServerDescriptor server) -> VoidResult;

/// @brief Removes the named server.
/// @return The removed descriptor, or BackendNotFound if no such server exists.
[[nodiscard]] auto removeServer(AppConfig& config, std::string_view name) -> Result<ServerDescriptor>;

/// @brief Enables or disables the named server.
[[nodiscard]] auto setServerEnabled(AppConfig& config, std::string_view name, bool enabled) -> VoidResult;

/// @brief Applies @p update to the named server.
/// @return The updated descriptor; BackendNotFound if no such server exists, InvalidArgument if the
///         command would become empty.
[[nodiscard]] auto updateServer(AppConfig& config, std::string_view name, const ServerUpdate& update)
    -> Result<ServerDescriptor>;

/// @brief Parses a partial server update ({"command"?, "args"?, "env"?, "enabled"?}).
[[nodiscard]] auto parseServerUpdate(const nlohmann::json& value) -> Result<ServerUpdate>;

/// @brief Converts a descriptor to its config file representation.
[[nodiscard]] auto toJson(const ServerDescriptor& server) -> nlohmann::json;

/// @brief Returns the enabled servers, in configuration order.
[[nodiscard]] auto enabledServers(const AppConfig& config) -> std::vector<ServerDescriptor>;

/// @brief Reads servers from a Claude Desktop style config ({"mcpServers": {name: {command, args, env}}}).
/// @return Enabled descriptors in name order, or an error.
[[nodiscard]] auto importClaudeDesktopConfig(std::string_view path) -> Result<std::vector<ServerDescriptor>>;

} // namespace mcpbridge
