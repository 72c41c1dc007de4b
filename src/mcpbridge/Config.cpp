// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/Protocol.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>

namespace mcpbridge
{

namespace
{

    auto readJsonFile(std::string_view path) -> Result<nlohmann::json>
    {
        auto file = std::ifstream(std::string(path));
        if (!file.is_open())
            return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

        auto ss = std::stringstream {};
        ss << file.rdbuf();

        auto parseResult = json::parse(ss.str());
        if (!parseResult)
            return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, parseResult.error().message));
        return parseResult;
    }

    auto parseServer(std::string name, const nlohmann::json& serverJson) -> ServerDescriptor
    {
        return ServerDescriptor {
            .name = std::move(name),
            .command = json::getStringOr(serverJson, "command", ""),
            .args = json::getStringArray(serverJson, "args"),
            .env = json::getStringMap(serverJson, "env"),
            .enabled = json::getBoolOr(serverJson, "enabled", true),
        };
    }

    auto findServer(AppConfig& config, std::string_view name)
    {
        return std::ranges::find_if(config.servers, [&](const ServerDescriptor& s) { return s.name == name; });
    }

} // namespace

auto defaultConfigDir() -> std::string
{
#if defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/mcpbridge";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/mcpbridge";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/mcpbridge";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto parseResult = readJsonFile(path);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("{}: top-level value must be an object", path));

    auto config = AppConfig {};

    // Settings section
    if (root.contains("settings"))
    {
        auto const& settings = root["settings"];
        config.settings.logLevel = json::getStringOr(settings, "logLevel", "info");
        config.settings.daemonHost = json::getStringOr(settings, "daemonHost", "127.0.0.1");
        config.settings.requestTimeoutMs = json::getIntOr(settings, "requestTimeoutMs", 30000);

        auto const port = json::getIntOr(settings, "daemonPort", 3000);
        if (port <= 0 || port > std::numeric_limits<uint16_t>::max())
            return makeError(ErrorCode::ConfigError, std::format("Invalid daemonPort: {}", port));
        config.settings.daemonPort = static_cast<uint16_t>(port);

        if (config.settings.requestTimeoutMs <= 0)
            return makeError(ErrorCode::ConfigError,
                             std::format("Invalid requestTimeoutMs: {}", config.settings.requestTimeoutMs));
    }

    // Servers section
    if (root.contains("servers") && root["servers"].is_array())
    {
        for (const auto& serverJson: root["servers"])
        {
            auto name = json::getString(serverJson, "name");
            if (!name)
                return makeError(ErrorCode::ConfigError, std::format("{}: server entry without a name", path));

            auto added = addServer(config, parseServer(std::move(*name), serverJson));
            if (!added)
                return std::unexpected(added.error());
        }
    }

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    root["settings"] = nlohmann::json {
        { "logLevel", config.settings.logLevel },
        { "daemonPort", config.settings.daemonPort },
        { "daemonHost", config.settings.daemonHost },
        { "requestTimeoutMs", config.settings.requestTimeoutMs },
    };

    auto servers = nlohmann::json::array();
    for (const auto& server: config.servers)
        servers.push_back(toJson(server));
    root["servers"] = std::move(servers);

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(2) << '\n';
    if (!file)
        return makeError(ErrorCode::IoError, std::format("Failed to write config file: {}", path));
    return {};
}

auto loadConfigOrDefaults(std::string_view path) -> Result<AppConfig>
{
    if (!std::filesystem::exists(path))
    {
        log::debug("No config file found at {}, using defaults", path);
        return AppConfig {};
    }
    return loadConfigFromFile(path);
}

auto loadConfig() -> Result<AppConfig>
{
    return loadConfigOrDefaults(defaultConfigPath());
}

auto addServer(AppConfig& config, ServerDescriptor server) -> VoidResult
{
    if (!protocol::isValidBackendName(server.name))
        return makeError(ErrorCode::InvalidBackendName,
                         std::format("Invalid server name '{}': must be non-empty and must not contain '{}'",
                                     server.name,
                                     protocol::NamespaceSeparator));

    if (findServer(config, server.name) != config.servers.end())
        return makeError(ErrorCode::DuplicateBackend, std::format("Server '{}' already exists", server.name));

    if (server.command.empty())
        return makeError(ErrorCode::ConfigError, std::format("Server '{}' has no command", server.name));

    config.servers.push_back(std::move(server));
    return {};
}

auto removeServer(AppConfig& config, std::string_view name) -> Result<ServerDescriptor>
{
    auto const it = findServer(config, name);
    if (it == config.servers.end())
        return makeError(ErrorCode::BackendNotFound, std::format("Server '{}' not found", name));

    auto removed = std::move(*it);
    config.servers.erase(it);
    return removed;
}

auto setServerEnabled(AppConfig& config, std::string_view name, bool enabled) -> VoidResult
{
    auto const it = findServer(config, name);
    if (it == config.servers.end())
        return makeError(ErrorCode::BackendNotFound, std::format("Server '{}' not found", name));

    it->enabled = enabled;
    return {};
}

auto updateServer(AppConfig& config, std::string_view name, const ServerUpdate& update) -> Result<ServerDescriptor>
{
    auto const it = findServer(config, name);
    if (it == config.servers.end())
        return makeError(ErrorCode::BackendNotFound, std::format("Server '{}' not found", name));

    if (update.command && update.command->empty())
        return makeError(ErrorCode::InvalidArgument, std::format("Server '{}' has no command", name));

    if (update.command)
        it->command = *update.command;
    if (update.args)
        it->args = *update.args;
    if (update.env)
        it->env = *update.env;
    if (update.enabled)
        it->enabled = *update.enabled;
    return *it;
}

auto parseServerUpdate(const nlohmann::json& value) -> Result<ServerUpdate>
{
    if (!value.is_object())
        return makeError(ErrorCode::InvalidArgument, "Server update must be a JSON object");

    auto update = ServerUpdate {};
    if (value.contains("command"))
    {
        if (!value["command"].is_string())
            return makeError(ErrorCode::InvalidArgument, "'command' must be a string");
        update.command = value["command"].get<std::string>();
    }
    if (value.contains("args"))
    {
        auto const& args = value["args"];
        if (!args.is_array() || !std::all_of(args.begin(), args.end(), [](const auto& arg) { return arg.is_string(); }))
            return makeError(ErrorCode::InvalidArgument, "'args' must be an array of strings");
        update.args = json::getStringArray(value, "args");
    }
    if (value.contains("env"))
    {
        auto const& env = value["env"];
        if (!env.is_object() || !std::all_of(env.begin(), env.end(), [](const auto& entry) { return entry.is_string(); }))
            return makeError(ErrorCode::InvalidArgument, "'env' must be an object of strings");
        update.env = json::getStringMap(value, "env");
    }
    if (value.contains("enabled"))
    {
        if (!value["enabled"].is_boolean())
            return makeError(ErrorCode::InvalidArgument, "'enabled' must be a boolean");
        update.enabled = value["enabled"].get<bool>();
    }
    return update;
}

auto toJson(const ServerDescriptor& server) -> nlohmann::json
{
    return nlohmann::json {
        { "name", server.name },
        { "command", server.command },
        { "args", server.args },
        { "env", server.env.empty() ? nlohmann::json::object() : nlohmann::json(server.env) },
        { "enabled", server.enabled },
    };
}

auto enabledServers(const AppConfig& config) -> std::vector<ServerDescriptor>
{
    auto result = std::vector<ServerDescriptor> {};
    std::ranges::copy_if(config.servers, std::back_inserter(result), &ServerDescriptor::enabled);
    return result;
}

auto importClaudeDesktopConfig(std::string_view path) -> Result<std::vector<ServerDescriptor>>
{
    auto parseResult = readJsonFile(path);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object() || !root.contains("mcpServers") || !root["mcpServers"].is_object())
        return makeError(ErrorCode::ConfigError, std::format("{}: no 'mcpServers' object found", path));

    auto servers = std::vector<ServerDescriptor> {};
    for (const auto& [name, serverJson]: root["mcpServers"].items())
    {
        auto server = parseServer(name, serverJson);
        server.enabled = true;
        servers.push_back(std::move(server));
    }
    return servers;
}

} // namespace mcpbridge
