// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <mcp/Protocol.hpp>
#include <mcpbridge/App.hpp>
#include <mcpbridge/Config.hpp>
#include <mcpbridge/UsageLog.hpp>

#include <CLI/CLI.hpp>

#include <csignal>
#include <cstdio>
#include <filesystem>
#include <format>
#include <map>
#include <optional>
#include <print>
#include <string>
#include <thread>
#include <vector>

#include <pthread.h>

namespace
{

/// @brief Prints the newest entries, then every new entry until SIGINT/SIGTERM.
auto followUsageLog(const mcpbridge::UsageLog& usageLog, std::optional<size_t> backlog) -> int
{
    auto entries = usageLog.read(backlog);
    if (!entries)
    {
        mcpbridge::log::error("Failed to read usage log: {}", entries.error().message);
        return 1;
    }
    for (const auto& entry: *entries)
        std::println("{}", mcpbridge::formatUsageEntry(entry));
    std::println("Following {} (Ctrl+C to stop)", usageLog.path().string());

    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    auto follower = std::jthread([&usageLog](std::stop_token stopToken) {
        usageLog.follow(stopToken, [](const mcpbridge::UsageEntry& entry) {
            std::println("{}", mcpbridge::formatUsageEntry(entry));
            std::fflush(stdout);
        });
    });

    auto signal = 0;
    sigwait(&signals, &signal);
    follower.request_stop();
    return 0;
}

auto parseEnvAssignments(const std::vector<std::string>& assignments)
    -> mcpbridge::Result<std::map<std::string, std::string>>
{
    auto env = std::map<std::string, std::string> {};
    for (const auto& assignment: assignments)
    {
        auto const eq = assignment.find('=');
        if (eq == std::string::npos || eq == 0)
            return mcpbridge::makeError(mcpbridge::ErrorCode::InvalidArgument,
                                        std::format("Invalid environment assignment '{}', expected KEY=VALUE", assignment));
        env[assignment.substr(0, eq)] = assignment.substr(eq + 1);
    }
    return env;
}

auto saveOrReport(const std::string& path, const mcpbridge::AppConfig& config) -> int
{
    auto saved = mcpbridge::saveConfigToFile(path, config);
    if (!saved)
    {
        mcpbridge::log::error("Failed to save config: {}", saved.error().message);
        return 1;
    }
    return 0;
}

void printServers(const mcpbridge::AppConfig& config)
{
    if (config.servers.empty())
    {
        std::println("No MCP servers configured. Add one with 'mcpbridge add <name> <command> [args...]'");
        return;
    }

    for (const auto& server: config.servers)
    {
        auto commandLine = server.command;
        for (const auto& arg: server.args)
            commandLine += " " + arg;
        std::println("{} {}  {}", server.enabled ? "[x]" : "[ ]", server.name, commandLine);
        for (const auto& [key, value]: server.env)
            std::println("      {}={}", key, value);
    }
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "mcpbridge - aggregate MCP tool servers behind one endpoint" };
    app.require_subcommand(1);

    auto configPath = std::string {};
    auto verbose = false;
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    // add
    auto* addCmd = app.add_subcommand("add", "Add an MCP server");
    auto addName = std::string {};
    auto addCommand = std::string {};
    auto addArgs = std::vector<std::string> {};
    auto addEnv = std::vector<std::string> {};
    addCmd->add_option("name", addName, "Server name (used as tool prefix)")->required();
    addCmd->add_option("command", addCommand, "Executable to launch")->required();
    addCmd->add_option("args", addArgs, "Arguments passed to the server");
    addCmd->add_option("-e,--env", addEnv, "Environment variable KEY=VALUE (repeatable)");

    // remove / enable / disable
    auto targetName = std::string {};
    auto* removeCmd = app.add_subcommand("remove", "Remove an MCP server");
    removeCmd->add_option("name", targetName, "Server name")->required();
    auto* enableCmd = app.add_subcommand("enable", "Enable an MCP server");
    enableCmd->add_option("name", targetName, "Server name")->required();
    auto* disableCmd = app.add_subcommand("disable", "Disable an MCP server");
    disableCmd->add_option("name", targetName, "Server name")->required();

    // list
    auto* listCmd = app.add_subcommand("list", "List configured MCP servers");

    // import
    auto importPath = std::string {};
    auto* importCmd = app.add_subcommand("import", "Import servers from a Claude Desktop config file");
    importCmd->add_option("path", importPath, "Path to claude_desktop_config.json")->required()->check(CLI::ExistingFile);

    // logs
    auto logsLimit = size_t { 50 };
    auto logsAll = false;
    auto logsFollow = false;
    auto* logsCmd = app.add_subcommand("logs", "Show recent tool calls");
    logsCmd->add_option("-n,--lines", logsLimit, "Number of entries to show");
    logsCmd->add_flag("--all", logsAll, "Show every recorded entry");
    logsCmd->add_flag("-f,--follow", logsFollow, "Keep printing new tool calls as they are recorded");

    // serve / daemon
    auto* serveCmd = app.add_subcommand("serve", "Serve MCP over stdin/stdout");
    auto daemonPort = std::optional<uint16_t> {};
    auto* daemonCmd = app.add_subcommand("daemon", "Serve MCP over HTTP");
    daemonCmd->add_option("-p,--port", daemonPort, "Port to listen on");

    CLI11_PARSE(app, argc, argv);

    if (configPath.empty())
        configPath = mcpbridge::defaultConfigPath();

    auto configResult = mcpbridge::loadConfigOrDefaults(configPath);
    if (!configResult)
    {
        mcpbridge::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    if (verbose)
        mcpbridge::log::setLevel(mcpbridge::log::Level::Debug);
    else if (auto level = mcpbridge::log::parseLevel(config.settings.logLevel))
        mcpbridge::log::setLevel(*level);
    else
        mcpbridge::log::warning("Unknown log level '{}' in config, using default", config.settings.logLevel);

    if (addCmd->parsed())
    {
        auto env = parseEnvAssignments(addEnv);
        if (!env)
        {
            mcpbridge::log::error("{}", env.error().message);
            return 1;
        }

        auto added = mcpbridge::addServer(config,
                                          mcpbridge::ServerDescriptor {
                                              .name = addName,
                                              .command = addCommand,
                                              .args = addArgs,
                                              .env = std::move(*env),
                                              .enabled = true,
                                          });
        if (!added)
        {
            mcpbridge::log::error("{}", added.error().message);
            return 1;
        }
        if (auto rc = saveOrReport(configPath, config); rc != 0)
            return rc;
        std::println("Added MCP server '{}'", addName);
        return 0;
    }

    if (removeCmd->parsed())
    {
        auto removed = mcpbridge::removeServer(config, targetName);
        if (!removed)
        {
            mcpbridge::log::error("{}", removed.error().message);
            return 1;
        }
        if (auto rc = saveOrReport(configPath, config); rc != 0)
            return rc;
        std::println("Removed MCP server '{}'", targetName);
        return 0;
    }

    if (enableCmd->parsed() || disableCmd->parsed())
    {
        auto const enable = enableCmd->parsed();
        auto updated = mcpbridge::setServerEnabled(config, targetName, enable);
        if (!updated)
        {
            mcpbridge::log::error("{}", updated.error().message);
            return 1;
        }
        if (auto rc = saveOrReport(configPath, config); rc != 0)
            return rc;
        std::println("{} MCP server '{}'", enable ? "Enabled" : "Disabled", targetName);
        return 0;
    }

    if (listCmd->parsed())
    {
        printServers(config);
        return 0;
    }

    if (importCmd->parsed())
    {
        auto imported = mcpbridge::importClaudeDesktopConfig(importPath);
        if (!imported)
        {
            mcpbridge::log::error("Failed to import: {}", imported.error().message);
            return 1;
        }

        auto count = 0;
        for (auto& server: *imported)
        {
            auto const name = server.name;
            if (auto added = mcpbridge::addServer(config, std::move(server)); !added)
            {
                mcpbridge::log::warning("Skipping '{}': {}", name, added.error().message);
                continue;
            }
            ++count;
        }
        if (auto rc = saveOrReport(configPath, config); rc != 0)
            return rc;
        std::println("Imported {} MCP server(s)", count);
        return 0;
    }

    auto const usageLogPath = std::filesystem::path(configPath).parent_path() / "usage.log";

    if (logsCmd->parsed() && logsFollow)
    {
        auto const backlog = logsCmd->count("--lines") ? logsLimit : size_t { 10 };
        return followUsageLog(mcpbridge::UsageLog(usageLogPath), logsAll ? std::nullopt : std::optional { backlog });
    }

    if (logsCmd->parsed())
    {
        auto entries = mcpbridge::UsageLog(usageLogPath).read(logsAll ? std::nullopt : std::optional { logsLimit });
        if (!entries)
        {
            mcpbridge::log::error("Failed to read usage log: {}", entries.error().message);
            return 1;
        }
        if (entries->empty())
            std::println("No tool calls recorded yet");
        for (const auto& entry: *entries)
            std::println("{}", mcpbridge::formatUsageEntry(entry));
        return 0;
    }

    auto application = mcpbridge::App(std::move(config), configPath, usageLogPath);

    if (serveCmd->parsed())
        return application.serve();

    if (daemonCmd->parsed())
        return application.daemon(daemonPort);

    return 0;
}
