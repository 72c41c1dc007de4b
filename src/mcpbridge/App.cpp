// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/Log.hpp>
#include <mcp/ConnectionRegistry.hpp>
#include <mcp/Router.hpp>
#include <mcpbridge/HttpServer.hpp>
#include <mcpbridge/ServerAdmin.hpp>
#include <mcpbridge/StdioServer.hpp>
#include <mcpbridge/UsageLog.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <functional>
#include <iostream>
#include <string>
#include <stop_token>
#include <thread>

#include <pthread.h>

namespace mcpbridge
{

namespace
{
    /// @brief Blocks SIGINT and SIGTERM in the calling thread and every thread it starts afterwards.
    auto blockTerminationSignals() -> sigset_t
    {
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &signals, nullptr);
        return signals;
    }

    /// @brief Waits for a blocked termination signal on a dedicated thread and invokes @p onSignal once.
    auto startSignalWatcher(sigset_t signals, std::function<void(int)> onSignal) -> std::jthread
    {
        return std::jthread([signals, onSignal = std::move(onSignal)](std::stop_token stopToken) {
            auto const pollInterval = timespec { .tv_sec = 0, .tv_nsec = 200'000'000 };
            while (!stopToken.stop_requested())
            {
                auto const signal = sigtimedwait(&signals, nullptr, &pollInterval);
                if (signal > 0)
                {
                    log::info("Received signal {}, shutting down", signal);
                    onSignal(signal);
                    return;
                }
            }
        });
    }

    auto connectionOptionsFrom(const Settings& settings) -> ConnectionOptions
    {
        return ConnectionOptions {
            .requestTimeout = std::chrono::milliseconds(settings.requestTimeoutMs),
            .terminateGrace = ConnectionOptions {}.terminateGrace,
        };
    }
} // namespace

struct App::Impl
{
    AppConfig config;
    UsageLog usageLog;
    ConnectionRegistry registry;
    Router router;
    ServerAdmin admin;

    Impl(AppConfig cfg, std::filesystem::path configPath, std::filesystem::path usageLogPath):
        config(std::move(cfg)),
        usageLog(std::move(usageLogPath)),
        registry(connectionOptionsFrom(config.settings)),
        router(registry, [this](const ToolCallRecord& call) { usageLog.record(call); }),
        admin(std::move(configPath), registry, usageLog)
    {
    }

    void connectBackends()
    {
        registry.connectAll(enabledServers(config));

        auto const connected = registry.connectedNames();
        if (connected.empty())
            log::warning("No MCP servers connected. Add servers with 'mcpbridge add'");
        else
        {
            auto names = std::string {};
            for (const auto& name: connected)
                names += names.empty() ? name : ", " + name;
            log::info("Connected to {} MCP server(s): {}", connected.size(), names);
        }
    }
};

App::App(AppConfig config, std::filesystem::path configPath, std::filesystem::path usageLogPath):
    _impl(std::make_unique<Impl>(std::move(config), std::move(configPath), std::move(usageLogPath)))
{
}

App::~App() = default;

auto App::serve() -> int
{
    auto const signals = blockTerminationSignals();

    // stdin cannot be interrupted portably, so a signal tears the backends down and exits directly.
    auto watcher = startSignalWatcher(signals, [this](int signal) {
        _impl->registry.shutdownAll();
        std::_Exit(128 + signal);
    });

    _impl->connectBackends();
    serveStdio(_impl->router, std::cin, std::cout);

    watcher.request_stop();
    watcher.join();
    _impl->registry.shutdownAll();
    return 0;
}

auto App::daemon(std::optional<uint16_t> port) -> int
{
    auto const signals = blockTerminationSignals();

    auto server = HttpServer(_impl->router, _impl->registry, _impl->admin);
    auto const host = _impl->config.settings.daemonHost;
    auto bound = server.bind(host, port.value_or(_impl->config.settings.daemonPort));
    if (!bound)
    {
        log::error("Failed to start daemon: {}", bound.error());
        return 1;
    }

    _impl->connectBackends();
    log::info("MCP bridge daemon listening on http://{}:{}", host, *bound);

    auto watcher = startSignalWatcher(signals, [&server](int) {
        server.waitUntilReady();
        server.stop();
    });

    auto runResult = server.run();

    watcher.request_stop();
    watcher.join();
    _impl->registry.shutdownAll();

    if (!runResult)
    {
        log::error("HTTP daemon failed: {}", runResult.error());
        return 1;
    }
    return 0;
}

} // namespace mcpbridge
