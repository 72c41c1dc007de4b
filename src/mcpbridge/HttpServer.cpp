// SPDX-License-Identifier: Apache-2.0
#include "HttpServer.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/Protocol.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <charconv>
#include <exception>
#include <format>
#include <optional>
#include <string>

namespace mcpbridge
{

namespace
{
    constexpr auto JsonContentType = "application/json";

    void setJson(httplib::Response& res, const nlohmann::json& body)
    {
        res.set_content(jsonrpc::serialize(body), JsonContentType);
    }

    void setError(httplib::Response& res, int status, std::string_view message)
    {
        res.status = status;
        setJson(res, { { "error", std::string(message) } });
    }

    /// @brief Reads a non-negative integer query parameter.
    auto sizeParam(const httplib::Request& req, const char* key, size_t defaultValue) -> std::optional<size_t>
    {
        if (!req.has_param(key))
            return defaultValue;

        auto const text = req.get_param_value(key);
        auto value = size_t { 0 };
        auto const [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc {} || end != text.data() + text.size())
            return std::nullopt;
        return value;
    }

    auto parseBody(const httplib::Request& req) -> Result<nlohmann::json>
    {
        auto body = json::parse(req.body);
        if (!body || !body->is_object())
            return makeError(ErrorCode::InvalidArgument, "Request body must be a JSON object");
        return body;
    }

    /// @brief Status code for a failed configuration edit.
    auto editFailureStatus(const Error& error) -> int
    {
        switch (error.code)
        {
            case ErrorCode::BackendNotFound: return 404;
            case ErrorCode::DuplicateBackend: return 409;
            case ErrorCode::ConfigError:
            case ErrorCode::IoError: return 500;
            default: return 400;
        }
    }
} // namespace

struct HttpServer::Impl
{
    Router& router;
    ConnectionRegistry& registry;
    ServerAdmin& admin;
    httplib::Server server;
    bool bound = false;

    Impl(Router& router, ConnectionRegistry& registry, ServerAdmin& admin):
        router(router), registry(registry), admin(admin)
    {
    }

    void installAdminRoutes()
    {
        server.Get("/api/servers", [this](const httplib::Request&, httplib::Response& res) {
            auto servers = admin.listServers();
            if (!servers)
                return setError(res, 500, servers.error().message);

            auto list = nlohmann::json::array();
            for (const auto& status: *servers)
                list.push_back(toJson(status));
            setJson(res, { { "servers", std::move(list) } });
        });

        server.Post("/api/servers", [this](const httplib::Request& req, httplib::Response& res) {
            auto body = parseBody(req);
            if (!body)
                return setError(res, 400, body.error().message);

            auto name = json::getString(*body, "name");
            auto command = json::getString(*body, "command");
            if (!name || !command || name->empty() || command->empty())
                return setError(res, 400, "name and command are required");

            auto added = admin.addServer(ServerDescriptor {
                .name = std::move(*name),
                .command = std::move(*command),
                .args = json::getStringArray(*body, "args"),
                .env = json::getStringMap(*body, "env"),
                .enabled = json::getBoolOr(*body, "enabled", true),
            });
            if (!added)
                return setError(res, editFailureStatus(added.error()), added.error().message);
            setJson(res, { { "success", true }, { "server", toJson(*added) } });
        });

        server.Patch(R"(/api/servers/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
            auto body = parseBody(req);
            if (!body)
                return setError(res, 400, body.error().message);

            auto update = parseServerUpdate(*body);
            if (!update)
                return setError(res, 400, update.error().message);

            auto updated = admin.updateServer(req.matches[1].str(), *update);
            if (!updated)
                return setError(res, editFailureStatus(updated.error()), updated.error().message);
            setJson(res, { { "success", true }, { "server", toJson(*updated) } });
        });

        server.Delete(R"(/api/servers/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
            auto removed = admin.removeServer(req.matches[1].str());
            if (!removed)
                return setError(res, editFailureStatus(removed.error()), removed.error().message);
            setJson(res, { { "success", true }, { "server", toJson(*removed) } });
        });

        server.Post("/api/reload", [this](const httplib::Request&, httplib::Response& res) {
            auto connected = admin.reload();
            if (!connected)
                return setError(res, 500, connected.error().message);
            setJson(res,
                    {
                        { "success", true },
                        { "connected", *connected },
                        { "message", std::format("Reconnected to {} server(s)", connected->size()) },
                    });
        });

        server.Get("/api/logs", [this](const httplib::Request& req, httplib::Response& res) {
            auto const limit = sizeParam(req, "limit", 50);
            auto const offset = sizeParam(req, "offset", 0);
            if (!limit || !offset)
                return setError(res, 400, "limit and offset must be non-negative integers");

            auto query = UsageQuery { .limit = *limit, .offset = *offset, .mcp = std::nullopt, .success = std::nullopt };
            if (req.has_param("mcp"))
                query.mcp = req.get_param_value("mcp");
            if (req.has_param("success"))
                query.success = req.get_param_value("success") == "true";

            auto page = admin.logs(query);
            if (!page)
                return setError(res, 500, page.error().message);

            auto entries = nlohmann::json::array();
            for (const auto& entry: page->entries)
                entries.push_back(toJson(entry));
            setJson(res,
                    {
                        { "entries", std::move(entries) },
                        { "total", page->total },
                        { "limit", *limit },
                        { "offset", *offset },
                    });
        });
    }

    void installRoutes()
    {
        server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            setJson(res,
                    {
                        { "status", "ok" },
                        { "service", protocol::BridgeName },
                        { "version", protocol::BridgeVersion },
                        { "connected", registry.connectedNames() },
                    });
        });

        server.Post("/mcp", [this](const httplib::Request& req, httplib::Response& res) {
            log::trace("POST /mcp <- {}", req.body);
            auto response = router.handleLine(req.body);
            if (!response)
            {
                // Notifications have no response body.
                res.status = 202;
                return;
            }
            setJson(res, *response);
        });

        server.Get("/tools", [this](const httplib::Request&, httplib::Response& res) {
            setJson(res, { { "tools", protocol::toJson(registry.listAllTools()) } });
        });

        server.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            auto message = std::string("unknown error");
            try
            {
                if (ep)
                    std::rethrow_exception(ep);
            }
            catch (const std::exception& e)
            {
                message = e.what();
            }
            log::error("Unhandled exception serving {} {}: {}", req.method, req.path, message);
            res.status = 500;
            setJson(res, jsonrpc::makeErrorResponse(nullptr, jsonrpc::ErrorCodes::InternalError, message));
        });
    }
};

HttpServer::HttpServer(Router& router, ConnectionRegistry& registry, ServerAdmin& admin):
    _impl(std::make_unique<Impl>(router, registry, admin))
{
    _impl->installRoutes();
    _impl->installAdminRoutes();
}

HttpServer::~HttpServer()
{
    stop();
}

auto HttpServer::bind(const std::string& host, uint16_t port) -> Result<uint16_t>
{
    if (port == 0)
    {
        auto const boundPort = _impl->server.bind_to_any_port(host);
        if (boundPort < 0)
            return makeError(ErrorCode::IoError, std::format("Failed to bind {}:<any>", host));
        _impl->bound = true;
        return static_cast<uint16_t>(boundPort);
    }

    if (!_impl->server.bind_to_port(host, port))
        return makeError(ErrorCode::IoError, std::format("Failed to bind {}:{}", host, port));
    _impl->bound = true;
    return port;
}

auto HttpServer::run() -> VoidResult
{
    if (!_impl->bound)
        return makeError(ErrorCode::InvalidState, "HTTP server is not bound");

    log::info("HTTP daemon serving /health, /mcp (POST), /tools and the /api management routes");
    if (!_impl->server.listen_after_bind())
        return makeError(ErrorCode::IoError, "HTTP server stopped with an error");
    return {};
}

void HttpServer::stop()
{
    if (_impl->server.is_running())
        _impl->server.stop();
}

void HttpServer::waitUntilReady() const
{
    _impl->server.wait_until_ready();
}

auto HttpServer::isRunning() const -> bool
{
    return _impl->server.is_running();
}

} // namespace mcpbridge
