// SPDX-License-Identifier: Apache-2.0
#include <mcp/Router.hpp>
#include <mcpbridge/HttpServer.hpp>
#include <mcpbridge/ServerAdmin.hpp>
#include <mcpbridge/UsageLog.hpp>

#include <tests/FakeBackend.hpp>

#include <catch2/catch_test_macros.hpp>

#include <httplib.h>

#include <filesystem>
#include <string>
#include <thread>

using namespace mcpbridge;
using test::FakeRegistry;

namespace
{

/// @brief Runs an HttpServer on an ephemeral port for the lifetime of the fixture.
struct RunningServer
{
    std::filesystem::path dir = std::filesystem::temp_directory_path() / "mcpbridge_http_server";
    FakeRegistry fakes;
    UsageLog usageLog { dir / "usage.log" };
    Router router { fakes.registry, [this](const ToolCallRecord& call) { usageLog.record(call); } };
    ServerAdmin admin { dir / "config.json", fakes.registry, usageLog };
    HttpServer server { router, fakes.registry, admin };
    uint16_t port = 0;
    VoidResult runResult;
    std::jthread thread;

    RunningServer()
    {
        std::filesystem::remove_all(dir);
        REQUIRE(fakes.connect("a", nlohmann::json::array({ { { "name", "x" }, { "description", "X tool" } } })));

        auto bound = server.bind("127.0.0.1", 0);
        REQUIRE(bound.has_value());
        port = *bound;
        REQUIRE(port != 0);

        thread = std::jthread([this] { runResult = server.run(); });
        server.waitUntilReady();
    }

    ~RunningServer()
    {
        server.stop();
        if (thread.joinable())
            thread.join();
        std::filesystem::remove_all(dir);
    }

    auto client() const -> httplib::Client { return httplib::Client("127.0.0.1", port); }
};

} // namespace

TEST_CASE("HttpServer run requires bind", "[http]")
{
    auto fakes = FakeRegistry {};
    auto router = Router(fakes.registry);
    auto const dir = std::filesystem::temp_directory_path();
    auto const usageLog = UsageLog(dir / "mcpbridge_http_unbound.log");
    auto admin = ServerAdmin(dir / "mcpbridge_http_unbound.json", fakes.registry, usageLog);
    auto server = HttpServer(router, fakes.registry, admin);

    auto result = server.run();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidState);
    CHECK(!server.isRunning());
}

TEST_CASE("HttpServer serves health, tools and JSON-RPC", "[http]")
{
    auto fixture = RunningServer {};
    auto client = fixture.client();
    CHECK(fixture.server.isRunning());

    SECTION("GET /health")
    {
        auto res = client.Get("/health");
        REQUIRE(res);
        CHECK(res->status == 200);

        auto const body = nlohmann::json::parse(res->body);
        CHECK(body["status"] == "ok");
        CHECK(body["service"] == "mcp-bridge");
        CHECK(body["version"] == "0.1.0");
        CHECK(body["connected"] == nlohmann::json::array({ "a" }));
    }

    SECTION("GET /tools")
    {
        auto res = client.Get("/tools");
        REQUIRE(res);
        CHECK(res->status == 200);

        auto const body = nlohmann::json::parse(res->body);
        REQUIRE(body["tools"].size() == 1);
        CHECK(body["tools"][0]["name"] == "a__x");
        CHECK(body["tools"][0]["description"] == "X tool");
    }

    SECTION("POST /mcp tools/call")
    {
        auto const request = nlohmann::json {
            { "jsonrpc", "2.0" },
            { "id", 7 },
            { "method", "tools/call" },
            { "params", { { "name", "a__x" }, { "arguments", { { "k", 1 } } } } },
        };
        auto res = client.Post("/mcp", request.dump(), "application/json");
        REQUIRE(res);
        CHECK(res->status == 200);

        auto const body = nlohmann::json::parse(res->body);
        CHECK(body["id"] == 7);
        CHECK(body["result"]["content"][0]["text"] == R"(x:{"k":1})");
    }

    SECTION("POST /mcp ping")
    {
        auto res = client.Post("/mcp", R"({"jsonrpc":"2.0","id":"p","method":"ping"})", "application/json");
        REQUIRE(res);
        auto const body = nlohmann::json::parse(res->body);
        CHECK(body["id"] == "p");
        CHECK(body["result"] == nlohmann::json::object());
    }

    SECTION("POST /mcp notification is accepted without a body")
    {
        auto res = client.Post(
            "/mcp", R"({"jsonrpc":"2.0","method":"notifications/initialized"})", "application/json");
        REQUIRE(res);
        CHECK(res->status == 202);
        CHECK(res->body.empty());
    }

    SECTION("POST /mcp with malformed JSON")
    {
        auto res = client.Post("/mcp", "{not json", "application/json");
        REQUIRE(res);
        auto const body = nlohmann::json::parse(res->body);
        CHECK(body["id"].is_null());
        CHECK(body["error"]["code"] == -32700);
    }

    SECTION("POST /mcp with bytes that are not UTF-8")
    {
        auto res = client.Post("/mcp", "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"\xFF\"}", "application/json");
        REQUIRE(res);
        CHECK(res->status == 200);
        auto const body = nlohmann::json::parse(res->body);
        CHECK(body["error"]["code"] == -32700);
    }

    SECTION("Unknown route")
    {
        auto res = client.Get("/nope");
        REQUIRE(res);
        CHECK(res->status == 404);
    }
}

TEST_CASE("HttpServer manages configured servers", "[http]")
{
    auto fixture = RunningServer {};
    auto client = fixture.client();

    auto const add = [&](std::string const& body) { return client.Post("/api/servers", body, "application/json"); };

    auto res = add(R"({"name":"a","command":"fake","args":["--stdio"],"env":{"TOKEN":"t"}})");
    REQUIRE(res);
    CHECK(res->status == 200);
    auto body = nlohmann::json::parse(res->body);
    CHECK(body["success"] == true);
    CHECK(body["server"]["name"] == "a");
    CHECK(body["server"]["args"] == nlohmann::json::array({ "--stdio" }));
    CHECK(body["server"]["enabled"] == true);

    SECTION("GET /api/servers flags connected backends")
    {
        REQUIRE(add(R"({"name":"b","command":"fake","enabled":false})"));

        auto list = client.Get("/api/servers");
        REQUIRE(list);
        CHECK(list->status == 200);
        auto const servers = nlohmann::json::parse(list->body)["servers"];
        REQUIRE(servers.size() == 2);
        CHECK(servers[0]["name"] == "a");
        CHECK(servers[0]["env"]["TOKEN"] == "t");
        CHECK(servers[0]["connected"] == true);
        CHECK(servers[1]["name"] == "b");
        CHECK(servers[1]["enabled"] == false);
        CHECK(servers[1]["connected"] == false);
    }

    SECTION("POST /api/servers rejects bad input")
    {
        auto duplicate = add(R"({"name":"a","command":"fake"})");
        REQUIRE(duplicate);
        CHECK(duplicate->status == 409);
        CHECK(nlohmann::json::parse(duplicate->body).contains("error"));

        auto missingCommand = add(R"({"name":"c"})");
        REQUIRE(missingCommand);
        CHECK(missingCommand->status == 400);

        auto badName = add(R"({"name":"c__d","command":"fake"})");
        REQUIRE(badName);
        CHECK(badName->status == 400);

        auto notJson = add("{nope");
        REQUIRE(notJson);
        CHECK(notJson->status == 400);
    }

    SECTION("PATCH /api/servers/<name>")
    {
        auto patched = client.Patch("/api/servers/a", R"({"command":"other","enabled":false})", "application/json");
        REQUIRE(patched);
        CHECK(patched->status == 200);
        auto const server = nlohmann::json::parse(patched->body)["server"];
        CHECK(server["command"] == "other");
        CHECK(server["args"] == nlohmann::json::array({ "--stdio" }));
        CHECK(server["enabled"] == false);

        auto badType = client.Patch("/api/servers/a", R"({"enabled":"no"})", "application/json");
        REQUIRE(badType);
        CHECK(badType->status == 400);

        auto missing = client.Patch("/api/servers/zzz", R"({"enabled":true})", "application/json");
        REQUIRE(missing);
        CHECK(missing->status == 404);
    }

    SECTION("DELETE /api/servers/<name>")
    {
        auto removed = client.Delete("/api/servers/a");
        REQUIRE(removed);
        CHECK(removed->status == 200);
        CHECK(nlohmann::json::parse(removed->body)["server"]["name"] == "a");

        auto again = client.Delete("/api/servers/a");
        REQUIRE(again);
        CHECK(again->status == 404);

        auto list = client.Get("/api/servers");
        REQUIRE(list);
        CHECK(nlohmann::json::parse(list->body)["servers"].empty());
    }

    SECTION("POST /api/reload connects the enabled servers")
    {
        REQUIRE(add(R"({"name":"b","command":"fake"})"));
        REQUIRE(add(R"({"name":"off","command":"fake","enabled":false})"));
        fixture.fakes.add("a", nlohmann::json::array({ { { "name", "x" } } }));
        fixture.fakes.add("b", nlohmann::json::array({ { { "name", "y" } } }));

        auto reloaded = client.Post("/api/reload", "", "application/json");
        REQUIRE(reloaded);
        CHECK(reloaded->status == 200);
        auto const result = nlohmann::json::parse(reloaded->body);
        CHECK(result["success"] == true);
        CHECK(result["connected"] == nlohmann::json::array({ "a", "b" }));
        CHECK(result["message"] == "Reconnected to 2 server(s)");

        auto tools = client.Get("/tools");
        REQUIRE(tools);
        auto const catalog = nlohmann::json::parse(tools->body)["tools"];
        REQUIRE(catalog.size() == 2);
        CHECK(catalog[0]["name"] == "a__x");
        CHECK(catalog[1]["name"] == "b__y");
    }
}

TEST_CASE("HttpServer serves the usage log", "[http]")
{
    auto fixture = RunningServer {};
    auto client = fixture.client();

    auto const call = [&](std::string const& name) {
        auto const request = nlohmann::json {
            { "jsonrpc", "2.0" },
            { "id", 1 },
            { "method", "tools/call" },
            { "params", { { "name", name }, { "arguments", nlohmann::json::object() } } },
        };
        REQUIRE(client.Post("/mcp", request.dump(), "application/json"));
    };
    call("a__x");
    call("missing__x");
    call("a__x");

    SECTION("Everything")
    {
        auto res = client.Get("/api/logs");
        REQUIRE(res);
        CHECK(res->status == 200);
        auto const body = nlohmann::json::parse(res->body);
        CHECK(body["total"] == 3);
        CHECK(body["limit"] == 50);
        CHECK(body["offset"] == 0);
        REQUIRE(body["entries"].size() == 3);
        CHECK(body["entries"][1]["mcp"] == "missing");
        CHECK(body["entries"][1]["success"] == false);
    }

    SECTION("Filters")
    {
        auto res = client.Get("/api/logs?mcp=a&success=true");
        REQUIRE(res);
        auto const body = nlohmann::json::parse(res->body);
        CHECK(body["total"] == 2);
        for (auto const& entry: body["entries"])
            CHECK(entry["mcp"] == "a");

        auto failed = client.Get("/api/logs?success=false");
        REQUIRE(failed);
        CHECK(nlohmann::json::parse(failed->body)["total"] == 1);
    }

    SECTION("Paging")
    {
        auto res = client.Get("/api/logs?limit=1&offset=1");
        REQUIRE(res);
        auto const body = nlohmann::json::parse(res->body);
        CHECK(body["total"] == 3);
        REQUIRE(body["entries"].size() == 1);
        CHECK(body["entries"][0]["mcp"] == "missing");
    }

    SECTION("Bad paging parameters")
    {
        auto res = client.Get("/api/logs?limit=ten");
        REQUIRE(res);
        CHECK(res->status == 400);

        auto negative = client.Get("/api/logs?offset=-1");
        REQUIRE(negative);
        CHECK(negative->status == 400);
    }
}

TEST_CASE("HttpServer stops from another thread", "[http]")
{
    auto fixture = RunningServer {};
    fixture.server.stop();
    fixture.thread.join();
    CHECK(fixture.runResult.has_value());
    CHECK(!fixture.server.isRunning());

    auto client = fixture.client();
    client.set_connection_timeout(std::chrono::milliseconds(500));
    CHECK(!client.Get("/health"));
}
