// SPDX-License-Identifier: Apache-2.0
#include <mcp/ConnectionRegistry.hpp>

#include <tests/FakeBackend.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <future>
#include <map>
#include <string>
#include <thread>
#include <variant>

using namespace mcpbridge;
using namespace std::chrono_literals;
using test::FakeRegistry;
using test::FakeTransport;

namespace
{

auto descriptor(std::string name, std::string command = "fake") -> ServerDescriptor
{
    return ServerDescriptor {
        .name = std::move(name),
        .command = std::move(command),
        .args = {},
        .env = {},
        .enabled = true,
    };
}

auto tool(std::string name) -> nlohmann::json
{
    return { { "name", std::move(name) }, { "inputSchema", { { "type", "object" } } } };
}

auto tool(std::string name, std::string description) -> nlohmann::json
{
    auto t = tool(std::move(name));
    t["description"] = std::move(description);
    return t;
}

auto fixture() -> std::string
{
    return std::string(MCPBRIDGE_TEST_FIXTURE_DIR) + "/fake_backend.sh";
}

auto fixtureDescriptor(std::string name, std::map<std::string, std::string> env = {}) -> ServerDescriptor
{
    return ServerDescriptor {
        .name = std::move(name),
        .command = "sh",
        .args = { fixture() },
        .env = std::move(env),
        .enabled = true,
    };
}

auto textOf(const ToolCallResult& result) -> std::string
{
    return std::get<TextContent>(result.content.at(0)).text;
}

} // namespace

TEST_CASE("ConnectionRegistry namespaces tools in connection order", "[registry]")
{
    auto fakes = FakeRegistry {};
    fakes.add("a", nlohmann::json::array({ tool("x") }));
    fakes.add("b", nlohmann::json::array({ tool("y", "does y") }));

    REQUIRE(fakes.registry.connect(descriptor("a")).has_value());
    REQUIRE(fakes.registry.connect(descriptor("b")).has_value());

    auto tools = fakes.registry.listAllTools();
    REQUIRE(tools.size() == 2);
    CHECK(tools[0].name == "a__x");
    CHECK(!tools[0].description.has_value());
    CHECK(tools[0].inputSchema == nlohmann::json { { "type", "object" } });
    CHECK(tools[1].name == "b__y");
    CHECK(tools[1].description == "[b] does y");

    CHECK(fakes.registry.connectedNames() == std::vector<std::string> { "a", "b" });
}

TEST_CASE("ConnectionRegistry routes a call to its backend only", "[registry]")
{
    auto fakes = FakeRegistry {};
    auto a = fakes.add("a", nlohmann::json::array({ tool("x") }));
    auto b = fakes.add("b", nlohmann::json::array({ tool("y") }));
    REQUIRE(fakes.registry.connect(descriptor("a")).has_value());
    REQUIRE(fakes.registry.connect(descriptor("b")).has_value());

    auto result = fakes.registry.callTool("a__x", { { "n", 1 } });
    REQUIRE(result.has_value());
    CHECK(textOf(*result) == R"(x:{"n":1})");

    auto const calls = a->sentWithMethod("tools/call");
    REQUIRE(calls.size() == 1);
    CHECK(calls[0]["params"]["name"] == "x");
    CHECK(calls[0]["params"]["arguments"] == nlohmann::json { { "n", 1 } });
    CHECK(b->sentWithMethod("tools/call").empty());
}

TEST_CASE("ConnectionRegistry reports unknown backends", "[registry]")
{
    auto fakes = FakeRegistry {};
    fakes.add("a", nlohmann::json::array({ tool("x") }));
    REQUIRE(fakes.registry.connect(descriptor("a")).has_value());

    auto result = fakes.registry.callTool("c__x", nlohmann::json::object());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::BackendNotFound);
    CHECK(result.error().message == "MCP server 'c' not connected");
}

TEST_CASE("ConnectionRegistry rejects tool names without a separator", "[registry]")
{
    auto fakes = FakeRegistry {};
    auto result = fakes.registry.callTool("noseparator", nlohmann::json::object());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidToolName);
}

TEST_CASE("ConnectionRegistry rejects names containing the separator", "[registry]")
{
    auto fakes = FakeRegistry {};
    fakes.add("my__server", nlohmann::json::array({ tool("x") }));

    auto result = fakes.registry.connect(descriptor("my__server"));
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidBackendName);
    CHECK(fakes.registry.size() == 0);
    CHECK(fakes.transports["my__server"]->sent().empty());
}

TEST_CASE("ConnectionRegistry rejects duplicate names", "[registry]")
{
    auto fakes = FakeRegistry {};
    fakes.add("a", nlohmann::json::array({ tool("x") }));
    REQUIRE(fakes.registry.connect(descriptor("a")).has_value());

    auto result = fakes.registry.connect(descriptor("a"));
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::DuplicateBackend);
    CHECK(fakes.registry.size() == 1);
    CHECK(fakes.registry.callTool("a__x", nlohmann::json::object()).has_value());
}

TEST_CASE("ConnectionRegistry does not register a backend whose handshake fails", "[registry]")
{
    auto fakes = FakeRegistry {};
    auto broken = std::make_shared<FakeTransport>([](const nlohmann::json& message) -> std::optional<nlohmann::json> {
        if (!message.contains("id"))
            return std::nullopt;
        return test::errorTo(message, -32603, "not today");
    });
    fakes.transports["broken"] = broken;

    auto result = fakes.registry.connect(descriptor("broken"));
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::HandshakeFailure);
    CHECK(fakes.registry.size() == 0);
    CHECK(!broken->isRunning());
}

TEST_CASE("ConnectionRegistry connectAll skips failures and disabled servers", "[registry]")
{
    auto fakes = FakeRegistry {};
    fakes.add("good", nlohmann::json::array({ tool("x") }));
    fakes.add("off", nlohmann::json::array({ tool("x") }));

    auto disabled = descriptor("off");
    disabled.enabled = false;

    fakes.registry.connectAll({ descriptor("missing"), descriptor("good"), disabled });

    CHECK(fakes.registry.connectedNames() == std::vector<std::string> { "good" });
    CHECK(fakes.transports["off"]->sent().empty());
}

TEST_CASE("ConnectionRegistry connectAll tolerates a command that does not exist", "[registry][process]")
{
    auto registry = ConnectionRegistry(ConnectionOptions { .requestTimeout = 5s, .terminateGrace = 500ms });

    registry.connectAll({
        ServerDescriptor {
            .name = "ghost",
            .command = "/nonexistent/mcp/server/binary",
            .args = {},
            .env = {},
            .enabled = true,
        },
        fixtureDescriptor("real"),
    });

    CHECK(registry.connectedNames() == std::vector<std::string> { "real" });

    auto tools = registry.listAllTools();
    REQUIRE(tools.size() == 2);
    CHECK(tools[0].name == "real__echo");
    CHECK(tools[0].description == "[real] Echoes a greeting");
    CHECK(tools[1].name == "real__env");
    CHECK(!tools[1].description.has_value());

    auto result = registry.callTool("real__echo", nlohmann::json::object());
    REQUIRE(result.has_value());
    CHECK(textOf(*result) == "echo from fake");
}

TEST_CASE("ConnectionRegistry passes descriptor environment to the backend", "[registry][process]")
{
    auto registry = ConnectionRegistry();
    REQUIRE(registry.connect(fixtureDescriptor("envy", { { "FAKE_BACKEND_VALUE", "s3cret" } })).has_value());

    auto result = registry.callTool("envy__env", nlohmann::json::object());
    REQUIRE(result.has_value());
    CHECK(textOf(*result) == "s3cret");
}

TEST_CASE("ConnectionRegistry keeps working when a backend emits garbage lines", "[registry][process]")
{
    auto registry = ConnectionRegistry();
    REQUIRE(registry.connect(fixtureDescriptor("noisy", { { "FAKE_BACKEND_GARBAGE", "1" } })).has_value());

    auto result = registry.callTool("noisy__echo", nlohmann::json::object());
    REQUIRE(result.has_value());
    CHECK(textOf(*result) == "echo from fake");
}

TEST_CASE("ConnectionRegistry calls to different backends proceed independently", "[registry][process]")
{
    auto registry = ConnectionRegistry();
    REQUIRE(registry.connect(fixtureDescriptor("slow", { { "FAKE_BACKEND_NAME", "slow" }, { "FAKE_BACKEND_DELAY", "2" } }))
                .has_value());
    REQUIRE(registry.connect(fixtureDescriptor("fast", { { "FAKE_BACKEND_NAME", "fast" } })).has_value());

    auto const start = std::chrono::steady_clock::now();
    auto slowCall = std::async(std::launch::async, [&] { return registry.callTool("slow__echo", nlohmann::json::object()); });
    std::this_thread::sleep_for(50ms);

    auto fast = registry.callTool("fast__echo", nlohmann::json::object());
    auto const fastElapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(fast.has_value());
    CHECK(textOf(*fast) == "echo from fast");
    CHECK(fastElapsed < 1500ms);

    auto slow = slowCall.get();
    REQUIRE(slow.has_value());
    CHECK(textOf(*slow) == "echo from slow");
    CHECK(std::chrono::steady_clock::now() - start >= 2s);
}

TEST_CASE("ConnectionRegistry fails fast when a backend process dies", "[registry][process]")
{
    auto registry = ConnectionRegistry(ConnectionOptions { .requestTimeout = 20s, .terminateGrace = 500ms });
    REQUIRE(registry.connect(fixtureDescriptor("doomed")).has_value());
    REQUIRE(registry.connect(fixtureDescriptor("survivor")).has_value());

    // The fixture exits without answering a call to "exit".
    auto const start = std::chrono::steady_clock::now();
    auto result = registry.callTool("doomed__exit", nlohmann::json::object());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConnectionClosed);
    CHECK(std::chrono::steady_clock::now() - start < 10s);

    // The dead backend is unregistered; its name and tools are gone.
    CHECK(registry.connectedNames() == std::vector<std::string> { "survivor" });
    CHECK(registry.size() == 1);
    CHECK(registry.find("doomed") == nullptr);
    for (auto const& t: registry.listAllTools())
        CHECK(t.name.starts_with("survivor__"));

    auto again = registry.callTool("doomed__echo", nlohmann::json::object());
    REQUIRE(!again.has_value());
    CHECK(again.error().code == ErrorCode::BackendNotFound);

    auto other = registry.callTool("survivor__echo", nlohmann::json::object());
    REQUIRE(other.has_value());
}

TEST_CASE("ConnectionRegistry stops reporting a backend whose stream ended", "[registry]")
{
    auto fakes = FakeRegistry {};
    auto a = fakes.connect("a", nlohmann::json::array({ tool("x") }));
    auto b = fakes.connect("b", nlohmann::json::array({ tool("y") }));
    REQUIRE(a != nullptr);
    REQUIRE(b != nullptr);

    a->endStream();

    // The reader notices the end of stream asynchronously.
    auto const deadline = std::chrono::steady_clock::now() + 5s;
    while (fakes.registry.size() != 1 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(10ms);

    CHECK(fakes.registry.connectedNames() == std::vector<std::string> { "b" });
    auto const tools = fakes.registry.listAllTools();
    REQUIRE(tools.size() == 1);
    CHECK(tools[0].name == "b__y");

    CHECK(fakes.registry.pruneDisconnected() == std::vector<std::string> { "a" });
    CHECK(fakes.registry.pruneDisconnected().empty());

    // The name can be reused once the dead backend is gone.
    REQUIRE(fakes.connect("a", nlohmann::json::array({ tool("z") })) != nullptr);
    CHECK(fakes.registry.connectedNames() == std::vector<std::string> { "b", "a" });
}

TEST_CASE("ConnectionRegistry handshake with a backend that exits fails with ConnectionClosed", "[registry][process]")
{
    auto registry = ConnectionRegistry();

    auto result = registry.connect(ServerDescriptor {
        .name = "quitter",
        .command = "sh",
        .args = { "-c", "read line; exit 0" },
        .env = {},
        .enabled = true,
    });

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConnectionClosed);
    CHECK(registry.size() == 0);
}

TEST_CASE("ConnectionRegistry disconnect and shutdownAll terminate backends", "[registry]")
{
    auto fakes = FakeRegistry {};
    auto a = fakes.add("a", nlohmann::json::array({ tool("x") }));
    auto b = fakes.add("b", nlohmann::json::array({ tool("y") }));
    REQUIRE(fakes.registry.connect(descriptor("a")).has_value());
    REQUIRE(fakes.registry.connect(descriptor("b")).has_value());

    fakes.registry.disconnect("a");
    fakes.registry.disconnect("not-there");
    CHECK(!a->isRunning());
    CHECK(fakes.registry.connectedNames() == std::vector<std::string> { "b" });

    auto gone = fakes.registry.callTool("a__x", nlohmann::json::object());
    REQUIRE(!gone.has_value());
    CHECK(gone.error().code == ErrorCode::BackendNotFound);

    fakes.registry.shutdownAll();
    CHECK(!b->isRunning());
    CHECK(fakes.registry.size() == 0);
    CHECK(fakes.registry.listAllTools().empty());
}

TEST_CASE("ConnectionRegistry shuts down backend processes on destruction", "[registry][process]")
{
    auto connection = std::shared_ptr<BackendConnection> {};
    {
        auto registry = ConnectionRegistry();
        REQUIRE(registry.connect(fixtureDescriptor("scoped")).has_value());
        connection = registry.find("scoped");
        REQUIRE(connection != nullptr);
        REQUIRE(connection->isRunning());
    }
    CHECK(connection->state() == ConnectionState::Terminated);
    CHECK(!connection->isRunning());
}
