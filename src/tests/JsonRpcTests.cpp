// SPDX-License-Identifier: Apache-2.0
#include <mcp/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace mcpbridge;

TEST_CASE("makeRequest creates valid JSON-RPC 2.0 request", "[jsonrpc]")
{
    auto request = jsonrpc::makeRequest(1, "test/method");

    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["id"] == 1);
    CHECK(request["method"] == "test/method");
    CHECK(!request.contains("params"));
}

TEST_CASE("makeRequest includes params when provided", "[jsonrpc]")
{
    auto params = nlohmann::json { { "key", "value" } };
    auto request = jsonrpc::makeRequest(42, "test/method", params);

    CHECK(request["id"] == 42);
    REQUIRE(request.contains("params"));
    CHECK(request["params"]["key"] == "value");
}

TEST_CASE("makeNotification creates valid notification (no id)", "[jsonrpc]")
{
    auto notif = jsonrpc::makeNotification("notifications/initialized");

    CHECK(notif["jsonrpc"] == "2.0");
    CHECK(!notif.contains("id"));
    CHECK(!notif.contains("params"));
    CHECK(notif["method"] == "notifications/initialized");
}

TEST_CASE("makeErrorResponse carries code, message and id", "[jsonrpc]")
{
    auto response = jsonrpc::makeErrorResponse("abc", jsonrpc::ErrorCodes::MethodNotFound, "Method not found: x");

    CHECK(response["jsonrpc"] == "2.0");
    CHECK(response["id"] == "abc");
    CHECK(response["error"]["code"] == -32601);
    CHECK(response["error"]["message"] == "Method not found: x");
    CHECK(!response.contains("result"));
}

TEST_CASE("makeSuccessResponse keeps a null id", "[jsonrpc]")
{
    auto response = jsonrpc::makeSuccessResponse(nullptr, nlohmann::json::object());

    CHECK(response["id"].is_null());
    CHECK(response["result"] == nlohmann::json::object());
}

TEST_CASE("parseResponse handles success response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "result", { { "status", "ok" } } },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(result->isSuccess());
    CHECK(result->result->at("status") == "ok");
    CHECK(!result->error.has_value());
    CHECK(result->numericId() == 1);
}

TEST_CASE("parseResponse handles error response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "error",
          {
              { "code", -32600 },
              { "message", "Invalid Request" },
          } },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(!result->isSuccess());
    REQUIRE(result->error.has_value());
    CHECK(result->error->code == -32600);
    CHECK(result->error->message == "Invalid Request");
}

TEST_CASE("parseResponse rejects non-JSON-RPC messages", "[jsonrpc]")
{
    auto msg = nlohmann::json { { "version", "1.0" } };
    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("parseResponse handles response without result or error", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("parseResponse rejects a response carrying both result and error", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 3 },
        { "result", nlohmann::json::object() },
        { "error", { { "code", 1 }, { "message", "x" } } },
    };

    CHECK(!jsonrpc::parseResponse(msg).has_value());
}

TEST_CASE("parseResponse rejects backend-initiated requests", "[jsonrpc]")
{
    auto msg = jsonrpc::makeRequest(7, "sampling/createMessage");
    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("Response numericId is empty for string ids", "[jsonrpc]")
{
    auto msg = nlohmann::json { { "jsonrpc", "2.0" }, { "id", "x" }, { "result", 1 } };
    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(!result->numericId().has_value());
}

TEST_CASE("parseRequest accepts requests and notifications", "[jsonrpc]")
{
    auto request = jsonrpc::parseRequest(jsonrpc::makeRequest(5, "tools/list"));
    REQUIRE(request.has_value());
    CHECK(request->method == "tools/list");
    CHECK(!request->isNotification());
    CHECK(*request->id == 5);
    CHECK(!request->params.has_value());

    auto notification = jsonrpc::parseRequest(jsonrpc::makeNotification("notifications/initialized"));
    REQUIRE(notification.has_value());
    CHECK(notification->isNotification());
}

TEST_CASE("parseRequest rejects malformed shapes", "[jsonrpc]")
{
    CHECK(!jsonrpc::parseRequest(nlohmann::json::array()).has_value());
    CHECK(!jsonrpc::parseRequest(nlohmann::json { { "jsonrpc", "2.0" }, { "id", 1 } }).has_value());
    CHECK(!jsonrpc::parseRequest(nlohmann::json { { "jsonrpc", "2.0" }, { "id", 1 }, { "method", 42 } }).has_value());
    CHECK(!jsonrpc::parseRequest(nlohmann::json { { "jsonrpc", "2.0" }, { "id", { 1, 2 } }, { "method", "ping" } })
               .has_value());
}

TEST_CASE("parseRequest requires the 2.0 version tag", "[jsonrpc]")
{
    auto missing = jsonrpc::parseRequest(nlohmann::json { { "id", 1 }, { "method", "ping" } });
    REQUIRE(!missing.has_value());
    CHECK(missing.error().code == ErrorCode::ProtocolError);

    CHECK(!jsonrpc::parseRequest(nlohmann::json { { "jsonrpc", "1.0" }, { "id", 1 }, { "method", "ping" } }).has_value());
    CHECK(!jsonrpc::parseRequest(nlohmann::json { { "jsonrpc", 2 }, { "id", 1 }, { "method", "ping" } }).has_value());
}

TEST_CASE("serialize replaces invalid UTF-8 instead of throwing", "[jsonrpc]")
{
    auto const message = jsonrpc::makeErrorResponse(nullptr, jsonrpc::ErrorCodes::ParseError, "last read: '\xFF'");

    auto line = std::string {};
    REQUIRE_NOTHROW(line = jsonrpc::serialize(message));
    CHECK(line.find('\n') == std::string::npos);

    auto const reparsed = nlohmann::json::parse(line);
    CHECK(reparsed["error"]["message"] == "last read: '\xEF\xBF\xBD'");
}
