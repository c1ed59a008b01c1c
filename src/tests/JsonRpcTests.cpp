// SPDX-License-Identifier: Apache-2.0
#include <mcp/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mcphub;

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
    auto notif = jsonrpc::makeNotification("notifications/initialized", nlohmann::json::object());

    CHECK(notif["jsonrpc"] == "2.0");
    CHECK(!notif.contains("id"));
    CHECK(notif["method"] == "notifications/initialized");
    CHECK(notif["params"].is_object());
}

TEST_CASE("makeResult and makeErrorResponse echo the peer's id", "[jsonrpc]")
{
    auto const id = nlohmann::json("srv-7");

    auto ok = jsonrpc::makeResult(id, nlohmann::json::object());
    CHECK(ok["id"] == "srv-7");
    CHECK(ok["result"].is_object());

    auto failed = jsonrpc::makeErrorResponse(id, jsonrpc::errors::MethodNotFound, "Method not found: sampling");
    CHECK(failed["id"] == "srv-7");
    CHECK(failed["error"]["code"] == -32601);
    CHECK(failed["error"]["message"] == "Method not found: sampling");
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

TEST_CASE("parseMessage classifies responses, requests and notifications", "[jsonrpc]")
{
    SECTION("id without method is a response")
    {
        auto message = jsonrpc::parseMessage({ { "jsonrpc", "2.0" }, { "id", 3 }, { "result", { { "x", 1 } } } });
        REQUIRE(message.has_value());
        REQUIRE(std::holds_alternative<jsonrpc::Response>(*message));
        CHECK(std::get<jsonrpc::Response>(*message).id == 3);
    }

    SECTION("id and method is a server request")
    {
        auto message = jsonrpc::parseMessage({ { "jsonrpc", "2.0" }, { "id", "a" }, { "method", "ping" } });
        REQUIRE(message.has_value());
        REQUIRE(std::holds_alternative<jsonrpc::Request>(*message));
        CHECK(std::get<jsonrpc::Request>(*message).id == "a");
        CHECK(std::get<jsonrpc::Request>(*message).method == "ping");
    }

    SECTION("method without id is a notification")
    {
        auto message = jsonrpc::parseMessage(
            { { "jsonrpc", "2.0" }, { "method", "notifications/tools/list_changed" }, { "params", { { "a", 1 } } } });
        REQUIRE(message.has_value());
        REQUIRE(std::holds_alternative<jsonrpc::Notification>(*message));
        CHECK(std::get<jsonrpc::Notification>(*message).method == "notifications/tools/list_changed");
        CHECK(std::get<jsonrpc::Notification>(*message).params["a"] == 1);
    }

    SECTION("null id with method is a notification")
    {
        auto message = jsonrpc::parseMessage({ { "jsonrpc", "2.0" }, { "id", nullptr }, { "method", "log" } });
        REQUIRE(message.has_value());
        CHECK(std::holds_alternative<jsonrpc::Notification>(*message));
    }

    SECTION("neither id nor method is rejected")
    {
        auto message = jsonrpc::parseMessage({ { "jsonrpc", "2.0" }, { "result", 1 } });
        REQUIRE(!message.has_value());
        CHECK(message.error().code == ErrorCode::ProtocolError);
    }

    SECTION("wrong protocol version is rejected")
    {
        auto message = jsonrpc::parseMessage({ { "jsonrpc", "1.0" }, { "id", 1 }, { "result", 1 } });
        REQUIRE(!message.has_value());
        CHECK(message.error().code == ErrorCode::ProtocolError);
    }
}
