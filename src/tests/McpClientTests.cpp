// SPDX-License-Identifier: Apache-2.0
#include <mcp/McpClient.hpp>

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>
#include <vector>

using namespace mcphub;
using namespace std::chrono_literals;

namespace
{

auto testServer(std::vector<std::string> args = {}) -> ServerDescriptor
{
    return ServerDescriptor { .name = "client-test", .command = MCPHUB_TEST_SERVER_PATH, .args = std::move(args) };
}

/// @brief Event loop, correlator and options shared by one client under test.
struct Fixture
{
    EventLoop loop;
    ClientOptions options;
    RequestCorrelator correlator { loop, 5000ms };

    Fixture() { options.killTimeout = 200ms; }

    auto connect(McpClient& client) -> VoidResult
    {
        return awaitResult<void>(loop, [&](VoidCallback done) { client.connect(std::move(done)); });
    }

    void stop(McpClient& client)
    {
        auto exited = false;
        client.setExitHandler([&](const std::string&) { exited = true; });
        client.terminate();
        loop.runUntil([&] { return exited || !client.hasProcess(); });
    }
};

} // namespace

TEST_CASE("McpClient performs the initialize handshake", "[mcp]")
{
    auto fixture = Fixture {};
    auto client = McpClient(fixture.loop, fixture.correlator, testServer({ "--name", "handshake" }), fixture.options);
    CHECK(client.state() == ConnectionState::Disconnected);

    REQUIRE(fixture.connect(client).has_value());
    CHECK(client.state() == ConnectionState::Connected);
    CHECK(client.hasProcess());
    CHECK(client.serverInfo().name == "handshake");
    CHECK(client.serverInfo().version == "1.0.0");
    CHECK(client.serverInfo().hasTools);

    fixture.stop(client);
}

TEST_CASE("McpClient joins concurrent connect attempts", "[mcp]")
{
    auto fixture = Fixture {};
    auto client = McpClient(fixture.loop, fixture.correlator, testServer(), fixture.options);

    auto results = std::vector<VoidResult> {};
    client.connect([&](VoidResult result) { results.push_back(result); });
    client.connect([&](VoidResult result) { results.push_back(result); });
    fixture.loop.runUntil([&] { return results.size() == 2; });

    REQUIRE(results.size() == 2);
    CHECK(results[0].has_value());
    CHECK(results[1].has_value());
    // One handshake: initialize is the only request sent so far.
    CHECK(fixture.correlator.lastRequestId() == 1);

    // Connecting again completes without a new handshake.
    REQUIRE(fixture.connect(client).has_value());
    CHECK(fixture.correlator.lastRequestId() == 1);

    fixture.stop(client);
}

TEST_CASE("McpClient lists tools across pages", "[mcp]")
{
    auto fixture = Fixture {};
    auto client = McpClient(fixture.loop, fixture.correlator, testServer({ "--page-size", "3" }), fixture.options);
    REQUIRE(fixture.connect(client).has_value());

    auto tools = awaitResult<std::vector<Tool>>(fixture.loop, [&](Callback<std::vector<Tool>> done) {
        client.listTools(std::move(done));
    });
    REQUIRE(tools.has_value());
    REQUIRE(tools->size() == 7);
    CHECK((*tools)[0].name == "echo");
    CHECK((*tools)[0].serverName == "client-test");
    CHECK((*tools)[0].inputSchema["type"] == "object");

    fixture.stop(client);
}

TEST_CASE("McpClient reports missing resources as RPC errors", "[mcp]")
{
    auto fixture = Fixture {};
    auto client = McpClient(fixture.loop, fixture.correlator, testServer(), fixture.options);
    REQUIRE(fixture.connect(client).has_value());

    auto content = awaitResult<std::optional<std::string>>(
        fixture.loop, [&](Callback<std::optional<std::string>> done) { client.readResource("mem://none", std::move(done)); });
    REQUIRE(!content.has_value());
    CHECK(content.error().code == ErrorCode::RpcError);

    fixture.stop(client);
}

TEST_CASE("McpClient refuses transports other than stdio", "[mcp]")
{
    auto fixture = Fixture {};
    auto descriptor = testServer();
    descriptor.transport = TransportKind::WebSocket;
    auto client = McpClient(fixture.loop, fixture.correlator, descriptor, fixture.options);

    auto result = fixture.connect(client);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
    CHECK(client.state() == ConnectionState::Error);
    CHECK(!client.hasProcess());
}

TEST_CASE("McpClient requests fail fast without a process", "[mcp]")
{
    auto fixture = Fixture {};
    auto client = McpClient(fixture.loop, fixture.correlator, testServer(), fixture.options);

    auto result = awaitResult<nlohmann::json>(fixture.loop, [&](Callback<nlohmann::json> done) {
        client.callTool("echo", nlohmann::json::object(), std::move(done));
    });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::NotConnected);
}
