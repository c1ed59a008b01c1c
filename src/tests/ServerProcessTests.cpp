// SPDX-License-Identifier: Apache-2.0
#include <mcp/ServerProcess.hpp>

#include <catch2/catch_test_macros.hpp>

#include <csignal>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

#include <sys/wait.h>

using namespace mcphub;
using namespace std::chrono_literals;

namespace
{

struct Recorder
{
    std::vector<jsonrpc::Message> messages;
    std::optional<int> exitStatus;
    bool messageBeforeExit = false;

    auto handlers() -> ServerProcessHandlers
    {
        return ServerProcessHandlers {
            .onMessage = [this](jsonrpc::Message message) { messages.push_back(std::move(message)); },
            .onExit =
                [this](int status) {
                    messageBeforeExit = !messages.empty();
                    exitStatus = status;
                },
        };
    }
};

auto shell(std::string script) -> ServerDescriptor
{
    return ServerDescriptor { .name = "sh", .command = "/bin/sh", .args = { "-c", std::move(script) } };
}

} // namespace

TEST_CASE("ServerProcess starts disconnected", "[process]")
{
    auto loop = EventLoop {};
    auto process = ServerProcess(loop, "idle", {});
    CHECK(!process.isConnected());
    CHECK(!process.isRunning());
}

TEST_CASE("ServerProcess send fails when not connected", "[process]")
{
    auto loop = EventLoop {};
    auto process = ServerProcess(loop, "idle", {});

    auto written = std::optional<VoidResult> {};
    process.send(nlohmann::json { { "test", true } }, [&](VoidResult result) { written = result; });
    loop.runUntil([&] { return written.has_value(); });

    REQUIRE(!written->has_value());
    CHECK(written->error().code == ErrorCode::TransportError);
}

TEST_CASE("ServerProcess round-trips messages through a child process", "[process]")
{
    auto loop = EventLoop {};
    auto recorder = Recorder {};
    auto process = ServerProcess(loop, "cat", recorder.handlers());

    REQUIRE(process.start(ServerDescriptor { .name = "cat", .command = "cat" }).has_value());
    CHECK(process.isConnected());
    CHECK(process.pid() > 0);

    auto written = std::optional<VoidResult> {};
    process.send(jsonrpc::makeRequest(5, "ping"), [&](VoidResult result) { written = result; });
    loop.runUntil([&] { return !recorder.messages.empty(); });

    REQUIRE(written.has_value());
    CHECK(written->has_value());
    REQUIRE(std::holds_alternative<jsonrpc::Request>(recorder.messages[0]));
    CHECK(std::get<jsonrpc::Request>(recorder.messages[0]).method == "ping");

    process.closeStdin();
    CHECK(!process.isConnected());
    loop.runUntil([&] { return recorder.exitStatus.has_value(); });

    REQUIRE(recorder.exitStatus.has_value());
    CHECK(WIFEXITED(*recorder.exitStatus));
    CHECK(WEXITSTATUS(*recorder.exitStatus) == 0);
    CHECK(!process.isRunning());
}

TEST_CASE("ServerProcess delivers output written right before exit", "[process]")
{
    auto loop = EventLoop {};
    auto recorder = Recorder {};
    auto process = ServerProcess(loop, "sh", recorder.handlers());

    REQUIRE(process.start(shell(R"(echo '{"jsonrpc":"2.0","method":"bye"}'; exit 3)")).has_value());
    loop.runUntil([&] { return recorder.exitStatus.has_value(); });

    CHECK(recorder.messageBeforeExit);
    REQUIRE(recorder.messages.size() == 1);
    CHECK(std::get<jsonrpc::Notification>(recorder.messages[0]).method == "bye");
    CHECK(describeExitStatus(*recorder.exitStatus) == "exit code 3");
}

TEST_CASE("ServerProcess overlays the configured environment", "[process]")
{
    auto loop = EventLoop {};
    auto recorder = Recorder {};
    auto process = ServerProcess(loop, "sh", recorder.handlers());

    auto descriptor = shell(R"(printf '{"jsonrpc":"2.0","method":"%s","params":{"home":"%s"}}\n' "$MCPHUB_TEST_VAR" "${HOME:+set}")");
    descriptor.env["MCPHUB_TEST_VAR"] = "overlaid";

    REQUIRE(process.start(descriptor).has_value());
    loop.runUntil([&] { return recorder.exitStatus.has_value(); });

    REQUIRE(recorder.messages.size() == 1);
    auto const& notification = std::get<jsonrpc::Notification>(recorder.messages[0]);
    CHECK(notification.method == "overlaid");
    if (std::getenv("HOME"))
        CHECK(notification.params["home"] == "set");
}

TEST_CASE("ServerProcess escalates to SIGKILL when SIGTERM is ignored", "[process]")
{
    auto loop = EventLoop {};
    auto recorder = Recorder {};
    auto process = ServerProcess(loop, "stubborn", recorder.handlers());

    REQUIRE(process.start(shell(R"(trap '' TERM; exec sleep 30)")).has_value());
    // Give the shell time to install the trap before signalling it.
    loop.startTimer(100ms, [] {});
    loop.runOnce(200ms);

    process.terminate(100ms);
    loop.runUntil([&] { return recorder.exitStatus.has_value(); });

    REQUIRE(recorder.exitStatus.has_value());
    REQUIRE(WIFSIGNALED(*recorder.exitStatus));
    CHECK(WTERMSIG(*recorder.exitStatus) == SIGKILL);
}

TEST_CASE("ServerProcess fails to start invalid command", "[process]")
{
    auto loop = EventLoop {};
    auto process = ServerProcess(loop, "missing", {});

    auto result = process.start(ServerDescriptor { .name = "missing", .command = "/nonexistent/mcp-server" });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProcessError);
    CHECK(!process.isRunning());
}

TEST_CASE("ServerProcess rejects an empty command", "[process]")
{
    auto loop = EventLoop {};
    auto process = ServerProcess(loop, "empty", {});

    auto result = process.start(ServerDescriptor { .name = "empty" });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("ServerProcess starts servers with default SIGPIPE handling", "[process]")
{
    // Even a host that ignores SIGPIPE must not pass that on to its servers.
    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    struct sigaction saved {};
    REQUIRE(sigaction(SIGPIPE, &ignore, &saved) == 0);

    auto loop = EventLoop {};
    auto recorder = Recorder {};
    auto process = ServerProcess(loop, "sh", recorder.handlers());
    auto const started = process.start(
        shell(R"sh(printf '{"jsonrpc":"2.0","method":"%s"}\n' "$(sed -n 's/^SigIgn:[[:space:]]*//p' /proc/self/status)")sh"));
    sigaction(SIGPIPE, &saved, nullptr);

    REQUIRE(started.has_value());
    loop.runUntil([&] { return recorder.exitStatus.has_value(); });

    REQUIRE(recorder.messages.size() == 1);
    auto const ignoredMask = std::stoull(std::get<jsonrpc::Notification>(recorder.messages[0]).method, nullptr, 16);
    CHECK((ignoredMask & (1ull << (SIGPIPE - 1))) == 0);
}

TEST_CASE("ServerProcess reports writes to a closed stdin without touching SIGPIPE", "[process]")
{
    struct sigaction before {};
    REQUIRE(sigaction(SIGPIPE, nullptr, &before) == 0);

    auto loop = EventLoop {};
    auto recorder = Recorder {};
    auto process = ServerProcess(loop, "deaf", recorder.handlers());
    REQUIRE(process.start(shell(R"(exec 0<&-; exec sleep 5)")).has_value());

    // Give the shell time to close its stdin.
    loop.startTimer(150ms, [] {});
    loop.runOnce(300ms);
    REQUIRE(process.isConnected());

    auto written = std::optional<VoidResult> {};
    process.send(jsonrpc::makeNotification("notifications/initialized", nlohmann::json::object()),
                 [&](VoidResult result) { written = result; });
    loop.runUntil([&] { return written.has_value(); });

    REQUIRE(!written->has_value());
    CHECK(written->error().code == ErrorCode::TransportError);

    struct sigaction after {};
    REQUIRE(sigaction(SIGPIPE, nullptr, &after) == 0);
    CHECK(after.sa_handler == before.sa_handler);

    auto pending = sigset_t {};
    sigemptyset(&pending);
    sigpending(&pending);
    CHECK(sigismember(&pending, SIGPIPE) == 0);
}
