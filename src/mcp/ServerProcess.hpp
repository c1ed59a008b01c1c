// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/EventLoop.hpp>
#include <core/Types.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/Transport.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include <sys/types.h>

namespace mcphub
{

/// @brief Callbacks through which a ServerProcess reports incoming traffic and exit.
struct ServerProcessHandlers
{
    /// @brief Receives every well-formed JSON-RPC message from stdout, in arrival order.
    std::function<void(jsonrpc::Message message)> onMessage;

    /// @brief Invoked once after the process has been reaped; receives the waitpid() status.
    std::function<void(int status)> onExit;
};

/// @brief Owns one MCP server subprocess speaking newline-delimited JSON over stdio.
///
/// stdin, stdout and stderr are piped and serviced non-blocking on the event loop.
/// stdout is framed into JSON-RPC messages; stderr is only logged.
class ServerProcess: public Transport
{
  public:
    ServerProcess(EventLoop& loop, std::string serverName, ServerProcessHandlers handlers);
    ~ServerProcess() override;

    ServerProcess(const ServerProcess&) = delete;
    ServerProcess& operator=(const ServerProcess&) = delete;

    /// @brief Spawns the server process.
    /// @param descriptor The server configuration (command, args, env).
    /// @return Success or a ProcessError if the process could not be spawned.
    [[nodiscard]] auto start(const ServerDescriptor& descriptor) -> VoidResult;

    void send(const nlohmann::json& message, VoidCallback onWritten) override;

    /// @brief Returns true while the process is running and its stdin is open.
    [[nodiscard]] auto isConnected() const -> bool override;

    /// @brief Returns true until the process has been reaped.
    [[nodiscard]] auto isRunning() const -> bool;

    [[nodiscard]] auto pid() const -> pid_t;

    /// @brief Closes the process's stdin. Queued writes fail.
    void closeStdin();

    /// @brief Closes stdin and sends SIGTERM, escalating to SIGKILL after @p killTimeout.
    void terminate(std::chrono::milliseconds killTimeout);

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

/// @brief Renders a waitpid() status for log messages, e.g. "exit code 1" or "signal 9".
[[nodiscard]] auto describeExitStatus(int status) -> std::string;

} // namespace mcphub
