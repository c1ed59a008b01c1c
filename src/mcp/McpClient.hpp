// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Async.hpp>
#include <core/EventLoop.hpp>
#include <core/Log.hpp>
#include <core/Types.hpp>
#include <mcp/RequestCorrelator.hpp>
#include <mcp/ServerProcess.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcphub
{

/// @brief Protocol settings shared by all server connections.
struct ClientOptions
{
    std::string protocolVersion = "2024-11-05";
    ClientInfo clientInfo;
    std::chrono::milliseconds requestTimeout { 30000 };
    std::chrono::milliseconds killTimeout { 5000 };
};

/// @brief Client side of one MCP server connection.
///
/// Owns the server's process and connection state, performs the
/// initialize/initialized handshake and issues the MCP methods. Requests are
/// correlated by the RequestCorrelator shared with all other servers.
class McpClient
{
  public:
    using ExitHandler = std::function<void(const std::string& serverName)>;

    McpClient(EventLoop& loop, RequestCorrelator& correlator, ServerDescriptor descriptor, const ClientOptions& options);
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    [[nodiscard]] auto name() const -> const std::string& { return _descriptor.name; }
    [[nodiscard]] auto descriptor() const -> const ServerDescriptor& { return _descriptor; }

    /// @brief Replaces the descriptor; takes effect the next time the server is started.
    void setDescriptor(ServerDescriptor descriptor);

    [[nodiscard]] auto state() const -> ConnectionState { return _state; }

    /// @brief Returns what the server reported during the handshake (valid once connected).
    [[nodiscard]] auto serverInfo() const -> const ServerInfo& { return _serverInfo; }

    /// @brief Returns true while a process handle exists.
    [[nodiscard]] auto hasProcess() const -> bool { return _process != nullptr; }

    /// @brief Returns the live connection, or nullptr if there is no process.
    [[nodiscard]] auto transport() -> Transport* { return _process.get(); }

    /// @brief Installs a handler invoked after the server's process has exited.
    void setExitHandler(ExitHandler handler);

    /// @brief Spawns the server and performs the handshake.
    ///
    /// Completes immediately if the server is already connected; joins the
    /// ongoing attempt if a connection is in progress.
    void connect(VoidCallback onConnected);

    /// @brief Sends a request to this server.
    void request(std::string_view method, nlohmann::json params, Callback<nlohmann::json> onResult);

    /// @brief Sends a notification to this server.
    void notify(std::string_view method, nlohmann::json params, VoidCallback onWritten);

    /// @brief Issues tools/list, following pagination cursors.
    void listTools(Callback<std::vector<Tool>> onTools);

    /// @brief Issues resources/list, following pagination cursors.
    void listResources(Callback<std::vector<Resource>> onResources);

    /// @brief Issues resources/read and decodes the first content entry.
    ///
    /// Yields the entry's text, or its base64-decoded blob, or std::nullopt if it has neither.
    void readResource(std::string_view uri, Callback<std::optional<std::string>> onContent);

    /// @brief Issues tools/call and yields the result verbatim.
    void callTool(std::string_view toolName, const nlohmann::json& arguments, Callback<nlohmann::json> onResult);

    /// @brief Closes stdin, sends SIGTERM and schedules SIGKILL after the kill timeout.
    void terminate();

    /// @brief Drops the connection state back to Disconnected. Only valid without a process.
    void reset();

  private:
    void setState(ConnectionState state);
    void handshake();
    void finishConnect(VoidResult result);
    void handleExit(int status);
    void listAll(std::string method,
                 std::string key,
                 std::optional<std::string> cursor,
                 std::shared_ptr<std::vector<nlohmann::json>> items,
                 std::size_t page,
                 Callback<std::vector<nlohmann::json>> onItems);

    EventLoop& _loop;
    RequestCorrelator& _correlator;
    ServerDescriptor _descriptor;
    const ClientOptions& _options;
    log::Logger _logger;

    ConnectionState _state = ConnectionState::Disconnected;
    ServerInfo _serverInfo;
    std::unique_ptr<ServerProcess> _process;
    std::vector<VoidCallback> _connectWaiters;
    ExitHandler _exitHandler;
};

} // namespace mcphub
