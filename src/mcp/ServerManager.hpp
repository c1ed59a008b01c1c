// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Async.hpp>
#include <core/Error.hpp>
#include <core/EventLoop.hpp>
#include <core/Types.hpp>
#include <mcp/McpClient.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief Manages multiple MCP server connections and routes tool calls.
///
/// Everything runs on one EventLoop owned by the manager. Each operation has an
/// asynchronous form taking a continuation and a blocking form that drives the
/// loop until the result is available. Continuations always run from the loop,
/// never from inside the call that started the operation.
class ServerManager
{
  public:
    /// @brief Constructs a manager for the given servers.
    /// @param servers Initial server descriptors; a later entry replaces an earlier one of the same name.
    /// @param options Protocol settings and timeouts.
    explicit ServerManager(std::vector<ServerDescriptor> servers = {}, ClientOptions options = {});
    ~ServerManager();

    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    /// @brief Starts every enabled server concurrently, then refreshes the catalog.
    ///
    /// A server failing to start does not affect the others and is not reported as
    /// an error; its state becomes ConnectionState::Error. A no-op once initialized.
    void initializeAsync(VoidCallback onDone);
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Starts one registered server and performs its handshake.
    void initializeServerAsync(std::string_view name, VoidCallback onDone);
    [[nodiscard]] auto initializeServer(std::string_view name) -> VoidResult;

    /// @brief Re-lists tools and resources of every connected server.
    ///
    /// Listings that fail leave that server's earlier entries in place.
    void refreshCatalogAsync(VoidCallback onDone);
    [[nodiscard]] auto refreshCatalog() -> VoidResult;

    /// @brief Notifies connected servers, terminates all processes and clears the catalog.
    ///
    /// Waits until every process has exited. Calling it again is a no-op.
    void shutdownAsync(VoidCallback onDone);
    void shutdown();

    /// @brief Adds or replaces a server descriptor.
    ///
    /// Registering an enabled server while initialized re-runs initialize() for all
    /// enabled servers. Connected servers keep running; the others are (re)started.
    void registerServer(ServerDescriptor descriptor);

    /// @brief Removes a server descriptor. A running process keeps running until shutdown.
    void unregisterServer(std::string_view name);

    /// @brief Returns all registered server descriptors.
    [[nodiscard]] auto getServers() const -> std::vector<ServerDescriptor>;

    /// @brief Returns the connection state of a server (Disconnected if unknown).
    [[nodiscard]] auto serverState(std::string_view name) const -> ConnectionState;

    /// @brief Returns what a connected server reported during its handshake.
    [[nodiscard]] auto serverInfo(std::string_view name) const -> std::optional<ServerInfo>;

    [[nodiscard]] auto isInitialized() const -> bool;

    /// @brief Lists all tools currently in the catalog.
    [[nodiscard]] auto getAvailableTools() const -> std::vector<Tool>;

    /// @brief Looks up a tool by name.
    [[nodiscard]] auto getTool(std::string_view name) const -> std::optional<Tool>;

    /// @brief Refreshes the catalog and lists all resources.
    void listResourcesAsync(Callback<std::vector<Resource>> onResources);
    [[nodiscard]] auto listResources() -> Result<std::vector<Resource>>;

    /// @brief Reads a resource from its owning server.
    ///
    /// Yields std::nullopt if the URI is unknown or the content has neither text nor blob.
    void getResourceAsync(std::string_view uri, Callback<std::optional<std::string>> onContent);
    [[nodiscard]] auto getResource(std::string_view uri) -> Result<std::optional<std::string>>;

    /// @brief Calls a tool by name, routing to the server that provides it.
    ///
    /// The result object is returned as the server sent it, including isError.
    void callToolAsync(std::string_view name, nlohmann::json arguments, Callback<nlohmann::json> onResult);
    [[nodiscard]] auto callTool(std::string_view name, nlohmann::json arguments) -> Result<nlohmann::json>;

    /// @brief Sends an arbitrary request to one server.
    void sendRequestAsync(std::string_view serverName,
                          std::string_view method,
                          nlohmann::json params,
                          Callback<nlohmann::json> onResult);

    /// @brief Sends an arbitrary notification to one server.
    void sendNotificationAsync(std::string_view serverName,
                               std::string_view method,
                               nlohmann::json params,
                               VoidCallback onWritten);

    /// @brief Handles pending I/O, timers and notifications for at most @p maxWait.
    /// @return False if there was nothing to wait for.
    auto processEvents(std::chrono::milliseconds maxWait) -> bool;

    /// @brief Returns the number of requests awaiting a response.
    [[nodiscard]] auto pendingRequestCount() const -> std::size_t;

    [[nodiscard]] auto eventLoop() -> EventLoop&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcphub
