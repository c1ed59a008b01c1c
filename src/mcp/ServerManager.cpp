// SPDX-License-Identifier: Apache-2.0
#include "ServerManager.hpp"

#include <core/Log.hpp>
#include <mcp/Catalog.hpp>
#include <mcp/RequestCorrelator.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <format>
#include <functional>
#include <map>
#include <type_traits>
#include <utility>

namespace mcphub
{

namespace
{
    // Server notifications announcing that the catalog should be re-listed.
    constexpr auto ListChangedNotifications = std::array<std::string_view, 4> {
        "roots/list_changed",
        "notifications/roots/list_changed",
        "notifications/tools/list_changed",
        "notifications/resources/list_changed",
    };

    auto isListChanged(std::string_view method) -> bool
    {
        return std::ranges::find(ListChangedNotifications, method) != ListChangedNotifications.end();
    }
} // namespace

struct ServerManager::Impl
{
    ClientOptions options;
    EventLoop loop;
    RequestCorrelator correlator;
    Catalog catalog;
    std::map<std::string, ServerDescriptor, std::less<>> descriptors;
    std::map<std::string, std::unique_ptr<McpClient>, std::less<>> clients;

    bool initialized = false;
    bool initializing = false;
    std::vector<VoidCallback> initWaiters;

    bool refreshing = false;
    bool refreshAgain = false;
    std::vector<VoidCallback> refreshWaiters;

    bool shuttingDown = false;
    bool terminating = false;
    std::uint64_t shutdownGeneration = 0;
    std::vector<VoidCallback> shutdownWaiters;

    explicit Impl(ClientOptions clientOptions):
        options(std::move(clientOptions)), correlator(loop, options.requestTimeout)
    {
        correlator.setNotificationHandler(
            [this](const std::string& serverName, const jsonrpc::Notification& notification) {
                handleNotification(serverName, notification);
            });
        correlator.setRequestHandler([this](const std::string& serverName, const jsonrpc::Request& request) {
            handleServerRequest(serverName, request);
        });
    }

    template <typename T>
    void deliver(const Callback<T>& callback, std::type_identity_t<Result<T>> result)
    {
        if (!callback)
            return;
        loop.post([callback, result = std::move(result)]() mutable { callback(std::move(result)); });
    }

    [[nodiscard]] auto findClient(std::string_view name) -> McpClient*
    {
        auto const it = clients.find(name);
        return it != clients.end() ? it->second.get() : nullptr;
    }

    auto ensureClient(const ServerDescriptor& descriptor) -> McpClient&
    {
        if (auto* client = findClient(descriptor.name))
        {
            client->setDescriptor(descriptor);
            return *client;
        }

        auto client = std::make_unique<McpClient>(loop, correlator, descriptor, options);
        client->setExitHandler([this](const std::string& serverName) { handleExit(serverName); });
        auto& ref = *client;
        clients.emplace(descriptor.name, std::move(client));
        return ref;
    }

    void ensureInitialized(std::function<void()> then)
    {
        if (initialized)
        {
            then();
            return;
        }
        initializeAll([then = std::move(then)](VoidResult) { then(); });
    }

    void initializeServer(std::string_view name, VoidCallback onDone)
    {
        auto const it = descriptors.find(name);
        if (it == descriptors.end())
        {
            deliver(onDone, makeError(ErrorCode::NotFound, std::format("Unknown MCP server: {}", name)));
            return;
        }

        ensureClient(it->second).connect(std::move(onDone));
    }

    void initializeAll(VoidCallback onDone)
    {
        if (initialized)
        {
            deliver(onDone, {});
            return;
        }

        initWaiters.push_back(std::move(onDone));
        if (initializing)
            return;
        initializing = true;

        auto names = std::vector<std::string> {};
        for (const auto& [name, descriptor]: descriptors)
        {
            if (descriptor.enabled)
                names.push_back(name);
        }

        log::info("Initializing {} MCP server(s)", names.size());

        auto const generation = shutdownGeneration;
        auto join = Join::create(names.size(), [this, generation] {
            refreshAll([this, generation](VoidResult) {
                initializing = false;
                if (generation == shutdownGeneration)
                    initialized = true;
                auto waiters = std::exchange(initWaiters, {});
                for (auto& waiter: waiters)
                    deliver(waiter, {});
            });
        });

        for (const auto& name: names)
        {
            initializeServer(name, [join, name](VoidResult result) {
                if (!result)
                    log::warning("Failed to initialize MCP server '{}': {}", name, result.error().message);
                join->settle();
            });
        }
    }

    void refreshAll(VoidCallback onDone)
    {
        refreshWaiters.push_back(std::move(onDone));
        if (refreshing)
        {
            refreshAgain = true;
            return;
        }
        runRefresh();
    }

    void runRefresh()
    {
        refreshing = true;
        refreshAgain = false;
        auto waiters = std::exchange(refreshWaiters, {});

        auto connected = std::vector<McpClient*> {};
        for (auto& [name, client]: clients)
        {
            if (client->state() == ConnectionState::Connected)
                connected.push_back(client.get());
        }

        auto join = Join::create(connected.size() * 2, [this, waiters = std::move(waiters)] {
            refreshing = false;
            log::info("Catalog holds {} tool(s) and {} resource(s)", catalog.toolCount(), catalog.resourceCount());
            for (const auto& waiter: waiters)
                deliver(waiter, {});
            if (refreshAgain)
                runRefresh();
        });

        for (auto* client: connected)
        {
            auto const serverName = client->name();
            client->listTools([this, join, serverName](Result<std::vector<Tool>> tools) {
                if (tools)
                {
                    log::debug("Server '{}' lists {} tool(s)", serverName, tools->size());
                    catalog.upsertTools(std::move(*tools));
                }
                else
                {
                    log::warning("Failed to list tools for server '{}': {}", serverName, tools.error().message);
                }
                join->settle();
            });

            client->listResources([this, join, serverName](Result<std::vector<Resource>> resources) {
                if (resources)
                {
                    log::debug("Server '{}' lists {} resource(s)", serverName, resources->size());
                    catalog.upsertResources(std::move(*resources));
                }
                else
                {
                    log::warning(
                        "Failed to list resources for server '{}': {}", serverName, resources.error().message);
                }
                join->settle();
            });
        }
    }

    void shutdownAll(VoidCallback onDone)
    {
        shutdownWaiters.push_back(std::move(onDone));
        if (shuttingDown)
            return;

        auto const anyProcess =
            std::ranges::any_of(clients, [](const auto& entry) { return entry.second->hasProcess(); });
        if (!initialized && !initializing && !anyProcess)
        {
            for (auto& waiter: std::exchange(shutdownWaiters, {}))
                deliver(waiter, {});
            return;
        }

        log::info("Shutting down MCP servers");
        shuttingDown = true;
        initialized = false;
        ++shutdownGeneration;

        auto targets = std::vector<McpClient*> {};
        for (auto& [name, client]: clients)
        {
            if (client->state() == ConnectionState::Connected || client->state() == ConnectionState::Initializing)
                targets.push_back(client.get());
        }

        auto join = Join::create(targets.size(), [this] { terminateAll(); });
        for (auto* client: targets)
        {
            client->notify("notifications/shutdown",
                           nlohmann::json::object(),
                           [join, serverName = client->name()](VoidResult result) {
                               if (!result)
                               {
                                   log::warning("Shutdown notification to server '{}' failed: {}",
                                                serverName,
                                                result.error().message);
                               }
                               join->settle();
                           });
        }
    }

    void terminateAll()
    {
        terminating = true;
        for (auto& [name, client]: clients)
            client->terminate();
        checkShutdownComplete();
    }

    void checkShutdownComplete()
    {
        if (!terminating)
            return;
        if (std::ranges::any_of(clients, [](const auto& entry) { return entry.second->hasProcess(); }))
            return;

        terminating = false;
        loop.post([this] { finishShutdown(); });
    }

    void finishShutdown()
    {
        catalog.clear();
        std::erase_if(clients, [this](const auto& entry) { return !descriptors.contains(entry.first); });
        for (auto& [name, client]: clients)
            client->reset();

        shuttingDown = false;
        log::info("MCP servers shut down");

        for (auto& waiter: std::exchange(shutdownWaiters, {}))
            deliver(waiter, {});
    }

    void handleExit(const std::string& serverName)
    {
        log::debug("Server '{}' process exited", serverName);
        checkShutdownComplete();
    }

    void handleNotification(const std::string& serverName, const jsonrpc::Notification& notification)
    {
        if (isListChanged(notification.method))
        {
            log::info("Server '{}' reported '{}', refreshing catalog", serverName, notification.method);
            refreshAll(nullptr);
            return;
        }

        log::debug("Ignoring notification '{}' from server '{}'", notification.method, serverName);
    }

    void handleServerRequest(const std::string& serverName, const jsonrpc::Request& request)
    {
        auto response = nlohmann::json {};
        if (request.method == "ping")
            response = jsonrpc::makeResult(request.id, nlohmann::json::object());
        else if (request.method == "roots/list")
            response = jsonrpc::makeResult(request.id, nlohmann::json { { "roots", nlohmann::json::array() } });
        else
            response = jsonrpc::makeErrorResponse(
                request.id, jsonrpc::errors::MethodNotFound, std::format("Method not found: {}", request.method));

        auto* client = findClient(serverName);
        if (!client || !client->transport())
            return;

        client->transport()->send(response, [serverName](VoidResult written) {
            if (!written)
                log::warning("Failed to answer server '{}': {}", serverName, written.error().message);
        });
    }
};

ServerManager::ServerManager(std::vector<ServerDescriptor> servers, ClientOptions options):
    _impl(std::make_unique<Impl>(std::move(options)))
{
    for (auto& server: servers)
    {
        auto name = server.name;
        _impl->descriptors.insert_or_assign(std::move(name), std::move(server));
    }
}

ServerManager::~ServerManager()
{
    shutdown();
}

void ServerManager::initializeAsync(VoidCallback onDone)
{
    _impl->initializeAll(std::move(onDone));
}

auto ServerManager::initialize() -> VoidResult
{
    return awaitResult<void>(_impl->loop, [this](VoidCallback done) { initializeAsync(std::move(done)); });
}

void ServerManager::initializeServerAsync(std::string_view name, VoidCallback onDone)
{
    _impl->initializeServer(name, std::move(onDone));
}

auto ServerManager::initializeServer(std::string_view name) -> VoidResult
{
    return awaitResult<void>(_impl->loop,
                             [this, name](VoidCallback done) { initializeServerAsync(name, std::move(done)); });
}

void ServerManager::refreshCatalogAsync(VoidCallback onDone)
{
    _impl->refreshAll(std::move(onDone));
}

auto ServerManager::refreshCatalog() -> VoidResult
{
    return awaitResult<void>(_impl->loop, [this](VoidCallback done) { refreshCatalogAsync(std::move(done)); });
}

void ServerManager::shutdownAsync(VoidCallback onDone)
{
    _impl->shutdownAll(std::move(onDone));
}

void ServerManager::shutdown()
{
    auto result = awaitResult<void>(_impl->loop, [this](VoidCallback done) { shutdownAsync(std::move(done)); });
    if (!result)
        log::error("MCP shutdown incomplete: {}", result.error().message);
}

void ServerManager::registerServer(ServerDescriptor descriptor)
{
    auto const enabled = descriptor.enabled;
    auto name = descriptor.name;
    log::debug("Registering MCP server '{}'", name);
    _impl->descriptors.insert_or_assign(name, std::move(descriptor));

    if (!enabled || !_impl->initialized)
        return;

    // Full re-initialization: connected servers are kept, servers in error are retried.
    _impl->initialized = false;
    _impl->initializeAll([name](VoidResult result) {
        if (!result)
            log::error("Re-initialization after registering MCP server '{}' failed: {}", name, result.error().message);
    });
}

void ServerManager::unregisterServer(std::string_view name)
{
    if (auto const it = _impl->descriptors.find(name); it != _impl->descriptors.end())
        _impl->descriptors.erase(it);
}

auto ServerManager::getServers() const -> std::vector<ServerDescriptor>
{
    auto servers = std::vector<ServerDescriptor> {};
    servers.reserve(_impl->descriptors.size());
    for (const auto& [name, descriptor]: _impl->descriptors)
        servers.push_back(descriptor);
    return servers;
}

auto ServerManager::serverState(std::string_view name) const -> ConnectionState
{
    auto const* client = _impl->findClient(name);
    return client ? client->state() : ConnectionState::Disconnected;
}

auto ServerManager::serverInfo(std::string_view name) const -> std::optional<ServerInfo>
{
    auto const* client = _impl->findClient(name);
    if (!client || client->state() != ConnectionState::Connected)
        return std::nullopt;
    return client->serverInfo();
}

auto ServerManager::isInitialized() const -> bool
{
    return _impl->initialized;
}

auto ServerManager::getAvailableTools() const -> std::vector<Tool>
{
    return _impl->catalog.tools();
}

auto ServerManager::getTool(std::string_view name) const -> std::optional<Tool>
{
    return _impl->catalog.findTool(name);
}

void ServerManager::listResourcesAsync(Callback<std::vector<Resource>> onResources)
{
    _impl->ensureInitialized([this, onResources = std::move(onResources)] {
        _impl->refreshAll([this, onResources](VoidResult refreshed) {
            if (!refreshed)
            {
                onResources(std::unexpected(refreshed.error()));
                return;
            }
            onResources(_impl->catalog.resources());
        });
    });
}

auto ServerManager::listResources() -> Result<std::vector<Resource>>
{
    return awaitResult<std::vector<Resource>>(
        _impl->loop, [this](Callback<std::vector<Resource>> done) { listResourcesAsync(std::move(done)); });
}

void ServerManager::getResourceAsync(std::string_view uri, Callback<std::optional<std::string>> onContent)
{
    _impl->ensureInitialized([this, uri = std::string(uri), onContent = std::move(onContent)] {
        auto const resource = _impl->catalog.findResource(uri);
        if (!resource)
        {
            log::debug("Resource '{}' is not in the catalog", uri);
            _impl->deliver(onContent, std::optional<std::string> {});
            return;
        }

        auto* client = _impl->findClient(resource->serverName);
        if (!client || client->state() != ConnectionState::Connected)
        {
            _impl->deliver(onContent,
                           makeError(ErrorCode::NotConnected,
                                     std::format("Server '{}' for resource '{}' is not connected",
                                                 resource->serverName,
                                                 uri)));
            return;
        }

        client->readResource(uri, onContent);
    });
}

auto ServerManager::getResource(std::string_view uri) -> Result<std::optional<std::string>>
{
    return awaitResult<std::optional<std::string>>(
        _impl->loop, [this, uri](Callback<std::optional<std::string>> done) { getResourceAsync(uri, std::move(done)); });
}

void ServerManager::callToolAsync(std::string_view name, nlohmann::json arguments, Callback<nlohmann::json> onResult)
{
    _impl->ensureInitialized(
        [this, name = std::string(name), arguments = std::move(arguments), onResult = std::move(onResult)] {
            auto const tool = _impl->catalog.findTool(name);
            if (!tool)
            {
                _impl->deliver(onResult, makeError(ErrorCode::NotFound, std::format("MCP tool not found: {}", name)));
                return;
            }

            auto* client = _impl->findClient(tool->serverName);
            if (!client || client->state() != ConnectionState::Connected)
            {
                _impl->deliver(onResult,
                               makeError(ErrorCode::NotConnected,
                                         std::format("Server '{}' for tool '{}' is not connected",
                                                     tool->serverName,
                                                     name)));
                return;
            }

            log::debug("Calling tool '{}' on server '{}'", name, tool->serverName);
            client->callTool(name, arguments, onResult);
        });
}

auto ServerManager::callTool(std::string_view name, nlohmann::json arguments) -> Result<nlohmann::json>
{
    return awaitResult<nlohmann::json>(_impl->loop, [&](Callback<nlohmann::json> done) {
        callToolAsync(name, std::move(arguments), std::move(done));
    });
}

void ServerManager::sendRequestAsync(std::string_view serverName,
                                     std::string_view method,
                                     nlohmann::json params,
                                     Callback<nlohmann::json> onResult)
{
    auto* client = _impl->findClient(serverName);
    _impl->correlator.sendRequest(client ? client->transport() : nullptr,
                                  std::string(serverName),
                                  method,
                                  std::move(params),
                                  std::move(onResult));
}

void ServerManager::sendNotificationAsync(std::string_view serverName,
                                          std::string_view method,
                                          nlohmann::json params,
                                          VoidCallback onWritten)
{
    auto* client = _impl->findClient(serverName);
    _impl->correlator.sendNotification(client ? client->transport() : nullptr,
                                       std::string(serverName),
                                       method,
                                       std::move(params),
                                       std::move(onWritten));
}

auto ServerManager::processEvents(std::chrono::milliseconds maxWait) -> bool
{
    return _impl->loop.runOnce(maxWait);
}

auto ServerManager::pendingRequestCount() const -> std::size_t
{
    return _impl->correlator.pendingCount();
}

auto ServerManager::eventLoop() -> EventLoop&
{
    return _impl->loop;
}

} // namespace mcphub
