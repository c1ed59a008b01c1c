// SPDX-License-Identifier: Apache-2.0
#include "McpClient.hpp"

#include <core/Base64.hpp>
#include <core/JsonUtils.hpp>
#include <mcp/Catalog.hpp>

#include <format>
#include <utility>

namespace mcphub
{

namespace
{
    // Upper bound on pages followed for a single listing.
    constexpr auto MaxListPages = std::size_t { 100 };

    auto exitError(const std::string& serverName, int status) -> Error
    {
        return Error {
            ErrorCode::TransportError,
            std::format("Server '{}' exited ({})", serverName, describeExitStatus(status)),
        };
    }
} // namespace

McpClient::McpClient(EventLoop& loop,
                     RequestCorrelator& correlator,
                     ServerDescriptor descriptor,
                     const ClientOptions& options):
    _loop(loop),
    _correlator(correlator),
    _descriptor(std::move(descriptor)),
    _options(options),
    _logger("mcp:" + _descriptor.name)
{
}

McpClient::~McpClient() = default;

void McpClient::setDescriptor(ServerDescriptor descriptor)
{
    _descriptor = std::move(descriptor);
}

void McpClient::setExitHandler(ExitHandler handler)
{
    _exitHandler = std::move(handler);
}

void McpClient::setState(ConnectionState state)
{
    if (_state == state)
        return;
    _logger.debug("State {} -> {}", connectionStateToString(_state), connectionStateToString(state));
    _state = state;
}

void McpClient::connect(VoidCallback onConnected)
{
    if (_state == ConnectionState::Connected && _process)
    {
        _loop.post([onConnected = std::move(onConnected)] { onConnected({}); });
        return;
    }

    _connectWaiters.push_back(std::move(onConnected));
    if (_connectWaiters.size() > 1)
        return;

    if (_descriptor.transport != TransportKind::Stdio)
    {
        setState(ConnectionState::Error);
        auto const message = std::format("Transport '{}' is not supported for server '{}'",
                                         transportToString(_descriptor.transport),
                                         _descriptor.name);
        _logger.error("{}", message);
        _loop.post([this, message] { finishConnect(makeError(ErrorCode::ConfigError, message)); });
        return;
    }

    _process = std::make_unique<ServerProcess>(
        _loop,
        _descriptor.name,
        ServerProcessHandlers {
            .onMessage = [this](jsonrpc::Message message) { _correlator.dispatch(name(), std::move(message)); },
            .onExit = [this](int status) { handleExit(status); },
        });

    setState(ConnectionState::Connecting);
    if (auto started = _process->start(_descriptor); !started)
    {
        _process.reset();
        setState(ConnectionState::Error);
        _logger.error("{}", started.error().message);
        _loop.post([this, error = started.error()] { finishConnect(std::unexpected(error)); });
        return;
    }

    handshake();
}

void McpClient::handshake()
{
    setState(ConnectionState::Initializing);

    auto params = nlohmann::json {
        { "protocolVersion", _options.protocolVersion },
        { "capabilities", { { "roots", { { "listChanged", true } } } } },
        { "clientInfo",
          nlohmann::json {
              { "name", _options.clientInfo.name },
              { "version", _options.clientInfo.version },
          } },
    };

    request("initialize", std::move(params), [this](Result<nlohmann::json> response) {
        if (!response)
        {
            finishConnect(std::unexpected(response.error()));
            return;
        }

        auto const& result = *response;
        auto protocolVersion = json::getString(result, "protocolVersion");
        if (!protocolVersion)
        {
            finishConnect(makeError(ErrorCode::ProtocolError, "Invalid initialize response: missing protocolVersion"));
            return;
        }
        if (!result.contains("serverInfo") || !result["serverInfo"].is_object())
        {
            finishConnect(makeError(ErrorCode::ProtocolError, "Invalid initialize response: missing serverInfo"));
            return;
        }

        auto const& serverInfo = result["serverInfo"];
        _serverInfo = ServerInfo {
            .name = json::getStringOr(serverInfo, "name", "unknown"),
            .version = json::getStringOr(serverInfo, "version", "unknown"),
            .protocolVersion = std::move(*protocolVersion),
        };

        if (result.contains("capabilities") && result["capabilities"].is_object())
        {
            auto const& caps = result["capabilities"];
            _serverInfo.hasTools = caps.contains("tools");
            _serverInfo.hasResources = caps.contains("resources");
            _serverInfo.hasPrompts = caps.contains("prompts");
        }

        notify("notifications/initialized", nlohmann::json::object(), [this](VoidResult written) {
            if (!written)
            {
                finishConnect(std::unexpected(written.error()));
                return;
            }

            setState(ConnectionState::Connected);
            _logger.info("MCP server initialized: {} v{} (protocol {})",
                         _serverInfo.name,
                         _serverInfo.version,
                         _serverInfo.protocolVersion);
            finishConnect({});
        });
    });
}

void McpClient::finishConnect(VoidResult result)
{
    if (!result)
    {
        _logger.error("Handshake failed: {}", result.error().message);
        setState(ConnectionState::Error);
        if (_process)
            _process->terminate(_options.killTimeout);
    }

    auto waiters = std::exchange(_connectWaiters, {});
    for (auto& waiter: waiters)
    {
        if (waiter)
            waiter(result);
    }
}

void McpClient::handleExit(int status)
{
    auto const error = exitError(name(), status);

    // The process object is still on the call stack; release it once this round is over.
    _loop.post([process = std::move(_process)] {});

    if (_state == ConnectionState::Connected)
    {
        _logger.warning("{}", error.message);
        setState(ConnectionState::Disconnected);
    }

    _correlator.failPending(name(), error);

    if (_exitHandler)
        _exitHandler(name());
}

void McpClient::request(std::string_view method, nlohmann::json params, Callback<nlohmann::json> onResult)
{
    _correlator.sendRequest(_process.get(), name(), method, std::move(params), std::move(onResult));
}

void McpClient::notify(std::string_view method, nlohmann::json params, VoidCallback onWritten)
{
    _correlator.sendNotification(_process.get(), name(), method, std::move(params), std::move(onWritten));
}

void McpClient::listAll(std::string method,
                        std::string key,
                        std::optional<std::string> cursor,
                        std::shared_ptr<std::vector<nlohmann::json>> items,
                        std::size_t page,
                        Callback<std::vector<nlohmann::json>> onItems)
{
    auto params = nlohmann::json::object();
    if (cursor)
        params["cursor"] = *cursor;

    request(method,
            std::move(params),
            [this,
             method,
             key,
             cursor,
             items = std::move(items),
             page,
             onItems = std::move(onItems)](Result<nlohmann::json> result) mutable {
                if (!result)
                {
                    onItems(std::unexpected(result.error()));
                    return;
                }

                if (result->is_object() && result->contains(key) && (*result)[key].is_array())
                {
                    for (auto& item: (*result)[key])
                        items->push_back(std::move(item));
                }

                auto next = json::getOptionalString(*result, "nextCursor");
                if (!next || next->empty() || next == cursor)
                {
                    onItems(std::move(*items));
                    return;
                }

                if (page + 1 >= MaxListPages)
                {
                    _logger.warning("{} returned more than {} pages, ignoring the rest", method, MaxListPages);
                    onItems(std::move(*items));
                    return;
                }

                listAll(std::move(method), std::move(key), std::move(next), std::move(items), page + 1, std::move(onItems));
            });
}

void McpClient::listTools(Callback<std::vector<Tool>> onTools)
{
    listAll("tools/list",
            "tools",
            std::nullopt,
            std::make_shared<std::vector<nlohmann::json>>(),
            0,
            [this, onTools = std::move(onTools)](Result<std::vector<nlohmann::json>> items) {
                onTools(items.transform([this](const std::vector<nlohmann::json>& entries) {
                    return toolsFromJson(entries, name());
                }));
            });
}

void McpClient::listResources(Callback<std::vector<Resource>> onResources)
{
    listAll("resources/list",
            "resources",
            std::nullopt,
            std::make_shared<std::vector<nlohmann::json>>(),
            0,
            [this, onResources = std::move(onResources)](Result<std::vector<nlohmann::json>> items) {
                onResources(items.transform([this](const std::vector<nlohmann::json>& entries) {
                    return resourcesFromJson(entries, name());
                }));
            });
}

void McpClient::readResource(std::string_view uri, Callback<std::optional<std::string>> onContent)
{
    auto params = nlohmann::json { { "uri", uri } };
    request("resources/read",
            std::move(params),
            [onContent = std::move(onContent)](Result<nlohmann::json> result) {
                if (!result)
                {
                    onContent(std::unexpected(result.error()));
                    return;
                }

                if (!result->is_object() || !result->contains("contents") || !(*result)["contents"].is_array()
                    || (*result)["contents"].empty())
                {
                    onContent(std::optional<std::string> {});
                    return;
                }

                auto const& first = (*result)["contents"][0];
                if (auto text = json::getOptionalString(first, "text"))
                {
                    onContent(std::optional<std::string> { std::move(*text) });
                    return;
                }

                if (auto blob = json::getOptionalString(first, "blob"))
                {
                    auto decoded = base64::decode(*blob);
                    if (!decoded)
                    {
                        onContent(makeError(ErrorCode::ProtocolError,
                                            std::format("Invalid resource blob: {}", decoded.error().message)));
                        return;
                    }
                    onContent(std::optional<std::string> { std::move(*decoded) });
                    return;
                }

                onContent(std::optional<std::string> {});
            });
}

void McpClient::callTool(std::string_view toolName,
                         const nlohmann::json& arguments,
                         Callback<nlohmann::json> onResult)
{
    auto params = nlohmann::json {
        { "name", toolName },
        { "arguments", arguments.is_null() ? nlohmann::json::object() : arguments },
    };

    request("tools/call", std::move(params), std::move(onResult));
}

void McpClient::terminate()
{
    if (_process)
        _process->terminate(_options.killTimeout);
}

void McpClient::reset()
{
    if (_process)
        return;
    setState(ConnectionState::Disconnected);
    _serverInfo = ServerInfo {};
}

} // namespace mcphub
