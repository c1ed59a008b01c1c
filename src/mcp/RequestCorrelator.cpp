// SPDX-License-Identifier: Apache-2.0
#include "RequestCorrelator.hpp"

#include <core/Log.hpp>

#include <format>
#include <type_traits>
#include <variant>
#include <vector>

namespace mcphub
{

RequestCorrelator::RequestCorrelator(EventLoop& loop, std::chrono::milliseconds requestTimeout):
    _loop(loop), _requestTimeout(requestTimeout)
{
}

RequestCorrelator::~RequestCorrelator()
{
    for (const auto& [id, pending]: _pending)
        _loop.cancelTimer(pending.timer);
}

void RequestCorrelator::sendRequest(Transport* transport,
                                    const std::string& serverName,
                                    std::string_view method,
                                    nlohmann::json params,
                                    Callback<nlohmann::json> onResult)
{
    if (!transport || !transport->isConnected())
    {
        auto error = Error { ErrorCode::NotConnected, std::format("Server '{}' is not connected", serverName) };
        _loop.post([onResult = std::move(onResult), error = std::move(error)] { onResult(std::unexpected(error)); });
        return;
    }

    auto const id = _nextId++;
    auto const timer = _loop.startTimer(_requestTimeout, [this, id] {
        auto const it = _pending.find(id);
        if (it == _pending.end())
            return;
        auto const message = std::format(
            "Request '{}' to server '{}' timed out after {} ms", it->second.method, it->second.serverName, _requestTimeout.count());
        log::warning("{}", message);
        complete(id, makeError(ErrorCode::TimeoutError, message));
    });

    _pending.emplace(id,
                     PendingRequest {
                         .serverName = serverName,
                         .method = std::string(method),
                         .onResult = std::move(onResult),
                         .timer = timer,
                     });

    log::debug("Request #{} '{}' -> server '{}'", id, method, serverName);
    transport->send(jsonrpc::makeRequest(id, method, std::move(params)), [this, id](VoidResult written) {
        if (!written)
            complete(id, std::unexpected(written.error()));
    });
}

void RequestCorrelator::sendNotification(Transport* transport,
                                         const std::string& serverName,
                                         std::string_view method,
                                         nlohmann::json params,
                                         VoidCallback onWritten)
{
    if (!transport || !transport->isConnected())
    {
        auto error = Error { ErrorCode::NotConnected, std::format("Server '{}' is not connected", serverName) };
        _loop.post([onWritten = std::move(onWritten), error = std::move(error)] {
            if (onWritten)
                onWritten(std::unexpected(error));
        });
        return;
    }

    log::debug("Notification '{}' -> server '{}'", method, serverName);
    transport->send(jsonrpc::makeNotification(method, std::move(params)), std::move(onWritten));
}

void RequestCorrelator::dispatch(const std::string& serverName, jsonrpc::Message message)
{
    std::visit(
        [&](auto& msg) {
            using T = std::decay_t<decltype(msg)>;
            if constexpr (std::is_same_v<T, jsonrpc::Response>)
            {
                handleResponse(serverName, msg);
            }
            else if constexpr (std::is_same_v<T, jsonrpc::Notification>)
            {
                log::debug("Notification '{}' <- server '{}'", msg.method, serverName);
                if (_notificationHandler)
                    _notificationHandler(serverName, msg);
            }
            else
            {
                log::debug("Request '{}' <- server '{}'", msg.method, serverName);
                if (_requestHandler)
                    _requestHandler(serverName, msg);
            }
        },
        message);
}

void RequestCorrelator::failPending(const std::string& serverName, const Error& error)
{
    auto ids = std::vector<std::int64_t> {};
    for (const auto& [id, pending]: _pending)
    {
        if (pending.serverName == serverName)
            ids.push_back(id);
    }

    for (auto const id: ids)
        complete(id, std::unexpected(error));
}

void RequestCorrelator::setNotificationHandler(NotificationHandler handler)
{
    _notificationHandler = std::move(handler);
}

void RequestCorrelator::setRequestHandler(RequestHandler handler)
{
    _requestHandler = std::move(handler);
}

auto RequestCorrelator::pendingCount() const -> std::size_t
{
    return _pending.size();
}

auto RequestCorrelator::isPending(std::int64_t id) const -> bool
{
    return _pending.contains(id);
}

auto RequestCorrelator::lastRequestId() const -> std::int64_t
{
    return _nextId - 1;
}

void RequestCorrelator::complete(std::int64_t id, Result<nlohmann::json> result)
{
    auto node = _pending.extract(id);
    if (node.empty())
        return;

    _loop.cancelTimer(node.mapped().timer);
    if (!node.mapped().onResult)
        return;

    // Continuations never run on the stack of the reader that produced the response.
    _loop.post([onResult = std::move(node.mapped().onResult), result = std::move(result)]() mutable {
        onResult(std::move(result));
    });
}

void RequestCorrelator::handleResponse(const std::string& serverName, const jsonrpc::Response& response)
{
    if (!response.id.is_number_integer())
    {
        log::debug("Dropping response with non-numeric id {} from server '{}'", response.id.dump(), serverName);
        return;
    }

    auto const id = response.id.get<std::int64_t>();
    auto const it = _pending.find(id);
    if (it == _pending.end())
    {
        log::debug("Dropping response #{} from server '{}': no pending request", id, serverName);
        return;
    }

    if (it->second.serverName != serverName)
    {
        log::warning("Dropping response #{} from server '{}': request was sent to '{}'",
                     id,
                     serverName,
                     it->second.serverName);
        return;
    }

    if (response.error)
    {
        complete(id,
                 makeError(ErrorCode::RpcError,
                           std::format("RPC error {}: {}", response.error->code, response.error->message)));
        return;
    }

    complete(id, response.result.value_or(nlohmann::json::object()));
}

} // namespace mcphub
