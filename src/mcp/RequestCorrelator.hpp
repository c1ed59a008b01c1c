// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Async.hpp>
#include <core/EventLoop.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace mcphub
{

/// @brief Matches JSON-RPC responses to outstanding requests across all servers.
///
/// Request ids come from one counter shared by every server and are never reused.
/// Each pending request completes exactly once: by its response, by its timeout,
/// by a failed write, or by failPending() when its server goes away. The
/// continuation is posted to the event loop rather than invoked in place.
class RequestCorrelator
{
  public:
    using NotificationHandler =
        std::function<void(const std::string& serverName, const jsonrpc::Notification& notification)>;
    using RequestHandler = std::function<void(const std::string& serverName, const jsonrpc::Request& request)>;

    RequestCorrelator(EventLoop& loop, std::chrono::milliseconds requestTimeout);
    ~RequestCorrelator();

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    /// @brief Sends a request and completes @p onResult with its result.
    /// @param transport The server's connection, or nullptr if the server has no live process.
    /// @param serverName The server the request is addressed to.
    /// @param method The method name.
    /// @param params The request parameters.
    /// @param onResult Receives the result, an RpcError, a TimeoutError or a transport error.
    void sendRequest(Transport* transport,
                     const std::string& serverName,
                     std::string_view method,
                     nlohmann::json params,
                     Callback<nlohmann::json> onResult);

    /// @brief Sends a notification; completes once the line has been written.
    void sendNotification(Transport* transport,
                          const std::string& serverName,
                          std::string_view method,
                          nlohmann::json params,
                          VoidCallback onWritten);

    /// @brief Routes one incoming message from @p serverName.
    void dispatch(const std::string& serverName, jsonrpc::Message message);

    /// @brief Rejects every pending request addressed to @p serverName with @p error.
    void failPending(const std::string& serverName, const Error& error);

    void setNotificationHandler(NotificationHandler handler);
    void setRequestHandler(RequestHandler handler);

    [[nodiscard]] auto pendingCount() const -> std::size_t;
    [[nodiscard]] auto isPending(std::int64_t id) const -> bool;

    /// @brief Returns the id assigned to the most recent request (0 if none yet).
    [[nodiscard]] auto lastRequestId() const -> std::int64_t;

  private:
    struct PendingRequest
    {
        std::string serverName;
        std::string method;
        Callback<nlohmann::json> onResult;
        EventLoop::TimerId timer = 0;
    };

    void complete(std::int64_t id, Result<nlohmann::json> result);
    void handleResponse(const std::string& serverName, const jsonrpc::Response& response);

    EventLoop& _loop;
    std::chrono::milliseconds _requestTimeout;
    std::int64_t _nextId = 1;
    std::map<std::int64_t, PendingRequest> _pending;
    NotificationHandler _notificationHandler;
    RequestHandler _requestHandler;
};

} // namespace mcphub
