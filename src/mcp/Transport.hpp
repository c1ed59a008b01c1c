// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Async.hpp>
#include <core/Error.hpp>

#include <nlohmann/json.hpp>

namespace mcphub
{

/// @brief Abstract interface for the outgoing half of an MCP connection.
///
/// Incoming messages are delivered by the concrete transport through the
/// handlers it was constructed with.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Queues a JSON message for delivery as one line.
    /// @param message The JSON message to send.
    /// @param onWritten Invoked from the event loop once the line was written or the write failed.
    virtual void send(const nlohmann::json& message, VoidCallback onWritten) = 0;

    /// @brief Returns true if the transport can accept messages.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace mcphub
