// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief The channel used to reach an MCP server.
enum class TransportKind
{
    Stdio,
    Sse,
    WebSocket,
};

/// @brief Converts a TransportKind enum to its configuration string.
[[nodiscard]] constexpr auto transportToString(TransportKind kind) -> std::string_view
{
    switch (kind)
    {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Sse: return "sse";
        case TransportKind::WebSocket: return "websocket";
    }
    return "unknown";
}

/// @brief Parses a configuration string to a TransportKind.
/// @return The transport, or std::nullopt if the name is not recognized.
[[nodiscard]] constexpr auto transportFromString(std::string_view str) -> std::optional<TransportKind>
{
    if (str == "stdio")
        return TransportKind::Stdio;
    if (str == "sse")
        return TransportKind::Sse;
    if (str == "websocket")
        return TransportKind::WebSocket;
    return std::nullopt;
}

/// @brief Connection state of a single MCP server.
enum class ConnectionState
{
    Disconnected,
    Connecting,
    Initializing,
    Connected,
    Error,
};

[[nodiscard]] constexpr auto connectionStateToString(ConnectionState state) -> std::string_view
{
    switch (state)
    {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Initializing: return "initializing";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Error: return "error";
    }
    return "unknown";
}

/// @brief Static configuration of an MCP server.
struct ServerDescriptor
{
    std::string name;
    bool enabled = true;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env; // Overlaid on the parent environment
    TransportKind transport = TransportKind::Stdio;
    nlohmann::json config = nlohmann::json::object();
};

/// @brief Identity and capabilities a server reported during the handshake.
struct ServerInfo
{
    std::string name;
    std::string version;
    std::string protocolVersion;
    bool hasTools = false;
    bool hasResources = false;
    bool hasPrompts = false;
};

/// @brief A callable operation exposed by a server.
struct Tool
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema;
    std::string serverName; // Routing only
};

/// @brief A URI-addressed readable item exposed by a server.
struct Resource
{
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;
    std::string serverName; // Routing only
};

/// @brief Name and version announced to servers as clientInfo.
struct ClientInfo
{
    std::string name = "mcphub";
    std::string version = "0.1.0";
};

} // namespace mcphub
