// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace mcphub
{

namespace
{
    auto parseServer(const std::string& name, const nlohmann::json& serverJson) -> Result<ServerDescriptor>
    {
        if (!serverJson.is_object())
            return makeError(ErrorCode::ConfigError, std::format("Server '{}' must be a JSON object", name));

        auto const transportName = json::getStringOr(serverJson, "transport", "stdio");
        auto const transport = transportFromString(transportName);
        if (!transport)
        {
            return makeError(ErrorCode::ConfigError,
                             std::format("Server '{}' has unknown transport '{}'", name, transportName));
        }

        auto server = ServerDescriptor {
            .name = name,
            .enabled = json::getBoolOr(serverJson, "enabled", true),
            .command = json::getStringOr(serverJson, "command", ""),
            .args = json::getStringArray(serverJson, "args"),
            .env = json::getStringMap(serverJson, "env"),
            .transport = *transport,
            .config = nlohmann::json::object(),
        };

        if (serverJson.contains("config") && serverJson["config"].is_object())
            server.config = serverJson["config"];

        return server;
    }
} // namespace

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/mcphub";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/mcphub";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto parseConfig(std::string_view content) -> Result<AppConfig>
{
    auto parseResult = json::parse(content);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, parseResult.error().message);

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be a JSON object");

    auto config = AppConfig {};
    config.logLevel = log::levelFromString(json::getStringOr(root, "logLevel", "info"), log::Level::Info);

    // Protocol section
    config.client.protocolVersion = json::getStringOr(root, "protocolVersion", config.client.protocolVersion);
    if (root.contains("clientInfo") && root["clientInfo"].is_object())
    {
        auto const& clientInfo = root["clientInfo"];
        config.client.clientInfo.name = json::getStringOr(clientInfo, "name", config.client.clientInfo.name);
        config.client.clientInfo.version =
            json::getStringOr(clientInfo, "version", config.client.clientInfo.version);
    }

    auto const requestTimeoutMs =
        json::getIntOr(root, "requestTimeoutMs", static_cast<int>(config.client.requestTimeout.count()));
    auto const killTimeoutMs =
        json::getIntOr(root, "killTimeoutMs", static_cast<int>(config.client.killTimeout.count()));
    if (requestTimeoutMs <= 0 || killTimeoutMs < 0)
        return makeError(ErrorCode::ConfigError, "requestTimeoutMs must be positive and killTimeoutMs must not be negative");
    config.client.requestTimeout = std::chrono::milliseconds(requestTimeoutMs);
    config.client.killTimeout = std::chrono::milliseconds(killTimeoutMs);

    // MCP servers section
    if (root.contains("mcpServers"))
    {
        if (!root["mcpServers"].is_object())
            return makeError(ErrorCode::ConfigError, "'mcpServers' must be a JSON object");

        for (const auto& [name, serverJson]: root["mcpServers"].items())
        {
            auto server = parseServer(name, serverJson);
            if (!server)
                return std::unexpected(server.error());
            config.mcpServers.push_back(std::move(*server));
        }
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto config = parseConfig(ss.str());
    if (!config)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, config.error().message));
    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();
    root["logLevel"] = log::levelToString(config.logLevel);
    root["protocolVersion"] = config.client.protocolVersion;
    root["clientInfo"] = {
        { "name", config.client.clientInfo.name },
        { "version", config.client.clientInfo.version },
    };
    root["requestTimeoutMs"] = config.client.requestTimeout.count();
    root["killTimeoutMs"] = config.client.killTimeout.count();

    auto servers = nlohmann::json::object();
    for (const auto& serverConfig: config.mcpServers)
    {
        auto server = nlohmann::json::object();
        server["command"] = serverConfig.command;
        if (!serverConfig.args.empty())
            server["args"] = serverConfig.args;
        if (!serverConfig.env.empty())
        {
            auto env = nlohmann::json::object();
            for (const auto& [key, value]: serverConfig.env)
                env[key] = value;
            server["env"] = std::move(env);
        }
        if (!serverConfig.enabled)
            server["enabled"] = false;
        server["transport"] = transportToString(serverConfig.transport);
        if (!serverConfig.config.empty())
            server["config"] = serverConfig.config;
        servers[serverConfig.name] = std::move(server);
    }
    root["mcpServers"] = std::move(servers);

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace mcphub
