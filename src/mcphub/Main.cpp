// SPDX-License-Identifier: Apache-2.0
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/Catalog.hpp>
#include <mcp/ServerManager.hpp>
#include <mcphub/Config.hpp>

#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>

#include <format>
#include <print>

namespace
{

using namespace mcphub;

auto describeServers(const ServerManager& manager) -> nlohmann::json
{
    auto servers = nlohmann::json::array();
    for (const auto& descriptor: manager.getServers())
    {
        auto entry = nlohmann::json {
            { "name", descriptor.name },
            { "enabled", descriptor.enabled },
            { "transport", transportToString(descriptor.transport) },
            { "command", descriptor.command },
            { "args", descriptor.args },
            { "state", connectionStateToString(manager.serverState(descriptor.name)) },
        };

        if (auto const info = manager.serverInfo(descriptor.name))
        {
            entry["serverInfo"] = {
                { "name", info->name },
                { "version", info->version },
                { "protocolVersion", info->protocolVersion },
                { "tools", info->hasTools },
                { "resources", info->hasResources },
                { "prompts", info->hasPrompts },
            };
        }

        servers.push_back(std::move(entry));
    }
    return servers;
}

auto printTools(const ServerManager& manager) -> int
{
    auto tools = nlohmann::json::array();
    for (const auto& tool: manager.getAvailableTools())
        tools.push_back(toJson(tool));
    std::println("{}", tools.dump(2));
    return 0;
}

auto printResources(ServerManager& manager) -> int
{
    auto resources = manager.listResources();
    if (!resources)
    {
        log::error("Failed to list resources: {}", resources.error().message);
        return 1;
    }

    auto output = nlohmann::json::array();
    for (const auto& resource: *resources)
        output.push_back(toJson(resource));
    std::println("{}", output.dump(2));
    return 0;
}

auto callTool(ServerManager& manager, const std::string& toolName, const std::string& argumentsText) -> int
{
    auto arguments = nlohmann::json::object();
    if (!argumentsText.empty())
    {
        auto parsed = json::parse(argumentsText);
        if (!parsed)
        {
            log::error("Invalid tool arguments: {}", parsed.error().message);
            return 1;
        }
        arguments = std::move(*parsed);
    }

    auto result = manager.callTool(toolName, std::move(arguments));
    if (!result)
    {
        log::error("Tool call failed: {}", result.error());
        return 1;
    }

    std::println("{}", result->dump(2));
    return json::getBoolOr(*result, "isError", false) ? 2 : 0;
}

auto readResource(ServerManager& manager, const std::string& uri) -> int
{
    auto content = manager.getResource(uri);
    if (!content)
    {
        log::error("Failed to read resource: {}", content.error());
        return 1;
    }

    if (!*content)
    {
        log::error("Resource not found or without content: {}", uri);
        return 1;
    }

    std::print("{}", **content);
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "mcphub - MCP server manager and tool router" };
    app.require_subcommand(1);

    auto configPath = std::string {};
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    auto* serversCommand = app.add_subcommand("servers", "Start all servers and show their state");
    auto* toolsCommand = app.add_subcommand("tools", "List the tools of all servers");
    auto* resourcesCommand = app.add_subcommand("resources", "List the resources of all servers");

    auto toolName = std::string {};
    auto toolArguments = std::string {};
    auto* callCommand = app.add_subcommand("call", "Call a tool");
    callCommand->add_option("tool", toolName, "Tool name")->required();
    callCommand->add_option("arguments", toolArguments, "Tool arguments as a JSON object");

    auto resourceUri = std::string {};
    auto* readCommand = app.add_subcommand("read", "Read a resource");
    readCommand->add_option("uri", resourceUri, "Resource URI")->required();

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = configPath.empty() ? loadConfig() : loadConfigFromFile(configPath);
    if (!configResult)
    {
        log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;
    log::setLevel(verbose ? log::Level::Debug : config.logLevel);

    auto manager = ServerManager(std::move(config.mcpServers), std::move(config.client));
    if (auto initResult = manager.initialize(); !initResult)
    {
        log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    auto exitCode = 0;
    if (serversCommand->parsed())
    {
        std::println("{}", describeServers(manager).dump(2));
    }
    else if (toolsCommand->parsed())
        exitCode = printTools(manager);
    else if (resourcesCommand->parsed())
        exitCode = printResources(manager);
    else if (callCommand->parsed())
        exitCode = callTool(manager, toolName, toolArguments);
    else if (readCommand->parsed())
        exitCode = readResource(manager, resourceUri);

    manager.shutdown();
    return exitCode;
}
