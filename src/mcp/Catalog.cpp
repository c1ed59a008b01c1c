// SPDX-License-Identifier: Apache-2.0
#include "Catalog.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

namespace mcphub
{

void Catalog::upsertTools(std::vector<Tool> tools)
{
    for (auto& tool: tools)
    {
        auto const it = _tools.find(tool.name);
        if (it != _tools.end() && it->second.serverName != tool.serverName)
        {
            log::warning("Tool '{}' from server '{}' replaces the one from server '{}'",
                         tool.name,
                         tool.serverName,
                         it->second.serverName);
        }
        auto key = tool.name;
        _tools.insert_or_assign(std::move(key), std::move(tool));
    }
}

void Catalog::upsertResources(std::vector<Resource> resources)
{
    for (auto& resource: resources)
    {
        auto key = resource.uri;
        _resources.insert_or_assign(std::move(key), std::move(resource));
    }
}

void Catalog::clear()
{
    _tools.clear();
    _resources.clear();
}

auto Catalog::tools() const -> std::vector<Tool>
{
    auto result = std::vector<Tool> {};
    result.reserve(_tools.size());
    for (const auto& [name, tool]: _tools)
        result.push_back(tool);
    return result;
}

auto Catalog::findTool(std::string_view name) const -> std::optional<Tool>
{
    auto const it = _tools.find(name);
    if (it == _tools.end())
        return std::nullopt;
    return it->second;
}

auto Catalog::resources() const -> std::vector<Resource>
{
    auto result = std::vector<Resource> {};
    result.reserve(_resources.size());
    for (const auto& [uri, resource]: _resources)
        result.push_back(resource);
    return result;
}

auto Catalog::findResource(std::string_view uri) const -> std::optional<Resource>
{
    auto const it = _resources.find(uri);
    if (it == _resources.end())
        return std::nullopt;
    return it->second;
}

auto toolsFromJson(const std::vector<nlohmann::json>& entries, const std::string& serverName) -> std::vector<Tool>
{
    auto tools = std::vector<Tool> {};
    for (const auto& toolJson: entries)
    {
        auto name = json::getOptionalString(toolJson, "name");
        if (!name)
        {
            log::debug("Skipping unnamed tool from server '{}'", serverName);
            continue;
        }

        tools.push_back(Tool {
            .name = std::move(*name),
            .description = json::getStringOr(toolJson, "description", ""),
            .inputSchema = toolJson.value("inputSchema", nlohmann::json::object()),
            .serverName = serverName,
        });
    }
    return tools;
}

auto resourcesFromJson(const std::vector<nlohmann::json>& entries, const std::string& serverName)
    -> std::vector<Resource>
{
    auto resources = std::vector<Resource> {};
    for (const auto& resourceJson: entries)
    {
        auto uri = json::getOptionalString(resourceJson, "uri");
        if (!uri)
        {
            log::debug("Skipping resource without uri from server '{}'", serverName);
            continue;
        }

        auto name = json::getStringOr(resourceJson, "name", *uri);
        resources.push_back(Resource {
            .uri = std::move(*uri),
            .name = std::move(name),
            .description = json::getOptionalString(resourceJson, "description"),
            .mimeType = json::getOptionalString(resourceJson, "mimeType"),
            .serverName = serverName,
        });
    }
    return resources;
}

auto toJson(const Tool& tool) -> nlohmann::json
{
    return nlohmann::json {
        { "name", tool.name },
        { "description", tool.description },
        { "inputSchema", tool.inputSchema },
        { "serverName", tool.serverName },
    };
}

auto toJson(const Resource& resource) -> nlohmann::json
{
    auto result = nlohmann::json {
        { "uri", resource.uri },
        { "name", resource.name },
        { "serverName", resource.serverName },
    };
    if (resource.description)
        result["description"] = *resource.description;
    if (resource.mimeType)
        result["mimeType"] = *resource.mimeType;
    return result;
}

} // namespace mcphub
