// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief Unified lookup tables of the tools and resources of all servers.
///
/// Tools are keyed by name and resources by URI. Inserting an entry under an
/// existing key replaces it entirely, whichever server owned it before.
class Catalog
{
  public:
    /// @brief Inserts or replaces the given tools.
    void upsertTools(std::vector<Tool> tools);

    /// @brief Inserts or replaces the given resources.
    void upsertResources(std::vector<Resource> resources);

    void clear();

    [[nodiscard]] auto tools() const -> std::vector<Tool>;
    [[nodiscard]] auto findTool(std::string_view name) const -> std::optional<Tool>;

    [[nodiscard]] auto resources() const -> std::vector<Resource>;
    [[nodiscard]] auto findResource(std::string_view uri) const -> std::optional<Resource>;

    [[nodiscard]] auto toolCount() const -> std::size_t { return _tools.size(); }
    [[nodiscard]] auto resourceCount() const -> std::size_t { return _resources.size(); }

  private:
    std::map<std::string, Tool, std::less<>> _tools;
    std::map<std::string, Resource, std::less<>> _resources;
};

/// @brief Converts the entries of a tools/list result page to Tools owned by @p serverName.
///
/// Entries without a string name are skipped.
[[nodiscard]] auto toolsFromJson(const std::vector<nlohmann::json>& entries, const std::string& serverName)
    -> std::vector<Tool>;

/// @brief Converts the entries of a resources/list result page to Resources owned by @p serverName.
///
/// Entries without a string uri are skipped.
[[nodiscard]] auto resourcesFromJson(const std::vector<nlohmann::json>& entries, const std::string& serverName)
    -> std::vector<Resource>;

/// @brief Serializes a tool the way tools/list describes it, plus its serverName.
[[nodiscard]] auto toJson(const Tool& tool) -> nlohmann::json;

/// @brief Serializes a resource the way resources/list describes it, plus its serverName.
[[nodiscard]] auto toJson(const Resource& resource) -> nlohmann::json;

} // namespace mcphub
