// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <core/Types.hpp>
#include <mcp/McpClient.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief Top-level application configuration.
struct AppConfig
{
    log::Level logLevel = log::Level::Info;

    /// @brief Protocol version, client identity and timeouts used for every server.
    ClientOptions client;

    /// @brief Configured servers, ordered by name.
    std::vector<ServerDescriptor> mcpServers;
};

/// @brief Loads the application configuration from the default config path.
///
/// A missing file is not an error; the defaults are returned instead.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses the application configuration from a JSON document.
[[nodiscard]] auto parseConfig(std::string_view content) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path.
/// $XDG_CONFIG_HOME/mcphub or ~/.config/mcphub
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace mcphub
