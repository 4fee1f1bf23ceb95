// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <core/Types.hpp>
#include <mcp/ProxyManager.hpp>
#include <mcp/Transport.hpp>
#include <server/AutoRestart.hpp>

#include <map>
#include <string>
#include <string_view>

namespace mcphub
{

/// @brief General hub settings.
struct HubConfig
{
    /// @brief Where server logs live. Empty means defaultDataDir().
    std::string dataDir;
    log::Level logLevel = log::Level::Info;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    HubConfig hub;
    TransportOptions transport;
    AutoRestartConfig autoRestart;
    ProxyOptions proxy;

    /// @brief Configured tool servers keyed by name. The name doubles as the server id.
    std::map<std::string, ServerDescriptor> mcpServers;
};

/// @brief Parses a configuration document.
[[nodiscard]] auto parseConfig(std::string_view content) -> Result<AppConfig>;

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration, or defaults if there is no config file.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file, creating its directory.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory: $XDG_CONFIG_HOME/mcphub or ~/.config/mcphub.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns the default data directory: $XDG_DATA_HOME/mcphub or ~/.local/share/mcphub.
[[nodiscard]] auto defaultDataDir() -> std::string;

} // namespace mcphub
