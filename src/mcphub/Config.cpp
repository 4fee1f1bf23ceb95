// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>

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

    auto seconds(const nlohmann::json& obj, std::string_view key, std::chrono::seconds fallback)
        -> std::chrono::seconds
    {
        return std::chrono::seconds(json::getIntOr(obj, key, static_cast<int>(fallback.count())));
    }

    auto logLevelKey(log::Level level) -> std::string_view
    {
        switch (level)
        {
            case log::Level::Error: return "error";
            case log::Level::Warning: return "warn";
            case log::Level::Info: return "info";
            case log::Level::Debug: return "debug";
            case log::Level::Trace: return "trace";
        }
        return "info";
    }

    auto parseServer(const std::string& name, const nlohmann::json& serverJson) -> Result<ServerDescriptor>
    {
        if (!serverJson.is_object())
            return makeError(ErrorCode::ConfigError, std::format("Server '{}': entry is not an object", name));

        auto const transportName = json::getStringOr(serverJson, "transport", "stdio");
        auto const transport = transportKindFromString(transportName);
        if (!transport)
            return makeError(ErrorCode::ConfigError,
                             std::format("Server '{}': unknown transport '{}'", name, transportName));

        auto owner = json::getStringOr(serverJson, "owner", "");

        auto descriptor = ServerDescriptor {
            .id = name,
            .ownerId = owner.empty() ? std::nullopt : std::optional(owner),
            .name = name,
            .displayName = json::getStringOr(serverJson, "displayName", name),
            .description = json::getStringOr(serverJson, "description", ""),
            .isSystem = json::getBoolOr(serverJson, "system", owner.empty()),
            .enabled = json::getBoolOr(serverJson, "enabled", true),
            .transport = *transport,
            .command = json::getStringOr(serverJson, "command", ""),
            .args = json::getStringArray(serverJson, "args"),
            .env = json::getStringMap(serverJson, "env"),
            .url = json::getStringOr(serverJson, "url", ""),
            .headers = json::getStringMap(serverJson, "headers"),
            .timeoutSeconds = json::getIntOr(serverJson, "timeoutSeconds", 30),
            .maxRestartAttempts = json::getIntOr(serverJson, "maxRestartAttempts", 3),
        };

        if (descriptor.transport == TransportKind::Stdio && descriptor.command.empty())
            return makeError(ErrorCode::ConfigError, std::format("Server '{}': stdio transport needs a command", name));
        if (descriptor.transport != TransportKind::Stdio && descriptor.url.empty())
            return makeError(ErrorCode::ConfigError,
                             std::format("Server '{}': {} transport needs a url", name, transportName));
        if (descriptor.isSystem && descriptor.ownerId)
            return makeError(ErrorCode::ConfigError, std::format("Server '{}': system servers have no owner", name));

        return descriptor;
    }

    auto serverToJson(const ServerDescriptor& descriptor) -> nlohmann::json
    {
        auto server = nlohmann::json::object();
        server["transport"] = std::string(transportKindToString(descriptor.transport));
        if (descriptor.displayName != descriptor.name)
            server["displayName"] = descriptor.displayName;
        if (!descriptor.description.empty())
            server["description"] = descriptor.description;
        server["system"] = descriptor.isSystem;
        server["enabled"] = descriptor.enabled;
        if (descriptor.ownerId)
            server["owner"] = *descriptor.ownerId;

        if (descriptor.transport == TransportKind::Stdio)
        {
            server["command"] = descriptor.command;
            if (!descriptor.args.empty())
                server["args"] = descriptor.args;
            if (!descriptor.env.empty())
                server["env"] = descriptor.env;
        }
        else
        {
            server["url"] = descriptor.url;
            if (!descriptor.headers.empty())
                server["headers"] = descriptor.headers;
        }

        server["timeoutSeconds"] = descriptor.timeoutSeconds;
        server["maxRestartAttempts"] = descriptor.maxRestartAttempts;
        return server;
    }

} // namespace

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/mcphub";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/mcphub";
    return ".";
}

auto defaultDataDir() -> std::string
{
    auto const* const xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData)
        return std::string(xdgData) + "/mcphub";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.local/share/mcphub";
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
        return makeError(ErrorCode::ConfigError, "Config root must be an object");

    auto config = AppConfig {};

    if (root.contains("hub"))
    {
        auto const& hub = root["hub"];
        config.hub.dataDir = json::getStringOr(hub, "dataDir", "");
        auto const levelName = json::getStringOr(hub, "logLevel", "info");
        auto const level = log::levelFromString(levelName);
        if (!level)
            return makeError(ErrorCode::ConfigError, std::format("Unknown log level '{}'", levelName));
        config.hub.logLevel = *level;
    }

    if (root.contains("transport"))
    {
        auto const& transport = root["transport"];
        config.transport.requestTimeout =
            seconds(transport, "requestTimeoutSeconds", config.transport.requestTimeout);
        config.transport.reconnectDelay =
            seconds(transport, "sseReconnectDelaySeconds", config.transport.reconnectDelay);
        config.transport.stopGracePeriod =
            seconds(transport, "stopGracePeriodSeconds", config.transport.stopGracePeriod);
        config.transport.healthProbeTimeout =
            seconds(transport, "healthProbeTimeoutSeconds", config.transport.healthProbeTimeout);
    }
    config.proxy.stopGracePeriod = config.transport.stopGracePeriod;

    if (root.contains("autoRestart"))
    {
        auto const& autoRestart = root["autoRestart"];
        config.autoRestart.enabled = json::getBoolOr(autoRestart, "enabled", true);
        config.autoRestart.healthCheckInterval =
            seconds(autoRestart, "healthCheckIntervalSeconds", config.autoRestart.healthCheckInterval);
        config.autoRestart.maxRestartAttempts = json::getIntOr(autoRestart, "maxRestartAttempts", 3);
        config.autoRestart.restartDelay = seconds(autoRestart, "restartDelaySeconds", config.autoRestart.restartDelay);
    }

    if (root.contains("proxy"))
    {
        auto const& proxy = root["proxy"];
        auto const start = json::getIntOr(proxy, "portRangeStart", 9000);
        auto const end = json::getIntOr(proxy, "portRangeEnd", 9999);
        if (start < 1 || end > 65535 || start > end)
            return makeError(ErrorCode::ConfigError, std::format("Invalid proxy port range {}-{}", start, end));
        config.proxy.portRangeStart = static_cast<uint16_t>(start);
        config.proxy.portRangeEnd = static_cast<uint16_t>(end);
    }

    if (root.contains("mcpServers") && root["mcpServers"].is_object())
    {
        for (const auto& [name, serverJson]: root["mcpServers"].items())
        {
            auto descriptor = parseServer(name, serverJson);
            if (!descriptor)
                return std::unexpected(descriptor.error());
            config.mcpServers[name] = std::move(*descriptor);
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
    return parseConfig(ss.str());
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    auto hub = nlohmann::json::object();
    if (!config.hub.dataDir.empty())
        hub["dataDir"] = config.hub.dataDir;
    hub["logLevel"] = std::string(logLevelKey(config.hub.logLevel));
    root["hub"] = std::move(hub);

    root["transport"] = nlohmann::json {
        { "requestTimeoutSeconds", config.transport.requestTimeout.count() },
        { "sseReconnectDelaySeconds", config.transport.reconnectDelay.count() },
        { "stopGracePeriodSeconds", config.transport.stopGracePeriod.count() },
        { "healthProbeTimeoutSeconds", config.transport.healthProbeTimeout.count() },
    };

    root["autoRestart"] = nlohmann::json {
        { "enabled", config.autoRestart.enabled },
        { "healthCheckIntervalSeconds", config.autoRestart.healthCheckInterval.count() },
        { "maxRestartAttempts", config.autoRestart.maxRestartAttempts },
        { "restartDelaySeconds", config.autoRestart.restartDelay.count() },
    };

    root["proxy"] = nlohmann::json {
        { "portRangeStart", config.proxy.portRangeStart },
        { "portRangeEnd", config.proxy.portRangeEnd },
    };

    if (!config.mcpServers.empty())
    {
        auto servers = nlohmann::json::object();
        for (const auto& [name, descriptor]: config.mcpServers)
            servers[name] = serverToJson(descriptor);
        root["mcpServers"] = std::move(servers);
    }

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
