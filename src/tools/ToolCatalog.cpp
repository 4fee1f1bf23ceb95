// SPDX-License-Identifier: Apache-2.0
#include "ToolCatalog.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/Uuid.hpp>
#include <mcp/JsonRpc.hpp>
#include <store/Store.hpp>

#include <algorithm>
#include <format>

namespace mcphub
{

namespace
{

    auto isAccessibleBy(const ServerDescriptor& server, const std::string& userId) -> bool
    {
        return server.isSystem || server.ownerId == userId;
    }

    auto resolve(ToolDescriptor tool, const ServerDescriptor& server) -> ResolvedTool
    {
        return ResolvedTool {
            .tool = std::move(tool),
            .serverName = server.name,
            .serverDisplayName = server.displayName.empty() ? server.name : server.displayName,
            .isSystem = server.isSystem,
            .transport = server.transport,
        };
    }

} // namespace

ToolCatalog::ToolCatalog(std::shared_ptr<ToolStore> tools,
                         std::shared_ptr<ServerStore> servers,
                         TransportLookup lookup,
                         clock::NowFunction now):
    _tools(std::move(tools)), _servers(std::move(servers)), _lookup(std::move(lookup)), _now(std::move(now))
{
}

auto ToolCatalog::discoveryLock(const std::string& serverId) -> std::shared_ptr<std::mutex>
{
    auto lock = std::lock_guard { _locksMutex };
    auto& slot = _discoveryLocks[serverId];
    if (!slot)
        slot = std::make_shared<std::mutex>();
    return slot;
}

auto ToolCatalog::discover(const std::string& serverId) -> Result<size_t>
{
    auto serverLock = discoveryLock(serverId);
    auto guard = std::lock_guard { *serverLock };
    return discoverLocked(serverId);
}

auto ToolCatalog::discoverIfStale(const std::string& serverId) -> Result<size_t>
{
    auto serverLock = discoveryLock(serverId);
    auto guard = std::lock_guard { *serverLock };

    // Another caller may have finished discovering while we waited for the lock.
    auto stale = shouldRediscover(serverId);
    if (!stale)
        return std::unexpected(stale.error());
    if (!*stale)
        return listForServer(serverId).transform([](const auto& tools) { return tools.size(); });

    return discoverLocked(serverId);
}

auto ToolCatalog::discoverLocked(const std::string& serverId) -> Result<size_t>
{
    auto record = _servers->getServer(serverId);
    if (!record)
        return std::unexpected(record.error());
    if (!record->has_value())
        return makeError(ErrorCode::NotFound, std::format("Server not found: {}", serverId));

    auto transport = _lookup(serverId);
    if (!transport)
        return std::unexpected(transport.error());

    log::info("Discovering tools for server {}", (*record)->descriptor.name);

    auto request = jsonrpc::makeRequest(uuid::generate(), "tools/list", nlohmann::json::object());
    return (*transport)
        ->send(request)
        .and_then([](const jsonrpc::Response& response) -> Result<nlohmann::json> {
            if (response.error)
                return makeError(ErrorCode::ProtocolError,
                                 std::format("MCP error: {} - {}", response.error->code, response.error->message));
            if (!response.result)
                return makeError(ErrorCode::ProtocolError, "No result in MCP response");
            return *response.result;
        })
        .and_then(parseToolList)
        .and_then([&](const std::vector<ToolDefinition>& tools) -> Result<size_t> {
            if (auto replaced = replace(serverId, tools); !replaced)
                return std::unexpected(replaced.error());
            log::info("Discovered {} tools for server {}", tools.size(), (*record)->descriptor.name);
            return tools.size();
        });
}

auto ToolCatalog::parseToolList(const nlohmann::json& result) -> Result<std::vector<ToolDefinition>>
{
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array())
        return makeError(ErrorCode::ProtocolError, "Failed to parse tools response: missing tools array");

    auto tools = std::vector<ToolDefinition> {};
    for (const auto& toolJson: result["tools"])
    {
        auto name = json::getString(toolJson, "name");
        if (!name)
            return makeError(ErrorCode::ProtocolError,
                             std::format("Failed to parse tools response: {}", name.error().message));

        auto schema = toolJson.contains("inputSchema") && toolJson["inputSchema"].is_object()
                          ? toolJson["inputSchema"]
                          : nlohmann::json { { "type", "object" } };

        tools.push_back(ToolDefinition {
            .name = std::move(*name),
            .description = json::getStringOr(toolJson, "description", ""),
            .inputSchema = std::move(schema),
        });
    }
    return tools;
}

auto ToolCatalog::replace(const std::string& serverId, const std::vector<ToolDefinition>& tools) -> VoidResult
{
    auto const now = _now();

    auto descriptors = std::vector<ToolDescriptor> {};
    descriptors.reserve(tools.size());
    for (const auto& tool: tools)
    {
        descriptors.push_back(ToolDescriptor {
            .serverId = serverId,
            .name = tool.name,
            .description = tool.description,
            .inputSchema = tool.inputSchema,
            .discoveredAt = now,
        });
    }

    if (auto replaced = _tools->replaceTools(serverId, descriptors); !replaced)
        return replaced;

    return _servers->updateToolStats(serverId, static_cast<int>(descriptors.size()), now);
}

auto ToolCatalog::findByName(const std::string& userId,
                             const std::string& toolName,
                             const std::optional<std::string>& serverId) -> Result<std::optional<ResolvedTool>>
{
    auto candidates = _tools->findTools(toolName);
    if (!candidates)
        return std::unexpected(candidates.error());

    auto systemMatch = std::optional<ResolvedTool> {};
    for (auto& tool: *candidates)
    {
        if (serverId && tool.serverId != *serverId)
            continue;

        auto server = _servers->getServer(tool.serverId);
        if (!server)
            return std::unexpected(server.error());
        if (!server->has_value() || !(*server)->descriptor.enabled)
            continue;

        auto const& descriptor = (*server)->descriptor;
        if (!isAccessibleBy(descriptor, userId))
            continue;

        if (!descriptor.isSystem)
            return std::optional<ResolvedTool> { resolve(std::move(tool), descriptor) };

        if (!systemMatch)
            systemMatch = resolve(std::move(tool), descriptor);
    }

    return systemMatch;
}

auto ToolCatalog::recordUsage(const std::string& serverId, const std::string& toolName) -> VoidResult
{
    return _tools->incrementUsage(serverId, toolName, _now());
}

auto ToolCatalog::listForServer(const std::string& serverId) -> Result<std::vector<ToolDescriptor>>
{
    return _tools->listTools(serverId).transform([](std::vector<ToolDescriptor> tools) {
        std::ranges::sort(tools, {}, &ToolDescriptor::name);
        return tools;
    });
}

auto ToolCatalog::listAccessible(const std::string& userId) -> Result<std::vector<ResolvedTool>>
{
    auto servers = _servers->listServers();
    if (!servers)
        return std::unexpected(servers.error());

    auto result = std::vector<ResolvedTool> {};
    for (const auto& record: *servers)
    {
        if (!record.descriptor.enabled || !isAccessibleBy(record.descriptor, userId))
            continue;

        auto tools = _tools->listTools(record.descriptor.id);
        if (!tools)
            return std::unexpected(tools.error());

        for (auto& tool: *tools)
            result.push_back(resolve(std::move(tool), record.descriptor));
    }

    std::ranges::sort(result, [](const ResolvedTool& a, const ResolvedTool& b) {
        if (a.serverDisplayName != b.serverDisplayName)
            return a.serverDisplayName < b.serverDisplayName;
        return a.tool.name < b.tool.name;
    });
    return result;
}

auto ToolCatalog::shouldRediscover(const std::string& serverId) -> Result<bool>
{
    auto record = _servers->getServer(serverId);
    if (!record)
        return std::unexpected(record.error());
    if (!record->has_value())
        return makeError(ErrorCode::NotFound, std::format("Server not found: {}", serverId));

    auto const& discoveredAt = (*record)->runtime.toolsDiscoveredAt;
    if (!discoveredAt)
        return true;
    return _now() - *discoveredAt > CacheLifetime;
}

} // namespace mcphub
