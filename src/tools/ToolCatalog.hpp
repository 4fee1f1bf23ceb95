// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcphub
{

class ServerStore;
class ToolStore;

/// @brief Resolves the transport of a running server.
using TransportLookup = std::function<Result<std::shared_ptr<Transport>>(const std::string& serverId)>;

/// @brief A cached tool together with the server that provides it.
struct ResolvedTool
{
    ToolDescriptor tool;
    std::string serverName;
    std::string serverDisplayName;
    bool isSystem = false;
    TransportKind transport = TransportKind::Stdio;
};

/// @brief Cache of the tools each server offers.
///
/// Discovery always replaces a server's complete tool set; entries from an
/// earlier discovery never survive a later one.
class ToolCatalog
{
  public:
    /// Cached tool sets older than this are considered stale.
    static constexpr auto CacheLifetime = std::chrono::minutes(10);

    ToolCatalog(std::shared_ptr<ToolStore> tools,
                std::shared_ptr<ServerStore> servers,
                TransportLookup lookup,
                clock::NowFunction now = clock::now);

    /// @brief Asks the running server for tools/list and replaces its cached tool set.
    /// @return Number of tools discovered.
    [[nodiscard]] auto discover(const std::string& serverId) -> Result<size_t>;

    /// @brief Like discover(), but returns the cached count while the cache is fresh.
    [[nodiscard]] auto discoverIfStale(const std::string& serverId) -> Result<size_t>;

    /// @brief Replaces the cached tool set of a server and updates its tool statistics.
    [[nodiscard]] auto replace(const std::string& serverId, const std::vector<ToolDefinition>& tools) -> VoidResult;

    /// @brief Finds a tool the user may call.
    ///
    /// Without an explicit server the user's own servers win over system servers.
    [[nodiscard]] auto findByName(const std::string& userId,
                                  const std::string& toolName,
                                  const std::optional<std::string>& serverId = std::nullopt)
        -> Result<std::optional<ResolvedTool>>;

    [[nodiscard]] auto recordUsage(const std::string& serverId, const std::string& toolName) -> VoidResult;

    [[nodiscard]] auto listForServer(const std::string& serverId) -> Result<std::vector<ToolDescriptor>>;

    /// @brief Tools of the user's own and of system servers, enabled servers only.
    [[nodiscard]] auto listAccessible(const std::string& userId) -> Result<std::vector<ResolvedTool>>;

    /// @brief True if the server was never discovered or its cache is older than CacheLifetime.
    [[nodiscard]] auto shouldRediscover(const std::string& serverId) -> Result<bool>;

    /// @brief Extracts the tool definitions of a tools/list result.
    [[nodiscard]] static auto parseToolList(const nlohmann::json& result) -> Result<std::vector<ToolDefinition>>;

  private:
    [[nodiscard]] auto discoveryLock(const std::string& serverId) -> std::shared_ptr<std::mutex>;
    [[nodiscard]] auto discoverLocked(const std::string& serverId) -> Result<size_t>;

    std::shared_ptr<ToolStore> _tools;
    std::shared_ptr<ServerStore> _servers;
    TransportLookup _lookup;
    clock::NowFunction _now;

    std::mutex _locksMutex;
    std::map<std::string, std::shared_ptr<std::mutex>> _discoveryLocks;
};

} // namespace mcphub
