// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/StdioProxy.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace mcphub
{

/// @brief Hands out loopback ports from a fixed range.
class PortAllocator
{
  public:
    PortAllocator(uint16_t rangeStart, uint16_t rangeEnd);

    /// Takes a candidate port and reports whether it now holds it.
    using Binder = std::function<bool(uint16_t)>;

    /// @brief Reserves the lowest unreserved port that @p bind manages to take.
    ///
    /// The caller's listener holds the port from then on, so nothing else can
    /// grab it between the check and its use.
    [[nodiscard]] auto allocate(const Binder& bind) -> std::optional<uint16_t>;
    void release(uint16_t port);
    void clear();

    [[nodiscard]] auto allocatedCount() const -> size_t;

  private:
    uint16_t _rangeStart;
    uint16_t _rangeEnd;
    std::set<uint16_t> _allocated;
    mutable std::mutex _mutex;
};

struct ProxyOptions
{
    uint16_t portRangeStart = 9000;
    uint16_t portRangeEnd = 9999;
    std::chrono::milliseconds stopGracePeriod { 5'000 };
};

struct ProxyInfo
{
    std::string serverId;
    std::string serverName;
    uint16_t port = 0;
    std::string proxyUrl;
    int pid = -1;
};

/// @brief Owns every stdio proxy, keyed by server id.
class ProxyManager
{
  public:
    ProxyManager(std::filesystem::path dataDir, ProxyOptions options = {});
    ~ProxyManager();

    ProxyManager(const ProxyManager&) = delete;
    ProxyManager& operator=(const ProxyManager&) = delete;

    /// @brief Starts a proxy for a stdio server, or returns the one already running.
    [[nodiscard]] auto startProxy(const ServerDescriptor& descriptor) -> Result<std::shared_ptr<StdioProxy>>;

    /// @brief Stops and forgets the proxy of a server; a no-op if there is none.
    [[nodiscard]] auto stopProxy(const std::string& serverId) -> VoidResult;

    [[nodiscard]] auto find(const std::string& serverId) const -> std::shared_ptr<StdioProxy>;
    [[nodiscard]] auto proxyUrl(const std::string& serverId) const -> std::optional<std::string>;
    [[nodiscard]] auto isProxyHealthy(const std::string& serverId) const -> bool;
    [[nodiscard]] auto runningProxies() const -> std::vector<ProxyInfo>;

    /// @brief Stops every proxy and releases all ports.
    void shutdownAll();

  private:
    std::filesystem::path _dataDir;
    ProxyOptions _options;
    PortAllocator _ports;
    std::map<std::string, std::shared_ptr<StdioProxy>> _proxies;
    mutable std::shared_mutex _mutex;
    std::mutex _startMutex;
};

} // namespace mcphub
