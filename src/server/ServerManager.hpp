// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/Transport.hpp>
#include <server/ServerRegistry.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace mcphub
{

class ProcessProbe;
class ProxyManager;
class ServerStore;
class TransportFactory;

/// @brief The server was started by this call.
struct Started
{
    std::optional<int> pid;
    std::optional<uint16_t> port;
};

/// @brief The server was already running; nothing was spawned.
struct AlreadyRunning
{
    std::optional<int> pid;
    std::optional<uint16_t> port;
};

/// @brief The transport could not be started. Nothing was registered.
struct StartFailed
{
    Error error;
    std::filesystem::path logPath;
};

using StartOutcome = std::variant<Started, AlreadyRunning, StartFailed>;

/// @brief Liveness facts of a verified server.
struct RunningInfo
{
    std::optional<int> pid;
    std::optional<uint16_t> port;
};

/// @brief Invoked after a successful start, typically to discover the server's tools.
using DiscoveryHook = std::function<VoidResult(const std::string& serverId)>;

/// @brief Drives the lifecycle of tool servers: start, stop, verify, reconcile, shutdown.
///
/// All starts, for any server, are serialized by a single mutex so that two
/// callers can never spawn the same server twice or race for a port.
class ServerManager
{
  public:
    ServerManager(std::shared_ptr<ServerStore> store,
                  std::shared_ptr<ServerRegistry> registry,
                  std::shared_ptr<TransportFactory> factory,
                  std::shared_ptr<ProxyManager> proxies,
                  std::shared_ptr<ProcessProbe> probe,
                  std::filesystem::path dataDir,
                  clock::NowFunction now = clock::now);

    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    /// @brief Starts a server unless it is already running.
    /// @return The outcome, or NotFound / StorageError if the descriptor cannot be loaded.
    [[nodiscard]] auto start(const std::string& serverId) -> Result<StartOutcome>;

    /// @brief Stops a server and persists it as stopped, even if the teardown fails.
    [[nodiscard]] auto stop(const std::string& serverId) -> VoidResult;

    /// @brief Checks that a server is really running.
    ///
    /// A server that turns out dead, foreign or unreachable is removed from the
    /// registry and persisted as stopped before this returns.
    [[nodiscard]] auto verifyRunning(const ServerDescriptor& descriptor) -> std::optional<RunningInfo>;

    [[nodiscard]] auto isRunning(const std::string& serverId) -> bool;

    /// @brief Corrects persisted state of enabled servers and starts enabled system servers.
    [[nodiscard]] auto reconcile() -> VoidResult;

    /// @brief Stops every registered server and every stdio proxy.
    void shutdownAll();

    /// @brief The transport of a running server, or NotFound.
    [[nodiscard]] auto transportFor(const std::string& serverId) const -> Result<std::shared_ptr<Transport>>;

    void setDiscoveryHook(DiscoveryHook hook);

    /// @brief Directory holding the per-server log files.
    [[nodiscard]] auto logPathFor(const std::string& serverId) const -> std::filesystem::path;

    [[nodiscard]] auto registry() const noexcept -> const ServerRegistry& { return *_registry; }

  private:
    [[nodiscard]] auto verifyStdio(const ServerDescriptor& descriptor) -> std::optional<RunningInfo>;
    [[nodiscard]] auto verifyRemote(const ServerDescriptor& descriptor) -> std::optional<RunningInfo>;
    void cleanupStale(const ServerDescriptor& descriptor, std::string_view reason);
    void persistStopped(const std::string& serverId);

    std::shared_ptr<ServerStore> _store;
    std::shared_ptr<ServerRegistry> _registry;
    std::shared_ptr<TransportFactory> _factory;
    std::shared_ptr<ProxyManager> _proxies;
    std::shared_ptr<ProcessProbe> _probe;
    std::filesystem::path _dataDir;
    clock::NowFunction _now;

    std::mutex _startMutex;
    mutable std::mutex _hookMutex;
    DiscoveryHook _discoveryHook;
};

} // namespace mcphub
