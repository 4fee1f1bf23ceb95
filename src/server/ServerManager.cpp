// SPDX-License-Identifier: Apache-2.0
#include "ServerManager.hpp"

#include <core/Log.hpp>
#include <mcp/ProcessProbe.hpp>
#include <mcp/ProxyManager.hpp>
#include <mcp/ServerLog.hpp>
#include <mcp/TransportFactory.hpp>
#include <store/Store.hpp>

#include <format>

namespace mcphub
{

namespace
{

    auto describePid(std::optional<int> pid) -> std::string
    {
        return pid ? std::to_string(*pid) : std::string("-");
    }

    auto stoppedUpdate() -> RuntimeUpdate
    {
        return RuntimeUpdate {
            .status = ServerStatus::Stopped,
            .isActive = false,
            .processId = std::nullopt,
            .port = std::nullopt,
            .proxyUrl = {},
        };
    }

} // namespace

ServerManager::ServerManager(std::shared_ptr<ServerStore> store,
                             std::shared_ptr<ServerRegistry> registry,
                             std::shared_ptr<TransportFactory> factory,
                             std::shared_ptr<ProxyManager> proxies,
                             std::shared_ptr<ProcessProbe> probe,
                             std::filesystem::path dataDir,
                             clock::NowFunction now):
    _store(std::move(store)),
    _registry(std::move(registry)),
    _factory(std::move(factory)),
    _proxies(std::move(proxies)),
    _probe(std::move(probe)),
    _dataDir(std::move(dataDir)),
    _now(std::move(now))
{
}

auto ServerManager::logPathFor(const std::string& serverId) const -> std::filesystem::path
{
    return ServerLog::directoryFor(_dataDir, serverId);
}

void ServerManager::setDiscoveryHook(DiscoveryHook hook)
{
    auto lock = std::lock_guard { _hookMutex };
    _discoveryHook = std::move(hook);
}

auto ServerManager::start(const std::string& serverId) -> Result<StartOutcome>
{
    auto startLock = std::unique_lock { _startMutex };

    auto record = _store->getServer(serverId);
    if (!record)
        return std::unexpected(record.error());
    if (!record->has_value())
        return makeError(ErrorCode::NotFound, std::format("Server {} not found", serverId));

    auto const& descriptor = (*record)->descriptor;

    if (descriptor.transport == TransportKind::Stdio)
    {
        if (auto running = verifyStdio(descriptor))
        {
            log::info("MCP server {} already running (PID: {})", descriptor.name, describePid(running->pid));
            return AlreadyRunning { .pid = running->pid, .port = running->port };
        }
    }
    else if (auto entry = _registry->find(serverId))
    {
        return AlreadyRunning { .pid = entry->pid, .port = entry->port };
    }

    auto const logPath = logPathFor(serverId);

    auto transport = _factory->create(descriptor);
    if (!transport)
    {
        log::error("Cannot create transport for MCP server {}: {}", descriptor.name, transport.error());
        return StartFailed { .error = transport.error(), .logPath = logPath };
    }

    log::info("Starting MCP server {} ({})", descriptor.name, transportKindToString(descriptor.transport));
    auto info = (*transport)->start();
    if (!info)
    {
        log::error("Failed to start MCP server {}: {}", descriptor.name, info.error());
        auto const failed = RuntimeUpdate { .status = ServerStatus::Failed };
        if (auto persisted = _store->updateRuntime(serverId, failed); !persisted)
            log::warning("Cannot persist failure of MCP server {}: {}", serverId, persisted.error());
        return StartFailed { .error = info.error(), .logPath = logPath };
    }

    auto const inserted = _registry->insert(RegistryEntry {
        .serverId = serverId,
        .transport = *transport,
        .pid = info->pid,
        .port = info->port,
        .kind = descriptor.transport,
    });
    if (!inserted)
        log::warning("MCP server {} was registered concurrently; keeping the existing entry", serverId);

    auto const running = RuntimeUpdate {
        .status = ServerStatus::Running,
        .isActive = true,
        .processId = info->pid,
        .port = info->port,
        .proxyUrl = info->proxyUrl,
    };
    if (auto persisted = _store->updateRuntime(serverId, running); !persisted)
        log::warning("Cannot persist runtime info of MCP server {}: {}", serverId, persisted.error());
    if (auto persisted = _store->recordRestart(serverId, _now()); !persisted)
        log::warning("Cannot update restart count of MCP server {}: {}", serverId, persisted.error());

    log::info("MCP server {} started (PID: {})", descriptor.name, describePid(info->pid));

    // Discovery talks to the server; do not hold up other starts meanwhile.
    startLock.unlock();

    auto hook = DiscoveryHook {};
    {
        auto lock = std::lock_guard { _hookMutex };
        hook = _discoveryHook;
    }
    if (hook)
    {
        if (auto discovered = hook(serverId); !discovered)
            log::warning("Tool discovery for MCP server {} failed: {}", descriptor.name, discovered.error());
    }

    return Started { .pid = info->pid, .port = info->port };
}

auto ServerManager::stop(const std::string& serverId) -> VoidResult
{
    // Remove first so concurrent health checks see the server going away.
    auto entry = _registry->remove(serverId);

    if (entry)
    {
        log::info("Stopping MCP server {} (PID: {}, transport: {})",
                  serverId,
                  describePid(entry->pid),
                  transportKindToString(entry->kind));

        if (entry->kind == TransportKind::Stdio)
        {
            if (auto stopped = _proxies->stopProxy(serverId); !stopped)
                log::warning("Failed to stop proxy of MCP server {}: {}", serverId, stopped.error());
        }
        entry->transport->stop();
    }
    else if (_proxies->find(serverId))
    {
        // A proxy without registry entry is left over from a failed verification.
        if (auto stopped = _proxies->stopProxy(serverId); !stopped)
            log::warning("Failed to stop proxy of MCP server {}: {}", serverId, stopped.error());
    }

    return _store->updateRuntime(serverId, stoppedUpdate());
}

auto ServerManager::verifyRunning(const ServerDescriptor& descriptor) -> std::optional<RunningInfo>
{
    auto running = descriptor.transport == TransportKind::Stdio ? verifyStdio(descriptor) : verifyRemote(descriptor);
    if (running)
    {
        if (auto stamped = _store->recordHealthCheck(descriptor.id, _now()); !stamped)
            log::debug("Cannot record health check of {}: {}", descriptor.id, stamped.error());
    }
    return running;
}

auto ServerManager::isRunning(const std::string& serverId) -> bool
{
    auto record = _store->getServer(serverId);
    if (!record || !record->has_value())
        return false;
    return verifyRunning((*record)->descriptor).has_value();
}

auto ServerManager::verifyStdio(const ServerDescriptor& descriptor) -> std::optional<RunningInfo>
{
    auto pid = std::optional<int> {};
    auto port = std::optional<uint16_t> {};

    if (auto entry = _registry->find(descriptor.id))
    {
        pid = entry->pid;
        port = entry->port;
    }
    else if (auto record = _store->getServer(descriptor.id); record && record->has_value())
    {
        pid = (*record)->runtime.processId;
        port = (*record)->runtime.port;
    }

    if (!pid)
        return std::nullopt;

    if (!_probe->isAlive(*pid))
    {
        cleanupStale(descriptor, std::format("process {} is gone", *pid));
        return std::nullopt;
    }

    if (!_probe->hasMarker(*pid))
    {
        cleanupStale(descriptor, std::format("pid {} belongs to another process", *pid));
        return std::nullopt;
    }

    return RunningInfo { .pid = pid, .port = port };
}

auto ServerManager::verifyRemote(const ServerDescriptor& descriptor) -> std::optional<RunningInfo>
{
    auto entry = _registry->find(descriptor.id);
    if (!entry)
        return std::nullopt;

    if (!entry->transport->isHealthy())
    {
        cleanupStale(descriptor, "health probe failed");
        return std::nullopt;
    }

    return RunningInfo { .pid = entry->pid, .port = entry->port };
}

void ServerManager::cleanupStale(const ServerDescriptor& descriptor, std::string_view reason)
{
    log::warning("MCP server {} is not running ({}), cleaning up", descriptor.name, reason);

    auto entry = _registry->remove(descriptor.id);

    // Our own child may have died; release its proxy and port. A foreign pid is
    // never signalled because the proxy only ever signals its own unreaped child.
    if (descriptor.transport == TransportKind::Stdio)
    {
        if (auto stopped = _proxies->stopProxy(descriptor.id); !stopped)
            log::warning("Failed to release proxy of MCP server {}: {}", descriptor.id, stopped.error());
    }

    if (entry)
        entry->transport->stop();

    persistStopped(descriptor.id);
}

void ServerManager::persistStopped(const std::string& serverId)
{
    if (auto persisted = _store->updateRuntime(serverId, stoppedUpdate()); !persisted)
        log::warning("Cannot persist stopped state of MCP server {}: {}", serverId, persisted.error());
}

auto ServerManager::reconcile() -> VoidResult
{
    log::info("Starting MCP server state reconciliation...");

    auto servers = _store->listServers();
    if (!servers)
        return std::unexpected(servers.error());

    for (const auto& record: *servers)
    {
        auto const& descriptor = record.descriptor;
        if (!descriptor.enabled)
            continue;

        if (!verifyRunning(descriptor) && (record.runtime.status != ServerStatus::Stopped || record.runtime.isActive))
            persistStopped(descriptor.id);

        if (!descriptor.isSystem)
            continue;

        log::info("Auto-starting system MCP server: {}", descriptor.name);
        auto outcome = start(descriptor.id);
        if (!outcome)
        {
            log::error("Failed to auto-start system server {}: {}", descriptor.name, outcome.error());
            continue;
        }
        if (auto const* failed = std::get_if<StartFailed>(&*outcome))
            log::error("Failed to auto-start system server {}: {} (logs: {})",
                       descriptor.name,
                       failed->error,
                       failed->logPath.string());
    }

    return {};
}

void ServerManager::shutdownAll()
{
    log::info("Shutting down all MCP servers...");

    for (const auto& entry: _registry->snapshot())
    {
        if (auto stopped = stop(entry.serverId); !stopped)
            log::error("Failed to stop MCP server {} (PID: {}): {}",
                       entry.serverId,
                       describePid(entry.pid),
                       stopped.error());
    }

    for (auto& leftover: _registry->clear())
        leftover.transport->stop();

    _proxies->shutdownAll();
}

auto ServerManager::transportFor(const std::string& serverId) const -> Result<std::shared_ptr<Transport>>
{
    auto entry = _registry->find(serverId);
    if (!entry)
        return makeError(ErrorCode::NotFound, std::format("MCP server {} is not running", serverId));
    return entry->transport;
}

} // namespace mcphub
