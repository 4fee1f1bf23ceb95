// SPDX-License-Identifier: Apache-2.0
#include "AutoRestart.hpp"

#include <core/Log.hpp>
#include <server/ServerManager.hpp>
#include <store/Store.hpp>

#include <algorithm>
#include <variant>

namespace mcphub
{

AutoRestart::AutoRestart(std::shared_ptr<ServerManager> manager,
                         std::shared_ptr<ServerStore> store,
                         AutoRestartConfig config,
                         clock::NowFunction now):
    _manager(std::move(manager)), _store(std::move(store)), _config(config), _now(std::move(now))
{
}

AutoRestart::~AutoRestart()
{
    stop();
}

void AutoRestart::start()
{
    if (!_config.enabled)
    {
        log::info("MCP server auto-restart is disabled");
        return;
    }

    if (_thread.joinable())
        return;

    log::info("Starting MCP server auto-restart task (check interval: {} seconds)",
              _config.healthCheckInterval.count());

    {
        auto lock = std::lock_guard { _mutex };
        _stopping = false;
    }
    _thread = std::thread([this] { run(); });
}

void AutoRestart::stop()
{
    {
        auto lock = std::lock_guard { _mutex };
        _stopping = true;
    }
    _cv.notify_all();

    if (_thread.joinable())
        _thread.join();
}

void AutoRestart::run()
{
    auto lock = std::unique_lock { _mutex };
    while (!_stopping)
    {
        if (_cv.wait_for(lock, _config.healthCheckInterval, [this] { return _stopping; }))
            break;

        lock.unlock();
        checkOnce();
        lock.lock();
    }
}

auto AutoRestart::checkOnce() -> int
{
    auto servers = _store->listServers();
    if (!servers)
    {
        log::error("Error during MCP server health check: {}", servers.error());
        return 0;
    }

    auto restarts = 0;
    for (const auto& record: *servers)
    {
        auto const& descriptor = record.descriptor;

        // User servers are started and stopped on request only.
        if (!descriptor.enabled || !descriptor.isSystem)
            continue;

        auto const now = _now();

        if (_manager->verifyRunning(descriptor))
        {
            auto lock = std::lock_guard { _mutex };
            _health[descriptor.id] = ServerHealth { .lastHealthCheck = now };
            continue;
        }

        if (!shouldRestart(descriptor, now))
            continue;

        ++restarts;
        log::info("Auto-restarting failed MCP server: {}", descriptor.name);
        auto outcome = _manager->start(descriptor.id);
        if (!outcome)
            log::error("Failed to restart MCP server {}: {}", descriptor.name, outcome.error());
        else if (auto const* failed = std::get_if<StartFailed>(&*outcome))
            log::error("Failed to restart MCP server {}: {}", descriptor.name, failed->error);
        else
            log::info("Successfully restarted MCP server: {}", descriptor.name);
    }
    return restarts;
}

auto AutoRestart::shouldRestart(const ServerDescriptor& descriptor, clock::TimePoint now) -> bool
{
    // The hub-wide setting caps whatever a server asks for.
    auto const maxAttempts = std::min(descriptor.maxRestartAttempts, _config.maxRestartAttempts);

    auto lock = std::lock_guard { _mutex };
    auto& health = _health[descriptor.id];

    ++health.consecutiveFailures;
    health.lastHealthCheck = now;

    if (health.consecutiveFailures > maxAttempts)
    {
        if (health.consecutiveFailures == maxAttempts + 1)
            log::warning("MCP server {} exceeded max restart attempts ({}), giving up", descriptor.id, maxAttempts);
        return false;
    }

    if (health.lastRestartAttempt && now - *health.lastRestartAttempt < _config.restartDelay)
        return false;

    health.lastRestartAttempt = now;
    return true;
}

auto AutoRestart::health(const std::string& serverId) const -> std::optional<ServerHealth>
{
    auto lock = std::lock_guard { _mutex };
    auto it = _health.find(serverId);
    if (it == _health.end())
        return std::nullopt;
    return it->second;
}

} // namespace mcphub
