// SPDX-License-Identifier: Apache-2.0
#include "ProxyManager.hpp"

#include <core/Log.hpp>
#include <mcp/ServerLog.hpp>

#include <format>

namespace mcphub
{

PortAllocator::PortAllocator(uint16_t rangeStart, uint16_t rangeEnd): _rangeStart(rangeStart), _rangeEnd(rangeEnd)
{
}

auto PortAllocator::allocate(const Binder& bind) -> std::optional<uint16_t>
{
    auto lock = std::lock_guard { _mutex };
    for (auto port = static_cast<uint32_t>(_rangeStart); port <= _rangeEnd; ++port)
    {
        auto const candidate = static_cast<uint16_t>(port);
        if (!_allocated.contains(candidate) && bind(candidate))
        {
            _allocated.insert(candidate);
            return candidate;
        }
    }
    return std::nullopt;
}

void PortAllocator::release(uint16_t port)
{
    auto lock = std::lock_guard { _mutex };
    _allocated.erase(port);
}

void PortAllocator::clear()
{
    auto lock = std::lock_guard { _mutex };
    _allocated.clear();
}

auto PortAllocator::allocatedCount() const -> size_t
{
    auto lock = std::lock_guard { _mutex };
    return _allocated.size();
}

ProxyManager::ProxyManager(std::filesystem::path dataDir, ProxyOptions options):
    _dataDir(std::move(dataDir)), _options(options), _ports(options.portRangeStart, options.portRangeEnd)
{
}

ProxyManager::~ProxyManager()
{
    shutdownAll();
}

auto ProxyManager::startProxy(const ServerDescriptor& descriptor) -> Result<std::shared_ptr<StdioProxy>>
{
    if (descriptor.transport != TransportKind::Stdio)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Server {} does not use the stdio transport", descriptor.id));

    if (descriptor.command.empty())
        return makeError(ErrorCode::ConfigError,
                         std::format("Command is required for stdio server {}", descriptor.id));

    // Two racing starts for the same server must not spawn twice.
    auto startLock = std::lock_guard { _startMutex };

    if (auto existing = find(descriptor.id))
        return existing;

    auto proxy = std::make_shared<StdioProxy>(descriptor, std::make_shared<ServerLog>(_dataDir, descriptor.id));
    auto port = _ports.allocate([&](uint16_t candidate) { return proxy->bind(candidate).has_value(); });
    if (!port)
        return makeError(ErrorCode::TransportError,
                         std::format("No free proxy port in {}-{}", _options.portRangeStart, _options.portRangeEnd));

    if (auto started = proxy->start(); !started)
    {
        _ports.release(*port);
        return std::unexpected(started.error());
    }

    {
        auto lock = std::unique_lock { _mutex };
        _proxies[descriptor.id] = proxy;
    }
    return proxy;
}

auto ProxyManager::stopProxy(const std::string& serverId) -> VoidResult
{
    auto proxy = std::shared_ptr<StdioProxy> {};
    {
        auto lock = std::unique_lock { _mutex };
        auto it = _proxies.find(serverId);
        if (it == _proxies.end())
            return {};
        proxy = std::move(it->second);
        _proxies.erase(it);
    }

    auto const port = proxy->port();
    proxy->stop(_options.stopGracePeriod);
    _ports.release(port);
    log::debug("Stopped proxy for MCP server {}", serverId);
    return {};
}

auto ProxyManager::find(const std::string& serverId) const -> std::shared_ptr<StdioProxy>
{
    auto lock = std::shared_lock { _mutex };
    auto it = _proxies.find(serverId);
    return it != _proxies.end() ? it->second : nullptr;
}

auto ProxyManager::proxyUrl(const std::string& serverId) const -> std::optional<std::string>
{
    if (auto proxy = find(serverId))
        return proxy->proxyUrl();
    return std::nullopt;
}

auto ProxyManager::isProxyHealthy(const std::string& serverId) const -> bool
{
    auto proxy = find(serverId);
    return proxy && proxy->isHealthy();
}

auto ProxyManager::runningProxies() const -> std::vector<ProxyInfo>
{
    auto lock = std::shared_lock { _mutex };
    auto out = std::vector<ProxyInfo> {};
    out.reserve(_proxies.size());
    for (const auto& [id, proxy]: _proxies)
    {
        out.push_back(ProxyInfo {
            .serverId = id,
            .serverName = proxy->serverName(),
            .port = proxy->port(),
            .proxyUrl = proxy->proxyUrl(),
            .pid = proxy->pid(),
        });
    }
    return out;
}

void ProxyManager::shutdownAll()
{
    auto ids = std::vector<std::string> {};
    {
        auto lock = std::shared_lock { _mutex };
        for (const auto& [id, proxy]: _proxies)
            ids.push_back(id);
    }

    if (!ids.empty())
        log::info("Shutting down {} MCP prox{}", ids.size(), ids.size() == 1 ? "y" : "ies");

    for (const auto& id: ids)
    {
        if (auto stopped = stopProxy(id); !stopped)
            log::error("Failed to stop proxy for server {}: {}", id, stopped.error());
    }

    _ports.clear();
}

} // namespace mcphub
