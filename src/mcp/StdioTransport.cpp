// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/Log.hpp>
#include <mcp/Handshake.hpp>
#include <mcp/ProxyManager.hpp>

#include <format>

namespace mcphub
{

StdioTransport::StdioTransport(ServerDescriptor descriptor,
                               std::shared_ptr<ProxyManager> proxies,
                               TransportOptions options):
    _descriptor(std::move(descriptor)), _proxies(std::move(proxies)), _options(std::move(options))
{
}

StdioTransport::~StdioTransport()
{
    stop();
}

auto StdioTransport::start() -> Result<ConnectionInfo>
{
    if (currentProxy())
        return makeError(ErrorCode::TransportError, "Transport already started");

    auto proxy = _proxies->startProxy(_descriptor);
    if (!proxy)
        return std::unexpected(proxy.error());

    {
        auto lock = std::lock_guard { _mutex };
        _proxy = *proxy;
        _forwarding = _proxy->notifications().subscribe([this](const nlohmann::json& n) { _hub.publish(n); });
    }

    auto handshake = performHandshake(*this, _options.clientName, _options.clientVersion);
    if (!handshake)
    {
        log::warning("Handshake with stdio server {} failed: {}", _descriptor.id, handshake.error());
        stop();
        return std::unexpected(handshake.error());
    }

    auto const& started = *proxy;
    return ConnectionInfo {
        .pid = started->pid(),
        .port = started->port(),
        .proxyUrl = started->proxyUrl(),
    };
}

auto StdioTransport::send(const nlohmann::json& request) -> Result<jsonrpc::Response>
{
    auto proxy = currentProxy();
    if (!proxy)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    return proxy->request(request, std::chrono::duration_cast<std::chrono::milliseconds>(_options.requestTimeout));
}

auto StdioTransport::notify(const nlohmann::json& notification) -> VoidResult
{
    auto proxy = currentProxy();
    if (!proxy)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    return proxy->notify(notification);
}

auto StdioTransport::notifications() -> NotificationHub&
{
    return _hub;
}

void StdioTransport::stop()
{
    auto proxy = std::shared_ptr<StdioProxy> {};
    {
        auto lock = std::lock_guard { _mutex };
        _forwarding.reset();
        proxy = std::move(_proxy);
    }

    if (!proxy)
        return;

    if (auto stopped = _proxies->stopProxy(_descriptor.id); !stopped)
        log::warning("Failed to stop proxy for {}: {}", _descriptor.id, stopped.error());
}

auto StdioTransport::isHealthy() -> bool
{
    auto proxy = currentProxy();
    return proxy && proxy->isHealthy();
}

auto StdioTransport::currentProxy() const -> std::shared_ptr<StdioProxy>
{
    auto lock = std::lock_guard { _mutex };
    return _proxy;
}

} // namespace mcphub
