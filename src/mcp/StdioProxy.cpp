// SPDX-License-Identifier: Apache-2.0
#include "StdioProxy.hpp"

#include <core/Log.hpp>
#include <mcp/ServerLog.hpp>

#include <format>

namespace mcphub
{

StdioProxy::StdioProxy(const ServerDescriptor& descriptor, std::shared_ptr<ServerLog> serverLog):
    _serverId(descriptor.id),
    _serverName(descriptor.name),
    _serverLog(serverLog),
    _requestTimeout(std::chrono::seconds(descriptor.timeoutSeconds)),
    _process(
        StdioProcessConfig {
            .command = descriptor.command,
            .args = descriptor.args,
            .env = descriptor.env,
        },
        std::move(serverLog)),
    _http(ProxyEndpoints {
        .request = [this](const nlohmann::json& message) { return _process.request(message, _requestTimeout); },
        .notify = [this](const nlohmann::json& message) { return _process.notify(message); },
        .healthy = [this] { return _process.isRunning(); },
        .notifications = &_process.notifications(),
    })
{
}

auto StdioProxy::bind(uint16_t port) -> VoidResult
{
    if (auto listening = _http.listen(port); !listening)
        return listening;

    _port = port;
    _proxyUrl = std::format("http://127.0.0.1:{}/mcp", port);
    return {};
}

auto StdioProxy::start() -> VoidResult
{
    if (!_http.isListening())
        return makeError(ErrorCode::InvalidArgument, std::format("Proxy for {} has no bound port", _serverName));

    if (_serverLog)
        _serverLog->exec("INFO", std::format("Starting MCP stdio proxy for {} on port {}", _serverName, _port));

    auto spawned = _process.spawn();
    if (!spawned)
    {
        _http.stop();
        return spawned;
    }

    _http.start();
    log::info("Started MCP proxy for '{}' on port {}", _serverName, _port);
    return {};
}

void StdioProxy::stop(std::chrono::milliseconds gracePeriod)
{
    if (_serverLog)
        _serverLog->exec("INFO", "Stopping MCP stdio proxy");

    _process.terminate(gracePeriod);
    _http.stop();
    log::info("Stopped MCP proxy for '{}'", _serverName);
}

auto StdioProxy::request(const nlohmann::json& message, std::chrono::milliseconds timeout)
    -> Result<jsonrpc::Response>
{
    return _process.request(message, timeout);
}

auto StdioProxy::notify(const nlohmann::json& message) -> VoidResult
{
    return _process.notify(message);
}

auto StdioProxy::notifications() -> NotificationHub&
{
    return _process.notifications();
}

auto StdioProxy::isHealthy() const -> bool
{
    return _process.isRunning();
}

} // namespace mcphub
