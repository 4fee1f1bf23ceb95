// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/ProxyHttpServer.hpp>
#include <mcp/StdioProcess.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace mcphub
{

class ServerLog;

/// @brief Owns one stdio server process and the loopback endpoint advertised for it.
///
/// The hub dispatches requests to the child in-process. The same requests are
/// served over HTTP on the bound loopback port, so the advertised proxy URL
/// can be used by any local client.
class StdioProxy
{
  public:
    StdioProxy(const ServerDescriptor& descriptor, std::shared_ptr<ServerLog> serverLog);

    /// @brief Binds the HTTP endpoint to 127.0.0.1:<port>. Fails when the port is taken.
    [[nodiscard]] auto bind(uint16_t port) -> VoidResult;

    /// @brief Spawns the server process and starts serving the bound port.
    [[nodiscard]] auto start() -> VoidResult;

    /// @brief Terminates the process and closes the endpoint. Safe to call more than once.
    void stop(std::chrono::milliseconds gracePeriod);

    [[nodiscard]] auto request(const nlohmann::json& message, std::chrono::milliseconds timeout)
        -> Result<jsonrpc::Response>;
    [[nodiscard]] auto notify(const nlohmann::json& message) -> VoidResult;
    [[nodiscard]] auto notifications() -> NotificationHub&;

    [[nodiscard]] auto isHealthy() const -> bool;

    [[nodiscard]] auto serverId() const noexcept -> const std::string& { return _serverId; }
    [[nodiscard]] auto serverName() const noexcept -> const std::string& { return _serverName; }
    [[nodiscard]] auto port() const noexcept -> uint16_t { return _port; }
    [[nodiscard]] auto proxyUrl() const noexcept -> const std::string& { return _proxyUrl; }
    [[nodiscard]] auto pid() const -> int { return _process.pid(); }

  private:
    std::string _serverId;
    std::string _serverName;
    std::shared_ptr<ServerLog> _serverLog;
    std::chrono::milliseconds _requestTimeout;
    StdioProcess _process;
    uint16_t _port = 0;
    std::string _proxyUrl;
    ProxyHttpServer _http; // last: its handlers reach into _process
};

} // namespace mcphub
