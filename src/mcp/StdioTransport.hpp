// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <memory>
#include <mutex>

namespace mcphub
{

class ProxyManager;
class StdioProxy;

/// @brief Transport that talks to a spawned MCP server over stdio pipes.
///
/// The child process is owned by a StdioProxy held in the ProxyManager, so
/// the manager can tear it down independently of this object.
class StdioTransport: public Transport
{
  public:
    StdioTransport(ServerDescriptor descriptor, std::shared_ptr<ProxyManager> proxies, TransportOptions options = {});
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    [[nodiscard]] auto start() -> Result<ConnectionInfo> override;
    [[nodiscard]] auto send(const nlohmann::json& request) -> Result<jsonrpc::Response> override;
    [[nodiscard]] auto notify(const nlohmann::json& notification) -> VoidResult override;
    [[nodiscard]] auto notifications() -> NotificationHub& override;
    void stop() override;
    [[nodiscard]] auto isHealthy() -> bool override;
    [[nodiscard]] auto kind() const -> TransportKind override { return TransportKind::Stdio; }

  private:
    [[nodiscard]] auto currentProxy() const -> std::shared_ptr<StdioProxy>;

    ServerDescriptor _descriptor;
    std::shared_ptr<ProxyManager> _proxies;
    TransportOptions _options;
    NotificationHub _hub;

    mutable std::mutex _mutex;
    std::shared_ptr<StdioProxy> _proxy;
    NotificationHub::Subscription _forwarding;
};

} // namespace mcphub
