// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/NotificationHub.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace mcphub
{

/// @brief What the loopback endpoint of a stdio proxy forwards to.
struct ProxyEndpoints
{
    std::function<Result<jsonrpc::Response>(const nlohmann::json& request)> request;
    std::function<VoidResult(const nlohmann::json& notification)> notify;
    std::function<bool()> healthy;
    NotificationHub* notifications = nullptr;
};

/// @brief Loopback HTTP endpoint of a stdio proxy.
///
/// Routes:
///   POST /mcp                 JSON-RPC request or notification, answered in the response body
///   POST /messages/<session>  same as /mcp
///   GET  /sse                 text/event-stream of server notifications
///   GET  /health              {"status":"healthy"} or 503
///
/// The acceptor is bound by listen() and held until stop(). Each connection
/// is served on its own thread and closed after one exchange.
class ProxyHttpServer
{
  public:
    explicit ProxyHttpServer(ProxyEndpoints endpoints);
    ~ProxyHttpServer();

    ProxyHttpServer(const ProxyHttpServer&) = delete;
    ProxyHttpServer& operator=(const ProxyHttpServer&) = delete;

    /// @brief Binds 127.0.0.1:<port>; fails with TransportError when the port is taken.
    [[nodiscard]] auto listen(uint16_t port) -> VoidResult;

    /// @brief Starts accepting connections on the bound port.
    void start();

    /// @brief Closes the acceptor and open connections, then waits for in-flight exchanges.
    void stop();

    [[nodiscard]] auto isListening() const -> bool;

    /// Shared with the connection threads, which may outlive a stop() call by a few instructions.
    struct State;

  private:
    std::shared_ptr<State> _state;
};

} // namespace mcphub
