// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/NotificationHub.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace mcphub
{

/// @brief What a started transport reports about its channel.
struct ConnectionInfo
{
    std::optional<int> pid;
    std::optional<uint16_t> port;
    std::string proxyUrl;
};

/// @brief Tunables shared by all transport kinds.
struct TransportOptions
{
    std::chrono::seconds requestTimeout { 30 };
    std::chrono::seconds reconnectDelay { 5 };
    std::chrono::seconds healthProbeTimeout { 5 };
    std::chrono::seconds stopGracePeriod { 5 };
    std::string clientName = "mcphub";
    std::string clientVersion = "0.1.0";
};

/// @brief Abstract interface for one MCP server channel.
///
/// start() connects and completes the initialize handshake before returning.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Establishes the channel and performs the MCP handshake.
    [[nodiscard]] virtual auto start() -> Result<ConnectionInfo> = 0;

    /// @brief Sends a request and waits for the correlated response.
    /// @param request A JSON-RPC request carrying an id.
    /// @return The response, TimeoutError when none arrives in time, or TransportError.
    [[nodiscard]] virtual auto send(const nlohmann::json& request) -> Result<jsonrpc::Response> = 0;

    /// @brief Sends a notification; no response is expected.
    [[nodiscard]] virtual auto notify(const nlohmann::json& notification) -> VoidResult = 0;

    /// @brief Stream of server-initiated notifications.
    [[nodiscard]] virtual auto notifications() -> NotificationHub& = 0;

    /// @brief Releases the channel and any spawned process. Idempotent.
    virtual void stop() = 0;

    /// @brief Cheap reachability probe.
    [[nodiscard]] virtual auto isHealthy() -> bool = 0;

    [[nodiscard]] virtual auto kind() const -> TransportKind = 0;
};

} // namespace mcphub
