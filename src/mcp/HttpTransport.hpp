// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/HttpClient.hpp>
#include <mcp/Transport.hpp>

#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace mcphub
{

/// @brief Transport for MCP servers reachable over plain HTTP POST.
///
/// Every request is POSTed to the server's /mcp endpoint and the response is
/// read from the HTTP response body.
class HttpTransport: public Transport
{
    struct Passkey
    {
        explicit Passkey() = default;
    };

  public:
    /// @brief Validates the descriptor's URL and builds the transport.
    /// @return The transport, or ConfigError when the URL is missing or invalid.
    [[nodiscard]] static auto create(ServerDescriptor descriptor,
                                     std::shared_ptr<HttpClient> client,
                                     TransportOptions options = {}) -> Result<std::unique_ptr<HttpTransport>>;

    /// @brief Only create() can name the passkey.
    HttpTransport(Passkey,
                  ServerDescriptor descriptor,
                  std::shared_ptr<HttpClient> client,
                  TransportOptions options,
                  std::string endpoint,
                  std::optional<uint16_t> port);

    /// @brief Returns url with "/mcp" appended unless it already ends that way.
    [[nodiscard]] static auto normalizeEndpoint(std::string_view url) -> std::string;

    [[nodiscard]] auto start() -> Result<ConnectionInfo> override;
    [[nodiscard]] auto send(const nlohmann::json& request) -> Result<jsonrpc::Response> override;
    [[nodiscard]] auto notify(const nlohmann::json& notification) -> VoidResult override;
    [[nodiscard]] auto notifications() -> NotificationHub& override { return _hub; }
    void stop() override;
    [[nodiscard]] auto isHealthy() -> bool override;
    [[nodiscard]] auto kind() const -> TransportKind override { return TransportKind::Http; }

    [[nodiscard]] auto endpoint() const noexcept -> const std::string& { return _endpoint; }

  private:
    [[nodiscard]] auto post(const nlohmann::json& message) -> Result<HttpResponse>;

    ServerDescriptor _descriptor;
    std::shared_ptr<HttpClient> _client;
    TransportOptions _options;
    std::string _endpoint;
    std::optional<uint16_t> _port;
    NotificationHub _hub;
    std::atomic<bool> _initialized = false;
};

} // namespace mcphub
