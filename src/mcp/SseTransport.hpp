// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/HttpClient.hpp>
#include <mcp/PendingRequests.hpp>
#include <mcp/SseParser.hpp>
#include <mcp/Transport.hpp>

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace mcphub
{

/// @brief Transport for MCP servers speaking the server-sent-events binding.
///
/// A listener thread keeps the event stream open, reconnecting after a fixed
/// delay whenever it drops. Requests are POSTed to a per-session URL and
/// their responses arrive on the event stream, correlated by request id.
class SseTransport: public Transport
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
                                     TransportOptions options = {}) -> Result<std::unique_ptr<SseTransport>>;

    /// @brief Only create() can name the passkey.
    SseTransport(Passkey,
                 ServerDescriptor descriptor,
                 std::shared_ptr<HttpClient> client,
                 TransportOptions options,
                 std::string baseUrl,
                 std::optional<uint16_t> port);
    ~SseTransport() override;

    SseTransport(const SseTransport&) = delete;
    SseTransport& operator=(const SseTransport&) = delete;

    [[nodiscard]] auto start() -> Result<ConnectionInfo> override;
    [[nodiscard]] auto send(const nlohmann::json& request) -> Result<jsonrpc::Response> override;
    [[nodiscard]] auto notify(const nlohmann::json& notification) -> VoidResult override;
    [[nodiscard]] auto notifications() -> NotificationHub& override { return _hub; }
    void stop() override;
    [[nodiscard]] auto isHealthy() -> bool override;
    [[nodiscard]] auto kind() const -> TransportKind override { return TransportKind::Sse; }

    [[nodiscard]] auto sessionId() const -> std::string;
    [[nodiscard]] auto streamUrl() const -> std::string;
    [[nodiscard]] auto postUrl() const -> std::string;

    /// @brief Routes one decoded event; exposed for the listener and for tests.
    void handleEvent(const SseEvent& event);

  private:
    void listen();
    [[nodiscard]] auto postMessage(const nlohmann::json& message) -> VoidResult;
    [[nodiscard]] auto waitForConnection(std::chrono::milliseconds timeout) -> bool;
    [[nodiscard]] auto resolveEndpoint(std::string_view endpoint) const -> std::string;

    ServerDescriptor _descriptor;
    std::shared_ptr<HttpClient> _client;
    TransportOptions _options;
    std::string _baseUrl;
    std::optional<uint16_t> _port;

    NotificationHub _hub;
    PendingRequests _pending;

    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::string _sessionId;
    std::string _streamUrl;
    std::string _postUrl;
    bool _connected = false;
    std::optional<Error> _connectFailure; ///< Why the stream of the current start() never opened.

    std::atomic<bool> _stopping = false;
    std::atomic<bool> _listenerAlive = false;
    std::atomic<bool> _initialized = false;
    std::thread _listener;
};

} // namespace mcphub
