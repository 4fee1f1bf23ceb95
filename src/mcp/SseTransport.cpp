// SPDX-License-Identifier: Apache-2.0
#include "SseTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/Uuid.hpp>
#include <mcp/Handshake.hpp>

#include <format>

namespace mcphub
{

SseTransport::SseTransport(Passkey,
                           ServerDescriptor descriptor,
                           std::shared_ptr<HttpClient> client,
                           TransportOptions options,
                           std::string baseUrl,
                           std::optional<uint16_t> port):
    _descriptor(std::move(descriptor)),
    _client(std::move(client)),
    _options(std::move(options)),
    _baseUrl(std::move(baseUrl)),
    _port(port)
{
}

SseTransport::~SseTransport()
{
    stop();
}

auto SseTransport::create(ServerDescriptor descriptor, std::shared_ptr<HttpClient> client, TransportOptions options)
    -> Result<std::unique_ptr<SseTransport>>
{
    if (descriptor.url.empty())
        return makeError(ErrorCode::ConfigError,
                         std::format("URL is required for SSE transport (server {})", descriptor.id));

    auto parsed = parseUrl(descriptor.url);
    if (!parsed)
        return std::unexpected(parsed.error());

    auto base = std::string_view(descriptor.url);
    while (base.ends_with('/'))
        base.remove_suffix(1);

    auto baseUrl = std::string(base);
    return std::make_unique<SseTransport>(
        Passkey {}, std::move(descriptor), std::move(client), std::move(options), std::move(baseUrl), parsed->port);
}

auto SseTransport::start() -> Result<ConnectionInfo>
{
    if (_listener.joinable())
        return makeError(ErrorCode::TransportError, "Transport already started");

    {
        auto lock = std::lock_guard { _mutex };
        _sessionId = uuid::generate();
        _streamUrl = std::format("{}/sse/{}", _baseUrl, _sessionId);
        _postUrl = std::format("{}/messages/{}", _baseUrl, _sessionId);
        _connected = false;
        _connectFailure.reset();
    }

    _stopping = false;
    _listenerAlive = true;
    _listener = std::thread([this] { listen(); });

    if (!waitForConnection(std::chrono::duration_cast<std::chrono::milliseconds>(_options.requestTimeout)))
    {
        auto reason = std::string { "no response" };
        {
            auto lock = std::lock_guard { _mutex };
            if (_connectFailure)
                reason = _connectFailure->message;
        }
        stop();
        return makeError(ErrorCode::TransportError,
                         std::format("SSE stream {} did not connect: {}", streamUrl(), reason));
    }

    auto handshake = performHandshake(*this, _options.clientName, _options.clientVersion);
    if (!handshake)
    {
        stop();
        return std::unexpected(handshake.error());
    }

    _initialized = true;
    log::info("[{}] MCP SSE session {} initialized", _descriptor.name, sessionId());
    return ConnectionInfo { .pid = std::nullopt, .port = _port, .proxyUrl = {} };
}

void SseTransport::listen()
{
    while (!_stopping)
    {
        auto parser = SseParser {};
        auto request = HttpRequest {
            .method = "GET",
            .url = streamUrl(),
            .headers = _descriptor.headers,
            .body = {},
            .timeout = std::chrono::milliseconds::zero(),
        };
        request.headers["Accept"] = "text/event-stream";
        request.headers["Cache-Control"] = "no-cache";

        auto onChunk = [&](std::string_view chunk) {
            {
                auto lock = std::lock_guard { _mutex };
                if (!_connected)
                {
                    _connected = true;
                    _cv.notify_all();
                }
            }
            for (const auto& event: parser.feed(chunk))
                handleEvent(event);
            return !_stopping.load();
        };

        auto result = _client->stream(request, onChunk, [this] { return _stopping.load(); });
        if (result && (*result < 200 || *result >= 300))
            result = makeError(ErrorCode::TransportError, std::format("HTTP {} from {}", *result, request.url));

        {
            auto lock = std::lock_guard { _mutex };
            if (!result && !_connected && !_initialized)
            {
                _connectFailure = result.error();
                _cv.notify_all();
            }
            _connected = false;
        }

        if (_stopping)
            break;

        if (!result)
            log::warning("SSE stream for {} failed: {}", _descriptor.id, result.error());
        else
            log::info("SSE stream for {} closed (status {}), reconnecting", _descriptor.id, *result);

        auto lock = std::unique_lock { _mutex };
        _cv.wait_for(lock, _options.reconnectDelay, [this] { return _stopping.load(); });
    }

    _listenerAlive = false;
}

void SseTransport::handleEvent(const SseEvent& event)
{
    if (event.event == "endpoint")
    {
        auto url = resolveEndpoint(event.data);
        log::debug("SSE server {} announced message endpoint {}", _descriptor.id, url);
        auto lock = std::lock_guard { _mutex };
        _postUrl = std::move(url);
        return;
    }

    auto message = json::parse(event.data);
    if (!message)
    {
        log::warning("Skipping unparseable SSE event from {}: {}", _descriptor.id, message.error().message);
        return;
    }

    if (message->is_object() && message->contains("id") && !(*message)["id"].is_null())
    {
        _pending.resolve(*message);
        return;
    }

    if (jsonrpc::classify(*message) == jsonrpc::MessageKind::Notification)
        _hub.publish(*message);
    else
        log::debug("Ignoring SSE event without id or method from {}", _descriptor.id);
}

auto SseTransport::resolveEndpoint(std::string_view endpoint) const -> std::string
{
    while (!endpoint.empty() && (endpoint.back() == '\n' || endpoint.back() == '\r' || endpoint.back() == ' '))
        endpoint.remove_suffix(1);

    if (endpoint.starts_with("http://") || endpoint.starts_with("https://"))
        return std::string(endpoint);

    if (endpoint.starts_with('/'))
    {
        auto parsed = parseUrl(_baseUrl);
        if (parsed)
        {
            auto const port = parsed->port ? std::format(":{}", *parsed->port) : std::string {};
            return std::format("{}://{}{}{}", parsed->scheme, parsed->host, port, endpoint);
        }
    }
    return std::format("{}/{}", _baseUrl, endpoint);
}

auto SseTransport::waitForConnection(std::chrono::milliseconds timeout) -> bool
{
    auto lock = std::unique_lock { _mutex };
    auto const settled = [this] { return _connected || _connectFailure.has_value() || !_listenerAlive.load(); };
    return _cv.wait_for(lock, timeout, settled) && _connected;
}

auto SseTransport::postMessage(const nlohmann::json& message) -> VoidResult
{
    auto request = HttpRequest {
        .method = "POST",
        .url = postUrl(),
        .headers = _descriptor.headers,
        .body = message.dump(),
        .timeout = std::chrono::duration_cast<std::chrono::milliseconds>(_options.requestTimeout),
    };
    request.headers["Content-Type"] = "application/json";

    auto response = _client->perform(request);
    if (!response)
        return std::unexpected(response.error());

    if (!response->isSuccess())
        return makeError(ErrorCode::TransportError,
                         std::format("HTTP error {} posting to {}", response->status, request.url));
    return {};
}

auto SseTransport::send(const nlohmann::json& request) -> Result<jsonrpc::Response>
{
    if (!request.is_object() || !request.contains("id"))
        return makeError(ErrorCode::InvalidArgument, "Request has no id");

    if (!_listenerAlive)
        return makeError(ErrorCode::TransportError, "SSE listener is not running");

    // The response arrives on the event stream, so register before posting.
    auto ticket = _pending.add(request["id"]);
    if (!ticket)
        return std::unexpected(ticket.error());

    if (auto posted = postMessage(request); !posted)
        return std::unexpected(posted.error());

    return ticket->wait(std::chrono::duration_cast<std::chrono::milliseconds>(_options.requestTimeout));
}

auto SseTransport::notify(const nlohmann::json& notification) -> VoidResult
{
    return postMessage(notification);
}

void SseTransport::stop()
{
    _initialized = false;
    {
        auto lock = std::lock_guard { _mutex };
        _stopping = true;
    }
    _cv.notify_all();

    if (_listener.joinable())
    {
        _listener.join();
        log::info("[{}] MCP SSE session stopped", _descriptor.name);
    }

    _pending.failAll(Error { ErrorCode::TransportError, "SSE transport stopped" });
}

auto SseTransport::isHealthy() -> bool
{
    auto probe = _client->perform(HttpRequest {
        .method = "GET",
        .url = _baseUrl,
        .headers = _descriptor.headers,
        .body = {},
        .timeout = std::chrono::duration_cast<std::chrono::milliseconds>(_options.healthProbeTimeout),
    });
    if (!probe)
    {
        log::debug("SSE server {} unreachable: {}", _descriptor.id, probe.error());
        return false;
    }

    if (!_initialized)
        return true;

    return _listenerAlive.load();
}

auto SseTransport::sessionId() const -> std::string
{
    auto lock = std::lock_guard { _mutex };
    return _sessionId;
}

auto SseTransport::streamUrl() const -> std::string
{
    auto lock = std::lock_guard { _mutex };
    return _streamUrl;
}

auto SseTransport::postUrl() const -> std::string
{
    auto lock = std::lock_guard { _mutex };
    return _postUrl;
}

} // namespace mcphub
