// SPDX-License-Identifier: Apache-2.0
#include "HttpTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/Handshake.hpp>
#include <mcp/SseParser.hpp>

#include <format>

namespace mcphub
{

namespace
{
    /// Streamable-HTTP servers may answer with a one-shot event stream instead of plain JSON.
    auto extractResponseBody(const std::string& body) -> std::string
    {
        auto const first = body.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return body;
        if (body.compare(first, 5, "data:") != 0 && body.compare(first, 6, "event:") != 0)
            return body;

        auto parser = SseParser {};
        auto events = parser.feed(body + "\n\n");
        for (auto& event: events)
        {
            if (event.event == "message" && !event.data.empty())
                return std::move(event.data);
        }
        return body;
    }
} // namespace

HttpTransport::HttpTransport(Passkey,
                             ServerDescriptor descriptor,
                             std::shared_ptr<HttpClient> client,
                             TransportOptions options,
                             std::string endpoint,
                             std::optional<uint16_t> port):
    _descriptor(std::move(descriptor)),
    _client(std::move(client)),
    _options(std::move(options)),
    _endpoint(std::move(endpoint)),
    _port(port)
{
}

auto HttpTransport::create(ServerDescriptor descriptor, std::shared_ptr<HttpClient> client, TransportOptions options)
    -> Result<std::unique_ptr<HttpTransport>>
{
    if (descriptor.url.empty())
        return makeError(ErrorCode::ConfigError,
                         std::format("URL is required for HTTP transport (server {})", descriptor.id));

    auto parsed = parseUrl(descriptor.url);
    if (!parsed)
        return std::unexpected(parsed.error());

    auto endpoint = normalizeEndpoint(descriptor.url);
    return std::make_unique<HttpTransport>(
        Passkey {}, std::move(descriptor), std::move(client), std::move(options), std::move(endpoint), parsed->port);
}

auto HttpTransport::normalizeEndpoint(std::string_view url) -> std::string
{
    if (url.ends_with("/mcp"))
        return std::string(url);

    while (url.ends_with('/'))
        url.remove_suffix(1);
    return std::format("{}/mcp", url);
}

auto HttpTransport::start() -> Result<ConnectionInfo>
{
    auto handshake = performHandshake(*this, _options.clientName, _options.clientVersion);
    if (!handshake)
        return std::unexpected(handshake.error());

    _initialized = true;
    log::info("[{}] MCP HTTP session initialized", _descriptor.name);
    return ConnectionInfo { .pid = std::nullopt, .port = _port, .proxyUrl = {} };
}

auto HttpTransport::post(const nlohmann::json& message) -> Result<HttpResponse>
{
    auto request = HttpRequest {
        .method = "POST",
        .url = _endpoint,
        .headers = _descriptor.headers,
        .body = message.dump(),
        .timeout = std::chrono::duration_cast<std::chrono::milliseconds>(_options.requestTimeout),
    };
    request.headers["Content-Type"] = "application/json";
    request.headers["Accept"] = "application/json, text/event-stream";

    return _client->perform(request);
}

auto HttpTransport::send(const nlohmann::json& request) -> Result<jsonrpc::Response>
{
    auto response = post(request);
    if (!response)
        return std::unexpected(response.error());

    if (!response->isSuccess())
        return makeError(ErrorCode::TransportError,
                         std::format("HTTP error {}: {}", response->status, response->body));

    auto message = json::parse(extractResponseBody(response->body));
    if (!message)
        return makeError(ErrorCode::ProtocolError,
                         std::format("Failed to parse MCP response: {}", message.error().message));

    return jsonrpc::parseResponse(*message);
}

auto HttpTransport::notify(const nlohmann::json& notification) -> VoidResult
{
    auto response = post(notification);
    if (!response)
        return std::unexpected(response.error());

    if (!response->isSuccess())
        return makeError(ErrorCode::TransportError, std::format("HTTP error {}", response->status));

    return {};
}

void HttpTransport::stop()
{
    if (_initialized.exchange(false))
        log::info("[{}] MCP HTTP session stopped", _descriptor.name);
}

auto HttpTransport::isHealthy() -> bool
{
    auto const timeout = std::chrono::duration_cast<std::chrono::milliseconds>(_options.healthProbeTimeout);

    // Any answer from the MCP endpoint means the server is reachable.
    auto probe = HttpRequest { .method = "GET", .url = _endpoint, .headers = _descriptor.headers, .timeout = timeout };
    if (_client->perform(probe))
        return true;

    auto base = std::string_view(_endpoint);
    base.remove_suffix(std::string_view("/mcp").size());
    auto health = _client->perform(
        HttpRequest { .method = "GET", .url = std::format("{}/health", base), .headers = {}, .timeout = timeout });
    return health && health->isSuccess();
}

} // namespace mcphub
