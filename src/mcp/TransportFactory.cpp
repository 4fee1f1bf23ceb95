// SPDX-License-Identifier: Apache-2.0
#include "TransportFactory.hpp"

#include <mcp/HttpClient.hpp>
#include <mcp/HttpTransport.hpp>
#include <mcp/ProxyManager.hpp>
#include <mcp/SseTransport.hpp>
#include <mcp/StdioTransport.hpp>

#include <format>

namespace mcphub
{

DefaultTransportFactory::DefaultTransportFactory(std::shared_ptr<ProxyManager> proxies,
                                                 std::shared_ptr<HttpClient> httpClient,
                                                 TransportOptions options):
    _proxies(std::move(proxies)), _httpClient(std::move(httpClient)), _options(std::move(options))
{
}

auto DefaultTransportFactory::create(const ServerDescriptor& descriptor) -> Result<std::shared_ptr<Transport>>
{
    auto options = _options;
    if (descriptor.timeoutSeconds > 0)
        options.requestTimeout = std::chrono::seconds(descriptor.timeoutSeconds);

    switch (descriptor.transport)
    {
        case TransportKind::Stdio:
            if (descriptor.command.empty())
                return makeError(ErrorCode::ConfigError,
                                 std::format("Command is required for stdio server {}", descriptor.id));
            return std::make_shared<StdioTransport>(descriptor, _proxies, std::move(options));

        case TransportKind::Http: {
            auto transport = HttpTransport::create(descriptor, _httpClient, std::move(options));
            if (!transport)
                return std::unexpected(transport.error());
            return std::shared_ptr<Transport>(std::move(*transport));
        }

        case TransportKind::Sse: {
            auto transport = SseTransport::create(descriptor, _httpClient, std::move(options));
            if (!transport)
                return std::unexpected(transport.error());
            return std::shared_ptr<Transport>(std::move(*transport));
        }
    }

    return makeError(ErrorCode::ConfigError, std::format("Unknown transport for server {}", descriptor.id));
}

} // namespace mcphub
