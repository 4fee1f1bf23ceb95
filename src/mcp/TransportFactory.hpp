// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/Transport.hpp>

#include <memory>

namespace mcphub
{

class HttpClient;
class ProxyManager;

/// @brief Builds the transport matching a descriptor's transport kind.
class TransportFactory
{
  public:
    virtual ~TransportFactory() = default;

    /// @return A transport ready to start(), or ConfigError for unusable parameters.
    [[nodiscard]] virtual auto create(const ServerDescriptor& descriptor) -> Result<std::shared_ptr<Transport>> = 0;
};

/// @brief Production factory: Stdio via the proxy manager, Http/Sse via libcurl.
class DefaultTransportFactory final: public TransportFactory
{
  public:
    DefaultTransportFactory(std::shared_ptr<ProxyManager> proxies,
                            std::shared_ptr<HttpClient> httpClient,
                            TransportOptions options = {});

    [[nodiscard]] auto create(const ServerDescriptor& descriptor) -> Result<std::shared_ptr<Transport>> override;

  private:
    std::shared_ptr<ProxyManager> _proxies;
    std::shared_ptr<HttpClient> _httpClient;
    TransportOptions _options;
};

} // namespace mcphub
