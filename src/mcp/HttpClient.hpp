// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcphub
{

struct HttpRequest
{
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    std::chrono::milliseconds timeout { 30'000 }; ///< Zero means no overall limit (streams).
};

struct HttpResponse
{
    long status = 0;
    std::string body;

    [[nodiscard]] auto isSuccess() const -> bool { return status >= 200 && status < 300; }
};

/// @brief Components of an absolute http(s) URL.
struct ParsedUrl
{
    std::string scheme;
    std::string host;
    std::optional<uint16_t> port; ///< Only set when the URL names one explicitly.
    std::string path;
};

/// @brief Parses and validates an absolute http or https URL.
/// @return The URL components, or ConfigError for anything else.
[[nodiscard]] auto parseUrl(std::string_view url) -> Result<ParsedUrl>;

/// @brief Receives a chunk of a streamed body. Return false to abort the stream.
using ChunkHandler = std::function<bool(std::string_view chunk)>;

/// @brief Polled while a stream is open. Return true to abort it.
using StopPredicate = std::function<bool()>;

/// @brief Minimal blocking HTTP client used by the Http and Sse transports.
class HttpClient
{
  public:
    virtual ~HttpClient() = default;

    /// @brief Performs a request and buffers the whole response body.
    /// @return The response (any status) or a TransportError / TimeoutError.
    [[nodiscard]] virtual auto perform(const HttpRequest& request) -> Result<HttpResponse> = 0;

    /// @brief Performs a request and delivers the body incrementally.
    ///
    /// Returns when the server closes the stream, a handler aborts, or
    /// shouldStop() becomes true. Aborting is not an error.
    ///
    /// @return The 2xx status of the stream, or a TransportError. A non-2xx
    ///         reply is an error and its body never reaches onChunk.
    [[nodiscard]] virtual auto stream(const HttpRequest& request,
                                      const ChunkHandler& onChunk,
                                      const StopPredicate& shouldStop) -> Result<long> = 0;
};

/// @brief HttpClient backed by the libcurl easy interface.
class CurlHttpClient final: public HttpClient
{
  public:
    CurlHttpClient();

    [[nodiscard]] auto perform(const HttpRequest& request) -> Result<HttpResponse> override;
    [[nodiscard]] auto stream(const HttpRequest& request,
                              const ChunkHandler& onChunk,
                              const StopPredicate& shouldStop) -> Result<long> override;
};

/// @brief Creates the default libcurl-backed client.
[[nodiscard]] auto makeHttpClient() -> std::shared_ptr<HttpClient>;

} // namespace mcphub
