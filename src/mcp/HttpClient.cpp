// SPDX-License-Identifier: Apache-2.0
#include "HttpClient.hpp"

#include <core/Log.hpp>

#include <curl/curl.h>

#include <algorithm>
#include <format>
#include <memory>
#include <mutex>

namespace mcphub
{

namespace
{
    struct CurlDeleter
    {
        void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
    };

    struct SlistDeleter
    {
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
    };

    using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
    using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

    auto curlError(CURLcode code, std::string_view url) -> Error
    {
        auto const kind = code == CURLE_OPERATION_TIMEDOUT ? ErrorCode::TimeoutError : ErrorCode::TransportError;
        return Error { kind, std::format("HTTP request to {} failed: {}", url, curl_easy_strerror(code)) };
    }

    auto buildHeaderList(const std::map<std::string, std::string>& headers) -> HeaderList
    {
        curl_slist* list = nullptr;
        for (const auto& [name, value]: headers)
            list = curl_slist_append(list, std::format("{}: {}", name, value).c_str());
        return HeaderList { list };
    }

    /// Applies method, url, body and timeouts common to both request styles.
    void configure(CURL* curl, const HttpRequest& request, curl_slist* headers)
    {
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 10'000L);
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);

        if (headers)
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

        if (request.method == "GET")
        {
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        }
        else
        {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        }
    }

    auto bufferCallback(char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t
    {
        auto const total = size * nmemb;
        static_cast<std::string*>(userdata)->append(ptr, total);
        return total;
    }

    auto isSuccessStatus(long status) -> bool
    {
        return status >= 200 && status < 300;
    }

    struct StreamContext
    {
        CURL* curl = nullptr;
        const ChunkHandler* onChunk = nullptr;
        const StopPredicate* shouldStop = nullptr;
        bool aborted = false;
        std::string rejectedBody; ///< Start of the body of a non-2xx reply, never handed to onChunk.
    };

    auto streamCallback(char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t
    {
        constexpr auto MaxRejectedBody = size_t { 512 };

        auto const total = size * nmemb;
        auto* ctx = static_cast<StreamContext*>(userdata);

        auto status = 0L;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
        if (!isSuccessStatus(status))
        {
            ctx->rejectedBody.append(ptr, std::min(total, MaxRejectedBody - ctx->rejectedBody.size()));
            return ctx->rejectedBody.size() < MaxRejectedBody ? total : 0;
        }

        if (!(*ctx->onChunk)(std::string_view(ptr, total)))
        {
            ctx->aborted = true;
            return 0; // CURLE_WRITE_ERROR
        }
        return total;
    }

    auto progressCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int
    {
        auto* ctx = static_cast<StreamContext*>(userdata);
        if (*ctx->shouldStop && (*ctx->shouldStop)())
        {
            ctx->aborted = true;
            return 1; // CURLE_ABORTED_BY_CALLBACK
        }
        return 0;
    }

    std::once_flag globalInitFlag;
} // namespace

auto parseUrl(std::string_view url) -> Result<ParsedUrl>
{
    auto handle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> { curl_url(), &curl_url_cleanup };
    if (!handle)
        return makeError(ErrorCode::ConfigError, "curl_url failed");

    auto const text = std::string(url);
    if (curl_url_set(handle.get(), CURLUPART_URL, text.c_str(), 0) != CURLUE_OK)
        return makeError(ErrorCode::ConfigError, std::format("Invalid URL '{}'", url));

    auto part = [&](CURLUPart which) -> std::optional<std::string> {
        char* value = nullptr;
        if (curl_url_get(handle.get(), which, &value, 0) != CURLUE_OK || !value)
            return std::nullopt;
        auto out = std::string(value);
        curl_free(value);
        return out;
    };

    auto parsed = ParsedUrl {
        .scheme = part(CURLUPART_SCHEME).value_or(""),
        .host = part(CURLUPART_HOST).value_or(""),
        .port = std::nullopt,
        .path = part(CURLUPART_PATH).value_or("/"),
    };

    if (parsed.scheme != "http" && parsed.scheme != "https")
        return makeError(ErrorCode::ConfigError, std::format("Unsupported URL scheme in '{}'", url));
    if (parsed.host.empty())
        return makeError(ErrorCode::ConfigError, std::format("URL '{}' has no host", url));

    if (auto port = part(CURLUPART_PORT))
        parsed.port = static_cast<uint16_t>(std::stoul(*port));

    return parsed;
}

CurlHttpClient::CurlHttpClient()
{
    std::call_once(globalInitFlag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

auto CurlHttpClient::perform(const HttpRequest& request) -> Result<HttpResponse>
{
    auto curl = CurlHandle { curl_easy_init() };
    if (!curl)
        return makeError(ErrorCode::TransportError, "curl_easy_init failed");

    auto headers = buildHeaderList(request.headers);
    configure(curl.get(), request, headers.get());

    auto response = HttpResponse {};
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, bufferCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    if (auto const rc = curl_easy_perform(curl.get()); rc != CURLE_OK)
        return std::unexpected(curlError(rc, request.url));

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    log::trace("{} {} -> {}", request.method, request.url, response.status);
    return response;
}

auto CurlHttpClient::stream(const HttpRequest& request,
                            const ChunkHandler& onChunk,
                            const StopPredicate& shouldStop) -> Result<long>
{
    auto curl = CurlHandle { curl_easy_init() };
    if (!curl)
        return makeError(ErrorCode::TransportError, "curl_easy_init failed");

    auto headers = buildHeaderList(request.headers);
    configure(curl.get(), request, headers.get());

    auto ctx = StreamContext { .curl = curl.get(), .onChunk = &onChunk, .shouldStop = &shouldStop };
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, streamCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);

    auto const rc = curl_easy_perform(curl.get());

    auto status = 0L;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);

    // Also covers a rejected body cut short by streamCallback.
    if (status != 0 && !isSuccessStatus(status))
        return makeError(ErrorCode::TransportError,
                         std::format("Stream {} {} returned HTTP {}: {}", request.method, request.url, status,
                                     ctx.rejectedBody));

    if (rc != CURLE_OK && !ctx.aborted)
        return std::unexpected(curlError(rc, request.url));

    return status;
}

auto makeHttpClient() -> std::shared_ptr<HttpClient>
{
    return std::make_shared<CurlHttpClient>();
}

} // namespace mcphub
