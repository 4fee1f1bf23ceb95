// SPDX-License-Identifier: Apache-2.0
#include <core/Uuid.hpp>
#include <mcp/HttpTransport.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/ProxyManager.hpp>
#include <mcp/SseTransport.hpp>
#include <mcp/TransportFactory.hpp>

#include "FakeHttpClient.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <thread>

using namespace mcphub;
using namespace std::chrono_literals;
using mcphub::test::FakeHttpClient;

namespace
{

auto remoteServer(std::string url, TransportKind kind) -> ServerDescriptor
{
    return ServerDescriptor {
        .id = "remote",
        .name = "remote",
        .transport = kind,
        .url = std::move(url),
        .headers = { { "Authorization", "Bearer token" } },
    };
}

auto fastOptions() -> TransportOptions
{
    return TransportOptions { .requestTimeout = 2s, .reconnectDelay = 1s, .healthProbeTimeout = 1s };
}

auto makeHttp(const std::shared_ptr<FakeHttpClient>& client, std::string url = "http://127.0.0.1:8931")
    -> std::unique_ptr<HttpTransport>
{
    auto transport = HttpTransport::create(remoteServer(std::move(url), TransportKind::Http), client, fastOptions());
    REQUIRE(transport.has_value());
    return std::move(*transport);
}

auto makeSse(const std::shared_ptr<FakeHttpClient>& client) -> std::unique_ptr<SseTransport>
{
    client->streamMode = true;
    auto descriptor = remoteServer("http://127.0.0.1:8932/", TransportKind::Sse);
    auto transport = SseTransport::create(std::move(descriptor), client, fastOptions());
    REQUIRE(transport.has_value());
    return std::move(*transport);
}

} // namespace

TEST_CASE("parseUrl accepts http and https only", "[http]")
{
    auto parsed = parseUrl("https://example.com:8443/api");
    REQUIRE(parsed.has_value());
    CHECK(parsed->scheme == "https");
    CHECK(parsed->host == "example.com");
    CHECK(parsed->port == 8443);
    CHECK(parsed->path == "/api");

    CHECK(!parseUrl("http://example.com")->port.has_value());
    CHECK(parseUrl("ftp://example.com").error().code == ErrorCode::ConfigError);
    CHECK(parseUrl("not a url").error().code == ErrorCode::ConfigError);
}

TEST_CASE("HttpTransport requires a valid URL", "[http]")
{
    auto client = std::make_shared<FakeHttpClient>();
    CHECK(HttpTransport::create(remoteServer("", TransportKind::Http), client).error().code == ErrorCode::ConfigError);
    CHECK(HttpTransport::create(remoteServer("ftp://x", TransportKind::Http), client).error().code
          == ErrorCode::ConfigError);
}

TEST_CASE("HttpTransport appends the /mcp endpoint once", "[http]")
{
    CHECK(HttpTransport::normalizeEndpoint("http://h:1") == "http://h:1/mcp");
    CHECK(HttpTransport::normalizeEndpoint("http://h:1//") == "http://h:1/mcp");
    CHECK(HttpTransport::normalizeEndpoint("http://h:1/mcp") == "http://h:1/mcp");
}

TEST_CASE("HttpTransport start performs the handshake", "[http]")
{
    auto client = std::make_shared<FakeHttpClient>();
    auto transport = makeHttp(client);

    auto info = transport->start();
    REQUIRE(info.has_value());
    CHECK(!info->pid.has_value());
    CHECK(info->port == 8931);
    CHECK(client->methodsPosted() == std::vector<std::string> { "initialize", "notifications/initialized" });

    auto const& first = client->requests.front();
    CHECK(first.url == "http://127.0.0.1:8931/mcp");
    CHECK(first.headers.at("Authorization") == "Bearer token");
    CHECK(first.headers.at("Content-Type") == "application/json");
}

TEST_CASE("HttpTransport send returns the decoded response", "[http]")
{
    auto client = std::make_shared<FakeHttpClient>();
    auto transport = makeHttp(client);

    SECTION("plain JSON body")
    {
        auto response = transport->send(jsonrpc::makeRequest(1, "tools/list", { { "cursor", "x" } }));
        REQUIRE(response.has_value());
        REQUIRE(response->result.has_value());
        CHECK((*response->result)["echo"]["cursor"] == "x");
    }

    SECTION("event-stream framed body")
    {
        client->sseFramedReplies = true;
        auto response = transport->send(jsonrpc::makeRequest(2, "ping", nullptr));
        REQUIRE(response.has_value());
        CHECK(response->result.has_value());
    }

    SECTION("HTTP error status")
    {
        client->postStatus = 500;
        auto response = transport->send(jsonrpc::makeRequest(3, "ping", nullptr));
        REQUIRE(!response.has_value());
        CHECK(response.error().code == ErrorCode::TransportError);
    }

    SECTION("unreachable server")
    {
        client->reachable = false;
        auto response = transport->send(jsonrpc::makeRequest(4, "ping", nullptr));
        REQUIRE(!response.has_value());
        CHECK(response.error().code == ErrorCode::TransportError);
    }
}

TEST_CASE("HttpTransport health follows reachability", "[http]")
{
    auto client = std::make_shared<FakeHttpClient>();
    auto transport = makeHttp(client);
    REQUIRE(transport->start().has_value());

    CHECK(transport->isHealthy());
    client->reachable = false;
    CHECK(!transport->isHealthy());
    client->reachable = true;
    CHECK(transport->isHealthy());

    transport->stop();
    transport->stop();
}

TEST_CASE("SseTransport requires a valid URL", "[sse-transport]")
{
    auto client = std::make_shared<FakeHttpClient>();
    CHECK(SseTransport::create(remoteServer("", TransportKind::Sse), client).error().code == ErrorCode::ConfigError);
}

TEST_CASE("SseTransport resolves announced endpoints against its base URL", "[sse-transport]")
{
    auto client = std::make_shared<FakeHttpClient>();
    auto transport = makeSse(client);

    transport->handleEvent(SseEvent { .event = "endpoint", .data = "/messages/abc\n" });
    CHECK(transport->postUrl() == "http://127.0.0.1:8932/messages/abc");

    transport->handleEvent(SseEvent { .event = "endpoint", .data = "https://other.example/post" });
    CHECK(transport->postUrl() == "https://other.example/post");

    transport->handleEvent(SseEvent { .event = "endpoint", .data = "relative" });
    CHECK(transport->postUrl() == "http://127.0.0.1:8932/relative");
}

TEST_CASE("SseTransport publishes notifications from the stream", "[sse-transport]")
{
    auto client = std::make_shared<FakeHttpClient>();
    auto transport = makeSse(client);

    auto received = std::vector<std::string> {};
    auto subscription = transport->notifications().subscribe(
        [&](const nlohmann::json& n) { received.push_back(n["method"].get<std::string>()); });

    transport->handleEvent(SseEvent { .data = R"({"jsonrpc":"2.0","method":"notifications/tools/list_changed"})" });
    transport->handleEvent(SseEvent { .data = "not json" });

    CHECK(received == std::vector<std::string> { "notifications/tools/list_changed" });
}

TEST_CASE("SseTransport refuses to send before start", "[sse-transport]")
{
    auto client = std::make_shared<FakeHttpClient>();
    auto transport = makeSse(client);

    auto response = transport->send(jsonrpc::makeRequest(1, "ping", nullptr));
    REQUIRE(!response.has_value());
    CHECK(response.error().code == ErrorCode::TransportError);
    CHECK(transport->send(nlohmann::json::object()).error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("SseTransport correlates responses arriving on the stream", "[sse-transport]")
{
    auto client = std::make_shared<FakeHttpClient>();
    auto transport = makeSse(client);

    auto info = transport->start();
    REQUIRE(info.has_value());
    CHECK(info->port == 8932);
    CHECK(uuid::isValid(transport->sessionId()));
    CHECK(transport->streamUrl() == "http://127.0.0.1:8932/sse/" + transport->sessionId());
    CHECK(transport->postUrl() == "http://127.0.0.1:8932/messages/" + transport->sessionId());

    auto response = transport->send(jsonrpc::makeRequest("call-1", "tools/call", { { "name", "echo" } }));
    REQUIRE(response.has_value());
    CHECK((*response->result)["echo"]["name"] == "echo");

    CHECK(transport->isHealthy());
    transport->stop();
    CHECK(!transport->send(jsonrpc::makeRequest(2, "ping", nullptr)).has_value());
}

TEST_CASE("SseTransport turns unhealthy as soon as the server is unreachable", "[sse-transport]")
{
    auto client = std::make_shared<FakeHttpClient>();
    auto transport = makeSse(client);
    REQUIRE(transport->start().has_value());
    REQUIRE(transport->isHealthy());

    client->reachable = false;
    CHECK(!transport->isHealthy());
}

TEST_CASE("SseTransport start fails when the stream never connects", "[sse-transport]")
{
    auto client = std::make_shared<FakeHttpClient>();
    auto transport = makeSse(client);
    client->reachable = false;

    auto info = transport->start();
    REQUIRE(!info.has_value());
    CHECK(info.error().code == ErrorCode::TransportError);
}

TEST_CASE("SseTransport start fails when the stream is rejected", "[sse-transport]")
{
    auto client = std::make_shared<FakeHttpClient>();
    auto transport = makeSse(client);
    client->streamStatus = 404;

    auto const started = std::chrono::steady_clock::now();
    auto info = transport->start();
    REQUIRE(!info.has_value());
    CHECK(info.error().code == ErrorCode::TransportError);
    CHECK(info.error().message.find("404") != std::string::npos);
    CHECK(std::chrono::steady_clock::now() - started < fastOptions().requestTimeout);
    CHECK(client->streamsOpened == 0);
    CHECK(client->methodsPosted().empty());
}

TEST_CASE("SseTransport reopens a dropped stream and keeps correlating", "[sse-transport]")
{
    auto client = std::make_shared<FakeHttpClient>();
    auto transport = makeSse(client);
    REQUIRE(transport->start().has_value());
    REQUIRE(client->streamsOpened == 1);

    client->reachable = false;
    std::this_thread::sleep_for(200ms);
    CHECK(client->streamsOpened == 1);

    client->reachable = true;
    std::this_thread::sleep_for(fastOptions().reconnectDelay + 500ms);
    CHECK(client->streamsOpened == 2);

    auto response = transport->send(jsonrpc::makeRequest("after-reconnect", "tools/call", { { "name", "echo" } }));
    REQUIRE(response.has_value());
    CHECK(response->id == "after-reconnect");
    CHECK((*response->result)["echo"]["name"] == "echo");
    CHECK(transport->isHealthy());
}

TEST_CASE("DefaultTransportFactory builds the transport of each kind", "[factory]")
{
    auto const dataDir = std::filesystem::temp_directory_path() / "mcphub-factory-tests";
    auto factory = DefaultTransportFactory(std::make_shared<ProxyManager>(dataDir),
                                           std::make_shared<FakeHttpClient>(),
                                           fastOptions());

    auto stdio = ServerDescriptor { .id = "local", .name = "local", .command = "cat" };
    auto http = remoteServer("http://127.0.0.1:8931", TransportKind::Http);
    auto sse = remoteServer("http://127.0.0.1:8932", TransportKind::Sse);

    CHECK(factory.create(stdio).value()->kind() == TransportKind::Stdio);
    CHECK(factory.create(http).value()->kind() == TransportKind::Http);
    CHECK(factory.create(sse).value()->kind() == TransportKind::Sse);

    stdio.command.clear();
    http.url = "gopher://old";
    CHECK(factory.create(stdio).error().code == ErrorCode::ConfigError);
    CHECK(factory.create(http).error().code == ErrorCode::ConfigError);
}
