// SPDX-License-Identifier: Apache-2.0
#include <mcp/Handshake.hpp>

#include "FakeTransport.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace mcphub;

TEST_CASE("performHandshake sends initialize then the initialized notification", "[handshake]")
{
    auto transport = test::FakeTransport {};
    transport.respondWith(nlohmann::json {
        { "protocolVersion", "2024-11-05" },
        { "serverInfo", { { "name", "weather" }, { "version", "0.3.0" } } },
    });

    auto result = performHandshake(transport, "mcphub", "0.1.0");
    REQUIRE(result.has_value());
    CHECK((*result)["serverInfo"]["name"] == "weather");

    CHECK(transport.sentMethods() == std::vector<std::string> { "initialize", "notifications/initialized" });
    auto const& initialize = transport.sent.front();
    CHECK(initialize["params"]["clientInfo"]["name"] == "mcphub");
    CHECK(initialize["params"]["protocolVersion"] == "2024-11-05");
    CHECK(!transport.sent.back().contains("id"));
}

TEST_CASE("performHandshake maps an error payload to ProtocolError", "[handshake]")
{
    auto transport = test::FakeTransport {};
    transport.failWith(-32600, "unsupported protocol version");

    auto result = performHandshake(transport, "mcphub", "0.1.0");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
    CHECK(result.error().message.find("unsupported protocol version") != std::string::npos);
    CHECK(transport.sentMethods() == std::vector<std::string> { "initialize" });
}

TEST_CASE("performHandshake passes transport failures through", "[handshake]")
{
    auto transport = test::FakeTransport {};
    transport.handler = [](const nlohmann::json&) -> Result<jsonrpc::Response> {
        return makeError(ErrorCode::TimeoutError, "Request timed out");
    };

    auto result = performHandshake(transport, "mcphub", "0.1.0");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TimeoutError);
}
