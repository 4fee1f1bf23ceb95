// SPDX-License-Identifier: Apache-2.0
#include <mcp/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mcphub;

TEST_CASE("makeRequest creates valid JSON-RPC 2.0 request", "[jsonrpc]")
{
    auto request = jsonrpc::makeRequest(1, "tools/list");

    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["id"] == 1);
    CHECK(request["method"] == "tools/list");
    CHECK(!request.contains("params"));
}

TEST_CASE("makeRequest keeps string ids and params", "[jsonrpc]")
{
    auto request = jsonrpc::makeRequest("tool-abc",
                                        "tools/call",
                                        nlohmann::json { { "name", "echo" }, { "arguments", { { "x", 1 } } } });

    CHECK(request["id"] == "tool-abc");
    REQUIRE(request.contains("params"));
    CHECK(request["params"]["name"] == "echo");
    CHECK(request["params"]["arguments"]["x"] == 1);
}

TEST_CASE("makeNotification creates a message without id", "[jsonrpc]")
{
    auto notif = jsonrpc::makeNotification("notifications/initialized");

    CHECK(notif["jsonrpc"] == "2.0");
    CHECK(!notif.contains("id"));
    CHECK(notif["method"] == "notifications/initialized");
}

TEST_CASE("classify distinguishes responses, requests and notifications", "[jsonrpc]")
{
    CHECK(jsonrpc::classify(jsonrpc::makeResponse(7, nlohmann::json::object())) == jsonrpc::MessageKind::Response);
    CHECK(jsonrpc::classify(jsonrpc::makeRequest(7, "roots/list")) == jsonrpc::MessageKind::Request);
    CHECK(jsonrpc::classify(jsonrpc::makeNotification("notifications/tools/list_changed"))
          == jsonrpc::MessageKind::Notification);
    CHECK(jsonrpc::classify(nlohmann::json { { "jsonrpc", "2.0" }, { "id", nullptr } })
          == jsonrpc::MessageKind::Invalid);
    CHECK(jsonrpc::classify(nlohmann::json::array()) == jsonrpc::MessageKind::Invalid);
}

TEST_CASE("parseResponse handles success response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "result", { { "status", "ok" } } },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(result->isSuccess());
    CHECK(result->result->at("status") == "ok");
    CHECK(!result->error.has_value());
}

TEST_CASE("parseResponse handles error response", "[jsonrpc]")
{
    auto msg = jsonrpc::makeErrorResponse(
        1, jsonrpc::RpcError { .code = -32601, .message = "Method not found", .data = { { "method", "x" } } });

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(!result->isSuccess());
    REQUIRE(result->error.has_value());
    CHECK(result->error->code == -32601);
    CHECK(result->error->message == "Method not found");
    CHECK(result->error->data["method"] == "x");
}

TEST_CASE("parseResponse tolerates a malformed error object", "[jsonrpc]")
{
    auto const msg = nlohmann::json::parse(
        R"({"jsonrpc":"2.0","id":1,"error":{"code":"E42","message":null,"data":[1,2]}})");

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    REQUIRE(result->error.has_value());
    CHECK(result->error->code == 0);
    CHECK(result->error->message == "Unknown error");
    CHECK(result->error->data == nlohmann::json::array({ 1, 2 }));

    auto fractional = jsonrpc::parseResponse(nlohmann::json::parse(
        R"({"jsonrpc":"2.0","id":2,"error":{"code":1.5,"message":{"text":"nested"}}})"));
    REQUIRE(fractional.has_value());
    CHECK(fractional->error->code == 0);
    CHECK(fractional->error->message == "Unknown error");
}

TEST_CASE("parseResponse rejects non-JSON-RPC messages", "[jsonrpc]")
{
    auto msg = nlohmann::json { { "version", "1.0" } };
    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("parseResponse rejects a response without id", "[jsonrpc]")
{
    auto result = jsonrpc::parseResponse(nlohmann::json { { "jsonrpc", "2.0" }, { "result", 1 } });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("parseResponse leaves result empty when the server sent neither result nor error", "[jsonrpc]")
{
    auto result = jsonrpc::parseResponse(nlohmann::json { { "jsonrpc", "2.0" }, { "id", 1 } });
    REQUIRE(result.has_value());
    CHECK(result->isSuccess());
    CHECK(!result->result.has_value());
}

TEST_CASE("makeInitializeParams announces protocol version and capabilities", "[jsonrpc]")
{
    auto params = jsonrpc::makeInitializeParams("mcphub", "1.2.3");

    CHECK(params["protocolVersion"] == "2024-11-05");
    CHECK(params["capabilities"]["roots"]["listChanged"] == true);
    CHECK(params["capabilities"]["sampling"].is_object());
    CHECK(params["clientInfo"]["name"] == "mcphub");
    CHECK(params["clientInfo"]["version"] == "1.2.3");
}
