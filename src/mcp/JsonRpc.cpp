// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace mcphub::jsonrpc
{

auto makeRequest(nlohmann::json id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", std::move(id) },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeResponse(nlohmann::json id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", std::move(id) },
        { "result", std::move(result) },
    };
}

auto makeErrorResponse(nlohmann::json id, const RpcError& error) -> nlohmann::json
{
    auto err = nlohmann::json {
        { "code", error.code },
        { "message", error.message },
    };
    if (!error.data.is_null())
        err["data"] = error.data;

    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", std::move(id) },
        { "error", std::move(err) },
    };
}

auto classify(const nlohmann::json& message) -> MessageKind
{
    if (!message.is_object())
        return MessageKind::Invalid;

    auto const hasId = message.contains("id") && !message["id"].is_null();
    auto const hasMethod = message.contains("method") && message["method"].is_string();

    if (hasId && hasMethod)
        return MessageKind::Request;
    if (hasId)
        return MessageKind::Response;
    if (hasMethod)
        return MessageKind::Notification;
    return MessageKind::Invalid;
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    if (!message.contains("id") || message["id"].is_null())
        return makeError(ErrorCode::ProtocolError, "JSON-RPC response has no id");

    auto response = Response { .id = message["id"] };

    if (message.contains("error") && message["error"].is_object())
    {
        auto const& err = message["error"];
        response.error = RpcError {
            .code = json::getIntOr(err, "code", 0),
            .message = json::getStringOr(err, "message", "Unknown error"),
            .data = err.contains("data") ? err["data"] : nlohmann::json {},
        };
    }
    else if (message.contains("result"))
    {
        response.result = message["result"];
    }

    return response;
}

auto makeInitializeParams(std::string_view clientName, std::string_view clientVersion) -> nlohmann::json
{
    return nlohmann::json {
        { "protocolVersion", ProtocolVersion },
        { "capabilities",
          {
              { "roots", { { "listChanged", true } } },
              { "sampling", nlohmann::json::object() },
          } },
        { "clientInfo",
          {
              { "name", clientName },
              { "version", clientVersion },
          } },
    };
}

} // namespace mcphub::jsonrpc
