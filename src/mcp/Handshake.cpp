// SPDX-License-Identifier: Apache-2.0
#include "Handshake.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/Uuid.hpp>

#include <format>

namespace mcphub
{

auto performHandshake(Transport& transport, std::string_view clientName, std::string_view clientVersion)
    -> Result<nlohmann::json>
{
    auto request = jsonrpc::makeRequest(
        uuid::generate(), "initialize", jsonrpc::makeInitializeParams(clientName, clientVersion));

    auto response = transport.send(request);
    if (!response)
        return std::unexpected(response.error());

    if (response->error)
        return makeError(ErrorCode::ProtocolError,
                         std::format("Initialize failed: {} (code {})",
                                     response->error->message,
                                     response->error->code));

    auto const serverInfo = response->result.value_or(nlohmann::json::object());
    if (serverInfo.is_object() && serverInfo.contains("serverInfo"))
        log::debug("MCP server identified as {} {}",
                   json::getStringOr(serverInfo["serverInfo"], "name", "?"),
                   json::getStringOr(serverInfo["serverInfo"], "version", "?"));

    if (auto sent = transport.notify(jsonrpc::makeNotification("notifications/initialized")); !sent)
        log::warning("Failed to send initialized notification: {}", sent.error());

    return serverInfo;
}

} // namespace mcphub
