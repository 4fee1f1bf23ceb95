// SPDX-License-Identifier: Apache-2.0
#include "MessageContent.hpp"

#include <core/JsonUtils.hpp>

#include <algorithm>
#include <format>

namespace mcphub
{

auto toPayload(const PendingToolCall& pending) -> nlohmann::json
{
    return nlohmann::json {
        { "tool_name", pending.toolName },
        { "server_id", pending.serverId },
        { "arguments", pending.arguments },
        { "is_approved", pending.isApproved ? nlohmann::json(*pending.isApproved) : nlohmann::json(nullptr) },
    };
}

auto parsePendingToolCall(const nlohmann::json& payload) -> Result<PendingToolCall>
{
    auto invalid = [](std::string_view reason) {
        return makeError(ErrorCode::InvalidPendingApprovalData,
                         std::format("Invalid pending approval data: {}", reason));
    };

    if (!payload.is_object())
        return invalid("payload is not an object");

    auto toolName = json::getString(payload, "tool_name");
    if (!toolName || toolName->empty())
        return invalid("missing tool_name");

    auto serverId = json::getString(payload, "server_id");
    if (!serverId || serverId->empty())
        return invalid("missing server_id");

    if (!payload.contains("arguments"))
        return invalid("missing arguments");

    auto isApproved = std::optional<bool> {};
    if (payload.contains("is_approved") && !payload["is_approved"].is_null())
    {
        if (!payload["is_approved"].is_boolean())
            return invalid("is_approved is not a boolean");
        isApproved = payload["is_approved"].get<bool>();
    }

    return PendingToolCall {
        .toolName = std::move(*toolName),
        .serverId = std::move(*serverId),
        .arguments = payload["arguments"],
        .isApproved = isApproved,
    };
}

auto makeToolCallPayload(const PendingToolCall& call, const std::string& callId) -> nlohmann::json
{
    return nlohmann::json {
        { "tool_name", call.toolName },
        { "server_id", call.serverId },
        { "arguments", call.arguments },
        { "call_id", callId },
    };
}

auto makeToolResultPayload(const std::string& callId,
                           const nlohmann::json& result,
                           bool success,
                           const std::optional<std::string>& errorMessage) -> nlohmann::json
{
    return nlohmann::json {
        { "call_id", callId },
        { "result", result },
        { "success", success },
        { "error_message", errorMessage ? nlohmann::json(*errorMessage) : nlohmann::json(nullptr) },
    };
}

auto lastContent(const Message& message) -> const MessageContent*
{
    auto it = std::ranges::max_element(message.contents, {}, &MessageContent::sequenceOrder);
    if (it == message.contents.end())
        return nullptr;
    return &*it;
}

} // namespace mcphub
