// SPDX-License-Identifier: Apache-2.0
#include "StreamEvent.hpp"

namespace mcphub
{

namespace
{

    template <class... Ts>
    struct overloaded: Ts...
    {
        using Ts::operator()...;
    };

} // namespace

auto eventName(const StreamEvent& event) -> std::string_view
{
    return std::visit(overloaded {
                          [](const NewMessageContent&) { return std::string_view { "newMessageContent" }; },
                          [](const ToolCallPendingApproval&) { return std::string_view { "toolCallPendingApproval" }; },
                          [](const ToolCall&) { return std::string_view { "toolCall" }; },
                          [](const ToolResult&) { return std::string_view { "toolResult" }; },
                          [](const StreamError&) { return std::string_view { "error" }; },
                      },
                      event);
}

auto toJson(const StreamEvent& event) -> nlohmann::json
{
    auto data = std::visit(
        overloaded {
            [](const NewMessageContent& e) {
                return nlohmann::json {
                    { "message_content_id", e.messageContentId },
                    { "message_id", e.messageId },
                };
            },
            [](const ToolCallPendingApproval& e) {
                return nlohmann::json {
                    { "message_content_id", e.messageContentId },
                    { "message_id", e.messageId },
                    { "tool_name", e.toolName },
                    { "server_id", e.serverId },
                    { "arguments", e.arguments },
                };
            },
            [](const ToolCall& e) {
                return nlohmann::json {
                    { "message_content_id", e.messageContentId },
                    { "message_id", e.messageId },
                    { "tool_name", e.toolName },
                    { "server_id", e.serverId },
                    { "arguments", e.arguments },
                    { "call_id", e.callId },
                };
            },
            [](const ToolResult& e) {
                auto payload = nlohmann::json {
                    { "message_content_id", e.messageContentId },
                    { "message_id", e.messageId },
                    { "call_id", e.callId },
                    { "result", e.result },
                    { "success", e.success },
                };
                payload["error_message"] = e.errorMessage ? nlohmann::json(*e.errorMessage) : nlohmann::json(nullptr);
                return payload;
            },
            [](const StreamError& e) {
                return nlohmann::json {
                    { "error", e.message },
                    { "code", e.code },
                };
            },
        },
        event);

    return nlohmann::json {
        { "event", std::string(eventName(event)) },
        { "data", std::move(data) },
    };
}

} // namespace mcphub
