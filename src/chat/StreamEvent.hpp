// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace mcphub
{

/// @brief Error codes carried by StreamError events.
namespace streamcode
{
    inline constexpr auto SystemInternalError = std::string_view { "SYSTEM_INTERNAL_ERROR" };
    inline constexpr auto SystemDatabaseError = std::string_view { "SYSTEM_DATABASE_ERROR" };
} // namespace streamcode

/// @brief Announces a persisted content item. Always precedes the event describing it.
struct NewMessageContent
{
    std::string messageContentId;
    std::string messageId;
};

/// @brief A tool call is waiting for the user's approval.
struct ToolCallPendingApproval
{
    std::string messageContentId;
    std::string messageId;
    std::string toolName;
    std::string serverId;
    nlohmann::json arguments;
};

/// @brief An approved tool call is being executed.
struct ToolCall
{
    std::string messageContentId;
    std::string messageId;
    std::string toolName;
    std::string serverId;
    nlohmann::json arguments;
    std::string callId;
};

/// @brief The outcome of a tool call.
struct ToolResult
{
    std::string messageContentId;
    std::string messageId;
    std::string callId;
    nlohmann::json result;
    bool success = false;
    std::optional<std::string> errorMessage;
};

/// @brief A user-visible failure; the turn ends after it.
struct StreamError
{
    std::string code;
    std::string message;
};

using StreamEvent = std::variant<NewMessageContent, ToolCallPendingApproval, ToolCall, ToolResult, StreamError>;

/// @brief Receives the events of a chat turn in order.
using EventSink = std::function<void(const StreamEvent&)>;

/// @brief Wire name of the event ("newMessageContent", "toolCall", ...).
[[nodiscard]] auto eventName(const StreamEvent& event) -> std::string_view;

/// @brief Wire form: {"event": name, "data": {...}} with snake_case data fields.
[[nodiscard]] auto toJson(const StreamEvent& event) -> nlohmann::json;

} // namespace mcphub
