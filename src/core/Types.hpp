// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief The channel kind used to reach a tool server.
enum class TransportKind
{
    Stdio,
    Http,
    Sse,
};

[[nodiscard]] constexpr auto transportKindToString(TransportKind kind) -> std::string_view
{
    switch (kind)
    {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Http: return "http";
        case TransportKind::Sse: return "sse";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto transportKindFromString(std::string_view str) -> std::optional<TransportKind>
{
    if (str == "stdio")
        return TransportKind::Stdio;
    if (str == "http")
        return TransportKind::Http;
    if (str == "sse")
        return TransportKind::Sse;
    return std::nullopt;
}

/// @brief Persisted lifecycle status of a tool server.
enum class ServerStatus
{
    Stopped,
    Starting,
    Running,
    Failed,
};

[[nodiscard]] constexpr auto serverStatusToString(ServerStatus status) -> std::string_view
{
    switch (status)
    {
        case ServerStatus::Stopped: return "stopped";
        case ServerStatus::Starting: return "starting";
        case ServerStatus::Running: return "running";
        case ServerStatus::Failed: return "failed";
    }
    return "unknown";
}

/// @brief Identity and configuration of a tool server. Never mutated by the runtime.
struct ServerDescriptor
{
    std::string id;
    std::optional<std::string> ownerId; // empty for system servers
    std::string name;
    std::string displayName;
    std::string description;
    bool isSystem = false;
    bool enabled = true;
    TransportKind transport = TransportKind::Stdio;

    // Stdio
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    // Http / Sse
    std::string url;
    std::map<std::string, std::string> headers;

    int timeoutSeconds = 30;
    int maxRestartAttempts = 3;
};

/// @brief Mutable runtime facts about a server, as persisted.
struct ServerRuntimeState
{
    ServerStatus status = ServerStatus::Stopped;
    bool isActive = false;
    std::optional<int> processId;
    std::optional<uint16_t> port;
    std::string proxyUrl;
    std::optional<clock::TimePoint> lastHealthCheck;
    int restartCount = 0;
    std::optional<clock::TimePoint> lastRestartAt;
    int toolCount = 0;
    std::optional<clock::TimePoint> toolsDiscoveredAt;
};

/// @brief A persisted server row: descriptor plus runtime columns.
struct ServerRecord
{
    ServerDescriptor descriptor;
    ServerRuntimeState runtime;
};

/// @brief A tool as reported by a server's tools/list response.
struct ToolDefinition
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema;
};

/// @brief A cached tool row, unique per (serverId, name).
struct ToolDescriptor
{
    std::string serverId;
    std::string name;
    std::string description;
    nlohmann::json inputSchema;
    clock::TimePoint discoveredAt;
    int usageCount = 0;
    std::optional<clock::TimePoint> lastUsedAt;
};

/// @brief A global or conversation-scoped trust decision for one tool.
///
/// Global records have no conversationId and keep approved == autoApprove.
struct ApprovalRecord
{
    std::string id;
    std::string userId;
    std::optional<std::string> conversationId;
    std::string serverId;
    std::string toolName;
    bool approved = false;
    bool autoApprove = false;
    bool isGlobal = false;
    std::optional<clock::TimePoint> approvedAt;
    std::optional<clock::TimePoint> expiresAt;
    std::string notes;
    clock::TimePoint createdAt;
    clock::TimePoint updatedAt;

    /// @brief Returns true if the record has an expiry that is not in the future.
    [[nodiscard]] auto isExpired(clock::TimePoint now) const -> bool
    {
        return expiresAt.has_value() && *expiresAt <= now;
    }
};

/// @brief The role of a message participant in a chat conversation.
enum class Role
{
    System,
    User,
    Assistant,
    Tool,
};

/// @brief Kind of a message content row.
enum class ContentKind
{
    Text,
    ToolCallPendingApproval,
    ToolCall,
    ToolResult,
};

[[nodiscard]] constexpr auto contentKindToString(ContentKind kind) -> std::string_view
{
    switch (kind)
    {
        case ContentKind::Text: return "text";
        case ContentKind::ToolCallPendingApproval: return "tool_call_pending_approval";
        case ContentKind::ToolCall: return "tool_call";
        case ContentKind::ToolResult: return "tool_result";
    }
    return "unknown";
}

/// @brief One ordered content item of a message.
struct MessageContent
{
    std::string id;
    std::string messageId;
    int sequenceOrder = 0;
    ContentKind kind = ContentKind::Text;
    nlohmann::json payload;
};

/// @brief A chat message with its content items.
struct Message
{
    std::string id;
    std::string conversationId;
    Role role = Role::User;
    std::vector<MessageContent> contents;
};

/// @brief A tool invocation proposed by the model.
struct ToolCallRequest
{
    std::string toolName;
    std::string serverId;
    nlohmann::json arguments;
};

/// @brief Outcome of one attempted tool execution.
struct ExecutionRecord
{
    std::string callId;
    std::string messageId;
    std::string toolName;
    std::string serverId;
    nlohmann::json arguments;
    nlohmann::json result;
    bool success = false;
    std::optional<std::string> errorMessage;
    int64_t durationMs = 0;
};

enum class ExecutionStatus
{
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled,
    Timeout,
};

[[nodiscard]] constexpr auto executionStatusToString(ExecutionStatus status) -> std::string_view
{
    switch (status)
    {
        case ExecutionStatus::Pending: return "pending";
        case ExecutionStatus::Running: return "running";
        case ExecutionStatus::Completed: return "completed";
        case ExecutionStatus::Failed: return "failed";
        case ExecutionStatus::Cancelled: return "cancelled";
        case ExecutionStatus::Timeout: return "timeout";
    }
    return "unknown";
}

/// @brief A row of the tool execution log.
struct ExecutionLogEntry
{
    std::string id;
    std::string userId;
    std::string serverId;
    std::optional<std::string> conversationId;
    std::string toolName;
    nlohmann::json parameters;
    nlohmann::json result;
    ExecutionStatus status = ExecutionStatus::Pending;
    clock::TimePoint startedAt;
    std::optional<clock::TimePoint> completedAt;
    std::optional<int64_t> durationMs;
    std::optional<std::string> errorMessage;
    std::optional<std::string> errorCode;
    std::string callId;
};

} // namespace mcphub
