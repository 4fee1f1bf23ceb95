// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mcphub
{

/// @brief Runtime columns written after a start, stop or cleanup.
struct RuntimeUpdate
{
    ServerStatus status = ServerStatus::Stopped;
    bool isActive = false;
    std::optional<int> processId;
    std::optional<uint16_t> port;
    std::string proxyUrl;
};

/// @brief Persistence of server descriptors and their runtime columns.
class ServerStore
{
  public:
    virtual ~ServerStore() = default;

    [[nodiscard]] virtual auto getServer(const std::string& serverId) -> Result<std::optional<ServerRecord>> = 0;
    [[nodiscard]] virtual auto listServers() -> Result<std::vector<ServerRecord>> = 0;

    /// @brief Inserts or replaces the descriptor. Runtime columns of an existing row are kept.
    [[nodiscard]] virtual auto upsertServer(const ServerDescriptor& descriptor) -> VoidResult = 0;
    [[nodiscard]] virtual auto removeServer(const std::string& serverId) -> VoidResult = 0;

    [[nodiscard]] virtual auto updateRuntime(const std::string& serverId, const RuntimeUpdate& update)
        -> VoidResult = 0;

    /// @brief Increments restartCount and stamps lastRestartAt.
    [[nodiscard]] virtual auto recordRestart(const std::string& serverId, clock::TimePoint at) -> VoidResult = 0;
    [[nodiscard]] virtual auto recordHealthCheck(const std::string& serverId, clock::TimePoint at) -> VoidResult = 0;
    [[nodiscard]] virtual auto updateToolStats(const std::string& serverId, int toolCount, clock::TimePoint at)
        -> VoidResult = 0;
};

/// @brief Persistence of the discovered tool cache.
class ToolStore
{
  public:
    virtual ~ToolStore() = default;

    /// @brief Atomically deletes every tool of the server and inserts @p tools.
    [[nodiscard]] virtual auto replaceTools(const std::string& serverId, const std::vector<ToolDescriptor>& tools)
        -> VoidResult = 0;
    [[nodiscard]] virtual auto listTools(const std::string& serverId) -> Result<std::vector<ToolDescriptor>> = 0;

    /// @brief All cached tools with this name, across servers.
    [[nodiscard]] virtual auto findTools(const std::string& toolName) -> Result<std::vector<ToolDescriptor>> = 0;
    [[nodiscard]] virtual auto incrementUsage(const std::string& serverId,
                                              const std::string& toolName,
                                              clock::TimePoint at) -> VoidResult = 0;
};

/// @brief Persistence of approval records.
///
/// Global rows are unique per (user, server, tool), conversation rows per
/// (user, conversation, server, tool).
class ApprovalStore
{
  public:
    virtual ~ApprovalStore() = default;

    [[nodiscard]] virtual auto findGlobal(const std::string& userId,
                                          const std::string& serverId,
                                          const std::string& toolName) -> Result<std::optional<ApprovalRecord>> = 0;
    [[nodiscard]] virtual auto findConversation(const std::string& userId,
                                                const std::string& conversationId,
                                                const std::string& serverId,
                                                const std::string& toolName)
        -> Result<std::optional<ApprovalRecord>> = 0;

    /// @brief Inserts the record, or replaces the row with the same id.
    [[nodiscard]] virtual auto saveApproval(const ApprovalRecord& record) -> VoidResult = 0;

    /// @return true if a row was deleted.
    [[nodiscard]] virtual auto removeApproval(const std::string& approvalId) -> Result<bool> = 0;

    [[nodiscard]] virtual auto listConversationApprovals(const std::string& userId, const std::string& conversationId)
        -> Result<std::vector<ApprovalRecord>> = 0;

    /// @return Number of rows deleted.
    [[nodiscard]] virtual auto deleteExpiredApprovals(clock::TimePoint now) -> Result<size_t> = 0;
};

/// @brief Persistence of chat messages and their content items.
class MessageStore
{
  public:
    virtual ~MessageStore() = default;

    [[nodiscard]] virtual auto createMessage(const std::string& conversationId, Role role) -> Result<Message> = 0;
    [[nodiscard]] virtual auto latestMessage(const std::string& conversationId, Role role)
        -> Result<std::optional<Message>> = 0;

    /// @brief Appends a content item after the message's last one.
    [[nodiscard]] virtual auto appendContent(const std::string& messageId, ContentKind kind, nlohmann::json payload)
        -> Result<MessageContent> = 0;
    [[nodiscard]] virtual auto getContent(const std::string& contentId) -> Result<std::optional<MessageContent>> = 0;

    /// @brief Replaces the payload of an existing content item in place.
    [[nodiscard]] virtual auto updateContentPayload(const std::string& contentId, nlohmann::json payload)
        -> VoidResult = 0;
};

/// @brief Query for execution log listing.
struct ExecutionLogFilter
{
    std::optional<std::string> userId;
    std::optional<std::string> serverId;
    std::optional<std::string> conversationId;
    std::optional<ExecutionStatus> status;
    int page = 1;
    int perPage = 20;
};

/// @brief Persistence of the tool execution log.
class ExecutionLogStore
{
  public:
    virtual ~ExecutionLogStore() = default;

    [[nodiscard]] virtual auto insertExecutionLog(const ExecutionLogEntry& entry) -> VoidResult = 0;
    [[nodiscard]] virtual auto updateExecutionLog(const ExecutionLogEntry& entry) -> VoidResult = 0;

    /// @brief Matching entries, newest first.
    [[nodiscard]] virtual auto listExecutionLogs(const ExecutionLogFilter& filter)
        -> Result<std::vector<ExecutionLogEntry>> = 0;
};

} // namespace mcphub
