// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <store/Store.hpp>

#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace mcphub
{

/// @brief Mutex-guarded in-process implementation of every store interface.
///
/// Backs the command line tool and the test suites. Nothing is written to disk.
class InMemoryStore final: public ServerStore,
                           public ToolStore,
                           public ApprovalStore,
                           public MessageStore,
                           public ExecutionLogStore
{
  public:
    // ServerStore
    [[nodiscard]] auto getServer(const std::string& serverId) -> Result<std::optional<ServerRecord>> override;
    [[nodiscard]] auto listServers() -> Result<std::vector<ServerRecord>> override;
    [[nodiscard]] auto upsertServer(const ServerDescriptor& descriptor) -> VoidResult override;
    [[nodiscard]] auto removeServer(const std::string& serverId) -> VoidResult override;
    [[nodiscard]] auto updateRuntime(const std::string& serverId, const RuntimeUpdate& update) -> VoidResult override;
    [[nodiscard]] auto recordRestart(const std::string& serverId, clock::TimePoint at) -> VoidResult override;
    [[nodiscard]] auto recordHealthCheck(const std::string& serverId, clock::TimePoint at) -> VoidResult override;
    [[nodiscard]] auto updateToolStats(const std::string& serverId, int toolCount, clock::TimePoint at)
        -> VoidResult override;

    // ToolStore
    [[nodiscard]] auto replaceTools(const std::string& serverId, const std::vector<ToolDescriptor>& tools)
        -> VoidResult override;
    [[nodiscard]] auto listTools(const std::string& serverId) -> Result<std::vector<ToolDescriptor>> override;
    [[nodiscard]] auto findTools(const std::string& toolName) -> Result<std::vector<ToolDescriptor>> override;
    [[nodiscard]] auto incrementUsage(const std::string& serverId, const std::string& toolName, clock::TimePoint at)
        -> VoidResult override;

    // ApprovalStore
    [[nodiscard]] auto findGlobal(const std::string& userId,
                                  const std::string& serverId,
                                  const std::string& toolName) -> Result<std::optional<ApprovalRecord>> override;
    [[nodiscard]] auto findConversation(const std::string& userId,
                                        const std::string& conversationId,
                                        const std::string& serverId,
                                        const std::string& toolName) -> Result<std::optional<ApprovalRecord>> override;
    [[nodiscard]] auto saveApproval(const ApprovalRecord& record) -> VoidResult override;
    [[nodiscard]] auto removeApproval(const std::string& approvalId) -> Result<bool> override;
    [[nodiscard]] auto listConversationApprovals(const std::string& userId, const std::string& conversationId)
        -> Result<std::vector<ApprovalRecord>> override;
    [[nodiscard]] auto deleteExpiredApprovals(clock::TimePoint now) -> Result<size_t> override;

    // MessageStore
    [[nodiscard]] auto createMessage(const std::string& conversationId, Role role) -> Result<Message> override;
    [[nodiscard]] auto latestMessage(const std::string& conversationId, Role role)
        -> Result<std::optional<Message>> override;
    [[nodiscard]] auto appendContent(const std::string& messageId, ContentKind kind, nlohmann::json payload)
        -> Result<MessageContent> override;
    [[nodiscard]] auto getContent(const std::string& contentId) -> Result<std::optional<MessageContent>> override;
    [[nodiscard]] auto updateContentPayload(const std::string& contentId, nlohmann::json payload)
        -> VoidResult override;

    // ExecutionLogStore
    [[nodiscard]] auto insertExecutionLog(const ExecutionLogEntry& entry) -> VoidResult override;
    [[nodiscard]] auto updateExecutionLog(const ExecutionLogEntry& entry) -> VoidResult override;
    [[nodiscard]] auto listExecutionLogs(const ExecutionLogFilter& filter)
        -> Result<std::vector<ExecutionLogEntry>> override;

  private:
    struct StoredMessage
    {
        Message message;
        uint64_t sequence = 0; // insertion order, for "latest"
    };

    using ToolKey = std::pair<std::string, std::string>; // (serverId, name)

    [[nodiscard]] auto findServerLocked(const std::string& serverId) -> Result<ServerRecord*>;

    mutable std::mutex _mutex;
    std::map<std::string, ServerRecord> _servers;
    std::map<ToolKey, ToolDescriptor> _tools;
    std::map<std::string, ApprovalRecord> _approvals;
    std::map<std::string, StoredMessage> _messages;
    std::map<std::string, std::string> _contentOwner; // contentId -> messageId
    std::vector<ExecutionLogEntry> _executionLogs;
    uint64_t _messageSequence = 0;
};

} // namespace mcphub
