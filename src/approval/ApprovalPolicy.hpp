// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

class ApprovalStore;

/// @brief Which record granted an approval.
enum class ApprovalSource
{
    Global,
    Conversation,
};

[[nodiscard]] constexpr auto approvalSourceToString(ApprovalSource source) -> std::string_view
{
    switch (source)
    {
        case ApprovalSource::Global: return "global";
        case ApprovalSource::Conversation: return "conversation";
    }
    return "unknown";
}

struct ApprovalDecision
{
    bool approved = false;
    ApprovalSource source = ApprovalSource::Global;
};

struct GlobalApprovalRequest
{
    bool autoApprove = false;
    std::optional<clock::TimePoint> expiresAt;
    std::string notes;
};

struct ConversationApprovalRequest
{
    std::string serverId;
    std::string toolName;
    bool approved = false;
    std::optional<clock::TimePoint> expiresAt;
    std::string notes;
};

struct ApprovalListFilter
{
    std::optional<std::string> serverId;
    std::optional<bool> approved;
    std::optional<std::string> toolName; ///< Case-insensitive substring.
    bool includeExpired = false;
    int page = 1;
    int perPage = 50; ///< Clamped to 1..100.
};

/// @brief Two-tier trust decisions for tool calls.
///
/// A global auto-approval always wins; otherwise a conversation approval
/// applies. Expiry is evaluated on every read. Nothing is cached.
class ApprovalPolicy
{
  public:
    explicit ApprovalPolicy(std::shared_ptr<ApprovalStore> store, clock::NowFunction now = clock::now);

    /// @return The granting decision, or nullopt if the call is not approved.
    [[nodiscard]] auto check(const std::string& userId,
                             const std::string& conversationId,
                             const std::string& serverId,
                             const std::string& toolName) -> Result<std::optional<ApprovalDecision>>;

    /// @brief Creates or updates the user's global record for a tool.
    [[nodiscard]] auto setGlobal(const std::string& userId,
                                 const std::string& serverId,
                                 const std::string& toolName,
                                 const GlobalApprovalRequest& request) -> Result<ApprovalRecord>;

    /// @brief Creates or updates the user's record for a tool within one conversation.
    [[nodiscard]] auto setConversation(const std::string& userId,
                                       const std::string& conversationId,
                                       const ConversationApprovalRequest& request) -> Result<ApprovalRecord>;

    /// @return true if a record was deleted.
    [[nodiscard]] auto removeGlobal(const std::string& userId,
                                    const std::string& serverId,
                                    const std::string& toolName) -> Result<bool>;

    /// @return true if a record was deleted.
    [[nodiscard]] auto removeConversation(const std::string& userId,
                                          const std::string& conversationId,
                                          const std::string& serverId,
                                          const std::string& toolName) -> Result<bool>;

    [[nodiscard]] auto getGlobal(const std::string& userId,
                                 const std::string& serverId,
                                 const std::string& toolName) -> Result<std::optional<ApprovalRecord>>;

    /// @brief Conversation records matching the filter, newest first.
    [[nodiscard]] auto listConversation(const std::string& userId,
                                        const std::string& conversationId,
                                        const ApprovalListFilter& filter = {})
        -> Result<std::vector<ApprovalRecord>>;

    /// @brief Deletes every expired record.
    /// @return Number of records deleted.
    [[nodiscard]] auto purgeExpired() -> Result<size_t>;

  private:
    std::shared_ptr<ApprovalStore> _store;
    clock::NowFunction _now;
    std::mutex _writeMutex;
};

} // namespace mcphub
