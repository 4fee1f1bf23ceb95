// SPDX-License-Identifier: Apache-2.0
#include "ApprovalPolicy.hpp"

#include <core/Log.hpp>
#include <core/Uuid.hpp>
#include <store/Store.hpp>

#include <algorithm>
#include <cctype>

namespace mcphub
{

namespace
{

    auto toLower(std::string_view text) -> std::string
    {
        auto out = std::string(text);
        std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

} // namespace

ApprovalPolicy::ApprovalPolicy(std::shared_ptr<ApprovalStore> store, clock::NowFunction now):
    _store(std::move(store)), _now(std::move(now))
{
}

auto ApprovalPolicy::check(const std::string& userId,
                           const std::string& conversationId,
                           const std::string& serverId,
                           const std::string& toolName) -> Result<std::optional<ApprovalDecision>>
{
    auto const now = _now();

    auto global = _store->findGlobal(userId, serverId, toolName);
    if (!global)
        return std::unexpected(global.error());

    if (*global && (*global)->approved && (*global)->autoApprove && !(*global)->isExpired(now))
        return ApprovalDecision { .approved = true, .source = ApprovalSource::Global };

    auto conversation = _store->findConversation(userId, conversationId, serverId, toolName);
    if (!conversation)
        return std::unexpected(conversation.error());

    if (*conversation && (*conversation)->approved && !(*conversation)->isExpired(now))
        return ApprovalDecision { .approved = true, .source = ApprovalSource::Conversation };

    return std::nullopt;
}

auto ApprovalPolicy::setGlobal(const std::string& userId,
                               const std::string& serverId,
                               const std::string& toolName,
                               const GlobalApprovalRequest& request) -> Result<ApprovalRecord>
{
    auto lock = std::lock_guard { _writeMutex };
    auto const now = _now();

    auto existing = _store->findGlobal(userId, serverId, toolName);
    if (!existing)
        return std::unexpected(existing.error());

    auto record = existing->value_or(ApprovalRecord {
        .id = uuid::generate(),
        .userId = userId,
        .conversationId = std::nullopt,
        .serverId = serverId,
        .toolName = toolName,
        .isGlobal = true,
        .createdAt = now,
    });

    record.approved = request.autoApprove;
    record.autoApprove = request.autoApprove;
    record.approvedAt = request.autoApprove ? std::optional { now } : std::nullopt;
    record.expiresAt = request.expiresAt;
    record.notes = request.notes;
    record.updatedAt = now;

    if (auto saved = _store->saveApproval(record); !saved)
        return std::unexpected(saved.error());

    log::debug("Global approval for {}/{} set to {} (user {})", serverId, toolName, request.autoApprove, userId);
    return record;
}

auto ApprovalPolicy::setConversation(const std::string& userId,
                                     const std::string& conversationId,
                                     const ConversationApprovalRequest& request) -> Result<ApprovalRecord>
{
    auto lock = std::lock_guard { _writeMutex };
    auto const now = _now();

    // Expired rows are updated in place as well; the unique key still holds them.
    auto existing = _store->findConversation(userId, conversationId, request.serverId, request.toolName);
    if (!existing)
        return std::unexpected(existing.error());

    auto record = existing->value_or(ApprovalRecord {
        .id = uuid::generate(),
        .userId = userId,
        .conversationId = conversationId,
        .serverId = request.serverId,
        .toolName = request.toolName,
        .autoApprove = false,
        .isGlobal = false,
        .createdAt = now,
    });

    record.approved = request.approved;
    record.approvedAt = request.approved ? std::optional { now } : std::nullopt;
    record.expiresAt = request.expiresAt;
    record.notes = request.notes;
    record.updatedAt = now;

    if (auto saved = _store->saveApproval(record); !saved)
        return std::unexpected(saved.error());

    log::debug("Conversation approval for {}/{} in {} set to {}",
               request.serverId,
               request.toolName,
               conversationId,
               request.approved);
    return record;
}

auto ApprovalPolicy::removeGlobal(const std::string& userId,
                                  const std::string& serverId,
                                  const std::string& toolName) -> Result<bool>
{
    auto lock = std::lock_guard { _writeMutex };
    return _store->findGlobal(userId, serverId, toolName)
        .and_then([&](const std::optional<ApprovalRecord>& record) -> Result<bool> {
            if (!record)
                return false;
            return _store->removeApproval(record->id);
        });
}

auto ApprovalPolicy::removeConversation(const std::string& userId,
                                        const std::string& conversationId,
                                        const std::string& serverId,
                                        const std::string& toolName) -> Result<bool>
{
    auto lock = std::lock_guard { _writeMutex };
    return _store->findConversation(userId, conversationId, serverId, toolName)
        .and_then([&](const std::optional<ApprovalRecord>& record) -> Result<bool> {
            if (!record)
                return false;
            return _store->removeApproval(record->id);
        });
}

auto ApprovalPolicy::getGlobal(const std::string& userId,
                               const std::string& serverId,
                               const std::string& toolName) -> Result<std::optional<ApprovalRecord>>
{
    return _store->findGlobal(userId, serverId, toolName);
}

auto ApprovalPolicy::listConversation(const std::string& userId,
                                      const std::string& conversationId,
                                      const ApprovalListFilter& filter) -> Result<std::vector<ApprovalRecord>>
{
    auto records = _store->listConversationApprovals(userId, conversationId);
    if (!records)
        return std::unexpected(records.error());

    auto const now = _now();
    auto const needle = filter.toolName ? toLower(*filter.toolName) : std::string {};

    std::erase_if(*records, [&](const ApprovalRecord& record) {
        if (filter.serverId && record.serverId != *filter.serverId)
            return true;
        if (filter.approved && record.approved != *filter.approved)
            return true;
        if (filter.toolName && toLower(record.toolName).find(needle) == std::string::npos)
            return true;
        return !filter.includeExpired && record.isExpired(now);
    });

    std::ranges::stable_sort(*records, std::ranges::greater {}, &ApprovalRecord::createdAt);

    auto const perPage = static_cast<size_t>(std::clamp(filter.perPage, 1, 100));
    auto const offset = static_cast<size_t>(std::max(filter.page, 1) - 1) * perPage;
    if (offset >= records->size())
        return std::vector<ApprovalRecord> {};

    auto const first = records->begin() + static_cast<std::ptrdiff_t>(offset);
    auto const last = records->begin() + static_cast<std::ptrdiff_t>(std::min(records->size(), offset + perPage));
    return std::vector<ApprovalRecord>(first, last);
}

auto ApprovalPolicy::purgeExpired() -> Result<size_t>
{
    auto purged = _store->deleteExpiredApprovals(_now());
    if (purged && *purged > 0)
        log::info("Removed {} expired tool approvals", *purged);
    return purged;
}

} // namespace mcphub
