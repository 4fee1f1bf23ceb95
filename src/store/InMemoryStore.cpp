// SPDX-License-Identifier: Apache-2.0
#include "InMemoryStore.hpp"

#include <core/Uuid.hpp>

#include <algorithm>
#include <format>

namespace mcphub
{

namespace
{

    auto notFound(std::string_view what, const std::string& id) -> Error
    {
        return Error { ErrorCode::NotFound, std::format("{} not found: {}", what, id) };
    }

} // namespace

auto InMemoryStore::findServerLocked(const std::string& serverId) -> Result<ServerRecord*>
{
    auto it = _servers.find(serverId);
    if (it == _servers.end())
        return std::unexpected(notFound("Server", serverId));
    return &it->second;
}

auto InMemoryStore::getServer(const std::string& serverId) -> Result<std::optional<ServerRecord>>
{
    auto lock = std::lock_guard { _mutex };
    auto it = _servers.find(serverId);
    if (it == _servers.end())
        return std::optional<ServerRecord> {};
    return std::optional<ServerRecord> { it->second };
}

auto InMemoryStore::listServers() -> Result<std::vector<ServerRecord>>
{
    auto lock = std::lock_guard { _mutex };
    auto records = std::vector<ServerRecord> {};
    records.reserve(_servers.size());
    for (const auto& [_, record]: _servers)
        records.push_back(record);
    return records;
}

auto InMemoryStore::upsertServer(const ServerDescriptor& descriptor) -> VoidResult
{
    if (descriptor.id.empty())
        return makeError(ErrorCode::InvalidArgument, "Server id must not be empty");

    auto lock = std::lock_guard { _mutex };
    _servers[descriptor.id].descriptor = descriptor;
    return {};
}

auto InMemoryStore::removeServer(const std::string& serverId) -> VoidResult
{
    auto lock = std::lock_guard { _mutex };
    if (_servers.erase(serverId) == 0)
        return std::unexpected(notFound("Server", serverId));

    std::erase_if(_tools, [&](const auto& item) { return item.first.first == serverId; });
    return {};
}

auto InMemoryStore::updateRuntime(const std::string& serverId, const RuntimeUpdate& update) -> VoidResult
{
    auto lock = std::lock_guard { _mutex };
    auto record = findServerLocked(serverId);
    if (!record)
        return std::unexpected(record.error());

    auto& runtime = (*record)->runtime;
    runtime.status = update.status;
    runtime.isActive = update.isActive;
    runtime.processId = update.processId;
    runtime.port = update.port;
    runtime.proxyUrl = update.proxyUrl;
    return {};
}

auto InMemoryStore::recordRestart(const std::string& serverId, clock::TimePoint at) -> VoidResult
{
    auto lock = std::lock_guard { _mutex };
    auto record = findServerLocked(serverId);
    if (!record)
        return std::unexpected(record.error());

    ++(*record)->runtime.restartCount;
    (*record)->runtime.lastRestartAt = at;
    return {};
}

auto InMemoryStore::recordHealthCheck(const std::string& serverId, clock::TimePoint at) -> VoidResult
{
    auto lock = std::lock_guard { _mutex };
    auto record = findServerLocked(serverId);
    if (!record)
        return std::unexpected(record.error());

    (*record)->runtime.lastHealthCheck = at;
    return {};
}

auto InMemoryStore::updateToolStats(const std::string& serverId, int toolCount, clock::TimePoint at) -> VoidResult
{
    auto lock = std::lock_guard { _mutex };
    auto record = findServerLocked(serverId);
    if (!record)
        return std::unexpected(record.error());

    (*record)->runtime.toolCount = toolCount;
    (*record)->runtime.toolsDiscoveredAt = at;
    return {};
}

auto InMemoryStore::replaceTools(const std::string& serverId, const std::vector<ToolDescriptor>& tools)
    -> VoidResult
{
    // Validate before touching the map so a bad batch leaves the old set intact.
    for (const auto& tool: tools)
    {
        if (tool.name.empty())
            return makeError(ErrorCode::InvalidArgument, std::format("Tool without name for server {}", serverId));
        if (tool.serverId != serverId)
            return makeError(ErrorCode::InvalidArgument,
                             std::format("Tool {} belongs to {}, not {}", tool.name, tool.serverId, serverId));
    }

    auto lock = std::lock_guard { _mutex };
    std::erase_if(_tools, [&](const auto& item) { return item.first.first == serverId; });
    for (const auto& tool: tools)
        _tools[ToolKey { serverId, tool.name }] = tool;
    return {};
}

auto InMemoryStore::listTools(const std::string& serverId) -> Result<std::vector<ToolDescriptor>>
{
    auto lock = std::lock_guard { _mutex };
    auto tools = std::vector<ToolDescriptor> {};
    for (auto it = _tools.lower_bound(ToolKey { serverId, {} }); it != _tools.end() && it->first.first == serverId;
         ++it)
        tools.push_back(it->second);
    return tools;
}

auto InMemoryStore::findTools(const std::string& toolName) -> Result<std::vector<ToolDescriptor>>
{
    auto lock = std::lock_guard { _mutex };
    auto tools = std::vector<ToolDescriptor> {};
    for (const auto& [key, tool]: _tools)
    {
        if (key.second == toolName)
            tools.push_back(tool);
    }
    return tools;
}

auto InMemoryStore::incrementUsage(const std::string& serverId, const std::string& toolName, clock::TimePoint at)
    -> VoidResult
{
    auto lock = std::lock_guard { _mutex };
    auto it = _tools.find(ToolKey { serverId, toolName });
    if (it == _tools.end())
        return std::unexpected(notFound("Tool", std::format("{}/{}", serverId, toolName)));

    ++it->second.usageCount;
    it->second.lastUsedAt = at;
    return {};
}

auto InMemoryStore::findGlobal(const std::string& userId, const std::string& serverId, const std::string& toolName)
    -> Result<std::optional<ApprovalRecord>>
{
    auto lock = std::lock_guard { _mutex };
    for (const auto& [_, record]: _approvals)
    {
        if (record.isGlobal && record.userId == userId && record.serverId == serverId && record.toolName == toolName)
            return std::optional<ApprovalRecord> { record };
    }
    return std::optional<ApprovalRecord> {};
}

auto InMemoryStore::findConversation(const std::string& userId,
                                     const std::string& conversationId,
                                     const std::string& serverId,
                                     const std::string& toolName) -> Result<std::optional<ApprovalRecord>>
{
    auto lock = std::lock_guard { _mutex };
    for (const auto& [_, record]: _approvals)
    {
        if (!record.isGlobal && record.userId == userId && record.conversationId == conversationId
            && record.serverId == serverId && record.toolName == toolName)
            return std::optional<ApprovalRecord> { record };
    }
    return std::optional<ApprovalRecord> {};
}

auto InMemoryStore::saveApproval(const ApprovalRecord& record) -> VoidResult
{
    if (record.id.empty())
        return makeError(ErrorCode::InvalidArgument, "Approval id must not be empty");
    if (record.isGlobal == record.conversationId.has_value())
        return makeError(ErrorCode::InvalidArgument,
                         "Global approvals have no conversation, conversation approvals need one");

    auto lock = std::lock_guard { _mutex };

    // Enforce the unique keys the way a relational schema would.
    for (const auto& [id, other]: _approvals)
    {
        if (id == record.id)
            continue;
        if (other.isGlobal == record.isGlobal && other.userId == record.userId
            && other.conversationId == record.conversationId && other.serverId == record.serverId
            && other.toolName == record.toolName)
            return makeError(ErrorCode::StorageError,
                             std::format("Duplicate approval for {}/{} (existing {})",
                                         record.serverId,
                                         record.toolName,
                                         id));
    }

    _approvals[record.id] = record;
    return {};
}

auto InMemoryStore::removeApproval(const std::string& approvalId) -> Result<bool>
{
    auto lock = std::lock_guard { _mutex };
    return _approvals.erase(approvalId) > 0;
}

auto InMemoryStore::listConversationApprovals(const std::string& userId, const std::string& conversationId)
    -> Result<std::vector<ApprovalRecord>>
{
    auto lock = std::lock_guard { _mutex };
    auto records = std::vector<ApprovalRecord> {};
    for (const auto& [_, record]: _approvals)
    {
        if (!record.isGlobal && record.userId == userId && record.conversationId == conversationId)
            records.push_back(record);
    }
    return records;
}

auto InMemoryStore::deleteExpiredApprovals(clock::TimePoint now) -> Result<size_t>
{
    auto lock = std::lock_guard { _mutex };
    return static_cast<size_t>(std::erase_if(_approvals, [&](const auto& item) { return item.second.isExpired(now); }));
}

auto InMemoryStore::createMessage(const std::string& conversationId, Role role) -> Result<Message>
{
    auto lock = std::lock_guard { _mutex };
    auto message = Message {
        .id = uuid::generate(),
        .conversationId = conversationId,
        .role = role,
        .contents = {},
    };
    _messages[message.id] = StoredMessage { .message = message, .sequence = ++_messageSequence };
    return message;
}

auto InMemoryStore::latestMessage(const std::string& conversationId, Role role) -> Result<std::optional<Message>>
{
    auto lock = std::lock_guard { _mutex };
    const StoredMessage* latest = nullptr;
    for (const auto& [_, stored]: _messages)
    {
        if (stored.message.conversationId != conversationId || stored.message.role != role)
            continue;
        if (!latest || stored.sequence > latest->sequence)
            latest = &stored;
    }

    if (!latest)
        return std::optional<Message> {};
    return std::optional<Message> { latest->message };
}

auto InMemoryStore::appendContent(const std::string& messageId, ContentKind kind, nlohmann::json payload)
    -> Result<MessageContent>
{
    auto lock = std::lock_guard { _mutex };
    auto it = _messages.find(messageId);
    if (it == _messages.end())
        return std::unexpected(notFound("Message", messageId));

    auto& contents = it->second.message.contents;
    auto content = MessageContent {
        .id = uuid::generate(),
        .messageId = messageId,
        .sequenceOrder = contents.empty() ? 0 : contents.back().sequenceOrder + 1,
        .kind = kind,
        .payload = std::move(payload),
    };
    contents.push_back(content);
    _contentOwner[content.id] = messageId;
    return content;
}

auto InMemoryStore::getContent(const std::string& contentId) -> Result<std::optional<MessageContent>>
{
    auto lock = std::lock_guard { _mutex };
    auto owner = _contentOwner.find(contentId);
    if (owner == _contentOwner.end())
        return std::optional<MessageContent> {};

    for (const auto& content: _messages.at(owner->second).message.contents)
    {
        if (content.id == contentId)
            return std::optional<MessageContent> { content };
    }
    return std::optional<MessageContent> {};
}

auto InMemoryStore::updateContentPayload(const std::string& contentId, nlohmann::json payload) -> VoidResult
{
    auto lock = std::lock_guard { _mutex };
    auto owner = _contentOwner.find(contentId);
    if (owner == _contentOwner.end())
        return std::unexpected(notFound("Message content", contentId));

    for (auto& content: _messages.at(owner->second).message.contents)
    {
        if (content.id == contentId)
        {
            content.payload = std::move(payload);
            return {};
        }
    }
    return std::unexpected(notFound("Message content", contentId));
}

auto InMemoryStore::insertExecutionLog(const ExecutionLogEntry& entry) -> VoidResult
{
    if (entry.id.empty())
        return makeError(ErrorCode::InvalidArgument, "Execution log id must not be empty");

    auto lock = std::lock_guard { _mutex };
    if (std::ranges::any_of(_executionLogs, [&](const auto& e) { return e.id == entry.id; }))
        return makeError(ErrorCode::StorageError, std::format("Execution log {} already exists", entry.id));

    _executionLogs.push_back(entry);
    return {};
}

auto InMemoryStore::updateExecutionLog(const ExecutionLogEntry& entry) -> VoidResult
{
    auto lock = std::lock_guard { _mutex };
    auto it = std::ranges::find_if(_executionLogs, [&](const auto& e) { return e.id == entry.id; });
    if (it == _executionLogs.end())
        return std::unexpected(notFound("Execution log", entry.id));

    *it = entry;
    return {};
}

auto InMemoryStore::listExecutionLogs(const ExecutionLogFilter& filter) -> Result<std::vector<ExecutionLogEntry>>
{
    auto lock = std::lock_guard { _mutex };
    auto matches = std::vector<ExecutionLogEntry> {};
    for (const auto& entry: _executionLogs)
    {
        if (filter.userId && entry.userId != *filter.userId)
            continue;
        if (filter.serverId && entry.serverId != *filter.serverId)
            continue;
        if (filter.conversationId && entry.conversationId != *filter.conversationId)
            continue;
        if (filter.status && entry.status != *filter.status)
            continue;
        matches.push_back(entry);
    }

    std::ranges::stable_sort(matches, std::ranges::greater {}, &ExecutionLogEntry::startedAt);

    auto const perPage = std::clamp(filter.perPage, 1, 100);
    auto const page = std::max(filter.page, 1);
    auto const offset = static_cast<size_t>(page - 1) * static_cast<size_t>(perPage);
    if (offset >= matches.size())
        return std::vector<ExecutionLogEntry> {};

    auto const end = std::min(matches.size(), offset + static_cast<size_t>(perPage));
    return std::vector<ExecutionLogEntry>(matches.begin() + static_cast<std::ptrdiff_t>(offset),
                                          matches.begin() + static_cast<std::ptrdiff_t>(end));
}

} // namespace mcphub
