// SPDX-License-Identifier: Apache-2.0
#include "ExecutionOrchestrator.hpp"

#include <approval/ApprovalPolicy.hpp>
#include <chat/ToolExecutor.hpp>
#include <core/Log.hpp>
#include <core/Uuid.hpp>
#include <store/Store.hpp>

#include <chrono>
#include <format>

namespace mcphub
{

namespace
{

    constexpr auto HaltTurn = GateOutcome { .needsApproval = true, .continueLoop = false };

    void emitError(const EventSink& sink, std::string_view code, std::string message)
    {
        log::error("{}", message);
        sink(StreamError { .code = std::string(code), .message = std::move(message) });
    }

} // namespace

ExecutionOrchestrator::ExecutionOrchestrator(std::shared_ptr<MessageStore> messages,
                                             std::shared_ptr<ApprovalPolicy> approvals,
                                             std::shared_ptr<ToolInvoker> invoker):
    _messages(std::move(messages)), _approvals(std::move(approvals)), _invoker(std::move(invoker))
{
}

auto ExecutionOrchestrator::gatePendingCall(const std::string& userId,
                                            const std::string& conversationId,
                                            const EventSink& sink) -> GateOutcome
{
    auto message = _messages->latestMessage(conversationId, Role::Assistant);
    if (!message)
    {
        emitError(sink,
                  streamcode::SystemInternalError,
                  std::format("Failed to load messages: {}", message.error().message));
        return GateOutcome { .needsApproval = false, .continueLoop = false };
    }

    auto const* content = *message ? lastContent(**message) : nullptr;
    if (!content || content->kind != ContentKind::ToolCallPendingApproval)
        return GateOutcome {};

    auto pending = parsePendingToolCall(content->payload);
    if (!pending)
    {
        log::warning("Pending content {}: {}", content->id, pending.error().message);
        emitError(sink, streamcode::SystemInternalError, "Invalid pending approval data");
        return HaltTurn;
    }

    auto decision = _approvals->check(userId, conversationId, pending->serverId, pending->toolName);
    if (!decision)
    {
        emitError(sink,
                  streamcode::SystemInternalError,
                  std::format("Failed to check tool approval: {}", decision.error().message));
        return HaltTurn;
    }

    if (!*decision)
    {
        log::debug("Tool {} on {} awaits approval", pending->toolName, pending->serverId);
        sink(ToolCallPendingApproval {
            .messageContentId = content->id,
            .messageId = (*message)->id,
            .toolName = pending->toolName,
            .serverId = pending->serverId,
            .arguments = pending->arguments,
        });
        return HaltTurn;
    }

    log::info("Tool {} approved via {}", pending->toolName, approvalSourceToString((*decision)->source));

    auto const messageId = (*message)->id;
    auto executed = executeAndRecord(userId, conversationId, messageId, *pending, sink);
    if (!executed)
    {
        emitError(sink,
                  streamcode::SystemInternalError,
                  std::format("Tool execution failed: {}", executed.error().message));
        return GateOutcome { .needsApproval = true, .continueLoop = false, .executedMessageId = messageId };
    }

    return GateOutcome { .needsApproval = true, .continueLoop = true, .executedMessageId = messageId };
}

auto ExecutionOrchestrator::handleToolRequest(const ToolCallRequest& request,
                                              const std::string& messageId,
                                              const std::string& conversationId,
                                              const std::string& userId,
                                              const EventSink& sink) -> bool
{
    auto const pending = PendingToolCall {
        .toolName = request.toolName,
        .serverId = request.serverId,
        .arguments = request.arguments,
        .isApproved = std::nullopt,
    };

    auto content = _messages->appendContent(messageId, ContentKind::ToolCallPendingApproval, toPayload(pending));
    if (!content)
    {
        emitError(sink,
                  streamcode::SystemDatabaseError,
                  std::format("Failed to save pending approval: {}", content.error().message));
        return false;
    }

    log::debug("Tool call {} on {} parked for approval (conversation {}, user {})",
               request.toolName,
               request.serverId,
               conversationId,
               userId);

    sink(NewMessageContent { .messageContentId = content->id, .messageId = messageId });
    sink(ToolCallPendingApproval {
        .messageContentId = content->id,
        .messageId = messageId,
        .toolName = request.toolName,
        .serverId = request.serverId,
        .arguments = request.arguments,
    });
    return true;
}

auto ExecutionOrchestrator::approvePending(const std::string& userId,
                                           const std::string& conversationId,
                                           const std::string& contentId,
                                           bool approved) -> Result<ApprovalRecord>
{
    auto content = _messages->getContent(contentId);
    if (!content)
        return std::unexpected(content.error());
    if (!*content)
        return makeError(ErrorCode::NotFound, std::format("Message content not found: {}", contentId));
    if ((*content)->kind != ContentKind::ToolCallPendingApproval)
        return makeError(ErrorCode::InvalidPendingApprovalData,
                         std::format("Content {} is a {} row, not a pending tool call",
                                     contentId,
                                     contentKindToString((*content)->kind)));

    auto pending = parsePendingToolCall((*content)->payload);
    if (!pending)
        return std::unexpected(pending.error());

    pending->isApproved = approved;
    if (auto patched = _messages->updateContentPayload(contentId, toPayload(*pending)); !patched)
        return std::unexpected(patched.error());

    return _approvals->setConversation(userId,
                                       conversationId,
                                       ConversationApprovalRequest {
                                           .serverId = pending->serverId,
                                           .toolName = pending->toolName,
                                           .approved = approved,
                                       });
}

auto ExecutionOrchestrator::executeAndRecord(const std::string& userId,
                                             const std::string& conversationId,
                                             const std::string& messageId,
                                             const PendingToolCall& call,
                                             const EventSink& sink) -> Result<ExecutionRecord>
{
    auto const callId = uuid::generate();

    auto callContent = _messages->appendContent(messageId, ContentKind::ToolCall, makeToolCallPayload(call, callId));
    if (!callContent)
        return std::unexpected(callContent.error());

    sink(NewMessageContent { .messageContentId = callContent->id, .messageId = messageId });
    sink(ToolCall {
        .messageContentId = callContent->id,
        .messageId = messageId,
        .toolName = call.toolName,
        .serverId = call.serverId,
        .arguments = call.arguments,
        .callId = callId,
    });

    auto record = ExecutionRecord {
        .callId = callId,
        .messageId = messageId,
        .toolName = call.toolName,
        .serverId = call.serverId,
        .arguments = call.arguments,
    };

    auto const startTime = std::chrono::steady_clock::now();
    auto outcome = _invoker->invoke(ToolInvocation {
        .userId = userId,
        .conversationId = conversationId,
        .serverId = call.serverId,
        .toolName = call.toolName,
        .arguments = call.arguments,
        .callId = callId,
    });
    record.durationMs =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime).count();

    auto result = std::optional<nlohmann::json> {};
    if (!outcome)
    {
        record.success = false;
        record.errorMessage = std::format("Tool execution failed: {}", outcome.error().message);
    }
    else
    {
        record.success = outcome->success;
        record.errorMessage = outcome->errorMessage;
        result = outcome->result;
    }

    record.result = result.value_or(nlohmann::json {
        { "error", "execution_failed" },
        { "duration_ms", record.durationMs },
    });

    auto resultContent = _messages->appendContent(
        messageId,
        ContentKind::ToolResult,
        makeToolResultPayload(callId, record.result, record.success, record.errorMessage));
    if (!resultContent)
        return std::unexpected(resultContent.error());

    sink(NewMessageContent { .messageContentId = resultContent->id, .messageId = messageId });
    sink(ToolResult {
        .messageContentId = resultContent->id,
        .messageId = messageId,
        .callId = callId,
        .result = record.result,
        .success = record.success,
        .errorMessage = record.errorMessage,
    });

    return record;
}

} // namespace mcphub
