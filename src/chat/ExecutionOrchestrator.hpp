// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chat/MessageContent.hpp>
#include <chat/StreamEvent.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>

#include <memory>
#include <optional>
#include <string>

namespace mcphub
{

class ApprovalPolicy;
class MessageStore;
class ToolInvoker;

/// @brief Result of gating a chat turn on a pending tool call.
struct GateOutcome
{
    bool needsApproval = false; ///< The turn was about a pending tool call.
    bool continueLoop = true;   ///< The model may take another pass.
    std::optional<std::string> executedMessageId;
};

/// @brief The tool-call part of the chat turn loop.
///
/// A tool call proposed by the model is parked as a pending content item. On
/// each turn the pending item is checked against the approval policy; once
/// approved it is executed and its call and result are recorded. Every
/// recorded item is announced by NewMessageContent right before its own event.
/// Failures are reported as StreamError events; nothing is thrown.
class ExecutionOrchestrator
{
  public:
    ExecutionOrchestrator(std::shared_ptr<MessageStore> messages,
                          std::shared_ptr<ApprovalPolicy> approvals,
                          std::shared_ptr<ToolInvoker> invoker);

    /// @brief Resolves a pending tool call at the end of the conversation, if there is one.
    [[nodiscard]] auto gatePendingCall(const std::string& userId,
                                       const std::string& conversationId,
                                       const EventSink& sink) -> GateOutcome;

    /// @brief Parks a tool call proposed by the model for approval.
    /// @return true if handled; the caller must stop generating for this turn.
    [[nodiscard]] auto handleToolRequest(const ToolCallRequest& request,
                                         const std::string& messageId,
                                         const std::string& conversationId,
                                         const std::string& userId,
                                         const EventSink& sink) -> bool;

    /// @brief Records the user's decision on a pending tool call.
    ///
    /// Patches is_approved of the pending content in place and stores a
    /// conversation approval for the tool.
    [[nodiscard]] auto approvePending(const std::string& userId,
                                      const std::string& conversationId,
                                      const std::string& contentId,
                                      bool approved) -> Result<ApprovalRecord>;

  private:
    [[nodiscard]] auto executeAndRecord(const std::string& userId,
                                        const std::string& conversationId,
                                        const std::string& messageId,
                                        const PendingToolCall& call,
                                        const EventSink& sink) -> Result<ExecutionRecord>;

    std::shared_ptr<MessageStore> _messages;
    std::shared_ptr<ApprovalPolicy> _approvals;
    std::shared_ptr<ToolInvoker> _invoker;
};

} // namespace mcphub
