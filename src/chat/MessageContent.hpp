// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace mcphub
{

/// @brief Payload of a ToolCallPendingApproval content item.
struct PendingToolCall
{
    std::string toolName;
    std::string serverId;
    nlohmann::json arguments;
    std::optional<bool> isApproved; ///< nullopt while undecided.
};

[[nodiscard]] auto toPayload(const PendingToolCall& pending) -> nlohmann::json;

/// @brief Reads a pending tool call back from a content payload.
/// @return InvalidPendingApprovalData if required fields are missing or mistyped.
[[nodiscard]] auto parsePendingToolCall(const nlohmann::json& payload) -> Result<PendingToolCall>;

[[nodiscard]] auto makeToolCallPayload(const PendingToolCall& call, const std::string& callId) -> nlohmann::json;

[[nodiscard]] auto makeToolResultPayload(const std::string& callId,
                                         const nlohmann::json& result,
                                         bool success,
                                         const std::optional<std::string>& errorMessage) -> nlohmann::json;

/// @brief The content item with the highest sequence order, if any.
[[nodiscard]] auto lastContent(const Message& message) -> const MessageContent*;

} // namespace mcphub
