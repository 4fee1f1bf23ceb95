// SPDX-License-Identifier: Apache-2.0
#include "ToolExecutor.hpp"

#include <core/Log.hpp>
#include <core/Uuid.hpp>
#include <mcp/JsonRpc.hpp>
#include <store/Store.hpp>

#include <chrono>
#include <format>

namespace mcphub
{

ToolExecutor::ToolExecutor(TransportLookup lookup,
                           std::shared_ptr<ToolCatalog> catalog,
                           std::shared_ptr<ExecutionLogStore> executionLogs,
                           clock::NowFunction now):
    _lookup(std::move(lookup)),
    _catalog(std::move(catalog)),
    _executionLogs(std::move(executionLogs)),
    _now(std::move(now))
{
}

auto ToolExecutor::invoke(const ToolInvocation& invocation) -> Result<ToolOutcome>
{
    log::info("Executing MCP tool '{}' on server {}", invocation.toolName, invocation.serverId);

    auto entry = ExecutionLogEntry {
        .id = uuid::generate(),
        .userId = invocation.userId,
        .serverId = invocation.serverId,
        .conversationId = invocation.conversationId,
        .toolName = invocation.toolName,
        .parameters = invocation.arguments,
        .result = nullptr,
        .status = ExecutionStatus::Running,
        .startedAt = _now(),
        .callId = invocation.callId,
    };
    if (auto logged = _executionLogs->insertExecutionLog(entry); !logged)
        log::warning("Cannot write execution log for tool {}: {}", invocation.toolName, logged.error());

    auto const startTime = std::chrono::steady_clock::now();
    auto elapsed = [&] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime)
            .count();
    };

    auto transport = _lookup(invocation.serverId);
    if (!transport)
    {
        finishLog(std::move(entry), ExecutionStatus::Failed, nullptr, &transport.error(), elapsed());
        return std::unexpected(transport.error());
    }

    auto request = jsonrpc::makeRequest(std::format("tool-{}", uuid::generate()),
                                        "tools/call",
                                        nlohmann::json {
                                            { "name", invocation.toolName },
                                            { "arguments", invocation.arguments },
                                        });

    auto response = (*transport)->send(request);
    auto const durationMs = static_cast<int64_t>(elapsed());

    if (!response)
    {
        log::error("MCP tool '{}' request failed: {}", invocation.toolName, response.error());
        auto const status =
            response.error().code == ErrorCode::TimeoutError ? ExecutionStatus::Timeout : ExecutionStatus::Failed;
        finishLog(std::move(entry), status, nullptr, &response.error(), durationMs);
        return std::unexpected(response.error());
    }

    auto outcome = ToolOutcome { .durationMs = durationMs };
    if (response->error)
    {
        log::error("MCP tool '{}' execution failed: {} (code: {})",
                   invocation.toolName,
                   response->error->message,
                   response->error->code);
        outcome.success = false;
        outcome.errorMessage = response->error->message;
        outcome.errorCode = std::to_string(response->error->code);
        finishLog(std::move(entry), ExecutionStatus::Failed, &outcome, nullptr, durationMs);
    }
    else
    {
        log::info("MCP tool '{}' executed successfully in {}ms", invocation.toolName, durationMs);
        outcome.success = true;
        outcome.result = response->result;
        finishLog(std::move(entry), ExecutionStatus::Completed, &outcome, nullptr, durationMs);
    }

    if (auto counted = _catalog->recordUsage(invocation.serverId, invocation.toolName); !counted)
        log::debug("Cannot record usage of tool {}: {}", invocation.toolName, counted.error());

    return outcome;
}

void ToolExecutor::finishLog(ExecutionLogEntry entry,
                             ExecutionStatus status,
                             const ToolOutcome* outcome,
                             const Error* error,
                             int64_t durationMs)
{
    entry.status = status;
    entry.completedAt = _now();
    entry.durationMs = durationMs;

    if (outcome)
    {
        entry.result = outcome->result.value_or(nullptr);
        entry.errorMessage = outcome->errorMessage;
        entry.errorCode = outcome->errorCode;
    }
    if (error)
    {
        entry.errorMessage = error->message;
        entry.errorCode = std::string(errorCodeName(error->code));
    }

    if (auto logged = _executionLogs->updateExecutionLog(entry); !logged)
        log::warning("Cannot update execution log {}: {}", entry.id, logged.error());
    else
        log::debug("Execution {} of tool '{}' finished as {} after {}ms",
                   entry.id,
                   entry.toolName,
                   executionStatusToString(status),
                   durationMs);
}

} // namespace mcphub
