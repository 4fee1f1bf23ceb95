// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>
#include <core/Error.hpp>
#include <tools/ToolCatalog.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace mcphub
{

class ExecutionLogStore;

/// @brief One approved tool call to run.
struct ToolInvocation
{
    std::string userId;
    std::optional<std::string> conversationId;
    std::string serverId;
    std::string toolName;
    nlohmann::json arguments;
    std::string callId;
};

/// @brief What the server answered to a tools/call request.
struct ToolOutcome
{
    bool success = false;
    std::optional<nlohmann::json> result;
    std::optional<std::string> errorMessage;
    std::optional<std::string> errorCode;
    int64_t durationMs = 0;
};

/// @brief Runs a tool on its server.
class ToolInvoker
{
  public:
    virtual ~ToolInvoker() = default;

    /// @return The outcome (including tool-reported failures), or an error if
    ///         the request could not be completed at all.
    [[nodiscard]] virtual auto invoke(const ToolInvocation& invocation) -> Result<ToolOutcome> = 0;
};

/// @brief Sends tools/call through the server's registered transport.
///
/// Every invocation is written to the execution log and counted in the tool catalog.
class ToolExecutor final: public ToolInvoker
{
  public:
    ToolExecutor(TransportLookup lookup,
                 std::shared_ptr<ToolCatalog> catalog,
                 std::shared_ptr<ExecutionLogStore> executionLogs,
                 clock::NowFunction now = clock::now);

    [[nodiscard]] auto invoke(const ToolInvocation& invocation) -> Result<ToolOutcome> override;

  private:
    void finishLog(ExecutionLogEntry entry,
                   ExecutionStatus status,
                   const ToolOutcome* outcome,
                   const Error* error,
                   int64_t durationMs);

    TransportLookup _lookup;
    std::shared_ptr<ToolCatalog> _catalog;
    std::shared_ptr<ExecutionLogStore> _executionLogs;
    clock::NowFunction _now;
};

} // namespace mcphub
