// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/NotificationHub.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

class ServerLog;

/// @brief Environment variable set on every spawned server; identifies processes as ours.
inline constexpr auto ProcessMarkerVariable = std::string_view { "IS_MCPHUB_MCP" };

/// @brief Configuration for spawning an MCP server process.
struct StdioProcessConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
};

struct ResolvedCommand
{
    std::string program;
    std::vector<std::string> args;
};

/// @brief Looks up an executable by name; nullopt if it is not installed.
using ExecutableLookup = std::function<std::optional<std::string>(std::string_view name)>;

/// @brief Searches $PATH for an executable file.
[[nodiscard]] auto findExecutableOnPath(std::string_view name) -> std::optional<std::string>;

/// @brief Maps package-runner commands onto the bundled runtimes when available.
///
/// npx becomes "bun x", node/npm become bun, pip becomes "uv pip", uvx becomes
/// "uv tool run" and python becomes "uv run python". Anything else, or a
/// runtime that is not installed, is passed through unchanged.
[[nodiscard]] auto resolveCommand(std::string_view command,
                                  const std::vector<std::string>& args,
                                  const ExecutableLookup& lookup = findExecutableOnPath) -> ResolvedCommand;

/// @brief A spawned MCP server speaking newline-delimited JSON-RPC on stdio.
///
/// A reader thread routes stdout lines carrying an id to the waiting request
/// and lines carrying only a method to the notification hub. stderr lines are
/// appended to the server log.
class StdioProcess
{
  public:
    StdioProcess(StdioProcessConfig config, std::shared_ptr<ServerLog> serverLog);
    ~StdioProcess();

    StdioProcess(const StdioProcess&) = delete;
    StdioProcess& operator=(const StdioProcess&) = delete;

    /// @brief Spawns the child process and starts the reader threads.
    [[nodiscard]] auto spawn() -> VoidResult;

    /// @brief Writes a request and waits for the correlated response.
    [[nodiscard]] auto request(const nlohmann::json& message, std::chrono::milliseconds timeout)
        -> Result<jsonrpc::Response>;

    /// @brief Writes a message without waiting for anything.
    [[nodiscard]] auto notify(const nlohmann::json& message) -> VoidResult;

    [[nodiscard]] auto notifications() -> NotificationHub&;

    /// @brief Returns the child pid, or -1 when not spawned.
    [[nodiscard]] auto pid() const -> int;

    /// @brief True while the child has not been reaped and its stdout is open.
    [[nodiscard]] auto isRunning() const -> bool;

    /// @brief Closes stdin, sends SIGTERM, and escalates to SIGKILL after the grace period.
    void terminate(std::chrono::milliseconds gracePeriod);

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcphub
