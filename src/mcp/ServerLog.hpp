// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>
#include <core/Error.hpp>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief Which per-server log file an entry belongs to.
enum class ServerLogStream
{
    Exec, ///< Lifecycle events written by the hub.
    In,   ///< Data written to the server.
    Out,  ///< Data read from the server.
    Err,  ///< The server's stderr.
};

[[nodiscard]] constexpr auto serverLogStreamPrefix(ServerLogStream stream) -> std::string_view
{
    switch (stream)
    {
        case ServerLogStream::Exec: return "exec";
        case ServerLogStream::In: return "in";
        case ServerLogStream::Out: return "out";
        case ServerLogStream::Err: return "err";
    }
    return "exec";
}

struct ServerLogEntry
{
    ServerLogStream stream = ServerLogStream::Exec;
    std::string level;
    std::string message;
    clock::TimePoint timestamp;
};

/// @brief Per-server diagnostic log files.
///
/// Lives under <dataDir>/logs/mcp/<serverId>/ with one file per stream and
/// day, e.g. err-2025-09-28.log. Lines are "YYYY-MM-DD HH:MM:SS.mmm [LEVEL] message".
class ServerLog
{
  public:
    ServerLog(const std::filesystem::path& dataDir, std::string serverId);

    /// @brief The log directory of a server; stable even if nothing was written yet.
    [[nodiscard]] static auto directoryFor(const std::filesystem::path& dataDir, std::string_view serverId)
        -> std::filesystem::path;

    void exec(std::string_view level, std::string_view message);
    void stdinData(std::string_view data);
    void stdoutData(std::string_view data);
    void stderrData(std::string_view data);

    /// @brief Returns up to limit of today's entries across all streams, oldest first.
    [[nodiscard]] auto readRecent(size_t limit) const -> Result<std::vector<ServerLogEntry>>;

    [[nodiscard]] auto directory() const noexcept -> const std::filesystem::path& { return _dir; }

    /// @brief Parses one log line; nullopt if it is not in the expected format.
    [[nodiscard]] static auto parseLine(std::string_view line, ServerLogStream stream)
        -> std::optional<ServerLogEntry>;

  private:
    void write(ServerLogStream stream, std::string_view level, std::string_view message);

    std::filesystem::path _dir;
    std::string _serverId;
    mutable std::mutex _mutex;
};

} // namespace mcphub
