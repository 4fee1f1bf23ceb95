// SPDX-License-Identifier: Apache-2.0
#include "ServerLog.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <format>
#include <fstream>

namespace mcphub
{

ServerLog::ServerLog(const std::filesystem::path& dataDir, std::string serverId):
    _dir(directoryFor(dataDir, serverId)), _serverId(std::move(serverId))
{
    auto ec = std::error_code {};
    std::filesystem::create_directories(_dir, ec);
    if (ec)
        log::warning("Cannot create log directory {}: {}", _dir.string(), ec.message());
}

auto ServerLog::directoryFor(const std::filesystem::path& dataDir, std::string_view serverId)
    -> std::filesystem::path
{
    return dataDir / "logs" / "mcp" / std::string(serverId);
}

void ServerLog::exec(std::string_view level, std::string_view message)
{
    write(ServerLogStream::Exec, level, message);
}

void ServerLog::stdinData(std::string_view data)
{
    write(ServerLogStream::In, "DATA", data);
}

void ServerLog::stdoutData(std::string_view data)
{
    write(ServerLogStream::Out, "DATA", data);
}

void ServerLog::stderrData(std::string_view data)
{
    write(ServerLogStream::Err, "ERROR", data);
}

void ServerLog::write(ServerLogStream stream, std::string_view level, std::string_view message)
{
    auto const now = clock::now();
    auto const path = _dir / std::format("{}-{}.log", serverLogStreamPrefix(stream), clock::formatDate(now));

    auto lock = std::lock_guard { _mutex };
    auto file = std::ofstream(path, std::ios::app);
    if (!file)
    {
        log::debug("Cannot append to {}", path.string());
        return;
    }
    file << std::format("{} [{}] {}\n", clock::formatTimestamp(now), level, message);
}

auto ServerLog::parseLine(std::string_view line, ServerLogStream stream) -> std::optional<ServerLogEntry>
{
    // "2025-09-28 23:31:14.749 [INFO] Server stop requested"
    auto const firstSpace = line.find(' ');
    if (firstSpace == std::string_view::npos)
        return std::nullopt;
    auto const secondSpace = line.find(' ', firstSpace + 1);
    if (secondSpace == std::string_view::npos)
        return std::nullopt;

    auto timestamp = clock::parseTimestamp(line.substr(0, secondSpace));
    if (!timestamp)
        return std::nullopt;

    auto rest = line.substr(secondSpace + 1);
    if (rest.empty() || rest.front() != '[')
        return std::nullopt;

    auto const levelEnd = rest.find(']');
    if (levelEnd == std::string_view::npos)
        return std::nullopt;

    auto message = rest.substr(levelEnd + 1);
    if (!message.empty() && message.front() == ' ')
        message.remove_prefix(1);

    return ServerLogEntry {
        .stream = stream,
        .level = std::string(rest.substr(1, levelEnd - 1)),
        .message = std::string(message),
        .timestamp = *timestamp,
    };
}

auto ServerLog::readRecent(size_t limit) const -> Result<std::vector<ServerLogEntry>>
{
    auto const today = clock::formatDate(clock::now());
    auto entries = std::vector<ServerLogEntry> {};

    constexpr auto streams = std::array {
        ServerLogStream::Exec,
        ServerLogStream::In,
        ServerLogStream::Out,
        ServerLogStream::Err,
    };

    auto lock = std::lock_guard { _mutex };
    for (auto const stream: streams)
    {
        auto const path = _dir / std::format("{}-{}.log", serverLogStreamPrefix(stream), today);
        if (!std::filesystem::exists(path))
            continue;

        auto file = std::ifstream(path);
        if (!file)
            return makeError(ErrorCode::IoError, std::format("Cannot read log file {}", path.string()));

        auto line = std::string {};
        while (std::getline(file, line))
        {
            if (auto entry = parseLine(line, stream))
                entries.push_back(std::move(*entry));
        }
    }

    std::ranges::stable_sort(entries, {}, &ServerLogEntry::timestamp);
    if (entries.size() > limit)
        entries.erase(entries.begin(), entries.end() - static_cast<std::ptrdiff_t>(limit));
    return entries;
}

} // namespace mcphub
