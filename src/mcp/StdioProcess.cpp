// SPDX-License-Identifier: Apache-2.0
#include "StdioProcess.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/PendingRequests.hpp>
#include <mcp/ServerLog.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <format>
#include <mutex>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace mcphub
{

auto findExecutableOnPath(std::string_view name) -> std::optional<std::string>
{
    auto const* pathEnv = std::getenv("PATH");
    if (!pathEnv)
        return std::nullopt;

    auto const paths = std::string_view(pathEnv);
    auto start = size_t { 0 };
    while (start <= paths.size())
    {
        auto end = paths.find(':', start);
        if (end == std::string_view::npos)
            end = paths.size();

        auto const dir = paths.substr(start, end - start);
        if (!dir.empty())
        {
            auto const candidate = std::filesystem::path(dir) / std::string(name);
            if (::access(candidate.c_str(), X_OK) == 0)
                return candidate.string();
        }
        start = end + 1;
    }
    return std::nullopt;
}

auto resolveCommand(std::string_view command, const std::vector<std::string>& args, const ExecutableLookup& lookup)
    -> ResolvedCommand
{
    auto withPrefix = [&](const std::string& program, std::vector<std::string> prefix) {
        prefix.insert(prefix.end(), args.begin(), args.end());
        return ResolvedCommand { .program = program, .args = std::move(prefix) };
    };

    if (command == "npx")
    {
        if (auto bun = lookup("bun"))
            return withPrefix(*bun, { "x" });
    }
    else if (command == "node" || command == "npm")
    {
        if (auto bun = lookup("bun"))
            return withPrefix(*bun, {});
    }
    else if (command == "pip" || command == "pip3")
    {
        if (auto uv = lookup("uv"))
            return withPrefix(*uv, { "pip" });
    }
    else if (command == "uvx")
    {
        if (auto uv = lookup("uv"))
            return withPrefix(*uv, { "tool", "run" });
    }
    else if (command == "python" || command == "python3")
    {
        if (auto uv = lookup("uv"))
            return withPrefix(*uv, { "run", "python" });
    }

    return ResolvedCommand { .program = std::string(command), .args = args };
}

namespace
{
    void setCloseOnExec(int fd)
    {
        ::fcntl(fd, F_SETFD, ::fcntl(fd, F_GETFD) | FD_CLOEXEC);
    }

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    /// Reads fd line by line until EOF or until stop is set.
    template <typename LineHandler>
    void readLines(int fd, const std::atomic<bool>& stop, LineHandler&& onLine)
    {
        auto buffer = std::string {};
        auto chunk = std::array<char, 4096> {};

        while (!stop.load())
        {
            auto pfd = pollfd { .fd = fd, .events = POLLIN, .revents = 0 };
            auto const ready = ::poll(&pfd, 1, 100);
            if (ready < 0)
            {
                if (errno == EINTR)
                    continue;
                break;
            }
            if (ready == 0)
                continue;

            auto const bytesRead = ::read(fd, chunk.data(), chunk.size());
            if (bytesRead < 0 && errno == EINTR)
                continue;
            if (bytesRead <= 0)
                break;

            buffer.append(chunk.data(), static_cast<size_t>(bytesRead));
            auto newlinePos = buffer.find('\n');
            while (newlinePos != std::string::npos)
            {
                auto line = buffer.substr(0, newlinePos);
                buffer.erase(0, newlinePos + 1);
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();
                if (!line.empty())
                    onLine(line);
                newlinePos = buffer.find('\n');
            }
        }

        if (!buffer.empty())
            onLine(buffer);
    }

    std::once_flag ignoreSigpipeFlag;
} // namespace

struct StdioProcess::Impl
{
    StdioProcessConfig config;
    std::shared_ptr<ServerLog> serverLog;

    std::atomic<pid_t> childPid = -1; ///< Read by health checks while terminate() resets it.
    int stdinWrite = -1;
    int stdoutRead = -1;
    int stderrRead = -1;

    std::mutex writeMutex;
    std::atomic<bool> stopping = false;
    std::atomic<bool> stdoutOpen = false;
    std::atomic<bool> reaped = true;

    PendingRequests pending;
    NotificationHub hub;

    std::thread stdoutReader;
    std::thread stderrReader;

    void logExec(std::string_view level, std::string_view message) const
    {
        if (serverLog)
            serverLog->exec(level, message);
    }

    void routeLine(const std::string& line)
    {
        if (serverLog)
            serverLog->stdoutData(line);

        auto message = json::parse(line);
        if (!message)
        {
            log::debug("Skipping non-JSON output from {}: {}", config.command, line);
            return;
        }

        if (message->is_object() && message->contains("id") && !(*message)["id"].is_null())
        {
            if (!pending.resolve(*message) && jsonrpc::classify(*message) == jsonrpc::MessageKind::Request)
                log::debug("Ignoring server-initiated request {}", json::getStringOr(*message, "method", ""));
        }
        else if (jsonrpc::classify(*message) == jsonrpc::MessageKind::Notification)
        {
            hub.publish(*message);
        }
    }

    auto writeLine(const nlohmann::json& message) -> VoidResult
    {
        auto const text = message.dump();
        auto const data = text + "\n";

        auto lock = std::lock_guard { writeMutex };
        if (stdinWrite < 0)
            return makeError(ErrorCode::TransportError, "Process stdin is closed");

        if (serverLog)
            serverLog->stdinData(text);

        auto remaining = std::string_view(data);
        while (!remaining.empty())
        {
            auto const written = ::write(stdinWrite, remaining.data(), remaining.size());
            if (written < 0)
            {
                if (errno == EINTR)
                    continue;
                return makeError(ErrorCode::TransportError,
                                 std::format("Failed to write to process stdin: {}", std::strerror(errno)));
            }
            remaining.remove_prefix(static_cast<size_t>(written));
        }
        return {};
    }
};

StdioProcess::StdioProcess(StdioProcessConfig config, std::shared_ptr<ServerLog> serverLog):
    _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
    _impl->serverLog = std::move(serverLog);
}

StdioProcess::~StdioProcess()
{
    terminate(std::chrono::seconds(5));
}

auto StdioProcess::spawn() -> VoidResult
{
    if (_impl->childPid > 0)
        return makeError(ErrorCode::TransportError, "Process already spawned");

    std::call_once(ignoreSigpipeFlag, [] { ::signal(SIGPIPE, SIG_IGN); });

    auto const& config = _impl->config;
    auto const resolved = resolveCommand(config.command, config.args);
    _impl->logExec("INFO", std::format("Starting MCP server process: {}", resolved.program));

    int stdinPipe[2];
    int stdoutPipe[2];
    int stderrPipe[2];

    if (pipe(stdinPipe) != 0)
        return makeError(ErrorCode::TransportError, "Failed to create stdin pipe");
    if (pipe(stdoutPipe) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::TransportError, "Failed to create stdout pipe");
    }
    if (pipe(stderrPipe) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        ::close(stdoutPipe[1]);
        return makeError(ErrorCode::TransportError, "Failed to create stderr pipe");
    }

    // Parent ends must not leak into other children spawned later.
    setCloseOnExec(stdinPipe[1]);
    setCloseOnExec(stdoutPipe[0]);
    setCloseOnExec(stderrPipe[0]);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);

    // Build argv
    auto argv = std::vector<char*> {};
    auto program = resolved.program;
    argv.push_back(program.data());
    auto argCopies = resolved.args;
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Build environment (inherit, then config overrides, then the marker)
    auto envMap = std::map<std::string, std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto const entry = std::string_view(*e);
            auto const eq = entry.find('=');
            if (eq != std::string_view::npos)
                envMap[std::string(entry.substr(0, eq))] = std::string(entry.substr(eq + 1));
        }
    }
    for (const auto& [key, value]: config.env)
        envMap[key] = value;
    envMap[std::string(ProcessMarkerVariable)] = "1";

    auto envStrings = std::vector<std::string> {};
    envStrings.reserve(envMap.size());
    for (const auto& [key, value]: envMap)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid;
    auto const status = posix_spawnp(&pid, program.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);
    ::close(stderrPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        ::close(stderrPipe[0]);
        auto message = std::format("Failed to spawn process '{}': {}", program, std::strerror(status));
        _impl->logExec("ERROR", message);
        return makeError(ErrorCode::TransportError, std::move(message));
    }

    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->stderrRead = stderrPipe[0];
    _impl->stopping = false;
    _impl->stdoutOpen = true;
    _impl->reaped = false;

    auto* impl = _impl.get();
    impl->stdoutReader = std::thread([impl] {
        readLines(impl->stdoutRead, impl->stopping, [impl](const std::string& line) { impl->routeLine(line); });
        impl->stdoutOpen = false;
        impl->logExec("INFO", "MCP server stdout closed");
        impl->pending.failAll(Error { ErrorCode::TransportError, "Process stdout closed" });
    });
    impl->stderrReader = std::thread([impl] {
        readLines(impl->stderrRead, impl->stopping, [impl](const std::string& line) {
            if (impl->serverLog)
                impl->serverLog->stderrData(line);
        });
    });

    _impl->logExec("INFO", std::format("MCP server process started (PID: {})", pid));
    log::info("MCP server started: {} (pid {})", program, pid);
    return {};
}

auto StdioProcess::request(const nlohmann::json& message, std::chrono::milliseconds timeout)
    -> Result<jsonrpc::Response>
{
    if (!message.is_object() || !message.contains("id"))
        return makeError(ErrorCode::InvalidArgument, "Request has no id");

    if (!_impl->stdoutOpen)
        return makeError(ErrorCode::TransportError, "Process is not running");

    auto ticket = _impl->pending.add(message["id"]);
    if (!ticket)
        return std::unexpected(ticket.error());

    if (auto written = _impl->writeLine(message); !written)
        return std::unexpected(written.error());

    return ticket->wait(timeout);
}

auto StdioProcess::notify(const nlohmann::json& message) -> VoidResult
{
    return _impl->writeLine(message);
}

auto StdioProcess::notifications() -> NotificationHub&
{
    return _impl->hub;
}

auto StdioProcess::pid() const -> int
{
    return _impl->childPid;
}

auto StdioProcess::isRunning() const -> bool
{
    auto const pid = _impl->childPid.load();
    if (pid <= 0 || _impl->reaped || !_impl->stdoutOpen)
        return false;

    int status;
    auto const rc = ::waitpid(pid, &status, WNOHANG);
    if (rc == pid)
        _impl->reaped = true;
    return rc == 0;
}

void StdioProcess::terminate(std::chrono::milliseconds gracePeriod)
{
    {
        auto lock = std::lock_guard { _impl->writeMutex };
        closeFd(_impl->stdinWrite);
    }

    if (auto const pid = _impl->childPid.load(); pid > 0 && !_impl->reaped)
    {
        _impl->logExec("INFO", std::format("Stopping MCP server process (PID: {})", pid));
        ::kill(pid, SIGTERM);

        int status;
        auto exited = false;
        auto const deadline = std::chrono::steady_clock::now() + gracePeriod;
        while (std::chrono::steady_clock::now() < deadline)
        {
            auto const rc = ::waitpid(pid, &status, WNOHANG);
            if (rc == pid || (rc < 0 && errno == ECHILD))
            {
                exited = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        if (!exited)
        {
            log::warning("MCP server (pid {}) ignored SIGTERM, sending SIGKILL", pid);
            _impl->logExec("WARN", "Process did not exit within grace period, killing");
            ::kill(pid, SIGKILL);
            ::waitpid(pid, &status, 0);
        }
        _impl->reaped = true;
    }

    _impl->stopping = true;
    if (_impl->stdoutReader.joinable())
        _impl->stdoutReader.join();
    if (_impl->stderrReader.joinable())
        _impl->stderrReader.join();

    closeFd(_impl->stdoutRead);
    closeFd(_impl->stderrRead);

    _impl->pending.failAll(Error { ErrorCode::TransportError, "Process terminated" });
    _impl->childPid = -1;
}

} // namespace mcphub
