// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace mcphub
{

class ServerManager;
class ServerStore;

struct AutoRestartConfig
{
    std::chrono::seconds healthCheckInterval { 30 };
    int maxRestartAttempts = 3;
    std::chrono::seconds restartDelay { 5 };
    bool enabled = true;
};

/// @brief Per-server bookkeeping of the supervisor.
struct ServerHealth
{
    clock::TimePoint lastHealthCheck;
    int consecutiveFailures = 0;
    std::optional<clock::TimePoint> lastRestartAttempt;
};

/// @brief Periodically verifies enabled system servers and restarts the ones that died.
///
/// A server is given up on after as many consecutive failed checks as the
/// smaller of its own and the hub's maxRestartAttempts; one successful check
/// resets its counter.
class AutoRestart
{
  public:
    AutoRestart(std::shared_ptr<ServerManager> manager,
                std::shared_ptr<ServerStore> store,
                AutoRestartConfig config = {},
                clock::NowFunction now = clock::now);
    ~AutoRestart();

    AutoRestart(const AutoRestart&) = delete;
    AutoRestart& operator=(const AutoRestart&) = delete;

    /// @brief Runs one pass over all enabled system servers.
    /// @return Number of restarts attempted.
    auto checkOnce() -> int;

    /// @brief Starts the background thread. A no-op if disabled or already running.
    void start();

    /// @brief Stops and joins the background thread.
    void stop();

    [[nodiscard]] auto health(const std::string& serverId) const -> std::optional<ServerHealth>;

  private:
    void run();
    [[nodiscard]] auto shouldRestart(const ServerDescriptor& descriptor, clock::TimePoint now) -> bool;

    std::shared_ptr<ServerManager> _manager;
    std::shared_ptr<ServerStore> _store;
    AutoRestartConfig _config;
    clock::NowFunction _now;

    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::map<std::string, ServerHealth> _health;
    bool _stopping = false;
    std::thread _thread;
};

} // namespace mcphub
