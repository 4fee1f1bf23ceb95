// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/JsonRpc.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <future>
#include <map>
#include <mutex>
#include <string>

namespace mcphub
{

/// @brief Correlation table of in-flight requests, keyed by request id.
///
/// A caller registers an id before the request goes out, then waits on the
/// returned ticket. The ticket removes its entry when destroyed, so the table
/// is cleaned on success, timeout and early return alike. A response arriving
/// after its ticket is gone finds no entry and is dropped.
class PendingRequests
{
  public:
    class Ticket
    {
      public:
        ~Ticket();

        Ticket(Ticket&& other) noexcept;
        Ticket& operator=(Ticket&&) = delete;
        Ticket(const Ticket&) = delete;
        Ticket& operator=(const Ticket&) = delete;

        /// @brief Blocks until the response arrives, the table is failed, or the timeout elapses.
        [[nodiscard]] auto wait(std::chrono::milliseconds timeout) -> Result<jsonrpc::Response>;

        [[nodiscard]] auto key() const noexcept -> const std::string& { return _key; }

      private:
        friend class PendingRequests;
        Ticket(PendingRequests* owner, std::string key, std::future<Result<jsonrpc::Response>> future);

        PendingRequests* _owner;
        std::string _key;
        std::future<Result<jsonrpc::Response>> _future;
    };

    /// @brief Registers a request id. Fails if the id is already in flight.
    [[nodiscard]] auto add(const nlohmann::json& id) -> Result<Ticket>;

    /// @brief Completes the entry matching the message's id.
    /// @return false if no entry is waiting for that id.
    auto resolve(const nlohmann::json& message) -> bool;

    /// @brief Fails every waiting entry with the given error (transport closed).
    void failAll(const Error& error);

    [[nodiscard]] auto size() const -> size_t;

  private:
    void remove(const std::string& key);

    mutable std::mutex _mutex;
    std::map<std::string, std::promise<Result<jsonrpc::Response>>> _entries;
};

} // namespace mcphub
