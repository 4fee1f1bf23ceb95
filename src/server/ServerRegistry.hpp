// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <mcp/Transport.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace mcphub
{

/// @brief A started server as tracked by this process.
struct RegistryEntry
{
    std::string serverId;
    std::shared_ptr<Transport> transport;
    std::optional<int> pid;
    std::optional<uint16_t> port;
    TransportKind kind = TransportKind::Stdio;
};

/// @brief Table of running servers, owned by the ServerManager.
///
/// Readers share the lock; writers hold it exclusively, and only for the
/// map mutation itself. No method ever performs I/O under the lock.
class ServerRegistry
{
  public:
    /// @return false if an entry with this id already exists (the old one is kept).
    [[nodiscard]] auto insert(RegistryEntry entry) -> bool;

    /// @return The removed entry, or nullopt if the id was not registered.
    auto remove(const std::string& serverId) -> std::optional<RegistryEntry>;

    [[nodiscard]] auto find(const std::string& serverId) const -> std::optional<RegistryEntry>;
    [[nodiscard]] auto contains(const std::string& serverId) const -> bool;

    /// @brief Copy of all entries, ordered by server id.
    [[nodiscard]] auto snapshot() const -> std::vector<RegistryEntry>;
    [[nodiscard]] auto runningIds() const -> std::vector<std::string>;

    /// @brief Removes every entry and returns them.
    auto clear() -> std::vector<RegistryEntry>;

    [[nodiscard]] auto size() const -> size_t;

  private:
    std::map<std::string, RegistryEntry> _entries;
    mutable std::shared_mutex _mutex;
};

} // namespace mcphub
