// SPDX-License-Identifier: Apache-2.0
#include "ServerRegistry.hpp"

#include <mutex>

namespace mcphub
{

auto ServerRegistry::insert(RegistryEntry entry) -> bool
{
    auto lock = std::unique_lock { _mutex };
    auto const id = entry.serverId;
    return _entries.try_emplace(id, std::move(entry)).second;
}

auto ServerRegistry::remove(const std::string& serverId) -> std::optional<RegistryEntry>
{
    auto lock = std::unique_lock { _mutex };
    auto node = _entries.extract(serverId);
    if (node.empty())
        return std::nullopt;
    return std::move(node.mapped());
}

auto ServerRegistry::find(const std::string& serverId) const -> std::optional<RegistryEntry>
{
    auto lock = std::shared_lock { _mutex };
    auto it = _entries.find(serverId);
    if (it == _entries.end())
        return std::nullopt;
    return it->second;
}

auto ServerRegistry::contains(const std::string& serverId) const -> bool
{
    auto lock = std::shared_lock { _mutex };
    return _entries.contains(serverId);
}

auto ServerRegistry::snapshot() const -> std::vector<RegistryEntry>
{
    auto lock = std::shared_lock { _mutex };
    auto entries = std::vector<RegistryEntry> {};
    entries.reserve(_entries.size());
    for (const auto& [_, entry]: _entries)
        entries.push_back(entry);
    return entries;
}

auto ServerRegistry::runningIds() const -> std::vector<std::string>
{
    auto lock = std::shared_lock { _mutex };
    auto ids = std::vector<std::string> {};
    ids.reserve(_entries.size());
    for (const auto& [id, _]: _entries)
        ids.push_back(id);
    return ids;
}

auto ServerRegistry::clear() -> std::vector<RegistryEntry>
{
    auto removed = std::map<std::string, RegistryEntry> {};
    {
        auto lock = std::unique_lock { _mutex };
        removed.swap(_entries);
    }

    auto entries = std::vector<RegistryEntry> {};
    entries.reserve(removed.size());
    for (auto& [_, entry]: removed)
        entries.push_back(std::move(entry));
    return entries;
}

auto ServerRegistry::size() const -> size_t
{
    auto lock = std::shared_lock { _mutex };
    return _entries.size();
}

} // namespace mcphub
