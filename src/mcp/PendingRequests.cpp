// SPDX-License-Identifier: Apache-2.0
#include "PendingRequests.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>

namespace mcphub
{

PendingRequests::Ticket::Ticket(PendingRequests* owner,
                                std::string key,
                                std::future<Result<jsonrpc::Response>> future):
    _owner(owner), _key(std::move(key)), _future(std::move(future))
{
}

PendingRequests::Ticket::Ticket(Ticket&& other) noexcept:
    _owner(other._owner), _key(std::move(other._key)), _future(std::move(other._future))
{
    other._owner = nullptr;
}

PendingRequests::Ticket::~Ticket()
{
    if (_owner)
        _owner->remove(_key);
}

auto PendingRequests::Ticket::wait(std::chrono::milliseconds timeout) -> Result<jsonrpc::Response>
{
    if (!_future.valid())
        return makeError(ErrorCode::TransportError, std::format("Request {} already consumed", _key));

    if (_future.wait_for(timeout) != std::future_status::ready)
    {
        auto const seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout).count();
        return makeError(ErrorCode::TimeoutError,
                         std::format("Request {} timed out after {}s", _key, seconds));
    }

    return _future.get();
}

auto PendingRequests::add(const nlohmann::json& id) -> Result<Ticket>
{
    auto key = json::idToString(id);
    auto lock = std::lock_guard { _mutex };

    if (_entries.contains(key))
        return makeError(ErrorCode::InvalidArgument, std::format("Request id {} is already in flight", key));

    auto& promise = _entries[key];
    return Ticket { this, std::move(key), promise.get_future() };
}

auto PendingRequests::resolve(const nlohmann::json& message) -> bool
{
    if (!message.is_object() || !message.contains("id"))
        return false;

    auto const key = json::idToString(message["id"]);
    auto promise = std::promise<Result<jsonrpc::Response>> {};
    {
        auto lock = std::lock_guard { _mutex };
        auto it = _entries.find(key);
        if (it == _entries.end())
        {
            log::debug("Dropping response for unknown or expired request {}", key);
            return false;
        }
        promise = std::move(it->second);
        _entries.erase(it);
    }

    promise.set_value(jsonrpc::parseResponse(message));
    return true;
}

void PendingRequests::failAll(const Error& error)
{
    auto entries = std::map<std::string, std::promise<Result<jsonrpc::Response>>> {};
    {
        auto lock = std::lock_guard { _mutex };
        entries.swap(_entries);
    }

    for (auto& [key, promise]: entries)
        promise.set_value(std::unexpected(error));
}

auto PendingRequests::size() const -> size_t
{
    auto lock = std::lock_guard { _mutex };
    return _entries.size();
}

void PendingRequests::remove(const std::string& key)
{
    auto lock = std::lock_guard { _mutex };
    _entries.erase(key);
}

} // namespace mcphub
