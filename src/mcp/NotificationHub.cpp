// SPDX-License-Identifier: Apache-2.0
#include "NotificationHub.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <vector>

namespace mcphub
{

struct NotificationHub::Subscription::State
{
    std::mutex mutex;
    std::map<uint64_t, Handler> handlers;
    uint64_t nextId = 1;
};

NotificationHub::Subscription::~Subscription()
{
    reset();
}

NotificationHub::Subscription::Subscription(Subscription&& other) noexcept:
    _state(std::move(other._state)), _id(other._id)
{
    other._id = 0;
}

NotificationHub::Subscription& NotificationHub::Subscription::operator=(Subscription&& other) noexcept
{
    if (this != &other)
    {
        reset();
        _state = std::move(other._state);
        _id = other._id;
        other._id = 0;
    }
    return *this;
}

void NotificationHub::Subscription::reset()
{
    if (_id == 0)
        return;

    if (auto state = _state.lock())
    {
        auto lock = std::lock_guard { state->mutex };
        state->handlers.erase(_id);
    }
    _state.reset();
    _id = 0;
}

NotificationHub::NotificationHub(): _state(std::make_shared<Subscription::State>())
{
}

auto NotificationHub::subscribe(Handler handler) -> Subscription
{
    auto lock = std::lock_guard { _state->mutex };
    auto const id = _state->nextId++;
    _state->handlers.emplace(id, std::move(handler));
    return Subscription { _state, id };
}

void NotificationHub::publish(const nlohmann::json& notification)
{
    // Snapshot so handlers may subscribe or unsubscribe while being called.
    auto handlers = std::vector<Handler> {};
    {
        auto lock = std::lock_guard { _state->mutex };
        handlers.reserve(_state->handlers.size());
        for (const auto& [id, handler]: _state->handlers)
            handlers.push_back(handler);
    }

    log::trace("Publishing notification {} to {} subscriber(s)",
               json::getStringOr(notification, "method", ""),
               handlers.size());

    for (const auto& handler: handlers)
        handler(notification);
}

auto NotificationHub::subscriberCount() const -> size_t
{
    auto lock = std::lock_guard { _state->mutex };
    return _state->handlers.size();
}

} // namespace mcphub
