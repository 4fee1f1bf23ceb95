// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace mcphub
{

/// @brief Fans out server-initiated notifications to any number of subscribers.
///
/// Handlers run on the publishing thread (a transport reader) and must not block.
class NotificationHub
{
  public:
    using Handler = std::function<void(const nlohmann::json&)>;

    /// @brief Subscription handle; unsubscribes when destroyed.
    class Subscription
    {
      public:
        Subscription() = default;
        ~Subscription();

        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;
        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        /// @brief Detaches the handler now.
        void reset();

        [[nodiscard]] auto isActive() const -> bool { return _id != 0 && !_state.expired(); }

      private:
        friend class NotificationHub;
        struct State;

        Subscription(std::weak_ptr<State> state, uint64_t id): _state(std::move(state)), _id(id) {}

        std::weak_ptr<State> _state;
        uint64_t _id = 0;
    };

    NotificationHub();

    [[nodiscard]] auto subscribe(Handler handler) -> Subscription;

    /// @brief Delivers a notification to every current subscriber.
    void publish(const nlohmann::json& notification);

    [[nodiscard]] auto subscriberCount() const -> size_t;

  private:
    std::shared_ptr<Subscription::State> _state;
};

} // namespace mcphub
