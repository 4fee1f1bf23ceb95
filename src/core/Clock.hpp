// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace mcphub::clock
{

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/// @brief Source of the current time; injectable so expiry logic can be tested.
using NowFunction = std::function<TimePoint()>;

[[nodiscard]] inline auto now() -> TimePoint
{
    return Clock::now();
}

/// @brief Formats as "YYYY-MM-DD HH:MM:SS.mmm" (UTC).
[[nodiscard]] auto formatTimestamp(TimePoint tp) -> std::string;

/// @brief Formats as "YYYY-MM-DD" (UTC).
[[nodiscard]] auto formatDate(TimePoint tp) -> std::string;

/// @brief Parses the output of formatTimestamp().
[[nodiscard]] auto parseTimestamp(std::string_view text) -> std::optional<TimePoint>;

} // namespace mcphub::clock
