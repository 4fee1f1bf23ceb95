// SPDX-License-Identifier: Apache-2.0
#include "Clock.hpp"

#include <format>
#include <sstream>

namespace mcphub::clock
{

auto formatTimestamp(TimePoint tp) -> std::string
{
    return std::format("{:%Y-%m-%d %H:%M:%S}", std::chrono::floor<std::chrono::milliseconds>(tp));
}

auto formatDate(TimePoint tp) -> std::string
{
    return std::format("{:%Y-%m-%d}", std::chrono::floor<std::chrono::days>(tp));
}

auto parseTimestamp(std::string_view text) -> std::optional<TimePoint>
{
    auto stream = std::istringstream { std::string(text) };
    auto tp = std::chrono::sys_time<std::chrono::milliseconds> {};
    stream >> std::chrono::parse("%Y-%m-%d %H:%M:%S", tp);
    if (stream.fail())
        return std::nullopt;
    return std::chrono::time_point_cast<Clock::duration>(tp);
}

} // namespace mcphub::clock
