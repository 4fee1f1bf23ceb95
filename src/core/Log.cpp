// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <core/Clock.hpp>

#include <atomic>
#include <mutex>
#include <print>
#include <utility>

namespace mcphub::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalSink = Sink {};
    auto globalMutex = std::mutex {};
} // namespace

auto levelName(Level level) -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "ERROR";
        case Level::Warning: return "WARN ";
        case Level::Info: return "INFO ";
        case Level::Debug: return "DEBUG";
        case Level::Trace: return "TRACE";
    }
    return "?????";
}

auto levelFromString(std::string_view name) -> std::optional<Level>
{
    if (name == "error")
        return Level::Error;
    if (name == "warn" || name == "warning")
        return Level::Warning;
    if (name == "info")
        return Level::Info;
    if (name == "debug")
        return Level::Debug;
    if (name == "trace")
        return Level::Trace;
    return std::nullopt;
}

auto setSink(Sink sink) -> Sink
{
    auto const lock = std::lock_guard { globalMutex };
    std::swap(globalSink, sink);
    return sink;
}

void setLevel(Level level)
{
    globalLevel = level;
}

auto getLevel() -> Level
{
    return globalLevel;
}

void write(Level level, std::string_view message)
{
    if (!isEnabled(level))
        return;

    auto const lock = std::lock_guard { globalMutex };

    if (globalSink)
    {
        globalSink(level, message);
        return;
    }

    std::println(stderr, "{} [{}] {}", clock::formatTimestamp(clock::now()), levelName(level), message);
}

} // namespace mcphub::log
