// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string_view>

namespace mcphub::log
{

/// @brief Verbosity level, ordered from least to most verbose.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Returns the fixed-width tag printed in front of a message ("WARN ", "DEBUG", ...).
[[nodiscard]] auto levelName(Level level) -> std::string_view;

/// @brief Parses a level name as used in the config file ("error", "warn", "info", "debug", "trace").
[[nodiscard]] auto levelFromString(std::string_view name) -> std::optional<Level>;

/// @brief Receives every message that passes the level filter.
///
/// The message is the formatted text without timestamp or level prefix.
using Sink = std::function<void(Level level, std::string_view message)>;

/// @brief Installs a sink replacing stderr output and returns the previous one.
///
/// An empty sink restores stderr output.
auto setSink(Sink sink) -> Sink;

/// @brief Routes log output into a sink for the lifetime of this object.
class ScopedSink
{
  public:
    explicit ScopedSink(Sink sink): _previous { setSink(std::move(sink)) } {}
    ~ScopedSink() { setSink(std::move(_previous)); }

    ScopedSink(const ScopedSink&) = delete;
    ScopedSink& operator=(const ScopedSink&) = delete;

  private:
    Sink _previous;
};

void setLevel(Level level);
[[nodiscard]] auto getLevel() -> Level;

/// @brief Tests whether messages of the given level are currently emitted.
[[nodiscard]] inline auto isEnabled(Level level) -> bool
{
    return level <= getLevel();
}

/// @brief Emits an already formatted message.
///
/// Without a sink the line goes to stderr as "<ISO timestamp> [LEVEL] message".
/// Thread-safe; concurrent messages are never interleaved.
void write(Level level, std::string_view message);

/// @brief Formats and emits a message, skipping the formatting when the level is filtered out.
template <typename... Args>
void message(Level level, std::format_string<Args...> fmt, Args&&... args)
{
    if (isEnabled(level))
        write(level, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    message(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    message(Level::Warning, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    message(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    message(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    message(Level::Trace, fmt, std::forward<Args>(args)...);
}

} // namespace mcphub::log
