// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief One dispatched server-sent event.
struct SseEvent
{
    std::string event = "message";
    std::string data;
    std::string id;
};

/// @brief Incremental text/event-stream decoder.
///
/// Chunks may split lines and events at any byte; complete events are
/// returned as soon as their terminating blank line has been seen.
class SseParser
{
  public:
    [[nodiscard]] auto feed(std::string_view chunk) -> std::vector<SseEvent>;

    /// @brief Drops any partial line or event (used on reconnect).
    void reset();

  private:
    void processLine(std::string_view line, std::vector<SseEvent>& out);

    std::string _buffer;
    SseEvent _current;
    bool _hasData = false;
};

} // namespace mcphub
