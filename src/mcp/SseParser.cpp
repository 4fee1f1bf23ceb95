// SPDX-License-Identifier: Apache-2.0
#include "SseParser.hpp"

namespace mcphub
{

auto SseParser::feed(std::string_view chunk) -> std::vector<SseEvent>
{
    auto events = std::vector<SseEvent> {};
    _buffer.append(chunk);

    auto start = size_t { 0 };
    while (true)
    {
        auto const newline = _buffer.find('\n', start);
        if (newline == std::string::npos)
            break;

        auto line = std::string_view(_buffer).substr(start, newline - start);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);

        processLine(line, events);
        start = newline + 1;
    }
    _buffer.erase(0, start);
    return events;
}

void SseParser::reset()
{
    _buffer.clear();
    _current = SseEvent {};
    _hasData = false;
}

void SseParser::processLine(std::string_view line, std::vector<SseEvent>& out)
{
    if (line.empty())
    {
        if (_hasData)
        {
            if (!_current.data.empty() && _current.data.back() == '\n')
                _current.data.pop_back();
            out.push_back(std::move(_current));
        }
        _current = SseEvent {};
        _hasData = false;
        return;
    }

    if (line.front() == ':')
        return; // comment / keep-alive

    auto field = line;
    auto value = std::string_view {};
    if (auto const colon = line.find(':'); colon != std::string_view::npos)
    {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ')
            value.remove_prefix(1);
    }

    if (field == "data")
    {
        _current.data.append(value);
        _current.data.push_back('\n');
        _hasData = true;
    }
    else if (field == "event")
        _current.event = std::string(value);
    else if (field == "id")
        _current.id = std::string(value);
}

} // namespace mcphub
