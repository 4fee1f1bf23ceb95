// SPDX-License-Identifier: Apache-2.0
#include "ProcessProbe.hpp"

#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <cstdio>
#include <format>
#include <fstream>
#include <iterator>
#include <memory>

#include <signal.h>

namespace mcphub
{

SystemProcessProbe::SystemProcessProbe(std::string markerVariable): _marker(std::move(markerVariable))
{
}

auto SystemProcessProbe::isAlive(int pid) const -> bool
{
    if (pid <= 0)
        return false;

    if (::kill(pid, 0) == 0)
        return true;

    // The process exists but belongs to someone else.
    return errno == EPERM;
}

auto SystemProcessProbe::hasMarker(int pid) const -> bool
{
    if (auto block = readProcEnviron(pid))
        return environContainsMarker(*block, _marker);

    // No /proc (macOS, BSD): the ps dump separates entries with spaces.
    if (auto dump = readPsEnviron(pid))
        return psDumpContainsMarker(*dump, _marker);

    log::debug("Cannot inspect environment of pid {}", pid);
    return false;
}

auto SystemProcessProbe::environContainsMarker(std::string_view environBlock, std::string_view marker) -> bool
{
    auto const wanted = std::format("{}=1", marker);
    auto start = size_t { 0 };
    while (start < environBlock.size())
    {
        auto end = environBlock.find('\0', start);
        if (end == std::string_view::npos)
            end = environBlock.size();
        if (environBlock.substr(start, end - start) == wanted)
            return true;
        start = end + 1;
    }
    return false;
}

auto SystemProcessProbe::psDumpContainsMarker(std::string_view psDump, std::string_view marker) -> bool
{
    auto const wanted = std::format("{}=1", marker);
    auto const isSpace = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };

    auto pos = size_t { 0 };
    while (pos < psDump.size())
    {
        while (pos < psDump.size() && isSpace(psDump[pos]))
            ++pos;
        auto end = pos;
        while (end < psDump.size() && !isSpace(psDump[end]))
            ++end;
        if (psDump.substr(pos, end - pos) == wanted)
            return true;
        pos = end;
    }
    return false;
}

auto SystemProcessProbe::readProcEnviron(int pid) -> std::optional<std::string>
{
    auto file = std::ifstream(std::format("/proc/{}/environ", pid), std::ios::binary);
    if (!file)
        return std::nullopt;

    auto content = std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad())
        return std::nullopt;
    return content;
}

auto SystemProcessProbe::readPsEnviron(int pid) -> std::optional<std::string>
{
    auto const command = std::format("ps eww -p {} 2>/dev/null", pid);
    auto pipe = std::unique_ptr<FILE, decltype(&::pclose)>(::popen(command.c_str(), "r"), &::pclose);
    if (!pipe)
        return std::nullopt;

    auto output = std::string {};
    auto buffer = std::array<char, 4096> {};
    while (auto const n = std::fread(buffer.data(), 1, buffer.size(), pipe.get()))
        output.append(buffer.data(), n);

    if (output.empty())
        return std::nullopt;
    return output;
}

} // namespace mcphub
