// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/StdioProcess.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mcphub
{

/// @brief OS-level liveness check for spawned server processes.
///
/// The pid check and the environment read are two separate syscalls, so a pid
/// recycled between them can still be misjudged. Good enough to catch crashes
/// and stale rows; not a guarantee.
class ProcessProbe
{
  public:
    virtual ~ProcessProbe() = default;

    /// @brief True if a process with this pid exists.
    [[nodiscard]] virtual auto isAlive(int pid) const -> bool = 0;

    /// @brief True if the process environment carries the marker variable.
    [[nodiscard]] virtual auto hasMarker(int pid) const -> bool = 0;

    /// @brief Alive and spawned by us.
    [[nodiscard]] auto isOurs(int pid) const -> bool { return pid > 0 && isAlive(pid) && hasMarker(pid); }
};

class SystemProcessProbe final: public ProcessProbe
{
  public:
    explicit SystemProcessProbe(std::string markerVariable = std::string(ProcessMarkerVariable));

    [[nodiscard]] auto isAlive(int pid) const -> bool override;
    [[nodiscard]] auto hasMarker(int pid) const -> bool override;

    /// @brief Searches a NUL-separated environment block for NAME=1.
    [[nodiscard]] static auto environContainsMarker(std::string_view environBlock, std::string_view marker) -> bool;

    /// @brief Searches `ps eww` output, where entries are separated by whitespace, for NAME=1.
    [[nodiscard]] static auto psDumpContainsMarker(std::string_view psDump, std::string_view marker) -> bool;

  private:
    [[nodiscard]] static auto readProcEnviron(int pid) -> std::optional<std::string>;
    [[nodiscard]] static auto readPsEnviron(int pid) -> std::optional<std::string>;

    std::string _marker;
};

} // namespace mcphub
