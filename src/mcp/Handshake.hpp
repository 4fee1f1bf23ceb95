// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <string_view>

namespace mcphub
{

/// @brief Runs the MCP initialize exchange over a transport whose channel is up.
///
/// Sends initialize, fails with ProtocolError if the response carries an error,
/// then sends notifications/initialized. A failure to deliver the final
/// notification is logged but does not fail the handshake.
///
/// @return The server's initialize result (capabilities, serverInfo).
[[nodiscard]] auto performHandshake(Transport& transport,
                                    std::string_view clientName,
                                    std::string_view clientVersion) -> Result<nlohmann::json>;

} // namespace mcphub
