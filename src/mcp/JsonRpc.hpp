// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mcphub::jsonrpc
{

/// @brief MCP protocol revision announced during the initialize handshake.
inline constexpr auto ProtocolVersion = std::string_view { "2024-11-05" };

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief Represents a parsed JSON-RPC 2.0 response.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return !error.has_value(); }
};

/// @brief Shape of an incoming message, decided by its fields.
enum class MessageKind
{
    Response,     ///< Has an id and no method.
    Request,      ///< Has an id and a method (server-initiated request).
    Notification, ///< Has a method and no id.
    Invalid,
};

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID (string or integer).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(nlohmann::json id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a successful JSON-RPC 2.0 response message.
[[nodiscard]] auto makeResponse(nlohmann::json id, nlohmann::json result) -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 error response message.
[[nodiscard]] auto makeErrorResponse(nlohmann::json id, const RpcError& error) -> nlohmann::json;

/// @brief Classifies an incoming message by the presence of its id and method fields.
[[nodiscard]] auto classify(const nlohmann::json& message) -> MessageKind;

/// @brief Parses a JSON-RPC 2.0 response.
///
/// A message carrying an id but neither result nor error is accepted as a
/// successful response with no result.
///
/// @param message The JSON message to parse.
/// @return The parsed response or an Error.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

/// @brief Builds the params of the MCP initialize request.
/// @param clientName Client identity announced to the server.
/// @param clientVersion Client version announced to the server.
[[nodiscard]] auto makeInitializeParams(std::string_view clientName, std::string_view clientVersion)
    -> nlohmann::json;

} // namespace mcphub::jsonrpc
