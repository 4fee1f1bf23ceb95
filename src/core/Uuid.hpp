// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>

namespace mcphub::uuid
{

/// @brief Generates a random RFC 4122 version 4 UUID in canonical lowercase form.
[[nodiscard]] auto generate() -> std::string;

/// @brief Returns true if the text is a canonical 8-4-4-4-12 hex UUID.
[[nodiscard]] auto isValid(std::string_view text) -> bool;

} // namespace mcphub::uuid
