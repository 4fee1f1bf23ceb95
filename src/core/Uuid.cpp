// SPDX-License-Identifier: Apache-2.0
#include "Uuid.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <format>
#include <random>

namespace mcphub::uuid
{

auto generate() -> std::string
{
    static thread_local auto rng = std::mt19937_64 { std::random_device {}() };

    auto bytes = std::array<uint8_t, 16> {};
    for (auto& b: bytes)
        b = static_cast<uint8_t>(rng());

    // RFC 4122 variant, version 4
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    auto out = std::string {};
    out.reserve(36);
    for (auto i = size_t { 0 }; i < bytes.size(); ++i)
    {
        if (i == 4 || i == 6 || i == 8 || i == 10)
            out += '-';
        out += std::format("{:02x}", bytes[i]);
    }
    return out;
}

auto isValid(std::string_view text) -> bool
{
    if (text.size() != 36)
        return false;

    for (auto i = size_t { 0 }; i < text.size(); ++i)
    {
        if (i == 8 || i == 13 || i == 18 || i == 23)
        {
            if (text[i] != '-')
                return false;
        }
        else if (!std::isxdigit(static_cast<unsigned char>(text[i])))
            return false;
    }
    return true;
}

} // namespace mcphub::uuid
