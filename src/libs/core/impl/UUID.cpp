/*
 * Copyright (C) 2020 Emeric Poupon
 *
 * This file is part of hlsforge.
 *
 * hlsforge is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * hlsforge is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with hlsforge.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "core/UUID.hpp"

#include <array>
#include <cassert>
#include <cstdint>
#include <regex>

#include "core/Random.hpp"

namespace hlsforge::core
{
    namespace stringUtils
    {
        template<>
        std::optional<UUID> readAs(std::string_view str)
        {
            return UUID::fromString(str);
        }
    } // namespace stringUtils

    namespace
    {
        bool stringIsUUID(std::string_view str)
        {
            static const std::regex re{ R"([0-9a-fA-F]{8}\-[0-9a-fA-F]{4}\-[0-9a-fA-F]{4}\-[0-9a-fA-F]{4}\-[0-9a-fA-F]{12})" };

            return std::regex_match(std::cbegin(str), std::cend(str), re);
        }
    } // namespace

    UUID::UUID(std::string_view str)
        : _value{ stringUtils::stringToLower(str) }
    {
    }

    std::optional<UUID> UUID::fromString(std::string_view str)
    {
        if (!stringIsUUID(str))
            return std::nullopt;

        return UUID{ str };
    }

    UUID UUID::generate()
    {
        // Form is "123e4567-e89b-42d3-a456-426614174000"
        std::array<unsigned char, 16> bytes;
        for (unsigned char& byte : bytes)
            byte = random::getRandom<std::uint8_t>(0, 255);

        bytes[6] = (bytes[6] & 0x0F) | 0x40; // version 4
        bytes[8] = (bytes[8] & 0x3F) | 0x80; // RFC 4122 variant

        const std::string hex{ stringUtils::bufferToString(bytes) };

        std::string str;
        str.reserve(36);
        str.append(hex, 0, 8).append("-").append(hex, 8, 4).append("-").append(hex, 12, 4).append("-").append(hex, 16, 4).append("-").append(hex, 20, 12);

        assert(stringIsUUID(str));
        return UUID{ str };
    }
} // namespace hlsforge::core
