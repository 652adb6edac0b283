/*
 * Copyright (C) 2013 Emeric Poupon
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

#include "core/String.hpp"

#include <algorithm>
#include <iomanip>

#include <Wt/WDateTime.h>

namespace hlsforge::core::stringUtils
{
    template<>
    std::optional<std::string> readAs(std::string_view str)
    {
        return std::string{ str };
    }

    template<>
    std::optional<bool> readAs(std::string_view str)
    {
        const std::string lowerStr{ stringToLower(str) };
        if (lowerStr == "1" || lowerStr == "true")
            return true;
        else if (lowerStr == "0" || lowerStr == "false")
            return false;

        return std::nullopt;
    }

    std::vector<std::string_view> splitString(std::string_view str, char separator)
    {
        std::vector<std::string_view> res;

        std::size_t currentPos{};
        while (true)
        {
            const std::size_t separatorPos{ str.find(separator, currentPos) };
            if (separatorPos == std::string_view::npos)
            {
                res.push_back(str.substr(currentPos));
                break;
            }

            res.push_back(str.substr(currentPos, separatorPos - currentPos));
            currentPos = separatorPos + 1;
        }

        return res;
    }

    std::string joinStrings(std::span<const std::string> strings, std::string_view delimiter)
    {
        std::string res;
        bool first{ true };

        for (const std::string& str : strings)
        {
            if (!first)
                res += delimiter;
            res += str;
            first = false;
        }

        return res;
    }

    std::string_view stringTrim(std::string_view str, std::string_view whitespaces)
    {
        std::string_view res;

        const auto strBegin = str.find_first_not_of(whitespaces);
        if (strBegin != std::string_view::npos)
        {
            const auto strEnd{ str.find_last_not_of(whitespaces) };
            const auto strRange{ strEnd - strBegin + 1 };

            res = str.substr(strBegin, strRange);
        }

        return res;
    }

    std::string stringToLower(std::string_view str)
    {
        std::string res;
        res.reserve(str.size());

        std::transform(std::cbegin(str), std::cend(str), std::back_inserter(res), [](unsigned char c) { return std::tolower(c); });

        return res;
    }

    std::string bufferToString(std::span<const unsigned char> data)
    {
        std::ostringstream oss;

        for (unsigned char c : data)
            oss << std::setw(2) << std::setfill('0') << std::hex << static_cast<int>(c);

        return oss.str();
    }

    std::string uriEncode(std::string_view str, bool encodeSlash)
    {
        constexpr char lut[]{ "0123456789ABCDEF" };

        std::string res;
        res.reserve(str.size());

        for (const char c : str)
        {
            const unsigned char uc{ static_cast<unsigned char>(c) };
            if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~' || (c == '/' && !encodeSlash))
            {
                res.push_back(c);
                continue;
            }

            res.push_back('%');
            res.push_back(lut[(uc >> 4) & 0xF]);
            res.push_back(lut[uc & 0xF]);
        }

        return res;
    }

    bool stringStartsWith(std::string_view str, std::string_view prefix)
    {
        return str.substr(0, prefix.size()) == prefix;
    }

    bool stringEndsWith(std::string_view str, std::string_view ending)
    {
        if (str.length() < ending.length())
            return false;

        return str.substr(str.length() - ending.length()) == ending;
    }

    std::string toISO8601String(const Wt::WDateTime& dateTime)
    {
        if (dateTime.isValid())
        {
            // assume UTC
            return dateTime.toString("yyyy-MM-ddThh:mm:ss.zzz", false).toUTF8() + 'Z';
        }

        return "";
    }

    Wt::WDateTime fromISO8601String(std::string_view dateTime)
    {
        // assume UTC
        if (!dateTime.empty() && dateTime.back() == 'Z')
            dateTime.remove_suffix(1);

        return Wt::WDateTime::fromString(Wt::WString{ std::string{ dateTime } }, "yyyy-MM-ddThh:mm:ss.zzz");
    }
} // namespace hlsforge::core::stringUtils
