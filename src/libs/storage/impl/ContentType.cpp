/*
 * Copyright (C) 2026 The hlsforge authors
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

#include "storage/ContentType.hpp"

#include <filesystem>
#include <string>
#include <unordered_map>

#include "core/String.hpp"

namespace hlsforge::storage
{
    std::string_view getContentType(std::string_view key)
    {
        static const std::unordered_map<std::string, std::string_view> entries{
            { ".m3u8", "application/vnd.apple.mpegurl" },
            { ".ts", "video/MP2T" },
            { ".mp4", "video/mp4" },
        };

        const std::filesystem::path extension{ std::filesystem::path{ key }.extension() };
        auto it{ entries.find(core::stringUtils::stringToLower(extension.c_str())) };
        if (it == std::cend(entries))
            return "application/octet-stream";

        return it->second;
    }
} // namespace hlsforge::storage
