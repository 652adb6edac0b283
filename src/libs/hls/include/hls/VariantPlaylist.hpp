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

#pragma once

#include <chrono>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace hlsforge::hls
{
    struct Segment
    {
        std::string uri;
        std::chrono::milliseconds duration{};
    };

    struct VariantPlaylist
    {
        std::optional<std::chrono::seconds> targetDuration;
        std::optional<std::string> playlistType; // VOD, EVENT
        bool endList{};
        std::vector<Segment> segments;
    };

    // Throws PlaylistParseException if the stream is not a HLS playlist
    VariantPlaylist parseVariantPlaylist(std::istream& is);
} // namespace hlsforge::hls
