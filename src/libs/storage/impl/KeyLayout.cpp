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

#include "storage/KeyLayout.hpp"

namespace hlsforge::storage::keys
{
    std::string getSourceKey(const core::UUID& videoId)
    {
        return "source/" + std::string{ videoId.getAsString() } + ".mp4";
    }

    std::string getVariantPrefix(const core::UUID& videoId, unsigned height)
    {
        return "HLS/" + std::string{ videoId.getAsString() } + "/" + std::to_string(height) + "/";
    }

    std::string getVariantPlaylistKey(const core::UUID& videoId, unsigned height)
    {
        return getSegmentKey(videoId, height, "index.m3u8");
    }

    std::string getSegmentKey(const core::UUID& videoId, unsigned height, std::string_view fileName)
    {
        return getVariantPrefix(videoId, height) + std::string{ fileName };
    }

    std::string getMasterPlaylistKey(const core::UUID& videoId)
    {
        return "HLS/" + std::string{ videoId.getAsString() } + "/index.m3u8";
    }
} // namespace hlsforge::storage::keys
