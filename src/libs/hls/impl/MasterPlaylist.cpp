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

#include "hls/MasterPlaylist.hpp"

#include <algorithm>
#include <sstream>
#include <tuple>
#include <vector>

namespace hlsforge::hls
{
    std::string buildMasterPlaylist(std::span<const Variant> variants)
    {
        std::vector<Variant> sortedVariants(std::cbegin(variants), std::cend(variants));
        std::sort(std::begin(sortedVariants), std::end(sortedVariants), [](const Variant& lhs, const Variant& rhs) {
            return std::tie(lhs.height, lhs.width, lhs.bandwidth, lhs.uri) < std::tie(rhs.height, rhs.width, rhs.bandwidth, rhs.uri);
        });

        std::ostringstream oss;
        oss << "#EXTM3U\n";
        oss << "#EXT-X-VERSION:3\n";
        for (const Variant& variant : sortedVariants)
        {
            oss << "#EXT-X-STREAM-INF:BANDWIDTH=" << variant.bandwidth << ",RESOLUTION=" << variant.width << "x" << variant.height << "\n";
            oss << variant.uri << "\n";
        }

        return oss.str();
    }

    std::string getVariantUri(unsigned height)
    {
        return std::to_string(height) + "/index.m3u8";
    }
} // namespace hlsforge::hls
