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

#include <compare>
#include <span>
#include <string>

namespace hlsforge::hls
{
    struct Variant
    {
        std::string uri; // relative to the master playlist
        unsigned width{};
        unsigned height{};
        unsigned bandwidth{}; // bits per second

        auto operator<=>(const Variant&) const = default;
    };

    // Variants are sorted by resolution (height, then width), then by bandwidth and uri
    // so that the output does not depend on the input order
    std::string buildMasterPlaylist(std::span<const Variant> variants);

    // Uri of a variant playlist, relative to the master playlist
    std::string getVariantUri(unsigned height);
} // namespace hlsforge::hls
