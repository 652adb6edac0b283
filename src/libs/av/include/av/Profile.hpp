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

#include <optional>
#include <span>

namespace hlsforge::av
{
    // Encoding parameters of a rendition, bitrates in kbps
    struct Profile
    {
        unsigned height{};
        unsigned videoBitrate{};
        unsigned audioBitrate{};
    };

    // Ordered by height
    std::span<const Profile> getSupportedProfiles();
    std::optional<Profile> findProfile(unsigned height);

    // Advertised bandwidth of the variant, in bits per second
    unsigned getBandwidth(const Profile& profile);

    // Keeps the source aspect ratio, forced down to an even value (min 2)
    unsigned computeOutputWidth(unsigned sourceWidth, unsigned sourceHeight, unsigned height);
} // namespace hlsforge::av
