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

#include "av/Profile.hpp"

#include <algorithm>
#include <array>
#include <cmath>

#include "av/Exception.hpp"

namespace hlsforge::av
{
    namespace
    {
        constexpr std::array<Profile, 5> supportedProfiles{ {
            { 240, 400, 96 },
            { 360, 600, 96 },
            { 480, 800, 96 },
            { 720, 1500, 128 },
            { 1080, 3000, 128 },
        } };
    } // namespace

    std::span<const Profile> getSupportedProfiles()
    {
        return supportedProfiles;
    }

    std::optional<Profile> findProfile(unsigned height)
    {
        auto it{ std::find_if(std::cbegin(supportedProfiles), std::cend(supportedProfiles), [=](const Profile& profile) { return profile.height == height; }) };
        if (it == std::cend(supportedProfiles))
            return std::nullopt;

        return *it;
    }

    unsigned getBandwidth(const Profile& profile)
    {
        return (profile.videoBitrate + profile.audioBitrate) * 1000;
    }

    unsigned computeOutputWidth(unsigned sourceWidth, unsigned sourceHeight, unsigned height)
    {
        if (sourceWidth == 0 || sourceHeight == 0)
            throw Exception{ "Invalid source dimensions " + std::to_string(sourceWidth) + "x" + std::to_string(sourceHeight) };

        const auto width{ static_cast<unsigned>(std::lround(static_cast<double>(sourceWidth) * height / sourceHeight)) };
        return std::max(2u, width - (width % 2));
    }
} // namespace hlsforge::av
