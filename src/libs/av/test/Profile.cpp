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

#include <gtest/gtest.h>

#include "av/Exception.hpp"
#include "av/Profile.hpp"

namespace hlsforge::av::tests
{
    TEST(Profile, supportedProfiles)
    {
        const auto profiles{ getSupportedProfiles() };
        ASSERT_EQ(profiles.size(), 5);
        EXPECT_EQ(profiles.front().height, 240);
        EXPECT_EQ(profiles.back().height, 1080);

        for (std::size_t i{ 1 }; i < profiles.size(); ++i)
            EXPECT_LT(profiles[i - 1].height, profiles[i].height);
    }

    TEST(Profile, findProfile)
    {
        const std::optional<Profile> profile{ findProfile(720) };
        ASSERT_TRUE(profile);
        EXPECT_EQ(profile->videoBitrate, 1500);
        EXPECT_EQ(profile->audioBitrate, 128);

        EXPECT_FALSE(findProfile(0));
        EXPECT_FALSE(findProfile(144));
        EXPECT_FALSE(findProfile(2160));
    }

    TEST(Profile, bandwidth)
    {
        EXPECT_EQ(getBandwidth(*findProfile(240)), 496'000);
        EXPECT_EQ(getBandwidth(*findProfile(480)), 896'000);
        EXPECT_EQ(getBandwidth(*findProfile(1080)), 3'128'000);
    }

    TEST(Profile, outputWidth)
    {
        EXPECT_EQ(computeOutputWidth(1920, 1080, 720), 1280);
        EXPECT_EQ(computeOutputWidth(1920, 1080, 480), 852); // 853.33
        EXPECT_EQ(computeOutputWidth(1920, 1080, 240), 426);
        EXPECT_EQ(computeOutputWidth(640, 480, 240), 320);
        EXPECT_EQ(computeOutputWidth(1080, 1920, 240), 134); // 135 forced down
        EXPECT_EQ(computeOutputWidth(1, 1080, 240), 2);
    }

    TEST(Profile, outputWidthIsEvenAndKeepsAspectRatio)
    {
        for (unsigned sourceWidth{ 100 }; sourceWidth < 2000; sourceWidth += 37)
        {
            for (const Profile& profile : getSupportedProfiles())
            {
                const unsigned sourceHeight{ 1080 };
                const unsigned width{ computeOutputWidth(sourceWidth, sourceHeight, profile.height) };
                EXPECT_EQ(width % 2, 0);

                const double exactWidth{ static_cast<double>(sourceWidth) * profile.height / sourceHeight };
                EXPECT_LE(std::abs(width - exactWidth), 2.0);
            }
        }
    }

    TEST(Profile, outputWidthInvalidSource)
    {
        EXPECT_THROW(computeOutputWidth(0, 1080, 240), Exception);
        EXPECT_THROW(computeOutputWidth(1920, 0, 240), Exception);
    }
} // namespace hlsforge::av::tests
