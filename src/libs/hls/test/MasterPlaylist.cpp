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

#include <algorithm>
#include <vector>

#include <gtest/gtest.h>

#include "hls/MasterPlaylist.hpp"

namespace hlsforge::hls::tests
{
    TEST(MasterPlaylist, empty)
    {
        EXPECT_EQ(buildMasterPlaylist({}), "#EXTM3U\n#EXT-X-VERSION:3\n");
    }

    TEST(MasterPlaylist, layout)
    {
        const std::vector<Variant> variants{
            { getVariantUri(720), 1280, 720, 1628000 },
            { getVariantUri(240), 426, 240, 496000 },
        };

        EXPECT_EQ(buildMasterPlaylist(variants),
            "#EXTM3U\n"
            "#EXT-X-VERSION:3\n"
            "#EXT-X-STREAM-INF:BANDWIDTH=496000,RESOLUTION=426x240\n"
            "240/index.m3u8\n"
            "#EXT-X-STREAM-INF:BANDWIDTH=1628000,RESOLUTION=1280x720\n"
            "720/index.m3u8\n");
    }

    TEST(MasterPlaylist, orderIndependent)
    {
        std::vector<Variant> variants{
            { "480/index.m3u8", 854, 480, 896000 },
            { "240/index.m3u8", 426, 240, 496000 },
            { "1080/index.m3u8", 1920, 1080, 3128000 },
            { "720/index.m3u8", 1280, 720, 1628000 },
            { "360/index.m3u8", 640, 360, 696000 },
        };

        std::sort(std::begin(variants), std::end(variants));
        const std::string reference{ buildMasterPlaylist(variants) };

        while (std::next_permutation(std::begin(variants), std::end(variants)))
            ASSERT_EQ(buildMasterPlaylist(variants), reference);
    }

    TEST(MasterPlaylist, tieBreaks)
    {
        const std::vector<Variant> variants{
            { "b.m3u8", 640, 360, 700000 },
            { "a.m3u8", 640, 360, 700000 },
            { "c.m3u8", 640, 360, 600000 },
            { "d.m3u8", 480, 360, 900000 },
        };

        EXPECT_EQ(buildMasterPlaylist(variants),
            "#EXTM3U\n"
            "#EXT-X-VERSION:3\n"
            "#EXT-X-STREAM-INF:BANDWIDTH=900000,RESOLUTION=480x360\n"
            "d.m3u8\n"
            "#EXT-X-STREAM-INF:BANDWIDTH=600000,RESOLUTION=640x360\n"
            "c.m3u8\n"
            "#EXT-X-STREAM-INF:BANDWIDTH=700000,RESOLUTION=640x360\n"
            "a.m3u8\n"
            "#EXT-X-STREAM-INF:BANDWIDTH=700000,RESOLUTION=640x360\n"
            "b.m3u8\n");
    }

    TEST(MasterPlaylist, idempotent)
    {
        const std::vector<Variant> variants{ { "480/index.m3u8", 854, 480, 896000 } };
        EXPECT_EQ(buildMasterPlaylist(variants), buildMasterPlaylist(variants));
    }
} // namespace hlsforge::hls::tests
