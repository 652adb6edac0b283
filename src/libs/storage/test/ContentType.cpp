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

#include "core/UUID.hpp"
#include "storage/ContentType.hpp"
#include "storage/KeyLayout.hpp"

namespace hlsforge::storage::tests
{
    TEST(ContentType, byExtension)
    {
        EXPECT_EQ(getContentType("HLS/abc/index.m3u8"), "application/vnd.apple.mpegurl");
        EXPECT_EQ(getContentType("HLS/abc/240/seg_0.ts"), "video/MP2T");
        EXPECT_EQ(getContentType("source/abc.mp4"), "video/mp4");
        EXPECT_EQ(getContentType("HLS/abc/INDEX.M3U8"), "application/vnd.apple.mpegurl");
        EXPECT_EQ(getContentType("foo.bin"), "application/octet-stream");
        EXPECT_EQ(getContentType("foo"), "application/octet-stream");
        EXPECT_EQ(getContentType(""), "application/octet-stream");
    }

    TEST(KeyLayout, keys)
    {
        const core::UUID videoId{ core::UUID::fromString("3f6b5a1e-2c4d-4e8f-9a0b-1c2d3e4f5a6b").value() };

        EXPECT_EQ(keys::getSourceKey(videoId), "source/3f6b5a1e-2c4d-4e8f-9a0b-1c2d3e4f5a6b.mp4");
        EXPECT_EQ(keys::getVariantPrefix(videoId, 480), "HLS/3f6b5a1e-2c4d-4e8f-9a0b-1c2d3e4f5a6b/480/");
        EXPECT_EQ(keys::getVariantPlaylistKey(videoId, 480), "HLS/3f6b5a1e-2c4d-4e8f-9a0b-1c2d3e4f5a6b/480/index.m3u8");
        EXPECT_EQ(keys::getSegmentKey(videoId, 720, "seg_12.ts"), "HLS/3f6b5a1e-2c4d-4e8f-9a0b-1c2d3e4f5a6b/720/seg_12.ts");
        EXPECT_EQ(keys::getMasterPlaylistKey(videoId), "HLS/3f6b5a1e-2c4d-4e8f-9a0b-1c2d3e4f5a6b/index.m3u8");
    }
} // namespace hlsforge::storage::tests
