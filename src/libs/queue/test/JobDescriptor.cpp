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

#include "queue/Exception.hpp"
#include "queue/JobDescriptor.hpp"

namespace hlsforge::queue::tests
{
    TEST(JobDescriptor, toJsonAndBack)
    {
        const JobDescriptor descriptor{
            .jobId = core::UUID::generate(),
            .videoId = core::UUID::generate(),
            .profiles = { 720, 240, 480 },
        };

        const JobDescriptor parsed{ parseJobDescriptor(toJson(descriptor)) };
        EXPECT_EQ(parsed.jobId, descriptor.jobId);
        EXPECT_EQ(parsed.videoId, descriptor.videoId);
        EXPECT_EQ(parsed.profiles, descriptor.profiles);
    }

    TEST(JobDescriptor, parse)
    {
        const JobDescriptor descriptor{ parseJobDescriptor(R"({"job_id": "9B0F5D8E-1C2A-4B3C-8D4E-5F6A7B8C9D0E", "video_id": "3f6b5a1e-2c4d-4e8f-9a0b-1c2d3e4f5a6b", "profiles": [240, 1080]})") };

        EXPECT_EQ(descriptor.jobId.getAsString(), "9b0f5d8e-1c2a-4b3c-8d4e-5f6a7b8c9d0e");
        EXPECT_EQ(descriptor.videoId.getAsString(), "3f6b5a1e-2c4d-4e8f-9a0b-1c2d3e4f5a6b");
        EXPECT_EQ(descriptor.profiles, (std::vector<unsigned>{ 240, 1080 }));
    }

    TEST(JobDescriptor, emptyProfiles)
    {
        const JobDescriptor descriptor{ parseJobDescriptor(R"({"job_id": "9b0f5d8e-1c2a-4b3c-8d4e-5f6a7b8c9d0e", "video_id": "3f6b5a1e-2c4d-4e8f-9a0b-1c2d3e4f5a6b", "profiles": []})") };
        EXPECT_TRUE(descriptor.profiles.empty());
    }

    TEST(JobDescriptor, malformed)
    {
        EXPECT_THROW(parseJobDescriptor(""), DescriptorParseException);
        EXPECT_THROW(parseJobDescriptor("not json"), DescriptorParseException);
        EXPECT_THROW(parseJobDescriptor("[]"), DescriptorParseException);
        EXPECT_THROW(parseJobDescriptor(R"({"video_id": "3f6b5a1e-2c4d-4e8f-9a0b-1c2d3e4f5a6b", "profiles": [240]})"), DescriptorParseException);
        EXPECT_THROW(parseJobDescriptor(R"({"job_id": 12, "video_id": "3f6b5a1e-2c4d-4e8f-9a0b-1c2d3e4f5a6b", "profiles": [240]})"), DescriptorParseException);
        EXPECT_THROW(parseJobDescriptor(R"({"job_id": "foo", "video_id": "3f6b5a1e-2c4d-4e8f-9a0b-1c2d3e4f5a6b", "profiles": [240]})"), DescriptorParseException);
        EXPECT_THROW(parseJobDescriptor(R"({"job_id": "9b0f5d8e-1c2a-4b3c-8d4e-5f6a7b8c9d0e", "video_id": "3f6b5a1e-2c4d-4e8f-9a0b-1c2d3e4f5a6b"})"), DescriptorParseException);
        EXPECT_THROW(parseJobDescriptor(R"({"job_id": "9b0f5d8e-1c2a-4b3c-8d4e-5f6a7b8c9d0e", "video_id": "3f6b5a1e-2c4d-4e8f-9a0b-1c2d3e4f5a6b", "profiles": 240})"), DescriptorParseException);
        EXPECT_THROW(parseJobDescriptor(R"({"job_id": "9b0f5d8e-1c2a-4b3c-8d4e-5f6a7b8c9d0e", "video_id": "3f6b5a1e-2c4d-4e8f-9a0b-1c2d3e4f5a6b", "profiles": ["240"]})"), DescriptorParseException);
        EXPECT_THROW(parseJobDescriptor(R"({"job_id": "9b0f5d8e-1c2a-4b3c-8d4e-5f6a7b8c9d0e", "video_id": "3f6b5a1e-2c4d-4e8f-9a0b-1c2d3e4f5a6b", "profiles": [-240]})"), DescriptorParseException);
        EXPECT_THROW(parseJobDescriptor(R"({"job_id": "9b0f5d8e-1c2a-4b3c-8d4e-5f6a7b8c9d0e", "video_id": "3f6b5a1e-2c4d-4e8f-9a0b-1c2d3e4f5a6b", "profiles": [240.5]})"), DescriptorParseException);
    }
} // namespace hlsforge::queue::tests
