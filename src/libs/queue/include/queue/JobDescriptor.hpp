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

#include <string>
#include <string_view>
#include <vector>

#include "core/UUID.hpp"

namespace hlsforge::queue
{
    // Unit of work: transcode the listed profiles of a job
    struct JobDescriptor
    {
        core::UUID jobId;
        core::UUID videoId;
        std::vector<unsigned> profiles; // target heights
    };

    // {"job_id": string, "video_id": string, "profiles": [int, ...]}
    std::string toJson(const JobDescriptor& descriptor);

    // Throws DescriptorParseException
    JobDescriptor parseJobDescriptor(std::string_view payload);
} // namespace hlsforge::queue
