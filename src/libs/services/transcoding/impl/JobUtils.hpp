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

#include <string_view>

#include "database/objects/Job.hpp"
#include "services/transcoding/ITranscodeService.hpp"

namespace hlsforge::db
{
    class Session;
}

namespace hlsforge::transcoding::utils
{
    // Marks the job and its non terminal renditions failed
    // Needs a write transaction
    void failJob(db::Session& session, db::Job::pointer job, std::string_view error);

    JobInfo toJobInfo(db::Session& session, const db::Job::pointer& job);
} // namespace hlsforge::transcoding::utils
