/*
 * Copyright (C) 2019 Emeric Poupon
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

#include "database/Types.hpp"

namespace hlsforge::db
{
    std::string_view toString(JobStatus status)
    {
        switch (status)
        {
        case JobStatus::Queued:
            return "queued";
        case JobStatus::Running:
            return "running";
        case JobStatus::Done:
            return "done";
        case JobStatus::Failed:
            return "failed";
        }
        return "unknown";
    }

    std::string_view toString(RenditionStatus status)
    {
        switch (status)
        {
        case RenditionStatus::Queued:
            return "queued";
        case RenditionStatus::Running:
            return "running";
        case RenditionStatus::Ready:
            return "ready";
        case RenditionStatus::Failed:
            return "failed";
        }
        return "unknown";
    }

    bool isTerminal(JobStatus status)
    {
        return status == JobStatus::Done || status == JobStatus::Failed;
    }

    bool isTerminal(RenditionStatus status)
    {
        return status == RenditionStatus::Ready || status == RenditionStatus::Failed;
    }
} // namespace hlsforge::db
