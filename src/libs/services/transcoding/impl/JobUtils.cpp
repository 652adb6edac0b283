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

#include "JobUtils.hpp"

#include <vector>

#include "core/ILogger.hpp"
#include "database/Session.hpp"
#include "database/objects/Rendition.hpp"
#include "database/objects/Video.hpp"

namespace hlsforge::transcoding::utils
{
    void failJob(db::Session& session, db::Job::pointer job, std::string_view error)
    {
        session.checkWriteTransaction();

        std::vector<db::Rendition::pointer> renditions;
        db::Rendition::find(session, job->getId(), [&](const db::Rendition::pointer& rendition) {
            if (!db::isTerminal(rendition->getStatus()))
                renditions.push_back(rendition);
        });

        for (db::Rendition::pointer& rendition : renditions)
            rendition.modify()->setStatus(db::RenditionStatus::Failed, error);

        if (!db::isTerminal(job->getStatus()))
            job.modify()->setStatus(db::JobStatus::Failed, error);

        HLSFORGE_LOG(TRANSCODING, INFO, "Job " << job->getUUID() << " failed: " << error);
    }

    JobInfo toJobInfo(db::Session& session, const db::Job::pointer& job)
    {
        session.checkReadTransaction();

        JobInfo res{
            .jobId = job->getUUID(),
            .videoId = job->getVideo()->getUUID(),
            .status = job->getStatus(),
            .error = std::string{ job->getError() },
            .cancelRequested = job->isCancelRequested(),
            .createdAt = job->getCreatedAt(),
            .updatedAt = job->getUpdatedAt(),
            .renditions = {},
        };

        db::Rendition::find(session, job->getId(), [&](const db::Rendition::pointer& rendition) {
            res.renditions.push_back(RenditionInfo{
                .height = rendition->getHeight(),
                .width = rendition->getWidth(),
                .bandwidth = rendition->getBandwidth(),
                .status = rendition->getStatus(),
                .key = std::string{ rendition->getKey() },
                .error = std::string{ rendition->getError() },
            });
        });

        return res;
    }
} // namespace hlsforge::transcoding::utils
