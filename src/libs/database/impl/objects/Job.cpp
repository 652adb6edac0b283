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

#include "database/objects/Job.hpp"

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "database/Session.hpp"
#include "database/objects/Video.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(hlsforge::db::Job)

namespace hlsforge::db
{
    namespace
    {
        bool isTransitionAllowed(JobStatus from, JobStatus to)
        {
            switch (from)
            {
            case JobStatus::Queued:
                return to == JobStatus::Running || to == JobStatus::Failed;
            case JobStatus::Running:
                return to == JobStatus::Done || to == JobStatus::Failed;
            case JobStatus::Done:
            case JobStatus::Failed:
                break;
            }
            return false;
        }
    } // namespace

    Job::Job(const core::UUID& uuid, ObjectPtr<Video> video)
        : _uuid{ uuid.getAsString() }
        , _createdAt{ utils::normalizeDateTime(Wt::WDateTime::currentDateTime()) }
        , _updatedAt{ _createdAt }
        , _video{ getDboPtr(video) }
    {
    }

    Job::pointer Job::create(Session& session, const core::UUID& uuid, ObjectPtr<Video> video)
    {
        return session.getDboSession()->add(std::unique_ptr<Job>{ new Job{ uuid, video } });
    }

    std::size_t Job::getCount(Session& session)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM job"));
    }

    Job::pointer Job::find(Session& session, JobId id)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Job>>("SELECT j from job j").where("j.id = ?").bind(id));
    }

    Job::pointer Job::find(Session& session, const core::UUID& uuid)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Job>>("SELECT j from job j").where("j.uuid = ?").bind(std::string{ uuid.getAsString() }));
    }

    Job::pointer Job::findLatest(Session& session, VideoId videoId, std::optional<JobStatus> status)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<Job>>("SELECT j from job j").where("j.video_id = ?").bind(videoId) };
        if (status)
            query.where("j.status = ?").bind(static_cast<int>(*status));

        return utils::fetchQuerySingleResult(query.orderBy("j.created_at DESC, j.id DESC").limit(1));
    }

    core::UUID Job::getUUID() const
    {
        return core::UUID::fromString(_uuid).value();
    }

    void Job::setStatus(JobStatus status, std::string_view error)
    {
        if (status == _status)
            return;

        if (!isTransitionAllowed(_status, status))
            throw StateConflictException{ "Job " + _uuid + ": cannot change status from '" + std::string{ toString(_status) } + "' to '" + std::string{ toString(status) } + "'" };

        _status = status;
        if (status == JobStatus::Failed)
            _error = error;
        _updatedAt = Wt::WDateTime::currentDateTime();
    }
} // namespace hlsforge::db
