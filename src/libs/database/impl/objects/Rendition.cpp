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

#include "database/objects/Rendition.hpp"

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "database/Session.hpp"
#include "database/objects/Job.hpp"
#include "database/objects/Video.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(hlsforge::db::Rendition)

namespace hlsforge::db
{
    namespace
    {
        bool isTransitionAllowed(RenditionStatus from, RenditionStatus to)
        {
            switch (from)
            {
            case RenditionStatus::Queued:
                return to == RenditionStatus::Running || to == RenditionStatus::Failed;
            case RenditionStatus::Running:
                return to == RenditionStatus::Ready || to == RenditionStatus::Failed;
            case RenditionStatus::Ready:
            case RenditionStatus::Failed:
                break;
            }
            return false;
        }
    } // namespace

    Rendition::Rendition(ObjectPtr<Job> job, unsigned height, unsigned bandwidth)
        : _height{ static_cast<int>(height) }
        , _bandwidth{ static_cast<int>(bandwidth) }
        , _job{ getDboPtr(job) }
        , _video{ getDboPtr(job->getVideo()) }
    {
    }

    Rendition::pointer Rendition::create(Session& session, ObjectPtr<Job> job, unsigned height, unsigned bandwidth)
    {
        return session.getDboSession()->add(std::unique_ptr<Rendition>{ new Rendition{ job, height, bandwidth } });
    }

    std::size_t Rendition::getCount(Session& session)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM rendition"));
    }

    Rendition::pointer Rendition::find(Session& session, RenditionId id)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Rendition>>("SELECT r from rendition r").where("r.id = ?").bind(id));
    }

    Rendition::pointer Rendition::find(Session& session, JobId jobId, unsigned height)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Rendition>>("SELECT r from rendition r").where("r.job_id = ?").bind(jobId).where("r.height = ?").bind(static_cast<int>(height)));
    }

    void Rendition::find(Session& session, JobId jobId, std::function<void(const pointer&)> func)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<Rendition>>("SELECT r from rendition r").where("r.job_id = ?").bind(jobId).orderBy("r.height, r.id") };
        utils::forEachQueryResult(query, [&](const Wt::Dbo::ptr<Rendition>& rendition) { func(rendition); });
    }

    void Rendition::changeStatus(RenditionStatus status)
    {
        if (!isTransitionAllowed(_status, status))
            throw StateConflictException{ "Rendition " + std::to_string(_height) + "p of job " + getJobId().toString() + ": cannot change status from '" + std::string{ toString(_status) } + "' to '" + std::string{ toString(status) } + "'" };

        _status = status;
    }

    void Rendition::setStatus(RenditionStatus status, std::string_view error)
    {
        if (status == _status)
            return;

        if (status == RenditionStatus::Ready)
            throw Exception{ "Rendition cannot be set ready without a key" };

        changeStatus(status);
        if (status == RenditionStatus::Failed)
            _error = error;
    }

    void Rendition::setReady(std::string_view key, unsigned width)
    {
        if (_status == RenditionStatus::Ready)
            return;

        changeStatus(RenditionStatus::Ready);
        _key = key;
        _width = static_cast<int>(width);
        _error.clear();
    }
} // namespace hlsforge::db
