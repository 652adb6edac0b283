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

#include <functional>
#include <string>
#include <string_view>

#include <Wt/Dbo/Field.h>

#include "database/Object.hpp"
#include "database/Types.hpp"
#include "database/objects/JobId.hpp"
#include "database/objects/RenditionId.hpp"
#include "database/objects/VideoId.hpp"

namespace hlsforge::db
{
    class Job;
    class Session;
    class Video;

    // One output profile of a job
    class Rendition final : public Object<Rendition, RenditionId>
    {
    public:
        Rendition() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, RenditionId id);
        static pointer find(Session& session, JobId jobId, unsigned height);
        // ordered by height
        static void find(Session& session, JobId jobId, std::function<void(const pointer&)> func);

        // getters
        unsigned getHeight() const { return _height; }
        unsigned getWidth() const { return _width; }
        unsigned getBandwidth() const { return _bandwidth; } // bits per second
        RenditionStatus getStatus() const { return _status; }
        std::string_view getKey() const { return _key; } // storage key of the variant playlist, only set once ready
        std::string_view getError() const { return _error; }
        ObjectPtr<Job> getJob() const { return _job; }
        JobId getJobId() const { return _job.id(); }
        VideoId getVideoId() const { return _video.id(); }

        // setters
        // Allowed: queued -> running, queued -> failed, running -> failed
        // Setting the current status again is a no-op, any other change throws StateConflictException
        void setStatus(RenditionStatus status, std::string_view error = {});
        // running -> ready, key and width are set along with the status
        void setReady(std::string_view key, unsigned width);

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _height, "height");
            Wt::Dbo::field(a, _width, "width");
            Wt::Dbo::field(a, _bandwidth, "bandwidth");
            Wt::Dbo::field(a, _status, "status");
            Wt::Dbo::field(a, _key, "key");
            Wt::Dbo::field(a, _error, "error");

            Wt::Dbo::belongsTo(a, _job, "job", Wt::Dbo::OnDeleteCascade);
            Wt::Dbo::belongsTo(a, _video, "video", Wt::Dbo::OnDeleteCascade);
        }

    private:
        friend class Session;
        Rendition(ObjectPtr<Job> job, unsigned height, unsigned bandwidth);
        static pointer create(Session& session, ObjectPtr<Job> job, unsigned height, unsigned bandwidth);

        void changeStatus(RenditionStatus status);

        int _height{};
        int _width{};
        int _bandwidth{};
        RenditionStatus _status{ RenditionStatus::Queued };
        std::string _key;
        std::string _error;

        Wt::Dbo::ptr<Job> _job;
        Wt::Dbo::ptr<Video> _video;
    };
} // namespace hlsforge::db
