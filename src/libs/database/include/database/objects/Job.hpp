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

#include <optional>
#include <string>
#include <string_view>

#include <Wt/Dbo/Field.h>
#include <Wt/WDateTime.h>

#include "core/UUID.hpp"
#include "database/Object.hpp"
#include "database/Types.hpp"
#include "database/objects/JobId.hpp"
#include "database/objects/VideoId.hpp"

namespace hlsforge::db
{
    class Session;
    class Video;

    // One transcode request of a video
    class Job final : public Object<Job, JobId>
    {
    public:
        Job() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, JobId id);
        static pointer find(Session& session, const core::UUID& uuid);
        // most recently created job of the video, optionally restricted to the given status
        static pointer findLatest(Session& session, VideoId videoId, std::optional<JobStatus> status = std::nullopt);

        // getters
        core::UUID getUUID() const;
        JobStatus getStatus() const { return _status; }
        std::string_view getError() const { return _error; }
        bool isCancelRequested() const { return _cancelRequested; }
        const Wt::WDateTime& getCreatedAt() const { return _createdAt; }
        const Wt::WDateTime& getUpdatedAt() const { return _updatedAt; }
        ObjectPtr<Video> getVideo() const { return _video; }
        VideoId getVideoId() const { return _video.id(); }

        // setters
        // Allowed: queued -> running, queued -> failed, running -> done, running -> failed
        // Setting the current status again is a no-op, any other change throws StateConflictException
        void setStatus(JobStatus status, std::string_view error = {});
        void setCancelRequested() { _cancelRequested = true; }

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _uuid, "uuid");
            Wt::Dbo::field(a, _status, "status");
            Wt::Dbo::field(a, _error, "error");
            Wt::Dbo::field(a, _cancelRequested, "cancel_requested");
            Wt::Dbo::field(a, _createdAt, "created_at");
            Wt::Dbo::field(a, _updatedAt, "updated_at");

            Wt::Dbo::belongsTo(a, _video, "video", Wt::Dbo::OnDeleteCascade);
        }

    private:
        friend class Session;
        Job(const core::UUID& uuid, ObjectPtr<Video> video);
        static pointer create(Session& session, const core::UUID& uuid, ObjectPtr<Video> video);

        std::string _uuid;
        JobStatus _status{ JobStatus::Queued };
        std::string _error;
        bool _cancelRequested{};
        Wt::WDateTime _createdAt;
        Wt::WDateTime _updatedAt;

        Wt::Dbo::ptr<Video> _video;
    };
} // namespace hlsforge::db
