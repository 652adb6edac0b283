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

#include "TranscodeService.hpp"

#include <sstream>

#include "core/ILogger.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/Job.hpp"
#include "database/objects/Video.hpp"
#include "storage/Exception.hpp"
#include "storage/IObjectStore.hpp"
#include "storage/KeyLayout.hpp"

#include "services/transcoding/Exception.hpp"

#include "JobUtils.hpp"

namespace hlsforge::transcoding
{
    namespace
    {
        VideoInfo toVideoInfo(const db::Video::pointer& video)
        {
            return VideoInfo{
                .videoId = video->getUUID(),
                .sourceKey = std::string{ video->getSourceKey() },
                .createdAt = video->getCreatedAt(),
            };
        }

        [[noreturn]] void throwVideoNotFound(const core::UUID& videoId)
        {
            throw NotFoundException{ "Video " + std::string{ videoId.getAsString() } + " not found" };
        }

        [[noreturn]] void throwJobNotFound(const core::UUID& jobId)
        {
            throw NotFoundException{ "Job " + std::string{ jobId.getAsString() } + " not found" };
        }
    } // namespace

    std::unique_ptr<ITranscodeService> createTranscodeService(db::IDb& db, queue::IWorkQueue& queue, storage::IObjectStore& objectStore, const ProducerConfig& config)
    {
        return std::make_unique<TranscodeService>(db, queue, objectStore, config);
    }

    TranscodeService::TranscodeService(db::IDb& db, queue::IWorkQueue& queue, storage::IObjectStore& objectStore, const ProducerConfig& config)
        : _db{ db }
        , _objectStore{ objectStore }
        , _producer{ db, queue, objectStore, config }
    {
        HLSFORGE_LOG(TRANSCODING, DEBUG, "Service started!");
    }

    TranscodeService::~TranscodeService()
    {
        HLSFORGE_LOG(TRANSCODING, DEBUG, "Service stopped!");
    }

    core::UUID TranscodeService::importVideo(const std::filesystem::path& sourceFile)
    {
        return _producer.importVideo(sourceFile);
    }

    core::UUID TranscodeService::submitJob(const core::UUID& videoId, std::span<const unsigned> profiles)
    {
        return _producer.submitJob(videoId, profiles);
    }

    bool TranscodeService::cancelJob(const core::UUID& jobId)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        db::Job::pointer job{ db::Job::find(session, jobId) };
        if (!job)
            throwJobNotFound(jobId);

        if (db::isTerminal(job->getStatus()))
            return false;

        job.modify()->setCancelRequested();
        HLSFORGE_LOG(TRANSCODING, INFO, "Cancellation requested for job " << jobId);

        return true;
    }

    JobInfo TranscodeService::getJobStatus(const core::UUID& jobId)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createReadTransaction() };

        const db::Job::pointer job{ db::Job::find(session, jobId) };
        if (!job)
            throwJobNotFound(jobId);

        return utils::toJobInfo(session, job);
    }

    VideoSummary TranscodeService::getVideoSummary(const core::UUID& videoId)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createReadTransaction() };

        const db::Video::pointer video{ db::Video::find(session, videoId) };
        if (!video)
            throwVideoNotFound(videoId);

        VideoSummary summary{ .video = toVideoInfo(video), .latestJob = std::nullopt };
        if (const db::Job::pointer job{ db::Job::findLatest(session, video->getId()) })
            summary.latestJob = utils::toJobInfo(session, job);

        return summary;
    }

    std::vector<VideoInfo> TranscodeService::listVideos(std::size_t limit)
    {
        std::vector<VideoInfo> res;

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createReadTransaction() };

        db::Video::find(session, db::Range{ 0, limit }, [&](const db::Video::pointer& video) {
            res.push_back(toVideoInfo(video));
        });

        return res;
    }

    std::string TranscodeService::getMasterPlaylist(const core::UUID& videoId)
    {
        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createReadTransaction() };

            const db::Video::pointer video{ db::Video::find(session, videoId) };
            if (!video)
                throwVideoNotFound(videoId);

            if (!db::Job::findLatest(session, video->getId(), db::JobStatus::Done))
                throw NotReadyException{ "Video " + std::string{ videoId.getAsString() } + " has no completed job" };
        }

        std::ostringstream oss;
        try
        {
            _objectStore.get(storage::keys::getMasterPlaylistKey(videoId), oss);
        }
        catch (const storage::NotFoundException& e)
        {
            HLSFORGE_LOG(TRANSCODING, ERROR, "Master playlist of video " << videoId << " is missing: " << e.what());
            throw NotReadyException{ "Master playlist of video " + std::string{ videoId.getAsString() } + " is missing" };
        }

        return oss.str();
    }
} // namespace hlsforge::transcoding
