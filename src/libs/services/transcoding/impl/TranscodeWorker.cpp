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

#include "TranscodeWorker.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <mutex>
#include <sstream>

#include "core/IJobScheduler.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/Job.hpp"
#include "database/objects/Rendition.hpp"
#include "database/objects/Video.hpp"
#include "hls/MasterPlaylist.hpp"
#include "queue/Exception.hpp"
#include "queue/JobDescriptor.hpp"
#include "storage/ContentType.hpp"
#include "storage/IObjectStore.hpp"
#include "storage/KeyLayout.hpp"

#include "services/transcoding/Exception.hpp"

#include "JobUtils.hpp"
#include "RenditionJob.hpp"
#include "WorkingArea.hpp"

namespace hlsforge::transcoding
{
    namespace
    {
        constexpr std::string_view cancelledError{ "Cancelled" };

        // Polled from the encode threads, hits the database at most once per period
        class CancellationChecker
        {
        public:
            CancellationChecker(db::IDb& db, db::JobId jobId)
                : _db{ db }
                , _jobId{ jobId }
            {
            }

            bool isCancelRequested(bool force = false)
            {
                static constexpr std::chrono::milliseconds checkPeriod{ 500 };

                const std::scoped_lock lock{ _mutex };

                if (_cancelRequested)
                    return true;

                const auto now{ std::chrono::steady_clock::now() };
                if (!force && now - _lastCheck < checkPeriod)
                    return false;
                _lastCheck = now;

                try
                {
                    db::Session& session{ _db.getTLSSession() };
                    auto transaction{ session.createReadTransaction() };

                    const db::Job::pointer job{ db::Job::find(session, _jobId) };
                    _cancelRequested = job && job->isCancelRequested();
                }
                catch (const std::exception& e)
                {
                    HLSFORGE_LOG(TRANSCODING, ERROR, "Cannot check cancellation of job " << _jobId.toString() << ": " << e.what());
                }

                return _cancelRequested;
            }

        private:
            db::IDb& _db;
            const db::JobId _jobId;
            std::mutex _mutex;
            std::chrono::steady_clock::time_point _lastCheck{ std::chrono::steady_clock::now() };
            bool _cancelRequested{};
        };
    } // namespace

    TranscodeWorker::TranscodeWorker(db::IDb& db, storage::IObjectStore& objectStore, av::IHlsTranscoder& transcoder, const std::filesystem::path& workingDir, std::size_t encodeConcurrency)
        : _db{ db }
        , _objectStore{ objectStore }
        , _transcoder{ transcoder }
        , _workingDir{ workingDir }
        , _jobScheduler{ core::createJobScheduler("Encode", encodeConcurrency) }
    {
    }

    TranscodeWorker::~TranscodeWorker() = default;

    TranscodeWorker::Result TranscodeWorker::process(std::string_view payload, std::string_view attemptId, const ShouldStopCallback& shouldStop)
    {
        std::optional<queue::JobDescriptor> descriptor;
        try
        {
            descriptor = queue::parseJobDescriptor(payload);
        }
        catch (const queue::DescriptorParseException& e)
        {
            HLSFORGE_LOG(TRANSCODING, ERROR, "Dropping malformed descriptor: " << e.what());
            return Result::Skipped;
        }

        try
        {
            return processDescriptor(*descriptor, attemptId, shouldStop);
        }
        catch (const std::exception& e)
        {
            HLSFORGE_LOG(TRANSCODING, ERROR, "Processing of job " << descriptor->jobId << " interrupted: " << e.what());
            return Result::Interrupted;
        }
    }

    TranscodeWorker::Result TranscodeWorker::processDescriptor(const queue::JobDescriptor& descriptor, std::string_view attemptId, const ShouldStopCallback& shouldStop)
    {
        HLSFORGE_LOG(TRANSCODING, INFO, "Processing job " << descriptor.jobId << " of video " << descriptor.videoId);

        std::optional<JobContext> context;
        try
        {
            Result result{ Result::Skipped };
            context = startJob(descriptor, result);
            if (!context)
                return result;

            startRenditions(*context, descriptor);
        }
        catch (const std::exception& e)
        {
            HLSFORGE_LOG(TRANSCODING, ERROR, "Cannot start job " << descriptor.jobId << ": " << e.what());
            failJob(descriptor.jobId, e.what());
            return Result::Failed;
        }

        CancellationChecker cancellation{ _db, context->jobId };
        if (!context->pendingHeights.empty())
        {
            std::optional<WorkingArea> workingArea;
            std::filesystem::path sourceFile;
            try
            {
                workingArea.emplace(_workingDir / "jobs" / (std::string{ descriptor.jobId.getAsString() } + "-" + std::string{ attemptId }));
                sourceFile = workingArea->getPath() / "source.mp4";
                downloadSource(*context, sourceFile);
            }
            catch (const std::exception& e)
            {
                HLSFORGE_LOG(TRANSCODING, ERROR, "Cannot set up job " << descriptor.jobId << ": " << e.what());
                failJob(descriptor.jobId, e.what());
                return Result::Failed;
            }

            encodeRenditions(*context, workingArea->getPath(), sourceFile, [&] { return shouldStop() || cancellation.isCancelRequested(); });
        }

        if (shouldStop())
        {
            HLSFORGE_LOG(TRANSCODING, INFO, "Processing of job " << descriptor.jobId << " stopped");
            return Result::Interrupted;
        }

        if (cancellation.isCancelRequested(true))
        {
            failJob(descriptor.jobId, cancelledError);
            return Result::Failed;
        }

        return completeJob(*context);
    }

    std::optional<TranscodeWorker::JobContext> TranscodeWorker::startJob(const queue::JobDescriptor& descriptor, Result& result)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        db::Job::pointer job{ db::Job::find(session, descriptor.jobId) };
        if (!job)
        {
            HLSFORGE_LOG(TRANSCODING, ERROR, "Job " << descriptor.jobId << " not found, dropping descriptor");
            result = Result::Skipped;
            return std::nullopt;
        }

        if (db::isTerminal(job->getStatus()))
        {
            HLSFORGE_LOG(TRANSCODING, INFO, "Job " << descriptor.jobId << " already " << db::toString(job->getStatus()));
            result = Result::Skipped;
            return std::nullopt;
        }

        if (job->isCancelRequested())
        {
            utils::failJob(session, job, cancelledError);
            result = Result::Failed;
            return std::nullopt;
        }

        const db::Video::pointer video{ job->getVideo() };
        if (video->getUUID() != descriptor.videoId)
            HLSFORGE_LOG(TRANSCODING, WARNING, "Job " << descriptor.jobId << " belongs to video " << video->getUUID() << ", not " << descriptor.videoId);

        job.modify()->setStatus(db::JobStatus::Running);

        return JobContext{
            .jobId = job->getId(),
            .jobUUID = descriptor.jobId,
            .videoId = video->getUUID(),
            .sourceKey = std::string{ video->getSourceKey() },
            .pendingHeights = {},
        };
    }

    void TranscodeWorker::startRenditions(JobContext& context, const queue::JobDescriptor& descriptor)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        for (const unsigned height : descriptor.profiles)
        {
            if (std::find(std::cbegin(context.pendingHeights), std::cend(context.pendingHeights), height) != std::cend(context.pendingHeights))
                continue;

            db::Rendition::pointer rendition{ db::Rendition::find(session, context.jobId, height) };
            if (!rendition)
            {
                HLSFORGE_LOG(TRANSCODING, WARNING, "Job " << descriptor.jobId << " has no " << height << "p rendition, skipped");
                continue;
            }

            // done by an earlier attempt
            if (db::isTerminal(rendition->getStatus()))
                continue;

            rendition.modify()->setStatus(db::RenditionStatus::Running);
            context.pendingHeights.push_back(height);
        }
    }

    void TranscodeWorker::downloadSource(const JobContext& context, const std::filesystem::path& sourceFile)
    {
        std::ofstream ofs{ sourceFile, std::ios::binary };
        if (!ofs)
            throw Exception{ "Cannot create '" + sourceFile.string() + "'" };

        _objectStore.get(context.sourceKey, ofs);

        ofs.close();
        if (!ofs)
            throw Exception{ "Cannot write '" + sourceFile.string() + "'" };

        HLSFORGE_LOG(TRANSCODING, DEBUG, "Downloaded '" << context.sourceKey << "' to '" << sourceFile.string() << "'");
    }

    void TranscodeWorker::encodeRenditions(const JobContext& context, const std::filesystem::path& workingDir, const std::filesystem::path& sourceFile, const std::function<bool()>& shouldAbort)
    {
        const RenditionJob::Context jobContext{
            .db = _db,
            .objectStore = _objectStore,
            .transcoder = _transcoder,
            .sourceFile = sourceFile,
            .workingDir = workingDir,
            .videoId = context.videoId,
            .jobId = context.jobId,
            .shouldAbort = shouldAbort,
        };

        _jobScheduler->setShouldAbortCallback(shouldAbort);
        for (const unsigned height : context.pendingHeights)
            _jobScheduler->scheduleJob(std::make_unique<RenditionJob>(jobContext, height));

        _jobScheduler->wait();
        _jobScheduler->setShouldAbortCallback({});

        std::size_t readyCount{};
        std::size_t failedCount{};
        for (const std::unique_ptr<core::IJob>& job : _jobScheduler->popJobsDone())
        {
            switch (static_cast<const RenditionJob&>(*job).getOutcome())
            {
            case RenditionJob::Outcome::Ready:
                readyCount++;
                break;
            case RenditionJob::Outcome::Failed:
                failedCount++;
                break;
            case RenditionJob::Outcome::Aborted:
                break;
            }
        }

        HLSFORGE_LOG(TRANSCODING, DEBUG, "Job " << context.jobUUID << ": " << readyCount << " renditions ready, " << failedCount << " failed out of " << context.pendingHeights.size());
    }

    TranscodeWorker::Result TranscodeWorker::completeJob(const JobContext& context)
    {
        std::vector<hls::Variant> variants;
        std::vector<std::string> failures;
        std::vector<std::string> pendingHeights;
        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createReadTransaction() };

            db::Rendition::find(session, context.jobId, [&](const db::Rendition::pointer& rendition) {
                switch (rendition->getStatus())
                {
                case db::RenditionStatus::Ready:
                    variants.push_back(hls::Variant{
                        .uri = hls::getVariantUri(rendition->getHeight()),
                        .width = rendition->getWidth(),
                        .height = rendition->getHeight(),
                        .bandwidth = rendition->getBandwidth(),
                    });
                    break;
                case db::RenditionStatus::Failed:
                    failures.push_back(std::to_string(rendition->getHeight()) + ": " + std::string{ rendition->getError() });
                    break;
                case db::RenditionStatus::Queued:
                case db::RenditionStatus::Running:
                    pendingHeights.push_back(std::to_string(rendition->getHeight()));
                    break;
                }
            });
        }

        if (!pendingHeights.empty())
            throw Exception{ "Renditions not terminal: " + core::stringUtils::joinStrings(pendingHeights, ", ") };

        if (variants.empty())
        {
            failJob(context.jobUUID, "All renditions failed: " + core::stringUtils::joinStrings(failures, "; "));
            return Result::Failed;
        }

        const std::string masterKey{ storage::keys::getMasterPlaylistKey(context.videoId) };
        std::istringstream iss{ hls::buildMasterPlaylist(variants) };
        _objectStore.put(masterKey, iss, storage::getContentType(masterKey));

        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createWriteTransaction() };

            db::Job::pointer job{ db::Job::find(session, context.jobId) };
            if (!job)
                throw Exception{ "Job " + std::string{ context.jobUUID.getAsString() } + " vanished" };

            // another attempt may have completed the job meanwhile
            if (db::isTerminal(job->getStatus()))
            {
                HLSFORGE_LOG(TRANSCODING, INFO, "Job " << context.jobUUID << " already " << db::toString(job->getStatus()));
                return job->getStatus() == db::JobStatus::Done ? Result::Done : Result::Failed;
            }

            // cancellation requests are serialized with this transaction
            if (job->isCancelRequested())
            {
                utils::failJob(session, job, cancelledError);
                return Result::Failed;
            }

            job.modify()->setStatus(db::JobStatus::Done);
        }

        HLSFORGE_LOG(TRANSCODING, INFO, "Job " << context.jobUUID << " done: " << variants.size() << " renditions ready, " << failures.size() << " failed");

        return Result::Done;
    }

    void TranscodeWorker::failJob(const core::UUID& jobId, std::string_view error)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        if (db::Job::pointer job{ db::Job::find(session, jobId) })
            utils::failJob(session, job, error);
    }
} // namespace hlsforge::transcoding
