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

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/UUID.hpp"
#include "database/objects/JobId.hpp"

namespace hlsforge
{
    namespace av
    {
        class IHlsTranscoder;
    }

    namespace core
    {
        class IJobScheduler;
    }

    namespace db
    {
        class IDb;
    }

    namespace queue
    {
        struct JobDescriptor;
    }

    namespace storage
    {
        class IObjectStore;
    }
} // namespace hlsforge

namespace hlsforge::transcoding
{
    // Processes the job descriptors, one at a time
    class TranscodeWorker
    {
    public:
        TranscodeWorker(db::IDb& db, storage::IObjectStore& objectStore, av::IHlsTranscoder& transcoder, const std::filesystem::path& workingDir, std::size_t encodeConcurrency);
        ~TranscodeWorker();
        TranscodeWorker(const TranscodeWorker&) = delete;
        TranscodeWorker& operator=(const TranscodeWorker&) = delete;

        enum class Result
        {
            Done,
            Failed,
            Skipped,     // nothing to do: malformed descriptor, unknown or already over job
            Interrupted, // must not be acknowledged, will be processed again
        };

        // Never throws
        // attemptId identifies this delivery of the descriptor, concurrent attempts of a job get distinct working areas
        using ShouldStopCallback = std::function<bool()>;
        Result process(std::string_view payload, std::string_view attemptId, const ShouldStopCallback& shouldStop);

    private:
        struct JobContext
        {
            db::JobId jobId;
            core::UUID jobUUID;
            core::UUID videoId;
            std::string sourceKey;
            std::vector<unsigned> pendingHeights;
        };

        Result processDescriptor(const queue::JobDescriptor& descriptor, std::string_view attemptId, const ShouldStopCallback& shouldStop);
        std::optional<JobContext> startJob(const queue::JobDescriptor& descriptor, Result& result);
        void startRenditions(JobContext& context, const queue::JobDescriptor& descriptor);
        void downloadSource(const JobContext& context, const std::filesystem::path& sourceFile);
        void encodeRenditions(const JobContext& context, const std::filesystem::path& workingDir, const std::filesystem::path& sourceFile, const std::function<bool()>& shouldAbort);
        Result completeJob(const JobContext& context);

        void failJob(const core::UUID& jobId, std::string_view error);

        db::IDb& _db;
        storage::IObjectStore& _objectStore;
        av::IHlsTranscoder& _transcoder;
        const std::filesystem::path _workingDir;
        std::unique_ptr<core::IJobScheduler> _jobScheduler;
    };
} // namespace hlsforge::transcoding
