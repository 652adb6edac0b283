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

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <Wt/WDateTime.h>

#include "core/UUID.hpp"
#include "database/Types.hpp"
#include "services/transcoding/Config.hpp"

namespace hlsforge
{
    namespace db
    {
        class IDb;
    }

    namespace queue
    {
        class IWorkQueue;
    }

    namespace storage
    {
        class IObjectStore;
    }
} // namespace hlsforge

namespace hlsforge::transcoding
{
    struct RenditionInfo
    {
        unsigned height{};
        unsigned width{}; // 0 until ready
        unsigned bandwidth{};
        db::RenditionStatus status{ db::RenditionStatus::Queued };
        std::string key;
        std::string error;
    };

    struct JobInfo
    {
        core::UUID jobId;
        core::UUID videoId;
        db::JobStatus status{ db::JobStatus::Queued };
        std::string error;
        bool cancelRequested{};
        Wt::WDateTime createdAt;
        Wt::WDateTime updatedAt;
        std::vector<RenditionInfo> renditions; // ordered by height
    };

    struct VideoInfo
    {
        core::UUID videoId;
        std::string sourceKey;
        Wt::WDateTime createdAt;
    };

    struct VideoSummary
    {
        VideoInfo video;
        std::optional<JobInfo> latestJob;
    };

    class ITranscodeService
    {
    public:
        virtual ~ITranscodeService() = default;

        // Stores the file as the source of a new video
        virtual core::UUID importVideo(const std::filesystem::path& sourceFile) = 0;

        // Creates the job and its renditions, then enqueues it
        // Empty profiles select the default ladder
        // Throws NotFoundException or InvalidProfileException, in which case nothing is written
        virtual core::UUID submitJob(const core::UUID& videoId, std::span<const unsigned> profiles) = 0;

        // Returns false if the job is already over
        virtual bool cancelJob(const core::UUID& jobId) = 0;

        virtual JobInfo getJobStatus(const core::UUID& jobId) = 0;
        virtual VideoSummary getVideoSummary(const core::UUID& videoId) = 0;
        virtual std::vector<VideoInfo> listVideos(std::size_t limit = 25) = 0; // most recent first

        // Throws NotFoundException if the video is unknown, NotReadyException if no job of the video is done
        virtual std::string getMasterPlaylist(const core::UUID& videoId) = 0;
    };

    std::unique_ptr<ITranscodeService> createTranscodeService(db::IDb& db, queue::IWorkQueue& queue, storage::IObjectStore& objectStore, const ProducerConfig& config);
} // namespace hlsforge::transcoding
