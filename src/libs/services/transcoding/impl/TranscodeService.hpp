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

#include "services/transcoding/ITranscodeService.hpp"

#include "JobProducer.hpp"

namespace hlsforge::transcoding
{
    class TranscodeService : public ITranscodeService
    {
    public:
        TranscodeService(db::IDb& db, queue::IWorkQueue& queue, storage::IObjectStore& objectStore, const ProducerConfig& config);
        ~TranscodeService() override;
        TranscodeService(const TranscodeService&) = delete;
        TranscodeService& operator=(const TranscodeService&) = delete;

    private:
        core::UUID importVideo(const std::filesystem::path& sourceFile) override;
        core::UUID submitJob(const core::UUID& videoId, std::span<const unsigned> profiles) override;
        bool cancelJob(const core::UUID& jobId) override;

        JobInfo getJobStatus(const core::UUID& jobId) override;
        VideoSummary getVideoSummary(const core::UUID& videoId) override;
        std::vector<VideoInfo> listVideos(std::size_t limit) override;
        std::string getMasterPlaylist(const core::UUID& videoId) override;

        db::IDb& _db;
        storage::IObjectStore& _objectStore;
        JobProducer _producer;
    };
} // namespace hlsforge::transcoding
