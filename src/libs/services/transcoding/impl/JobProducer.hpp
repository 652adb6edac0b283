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
#include <span>
#include <string_view>
#include <vector>

#include "av/Profile.hpp"
#include "core/UUID.hpp"
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
    class JobProducer
    {
    public:
        JobProducer(db::IDb& db, queue::IWorkQueue& queue, storage::IObjectStore& objectStore, const ProducerConfig& config);
        ~JobProducer() = default;
        JobProducer(const JobProducer&) = delete;
        JobProducer& operator=(const JobProducer&) = delete;

        core::UUID importVideo(const std::filesystem::path& sourceFile);
        core::UUID submitJob(const core::UUID& videoId, std::span<const unsigned> requestedHeights);

    private:
        // Duplicates are dropped, first occurrence order is kept
        std::vector<av::Profile> resolveProfiles(std::span<const unsigned> requestedHeights) const;
        void abandonJob(const core::UUID& jobId, std::string_view error);

        db::IDb& _db;
        queue::IWorkQueue& _queue;
        storage::IObjectStore& _objectStore;
        const ProducerConfig _config;
    };
} // namespace hlsforge::transcoding
