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

#include <memory>

#include "services/transcoding/Config.hpp"

namespace hlsforge
{
    namespace av
    {
        class IHlsTranscoder;
    }

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
    // Consumes the work queue until destroyed
    // Expired leases are reaped periodically, dead letters fail their job
    class IWorkerService
    {
    public:
        virtual ~IWorkerService() = default;

        virtual std::size_t getProcessedCount() const = 0;
    };

    std::unique_ptr<IWorkerService> createWorkerService(db::IDb& db, queue::IWorkQueue& queue, storage::IObjectStore& objectStore, av::IHlsTranscoder& transcoder, const WorkerConfig& config);
} // namespace hlsforge::transcoding
