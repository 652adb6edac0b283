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

#include <atomic>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "core/IOContextRunner.hpp"
#include "services/transcoding/Config.hpp"
#include "services/transcoding/IWorkerService.hpp"

#include "LeaseKeeper.hpp"

namespace hlsforge::queue
{
    struct DeadLetter;
}

namespace hlsforge::transcoding
{
    class WorkerService : public IWorkerService
    {
    public:
        WorkerService(db::IDb& db, queue::IWorkQueue& queue, storage::IObjectStore& objectStore, av::IHlsTranscoder& transcoder, const WorkerConfig& config);
        ~WorkerService() override;
        WorkerService(const WorkerService&) = delete;
        WorkerService& operator=(const WorkerService&) = delete;

    private:
        std::size_t getProcessedCount() const override { return _processedCount; }

        void workerLoop(std::size_t index);

        void scheduleReap();
        void reap();
        void abandonJob(const queue::DeadLetter& deadLetter);

        db::IDb& _db;
        queue::IWorkQueue& _queue;
        storage::IObjectStore& _objectStore;
        av::IHlsTranscoder& _transcoder;
        const WorkerConfig _config;

        std::atomic<bool> _stopRequested{};
        std::atomic<std::size_t> _processedCount{};
        std::vector<std::thread> _workers;

        boost::asio::io_context _ioContext;
        boost::asio::steady_timer _reapTimer{ _ioContext };
        LeaseKeeper _leaseKeeper{ _ioContext, _queue, std::chrono::duration_cast<std::chrono::milliseconds>(_config.leaseDuration) / 3 };
        core::IOContextRunner _ioContextRunner{ _ioContext, 1, "Reaper" };
    };
} // namespace hlsforge::transcoding
