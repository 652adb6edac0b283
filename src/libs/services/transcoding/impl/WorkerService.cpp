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

#include "WorkerService.hpp"

#include <boost/asio/post.hpp>

#include "core/ILogger.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/Job.hpp"
#include "queue/Exception.hpp"
#include "queue/IWorkQueue.hpp"
#include "queue/JobDescriptor.hpp"

#include "JobUtils.hpp"
#include "TranscodeWorker.hpp"

namespace hlsforge::transcoding
{
    std::unique_ptr<IWorkerService> createWorkerService(db::IDb& db, queue::IWorkQueue& queue, storage::IObjectStore& objectStore, av::IHlsTranscoder& transcoder, const WorkerConfig& config)
    {
        return std::make_unique<WorkerService>(db, queue, objectStore, transcoder, config);
    }

    WorkerService::WorkerService(db::IDb& db, queue::IWorkQueue& queue, storage::IObjectStore& objectStore, av::IHlsTranscoder& transcoder, const WorkerConfig& config)
        : _db{ db }
        , _queue{ queue }
        , _objectStore{ objectStore }
        , _transcoder{ transcoder }
        , _config{ config }
    {
        HLSFORGE_LOG(TRANSCODING, INFO, "Starting " << _config.workerCount << " worker(s), " << _config.encodeConcurrency << " encode(s) per job");

        boost::asio::post(_ioContext, [this] {
            _leaseKeeper.start();
            reap();
            scheduleReap();
        });

        for (std::size_t i{}; i < _config.workerCount; ++i)
            _workers.emplace_back([this, i] { workerLoop(i); });
    }

    WorkerService::~WorkerService()
    {
        HLSFORGE_LOG(TRANSCODING, INFO, "Stopping workers...");

        _stopRequested = true;
        for (std::thread& worker : _workers)
            worker.join();

        _ioContextRunner.stop();

        HLSFORGE_LOG(TRANSCODING, INFO, "Workers stopped!");
    }

    void WorkerService::workerLoop(std::size_t index)
    {
        HLSFORGE_LOG(TRANSCODING, DEBUG, "Worker " << index << " started");

        TranscodeWorker worker{ _db, _objectStore, _transcoder, _config.workingDir, _config.encodeConcurrency };

        while (!_stopRequested)
        {
            std::optional<queue::Delivery> delivery;
            try
            {
                delivery = _queue.pop(_config.popTimeout);
            }
            catch (const std::exception& e)
            {
                HLSFORGE_LOG(TRANSCODING, ERROR, "Worker " << index << ": cannot pop work item: " << e.what());
                std::this_thread::sleep_for(_config.popTimeout);
                continue;
            }

            if (!delivery)
                continue;

            TranscodeWorker::Result result;
            {
                const LeaseKeeper::ScopedLease lease{ _leaseKeeper.keep(*delivery) };

                // once the lease is lost, another consumer may process the same job
                result = worker.process(delivery->payload, delivery->leaseToken, [&] { return _stopRequested.load() || lease.isLost(); });
            }

            if (result == TranscodeWorker::Result::Interrupted)
            {
                HLSFORGE_LOG(TRANSCODING, INFO, "Worker " << index << ": item " << delivery->id.toString() << " left for redelivery");
                continue;
            }

            try
            {
                if (!_queue.ack(*delivery))
                    HLSFORGE_LOG(TRANSCODING, WARNING, "Worker " << index << ": item " << delivery->id.toString() << " processed after its lease expired");
            }
            catch (const std::exception& e)
            {
                HLSFORGE_LOG(TRANSCODING, ERROR, "Worker " << index << ": cannot ack item " << delivery->id.toString() << ": " << e.what());
            }

            _processedCount++;
        }

        HLSFORGE_LOG(TRANSCODING, DEBUG, "Worker " << index << " stopped");
    }

    void WorkerService::scheduleReap()
    {
        _reapTimer.expires_after(_config.reapInterval);
        _reapTimer.async_wait([this](const boost::system::error_code& ec) {
            if (ec)
                return;

            reap();
            scheduleReap();
        });
    }

    void WorkerService::reap()
    {
        try
        {
            for (const queue::DeadLetter& deadLetter : _queue.reclaimExpiredLeases(_config.maxDeliveryCount))
                abandonJob(deadLetter);
        }
        catch (const std::exception& e)
        {
            HLSFORGE_LOG(TRANSCODING, ERROR, "Cannot reclaim expired leases: " << e.what());
        }
    }

    void WorkerService::abandonJob(const queue::DeadLetter& deadLetter)
    {
        std::optional<queue::JobDescriptor> descriptor;
        try
        {
            descriptor = queue::parseJobDescriptor(deadLetter.payload);
        }
        catch (const queue::DescriptorParseException& e)
        {
            HLSFORGE_LOG(TRANSCODING, ERROR, "Dropping malformed dead letter: " << e.what());
            return;
        }

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        db::Job::pointer job{ db::Job::find(session, descriptor->jobId) };
        if (!job || db::isTerminal(job->getStatus()))
            return;

        utils::failJob(session, job, "Abandoned after " + std::to_string(deadLetter.deliveryCount) + " deliveries");
    }
} // namespace hlsforge::transcoding
