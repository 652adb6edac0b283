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

#include "Common.hpp"

#include <atomic>
#include <thread>

#include "av/Exception.hpp"
#include "services/transcoding/IWorkerService.hpp"

namespace hlsforge::transcoding::tests
{
    class WorkerServiceTest : public TranscodingTest
    {
    protected:
        WorkerConfig createConfig() const
        {
            return WorkerConfig{
                .workingDir = _tmpDir / "work",
                .workerCount = 3,
                .encodeConcurrency = 2,
                .leaseDuration = leaseDuration,
                .maxDeliveryCount = 3,
                .reapInterval = std::chrono::seconds{ 1 },
                .popTimeout = std::chrono::milliseconds{ 50 },
            };
        }

        template<typename Predicate>
        bool waitFor(Predicate predicate, std::chrono::seconds timeout = std::chrono::seconds{ 30 })
        {
            const auto deadline{ std::chrono::steady_clock::now() + timeout };
            while (!predicate())
            {
                if (std::chrono::steady_clock::now() > deadline)
                    return false;
                std::this_thread::sleep_for(std::chrono::milliseconds{ 20 });
            }
            return true;
        }
    };

    TEST_F(WorkerServiceTest, concurrentWorkers)
    {
        constexpr std::size_t jobCount{ 6 };
        const std::vector<unsigned> profiles{ 240, 480, 720 };

        std::vector<core::UUID> jobIds;
        for (std::size_t i{}; i < jobCount; ++i)
            jobIds.push_back(_service->submitJob(importVideo("video " + std::to_string(i)), profiles));

        auto workerService{ createWorkerService(*_db, *_queue, *_objectStore, _transcoder, createConfig()) };

        ASSERT_TRUE(waitFor([&] { return workerService->getProcessedCount() == jobCount; }));
        workerService.reset();

        for (const core::UUID& jobId : jobIds)
        {
            const JobInfo job{ _service->getJobStatus(jobId) };
            EXPECT_EQ(job.status, db::JobStatus::Done);
            for (const RenditionInfo& rendition : job.renditions)
                EXPECT_EQ(rendition.status, db::RenditionStatus::Ready);

            EXPECT_EQ(_service->getMasterPlaylist(job.videoId).rfind("#EXTM3U\n", 0), 0);
        }

        // each descriptor processed exactly once
        EXPECT_EQ(_transcoder.getCallCount(240), jobCount);
        EXPECT_EQ(_transcoder.getCallCount(480), jobCount);
        EXPECT_EQ(_transcoder.getCallCount(720), jobCount);
        EXPECT_EQ(_queue->getCount(), 0);
    }

    TEST_F(WorkerServiceTest, deadLetter)
    {
        WorkerConfig config{ createConfig() };
        config.maxDeliveryCount = 1;

        const core::UUID jobId{ _service->submitJob(importVideo(), {}) };

        // consumer that never acks
        ASSERT_TRUE(_queue->pop(std::chrono::milliseconds{ 0 }));

        auto workerService{ createWorkerService(*_db, *_queue, *_objectStore, _transcoder, config) };

        ASSERT_TRUE(waitFor([&] { return _service->getJobStatus(jobId).status == db::JobStatus::Failed; }, std::chrono::seconds{ 10 }));
        workerService.reset();

        const JobInfo job{ _service->getJobStatus(jobId) };
        EXPECT_EQ(job.error, "Abandoned after 1 deliveries");
        for (const RenditionInfo& rendition : job.renditions)
            EXPECT_EQ(rendition.status, db::RenditionStatus::Failed);

        EXPECT_EQ(_queue->getCount(), 0);
        EXPECT_EQ(_transcoder.getCallCount(), 0);
    }

    TEST_F(WorkerServiceTest, lostLeaseAbortsProcessing)
    {
        WorkerConfig config{ createConfig() };
        config.workerCount = 1;
        config.encodeConcurrency = 1;

        const std::vector<unsigned> profiles{ 240, 480, 720 };
        const core::UUID jobId{ _service->submitJob(importVideo(), profiles) };

        std::atomic<bool> aborted{};
        _transcoder.setHook([&](unsigned height, const av::IHlsTranscoder::ShouldAbortCallback& shouldAbort) {
            if (height != 240 || _transcoder.getCallCount(240) != 1)
                return;

            _faultyQueue.setLeaseExtensionRefused(true);
            try
            {
                waitForAbort(shouldAbort);
            }
            catch (const av::EncodeAbortedException&)
            {
                aborted = true;
                _faultyQueue.setLeaseExtensionRefused(false);
                throw;
            }
        });

        auto workerService{ createWorkerService(*_db, _faultyQueue, _faultyObjectStore, _transcoder, config) };

        // the interrupted attempt is not acked, the descriptor is delivered again once its lease expired
        ASSERT_TRUE(waitFor([&] { return workerService->getProcessedCount() == 1; }));
        workerService.reset();

        EXPECT_TRUE(aborted);

        const JobInfo job{ _service->getJobStatus(jobId) };
        EXPECT_EQ(job.status, db::JobStatus::Done);
        for (const RenditionInfo& rendition : job.renditions)
            EXPECT_EQ(rendition.status, db::RenditionStatus::Ready);

        EXPECT_EQ(_transcoder.getCallCount(240), 2);
        EXPECT_EQ(_transcoder.getCallCount(480), 1);
        EXPECT_EQ(_transcoder.getCallCount(720), 1);
        EXPECT_EQ(_queue->getCount(), 0);
    }

    TEST_F(WorkerServiceTest, stopWhileIdle)
    {
        const auto start{ std::chrono::steady_clock::now() };
        {
            auto workerService{ createWorkerService(*_db, *_queue, *_objectStore, _transcoder, createConfig()) };
            EXPECT_EQ(workerService->getProcessedCount(), 0);
        }
        EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{ 5 });
    }
} // namespace hlsforge::transcoding::tests
