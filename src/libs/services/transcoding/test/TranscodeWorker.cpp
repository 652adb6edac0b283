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
#include <future>
#include <thread>

#include "av/Exception.hpp"
#include "services/transcoding/Exception.hpp"
#include "storage/Exception.hpp"
#include "storage/KeyLayout.hpp"

namespace hlsforge::transcoding::tests
{
    using TranscodeWorkerTest = TranscodingTest;

    namespace
    {
        const std::vector<unsigned> ladder{ 240, 480, 720 };
    } // namespace

    TEST_F(TranscodeWorkerTest, allRenditionsReady)
    {
        const core::UUID videoId{ importVideo() };
        const core::UUID jobId{ _service->submitJob(videoId, ladder) };

        EXPECT_EQ(processNext(), TranscodeWorker::Result::Done);

        const JobInfo job{ _service->getJobStatus(jobId) };
        EXPECT_EQ(job.status, db::JobStatus::Done);
        EXPECT_TRUE(job.error.empty());
        for (const RenditionInfo& rendition : job.renditions)
        {
            EXPECT_EQ(rendition.status, db::RenditionStatus::Ready);
            EXPECT_EQ(rendition.key, storage::keys::getVariantPlaylistKey(videoId, rendition.height));
            EXPECT_TRUE(rendition.error.empty());
        }
        EXPECT_EQ(getRendition(job, 240).width, 426);
        EXPECT_EQ(getRendition(job, 480).width, 852);
        EXPECT_EQ(getRendition(job, 720).width, 1280);

        EXPECT_EQ(getObject(storage::keys::getSegmentKey(videoId, 480, "seg_1.ts")), "segment 1 of 480p");
        EXPECT_EQ(_objectStore->stat(storage::keys::getSegmentKey(videoId, 480, "seg_1.ts"))->contentType, "video/MP2T");
        EXPECT_EQ(_objectStore->stat(storage::keys::getVariantPlaylistKey(videoId, 480))->contentType, "application/vnd.apple.mpegurl");

        const std::string expectedMaster{
            "#EXTM3U\n"
            "#EXT-X-VERSION:3\n"
            "#EXT-X-STREAM-INF:BANDWIDTH=496000,RESOLUTION=426x240\n"
            "240/index.m3u8\n"
            "#EXT-X-STREAM-INF:BANDWIDTH=896000,RESOLUTION=852x480\n"
            "480/index.m3u8\n"
            "#EXT-X-STREAM-INF:BANDWIDTH=1628000,RESOLUTION=1280x720\n"
            "720/index.m3u8\n"
        };
        EXPECT_EQ(_service->getMasterPlaylist(videoId), expectedMaster);
        EXPECT_EQ(getObject(storage::keys::getMasterPlaylistKey(videoId)), expectedMaster);

        EXPECT_EQ(_queue->getCount(), 0);
        EXPECT_TRUE(std::filesystem::is_empty(_tmpDir / "work" / "jobs"));
    }

    TEST_F(TranscodeWorkerTest, partialFailure)
    {
        _transcoder.setFailingHeights({ 480 });

        const core::UUID videoId{ importVideo() };
        const core::UUID jobId{ _service->submitJob(videoId, ladder) };

        EXPECT_EQ(processNext(), TranscodeWorker::Result::Done);

        const JobInfo job{ _service->getJobStatus(jobId) };
        EXPECT_EQ(job.status, db::JobStatus::Done);
        EXPECT_EQ(getRendition(job, 240).status, db::RenditionStatus::Ready);
        EXPECT_EQ(getRendition(job, 720).status, db::RenditionStatus::Ready);

        const RenditionInfo& failed{ getRendition(job, 480) };
        EXPECT_EQ(failed.status, db::RenditionStatus::Failed);
        EXPECT_NE(failed.error.find("Conversion failed for 480p"), std::string::npos);
        EXPECT_TRUE(failed.key.empty());

        const std::string master{ _service->getMasterPlaylist(videoId) };
        EXPECT_NE(master.find("240/index.m3u8\n"), std::string::npos);
        EXPECT_NE(master.find("720/index.m3u8\n"), std::string::npos);
        EXPECT_EQ(master.find("480/index.m3u8"), std::string::npos);
        EXPECT_FALSE(_objectStore->stat(storage::keys::getVariantPlaylistKey(videoId, 480)));
    }

    TEST_F(TranscodeWorkerTest, allRenditionsFailed)
    {
        _transcoder.setFailingHeights({ 240, 480, 720 });

        const core::UUID videoId{ importVideo() };
        const core::UUID jobId{ _service->submitJob(videoId, ladder) };

        EXPECT_EQ(processNext(), TranscodeWorker::Result::Failed);

        const JobInfo job{ _service->getJobStatus(jobId) };
        EXPECT_EQ(job.status, db::JobStatus::Failed);
        EXPECT_EQ(job.error.rfind("All renditions failed: 240: ", 0), 0);
        EXPECT_NE(job.error.find("480: "), std::string::npos);
        EXPECT_NE(job.error.find("720: "), std::string::npos);
        for (const RenditionInfo& rendition : job.renditions)
        {
            EXPECT_EQ(rendition.status, db::RenditionStatus::Failed);
            EXPECT_FALSE(rendition.error.empty());
        }

        EXPECT_FALSE(_objectStore->stat(storage::keys::getMasterPlaylistKey(videoId)));
        EXPECT_THROW(_service->getMasterPlaylist(videoId), NotReadyException);
    }

    TEST_F(TranscodeWorkerTest, parallelEncodes)
    {
        _transcoder.setFailingHeights({ 720 });

        const core::UUID videoId{ importVideo() };
        const std::vector<unsigned> profiles{ 240, 360, 480, 720, 1080 };
        const core::UUID jobId{ _service->submitJob(videoId, profiles) };

        EXPECT_EQ(processNext(3), TranscodeWorker::Result::Done);

        const JobInfo job{ _service->getJobStatus(jobId) };
        EXPECT_EQ(job.status, db::JobStatus::Done);
        ASSERT_EQ(job.renditions.size(), 5);
        for (const RenditionInfo& rendition : job.renditions)
            EXPECT_EQ(rendition.status, rendition.height == 720 ? db::RenditionStatus::Failed : db::RenditionStatus::Ready);
        EXPECT_EQ(_transcoder.getCallCount(), 5);
    }

    TEST_F(TranscodeWorkerTest, missingSource)
    {
        const core::UUID videoId{ importVideo() };
        const core::UUID jobId{ _service->submitJob(videoId, ladder) };

        std::filesystem::remove(_tmpDir / "objects" / "source" / (std::string{ videoId.getAsString() } + ".mp4"));

        EXPECT_EQ(processNext(), TranscodeWorker::Result::Failed);

        const JobInfo job{ _service->getJobStatus(jobId) };
        EXPECT_EQ(job.status, db::JobStatus::Failed);
        EXPECT_FALSE(job.error.empty());
        for (const RenditionInfo& rendition : job.renditions)
        {
            EXPECT_EQ(rendition.status, db::RenditionStatus::Failed);
            EXPECT_EQ(rendition.error, job.error);
        }
        EXPECT_EQ(_transcoder.getCallCount(), 0);
    }

    TEST_F(TranscodeWorkerTest, malformedDescriptor)
    {
        _queue->push("{not a descriptor");

        EXPECT_EQ(processNext(), TranscodeWorker::Result::Skipped);
        EXPECT_EQ(_queue->getCount(), 0);
    }

    TEST_F(TranscodeWorkerTest, unknownJob)
    {
        _queue->push(R"({"job_id": "9b0f5d8e-1c2a-4b3c-8d4e-5f6a7b8c9d0e", "video_id": "3f6b5a1e-2c4d-4e8f-9a0b-1c2d3e4f5a6b", "profiles": [240]})");

        EXPECT_EQ(processNext(), TranscodeWorker::Result::Skipped);
        EXPECT_EQ(_queue->getCount(), 0);
        EXPECT_EQ(_transcoder.getCallCount(), 0);
    }

    TEST_F(TranscodeWorkerTest, completedJobRedelivered)
    {
        const core::UUID videoId{ importVideo() };
        const core::UUID jobId{ _service->submitJob(videoId, ladder) };

        std::string payload;
        {
            const std::optional<queue::Delivery> delivery{ _queue->pop(std::chrono::milliseconds{ 0 }) };
            ASSERT_TRUE(delivery);
            payload = delivery->payload;
            EXPECT_TRUE(_queue->ack(*delivery));
        }

        _queue->push(payload);
        EXPECT_EQ(processNext(), TranscodeWorker::Result::Done);
        EXPECT_EQ(_transcoder.getCallCount(), 3);

        _queue->push(payload);
        EXPECT_EQ(processNext(), TranscodeWorker::Result::Skipped);
        EXPECT_EQ(_transcoder.getCallCount(), 3);
        EXPECT_EQ(_service->getJobStatus(jobId).status, db::JobStatus::Done);
    }

    TEST_F(TranscodeWorkerTest, cancelBeforeProcessing)
    {
        const core::UUID videoId{ importVideo() };
        const core::UUID jobId{ _service->submitJob(videoId, ladder) };

        EXPECT_TRUE(_service->cancelJob(jobId));
        EXPECT_EQ(processNext(), TranscodeWorker::Result::Failed);

        const JobInfo job{ _service->getJobStatus(jobId) };
        EXPECT_EQ(job.status, db::JobStatus::Failed);
        EXPECT_EQ(job.error, "Cancelled");
        for (const RenditionInfo& rendition : job.renditions)
            EXPECT_EQ(rendition.status, db::RenditionStatus::Failed);
        EXPECT_EQ(_transcoder.getCallCount(), 0);

        EXPECT_FALSE(_service->cancelJob(jobId));
    }

    TEST_F(TranscodeWorkerTest, cancelDuringEncode)
    {
        const core::UUID videoId{ importVideo() };
        const core::UUID jobId{ _service->submitJob(videoId, ladder) };

        _transcoder.setHook([&](unsigned height, const av::IHlsTranscoder::ShouldAbortCallback& shouldAbort) {
            if (height != 480)
                return;

            EXPECT_TRUE(_service->cancelJob(jobId));
            waitForAbort(shouldAbort);
        });

        EXPECT_EQ(processNext(), TranscodeWorker::Result::Failed);

        const JobInfo job{ _service->getJobStatus(jobId) };
        EXPECT_EQ(job.status, db::JobStatus::Failed);
        EXPECT_EQ(job.error, "Cancelled");
        EXPECT_EQ(getRendition(job, 240).status, db::RenditionStatus::Ready);
        EXPECT_EQ(getRendition(job, 480).status, db::RenditionStatus::Failed);
        EXPECT_EQ(getRendition(job, 720).status, db::RenditionStatus::Failed);

        // no encode started after the cancellation
        EXPECT_EQ(_transcoder.getCallCount(720), 0);
        EXPECT_FALSE(_objectStore->stat(storage::keys::getMasterPlaylistKey(videoId)));
    }

    TEST_F(TranscodeWorkerTest, interruptedJobIsResumed)
    {
        const core::UUID videoId{ importVideo() };
        const core::UUID jobId{ _service->submitJob(videoId, ladder) };

        std::atomic<bool> stop{};
        _transcoder.setHook([&](unsigned height, const av::IHlsTranscoder::ShouldAbortCallback& shouldAbort) {
            if (height == 480 && _transcoder.getCallCount(480) == 1)
            {
                stop = true;
                waitForAbort(shouldAbort);
            }
        });

        EXPECT_EQ(processNext(1, [&] { return stop.load(); }), TranscodeWorker::Result::Interrupted);
        {
            const JobInfo job{ _service->getJobStatus(jobId) };
            EXPECT_EQ(job.status, db::JobStatus::Running);
            EXPECT_EQ(getRendition(job, 240).status, db::RenditionStatus::Ready);
            EXPECT_EQ(getRendition(job, 480).status, db::RenditionStatus::Running);
            EXPECT_EQ(getRendition(job, 720).status, db::RenditionStatus::Running);
        }
        EXPECT_TRUE(std::filesystem::is_empty(_tmpDir / "work" / "jobs"));

        // lease expires, the descriptor is delivered again
        EXPECT_EQ(_queue->getAvailableCount(), 0);
        std::this_thread::sleep_for(leaseDuration + std::chrono::milliseconds{ 200 });
        EXPECT_TRUE(_queue->reclaimExpiredLeases(3).empty());

        EXPECT_EQ(processNext(), TranscodeWorker::Result::Done);

        const JobInfo job{ _service->getJobStatus(jobId) };
        EXPECT_EQ(job.status, db::JobStatus::Done);
        for (const RenditionInfo& rendition : job.renditions)
            EXPECT_EQ(rendition.status, db::RenditionStatus::Ready);

        EXPECT_EQ(_transcoder.getCallCount(240), 1);
        EXPECT_EQ(_transcoder.getCallCount(480), 2);
        EXPECT_EQ(_transcoder.getCallCount(720), 1);

        const std::string master{ _service->getMasterPlaylist(videoId) };
        EXPECT_NE(master.find("240/index.m3u8\n"), std::string::npos);
        EXPECT_NE(master.find("480/index.m3u8\n"), std::string::npos);
        EXPECT_NE(master.find("720/index.m3u8\n"), std::string::npos);
        EXPECT_EQ(_queue->getCount(), 0);
    }

    TEST_F(TranscodeWorkerTest, variantUploadFailure)
    {
        const core::UUID videoId{ importVideo() };
        const core::UUID jobId{ _service->submitJob(videoId, ladder) };

        const std::string playlistKey{ storage::keys::getVariantPlaylistKey(videoId, 480) };
        const std::string failingPrefix{ playlistKey.substr(0, playlistKey.rfind('/') + 1) };
        _faultyObjectStore.setPutHook([&](std::string_view key) {
            if (key.starts_with(failingPrefix))
                throw storage::StorageUnavailableException{ "Connection refused" };
        });

        EXPECT_EQ(processNext(), TranscodeWorker::Result::Done);

        const JobInfo job{ _service->getJobStatus(jobId) };
        EXPECT_EQ(job.status, db::JobStatus::Done);
        EXPECT_EQ(getRendition(job, 240).status, db::RenditionStatus::Ready);
        EXPECT_EQ(getRendition(job, 720).status, db::RenditionStatus::Ready);

        const RenditionInfo& failed{ getRendition(job, 480) };
        EXPECT_EQ(failed.status, db::RenditionStatus::Failed);
        EXPECT_NE(failed.error.find("Connection refused"), std::string::npos);

        const std::string master{ _service->getMasterPlaylist(videoId) };
        EXPECT_NE(master.find("240/index.m3u8\n"), std::string::npos);
        EXPECT_NE(master.find("720/index.m3u8\n"), std::string::npos);
        EXPECT_EQ(master.find("480/index.m3u8"), std::string::npos);
    }

    TEST_F(TranscodeWorkerTest, masterUploadFailure)
    {
        const core::UUID videoId{ importVideo() };
        const core::UUID jobId{ _service->submitJob(videoId, ladder) };

        const std::string masterKey{ storage::keys::getMasterPlaylistKey(videoId) };
        std::atomic<bool> storeDown{ true };
        _faultyObjectStore.setPutHook([&](std::string_view key) {
            if (storeDown && key == masterKey)
                throw storage::StorageUnavailableException{ "Connection refused" };
        });

        EXPECT_EQ(processNext(), TranscodeWorker::Result::Interrupted);
        {
            const JobInfo job{ _service->getJobStatus(jobId) };
            EXPECT_EQ(job.status, db::JobStatus::Running);
            for (const RenditionInfo& rendition : job.renditions)
                EXPECT_EQ(rendition.status, db::RenditionStatus::Ready);
        }
        EXPECT_FALSE(_objectStore->stat(masterKey));
        EXPECT_EQ(_queue->getCount(), 1);
        EXPECT_THROW(_service->getMasterPlaylist(videoId), NotReadyException);

        storeDown = false;
        std::this_thread::sleep_for(leaseDuration + std::chrono::milliseconds{ 200 });
        EXPECT_TRUE(_queue->reclaimExpiredLeases(3).empty());

        EXPECT_EQ(processNext(), TranscodeWorker::Result::Done);
        EXPECT_EQ(_service->getJobStatus(jobId).status, db::JobStatus::Done);
        EXPECT_TRUE(_objectStore->stat(masterKey));

        // ready renditions are not encoded again
        EXPECT_EQ(_transcoder.getCallCount(), 3);
        EXPECT_EQ(_queue->getCount(), 0);
    }

    TEST_F(TranscodeWorkerTest, cancelWhileCompleting)
    {
        const core::UUID videoId{ importVideo() };
        const core::UUID jobId{ _service->submitJob(videoId, ladder) };

        const std::string masterKey{ storage::keys::getMasterPlaylistKey(videoId) };
        _faultyObjectStore.setPutHook([&](std::string_view key) {
            if (key == masterKey)
                EXPECT_TRUE(_service->cancelJob(jobId));
        });

        EXPECT_EQ(processNext(), TranscodeWorker::Result::Failed);

        const JobInfo job{ _service->getJobStatus(jobId) };
        EXPECT_EQ(job.status, db::JobStatus::Failed);
        EXPECT_EQ(job.error, "Cancelled");
        // status never regresses
        for (const RenditionInfo& rendition : job.renditions)
            EXPECT_EQ(rendition.status, db::RenditionStatus::Ready);

        EXPECT_THROW(_service->getMasterPlaylist(videoId), NotReadyException);
        EXPECT_FALSE(_service->cancelJob(jobId));
    }

    TEST_F(TranscodeWorkerTest, concurrentAttemptsUseDistinctWorkingAreas)
    {
        const core::UUID videoId{ importVideo() };
        const std::vector<unsigned> profiles{ 240 };
        const core::UUID jobId{ _service->submitJob(videoId, profiles) };

        std::promise<void> firstEncodeStarted;
        std::promise<void> secondAttemptDone;
        const std::shared_future<void> secondAttemptDoneFuture{ secondAttemptDone.get_future() };
        std::atomic<bool> firstCall{ true };
        _transcoder.setHook([&](unsigned, const av::IHlsTranscoder::ShouldAbortCallback&) {
            if (!firstCall.exchange(false))
                return;

            firstEncodeStarted.set_value();
            secondAttemptDoneFuture.wait_for(std::chrono::seconds{ 10 });
        });

        const std::optional<queue::Delivery> firstDelivery{ _queue->pop(std::chrono::milliseconds{ 0 }) };
        ASSERT_TRUE(firstDelivery);

        std::atomic<TranscodeWorker::Result> firstResult{ TranscodeWorker::Result::Skipped };
        std::thread firstAttempt{ [&] {
            TranscodeWorker worker{ *_db, _faultyObjectStore, _transcoder, _tmpDir / "work", 1 };
            firstResult = worker.process(firstDelivery->payload, firstDelivery->leaseToken, [] { return false; });
        } };
        firstEncodeStarted.get_future().wait();

        // the first attempt stalls past its lease, the descriptor is delivered again
        std::this_thread::sleep_for(leaseDuration + std::chrono::milliseconds{ 200 });
        EXPECT_TRUE(_queue->reclaimExpiredLeases(3).empty());
        EXPECT_EQ(processNext(), TranscodeWorker::Result::Done);

        secondAttemptDone.set_value();
        firstAttempt.join();

        // the second attempt did not remove the source of the first one
        EXPECT_EQ(firstResult.load(), TranscodeWorker::Result::Done);
        EXPECT_FALSE(_queue->ack(*firstDelivery));

        const JobInfo job{ _service->getJobStatus(jobId) };
        EXPECT_EQ(job.status, db::JobStatus::Done);
        EXPECT_EQ(getRendition(job, 240).status, db::RenditionStatus::Ready);
        EXPECT_EQ(_transcoder.getCallCount(240), 2);
        EXPECT_TRUE(std::filesystem::is_empty(_tmpDir / "work" / "jobs"));
        EXPECT_EQ(_queue->getCount(), 0);
    }
} // namespace hlsforge::transcoding::tests
