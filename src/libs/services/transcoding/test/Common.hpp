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

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <string_view>

#include "av/IHlsTranscoder.hpp"
#include "core/UUID.hpp"
#include "database/IDb.hpp"
#include "queue/IWorkQueue.hpp"
#include "services/transcoding/ITranscodeService.hpp"
#include "storage/IObjectStore.hpp"

#include "TranscodeWorker.hpp"

namespace hlsforge::transcoding::tests
{
    // Writes two segments and a playlist per call, as a 1280x720 source would give
    class FakeTranscoder : public av::IHlsTranscoder
    {
    public:
        // Called before the output is written, may throw
        using Hook = std::function<void(unsigned height, const ShouldAbortCallback& shouldAbort)>;
        void setHook(Hook hook) { _hook = std::move(hook); }
        void setFailingHeights(std::set<unsigned> heights) { _failingHeights = std::move(heights); }

        std::size_t getCallCount(unsigned height) const;
        std::size_t getCallCount() const;

    private:
        av::TranscodeResult transcode(const av::TranscodeParameters& parameters, const ShouldAbortCallback& shouldAbort) override;

        Hook _hook;
        std::set<unsigned> _failingHeights;

        mutable std::mutex _mutex;
        std::map<unsigned, std::size_t> _callCounts;
    };

    // Blocks until aborted, then throws EncodeAbortedException
    void waitForAbort(const av::IHlsTranscoder::ShouldAbortCallback& shouldAbort);

    // Forwards to a real queue, with injectable faults
    class FaultyWorkQueue : public queue::IWorkQueue
    {
    public:
        FaultyWorkQueue(queue::IWorkQueue& queue)
            : _queue{ queue } {}

        void setPushFailing(bool failing) { _pushFailing = failing; }
        void setLeaseExtensionRefused(bool refused) { _leaseExtensionRefused = refused; }

    private:
        void push(std::string_view payload) override;
        std::optional<queue::Delivery> pop(std::chrono::milliseconds timeout) override { return _queue.pop(timeout); }
        bool ack(const queue::Delivery& delivery) override { return _queue.ack(delivery); }
        bool extendLease(const queue::Delivery& delivery) override;
        std::vector<queue::DeadLetter> reclaimExpiredLeases(std::size_t maxDeliveryCount) override { return _queue.reclaimExpiredLeases(maxDeliveryCount); }
        std::size_t getCount() override { return _queue.getCount(); }
        std::size_t getAvailableCount() override { return _queue.getAvailableCount(); }

        queue::IWorkQueue& _queue;
        std::atomic<bool> _pushFailing{};
        std::atomic<bool> _leaseExtensionRefused{};
    };

    // Forwards to a real store, the put hook is called before each put and may throw
    class FaultyObjectStore : public storage::IObjectStore
    {
    public:
        FaultyObjectStore(storage::IObjectStore& objectStore)
            : _objectStore{ objectStore } {}

        using PutHook = std::function<void(std::string_view key)>;
        void setPutHook(PutHook hook);

    private:
        void get(std::string_view key, std::ostream& os) override { _objectStore.get(key, os); }
        void put(std::string_view key, std::istream& is, std::string_view contentType) override;
        std::optional<storage::ObjectInfo> stat(std::string_view key) override { return _objectStore.stat(key); }

        storage::IObjectStore& _objectStore;
        std::mutex _mutex;
        PutHook _putHook;
    };

    class TranscodingTest : public ::testing::Test
    {
    protected:
        TranscodingTest();
        ~TranscodingTest() override;

        core::UUID importVideo(std::string_view content = "source video content");
        std::string getObject(std::string_view key);

        // Processes the next queued descriptor and acks it unless interrupted
        TranscodeWorker::Result processNext(std::size_t encodeConcurrency = 1, const TranscodeWorker::ShouldStopCallback& shouldStop = [] { return false; });

        static const RenditionInfo& getRendition(const JobInfo& job, unsigned height);

        static constexpr std::chrono::seconds leaseDuration{ 2 };

        const std::filesystem::path _tmpDir;
        std::unique_ptr<db::IDb> _db;
        std::unique_ptr<queue::IWorkQueue> _queue;
        std::unique_ptr<storage::IObjectStore> _objectStore;
        FaultyWorkQueue _faultyQueue{ *_queue };
        FaultyObjectStore _faultyObjectStore{ *_objectStore };
        FakeTranscoder _transcoder;
        std::unique_ptr<ITranscodeService> _service;
    };
} // namespace hlsforge::transcoding::tests
