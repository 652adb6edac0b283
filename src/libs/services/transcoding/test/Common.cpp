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

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

#include "av/Exception.hpp"
#include "av/Profile.hpp"
#include "database/Session.hpp"
#include "queue/Exception.hpp"

namespace hlsforge::transcoding::tests
{
    namespace
    {
        std::filesystem::path createTmpDir()
        {
            const std::filesystem::path path{ std::filesystem::temp_directory_path() / ("hlsforge-test-" + std::string{ core::UUID::generate().getAsString() }) };
            std::filesystem::create_directories(path);
            return path;
        }

        void writeFile(const std::filesystem::path& path, std::string_view content)
        {
            std::ofstream ofs{ path, std::ios::binary };
            ofs << content;
        }
    } // namespace

    void waitForAbort(const av::IHlsTranscoder::ShouldAbortCallback& shouldAbort)
    {
        const auto deadline{ std::chrono::steady_clock::now() + std::chrono::seconds{ 10 } };
        while (!shouldAbort())
        {
            if (std::chrono::steady_clock::now() > deadline)
                throw av::EncodeException{ "Not aborted" };
            std::this_thread::sleep_for(std::chrono::milliseconds{ 10 });
        }

        throw av::EncodeAbortedException{};
    }

    void FaultyWorkQueue::push(std::string_view payload)
    {
        if (_pushFailing)
            throw queue::Exception{ "Queue unreachable" };

        _queue.push(payload);
    }

    bool FaultyWorkQueue::extendLease(const queue::Delivery& delivery)
    {
        if (_leaseExtensionRefused)
            return false;

        return _queue.extendLease(delivery);
    }

    void FaultyObjectStore::setPutHook(PutHook hook)
    {
        const std::scoped_lock lock{ _mutex };
        _putHook = std::move(hook);
    }

    void FaultyObjectStore::put(std::string_view key, std::istream& is, std::string_view contentType)
    {
        PutHook hook;
        {
            const std::scoped_lock lock{ _mutex };
            hook = _putHook;
        }

        if (hook)
            hook(key);

        _objectStore.put(key, is, contentType);
    }

    std::size_t FakeTranscoder::getCallCount(unsigned height) const
    {
        const std::scoped_lock lock{ _mutex };

        auto it{ _callCounts.find(height) };
        return it == std::cend(_callCounts) ? 0 : it->second;
    }

    std::size_t FakeTranscoder::getCallCount() const
    {
        const std::scoped_lock lock{ _mutex };

        std::size_t count{};
        for (const auto& [height, heightCount] : _callCounts)
            count += heightCount;
        return count;
    }

    av::TranscodeResult FakeTranscoder::transcode(const av::TranscodeParameters& parameters, const ShouldAbortCallback& shouldAbort)
    {
        {
            const std::scoped_lock lock{ _mutex };
            _callCounts[parameters.height]++;
        }

        if (!std::filesystem::is_regular_file(parameters.inputFile))
            throw av::EncodeException{ "Cannot open input", parameters.inputFile.string() };

        if (_hook)
            _hook(parameters.height, shouldAbort);

        // the input is read during the whole encode
        if (!std::filesystem::is_regular_file(parameters.inputFile))
            throw av::EncodeException{ "Input vanished", parameters.inputFile.string() };

        if (_failingHeights.contains(parameters.height))
            throw av::EncodeException{ "Encoder exited with code 1", "Conversion failed for " + std::to_string(parameters.height) + "p" };

        std::filesystem::create_directories(parameters.outputDirectory);

        av::TranscodeResult result;
        result.playlistFile = parameters.outputDirectory / "index.m3u8";

        std::ostringstream playlist;
        playlist << "#EXTM3U\n#EXT-X-VERSION:3\n#EXT-X-TARGETDURATION:4\n#EXT-X-PLAYLIST-TYPE:VOD\n";
        for (std::size_t i{}; i < 2; ++i)
        {
            const std::string segmentName{ "seg_" + std::to_string(i) + ".ts" };
            writeFile(parameters.outputDirectory / segmentName, "segment " + std::to_string(i) + " of " + std::to_string(parameters.height) + "p");
            result.segmentFiles.push_back(parameters.outputDirectory / segmentName);
            playlist << "#EXTINF:4.000000,\n"
                     << segmentName << "\n";
        }
        playlist << "#EXT-X-ENDLIST\n";
        writeFile(result.playlistFile, playlist.str());

        result.height = parameters.height;
        result.width = av::computeOutputWidth(1280, 720, parameters.height);
        result.bandwidth = av::getBandwidth(av::findProfile(parameters.height).value());

        return result;
    }

    TranscodingTest::TranscodingTest()
        : _tmpDir{ createTmpDir() }
        , _db{ db::createDb(_tmpDir / "hlsforge.db", 16) }
        , _queue{ queue::createWorkQueue(*_db, queue::WorkQueueConfig{ leaseDuration, std::chrono::milliseconds{ 10 } }) }
        , _objectStore{ storage::createFileSystemObjectStore(_tmpDir / "objects") }
        , _service{ createTranscodeService(*_db, _faultyQueue, _faultyObjectStore, ProducerConfig{}) }
    {
        db::Session session{ *_db };
        session.prepareTablesIfNeeded();
        session.createIndexesIfNeeded();
    }

    TranscodingTest::~TranscodingTest()
    {
        _service.reset();
        _queue.reset();
        _db.reset();

        std::error_code ec;
        std::filesystem::remove_all(_tmpDir, ec);
    }

    core::UUID TranscodingTest::importVideo(std::string_view content)
    {
        const std::filesystem::path sourceFile{ _tmpDir / "upload.mp4" };
        writeFile(sourceFile, content);

        return _service->importVideo(sourceFile);
    }

    std::string TranscodingTest::getObject(std::string_view key)
    {
        std::ostringstream oss;
        _objectStore->get(key, oss);
        return oss.str();
    }

    TranscodeWorker::Result TranscodingTest::processNext(std::size_t encodeConcurrency, const TranscodeWorker::ShouldStopCallback& shouldStop)
    {
        const std::optional<queue::Delivery> delivery{ _queue->pop(std::chrono::milliseconds{ 0 }) };
        if (!delivery)
            throw std::runtime_error{ "Work queue is empty" };

        TranscodeWorker worker{ *_db, _faultyObjectStore, _transcoder, _tmpDir / "work", encodeConcurrency };
        const TranscodeWorker::Result result{ worker.process(delivery->payload, delivery->leaseToken, shouldStop) };
        if (result != TranscodeWorker::Result::Interrupted)
            EXPECT_TRUE(_queue->ack(*delivery));

        return result;
    }

    const RenditionInfo& TranscodingTest::getRendition(const JobInfo& job, unsigned height)
    {
        for (const RenditionInfo& rendition : job.renditions)
        {
            if (rendition.height == height)
                return rendition;
        }

        throw std::runtime_error{ "No rendition " + std::to_string(height) };
    }
} // namespace hlsforge::transcoding::tests
