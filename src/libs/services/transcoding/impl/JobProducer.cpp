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

#include "JobProducer.hpp"

#include <algorithm>
#include <fstream>

#include "core/ILogger.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/Job.hpp"
#include "database/objects/Rendition.hpp"
#include "database/objects/Video.hpp"
#include "queue/IWorkQueue.hpp"
#include "queue/JobDescriptor.hpp"
#include "storage/ContentType.hpp"
#include "storage/IObjectStore.hpp"
#include "storage/KeyLayout.hpp"

#include "services/transcoding/Exception.hpp"

#include "JobUtils.hpp"

namespace hlsforge::transcoding
{
    JobProducer::JobProducer(db::IDb& db, queue::IWorkQueue& queue, storage::IObjectStore& objectStore, const ProducerConfig& config)
        : _db{ db }
        , _queue{ queue }
        , _objectStore{ objectStore }
        , _config{ config }
    {
    }

    core::UUID JobProducer::importVideo(const std::filesystem::path& sourceFile)
    {
        std::error_code ec;
        const std::uintmax_t fileSize{ std::filesystem::file_size(sourceFile, ec) };
        if (ec)
            throw Exception{ "Cannot read source file '" + sourceFile.string() + "': " + ec.message() };
        if (fileSize == 0)
            throw Exception{ "Source file '" + sourceFile.string() + "' is empty" };

        std::ifstream ifs{ sourceFile, std::ios::binary };
        if (!ifs)
            throw Exception{ "Cannot open source file '" + sourceFile.string() + "'" };

        const core::UUID videoId{ core::UUID::generate() };
        const std::string sourceKey{ storage::keys::getSourceKey(videoId) };

        // object first: a video row always has its source
        _objectStore.put(sourceKey, ifs, storage::getContentType(sourceKey));

        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createWriteTransaction() };

            session.create<db::Video>(videoId, sourceKey);
        }

        HLSFORGE_LOG(TRANSCODING, INFO, "Imported video " << videoId << " from '" << sourceFile.string() << "' (" << fileSize << " bytes)");

        return videoId;
    }

    core::UUID JobProducer::submitJob(const core::UUID& videoId, std::span<const unsigned> requestedHeights)
    {
        const std::vector<av::Profile> profiles{ resolveProfiles(requestedHeights.empty() ? std::span<const unsigned>{ _config.defaultLadder } : requestedHeights) };

        const core::UUID jobId{ core::UUID::generate() };
        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createWriteTransaction() };

            const db::Video::pointer video{ db::Video::find(session, videoId) };
            if (!video)
                throw NotFoundException{ "Video " + std::string{ videoId.getAsString() } + " not found" };

            const db::Job::pointer job{ session.create<db::Job>(jobId, video) };
            for (const av::Profile& profile : profiles)
                session.create<db::Rendition>(job, profile.height, av::getBandwidth(profile));
        }

        queue::JobDescriptor descriptor{
            .jobId = jobId,
            .videoId = videoId,
            .profiles = {},
        };
        std::transform(std::cbegin(profiles), std::cend(profiles), std::back_inserter(descriptor.profiles), [](const av::Profile& profile) { return profile.height; });

        try
        {
            _queue.push(queue::toJson(descriptor));
        }
        catch (const std::exception& e)
        {
            HLSFORGE_LOG(TRANSCODING, ERROR, "Cannot enqueue job " << jobId << ": " << e.what());
            abandonJob(jobId, std::string{ "Enqueue failed: " } + e.what());
            throw;
        }

        HLSFORGE_LOG(TRANSCODING, INFO, "Submitted job " << jobId << " for video " << videoId << " (" << profiles.size() << " profiles)");

        return jobId;
    }

    std::vector<av::Profile> JobProducer::resolveProfiles(std::span<const unsigned> requestedHeights) const
    {
        std::vector<av::Profile> profiles;

        for (const unsigned height : requestedHeights)
        {
            const std::optional<av::Profile> profile{ av::findProfile(height) };
            if (!profile)
                throw InvalidProfileException{ height };

            if (std::none_of(std::cbegin(profiles), std::cend(profiles), [&](const av::Profile& p) { return p.height == height; }))
                profiles.push_back(*profile);
        }

        return profiles;
    }

    void JobProducer::abandonJob(const core::UUID& jobId, std::string_view error)
    {
        try
        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createWriteTransaction() };

            if (db::Job::pointer job{ db::Job::find(session, jobId) })
                utils::failJob(session, job, error);
        }
        catch (const std::exception& e)
        {
            HLSFORGE_LOG(TRANSCODING, ERROR, "Cannot mark job " << jobId << " as failed: " << e.what());
        }
    }
} // namespace hlsforge::transcoding
