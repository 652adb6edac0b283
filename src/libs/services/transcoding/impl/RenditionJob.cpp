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

#include "RenditionJob.hpp"

#include <fstream>

#include "av/Exception.hpp"
#include "av/IHlsTranscoder.hpp"
#include "core/ILogger.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/Rendition.hpp"
#include "storage/ContentType.hpp"
#include "storage/IObjectStore.hpp"
#include "storage/KeyLayout.hpp"

#include "services/transcoding/Exception.hpp"

namespace hlsforge::transcoding
{
    RenditionJob::RenditionJob(const Context& context, unsigned height)
        : _context{ context }
        , _height{ height }
    {
    }

    void RenditionJob::run()
    {
        try
        {
            encodeAndUpload();
            _outcome = Outcome::Ready;
        }
        catch (const av::EncodeAbortedException&)
        {
            HLSFORGE_LOG(TRANSCODING, INFO, "Rendition " << _height << "p of video " << _context.videoId << " aborted");
            _outcome = Outcome::Aborted;
        }
        catch (const std::exception& e)
        {
            HLSFORGE_LOG(TRANSCODING, ERROR, "Rendition " << _height << "p of video " << _context.videoId << " failed: " << e.what());
            recordFailure(e.what());
        }
    }

    void RenditionJob::encodeAndUpload()
    {
        const av::TranscodeParameters parameters{
            .inputFile = _context.sourceFile,
            .outputDirectory = _context.workingDir / std::to_string(_height),
            .height = _height,
        };

        const av::TranscodeResult result{ _context.transcoder.transcode(parameters, _context.shouldAbort) };

        // segments first: the playlist must never reference missing segments
        for (const std::filesystem::path& segmentFile : result.segmentFiles)
            uploadFile(segmentFile, storage::keys::getSegmentKey(_context.videoId, _height, segmentFile.filename().string()));

        const std::string playlistKey{ storage::keys::getVariantPlaylistKey(_context.videoId, _height) };
        uploadFile(result.playlistFile, playlistKey);

        db::Session& session{ _context.db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        db::Rendition::pointer rendition{ db::Rendition::find(session, _context.jobId, _height) };
        if (!rendition)
            throw Exception{ "Rendition " + std::to_string(_height) + "p not found" };

        // a concurrent attempt of the same job uploaded the same keys
        if (rendition->getStatus() == db::RenditionStatus::Ready)
        {
            HLSFORGE_LOG(TRANSCODING, DEBUG, "Rendition " << _height << "p of video " << _context.videoId << " already ready");
            return;
        }

        rendition.modify()->setReady(playlistKey, result.width);

        HLSFORGE_LOG(TRANSCODING, INFO, "Rendition " << _height << "p of video " << _context.videoId << " ready (" << result.width << "x" << result.height << ", " << result.segmentFiles.size() << " segments)");
    }

    void RenditionJob::uploadFile(const std::filesystem::path& file, const std::string& key)
    {
        std::ifstream ifs{ file, std::ios::binary };
        if (!ifs)
            throw Exception{ "Cannot open '" + file.string() + "'" };

        _context.objectStore.put(key, ifs, storage::getContentType(key));
    }

    void RenditionJob::recordFailure(const std::string& error)
    {
        _outcome = Outcome::Failed;
        _error = error;

        try
        {
            db::Session& session{ _context.db.getTLSSession() };
            auto transaction{ session.createWriteTransaction() };

            db::Rendition::pointer rendition{ db::Rendition::find(session, _context.jobId, _height) };
            if (rendition && !db::isTerminal(rendition->getStatus()))
                rendition.modify()->setStatus(db::RenditionStatus::Failed, error);
        }
        catch (const std::exception& e)
        {
            // the rendition stays non terminal, the job attempt will not be acknowledged
            HLSFORGE_LOG(TRANSCODING, ERROR, "Cannot record failure of rendition " << _height << "p: " << e.what());
        }
    }
} // namespace hlsforge::transcoding
