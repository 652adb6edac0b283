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
#include <functional>
#include <string>

#include "core/IJob.hpp"
#include "core/UUID.hpp"
#include "database/objects/JobId.hpp"

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

    namespace storage
    {
        class IObjectStore;
    }
} // namespace hlsforge

namespace hlsforge::transcoding
{
    // Encodes one profile of a job, uploads it and records the outcome in the rendition
    class RenditionJob : public core::IJob
    {
    public:
        struct Context
        {
            db::IDb& db;
            storage::IObjectStore& objectStore;
            av::IHlsTranscoder& transcoder;
            std::filesystem::path sourceFile;
            std::filesystem::path workingDir;
            core::UUID videoId;
            db::JobId jobId;
            std::function<bool()> shouldAbort;
        };

        enum class Outcome
        {
            Ready,
            Failed,
            Aborted, // rendition left untouched
        };

        RenditionJob(const Context& context, unsigned height);
        ~RenditionJob() override = default;
        RenditionJob(const RenditionJob&) = delete;
        RenditionJob& operator=(const RenditionJob&) = delete;

        unsigned getHeight() const { return _height; }
        Outcome getOutcome() const { return _outcome; }
        const std::string& getError() const { return _error; }

    private:
        core::LiteralString getName() const override { return "Encode rendition"; }
        void run() override;

        void encodeAndUpload();
        void uploadFile(const std::filesystem::path& file, const std::string& key);
        void recordFailure(const std::string& error);

        const Context& _context;
        const unsigned _height;
        Outcome _outcome{ Outcome::Aborted };
        std::string _error;
    };
} // namespace hlsforge::transcoding
