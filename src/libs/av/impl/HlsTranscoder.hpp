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

#include <string>

#include "av/IHlsTranscoder.hpp"

namespace hlsforge::av
{
    struct Profile;

    class HlsTranscoder : public IHlsTranscoder
    {
    public:
        HlsTranscoder(const std::filesystem::path& ffmpegFile, std::chrono::seconds timeout);
        ~HlsTranscoder() override = default;
        HlsTranscoder(const HlsTranscoder&) = delete;
        HlsTranscoder& operator=(const HlsTranscoder&) = delete;

    private:
        TranscodeResult transcode(const TranscodeParameters& parameters, const ShouldAbortCallback& shouldAbort) override;

        std::vector<std::string> buildArgs(const TranscodeParameters& parameters, const Profile& profile, unsigned width) const;
        std::string runEncoder(std::size_t debugId, const std::vector<std::string>& args, const ShouldAbortCallback& shouldAbort) const;
        static std::vector<std::filesystem::path> checkOutput(const std::filesystem::path& playlistFile, const std::string& output);

        const std::filesystem::path _ffmpegFile;
        const std::chrono::seconds _timeout;
    };
} // namespace hlsforge::av
