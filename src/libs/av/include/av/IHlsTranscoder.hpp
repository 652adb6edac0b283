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

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <vector>

namespace hlsforge::av
{
    struct TranscodeParameters
    {
        std::filesystem::path inputFile;
        std::filesystem::path outputDirectory; // receives index.m3u8 and its seg_<n>.ts files
        unsigned height{};                     // must be a supported profile
    };

    struct TranscodeResult
    {
        std::filesystem::path playlistFile;
        std::vector<std::filesystem::path> segmentFiles; // playlist order
        unsigned width{};
        unsigned height{};
        unsigned bandwidth{};
    };

    class IHlsTranscoder
    {
    public:
        virtual ~IHlsTranscoder() = default;

        // Polled while the encoder runs
        using ShouldAbortCallback = std::function<bool()>;

        // Blocking call
        // Throws EncodeException on encoder failure or malformed output, EncodeAbortedException if aborted
        virtual TranscodeResult transcode(const TranscodeParameters& parameters, const ShouldAbortCallback& shouldAbort) = 0;
    };

    // timeout: 0 means unlimited
    std::unique_ptr<IHlsTranscoder> createHlsTranscoder(const std::filesystem::path& ffmpegFile, std::chrono::seconds timeout);
} // namespace hlsforge::av
