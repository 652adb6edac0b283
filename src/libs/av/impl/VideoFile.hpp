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

#include "av/IVideoFile.hpp"

struct AVFormatContext;

namespace hlsforge::av
{
    class VideoFile final : public IVideoFile
    {
    public:
        VideoFile(const std::filesystem::path& p);
        ~VideoFile() override;
        VideoFile(const VideoFile&) = delete;
        VideoFile& operator=(const VideoFile&) = delete;

        const std::filesystem::path& getPath() const override;
        ContainerInfo getContainerInfo() const override;
        std::optional<VideoStreamInfo> getBestVideoStreamInfo() const override;
        bool hasAudioStream() const override;

    private:
        const std::filesystem::path _p;
        AVFormatContext* _context{};
    };
} // namespace hlsforge::av
