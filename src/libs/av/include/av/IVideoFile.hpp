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
#include <memory>
#include <optional>
#include <string>

namespace hlsforge::av
{
    struct ContainerInfo
    {
        std::size_t bitrate{};
        std::string name;
        std::chrono::milliseconds duration{};
    };

    struct VideoStreamInfo
    {
        std::size_t index{};
        unsigned width{};
        unsigned height{};
        std::string codecName;
    };

    class IVideoFile
    {
    public:
        virtual ~IVideoFile() = default;

        virtual const std::filesystem::path& getPath() const = 0;
        virtual ContainerInfo getContainerInfo() const = 0;
        virtual std::optional<VideoStreamInfo> getBestVideoStreamInfo() const = 0; // none if failure/unknown
        virtual bool hasAudioStream() const = 0;
    };

    // Throws av::Exception if the file cannot be opened or inspected
    std::unique_ptr<IVideoFile> parseVideoFile(const std::filesystem::path& p);
} // namespace hlsforge::av
