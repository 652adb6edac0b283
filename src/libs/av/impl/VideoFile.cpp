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

#include "VideoFile.hpp"

extern "C"
{
#define __STDC_CONSTANT_MACROS
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
}

#include <array>

#include "core/ILogger.hpp"

#include "av/Exception.hpp"

namespace hlsforge::av
{
    namespace
    {
        std::string averror_to_string(int error)
        {
            std::array<char, 128> buf = { 0 };

            if (::av_strerror(error, buf.data(), buf.size()) == 0)
                return buf.data();

            return "Unknown error";
        }

        class VideoFileException : public Exception
        {
        public:
            VideoFileException(int avError)
                : Exception{ "VideoFileException: " + averror_to_string(avError) }
            {
            }
        };
    } // namespace

    std::unique_ptr<IVideoFile> parseVideoFile(const std::filesystem::path& p)
    {
        return std::make_unique<VideoFile>(p);
    }

    VideoFile::VideoFile(const std::filesystem::path& p)
        : _p{ p }
    {
        int error{ avformat_open_input(&_context, _p.c_str(), nullptr, nullptr) };
        if (error < 0)
        {
            HLSFORGE_LOG(AV, ERROR, "Cannot open " << _p << ": " << averror_to_string(error));
            throw VideoFileException{ error };
        }

        error = avformat_find_stream_info(_context, nullptr);
        if (error < 0)
        {
            HLSFORGE_LOG(AV, ERROR, "Cannot find stream information on " << _p << ": " << averror_to_string(error));
            avformat_close_input(&_context);
            throw VideoFileException{ error };
        }
    }

    VideoFile::~VideoFile()
    {
        avformat_close_input(&_context);
    }

    const std::filesystem::path& VideoFile::getPath() const
    {
        return _p;
    }

    ContainerInfo VideoFile::getContainerInfo() const
    {
        ContainerInfo info;
        info.bitrate = _context->bit_rate;
        info.duration = std::chrono::milliseconds{ _context->duration == AV_NOPTS_VALUE ? 0 : _context->duration / AV_TIME_BASE * 1'000 };
        info.name = _context->iformat->name;

        return info;
    }

    std::optional<VideoStreamInfo> VideoFile::getBestVideoStreamInfo() const
    {
        const int index{ ::av_find_best_stream(_context,
            AVMEDIA_TYPE_VIDEO,
            -1, // Auto
            -1, // Auto
            nullptr,
            0) };

        if (index < 0)
            return std::nullopt;

        const AVStream* avstream{ _context->streams[index] };
        if (!avstream->codecpar)
        {
            HLSFORGE_LOG(AV, ERROR, "Skipping stream " << index << " since no codecpar is set");
            return std::nullopt;
        }

        VideoStreamInfo info;
        info.index = static_cast<std::size_t>(index);
        info.width = static_cast<unsigned>(avstream->codecpar->width);
        info.height = static_cast<unsigned>(avstream->codecpar->height);
        info.codecName = ::avcodec_get_name(avstream->codecpar->codec_id);

        return info;
    }

    bool VideoFile::hasAudioStream() const
    {
        return ::av_find_best_stream(_context, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0) >= 0;
    }
} // namespace hlsforge::av
