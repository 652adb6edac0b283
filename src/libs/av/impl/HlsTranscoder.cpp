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

#include "HlsTranscoder.hpp"

#include <array>
#include <atomic>
#include <fstream>

#include "core/IChildProcessManager.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "hls/Exception.hpp"
#include "hls/VariantPlaylist.hpp"

#include "av/Exception.hpp"
#include "av/IVideoFile.hpp"
#include "av/Profile.hpp"

namespace hlsforge::av
{
#define LOG(severity, message) HLSFORGE_LOG(AV, severity, "[" << debugId << "] - " << message)

    namespace
    {
        std::atomic<std::size_t> globalId{};

        constexpr std::size_t maxDiagnosticSize{ 4000 };
        constexpr std::chrono::milliseconds pollInterval{ 100 };
        constexpr std::string_view playlistFileName{ "index.m3u8" };
        constexpr std::string_view segmentFileNamePattern{ "seg_%d.ts" };
        constexpr unsigned segmentDuration{ 4 }; // seconds

        std::string toKbps(unsigned bitrate)
        {
            return std::to_string(bitrate) + "k";
        }
    } // namespace

    std::unique_ptr<IHlsTranscoder> createHlsTranscoder(const std::filesystem::path& ffmpegFile, std::chrono::seconds timeout)
    {
        return std::make_unique<HlsTranscoder>(ffmpegFile, timeout);
    }

    HlsTranscoder::HlsTranscoder(const std::filesystem::path& ffmpegFile, std::chrono::seconds timeout)
        : _ffmpegFile{ ffmpegFile }
        , _timeout{ timeout }
    {
        if (!std::filesystem::exists(_ffmpegFile))
            throw Exception{ "File '" + _ffmpegFile.string() + "' does not exist!" };
    }

    TranscodeResult HlsTranscoder::transcode(const TranscodeParameters& parameters, const ShouldAbortCallback& shouldAbort)
    {
        const std::size_t debugId{ globalId++ };

        const std::optional<Profile> profile{ findProfile(parameters.height) };
        if (!profile)
            throw Exception{ "Unsupported height " + std::to_string(parameters.height) };

        unsigned width{};
        try
        {
            const std::unique_ptr<IVideoFile> videoFile{ parseVideoFile(parameters.inputFile) };
            const std::optional<VideoStreamInfo> streamInfo{ videoFile->getBestVideoStreamInfo() };
            if (!streamInfo)
                throw EncodeException{ "No video stream found in " + parameters.inputFile.string() };

            width = computeOutputWidth(streamInfo->width, streamInfo->height, parameters.height);
        }
        catch (const EncodeException&)
        {
            throw;
        }
        catch (const Exception& e)
        {
            throw EncodeException{ "Cannot inspect " + parameters.inputFile.string(), e.what() };
        }

        std::filesystem::create_directories(parameters.outputDirectory);

        LOG(INFO, "Transcoding " << parameters.inputFile << " to " << width << "x" << parameters.height);

        const std::string output{ runEncoder(debugId, buildArgs(parameters, *profile, width), shouldAbort) };

        TranscodeResult result;
        result.playlistFile = parameters.outputDirectory / playlistFileName;
        result.segmentFiles = checkOutput(result.playlistFile, output);
        result.width = width;
        result.height = parameters.height;
        result.bandwidth = getBandwidth(*profile);

        LOG(DEBUG, "Transcode done: " << result.segmentFiles.size() << " segments");

        return result;
    }

    std::vector<std::string> HlsTranscoder::buildArgs(const TranscodeParameters& parameters, const Profile& profile, unsigned width) const
    {
        std::vector<std::string> args;

        // Make sure we do not rely on input
        args.emplace_back("-hide_banner");
        args.emplace_back("-nostdin");
        args.emplace_back("-loglevel");
        args.emplace_back("warning");
        args.emplace_back("-y");

        args.emplace_back("-i");
        args.emplace_back(parameters.inputFile.string());

        // first video stream, first audio stream if any
        args.emplace_back("-map");
        args.emplace_back("0:v:0");
        args.emplace_back("-map");
        args.emplace_back("0:a:0?");

        args.emplace_back("-vf");
        args.emplace_back("scale=" + std::to_string(width) + ":" + std::to_string(parameters.height));

        args.emplace_back("-c:v");
        args.emplace_back("libx264");
        args.emplace_back("-preset");
        args.emplace_back("veryfast");
        args.emplace_back("-b:v");
        args.emplace_back(toKbps(profile.videoBitrate));
        args.emplace_back("-maxrate");
        args.emplace_back(toKbps(profile.videoBitrate * 11 / 10));
        args.emplace_back("-bufsize");
        args.emplace_back(toKbps(profile.videoBitrate * 2));

        args.emplace_back("-c:a");
        args.emplace_back("aac");
        args.emplace_back("-b:a");
        args.emplace_back(toKbps(profile.audioBitrate));

        args.emplace_back("-f");
        args.emplace_back("hls");
        args.emplace_back("-hls_time");
        args.emplace_back(std::to_string(segmentDuration));
        args.emplace_back("-hls_playlist_type");
        args.emplace_back("vod");
        args.emplace_back("-hls_list_size");
        args.emplace_back("0");
        args.emplace_back("-hls_segment_filename");
        args.emplace_back((parameters.outputDirectory / segmentFileNamePattern).string());

        args.emplace_back((parameters.outputDirectory / playlistFileName).string());

        return args;
    }

    std::string HlsTranscoder::runEncoder(std::size_t debugId, const std::vector<std::string>& args, const ShouldAbortCallback& shouldAbort) const
    {
        LOG(DEBUG, "Dumping args (" << args.size() << ")");
        for (const std::string& arg : args)
            LOG(DEBUG, "Arg = '" << arg << "'");

        std::unique_ptr<core::IChildProcess> childProcess;
        try
        {
            childProcess = core::Service<core::IChildProcessManager>::get()->spawnChildProcess(_ffmpegFile, args);
        }
        catch (const core::ChildProcessException& exception)
        {
            throw EncodeException{ "Cannot execute '" + _ffmpegFile.string() + "'", exception.what() };
        }

        // merged stdout/stderr, only the tail is kept
        std::string output;
        std::array<std::byte, 1024> buffer;

        const auto startTime{ std::chrono::steady_clock::now() };
        while (!childProcess->finished())
        {
            if (shouldAbort && shouldAbort())
            {
                LOG(INFO, "Aborting encode");
                childProcess->kill();
                throw EncodeAbortedException{};
            }

            if (_timeout.count() > 0 && std::chrono::steady_clock::now() - startTime > _timeout)
            {
                LOG(ERROR, "Encode timed out after " << _timeout.count() << " seconds");
                childProcess->kill();
                throw EncodeException{ "Encoder timed out", output };
            }

            if (!childProcess->waitForOutput(pollInterval))
                continue;

            const std::size_t nbBytes{ childProcess->readSome(buffer.data(), buffer.size()) };
            output.append(reinterpret_cast<const char*>(buffer.data()), nbBytes);
            if (output.size() > maxDiagnosticSize)
                output.erase(0, output.size() - maxDiagnosticSize);
        }

        const std::optional<int> exitCode{ childProcess->waitForExit() };
        if (!exitCode)
            throw EncodeException{ "Encoder terminated by a signal", output };
        if (*exitCode != 0)
            throw EncodeException{ "Encoder exited with code " + std::to_string(*exitCode), output };

        return output;
    }

    std::vector<std::filesystem::path> HlsTranscoder::checkOutput(const std::filesystem::path& playlistFile, const std::string& output)
    {
        std::ifstream ifs{ playlistFile };
        if (!ifs)
            throw EncodeException{ "Missing playlist " + playlistFile.string(), output };

        hls::VariantPlaylist playlist;
        try
        {
            playlist = hls::parseVariantPlaylist(ifs);
        }
        catch (const hls::PlaylistParseException& e)
        {
            throw EncodeException{ "Malformed playlist " + playlistFile.string() + " (" + e.what() + ")", output };
        }

        if (playlist.segments.empty())
            throw EncodeException{ "Playlist " + playlistFile.string() + " has no segment", output };

        std::vector<std::filesystem::path> segmentFiles;
        for (const hls::Segment& segment : playlist.segments)
        {
            const std::filesystem::path segmentFile{ playlistFile.parent_path() / segment.uri };
            if (!std::filesystem::is_regular_file(segmentFile))
                throw EncodeException{ "Missing segment " + segmentFile.string(), output };

            segmentFiles.push_back(segmentFile);
        }

        return segmentFiles;
    }
} // namespace hlsforge::av
