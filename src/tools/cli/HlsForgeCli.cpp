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

#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "core/String.hpp"
#include "core/SystemPaths.hpp"
#include "core/UUID.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/Types.hpp"
#include "queue/IWorkQueue.hpp"
#include "services/transcoding/Config.hpp"
#include "services/transcoding/ITranscodeService.hpp"
#include "storage/IObjectStore.hpp"

namespace hlsforge
{
    namespace
    {
        core::UUID parseId(const std::vector<std::string>& args, std::string_view what)
        {
            if (args.size() != 1)
                throw std::runtime_error{ "Expected exactly one " + std::string{ what } + " id" };

            const std::optional<core::UUID> id{ core::UUID::fromString(args.front()) };
            if (!id)
                throw std::runtime_error{ "Invalid " + std::string{ what } + " id '" + args.front() + "'" };

            return *id;
        }

        std::vector<unsigned> parseProfiles(std::string_view str)
        {
            std::vector<unsigned> profiles;

            for (std::string_view entry : core::stringUtils::splitString(str, ','))
            {
                entry = core::stringUtils::stringTrim(entry);
                if (entry.empty())
                    continue;

                const std::optional<unsigned> height{ core::stringUtils::readAs<unsigned>(entry) };
                if (!height)
                    throw std::runtime_error{ "Invalid profile '" + std::string{ entry } + "'" };

                profiles.push_back(*height);
            }

            return profiles;
        }

        void dumpJob(std::ostream& os, const transcoding::JobInfo& job)
        {
            os << "Job " << job.jobId << " (video " << job.videoId << "): " << db::toString(job.status);
            if (!job.error.empty())
                os << " - " << job.error;
            os << "\n";
            os << "  created: " << core::stringUtils::toISO8601String(job.createdAt) << ", updated: " << core::stringUtils::toISO8601String(job.updatedAt);
            if (job.cancelRequested)
                os << ", cancel requested";
            os << "\n";

            for (const transcoding::RenditionInfo& rendition : job.renditions)
            {
                os << "  " << std::setw(5) << std::left << (std::to_string(rendition.height) + "p") << " " << std::setw(8) << db::toString(rendition.status) << std::right;
                switch (rendition.status)
                {
                case db::RenditionStatus::Ready:
                    os << " " << rendition.width << "x" << rendition.height << ", " << rendition.bandwidth << " bps, " << rendition.key;
                    break;
                case db::RenditionStatus::Failed:
                    os << " " << rendition.error;
                    break;
                case db::RenditionStatus::Queued:
                case db::RenditionStatus::Running:
                    break;
                }
                os << "\n";
            }
        }

        int processCommand(transcoding::ITranscodeService& service, const std::string& command, const std::vector<std::string>& args, const boost::program_options::variables_map& vm)
        {
            if (command == "import")
            {
                if (args.size() != 1)
                    throw std::runtime_error{ "Expected exactly one file" };

                std::cout << service.importVideo(args.front()) << std::endl;
            }
            else if (command == "submit")
            {
                const core::UUID videoId{ parseId(args, "video") };
                std::vector<unsigned> profiles;
                if (vm.count("profiles"))
                    profiles = parseProfiles(vm["profiles"].as<std::string>());

                std::cout << service.submitJob(videoId, profiles) << std::endl;
            }
            else if (command == "cancel")
            {
                const core::UUID jobId{ parseId(args, "job") };
                if (service.cancelJob(jobId))
                    std::cout << "Cancellation requested" << std::endl;
                else
                    std::cout << "Job is already over" << std::endl;
            }
            else if (command == "status")
            {
                dumpJob(std::cout, service.getJobStatus(parseId(args, "job")));
            }
            else if (command == "summary")
            {
                const transcoding::VideoSummary summary{ service.getVideoSummary(parseId(args, "video")) };

                std::cout << "Video " << summary.video.videoId << "\n";
                std::cout << "  source: " << summary.video.sourceKey << "\n";
                std::cout << "  created: " << core::stringUtils::toISO8601String(summary.video.createdAt) << "\n";
                if (summary.latestJob)
                    dumpJob(std::cout, *summary.latestJob);
                else
                    std::cout << "No job\n";
            }
            else if (command == "videos")
            {
                for (const transcoding::VideoInfo& video : service.listVideos(vm["limit"].as<unsigned>()))
                    std::cout << video.videoId << "\t" << core::stringUtils::toISO8601String(video.createdAt) << "\t" << video.sourceKey << "\n";
            }
            else if (command == "playlist")
            {
                std::cout << service.getMasterPlaylist(parseId(args, "video"));
            }
            else
            {
                throw std::runtime_error{ "Unknown command '" + command + "'" };
            }

            return EXIT_SUCCESS;
        }
    } // namespace
} // namespace hlsforge

int main(int argc, char* argv[])
{
    try
    {
        using namespace hlsforge;
        namespace program_options = boost::program_options;

        program_options::options_description options{ "Options" };

        // clang-format off
        options.add_options()
        ("conf,c", program_options::value<std::string>()->default_value((core::sysconfDirectory / "hlsforge.conf").string()), "hlsforge config file")
        ("profiles", program_options::value<std::string>(), "submit: comma separated target heights (default ladder if not set)")
        ("limit", program_options::value<unsigned>()->default_value(25), "videos: max number of videos to list")
        ("help,h", "produce help message");
        // clang-format on

        program_options::options_description hiddenOptions;
        // clang-format off
        hiddenOptions.add_options()
        ("command", program_options::value<std::string>(), "command")
        ("args", program_options::value<std::vector<std::string>>()->default_value({}, ""), "command arguments");
        // clang-format on

        program_options::options_description allOptions;
        allOptions.add(options).add(hiddenOptions);

        program_options::positional_options_description positionalOptions;
        positionalOptions.add("command", 1);
        positionalOptions.add("args", -1);

        program_options::variables_map vm;
        program_options::store(program_options::command_line_parser(argc, argv).options(allOptions).positional(positionalOptions).run(), vm);

        if (vm.count("help") || !vm.count("command"))
        {
            std::ostream& os{ vm.count("help") ? std::cout : std::cerr };
            os << "Usage: " << argv[0] << " [options] <command> [args]\n\n"
               << "Commands:\n"
               << "\timport <file>\n"
               << "\tsubmit <video-id> [--profiles 240,480]\n"
               << "\tcancel <job-id>\n"
               << "\tstatus <job-id>\n"
               << "\tsummary <video-id>\n"
               << "\tvideos [--limit N]\n"
               << "\tplaylist <video-id>\n\n"
               << options << "\n";
            return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
        }

        program_options::notify(vm);

        core::Service<core::IConfig> config{ core::createConfig(vm["conf"].as<std::string>()) };
        // stdout is reserved for command output
        core::Service<core::logging::ILogger> logger{ core::logging::createLogger(core::logging::Severity::WARNING, config->getPath("log-file", "")) };

        const std::filesystem::path workingDir{ config->getPath("working-dir", "/var/hlsforge") };
        const std::filesystem::path dbFile{ config->getPath("db-file", workingDir / "hlsforge.db") };
        const std::filesystem::path queueDbFile{ config->getPath("queue-db-file", dbFile) };

        auto database{ db::createDb(dbFile, 2) };
        {
            db::Session session{ *database };
            session.prepareTablesIfNeeded();
            session.createIndexesIfNeeded();
        }

        std::unique_ptr<db::IDb> queueDatabase;
        if (queueDbFile != dbFile)
        {
            queueDatabase = db::createDb(queueDbFile, 2);

            db::Session session{ *queueDatabase };
            session.prepareTablesIfNeeded();
            session.createIndexesIfNeeded();
        }

        auto workQueue{ queue::createWorkQueue(queueDatabase ? *queueDatabase : *database, queue::WorkQueueConfig{}) };
        auto objectStore{ storage::createObjectStoreFromConfig() };
        auto service{ transcoding::createTranscodeService(*database, *workQueue, *objectStore, transcoding::readProducerConfig(*config)) };

        return processCommand(*service, vm["command"].as<std::string>(), vm["args"].as<std::vector<std::string>>(), vm);
    }
    catch (const std::exception& e)
    {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
