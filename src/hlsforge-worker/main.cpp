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

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <unistd.h>

#include <Wt/WServer.h>
#include <boost/asio/io_context.hpp>

#include "av/IHlsTranscoder.hpp"
#include "core/IChildProcessManager.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/IOContextRunner.hpp"
#include "core/Service.hpp"
#include "core/SystemPaths.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "queue/IWorkQueue.hpp"
#include "services/transcoding/Config.hpp"
#include "services/transcoding/IWorkerService.hpp"
#include "storage/IObjectStore.hpp"

namespace hlsforge
{
    namespace
    {
        core::logging::Severity getLogMinSeverity()
        {
            std::string_view minSeverity{ core::Service<core::IConfig>::get()->getString("log-min-severity", "info") };

            if (minSeverity == "debug")
                return core::logging::Severity::DEBUG;
            else if (minSeverity == "info")
                return core::logging::Severity::INFO;
            else if (minSeverity == "warning")
                return core::logging::Severity::WARNING;
            else if (minSeverity == "error")
                return core::logging::Severity::ERROR;
            else if (minSeverity == "fatal")
                return core::logging::Severity::FATAL;

            throw core::HlsForgeException{ "Invalid config value for 'log-min-severity'" };
        }

        std::unique_ptr<db::IDb> openDb(const std::filesystem::path& dbFile, std::size_t connectionCount)
        {
            auto database{ db::createDb(dbFile, connectionCount) };

            db::Session session{ *database };
            session.prepareTablesIfNeeded();
            session.createIndexesIfNeeded();
            session.vacuumIfNeeded();

            return database;
        }
    } // namespace

    int main(int argc, char* argv[])
    {
        std::filesystem::path configFilePath{ core::sysconfDirectory / "hlsforge.conf" };
        int res{ EXIT_FAILURE };

        auto displayUsage{ [&](std::ostream& os) {
            os << "Usage:\t" << argv[0] << "\t[conf_file]\n\n"
               << "Options:\n"
               << "\tconf_file:\t path to the hlsforge configuration file (defaults to " << configFilePath << ")\n\n";
        } };

        if (argc == 2)
        {
            const std::string_view arg{ argv[1] };
            if (arg == "-h" || arg == "--help")
            {
                displayUsage(std::cout);
                return EXIT_SUCCESS;
            }
            configFilePath = std::string(arg, 0, 256);
        }
        else if (argc > 2)
        {
            displayUsage(std::cerr);
            return EXIT_FAILURE;
        }

        try
        {
            close(STDIN_FILENO);

            core::Service<core::IConfig> config{ core::createConfig(configFilePath) };
            core::Service<core::logging::ILogger> logger{ core::logging::createLogger(getLogMinSeverity(), config->getPath("log-file", "")) };

            const transcoding::WorkerConfig workerConfig{ transcoding::readWorkerConfig(*config) };

            // Make sure the working directory exists
            std::filesystem::create_directories(workerConfig.workingDir);

            boost::asio::io_context ioContext; // child process plumbing
            core::IOContextRunner ioContextRunner{ ioContext, 1, "Misc" };

            // worker loops, encode threads, lease keepers and the reaper may all access the database
            const std::size_t connectionCount{ workerConfig.workerCount * (workerConfig.encodeConcurrency + 2) + 2 };

            const std::filesystem::path dbFile{ config->getPath("db-file", workerConfig.workingDir / "hlsforge.db") };
            auto database{ openDb(dbFile, connectionCount) };

            const std::filesystem::path queueDbFile{ config->getPath("queue-db-file", dbFile) };
            std::unique_ptr<db::IDb> queueDatabase;
            if (queueDbFile != dbFile)
                queueDatabase = openDb(queueDbFile, connectionCount);

            auto workQueue{ queue::createWorkQueue(queueDatabase ? *queueDatabase : *database, queue::WorkQueueConfig{
                                                                                                    .leaseDuration = workerConfig.leaseDuration,
                                                                                                    .pollInterval = std::chrono::milliseconds{ config->getULong("queue-poll-interval-ms", 500) },
                                                                                                }) };

            // Service initialization order is important (reverse-order for deinit)
            core::Service<core::IChildProcessManager> childProcessManagerService{ core::createChildProcessManager(ioContext) };
            auto objectStore{ storage::createObjectStoreFromConfig() };
            auto transcoder{ av::createHlsTranscoder(config->getPath("ffmpeg-file", "/usr/bin/ffmpeg"), std::chrono::seconds{ config->getULong("encode-timeout-seconds", 0) }) };

            auto workerService{ transcoding::createWorkerService(*database, *workQueue, *objectStore, *transcoder, workerConfig) };

            HLSFORGE_LOG(MAIN, INFO, "Now running...");
            Wt::WServer::waitForShutdown();

            HLSFORGE_LOG(MAIN, INFO, "Stopping workers...");
            workerService.reset();

            HLSFORGE_LOG(MAIN, INFO, "Quitting...");
            res = EXIT_SUCCESS;
        }
        catch (const std::exception& e)
        {
            HLSFORGE_LOG(MAIN, FATAL, "Caught std::exception: " << e.what());
            std::cerr << "Caught std::exception: " << e.what() << std::endl;
            res = EXIT_FAILURE;
        }

        return res;
    }
} // namespace hlsforge

int main(int argc, char* argv[])
{
    return hlsforge::main(argc, argv);
}
