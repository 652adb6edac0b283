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

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include <boost/asio/io_context.hpp>

#include "core/IChildProcessManager.hpp"

namespace hlsforge::core::tests
{
    namespace
    {
        std::string readAll(IChildProcess& process)
        {
            std::string output;
            std::byte buffer[256];
            while (!process.finished())
            {
                if (!process.waitForOutput(std::chrono::milliseconds{ 100 }))
                    continue;

                const std::size_t n{ process.readSome(buffer, sizeof(buffer)) };
                output.append(reinterpret_cast<const char*>(buffer), n);
            }
            return output;
        }
    } // namespace

    class ChildProcessTest : public ::testing::Test
    {
    protected:
        boost::asio::io_context _ioContext;
        std::unique_ptr<IChildProcessManager> _childProcessManager{ createChildProcessManager(_ioContext) };
    };

    TEST_F(ChildProcessTest, capturesStdoutAndStderr)
    {
        auto process{ _childProcessManager->spawnChildProcess("/bin/sh", { "-c", "echo out; echo err 1>&2" }) };

        const std::string output{ readAll(*process) };
        EXPECT_NE(output.find("out\n"), std::string::npos);
        EXPECT_NE(output.find("err\n"), std::string::npos);
        EXPECT_EQ(process->waitForExit(), 0);
    }

    TEST_F(ChildProcessTest, exitCode)
    {
        auto process{ _childProcessManager->spawnChildProcess("/bin/sh", { "-c", "exit 3" }) };

        EXPECT_EQ(readAll(*process), "");
        EXPECT_EQ(process->waitForExit(), 3);
    }

    TEST_F(ChildProcessTest, missingExecutable)
    {
        auto process{ _childProcessManager->spawnChildProcess("/nonexistent/hlsforge-test-binary", {}) };

        readAll(*process);
        EXPECT_EQ(process->waitForExit(), 127);
    }

    TEST_F(ChildProcessTest, kill)
    {
        auto process{ _childProcessManager->spawnChildProcess("/bin/sh", { "-c", "exec sleep 30" }) };

        EXPECT_FALSE(process->waitForOutput(std::chrono::milliseconds{ 50 }));

        const auto start{ std::chrono::steady_clock::now() };
        process->kill();
        EXPECT_EQ(process->waitForExit(), std::nullopt); // terminated by a signal
        EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{ 10 });
    }

    TEST_F(ChildProcessTest, destructorKillsRunningProcess)
    {
        const auto start{ std::chrono::steady_clock::now() };
        {
            auto process{ _childProcessManager->spawnChildProcess("/bin/sh", { "-c", "exec sleep 30" }) };
        }
        EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{ 10 });
    }
} // namespace hlsforge::core::tests
