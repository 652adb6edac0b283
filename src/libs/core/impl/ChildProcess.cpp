/*
 * Copyright (C) 2020 Emeric Poupon
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

#include "ChildProcess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cassert>
#include <cerrno>
#include <mutex>
#include <system_error>

#include <boost/asio/buffer.hpp>

#include "core/ILogger.hpp"

namespace hlsforge::core
{
    namespace
    {
        class SystemException : public ChildProcessException
        {
        public:
            SystemException(std::error_code err, const std::string& errMsg)
                : ChildProcessException{ errMsg + ": " + err.message() }
            {
            }

            SystemException(boost::system::error_code ec, const std::string& errMsg)
                : ChildProcessException{ errMsg + ": " + ec.message() }
            {
            }
        };

        std::error_code lastError()
        {
            return std::error_code{ errno, std::generic_category() };
        }
    } // namespace

    ChildProcess::ChildProcess(boost::asio::io_context& ioContext, const std::filesystem::path& path, const Args& args)
        : _childOutput{ ioContext }
    {
        // make sure only one thread is executing this part of code
        static std::mutex mutex;
        const std::scoped_lock lock{ mutex };

        int pipefd[2];

        if (::pipe(pipefd) == -1)
            throw SystemException{ lastError(), "pipe failed!" };

        // Only set O_NONBLOCK on read end, programs don't expect their output to be non-blocking
        if (::fcntl(pipefd[0], F_SETFL, O_NONBLOCK) == -1)
            throw SystemException{ lastError(), "fcntl failed to set O_NONBLOCK!" };

        // Do not leak the read end into other children spawned concurrently
        if (::fcntl(pipefd[0], F_SETFD, FD_CLOEXEC) == -1)
            throw SystemException{ lastError(), "fcntl failed to set FD_CLOEXEC!" };

        std::vector<const char*> execArgs;
        execArgs.push_back(path.c_str());
        std::transform(std::cbegin(args), std::cend(args), std::back_inserter(execArgs), [](const std::string& arg) { return arg.c_str(); });
        execArgs.push_back(nullptr);

        const ::pid_t res{ ::fork() };
        if (res == -1)
            throw SystemException{ lastError(), "fork failed!" };

        if (res == 0) // CHILD
        {
            // Never close stdin, most programs expect it to exist
            const int nullFd{ ::open("/dev/null", O_RDONLY) };
            if (nullFd != -1)
            {
                ::dup2(nullFd, STDIN_FILENO);
                ::close(nullFd);
            }

            // Diagnostics are written to stderr, capture both streams through the pipe
            if (::dup2(pipefd[1], STDOUT_FILENO) == -1 || ::dup2(pipefd[1], STDERR_FILENO) == -1)
                ::_exit(127);
            ::close(pipefd[0]);
            ::close(pipefd[1]);

            ::execv(path.c_str(), const_cast<char* const*>(execArgs.data()));
            ::_exit(127);
        }

        // PARENT
        ::close(pipefd[1]);
        _childPID = res;

        boost::system::error_code assignError;
        _childOutput.assign(pipefd[0], assignError);
        if (assignError)
        {
            ::close(pipefd[0]);
            kill();
            wait(true);
            throw SystemException{ assignError, "assigning read end of pipe to asio stream failed!" };
        }
        _childOutput.non_blocking(true, assignError);

        HLSFORGE_LOG(CHILDPROCESS, DEBUG, "Spawned '" << path.string() << "', pid = " << _childPID);
    }

    ChildProcess::~ChildProcess()
    {
        HLSFORGE_LOG(CHILDPROCESS, DEBUG, "Closing child process...");
        closeOutput();

        if (_waited)
            return;

        if (!_finished)
            kill();

        try
        {
            wait(true);
        }
        catch (const ChildProcessException& e)
        {
            HLSFORGE_LOG(CHILDPROCESS, ERROR, "Cannot wait for child process: " << e.what());
        }
    }

    void ChildProcess::closeOutput()
    {
        if (!_childOutput.is_open())
            return;

        boost::system::error_code closeError;
        _childOutput.close(closeError);
        if (closeError)
            HLSFORGE_LOG(CHILDPROCESS, ERROR, "Close failed: " << closeError.message());
    }

    void ChildProcess::kill()
    {
        if (_waited)
            return;

        // process may already have finished
        HLSFORGE_LOG(CHILDPROCESS, DEBUG, "Killing child process " << _childPID << "...");
        if (::kill(_childPID, SIGKILL) == -1)
        {
            const std::error_code err{ lastError() };
            HLSFORGE_LOG(CHILDPROCESS, DEBUG, "Kill failed: " << err.message());
        }
    }

    bool ChildProcess::wait(bool block)
    {
        assert(!_waited);

        int wstatus{};
        ::pid_t pid;
        do
        {
            pid = ::waitpid(_childPID, &wstatus, block ? 0 : WNOHANG);
        } while (pid == -1 && errno == EINTR);

        if (pid == -1)
            throw SystemException{ lastError(), "waitpid failed!" };
        if (pid == 0)
            return false;

        if (WIFEXITED(wstatus))
        {
            _exitCode = WEXITSTATUS(wstatus);
            HLSFORGE_LOG(CHILDPROCESS, DEBUG, "Exit code = " << *_exitCode);
        }
        else if (WIFSIGNALED(wstatus))
        {
            HLSFORGE_LOG(CHILDPROCESS, DEBUG, "Terminated by signal " << WTERMSIG(wstatus));
        }

        _waited = true;
        return true;
    }

    bool ChildProcess::waitForOutput(std::chrono::milliseconds timeout)
    {
        if (_finished)
            return true;

        ::pollfd fd{};
        fd.fd = _childOutput.native_handle();
        fd.events = POLLIN;

        const int res{ ::poll(&fd, 1, static_cast<int>(timeout.count())) };
        if (res == -1)
        {
            if (errno == EINTR)
                return false;
            throw SystemException{ lastError(), "poll failed!" };
        }

        // POLLHUP is reported once every writer is gone: the next read returns end of file
        return res > 0 && (fd.revents & (POLLIN | POLLHUP | POLLERR));
    }

    std::size_t ChildProcess::readSome(std::byte* data, std::size_t bufferSize)
    {
        if (_finished)
            return 0;

        boost::system::error_code ec;
        const std::size_t res{ _childOutput.read_some(boost::asio::buffer(data, bufferSize), ec) };
        if (ec == boost::asio::error::would_block || ec == boost::asio::error::try_again || ec == boost::asio::error::interrupted)
            return 0;

        if (ec)
        {
            if (ec != boost::asio::error::eof)
                HLSFORGE_LOG(CHILDPROCESS, ERROR, "Read failed: " << ec.message());

            _finished = true;
            closeOutput();
        }

        return res;
    }

    bool ChildProcess::finished() const
    {
        return _finished;
    }

    std::optional<int> ChildProcess::waitForExit()
    {
        if (!_waited)
            wait(true);

        return _exitCode;
    }
} // namespace hlsforge::core
