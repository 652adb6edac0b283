/*
 * Copyright (C) 2025 Emeric Poupon
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

#include "JobScheduler.hpp"

#include <boost/asio/post.hpp>

#include "core/IJob.hpp"
#include "core/ILogger.hpp"

namespace hlsforge::core
{
    std::unique_ptr<IJobScheduler> createJobScheduler(core::LiteralString name, std::size_t threadCount)
    {
        return std::make_unique<JobScheduler>(name, threadCount);
    }

    JobScheduler::JobScheduler(core::LiteralString name, std::size_t threadCount)
        : _name{ name }
        , _ioContextRunner{ _ioContext, threadCount, name.str() }
    {
    }

    JobScheduler::~JobScheduler()
    {
        wait();
    }

    void JobScheduler::setShouldAbortCallback(ShouldAbortCallback callback)
    {
        _abortCallback = std::move(callback);
    }

    std::size_t JobScheduler::getThreadCount() const
    {
        return _ioContextRunner.getThreadCount();
    }

    void JobScheduler::scheduleJob(std::unique_ptr<IJob> job)
    {
        {
            std::scoped_lock lock{ _mutex };
            _ongoingJobCount += 1;
        }

        boost::asio::post(_ioContext, [job = std::move(job), this]() mutable {
            if (_abortCallback && _abortCallback())
            {
                HLSFORGE_LOG(UTILS, DEBUG, "[" << _name << "] discarding job '" << job->getName() << "': aborted");
                onJobFinished(std::move(job), false);
                return;
            }

            job->run();
            onJobFinished(std::move(job), true);
        });
    }

    void JobScheduler::onJobFinished(std::unique_ptr<IJob> job, bool hasRun)
    {
        {
            std::scoped_lock lock{ _mutex };

            if (hasRun)
                _doneJobs.emplace_back(std::move(job));
            _ongoingJobCount -= 1;
        }

        _condVar.notify_all();
    }

    void JobScheduler::wait()
    {
        std::unique_lock lock{ _mutex };
        _condVar.wait(lock, [this] { return _ongoingJobCount == 0; });
    }

    std::vector<std::unique_ptr<IJob>> JobScheduler::popJobsDone()
    {
        std::vector<std::unique_ptr<IJob>> res;

        std::scoped_lock lock{ _mutex };
        res.reserve(_doneJobs.size());
        while (!_doneJobs.empty())
        {
            res.push_back(std::move(_doneJobs.front()));
            _doneJobs.pop_front();
        }

        return res;
    }
} // namespace hlsforge::core
