/*
 * Copyright (C) 2019 Emeric Poupon
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

#include <functional>
#include <memory>
#include <vector>

#include "core/LiteralString.hpp"

namespace hlsforge::core
{
    class IJob;

    // Runs jobs on a bounded set of threads
    class IJobScheduler
    {
    public:
        virtual ~IJobScheduler() = default;

        // Evaluated before each job is started: aborted jobs are discarded without running
        using ShouldAbortCallback = std::function<bool()>;
        virtual void setShouldAbortCallback(ShouldAbortCallback callback) = 0;

        virtual std::size_t getThreadCount() const = 0;
        virtual void scheduleJob(std::unique_ptr<IJob> job) = 0;

        // Blocks until every scheduled job is either done or discarded
        virtual void wait() = 0;

        // Jobs that actually ran, in completion order
        virtual std::vector<std::unique_ptr<IJob>> popJobsDone() = 0;
    };

    std::unique_ptr<IJobScheduler> createJobScheduler(core::LiteralString name, std::size_t threadCount);
} // namespace hlsforge::core
