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

#include "services/transcoding/Config.hpp"

#include <algorithm>
#include <iterator>
#include <string>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"

#include "services/transcoding/Exception.hpp"

namespace hlsforge::transcoding
{
    ProducerConfig readProducerConfig(core::IConfig& config)
    {
        ProducerConfig res;

        res.defaultLadder.clear();
        config.visitULongs("default-ladder", [&](unsigned long height) { res.defaultLadder.push_back(static_cast<unsigned>(height)); }, { 240, 480, 720 });
        if (res.defaultLadder.empty())
            throw Exception{ "default-ladder must not be empty" };

        std::vector<std::string> heights;
        std::transform(std::cbegin(res.defaultLadder), std::cend(res.defaultLadder), std::back_inserter(heights), [](unsigned height) { return std::to_string(height); });
        HLSFORGE_LOG(TRANSCODING, DEBUG, "Default ladder = " << core::stringUtils::joinStrings(heights, ","));

        return res;
    }

    WorkerConfig readWorkerConfig(core::IConfig& config)
    {
        WorkerConfig res;

        res.workingDir = config.getPath("working-dir", "/var/hlsforge");
        res.workerCount = std::max<std::size_t>(config.getULong("worker-count", 1), 1);
        res.encodeConcurrency = std::max<std::size_t>(config.getULong("encode-concurrency", 1), 1);
        res.leaseDuration = std::chrono::seconds{ std::max<unsigned long>(config.getULong("queue-lease-seconds", 300), 3) };
        res.maxDeliveryCount = std::max<std::size_t>(config.getULong("queue-max-delivery-count", 3), 1);
        res.reapInterval = std::chrono::seconds{ std::max<unsigned long>(config.getULong("queue-reap-interval-seconds", 30), 1) };

        return res;
    }
} // namespace hlsforge::transcoding
