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
#include <cstddef>
#include <filesystem>
#include <vector>

namespace hlsforge::core
{
    class IConfig;
}

namespace hlsforge::transcoding
{
    struct ProducerConfig
    {
        std::vector<unsigned> defaultLadder{ 240, 480, 720 }; // used when a request lists no profile
    };

    struct WorkerConfig
    {
        std::filesystem::path workingDir{ "/var/hlsforge" }; // jobs are processed in <workingDir>/jobs/<job_id>
        std::size_t workerCount{ 1 };
        std::size_t encodeConcurrency{ 1 };
        std::chrono::seconds leaseDuration{ 300 };
        std::size_t maxDeliveryCount{ 3 };
        std::chrono::seconds reapInterval{ 30 };
        std::chrono::milliseconds popTimeout{ 1000 };
    };

    ProducerConfig readProducerConfig(core::IConfig& config);
    WorkerConfig readWorkerConfig(core::IConfig& config);
} // namespace hlsforge::transcoding
