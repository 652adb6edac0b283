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

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "core/Exception.hpp"

namespace hlsforge::core
{
    class ChildProcessException : public HlsForgeException
    {
    public:
        using HlsForgeException::HlsForgeException;
    };

    // Child process whose stdout and stderr are merged into a single pipe
    class IChildProcess
    {
    public:
        using Args = std::vector<std::string>;

        virtual ~IChildProcess() = default;

        // Returns true if some output (or the end of output) can be read without blocking
        virtual bool waitForOutput(std::chrono::milliseconds timeout) = 0;

        // Never blocks, returns 0 if nothing is available yet or if the end of output was reached
        virtual std::size_t readSome(std::byte* data, std::size_t bufferSize) = 0;

        // true once the end of output has been read
        virtual bool finished() const = 0;

        virtual void kill() = 0;

        // Blocks until the process exits. Returns its exit code, or nothing if it was terminated by a signal
        virtual std::optional<int> waitForExit() = 0;
    };
} // namespace hlsforge::core
