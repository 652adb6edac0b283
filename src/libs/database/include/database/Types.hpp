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

#include <cstddef>
#include <optional>
#include <string_view>

#include "core/Exception.hpp"

namespace hlsforge::db
{
    class Exception : public core::HlsForgeException
    {
    public:
        using HlsForgeException::HlsForgeException;
    };

    // Requested status change is not allowed from the current status
    class StateConflictException : public Exception
    {
    public:
        using Exception::Exception;
    };

    struct Range
    {
        std::size_t offset{};
        std::size_t size{};

        bool operator==(const Range& rhs) const { return offset == rhs.offset && size == rhs.size; }
    };

    // Caution: do not change enum values if they are set!
    enum class JobStatus
    {
        Queued = 0,
        Running = 1,
        Done = 2,
        Failed = 3,
    };

    enum class RenditionStatus
    {
        Queued = 0,
        Running = 1,
        Ready = 2,
        Failed = 3,
    };

    std::string_view toString(JobStatus status);
    std::string_view toString(RenditionStatus status);

    bool isTerminal(JobStatus status);
    bool isTerminal(RenditionStatus status);
} // namespace hlsforge::db
