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

#include "core/Exception.hpp"

namespace hlsforge::transcoding
{
    class Exception : public core::HlsForgeException
    {
    public:
        using HlsForgeException::HlsForgeException;
    };

    // Unknown video or job
    class NotFoundException : public Exception
    {
    public:
        using Exception::Exception;
    };

    // Requested height is not a supported profile
    class InvalidProfileException : public Exception
    {
    public:
        InvalidProfileException(unsigned height)
            : Exception{ "Unsupported profile " + std::to_string(height) } {}
    };

    // No job of the video is done yet
    class NotReadyException : public Exception
    {
    public:
        using Exception::Exception;
    };
} // namespace hlsforge::transcoding
