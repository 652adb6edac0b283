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

#include <string>

#include "core/Exception.hpp"

namespace hlsforge::av
{
    class Exception : public core::HlsForgeException
    {
    public:
        using HlsForgeException::HlsForgeException;
    };

    // Encoder failure, carries the tail of the encoder output
    class EncodeException : public Exception
    {
    public:
        EncodeException(const std::string& message, std::string diagnostic = {})
            : Exception{ diagnostic.empty() ? message : message + ": " + diagnostic }
            , _diagnostic{ std::move(diagnostic) }
        {
        }

        const std::string& getDiagnostic() const { return _diagnostic; }

    private:
        std::string _diagnostic;
    };

    // Encode stopped on request
    class EncodeAbortedException : public Exception
    {
    public:
        EncodeAbortedException()
            : Exception{ "Encode aborted" } {}
    };
} // namespace hlsforge::av
