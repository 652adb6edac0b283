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

#include "WorkingArea.hpp"

#include "core/ILogger.hpp"

#include "services/transcoding/Exception.hpp"

namespace hlsforge::transcoding
{
    WorkingArea::WorkingArea(const std::filesystem::path& path)
        : _path{ path }
    {
        std::error_code ec;

        // leftovers of a crashed process using the same path
        std::filesystem::remove_all(_path, ec);
        if (ec)
            throw Exception{ "Cannot clean working area '" + _path.string() + "': " + ec.message() };

        std::filesystem::create_directories(_path, ec);
        if (ec)
            throw Exception{ "Cannot create working area '" + _path.string() + "': " + ec.message() };

        HLSFORGE_LOG(TRANSCODING, DEBUG, "Created working area '" << _path.string() << "'");
    }

    WorkingArea::~WorkingArea()
    {
        std::error_code ec;
        std::filesystem::remove_all(_path, ec);
        if (ec)
            HLSFORGE_LOG(TRANSCODING, ERROR, "Cannot remove working area '" << _path.string() << "': " << ec.message());
        else
            HLSFORGE_LOG(TRANSCODING, DEBUG, "Removed working area '" << _path.string() << "'");
    }
} // namespace hlsforge::transcoding
