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

#include <filesystem>

namespace hlsforge::transcoding
{
    // Directory owned by a single job attempt, removed on destruction
    class WorkingArea
    {
    public:
        WorkingArea(const std::filesystem::path& path);
        ~WorkingArea();
        WorkingArea(const WorkingArea&) = delete;
        WorkingArea& operator=(const WorkingArea&) = delete;

        const std::filesystem::path& getPath() const { return _path; }

    private:
        const std::filesystem::path _path;
    };
} // namespace hlsforge::transcoding
