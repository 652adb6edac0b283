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

#include "storage/IObjectStore.hpp"

namespace hlsforge::storage
{
    // Objects are plain files under the root directory
    // Content types are kept in a parallel tree under <root>/.content-types
    class FileSystemObjectStore : public IObjectStore
    {
    public:
        FileSystemObjectStore(const std::filesystem::path& root);
        ~FileSystemObjectStore() override = default;
        FileSystemObjectStore(const FileSystemObjectStore&) = delete;
        FileSystemObjectStore& operator=(const FileSystemObjectStore&) = delete;

    private:
        void get(std::string_view key, std::ostream& os) override;
        void put(std::string_view key, std::istream& is, std::string_view contentType) override;
        std::optional<ObjectInfo> stat(std::string_view key) override;

        std::filesystem::path getObjectPath(std::string_view key) const;
        std::filesystem::path getContentTypePath(std::string_view key) const;

        const std::filesystem::path _root;
    };
} // namespace hlsforge::storage
