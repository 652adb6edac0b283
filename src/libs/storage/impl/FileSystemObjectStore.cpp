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

#include "FileSystemObjectStore.hpp"

#include <fstream>
#include <sstream>

#include "core/ILogger.hpp"
#include "core/Random.hpp"
#include "core/String.hpp"

#include "storage/Exception.hpp"

namespace hlsforge::storage
{
    namespace
    {
        constexpr std::string_view contentTypeDirectory{ ".content-types" };

        // Readers never see partial files: write next to the destination and rename
        template<typename WriteFunc>
        void atomicWrite(const std::filesystem::path& path, WriteFunc writeFunc)
        {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec)
                throw StorageUnavailableException{ "Cannot create directory " + path.parent_path().string() + ": " + ec.message() };

            std::filesystem::path tmpPath{ path };
            tmpPath += ".tmp-" + std::to_string(core::random::getRandom<unsigned>(0, 1'000'000'000));

            {
                std::ofstream ofs{ tmpPath, std::ios::binary | std::ios::trunc };
                if (!ofs)
                    throw StorageUnavailableException{ "Cannot open " + tmpPath.string() + " for writing" };

                writeFunc(ofs);
                ofs.flush();
                if (!ofs)
                {
                    ofs.close();
                    std::filesystem::remove(tmpPath, ec);
                    throw StorageUnavailableException{ "Cannot write " + tmpPath.string() };
                }
            }

            std::filesystem::rename(tmpPath, path, ec);
            if (ec)
            {
                std::error_code removeError;
                std::filesystem::remove(tmpPath, removeError);
                throw StorageUnavailableException{ "Cannot rename " + tmpPath.string() + " to " + path.string() + ": " + ec.message() };
            }
        }
    } // namespace

    FileSystemObjectStore::FileSystemObjectStore(const std::filesystem::path& root)
        : _root{ root }
    {
        std::error_code ec;
        std::filesystem::create_directories(_root, ec);
        if (ec)
            throw StorageUnavailableException{ "Cannot create store root " + _root.string() + ": " + ec.message() };

        HLSFORGE_LOG(STORAGE, INFO, "Using file system store at " << _root);
    }

    void FileSystemObjectStore::get(std::string_view key, std::ostream& os)
    {
        const std::filesystem::path path{ getObjectPath(key) };

        std::ifstream ifs{ path, std::ios::binary };
        if (!ifs)
        {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec))
                throw NotFoundException{ "Object '" + std::string{ key } + "' not found" };

            throw StorageUnavailableException{ "Cannot open " + path.string() + " for reading" };
        }

        // empty objects leave os untouched
        if (ifs.peek() != std::ifstream::traits_type::eof())
            os << ifs.rdbuf();

        if (!os || ifs.bad())
            throw StorageUnavailableException{ "Cannot read object '" + std::string{ key } + "'" };
    }

    void FileSystemObjectStore::put(std::string_view key, std::istream& is, std::string_view contentType)
    {
        const std::filesystem::path path{ getObjectPath(key) };

        atomicWrite(getContentTypePath(key), [&](std::ostream& os) { os << contentType; });
        atomicWrite(path, [&](std::ostream& os) {
            if (is.peek() != std::istream::traits_type::eof())
                os << is.rdbuf();
            if (is.bad())
                throw Exception{ "Cannot read input for object '" + std::string{ key } + "'" };
        });

        HLSFORGE_LOG(STORAGE, DEBUG, "Stored '" << key << "'");
    }

    std::optional<ObjectInfo> FileSystemObjectStore::stat(std::string_view key)
    {
        const std::filesystem::path path{ getObjectPath(key) };

        std::error_code ec;
        const auto size{ std::filesystem::file_size(path, ec) };
        if (ec)
        {
            if (ec == std::errc::no_such_file_or_directory)
                return std::nullopt;

            throw StorageUnavailableException{ "Cannot stat " + path.string() + ": " + ec.message() };
        }

        ObjectInfo info;
        info.size = static_cast<std::size_t>(size);

        std::ifstream ifs{ getContentTypePath(key) };
        if (!ifs || !std::getline(ifs, info.contentType) || info.contentType.empty())
            info.contentType = "application/octet-stream";

        return info;
    }

    std::filesystem::path FileSystemObjectStore::getObjectPath(std::string_view key) const
    {
        if (key.empty() || key.front() == '/')
            throw InvalidKeyException{ "Invalid key '" + std::string{ key } + "'" };

        for (std::string_view part : core::stringUtils::splitString(key, '/'))
        {
            if (part.empty() || part == "." || part == ".." || part.front() == '.')
                throw InvalidKeyException{ "Invalid key '" + std::string{ key } + "'" };
        }

        return _root / key;
    }

    std::filesystem::path FileSystemObjectStore::getContentTypePath(std::string_view key) const
    {
        return _root / contentTypeDirectory / key;
    }
} // namespace hlsforge::storage
