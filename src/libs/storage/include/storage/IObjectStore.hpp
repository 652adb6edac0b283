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
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace hlsforge::storage
{
    struct ObjectInfo
    {
        std::size_t size{};
        std::string contentType;
    };

    // Whole object store, keys are '/' separated relative paths
    // Implementations are thread safe
    class IObjectStore
    {
    public:
        virtual ~IObjectStore() = default;

        // Throws NotFoundException if the key does not exist
        virtual void get(std::string_view key, std::ostream& os) = 0;

        // Overwrites any existing object
        virtual void put(std::string_view key, std::istream& is, std::string_view contentType) = 0;

        // nullopt if the key does not exist
        virtual std::optional<ObjectInfo> stat(std::string_view key) = 0;
    };

    std::unique_ptr<IObjectStore> createFileSystemObjectStore(const std::filesystem::path& root);

    struct S3Parameters
    {
        std::string endpoint; // scheme://host[:port]
        std::string region;
        std::string bucket;
        std::string accessKey;
        std::string secretKey;
        std::chrono::seconds timeout{ 30 };
    };
    std::unique_ptr<IObjectStore> createS3ObjectStore(const S3Parameters& parameters);

    // Uses the "object-store-type" setting and the related backend settings
    std::unique_ptr<IObjectStore> createObjectStoreFromConfig();
} // namespace hlsforge::storage
