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

#include "storage/IObjectStore.hpp"

#include "core/IConfig.hpp"
#include "core/Service.hpp"

#include "storage/Exception.hpp"

#include "FileSystemObjectStore.hpp"
#include "S3ObjectStore.hpp"

namespace hlsforge::storage
{
    std::unique_ptr<IObjectStore> createFileSystemObjectStore(const std::filesystem::path& root)
    {
        return std::make_unique<FileSystemObjectStore>(root);
    }

    std::unique_ptr<IObjectStore> createS3ObjectStore(const S3Parameters& parameters)
    {
        return std::make_unique<S3ObjectStore>(parameters);
    }

    std::unique_ptr<IObjectStore> createObjectStoreFromConfig()
    {
        core::IConfig& config{ *core::Service<core::IConfig>::get() };

        const std::string_view type{ config.getString("object-store-type", "fs") };
        if (type == "fs")
        {
            const std::filesystem::path workingDir{ config.getPath("working-dir", "/var/hlsforge") };
            return createFileSystemObjectStore(config.getPath("fs-store-root", workingDir / "objects"));
        }

        if (type == "s3")
        {
            S3Parameters parameters;
            parameters.endpoint = config.getString("s3-endpoint", "http://localhost:9000");
            parameters.region = config.getString("s3-region", "us-east-1");
            parameters.bucket = config.getString("s3-bucket", "media");
            parameters.accessKey = config.getString("s3-access-key", "");
            parameters.secretKey = config.getString("s3-secret-key", "");
            parameters.timeout = std::chrono::seconds{ config.getULong("s3-timeout-seconds", 30) };

            return createS3ObjectStore(parameters);
        }

        throw Exception{ "Invalid value '" + std::string{ type } + "' for setting 'object-store-type'" };
    }
} // namespace hlsforge::storage
