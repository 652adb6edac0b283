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

#include <boost/asio/io_context.hpp>

#include <Wt/Http/Client.h>
#include <Wt/Http/Message.h>

#include "core/IOContextRunner.hpp"

#include "storage/IObjectStore.hpp"
#include "storage/S3Signature.hpp"

namespace hlsforge::storage
{
    // S3 compatible store, path-style urls
    // Requests are synchronous, performed on a dedicated io context
    class S3ObjectStore : public IObjectStore
    {
    public:
        S3ObjectStore(const S3Parameters& parameters);
        ~S3ObjectStore() override;
        S3ObjectStore(const S3ObjectStore&) = delete;
        S3ObjectStore& operator=(const S3ObjectStore&) = delete;

    private:
        void get(std::string_view key, std::ostream& os) override;
        void put(std::string_view key, std::istream& is, std::string_view contentType) override;
        std::optional<ObjectInfo> stat(std::string_view key) override;

        struct Response
        {
            int status{};
            Wt::Http::Message message;
        };
        // Throws StorageUnavailableException on transport error
        Response sendRequest(Wt::Http::Method method, std::string_view key, const std::string& payload, std::string_view contentType, std::ostream* output);
        std::string getPath(std::string_view key) const;

        const S3Parameters _parameters;
        const s3::Credentials _credentials;
        std::string _host; // as sent in the Host header

        boost::asio::io_context _ioContext;
        core::IOContextRunner _ioContextRunner{ _ioContext, 1, "S3" };
    };
} // namespace hlsforge::storage
