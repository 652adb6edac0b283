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

#include <map>
#include <string>
#include <string_view>

namespace Wt
{
    class WDateTime;
}

// AWS Signature Version 4, header based
namespace hlsforge::storage::s3
{
    struct Credentials
    {
        std::string accessKey;
        std::string secretKey;
    };

    // Keys are lower case header names
    using Headers = std::map<std::string, std::string>;

    struct SignedRequest
    {
        std::string method;  // GET, PUT, HEAD
        std::string path;    // not encoded, starting with '/'
        Headers headers;     // must contain host, x-amz-date and x-amz-content-sha256
        std::string payloadHash;
    };

    inline constexpr std::string_view emptyPayloadHash{ "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855" };

    std::string sha256Hex(std::string_view data);

    // yyyyMMdd'T'HHmmss'Z'
    std::string formatAmzDate(const Wt::WDateTime& dateTime);

    std::string computeCanonicalRequest(const SignedRequest& request);

    // Value of the Authorization header
    std::string computeAuthorization(const SignedRequest& request, const Credentials& credentials, std::string_view region, std::string_view service = "s3");
} // namespace hlsforge::storage::s3
