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

#include "storage/S3Signature.hpp"

#include <array>
#include <span>
#include <sstream>

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <Wt/WDateTime.h>

#include "core/String.hpp"

#include "storage/Exception.hpp"

namespace hlsforge::storage::s3
{
    namespace
    {
        using Digest = std::array<unsigned char, 32>;

        constexpr std::string_view algorithm{ "AWS4-HMAC-SHA256" };

        Digest hmacSha256(std::span<const unsigned char> key, std::string_view data)
        {
            Digest digest;
            unsigned int digestSize{ static_cast<unsigned int>(digest.size()) };
            if (!::HMAC(::EVP_sha256(), key.data(), static_cast<int>(key.size()), reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest.data(), &digestSize))
                throw Exception{ "HMAC computation failed" };

            return digest;
        }

        std::string getSignedHeaders(const Headers& headers)
        {
            std::string res;
            for (const auto& [name, value] : headers)
            {
                if (!res.empty())
                    res += ';';
                res += name;
            }
            return res;
        }

        const std::string& getHeader(const Headers& headers, const std::string& name)
        {
            auto it{ headers.find(name) };
            if (it == std::cend(headers))
                throw Exception{ "Missing header '" + name + "' in request to sign" };

            return it->second;
        }
    } // namespace

    std::string sha256Hex(std::string_view data)
    {
        Digest digest;
        unsigned int digestSize{};
        if (!::EVP_Digest(data.data(), data.size(), digest.data(), &digestSize, ::EVP_sha256(), nullptr))
            throw Exception{ "SHA256 computation failed" };

        return core::stringUtils::bufferToString(std::span{ digest.data(), digestSize });
    }

    std::string formatAmzDate(const Wt::WDateTime& dateTime)
    {
        return dateTime.toString("yyyyMMdd'T'HHmmss'Z'", false).toUTF8();
    }

    std::string computeCanonicalRequest(const SignedRequest& request)
    {
        std::ostringstream oss;

        oss << request.method << '\n';
        oss << core::stringUtils::uriEncode(request.path, false) << '\n';
        oss << '\n'; // no query string

        for (const auto& [name, value] : request.headers)
            oss << name << ':' << core::stringUtils::stringTrim(value) << '\n';
        oss << '\n';

        oss << getSignedHeaders(request.headers) << '\n';
        oss << request.payloadHash;

        return oss.str();
    }

    std::string computeAuthorization(const SignedRequest& request, const Credentials& credentials, std::string_view region, std::string_view service)
    {
        const std::string& amzDate{ getHeader(request.headers, "x-amz-date") };
        if (amzDate.size() != 16)
            throw Exception{ "Invalid x-amz-date '" + amzDate + "'" };

        const std::string dateStamp{ amzDate.substr(0, 8) };
        const std::string scope{ dateStamp + "/" + std::string{ region } + "/" + std::string{ service } + "/aws4_request" };

        std::string stringToSign{ algorithm };
        stringToSign += '\n';
        stringToSign += amzDate;
        stringToSign += '\n';
        stringToSign += scope;
        stringToSign += '\n';
        stringToSign += sha256Hex(computeCanonicalRequest(request));

        const std::string secret{ "AWS4" + credentials.secretKey };
        const Digest dateKey{ hmacSha256(std::span{ reinterpret_cast<const unsigned char*>(secret.data()), secret.size() }, dateStamp) };
        const Digest regionKey{ hmacSha256(dateKey, region) };
        const Digest serviceKey{ hmacSha256(regionKey, service) };
        const Digest signingKey{ hmacSha256(serviceKey, "aws4_request") };
        const Digest signature{ hmacSha256(signingKey, stringToSign) };

        std::string authorization{ algorithm };
        authorization += " Credential=" + credentials.accessKey + "/" + scope;
        authorization += ", SignedHeaders=" + getSignedHeaders(request.headers);
        authorization += ", Signature=" + core::stringUtils::bufferToString(signature);

        return authorization;
    }
} // namespace hlsforge::storage::s3
