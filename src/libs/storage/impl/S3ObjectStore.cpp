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

#include "S3ObjectStore.hpp"

#include <future>
#include <iterator>

#include <boost/asio/ssl/error.hpp>

#include <Wt/WDateTime.h>

#include "core/ILogger.hpp"
#include "core/String.hpp"

#include "storage/Exception.hpp"

#define LOG(sev, message) HLSFORGE_LOG(STORAGE, sev, "[S3] - " << message)

namespace hlsforge::storage
{
    namespace
    {
        std::string_view getMethodName(Wt::Http::Method method)
        {
            switch (method)
            {
            case Wt::Http::Method::Get:
                return "GET";
            case Wt::Http::Method::Put:
                return "PUT";
            case Wt::Http::Method::Head:
                return "HEAD";
            default:
                break;
            }

            throw Exception{ "Unhandled HTTP method" };
        }

        // Host header value, without the port if it is the default one of the scheme
        std::string computeHost(std::string_view endpoint)
        {
            const std::string_view::size_type schemeEnd{ endpoint.find("://") };
            if (schemeEnd == std::string_view::npos)
                throw Exception{ "Invalid S3 endpoint '" + std::string{ endpoint } + "': missing scheme" };

            const std::string scheme{ core::stringUtils::stringToLower(endpoint.substr(0, schemeEnd)) };
            std::string_view authority{ endpoint.substr(schemeEnd + 3) };
            authority = authority.substr(0, authority.find('/'));
            if (authority.empty())
                throw Exception{ "Invalid S3 endpoint '" + std::string{ endpoint } + "': missing host" };

            if ((scheme == "http" && authority.ends_with(":80")) || (scheme == "https" && authority.ends_with(":443")))
                authority = authority.substr(0, authority.rfind(':'));

            return std::string{ authority };
        }

        bool isSuccess(int status)
        {
            return status >= 200 && status < 300;
        }
    } // namespace

    S3ObjectStore::S3ObjectStore(const S3Parameters& parameters)
        : _parameters{ parameters }
        , _credentials{ parameters.accessKey, parameters.secretKey }
        , _host{ computeHost(parameters.endpoint) }
    {
        if (_parameters.bucket.empty())
            throw Exception{ "S3 bucket not set" };

        LOG(INFO, "Using bucket '" << _parameters.bucket << "' on " << _parameters.endpoint);
    }

    S3ObjectStore::~S3ObjectStore() = default;

    void S3ObjectStore::get(std::string_view key, std::ostream& os)
    {
        const Response response{ sendRequest(Wt::Http::Method::Get, key, {}, {}, &os) };
        if (response.status == 404)
            throw NotFoundException{ "Object '" + std::string{ key } + "' not found" };
        if (!isSuccess(response.status))
            throw StorageUnavailableException{ "GET '" + std::string{ key } + "' failed with status " + std::to_string(response.status) };
        if (!os)
            throw StorageUnavailableException{ "GET '" + std::string{ key } + "': cannot write output" };
    }

    void S3ObjectStore::put(std::string_view key, std::istream& is, std::string_view contentType)
    {
        const std::string payload{ std::istreambuf_iterator<char>{ is }, std::istreambuf_iterator<char>{} };
        if (is.bad())
            throw Exception{ "PUT '" + std::string{ key } + "': cannot read input" };

        const Response response{ sendRequest(Wt::Http::Method::Put, key, payload, contentType, nullptr) };
        if (!isSuccess(response.status))
            throw StorageUnavailableException{ "PUT '" + std::string{ key } + "' failed with status " + std::to_string(response.status) + ": " + response.message.body() };

        LOG(DEBUG, "Uploaded '" << key << "' (" << payload.size() << " bytes)");
    }

    std::optional<ObjectInfo> S3ObjectStore::stat(std::string_view key)
    {
        const Response response{ sendRequest(Wt::Http::Method::Head, key, {}, {}, nullptr) };
        if (response.status == 404)
            return std::nullopt;
        if (!isSuccess(response.status))
            throw StorageUnavailableException{ "HEAD '" + std::string{ key } + "' failed with status " + std::to_string(response.status) };

        ObjectInfo info;
        if (const std::string * contentLength{ response.message.getHeader("Content-Length") })
            info.size = core::stringUtils::readAs<std::size_t>(*contentLength).value_or(0);
        if (const std::string * contentType{ response.message.getHeader("Content-Type") })
            info.contentType = *contentType;

        return info;
    }

    S3ObjectStore::Response S3ObjectStore::sendRequest(Wt::Http::Method method, std::string_view key, const std::string& payload, std::string_view contentType, std::ostream* output)
    {
        const std::string path{ getPath(key) };

        s3::SignedRequest request;
        request.method = getMethodName(method);
        request.path = path;
        request.payloadHash = payload.empty() ? std::string{ s3::emptyPayloadHash } : s3::sha256Hex(payload);
        request.headers["host"] = _host;
        request.headers["x-amz-date"] = s3::formatAmzDate(Wt::WDateTime::currentDateTime());
        request.headers["x-amz-content-sha256"] = request.payloadHash;
        if (!contentType.empty())
            request.headers["content-type"] = contentType;

        Wt::Http::Message message;
        for (const auto& [name, value] : request.headers)
        {
            // set by the client itself
            if (name != "host")
                message.addHeader(name, value);
        }
        message.addHeader("Authorization", s3::computeAuthorization(request, _credentials, _parameters.region));
        if (!payload.empty())
            message.addBodyText(payload);

        const std::string url{ _parameters.endpoint + core::stringUtils::uriEncode(path, false) };
        LOG(DEBUG, "Sending " << request.method << " request to url '" << url << "'");

        std::promise<Response> promise;
        std::future<Response> future{ promise.get_future() };

        Wt::Http::Client client{ _ioContext };
        client.setTimeout(_parameters.timeout);
        client.setFollowRedirect(false);
        // 0: body is only delivered through bodyDataReceived
        client.setMaximumResponseSize(output ? 0 : 64 * 1024);

        int status{};
        client.headersReceived().connect([&](const Wt::Http::Message& msg) {
            status = msg.status();
        });
        client.bodyDataReceived().connect([&](const std::string& data) {
            if (output && isSuccess(status))
                output->write(data.data(), static_cast<std::streamsize>(data.size()));
        });
        client.done().connect([&](Wt::AsioWrapper::error_code ec, const Wt::Http::Message& msg) {
            if (ec && ec != boost::asio::ssl::error::stream_truncated)
            {
                promise.set_exception(std::make_exception_ptr(StorageUnavailableException{ request.method + " '" + path + "' failed: " + ec.message() }));
                return;
            }

            promise.set_value(Response{ msg.status(), msg });
        });

        if (!client.request(method, url, message))
            throw StorageUnavailableException{ "Cannot send request to '" + url + "', bad url or unsupported scheme?" };

        Response response{ future.get() };
        LOG(DEBUG, request.method << " '" << path << "': status = " << response.status);

        return response;
    }

    std::string S3ObjectStore::getPath(std::string_view key) const
    {
        if (key.empty() || key.front() == '/')
            throw InvalidKeyException{ "Invalid key '" + std::string{ key } + "'" };

        return "/" + _parameters.bucket + "/" + std::string{ key };
    }
} // namespace hlsforge::storage
