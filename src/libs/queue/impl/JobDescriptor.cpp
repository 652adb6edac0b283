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

#include "queue/JobDescriptor.hpp"

#include <Wt/Json/Array.h>
#include <Wt/Json/Object.h>
#include <Wt/Json/Parser.h>
#include <Wt/Json/Serializer.h>
#include <Wt/Json/Value.h>
#include <Wt/WException.h>

#include "queue/Exception.hpp"

namespace hlsforge::queue
{
    namespace
    {
        core::UUID parseUUID(const Wt::Json::Object& root, const std::string& name)
        {
            if (root.type(name) != Wt::Json::Type::String)
                throw DescriptorParseException{ "Missing or invalid '" + name + "'" };

            const std::string value{ static_cast<std::string>(root.get(name)) };
            const std::optional<core::UUID> uuid{ core::UUID::fromString(value) };
            if (!uuid)
                throw DescriptorParseException{ "Invalid '" + name + "' value '" + value + "'" };

            return *uuid;
        }

        std::vector<unsigned> parseProfiles(const Wt::Json::Object& root)
        {
            if (root.type("profiles") != Wt::Json::Type::Array)
                throw DescriptorParseException{ "Missing or invalid 'profiles'" };

            std::vector<unsigned> profiles;

            const Wt::Json::Array& values = root.get("profiles");
            for (const Wt::Json::Value& value : values)
            {
                if (value.type() != Wt::Json::Type::Number)
                    throw DescriptorParseException{ "Invalid profile type" };

                const double height{ static_cast<double>(value) };
                if (height <= 0 || height > 100'000 || height != static_cast<double>(static_cast<unsigned>(height)))
                    throw DescriptorParseException{ "Invalid profile value " + std::to_string(height) };

                profiles.push_back(static_cast<unsigned>(height));
            }

            return profiles;
        }
    } // namespace

    std::string toJson(const JobDescriptor& descriptor)
    {
        Wt::Json::Object root;
        root["job_id"] = Wt::Json::Value{ std::string{ descriptor.jobId.getAsString() } };
        root["video_id"] = Wt::Json::Value{ std::string{ descriptor.videoId.getAsString() } };

        Wt::Json::Array profiles;
        for (unsigned height : descriptor.profiles)
            profiles.push_back(Wt::Json::Value{ static_cast<int>(height) });
        root["profiles"] = Wt::Json::Value{ std::move(profiles) };

        return Wt::Json::serialize(root);
    }

    JobDescriptor parseJobDescriptor(std::string_view payload)
    {
        Wt::Json::Object root;
        try
        {
            Wt::Json::parse(std::string{ payload }, root);
        }
        catch (const Wt::WException& e)
        {
            throw DescriptorParseException{ "Cannot parse descriptor: " + std::string{ e.what() } };
        }

        return JobDescriptor{
            .jobId = parseUUID(root, "job_id"),
            .videoId = parseUUID(root, "video_id"),
            .profiles = parseProfiles(root),
        };
    }
} // namespace hlsforge::queue
