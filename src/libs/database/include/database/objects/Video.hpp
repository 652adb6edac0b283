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

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <Wt/Dbo/Field.h>
#include <Wt/WDateTime.h>

#include "core/UUID.hpp"
#include "database/Object.hpp"
#include "database/Types.hpp"
#include "database/objects/VideoId.hpp"

namespace hlsforge::db
{
    class Session;

    // Uploaded source video, immutable once created
    class Video final : public Object<Video, VideoId>
    {
    public:
        Video() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, VideoId id);
        static pointer find(Session& session, const core::UUID& uuid);
        // most recent first
        static void find(Session& session, std::optional<Range> range, std::function<void(const pointer&)> func);

        // getters
        core::UUID getUUID() const;
        std::string_view getSourceKey() const { return _sourceKey; }
        const Wt::WDateTime& getCreatedAt() const { return _createdAt; }

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _uuid, "uuid");
            Wt::Dbo::field(a, _sourceKey, "source_key");
            Wt::Dbo::field(a, _createdAt, "created_at");
        }

    private:
        friend class Session;
        Video(const core::UUID& uuid, std::string_view sourceKey);
        static pointer create(Session& session, const core::UUID& uuid, std::string_view sourceKey);

        std::string _uuid;
        std::string _sourceKey;
        Wt::WDateTime _createdAt;
    };
} // namespace hlsforge::db
