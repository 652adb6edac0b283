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

#include "database/objects/Video.hpp"

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "database/Session.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(hlsforge::db::Video)

namespace hlsforge::db
{
    Video::Video(const core::UUID& uuid, std::string_view sourceKey)
        : _uuid{ uuid.getAsString() }
        , _sourceKey{ sourceKey }
        , _createdAt{ utils::normalizeDateTime(Wt::WDateTime::currentDateTime()) }
    {
    }

    Video::pointer Video::create(Session& session, const core::UUID& uuid, std::string_view sourceKey)
    {
        return session.getDboSession()->add(std::unique_ptr<Video>{ new Video{ uuid, sourceKey } });
    }

    std::size_t Video::getCount(Session& session)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM video"));
    }

    Video::pointer Video::find(Session& session, VideoId id)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Video>>("SELECT v from video v").where("v.id = ?").bind(id));
    }

    Video::pointer Video::find(Session& session, const core::UUID& uuid)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Video>>("SELECT v from video v").where("v.uuid = ?").bind(std::string{ uuid.getAsString() }));
    }

    void Video::find(Session& session, std::optional<Range> range, std::function<void(const pointer&)> func)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<Video>>("SELECT v from video v").orderBy("v.created_at DESC, v.id DESC") };
        utils::forEachQueryRangeResult(query, range, [&](const Wt::Dbo::ptr<Video>& video) { func(video); });
    }

    core::UUID Video::getUUID() const
    {
        // only valid uuids are stored
        return core::UUID::fromString(_uuid).value();
    }
} // namespace hlsforge::db
