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

#include "database/objects/WorkItem.hpp"

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "database/Session.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(hlsforge::db::WorkItem)

namespace hlsforge::db
{
    WorkItem::WorkItem(std::string_view payload)
        : _payload{ payload }
        , _enqueuedAt{ Wt::WDateTime::currentDateTime() }
    {
    }

    WorkItem::pointer WorkItem::create(Session& session, std::string_view payload)
    {
        return session.getDboSession()->add(std::unique_ptr<WorkItem>{ new WorkItem{ payload } });
    }

    std::size_t WorkItem::getCount(Session& session)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM work_item"));
    }

    std::size_t WorkItem::getAvailableCount(Session& session)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM work_item WHERE lease_expires IS NULL"));
    }

    WorkItem::pointer WorkItem::claim(Session& session, std::string_view leaseToken, const Wt::WDateTime& leaseExpires)
    {
        session.checkWriteTransaction();

        // single statement: no other connection can claim the same row
        utils::executeCommand(*session.getDboSession(),
            "UPDATE work_item SET lease_token = ?, lease_expires = ?, delivery_count = delivery_count + 1, version = version + 1"
            " WHERE id = (SELECT id FROM work_item WHERE lease_expires IS NULL ORDER BY id LIMIT 1)",
            std::string{ leaseToken }, leaseExpires);
        // items already loaded in this session are stale now
        session.getDboSession()->rereadAll<WorkItem>();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<WorkItem>>("SELECT w_i from work_item w_i").where("w_i.lease_token = ?").bind(std::string{ leaseToken }));
    }

    WorkItem::pointer WorkItem::find(Session& session, WorkItemId id, std::string_view leaseToken)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<WorkItem>>("SELECT w_i from work_item w_i").where("w_i.id = ?").bind(id).where("w_i.lease_token = ?").bind(std::string{ leaseToken }));
    }

    void WorkItem::findExpired(Session& session, const Wt::WDateTime& now, std::function<void(const pointer&)> func)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<WorkItem>>("SELECT w_i from work_item w_i").where("w_i.lease_expires IS NOT NULL").where("w_i.lease_expires < ?").bind(now).orderBy("w_i.id") };
        // fetch everything first, func may modify or remove the items
        for (const Wt::Dbo::ptr<WorkItem>& workItem : utils::fetchQueryResults(query))
            func(workItem);
    }

    void WorkItem::releaseLease()
    {
        _leaseToken.clear();
        _leaseExpires = Wt::WDateTime{};
    }
} // namespace hlsforge::db
