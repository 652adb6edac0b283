/*
 * Copyright (C) 2019 Emeric Poupon
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

#include "database/Session.hpp"

#include <Wt/Dbo/WtSqlTraits.h>

#include "core/ILogger.hpp"

#include "database/objects/Job.hpp"
#include "database/objects/Rendition.hpp"
#include "database/objects/Video.hpp"
#include "database/objects/WorkItem.hpp"

#include "Db.hpp"
#include "TransactionChecker.hpp"
#include "Utils.hpp"

namespace hlsforge::db
{
    Session::Session(IDb& db)
        : _db{ db }
    {
        _session.setConnectionPool(static_cast<Db&>(_db).getConnectionPool());

        _session.mapClass<Job>("job");
        _session.mapClass<Rendition>("rendition");
        _session.mapClass<Video>("video");
        _session.mapClass<WorkItem>("work_item");
    }

    WriteTransaction Session::createWriteTransaction()
    {
        return WriteTransaction{ static_cast<Db&>(_db).getMutex(), _session };
    }

    ReadTransaction Session::createReadTransaction()
    {
        return ReadTransaction{ _session };
    }

    void Session::checkWriteTransaction() const
    {
#if HLSFORGE_CHECK_TRANSACTION_ACCESSES
        TransactionChecker::checkWriteTransaction(_session);
#endif
    }

    void Session::checkReadTransaction() const
    {
#if HLSFORGE_CHECK_TRANSACTION_ACCESSES
        TransactionChecker::checkReadTransaction(_session);
#endif
    }

    void Session::prepareTablesIfNeeded()
    {
        HLSFORGE_LOG(DB, INFO, "Preparing tables...");

        // Initial creation case
        try
        {
            auto transaction{ createWriteTransaction() };
            _session.createTables();
            HLSFORGE_LOG(DB, INFO, "Tables created");
        }
        catch (const Wt::Dbo::Exception& e)
        {
            HLSFORGE_LOG(DB, DEBUG, "Cannot create tables: " << e.what());
            if (std::string_view{ e.what() }.find("already exists") == std::string_view::npos)
            {
                HLSFORGE_LOG(DB, ERROR, "Cannot create tables: " << e.what());
                throw;
            }
        }
    }

    void Session::createIndexesIfNeeded()
    {
        HLSFORGE_LOG(DB, INFO, "Creating indexes...");

        {
            auto transaction{ createWriteTransaction() };

            utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS video_uuid_idx ON video(uuid)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS video_created_at_idx ON video(created_at)");
            utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS job_uuid_idx ON job(uuid)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS job_video_idx ON job(video_id)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS job_video_status_idx ON job(video_id, status)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS rendition_job_idx ON rendition(job_id)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS rendition_video_idx ON rendition(video_id)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS work_item_lease_expires_idx ON work_item(lease_expires)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS work_item_lease_token_idx ON work_item(lease_token)");
        }

        HLSFORGE_LOG(DB, INFO, "Indexes created!");
    }

    void Session::vacuumIfNeeded()
    {
        long pageCount{};
        long freeListCount{};

        {
            auto transaction{ createReadTransaction() };
            pageCount = utils::fetchQuerySingleResult(_session.query<long>("SELECT page_count FROM pragma_page_count"));
            freeListCount = utils::fetchQuerySingleResult(_session.query<long>("SELECT freelist_count FROM pragma_freelist_count"));
        }

        HLSFORGE_LOG(DB, INFO, "page stats: page_count = " << pageCount << ", freelist_count = " << freeListCount);
        if (freeListCount >= (pageCount / 10))
            vacuum();
    }

    void Session::vacuum()
    {
        HLSFORGE_LOG(DB, INFO, "Performing vacuum...");

        // We manually take a lock here since vacuum cannot be inside a transaction
        {
            std::unique_lock lock{ static_cast<Db&>(_db).getMutex() };
            static_cast<Db&>(_db).executeSql("VACUUM");
        }

        HLSFORGE_LOG(DB, INFO, "Vacuum complete!");
    }
} // namespace hlsforge::db
