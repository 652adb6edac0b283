/*
 * Copyright (C) 2021 Emeric Poupon
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

#include "Common.hpp"

#include <cstdio>

namespace hlsforge::db::tests
{
    TmpDatabase::TmpDatabase()
        : _tmpFile{ std::tmpnam(nullptr) }
        , _fileDeleter{ _tmpFile }
        , _db{ createDb(_tmpFile, 8) }
    {
    }

    IDb& TmpDatabase::getDb()
    {
        return *_db;
    }

    DatabaseFixture::~DatabaseFixture()
    {
        testDatabaseEmpty();
    }

    void DatabaseFixture::SetUpTestCase()
    {
        _tmpDb = std::make_unique<TmpDatabase>();
        {
            db::Session s{ _tmpDb->getDb() };
            s.prepareTablesIfNeeded();
            s.createIndexesIfNeeded();
        }
    }

    void DatabaseFixture::TearDownTestCase()
    {
        _tmpDb.reset();
    }

    void DatabaseFixture::testDatabaseEmpty()
    {
        auto transaction{ session.createReadTransaction() };

        EXPECT_EQ(Job::getCount(session), 0);
        EXPECT_EQ(Rendition::getCount(session), 0);
        EXPECT_EQ(Video::getCount(session), 0);
        EXPECT_EQ(WorkItem::getCount(session), 0);
    }

    TEST_F(DatabaseFixture, Common_IdType)
    {
        {
            const IdType id{};
            EXPECT_FALSE(id.isValid());
        }

        {
            const IdType id{ 0 };
            EXPECT_TRUE(id.isValid());
        }

        {
            const IdType id1{ 1 };
            const IdType id2{ 2 };
            EXPECT_NE(id1, id2);
            EXPECT_LT(id1, id2);
        }
    }

    TEST_F(DatabaseFixture, Common_statusStrings)
    {
        EXPECT_EQ(toString(JobStatus::Queued), "queued");
        EXPECT_EQ(toString(JobStatus::Done), "done");
        EXPECT_EQ(toString(RenditionStatus::Ready), "ready");
        EXPECT_EQ(toString(RenditionStatus::Failed), "failed");

        EXPECT_FALSE(isTerminal(JobStatus::Running));
        EXPECT_TRUE(isTerminal(JobStatus::Failed));
        EXPECT_FALSE(isTerminal(RenditionStatus::Queued));
        EXPECT_TRUE(isTerminal(RenditionStatus::Ready));
    }
} // namespace hlsforge::db::tests
