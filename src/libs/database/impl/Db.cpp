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

#include "Db.hpp"

#include <atomic>
#include <cassert>
#include <functional>
#include <memory>
#include <unordered_map>

#include <Wt/Dbo/FixedSqlConnectionPool.h>
#include <Wt/Dbo/backend/Sqlite3.h>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "database/Session.hpp"
#include "database/Types.hpp"

namespace hlsforge::db
{
    namespace
    {
        class Connection : public Wt::Dbo::backend::Sqlite3
        {
        public:
            Connection(const std::filesystem::path& dbPath)
                : Wt::Dbo::backend::Sqlite3{ dbPath.string() }
                , _dbPath{ dbPath }
            {
                prepare();
            }

            Connection(const Connection& other)
                : Wt::Dbo::backend::Sqlite3{ other }
                , _dbPath{ other._dbPath }
            {
                prepare();
            }
            ~Connection() override = default;

        private:
            Connection& operator=(const Connection&) = delete;
            Connection(Connection&&) = delete;
            Connection&& operator=(Connection&&) = delete;

            std::unique_ptr<SqlConnection> clone() const override
            {
                return std::make_unique<Connection>(*this);
            }

            void prepare()
            {
                HLSFORGE_LOG(DB, DEBUG, "Setting per-connection settings...");
                executeSql("PRAGMA journal_mode=WAL");
                executeSql("PRAGMA synchronous=normal");
                executeSql("PRAGMA foreign_keys=ON");
                // other worker processes may share the same file
                executeSql("PRAGMA busy_timeout=10000");
                HLSFORGE_LOG(DB, DEBUG, "Setting per-connection settings done!");
            }

            std::filesystem::path _dbPath;
        };

        enum class IntegrityCheckType
        {
            Quick,
            Full
        };
        bool checkDbIntegrity(Wt::Dbo::SqlConnection& connection, IntegrityCheckType checkType, std::function<void(std::string_view error)> errorCallback)
        {
            bool integrityCheckPassed{};

            auto statement = connection.prepareStatement(checkType == IntegrityCheckType::Full ? "PRAGMA integrity_check" : "PRAGMA quick_check");
            statement->execute();

            std::string result;
            result.reserve(32);
            while (statement->nextRow())
            {
                result.clear();
                statement->getResult(0, &result, static_cast<int>(result.capacity()));

                if (result == "ok")
                {
                    integrityCheckPassed = true;
                    break;
                }

                errorCallback(result);
            }

            return integrityCheckPassed;
        }

        bool checkDbForeignKeyConstraints(Wt::Dbo::SqlConnection& connection, std::function<void(std::string_view table, long long rowId, std::string_view referredTable)> errorCallback)
        {
            bool foreignKeyConstraintsPassed{ true };

            auto statement = connection.prepareStatement("PRAGMA foreign_key_check");
            statement->execute();

            std::string table;
            std::string foreignTable;
            // see https://www.sqlite.org/pragma.html#pragma_foreign_key_check for expected result
            while (statement->nextRow())
            {
                foreignKeyConstraintsPassed = false;

                table.clear();
                foreignTable.clear();
                long long rowId{};

                statement->getResult(0, &table, static_cast<int>(table.capacity()));
                statement->getResult(1, &rowId);
                statement->getResult(2, &foreignTable, static_cast<int>(foreignTable.capacity()));

                errorCallback(table, rowId, foreignTable);
            }

            return foreignKeyConstraintsPassed;
        }

        std::size_t generateInstanceId()
        {
            static std::atomic<std::size_t> counter{};
            return counter++;
        }
    } // namespace

    std::unique_ptr<IDb> createDb(const std::filesystem::path& dbPath, std::size_t connectionCount)
    {
        return std::make_unique<Db>(dbPath, connectionCount);
    }

    Db::Db(const std::filesystem::path& dbPath, std::size_t connectionCount)
        : _instanceId{ generateInstanceId() }
    {
        std::string checkType{ "quick" };
        HLSFORGE_LOG(DB, INFO, "Creating connection pool on file " << dbPath << " with " << connectionCount << " connections");

        auto connection{ std::make_unique<Connection>(dbPath) };
        if (core::IConfig * config{ core::Service<core::IConfig>::get() }) // may not be here on testU
        {
            connection->setProperty("show-queries", config->getBool("db-show-queries", false) ? "true" : "false");
            checkType = config->getString("db-integrity-check", "quick");
        }

        auto connectionPool{ std::make_unique<Wt::Dbo::FixedSqlConnectionPool>(std::move(connection), static_cast<int>(connectionCount)) };
        connectionPool->setTimeout(std::chrono::seconds{ 10 });

        _connectionPool = std::move(connectionPool);

        executeSql("PRAGMA temp_store=MEMORY");
        executeSql("PRAGMA cache_size=-8000");

        if (checkType == "quick")
        {
            performQuickCheck();
        }
        else if (checkType == "full")
        {
            performIntegrityCheck();
            performForeignKeyConstraintsCheck();
        }
        else if (checkType != "none")
        {
            throw Exception("Invalid 'db-integrity-check' value: '" + checkType + "'. Expected 'quick', 'full' or 'none'.");
        }
    }

    void Db::executeSql(const std::string& sql)
    {
        ScopedConnection connection{ *_connectionPool };
        connection->executeSql(sql);
    }

    Session& Db::getTLSSession()
    {
        // keyed by instance id, addresses of destroyed databases may be reused
        static thread_local std::unordered_map<std::size_t, Session*> tlsSessions;

        Session*& tlsSession{ tlsSessions[_instanceId] };
        if (!tlsSession)
        {
            auto newSession{ std::make_unique<Session>(*this) };
            tlsSession = newSession.get();

            {
                std::scoped_lock lock{ _tlsSessionsMutex };
                _tlsSessions.push_back(std::move(newSession));
            }
        }

        assert(&tlsSession->getDb() == this);

        return *tlsSession;
    }

    void Db::performQuickCheck()
    {
        ScopedConnection connection{ *_connectionPool };

        HLSFORGE_LOG(DB, INFO, "Performing quick database check...");

        const bool quickCheckPassed{ checkDbIntegrity(*connection, IntegrityCheckType::Quick, [&](std::string_view error) {
            HLSFORGE_LOG(DB, ERROR, "Quick check error: " << error);
        }) };

        if (quickCheckPassed)
            HLSFORGE_LOG(DB, INFO, "Quick database check passed!");
        else
            HLSFORGE_LOG(DB, ERROR, "Quick database check done with errors!");
    }

    void Db::performIntegrityCheck()
    {
        ScopedConnection connection{ *_connectionPool };

        HLSFORGE_LOG(DB, INFO, "Checking database integrity...");

        const bool integrityCheckPassed{ checkDbIntegrity(*connection, IntegrityCheckType::Full, [&](std::string_view error) {
            HLSFORGE_LOG(DB, ERROR, "Integrity check error: " << error);
        }) };

        if (integrityCheckPassed)
            HLSFORGE_LOG(DB, INFO, "Database integrity check passed!");
        else
            HLSFORGE_LOG(DB, ERROR, "Database integrity check done with errors!");
    }

    void Db::performForeignKeyConstraintsCheck()
    {
        ScopedConnection connection{ *_connectionPool };

        HLSFORGE_LOG(DB, INFO, "Checking foreign key constraints...");

        const bool foreignKeyConstraintsPassed{ checkDbForeignKeyConstraints(*connection, [&](std::string_view table, long long rowId, std::string_view referredTable) {
            HLSFORGE_LOG(DB, ERROR, "Foreign key constraint failed in table '" << table << "', rowid = " << rowId << ", referred table = '" << referredTable << "'");
        }) };

        if (!foreignKeyConstraintsPassed)
            throw Exception("Foreign key constraints check failed! Please restore from a backup or recreate the database.");

        HLSFORGE_LOG(DB, INFO, "Foreign key constraints check passed!");
    }

    Db::ScopedConnection::ScopedConnection(Wt::Dbo::SqlConnectionPool& pool)
        : _connectionPool{ pool }
        , _connection{ _connectionPool.getConnection() }
    {
    }

    Db::ScopedConnection::~ScopedConnection()
    {
        _connectionPool.returnConnection(std::move(_connection));
    }

    Wt::Dbo::SqlConnection* Db::ScopedConnection::operator->() const
    {
        return _connection.get();
    }
} // namespace hlsforge::db
