/*
 * Copyright (C) 2023 Emeric Poupon
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

#include <mutex>

#include <Wt/Dbo/Transaction.h>

namespace hlsforge::db
{
    // Committed on scope exit, rolled back if the scope is left by an exception
    class WriteTransaction
    {
    public:
        ~WriteTransaction() noexcept(false);

    private:
        friend class Session;
        WriteTransaction(std::mutex& mutex, Wt::Dbo::Session& session);

        WriteTransaction(const WriteTransaction&) = delete;
        WriteTransaction& operator=(const WriteTransaction&) = delete;

        std::unique_lock<std::mutex> _lock;
        Wt::Dbo::Transaction _transaction;
        const int _uncaughtExceptionCount;
    };

    class ReadTransaction
    {
    public:
        ~ReadTransaction();

    private:
        friend class Session;
        ReadTransaction(Wt::Dbo::Session& session);

        ReadTransaction(const ReadTransaction&) = delete;
        ReadTransaction& operator=(const ReadTransaction&) = delete;

        Wt::Dbo::Transaction _transaction;
    };
} // namespace hlsforge::db
