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

#include "database/Transaction.hpp"

#include <exception>

#include "TransactionChecker.hpp"

namespace hlsforge::db
{
    WriteTransaction::WriteTransaction(std::mutex& mutex, Wt::Dbo::Session& session)
        : _lock{ mutex }
        , _transaction{ session }
        , _uncaughtExceptionCount{ std::uncaught_exceptions() }
    {
#if HLSFORGE_CHECK_TRANSACTION_ACCESSES
        TransactionChecker::pushWriteTransaction(_transaction.session());
#endif
    }

    WriteTransaction::~WriteTransaction() noexcept(false)
    {
#if HLSFORGE_CHECK_TRANSACTION_ACCESSES
        TransactionChecker::popWriteTransaction(_transaction.session());
#endif

        // Unwinding: let Wt::Dbo::Transaction roll back
        if (std::uncaught_exceptions() > _uncaughtExceptionCount)
            return;

        _transaction.commit();
    }

    ReadTransaction::ReadTransaction(Wt::Dbo::Session& session)
        : _transaction{ session }
    {
#if HLSFORGE_CHECK_TRANSACTION_ACCESSES
        TransactionChecker::pushReadTransaction(_transaction.session());
#endif
    }

    ReadTransaction::~ReadTransaction()
    {
#if HLSFORGE_CHECK_TRANSACTION_ACCESSES
        TransactionChecker::popReadTransaction(_transaction.session());
#endif
    }
} // namespace hlsforge::db
