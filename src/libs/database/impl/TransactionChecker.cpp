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

#include "TransactionChecker.hpp"

#if HLSFORGE_CHECK_TRANSACTION_ACCESSES

    #include <cassert>
    #include <vector>

namespace hlsforge::db
{
    namespace
    {
        struct StackEntry
        {
            TransactionChecker::TransactionType type;
            const Wt::Dbo::Session* session{};
        };

        thread_local std::vector<StackEntry> transactionStack;

        void pushTransaction(TransactionChecker::TransactionType type, const Wt::Dbo::Session& session)
        {
            // a thread must not interleave transactions of different sessions
            assert(transactionStack.empty() || transactionStack.back().session == &session);
            transactionStack.push_back(StackEntry{ type, &session });
        }

        void popTransaction(TransactionChecker::TransactionType type, const Wt::Dbo::Session& session)
        {
            assert(!transactionStack.empty());
            assert(transactionStack.back().type == type);
            assert(transactionStack.back().session == &session);
            transactionStack.pop_back();
        }
    } // namespace

    void TransactionChecker::pushWriteTransaction(const Wt::Dbo::Session& session)
    {
        pushTransaction(TransactionType::Write, session);
    }

    void TransactionChecker::pushReadTransaction(const Wt::Dbo::Session& session)
    {
        pushTransaction(TransactionType::Read, session);
    }

    void TransactionChecker::popWriteTransaction(const Wt::Dbo::Session& session)
    {
        popTransaction(TransactionType::Write, session);
    }

    void TransactionChecker::popReadTransaction(const Wt::Dbo::Session& session)
    {
        popTransaction(TransactionType::Read, session);
    }

    void TransactionChecker::checkWriteTransaction(const Wt::Dbo::Session& session)
    {
        assert(!transactionStack.empty());
        assert(transactionStack.back().type == TransactionType::Write);
        assert(transactionStack.back().session == &session);
    }

    void TransactionChecker::checkReadTransaction(const Wt::Dbo::Session& session)
    {
        // a write transaction is also fine for reading
        assert(!transactionStack.empty());
        assert(transactionStack.back().session == &session);
    }
} // namespace hlsforge::db

#endif
