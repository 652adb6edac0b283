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
#include <string>
#include <string_view>

#include <Wt/Dbo/Field.h>
#include <Wt/WDateTime.h>

#include "database/Object.hpp"
#include "database/objects/WorkItemId.hpp"

namespace hlsforge::db
{
    class Session;

    // Durable work queue entry, FIFO order is the id order
    // An item is available when it holds no lease
    class WorkItem final : public Object<WorkItem, WorkItemId>
    {
    public:
        WorkItem() = default;

        static std::size_t getCount(Session& session);
        static std::size_t getAvailableCount(Session& session);

        // Atomically leases the oldest available item, if any
        // Needs a write transaction
        static pointer claim(Session& session, std::string_view leaseToken, const Wt::WDateTime& leaseExpires);

        // Only returns the item if it is still leased with this token
        static pointer find(Session& session, WorkItemId id, std::string_view leaseToken);

        // Leased items whose lease expired before the given date
        static void findExpired(Session& session, const Wt::WDateTime& now, std::function<void(const pointer&)> func);

        // getters
        std::string_view getPayload() const { return _payload; }
        const Wt::WDateTime& getEnqueuedAt() const { return _enqueuedAt; }
        std::string_view getLeaseToken() const { return _leaseToken; }
        const Wt::WDateTime& getLeaseExpires() const { return _leaseExpires; }
        std::size_t getDeliveryCount() const { return static_cast<std::size_t>(_deliveryCount); }
        bool isLeased() const { return !_leaseExpires.isNull(); }

        // setters
        void setLeaseExpires(const Wt::WDateTime& leaseExpires) { _leaseExpires = leaseExpires; }
        void releaseLease(); // makes the item available again

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _payload, "payload");
            Wt::Dbo::field(a, _enqueuedAt, "enqueued_at");
            Wt::Dbo::field(a, _leaseToken, "lease_token");
            Wt::Dbo::field(a, _leaseExpires, "lease_expires");
            Wt::Dbo::field(a, _deliveryCount, "delivery_count");
        }

    private:
        friend class Session;
        WorkItem(std::string_view payload);
        static pointer create(Session& session, std::string_view payload);

        std::string _payload;
        Wt::WDateTime _enqueuedAt;
        std::string _leaseToken;
        Wt::WDateTime _leaseExpires;
        int _deliveryCount{};
    };
} // namespace hlsforge::db
