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

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "database/objects/WorkItemId.hpp"

namespace hlsforge::db
{
    class IDb;
}

namespace hlsforge::queue
{
    // A claimed item, only the lease holder can ack it or extend its lease
    struct Delivery
    {
        db::WorkItemId id;
        std::string leaseToken;
        std::string payload;
        std::size_t deliveryCount{}; // 1 on the first delivery
    };

    struct DeadLetter
    {
        std::string payload;
        std::size_t deliveryCount{};
    };

    // Durable FIFO with at-least-once delivery
    // Claimed items become visible again once their lease expires and the expired leases are reclaimed
    class IWorkQueue
    {
    public:
        virtual ~IWorkQueue() = default;

        virtual void push(std::string_view payload) = 0;

        // Blocks until an item could be claimed or the timeout expires
        virtual std::optional<Delivery> pop(std::chrono::milliseconds timeout) = 0;

        // Removes the item. Returns false if the lease was lost
        virtual bool ack(const Delivery& delivery) = 0;

        // Returns false if the lease was lost
        virtual bool extendLease(const Delivery& delivery) = 0;

        // Makes expired items available again
        // Items already delivered maxDeliveryCount times are removed and returned
        virtual std::vector<DeadLetter> reclaimExpiredLeases(std::size_t maxDeliveryCount) = 0;

        virtual std::size_t getCount() = 0;
        virtual std::size_t getAvailableCount() = 0;
    };

    struct WorkQueueConfig
    {
        std::chrono::seconds leaseDuration{ 300 };
        std::chrono::milliseconds pollInterval{ 500 };
    };

    std::unique_ptr<IWorkQueue> createWorkQueue(db::IDb& db, const WorkQueueConfig& config);
} // namespace hlsforge::queue
