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

#include "queue/IWorkQueue.hpp"

namespace hlsforge::queue
{
    // Work items are rows of the work_item table
    // Claims are single UPDATE statements, so several processes can share the database file
    class DbWorkQueue : public IWorkQueue
    {
    public:
        DbWorkQueue(db::IDb& db, const WorkQueueConfig& config);
        ~DbWorkQueue() override = default;
        DbWorkQueue(const DbWorkQueue&) = delete;
        DbWorkQueue& operator=(const DbWorkQueue&) = delete;

    private:
        void push(std::string_view payload) override;
        std::optional<Delivery> pop(std::chrono::milliseconds timeout) override;
        bool ack(const Delivery& delivery) override;
        bool extendLease(const Delivery& delivery) override;
        std::vector<DeadLetter> reclaimExpiredLeases(std::size_t maxDeliveryCount) override;
        std::size_t getCount() override;
        std::size_t getAvailableCount() override;

        std::optional<Delivery> tryClaim();

        db::IDb& _db;
        const WorkQueueConfig _config;
    };
} // namespace hlsforge::queue
