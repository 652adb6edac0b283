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
#include <mutex>
#include <string>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "queue/IWorkQueue.hpp"

namespace hlsforge::transcoding
{
    // Periodically extends the leases of the deliveries being processed
    // Extensions run on the given io context
    class LeaseKeeper
    {
    public:
        LeaseKeeper(boost::asio::io_context& ioContext, queue::IWorkQueue& queue, std::chrono::milliseconds period);
        ~LeaseKeeper() = default;
        LeaseKeeper(const LeaseKeeper&) = delete;
        LeaseKeeper& operator=(const LeaseKeeper&) = delete;

        class ScopedLease
        {
        public:
            ~ScopedLease();
            ScopedLease(const ScopedLease&) = delete;
            ScopedLease& operator=(const ScopedLease&) = delete;

            // true once an extension was refused: another consumer may own the item now
            bool isLost() const;

        private:
            friend class LeaseKeeper;
            ScopedLease(LeaseKeeper& keeper, const queue::Delivery& delivery);

            LeaseKeeper& _keeper;
            const std::string _leaseToken;
        };

        void start();
        [[nodiscard]] ScopedLease keep(const queue::Delivery& delivery);

    private:
        void scheduleExtend();
        void extendLeases();

        struct Lease
        {
            queue::Delivery delivery;
            bool lost{};
        };

        queue::IWorkQueue& _queue;
        const std::chrono::milliseconds _period;
        boost::asio::steady_timer _timer;

        mutable std::mutex _mutex;
        std::unordered_map<std::string, Lease> _leases; // by lease token
    };
} // namespace hlsforge::transcoding
