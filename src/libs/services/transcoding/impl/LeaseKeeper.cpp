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

#include "LeaseKeeper.hpp"

#include <vector>

#include "core/ILogger.hpp"

namespace hlsforge::transcoding
{
    LeaseKeeper::ScopedLease::ScopedLease(LeaseKeeper& keeper, const queue::Delivery& delivery)
        : _keeper{ keeper }
        , _leaseToken{ delivery.leaseToken }
    {
        const std::scoped_lock lock{ _keeper._mutex };
        _keeper._leases.emplace(_leaseToken, Lease{ delivery, false });
    }

    LeaseKeeper::ScopedLease::~ScopedLease()
    {
        const std::scoped_lock lock{ _keeper._mutex };
        _keeper._leases.erase(_leaseToken);
    }

    bool LeaseKeeper::ScopedLease::isLost() const
    {
        const std::scoped_lock lock{ _keeper._mutex };

        auto it{ _keeper._leases.find(_leaseToken) };
        return it != std::cend(_keeper._leases) && it->second.lost;
    }

    LeaseKeeper::LeaseKeeper(boost::asio::io_context& ioContext, queue::IWorkQueue& queue, std::chrono::milliseconds period)
        : _queue{ queue }
        , _period{ period }
        , _timer{ ioContext }
    {
    }

    void LeaseKeeper::start()
    {
        scheduleExtend();
    }

    LeaseKeeper::ScopedLease LeaseKeeper::keep(const queue::Delivery& delivery)
    {
        return ScopedLease{ *this, delivery };
    }

    void LeaseKeeper::scheduleExtend()
    {
        _timer.expires_after(_period);
        _timer.async_wait([this](const boost::system::error_code& ec) {
            if (ec)
                return;

            extendLeases();
            scheduleExtend();
        });
    }

    void LeaseKeeper::extendLeases()
    {
        std::vector<queue::Delivery> deliveries;
        {
            const std::scoped_lock lock{ _mutex };
            for (const auto& [leaseToken, lease] : _leases)
            {
                if (!lease.lost)
                    deliveries.push_back(lease.delivery);
            }
        }

        for (const queue::Delivery& delivery : deliveries)
        {
            bool extended{};
            try
            {
                extended = _queue.extendLease(delivery);
            }
            catch (const std::exception& e)
            {
                // next period may do better
                HLSFORGE_LOG(TRANSCODING, ERROR, "Cannot extend lease of item " << delivery.id.toString() << ": " << e.what());
                extended = true;
            }

            if (extended)
                continue;

            HLSFORGE_LOG(TRANSCODING, WARNING, "Lease of item " << delivery.id.toString() << " lost");

            const std::scoped_lock lock{ _mutex };
            if (auto it{ _leases.find(delivery.leaseToken) }; it != std::cend(_leases))
                it->second.lost = true;
        }
    }
} // namespace hlsforge::transcoding
