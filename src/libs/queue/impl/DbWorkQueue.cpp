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

#include "DbWorkQueue.hpp"

#include <algorithm>
#include <thread>

#include <Wt/WDateTime.h>

#include "core/ILogger.hpp"
#include "core/UUID.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/WorkItem.hpp"

namespace hlsforge::queue
{
    std::unique_ptr<IWorkQueue> createWorkQueue(db::IDb& db, const WorkQueueConfig& config)
    {
        return std::make_unique<DbWorkQueue>(db, config);
    }

    DbWorkQueue::DbWorkQueue(db::IDb& db, const WorkQueueConfig& config)
        : _db{ db }
        , _config{ config }
    {
        HLSFORGE_LOG(QUEUE, INFO, "Lease duration = " << _config.leaseDuration.count() << "s, poll interval = " << _config.pollInterval.count() << "ms");
    }

    void DbWorkQueue::push(std::string_view payload)
    {
        db::Session& session{ _db.getTLSSession() };

        db::WorkItemId id;
        {
            auto transaction{ session.createWriteTransaction() };
            id = session.create<db::WorkItem>(payload)->getId();
        }

        HLSFORGE_LOG(QUEUE, DEBUG, "Pushed item " << id.toString());
    }

    std::optional<Delivery> DbWorkQueue::pop(std::chrono::milliseconds timeout)
    {
        const auto deadline{ std::chrono::steady_clock::now() + timeout };

        while (true)
        {
            if (std::optional<Delivery> delivery{ tryClaim() })
                return delivery;

            const auto now{ std::chrono::steady_clock::now() };
            if (now >= deadline)
                return std::nullopt;

            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(_config.pollInterval, deadline - now));
        }
    }

    std::optional<Delivery> DbWorkQueue::tryClaim()
    {
        db::Session& session{ _db.getTLSSession() };

        const std::string leaseToken{ core::UUID::generate().getAsString() };
        const Wt::WDateTime leaseExpires{ Wt::WDateTime::currentDateTime().addSecs(static_cast<int>(_config.leaseDuration.count())) };

        std::optional<Delivery> delivery;
        {
            auto transaction{ session.createWriteTransaction() };

            const db::WorkItem::pointer workItem{ db::WorkItem::claim(session, leaseToken, leaseExpires) };
            if (!workItem)
                return std::nullopt;

            delivery = Delivery{ workItem->getId(), leaseToken, std::string{ workItem->getPayload() }, workItem->getDeliveryCount() };
        }

        HLSFORGE_LOG(QUEUE, DEBUG, "Claimed item " << delivery->id.toString() << ", delivery " << delivery->deliveryCount);
        return delivery;
    }

    bool DbWorkQueue::ack(const Delivery& delivery)
    {
        db::Session& session{ _db.getTLSSession() };

        {
            auto transaction{ session.createWriteTransaction() };

            db::WorkItem::pointer workItem{ db::WorkItem::find(session, delivery.id, delivery.leaseToken) };
            if (!workItem)
            {
                HLSFORGE_LOG(QUEUE, WARNING, "Cannot ack item " << delivery.id.toString() << ": lease lost");
                return false;
            }

            workItem.remove();
        }

        HLSFORGE_LOG(QUEUE, DEBUG, "Acked item " << delivery.id.toString());
        return true;
    }

    bool DbWorkQueue::extendLease(const Delivery& delivery)
    {
        db::Session& session{ _db.getTLSSession() };

        auto transaction{ session.createWriteTransaction() };

        db::WorkItem::pointer workItem{ db::WorkItem::find(session, delivery.id, delivery.leaseToken) };
        if (!workItem)
        {
            HLSFORGE_LOG(QUEUE, WARNING, "Cannot extend lease of item " << delivery.id.toString() << ": lease lost");
            return false;
        }

        workItem.modify()->setLeaseExpires(Wt::WDateTime::currentDateTime().addSecs(static_cast<int>(_config.leaseDuration.count())));
        return true;
    }

    std::vector<DeadLetter> DbWorkQueue::reclaimExpiredLeases(std::size_t maxDeliveryCount)
    {
        db::Session& session{ _db.getTLSSession() };

        std::vector<DeadLetter> deadLetters;
        std::size_t reclaimedCount{};
        {
            auto transaction{ session.createWriteTransaction() };

            db::WorkItem::findExpired(session, Wt::WDateTime::currentDateTime(), [&](const db::WorkItem::pointer& item) {
                db::WorkItem::pointer workItem{ item };
                if (workItem->getDeliveryCount() >= maxDeliveryCount)
                {
                    HLSFORGE_LOG(QUEUE, WARNING, "Item " << workItem->getId().toString() << " abandoned after " << workItem->getDeliveryCount() << " deliveries");
                    deadLetters.push_back(DeadLetter{ std::string{ workItem->getPayload() }, workItem->getDeliveryCount() });
                    workItem.remove();
                }
                else
                {
                    workItem.modify()->releaseLease();
                    reclaimedCount++;
                }
            });
        }

        if (reclaimedCount > 0 || !deadLetters.empty())
            HLSFORGE_LOG(QUEUE, INFO, "Reclaimed " << reclaimedCount << " expired leases, " << deadLetters.size() << " dead letters");

        return deadLetters;
    }

    std::size_t DbWorkQueue::getCount()
    {
        db::Session& session{ _db.getTLSSession() };

        auto transaction{ session.createReadTransaction() };
        return db::WorkItem::getCount(session);
    }

    std::size_t DbWorkQueue::getAvailableCount()
    {
        db::Session& session{ _db.getTLSSession() };

        auto transaction{ session.createReadTransaction() };
        return db::WorkItem::getAvailableCount(session);
    }
} // namespace hlsforge::queue
