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

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <mutex>
#include <set>
#include <thread>

#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "queue/IWorkQueue.hpp"

namespace hlsforge::queue::tests
{
    class WorkQueueTest : public ::testing::Test
    {
    protected:
        WorkQueueTest()
        {
            db::Session session{ *_db };
            session.prepareTablesIfNeeded();
            session.createIndexesIfNeeded();
        }

        ~WorkQueueTest() override
        {
            _db.reset();
            std::error_code ec;
            for (const char* suffix : { "", "-wal", "-shm" })
                std::filesystem::remove(_dbFile.string() + suffix, ec);
        }

        std::unique_ptr<IWorkQueue> createQueue(std::chrono::seconds leaseDuration = std::chrono::seconds{ 300 })
        {
            return createWorkQueue(*_db, WorkQueueConfig{ leaseDuration, std::chrono::milliseconds{ 10 } });
        }

        const std::filesystem::path _dbFile{ std::tmpnam(nullptr) };
        std::unique_ptr<db::IDb> _db{ db::createDb(_dbFile, 8) };
    };

    TEST_F(WorkQueueTest, fifo)
    {
        auto queue{ createQueue() };

        queue->push("first");
        queue->push("second");
        EXPECT_EQ(queue->getCount(), 2);
        EXPECT_EQ(queue->getAvailableCount(), 2);

        const std::optional<Delivery> first{ queue->pop(std::chrono::milliseconds{ 0 }) };
        ASSERT_TRUE(first);
        EXPECT_EQ(first->payload, "first");
        EXPECT_EQ(first->deliveryCount, 1);
        EXPECT_FALSE(first->leaseToken.empty());

        const std::optional<Delivery> second{ queue->pop(std::chrono::milliseconds{ 0 }) };
        ASSERT_TRUE(second);
        EXPECT_EQ(second->payload, "second");
        EXPECT_NE(second->leaseToken, first->leaseToken);

        EXPECT_FALSE(queue->pop(std::chrono::milliseconds{ 0 }));
        EXPECT_EQ(queue->getCount(), 2);
        EXPECT_EQ(queue->getAvailableCount(), 0);
    }

    TEST_F(WorkQueueTest, popTimeout)
    {
        auto queue{ createQueue() };

        const auto start{ std::chrono::steady_clock::now() };
        EXPECT_FALSE(queue->pop(std::chrono::milliseconds{ 200 }));
        EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds{ 200 });
    }

    TEST_F(WorkQueueTest, popWaitsForPush)
    {
        auto queue{ createQueue() };

        std::thread producer{ [&] {
            std::this_thread::sleep_for(std::chrono::milliseconds{ 100 });
            queue->push("late");
        } };

        const std::optional<Delivery> delivery{ queue->pop(std::chrono::seconds{ 5 }) };
        producer.join();

        ASSERT_TRUE(delivery);
        EXPECT_EQ(delivery->payload, "late");
    }

    TEST_F(WorkQueueTest, ack)
    {
        auto queue{ createQueue() };
        queue->push("payload");

        const std::optional<Delivery> delivery{ queue->pop(std::chrono::milliseconds{ 0 }) };
        ASSERT_TRUE(delivery);

        EXPECT_TRUE(queue->ack(*delivery));
        EXPECT_EQ(queue->getCount(), 0);
        EXPECT_FALSE(queue->ack(*delivery));
    }

    TEST_F(WorkQueueTest, expiredLeaseIsRedelivered)
    {
        auto queue{ createQueue(std::chrono::seconds{ 1 }) };
        queue->push("payload");

        const std::optional<Delivery> first{ queue->pop(std::chrono::milliseconds{ 0 }) };
        ASSERT_TRUE(first);

        // lease still valid
        EXPECT_TRUE(queue->reclaimExpiredLeases(3).empty());
        EXPECT_FALSE(queue->pop(std::chrono::milliseconds{ 0 }));

        std::this_thread::sleep_for(std::chrono::milliseconds{ 1200 });
        EXPECT_TRUE(queue->reclaimExpiredLeases(3).empty());
        EXPECT_EQ(queue->getAvailableCount(), 1);

        const std::optional<Delivery> second{ queue->pop(std::chrono::milliseconds{ 0 }) };
        ASSERT_TRUE(second);
        EXPECT_EQ(second->id, first->id);
        EXPECT_EQ(second->payload, "payload");
        EXPECT_EQ(second->deliveryCount, 2);

        // the first consumer lost its lease
        EXPECT_FALSE(queue->ack(*first));
        EXPECT_FALSE(queue->extendLease(*first));
        EXPECT_TRUE(queue->ack(*second));
    }

    TEST_F(WorkQueueTest, extendLease)
    {
        auto queue{ createQueue(std::chrono::seconds{ 1 }) };
        queue->push("payload");

        const std::optional<Delivery> delivery{ queue->pop(std::chrono::milliseconds{ 0 }) };
        ASSERT_TRUE(delivery);

        std::this_thread::sleep_for(std::chrono::milliseconds{ 700 });
        EXPECT_TRUE(queue->extendLease(*delivery));
        std::this_thread::sleep_for(std::chrono::milliseconds{ 700 });

        EXPECT_TRUE(queue->reclaimExpiredLeases(3).empty());
        EXPECT_EQ(queue->getAvailableCount(), 0);
        EXPECT_TRUE(queue->ack(*delivery));
    }

    TEST_F(WorkQueueTest, deadLetter)
    {
        auto queue{ createQueue(std::chrono::seconds{ 1 }) };
        queue->push("poison");
        queue->push("other");

        for (std::size_t i{}; i < 2; ++i)
        {
            const std::optional<Delivery> delivery{ queue->pop(std::chrono::milliseconds{ 0 }) };
            ASSERT_TRUE(delivery);
            EXPECT_EQ(delivery->payload, "poison");
            EXPECT_EQ(delivery->deliveryCount, i + 1);

            std::this_thread::sleep_for(std::chrono::milliseconds{ 1200 });
            const std::vector<DeadLetter> deadLetters{ queue->reclaimExpiredLeases(2) };
            if (i == 0)
            {
                EXPECT_TRUE(deadLetters.empty());
            }
            else
            {
                ASSERT_EQ(deadLetters.size(), 1);
                EXPECT_EQ(deadLetters.front().payload, "poison");
                EXPECT_EQ(deadLetters.front().deliveryCount, 2);
            }
        }

        EXPECT_EQ(queue->getCount(), 1);
        const std::optional<Delivery> delivery{ queue->pop(std::chrono::milliseconds{ 0 }) };
        ASSERT_TRUE(delivery);
        EXPECT_EQ(delivery->payload, "other");
    }

    TEST_F(WorkQueueTest, concurrentConsumers)
    {
        constexpr std::size_t itemCount{ 100 };
        constexpr std::size_t consumerCount{ 4 };

        auto queue{ createQueue() };
        for (std::size_t i{}; i < itemCount; ++i)
            queue->push(std::to_string(i));

        std::mutex mutex;
        std::multiset<std::string> payloads;

        std::vector<std::thread> consumers;
        for (std::size_t i{}; i < consumerCount; ++i)
        {
            consumers.emplace_back([&] {
                while (const std::optional<Delivery> delivery{ queue->pop(std::chrono::milliseconds{ 0 }) })
                {
                    EXPECT_TRUE(queue->ack(*delivery));

                    const std::scoped_lock lock{ mutex };
                    payloads.insert(delivery->payload);
                }
            });
        }
        for (std::thread& consumer : consumers)
            consumer.join();

        ASSERT_EQ(payloads.size(), itemCount);
        for (std::size_t i{}; i < itemCount; ++i)
            EXPECT_EQ(payloads.count(std::to_string(i)), 1);
        EXPECT_EQ(queue->getCount(), 0);
    }

    TEST_F(WorkQueueTest, sharedDatabaseFile)
    {
        // two handles on the same file, as two worker processes would have
        std::unique_ptr<db::IDb> otherDb{ db::createDb(_dbFile, 2) };
        auto queue{ createQueue() };
        auto otherQueue{ createWorkQueue(*otherDb, WorkQueueConfig{}) };

        queue->push("payload");

        const std::optional<Delivery> delivery{ otherQueue->pop(std::chrono::milliseconds{ 0 }) };
        ASSERT_TRUE(delivery);
        EXPECT_FALSE(queue->pop(std::chrono::milliseconds{ 0 }));
        EXPECT_TRUE(otherQueue->ack(*delivery));
        EXPECT_EQ(queue->getCount(), 0);
    }
} // namespace hlsforge::queue::tests
