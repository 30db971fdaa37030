#include "rkv/BucketRegistry.hpp"
#include "rkv/Table.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace rkv;

TEST(BucketRegistryTest, OwnerIdsAreUnique) {
    BucketRegistry reg;
    auto a = reg.newOwnerId();
    auto b = reg.newOwnerId();
    EXPECT_NE(a, b);
}

TEST(BucketRegistryTest, RegisterUpdateResolve) {
    BucketRegistry reg;
    auto owner = reg.newOwnerId();
    auto table = std::make_shared<Table>();

    ASSERT_EQ(reg.registerBucket("orders", owner), RegisterResult::Ok);
    // claimed but not yet published
    EXPECT_EQ(reg.resolve("orders"), nullptr);

    ASSERT_TRUE(reg.update("orders", owner, table));
    EXPECT_EQ(reg.resolve("orders"), table);
    EXPECT_TRUE(reg.contains("orders"));
    EXPECT_EQ(reg.size(), 1u);
}

TEST(BucketRegistryTest, ResolveUnknownIsNull) {
    BucketRegistry reg;
    EXPECT_EQ(reg.resolve("none"), nullptr);
    EXPECT_FALSE(reg.contains("none"));
}

TEST(BucketRegistryTest, SecondRegisterFails) {
    BucketRegistry reg;
    auto first = reg.newOwnerId();
    auto second = reg.newOwnerId();
    auto table = std::make_shared<Table>();
    ASSERT_EQ(reg.registerBucket("b", first), RegisterResult::Ok);
    ASSERT_TRUE(reg.update("b", first, table));

    EXPECT_EQ(reg.registerBucket("b", second), RegisterResult::AlreadyRegistered);
    // the existing entry is untouched
    EXPECT_EQ(reg.resolve("b"), table);
}

TEST(BucketRegistryTest, UpdateByNonOwnerRejected) {
    BucketRegistry reg;
    auto owner = reg.newOwnerId();
    auto other = reg.newOwnerId();
    ASSERT_EQ(reg.registerBucket("b", owner), RegisterResult::Ok);
    EXPECT_FALSE(reg.update("b", other, std::make_shared<Table>()));
    EXPECT_FALSE(reg.update("missing", owner, std::make_shared<Table>()));
    EXPECT_EQ(reg.resolve("b"), nullptr);
}

TEST(BucketRegistryTest, UnregisterOnlyByOwner) {
    BucketRegistry reg;
    auto owner = reg.newOwnerId();
    auto table = std::make_shared<Table>();
    reg.registerBucket("b", owner);
    reg.update("b", owner, table);

    reg.unregister("b", owner + 1000);
    EXPECT_EQ(reg.resolve("b"), table);

    reg.unregister("b", owner);
    EXPECT_EQ(reg.resolve("b"), nullptr);
    EXPECT_NO_THROW(reg.unregister("b", owner));
}

TEST(BucketRegistryTest, ExpiredTableStopsResolving) {
    BucketRegistry reg;
    auto owner = reg.newOwnerId();
    auto table = std::make_shared<Table>();
    reg.registerBucket("b", owner);
    reg.update("b", owner, table);

    table.reset();
    EXPECT_EQ(reg.resolve("b"), nullptr);
    EXPECT_EQ(reg.size(), 0u);
    EXPECT_TRUE(reg.names().empty());
}

TEST(BucketRegistryTest, StaleEntryCanBeReclaimed) {
    BucketRegistry reg;
    auto oldOwner = reg.newOwnerId();
    auto newOwner = reg.newOwnerId();
    auto oldTable = std::make_shared<Table>();
    reg.registerBucket("b", oldOwner);
    reg.update("b", oldOwner, oldTable);
    oldTable.reset();

    auto newTable = std::make_shared<Table>();
    ASSERT_EQ(reg.registerBucket("b", newOwner), RegisterResult::Ok);
    ASSERT_TRUE(reg.update("b", newOwner, newTable));

    // the old owner's late teardown must not remove the new entry
    reg.unregister("b", oldOwner);
    EXPECT_EQ(reg.resolve("b"), newTable);
}

TEST(BucketRegistryTest, NamesListsPublishedBuckets) {
    BucketRegistry reg;
    std::vector<std::shared_ptr<Table>> tables;
    for (const char* name : {"a", "b", "c"}) {
        auto owner = reg.newOwnerId();
        tables.push_back(std::make_shared<Table>());
        reg.registerBucket(name, owner);
        reg.update(name, owner, tables.back());
    }
    reg.registerBucket("pending", reg.newOwnerId());

    auto names = reg.names();
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names, (std::vector<BucketId>{"a", "b", "c"}));
}

TEST(BucketRegistryTest, ConcurrentRegisterHasOneWinner) {
    BucketRegistry reg;
    const int threads = 16;
    std::atomic<int> wins{0};
    std::atomic<bool> go{false};
    std::vector<std::thread> ths;
    for (int i = 0; i < threads; ++i) {
        ths.emplace_back([&]() {
            auto owner = reg.newOwnerId();
            while (!go.load()) std::this_thread::yield();
            if (reg.registerBucket("contested", owner) == RegisterResult::Ok) wins++;
        });
    }
    go = true;
    for (auto& t : ths) t.join();
    EXPECT_EQ(wins.load(), 1);
}

TEST(BucketRegistryTest, ConcurrentDistinctRegistrations) {
    BucketRegistry reg;
    const int count = 50;
    std::vector<std::shared_ptr<Table>> tables(count);
    std::vector<std::thread> threads;
    for (int i = 0; i < count; ++i) {
        tables[i] = std::make_shared<Table>();
        threads.emplace_back([&reg, &tables, i]() {
            auto owner = reg.newOwnerId();
            const std::string id = "id" + std::to_string(i);
            reg.registerBucket(id, owner);
            reg.update(id, owner, tables[i]);
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(reg.size(), static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        EXPECT_EQ(reg.resolve("id" + std::to_string(i)), tables[i]);
    }
}
