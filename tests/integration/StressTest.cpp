#include "rkv/BucketManager.hpp"
#include "rkv/Store.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace rkv;
using namespace std::chrono_literals;

namespace {

class CountingSubscriber : public Subscriber {
public:
    void onEvent(const Event& ev) override {
        if (ev.kind == EventKind::Updated) updates++;
        else deletes++;
    }
    std::atomic<int> updates{0};
    std::atomic<int> deletes{0};
};

} // namespace

TEST(StressTest, ManyWritersOneWatcherSeesEveryMutation) {
    BucketRegistry registry;
    PubSub bus(4);
    Context ctx(registry, bus);
    Store store(ctx);
    auto mgr = BucketManager::start(ctx, "hot");

    auto counter = std::make_shared<CountingSubscriber>();
    store.watchAll("hot", counter);

    const int writers = 8, perWriter = 250;
    std::vector<std::thread> ths;
    for (int w = 0; w < writers; ++w) {
        ths.emplace_back([&store, w]() {
            for (int i = 0; i < perWriter; ++i) {
                const std::string key = "w" + std::to_string(w) + "_" + std::to_string(i % 25);
                store.put("hot", key, i);
                if (i % 5 == 0) store.del("hot", key);
            }
        });
    }
    for (auto& t : ths) t.join();
    bus.shutdown();

    EXPECT_EQ(counter->updates.load(), writers * perWriter);
    EXPECT_EQ(counter->deletes.load(), writers * (perWriter / 5));
}

TEST(StressTest, ReadersAndWritersAcrossBuckets) {
    BucketRegistry registry;
    PubSub bus(2);
    Context ctx(registry, bus);
    Store store(ctx);

    std::vector<std::unique_ptr<BucketManager>> mgrs;
    for (int b = 0; b < 4; ++b) {
        mgrs.push_back(BucketManager::start(ctx, "b" + std::to_string(b)));
    }

    std::atomic<bool> done{false};
    std::atomic<int> reads{0};
    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&, r]() {
            const std::string bucket = "b" + std::to_string(r);
            while (!done) {
                auto v = store.fetch(bucket, "counter");
                if (v) EXPECT_TRUE(std::holds_alternative<int>(*v));
                reads++;
            }
        });
    }

    std::vector<std::thread> writers;
    for (int w = 0; w < 4; ++w) {
        writers.emplace_back([&, w]() {
            const std::string bucket = "b" + std::to_string(w);
            for (int i = 0; i < 1000; ++i) store.put(bucket, "counter", i);
        });
    }
    for (auto& t : writers) t.join();
    done = true;
    for (auto& t : readers) t.join();

    for (int b = 0; b < 4; ++b) {
        EXPECT_EQ(store.get("b" + std::to_string(b), "counter"), Value(999));
    }
    EXPECT_GT(reads.load(), 0);
}

TEST(StressTest, ConcurrentPutNewAcrossStoreHasOneWinnerAndOneEvent) {
    BucketRegistry registry;
    PubSub bus(2);
    Context ctx(registry, bus);
    Store store(ctx);
    auto mgr = BucketManager::start(ctx, "cas");

    auto counter = std::make_shared<CountingSubscriber>();
    store.watchKey("cas", "slot", counter);

    const int threads = 16;
    std::atomic<int> wins{0};
    std::atomic<bool> go{false};
    std::vector<std::thread> ths;
    for (int i = 0; i < threads; ++i) {
        ths.emplace_back([&, i]() {
            while (!go.load()) std::this_thread::yield();
            if (store.putNew("cas", "slot", i) == PutResult::Ok) wins++;
        });
    }
    go = true;
    for (auto& t : ths) t.join();
    bus.shutdown();

    EXPECT_EQ(wins.load(), 1);
    EXPECT_EQ(counter->updates.load(), 1);
}
