#include <benchmark/benchmark.h>
#include "rkv/BucketManager.hpp"
#include "rkv/PubSub.hpp"
#include "rkv/Store.hpp"
#include "rkv/Subscriber.hpp"
#include <memory>
#include <vector>

namespace {

class NullSubscriber final : public rkv::Subscriber {
public:
    void onEvent(const rkv::Event&) override {}
};

} // namespace

static void BM_PubSubBroadcast(benchmark::State& state) {
    rkv::PubSub bus(2);
    std::vector<std::shared_ptr<NullSubscriber>> subs;
    for (int i = 0; i < state.range(0); ++i) {
        subs.push_back(std::make_shared<NullSubscriber>());
        bus.subscribe(rkv::Topic::forBucket("bench"), subs.back());
    }
    const rkv::Event ev{rkv::EventKind::Updated, "bench", "key"};

    for (auto _ : state) {
        bus.broadcast(rkv::Topic::forBucket("bench"), ev);
    }
    bus.shutdown();

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_PubSubBroadcast)->Arg(0)->Arg(1)->Arg(16)->Unit(benchmark::kMicrosecond);

static void BM_StorePutWatched(benchmark::State& state) {
    rkv::BucketRegistry registry;
    rkv::PubSub bus(2);
    rkv::Context ctx(registry, bus);
    rkv::Store store(ctx);
    auto mgr = rkv::BucketManager::start(ctx, "bench");

    auto sub = std::make_shared<NullSubscriber>();
    store.watchKey("bench", "key", sub);

    int i = 0;
    for (auto _ : state) {
        store.put("bench", "key", i++);
    }
    bus.shutdown();

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_StorePutWatched)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
