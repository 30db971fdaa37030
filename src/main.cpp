// File: src/main.cpp
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include "rkv/BucketManager.hpp"
#include "rkv/BucketRegistry.hpp"
#include "rkv/Context.hpp"
#include "rkv/Errors.hpp"
#include "rkv/PubSub.hpp"
#include "rkv/Store.hpp"
#include "rkv/Subscriber.hpp"

#include "rkv/rt/ShutdownCoordinator.hpp"
#include "rkv/util/Config.hpp"
#include "rkv/util/Logger.hpp"
#include "rkv/util/Metrics.hpp"

using rkv::util::LogLevel;
using rkv::util::logger;

static rkv::rt::ShutdownCoordinator gShutdown;

static std::string render(const rkv::Value& v) {
  if (auto s = std::get_if<std::string>(&v)) return *s;
  if (auto i = std::get_if<int>(&v)) return std::to_string(*i);
  if (auto d = std::get_if<double>(&v)) return std::to_string(*d);
  if (auto b = std::get_if<bool>(&v)) return *b ? "true" : "false";
  if (rkv::isNil(v)) return "nil";
  return "<list>";
}

// argv[1] = config file (optional)
int main(int argc, char* argv[]) {
  rkv::util::Config cfg;
  if (argc > 1 && !cfg.loadFromFile(argv[1])) {
    logger().log(LogLevel::Warn, "Failed to load config file", { {"path", argv[1]} });
  }
  cfg.apply();
  if (cfg.buckets.empty()) cfg.buckets["orders"] = "{}";

  logger().log(LogLevel::Info, "boot",
               { {"busThreads", std::to_string(cfg.busThreads)},
                 {"buckets", std::to_string(cfg.buckets.size())} });

  if (cfg.metricsIntervalSec > 0) {
    rkv::util::MetricRegistry::instance().startReporter(cfg.metricsIntervalSec);
  }

  rkv::BucketRegistry registry;
  rkv::PubSub bus(cfg.busThreads);
  rkv::Context ctx(registry, bus);
  rkv::Store store(ctx, cfg.storeOptions());

  std::vector<std::unique_ptr<rkv::BucketManager>> managers;
  for (const auto& [name, json] : cfg.buckets) {
    auto opts = rkv::BucketOptions::fromJson(json, cfg.defaultBucketOptions());
    if (!opts) {
      logger().log(LogLevel::Error, "Invalid bucket options",
                   { {"bucket", name}, {"error", opts.error().describe()} });
      return EXIT_FAILURE;
    }
    try {
      managers.push_back(rkv::BucketManager::start(ctx, name, *opts));
    } catch (const rkv::Error& ex) {
      logger().log(LogLevel::Error, "Bucket failed to start",
                   { {"bucket", name}, {"what", ex.what()} });
      return EXIT_FAILURE;
    }
  }

  // Managers go first so observers see buckets disappear before the bus drains.
  gShutdown.registerStep("buckets-stop", 10, [&managers]{
    for (auto& m : managers) m->stop();
  });
  gShutdown.registerStep("bus-drain",    50, [&bus]{ bus.shutdown(); });
  gShutdown.registerStep("metrics-stop", 90, []{
    rkv::util::MetricRegistry::instance().stopReporter();
  });

  const std::string bucket = managers.front()->id();
  auto watcher = std::make_shared<rkv::CallbackSubscriber>([](const rkv::Event& ev) {
    logger().log(LogLevel::Info, "event", { {"json", ev.toJson()} });
  });

  try {
    store.put(bucket, "o1", std::string("new"));
    logger().log(LogLevel::Info, "get", { {"key", "o1"}, {"value", render(store.get(bucket, "o1"))} });

    store.watchKey(bucket, "o1", watcher);
    store.put(bucket, "o1", std::string("shipped"));
    store.del(bucket, "o1");
    logger().log(LogLevel::Info, "get", { {"key", "o1"}, {"value", render(store.get(bucket, "o1"))} });
  } catch (const rkv::Error& ex) {
    logger().log(LogLevel::Error, "Demo failed", { {"what", ex.what()} });
    gShutdown.stop();
    return EXIT_FAILURE;
  }

  gShutdown.stop();

  logger().log(LogLevel::Info, "stopped", {});
  return EXIT_SUCCESS;
}
