#include "rkv/util/Metrics.hpp"
#include "rkv/util/Logger.hpp"

#include <chrono>
#include <sstream>
#include <vector>

namespace rkv {
namespace util {

MetricRegistry& MetricRegistry::instance() {
  static MetricRegistry inst;
  return inst;
}

MetricRegistry::~MetricRegistry() {
  stopReporter();
}

void MetricRegistry::startReporter(unsigned int intervalSeconds) {
  stopReporter();

  running_.store(true, std::memory_order_release);
  thr_ = std::thread([this, intervalSeconds]{
    reporterLoop(intervalSeconds > 0 ? intervalSeconds : 10);
  });
}

void MetricRegistry::stopReporter() {
  {
    std::lock_guard<std::mutex> lk(thrMu_);
    running_.store(false, std::memory_order_release);
  }
  thrCv_.notify_all();
  if (thr_.joinable()) thr_.join();
}

void MetricRegistry::increment(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  counters_[name] += v;
}

void MetricRegistry::setGauge(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  gauges_[name] = v;
}

double MetricRegistry::counter(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = counters_.find(name);
  return it == counters_.end() ? 0.0 : it->second;
}

double MetricRegistry::gauge(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = gauges_.find(name);
  return it == gauges_.end() ? 0.0 : it->second;
}

std::unordered_map<std::string, double> MetricRegistry::snapshotCounters() const {
  std::lock_guard<std::mutex> lk(mu_);
  return counters_;
}

std::unordered_map<std::string, double> MetricRegistry::snapshotGauges() const {
  std::lock_guard<std::mutex> lk(mu_);
  return gauges_;
}

void MetricRegistry::reset() {
  std::lock_guard<std::mutex> lk(mu_);
  counters_.clear();
  gauges_.clear();
}

void MetricRegistry::reporterLoop(unsigned int intervalSeconds) {
  const auto period = std::chrono::seconds(intervalSeconds);
  std::unique_lock<std::mutex> lk(thrMu_);
  while (running_.load(std::memory_order_acquire)) {
    if (thrCv_.wait_for(lk, period, [this]{ return !running_.load(std::memory_order_acquire); })) {
      break;
    }
    lk.unlock();
    report();
    lk.lock();
  }
}

void MetricRegistry::report() {
  auto c = snapshotCounters();
  auto g = snapshotGauges();
  if (c.empty() && g.empty()) return;

  std::vector<Field> fields;
  fields.reserve(c.size() + g.size());
  for (auto& kv : c) {
    std::ostringstream oss;
    oss << kv.second;
    fields.push_back({ kv.first, oss.str() });
  }
  for (auto& kv : g) {
    std::ostringstream oss;
    oss << kv.second;
    fields.push_back({ kv.first, oss.str() });
  }
  logger().log(LogLevel::Info, "metrics", fields);
}

} // namespace util
} // namespace rkv
