#include "rkv/PubSub.hpp"

#include "rkv/util/Logger.hpp"
#include "rkv/util/Metrics.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <exception>
#include <mutex>
#include <string>

namespace rkv {

PubSub::PubSub(unsigned threads)
  : _pool(threads == 0 ? 1 : threads) {}

PubSub::~PubSub() {
  shutdown();
}

void PubSub::shutdown() {
  bool expected = false;
  if (!_stopping.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return;
  }
  // Without stop(), join() returns once the queued deliveries have run.
  _pool.join();
  util::logger().log(util::LogLevel::Debug, "PubSub stopped", {});
}

void PubSub::subscribe(const Topic& topic, const std::shared_ptr<Subscriber>& sub) {
  if (!sub) return;
  WeakSub w = sub;

  std::unique_lock lock(_mutex);
  maybeSweepLocked();
  auto mit = _members.find(w);
  if (mit == _members.end()) {
    mit = _members.emplace(w, std::make_shared<Member>(boost::asio::make_strand(_pool))).first;
  }
  mit->second->topics.insert(topic);
  _topics[topic].insert(w);

  util::logger().log(util::LogLevel::Debug, "Subscribed", { {"topic", topic.describe()} });
}

void PubSub::unsubscribe(const Topic& topic, const std::shared_ptr<Subscriber>& sub) {
  if (!sub) return;
  WeakSub w = sub;

  std::unique_lock lock(_mutex);
  maybeSweepLocked();
  auto mit = _members.find(w);
  if (mit == _members.end()) return;
  if (mit->second->topics.erase(topic) == 0) return;

  // The member and its strand stay: deliveries already queued must finish
  // before anything posted after a resubscribe.
  dropTopicLocked(topic, w);

  util::logger().log(util::LogLevel::Debug, "Unsubscribed", { {"topic", topic.describe()} });
}

void PubSub::unsubscribeAll(const std::shared_ptr<Subscriber>& sub) {
  if (!sub) return;
  std::unique_lock lock(_mutex);
  auto mit = _members.find(WeakSub(sub));
  if (mit == _members.end()) return;
  for (const auto& topic : mit->second->topics) {
    dropTopicLocked(topic, mit->first);
  }
  mit->second->topics.clear();
}

void PubSub::dropTopicLocked(const Topic& topic, const WeakSub& sub) {
  auto tit = _topics.find(topic);
  if (tit == _topics.end()) return;
  tit->second.erase(sub);
  if (tit->second.empty()) _topics.erase(tit);
}

void PubSub::dropMemberLocked(const WeakSub& sub) {
  auto mit = _members.find(sub);
  if (mit == _members.end()) return;
  for (const auto& topic : mit->second->topics) {
    dropTopicLocked(topic, sub);
  }
  _members.erase(mit);
}

void PubSub::maybeSweepLocked() {
  if (_members.size() < _sweepAt) return;
  std::size_t swept = 0;
  for (auto mit = _members.begin(); mit != _members.end();) {
    if (!mit->first.expired()) {
      ++mit;
      continue;
    }
    for (const auto& topic : mit->second->topics) {
      dropTopicLocked(topic, mit->first);
    }
    mit = _members.erase(mit);
    ++swept;
  }
  _sweepAt = std::max(kSweepFloor, 2 * _members.size());
  if (swept > 0) {
    util::logger().log(util::LogLevel::Debug, "Swept expired subscribers",
                       { {"count", std::to_string(swept)} });
  }
}

void PubSub::broadcast(const Topic& topic, const Event& ev) {
  if (_stopping.load(std::memory_order_acquire)) return;

  std::vector<std::pair<WeakSub, std::shared_ptr<Member>>> targets;
  std::vector<WeakSub> dead;
  {
    std::shared_lock lock(_mutex);
    auto tit = _topics.find(topic);
    if (tit == _topics.end()) return;
    targets.reserve(tit->second.size());
    for (const auto& w : tit->second) {
      if (w.expired()) {
        dead.push_back(w);
        continue;
      }
      auto mit = _members.find(w);
      if (mit != _members.end()) targets.emplace_back(w, mit->second);
    }
  }

  for (const auto& t : targets) {
    boost::asio::post(t.second->strand, [w = t.first, ev]() {
      auto sub = w.lock();
      if (!sub) {
        RKV_METRIC_HIT("rkv.bus.dropped");
        util::logger().log(util::LogLevel::Trace, "Dropped event for expired subscriber",
                           { {"bucket", ev.bucket}, {"key", ev.key} });
        return;
      }
      try {
        sub->onEvent(ev);
      } catch (const std::exception& ex) {
        util::logger().log(util::LogLevel::Warn, "Subscriber threw",
                           { {"bucket", ev.bucket}, {"key", ev.key}, {"what", ex.what()} });
      } catch (...) {
        util::logger().log(util::LogLevel::Warn, "Subscriber threw",
                           { {"bucket", ev.bucket}, {"key", ev.key}, {"what", "unknown"} });
      }
    });
  }
  RKV_METRIC_INC("rkv.bus.posted", static_cast<double>(targets.size()));

  if (!dead.empty()) {
    std::unique_lock lock(_mutex);
    for (const auto& w : dead) dropMemberLocked(w);
    RKV_METRIC_INC("rkv.bus.dropped", static_cast<double>(dead.size()));
  }
}

std::size_t PubSub::subscriberCount(const Topic& topic) const {
  std::shared_lock lock(_mutex);
  auto tit = _topics.find(topic);
  if (tit == _topics.end()) return 0;
  std::size_t n = 0;
  for (const auto& w : tit->second) {
    if (!w.expired()) ++n;
  }
  return n;
}

std::size_t PubSub::topicCount() const {
  std::shared_lock lock(_mutex);
  return _topics.size();
}

} // namespace rkv
