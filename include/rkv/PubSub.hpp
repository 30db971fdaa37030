#pragma once

#include "rkv/Event.hpp"
#include "rkv/Subscriber.hpp"

#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <set>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace rkv {

/// Topic -> subscribers fan-out with asynchronous, best-effort delivery.
///
/// Every subscriber owns one strand on the bus's worker pool for as long as
/// it lives, so it sees events in the order a publishing thread broadcast
/// them and never runs two handlers at once, even across unsubscribe and
/// resubscribe. broadcast() only posts; it never waits on a
/// subscriber. Membership is a set: subscribing twice to a topic is one
/// subscription.
class PubSub {
public:
  explicit PubSub(unsigned threads = 2);
  ~PubSub();

  PubSub(const PubSub&)            = delete;
  PubSub& operator=(const PubSub&) = delete;

  void subscribe(const Topic& topic, const std::shared_ptr<Subscriber>& sub);

  /// Not being subscribed is not an error.
  void unsubscribe(const Topic& topic, const std::shared_ptr<Subscriber>& sub);

  void unsubscribeAll(const std::shared_ptr<Subscriber>& sub);

  /// Posts `ev` to every live member of `topic` at the time of the call.
  void broadcast(const Topic& topic, const Event& ev);

  std::size_t subscriberCount(const Topic& topic) const;
  std::size_t topicCount() const;

  /// Stops accepting broadcasts and waits for queued deliveries. Idempotent.
  void shutdown();

private:
  using Strand  = boost::asio::strand<boost::asio::thread_pool::executor_type>;
  using WeakSub = std::weak_ptr<Subscriber>;
  using WeakSet = std::set<WeakSub, std::owner_less<WeakSub>>;

  struct Member {
    Strand                                  strand;
    std::unordered_set<Topic, TopicHash>    topics;

    explicit Member(Strand s) : strand(std::move(s)) {}
  };

  // Callers hold _mutex exclusively.
  void dropMemberLocked(const WeakSub& sub);
  void dropTopicLocked(const Topic& topic, const WeakSub& sub);
  void maybeSweepLocked();

  // Expired members are swept once the member map reaches this size.
  static constexpr std::size_t kSweepFloor = 64;

  boost::asio::thread_pool _pool;

  mutable std::shared_mutex _mutex;
  std::unordered_map<Topic, WeakSet, TopicHash> _topics;
  std::map<WeakSub, std::shared_ptr<Member>, std::owner_less<WeakSub>> _members;
  std::size_t _sweepAt = kSweepFloor;

  std::atomic<bool> _stopping{false};
};

} // namespace rkv
