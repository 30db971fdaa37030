#pragma once

#include "rkv/Event.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace rkv {

/// Receives bus events. The bus holds subscribers weakly: destroying the
/// last shared_ptr ends every subscription it had.
class Subscriber {
public:
  Subscriber() = default;
  virtual ~Subscriber() = default;

  Subscriber(const Subscriber&) = delete;
  Subscriber& operator=(const Subscriber&) = delete;

  /// Runs on a bus worker thread, never concurrently with itself.
  virtual void onEvent(const Event& ev) = 0;
};

/// Queues delivered events for a consumer thread to pick up.
class Mailbox final : public Subscriber {
public:
  void onEvent(const Event& ev) override;

  /// Oldest queued event, waiting up to `timeout` for one to arrive.
  std::optional<Event> receive(std::chrono::milliseconds timeout);

  /// Everything queued right now, oldest first.
  std::vector<Event> drain();

  std::size_t pending() const;

private:
  mutable std::mutex      mx_;
  std::condition_variable cv_;
  std::deque<Event>       queue_;
};

/// Forwards each event to a callable.
class CallbackSubscriber final : public Subscriber {
public:
  using Callback = std::function<void(const Event&)>;

  explicit CallbackSubscriber(Callback cb);

  void onEvent(const Event& ev) override;

private:
  Callback cb_;
};

} // namespace rkv
