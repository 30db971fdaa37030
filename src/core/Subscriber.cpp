#include "rkv/Subscriber.hpp"

#include <iterator>
#include <utility>

namespace rkv {

void Mailbox::onEvent(const Event& ev) {
  {
    std::lock_guard<std::mutex> lk(mx_);
    queue_.push_back(ev);
  }
  cv_.notify_one();
}

std::optional<Event> Mailbox::receive(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mx_);
  if (!cv_.wait_for(lk, timeout, [this]{ return !queue_.empty(); })) {
    return std::nullopt;
  }
  Event ev = std::move(queue_.front());
  queue_.pop_front();
  return ev;
}

std::vector<Event> Mailbox::drain() {
  std::lock_guard<std::mutex> lk(mx_);
  std::vector<Event> out(std::make_move_iterator(queue_.begin()),
                         std::make_move_iterator(queue_.end()));
  queue_.clear();
  return out;
}

std::size_t Mailbox::pending() const {
  std::lock_guard<std::mutex> lk(mx_);
  return queue_.size();
}

CallbackSubscriber::CallbackSubscriber(Callback cb)
  : cb_(std::move(cb)) {}

void CallbackSubscriber::onEvent(const Event& ev) {
  if (cb_) cb_(ev);
}

} // namespace rkv
