#include "rkv/BucketRegistry.hpp"
#include "rkv/Table.hpp"

#include "rkv/util/Logger.hpp"
#include "rkv/util/Metrics.hpp"

#include <mutex>
#include <utility>

namespace rkv {

OwnerId BucketRegistry::newOwnerId() noexcept {
  return _nextOwner.fetch_add(1, std::memory_order_relaxed);
}

RegisterResult BucketRegistry::registerBucket(const BucketId& id, OwnerId owner) {
  std::size_t n = 0;
  {
    std::unique_lock lock(_mutex);
    auto it = _slots.find(id);
    if (it != _slots.end()) {
      const Slot& s = it->second;
      // A published slot whose table died is stale; the new owner may take it.
      const bool stale = s.published && s.table.expired();
      if (!stale) {
        util::logger().log(util::LogLevel::Warn, "Bucket already registered",
                           { {"bucket", id} });
        return RegisterResult::AlreadyRegistered;
      }
      _slots.erase(it);
    }
    _slots.emplace(id, Slot{ owner, false, {} });
    n = _slots.size();
  }

  RKV_METRIC_SET("rkv.buckets", static_cast<double>(n));
  util::logger().log(util::LogLevel::Debug, "Registered bucket",
                     { {"bucket", id}, {"owner", std::to_string(owner)} });
  return RegisterResult::Ok;
}

bool BucketRegistry::update(const BucketId& id, OwnerId owner, const std::shared_ptr<Table>& table) {
  std::unique_lock lock(_mutex);
  auto it = _slots.find(id);
  if (it == _slots.end() || it->second.owner != owner) return false;
  it->second.table = table;
  it->second.published = static_cast<bool>(table);
  return true;
}

std::shared_ptr<Table> BucketRegistry::resolve(const BucketId& id) const {
  {
    std::shared_lock lock(_mutex);
    auto it = _slots.find(id);
    if (it == _slots.end() || !it->second.published) return nullptr;
    if (auto t = it->second.table.lock()) return t;
  }
  purgeExpired(id);
  return nullptr;
}

void BucketRegistry::purgeExpired(const BucketId& id) const {
  std::unique_lock lock(_mutex);
  auto it = _slots.find(id);
  if (it != _slots.end() && it->second.published && it->second.table.expired()) {
    util::logger().log(util::LogLevel::Debug, "Purged stale bucket entry",
                       { {"bucket", id} });
    _slots.erase(it);
  }
}

void BucketRegistry::unregister(const BucketId& id, OwnerId owner) {
  std::size_t n = 0;
  {
    std::unique_lock lock(_mutex);
    auto it = _slots.find(id);
    if (it == _slots.end() || it->second.owner != owner) return;
    _slots.erase(it);
    n = _slots.size();
  }

  RKV_METRIC_SET("rkv.buckets", static_cast<double>(n));
  util::logger().log(util::LogLevel::Debug, "Unregistered bucket",
                     { {"bucket", id}, {"owner", std::to_string(owner)} });
}

bool BucketRegistry::contains(const BucketId& id) const {
  return resolve(id) != nullptr;
}

std::vector<BucketId> BucketRegistry::names() const {
  std::shared_lock lock(_mutex);
  std::vector<BucketId> out;
  out.reserve(_slots.size());
  for (const auto& [id, slot] : _slots) {
    if (slot.published && !slot.table.expired()) out.push_back(id);
  }
  return out;
}

std::size_t BucketRegistry::size() const {
  std::shared_lock lock(_mutex);
  std::size_t n = 0;
  for (const auto& kv : _slots) {
    if (kv.second.published && !kv.second.table.expired()) ++n;
  }
  return n;
}

} // namespace rkv
