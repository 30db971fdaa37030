#pragma once

#include "rkv/Value.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rkv {

class Table;

using OwnerId = std::uint64_t;

enum class RegisterResult {
  Ok,
  AlreadyRegistered
};

/// Directory of live buckets: id -> (owner, table).
///
/// The registry never owns a table. Entries hold a weak handle, so once the
/// owner drops its table the id stops resolving even before the owner's
/// teardown has called unregister().
class BucketRegistry {
public:
  BucketRegistry() = default;

  BucketRegistry(const BucketRegistry&)            = delete;
  BucketRegistry& operator=(const BucketRegistry&) = delete;

  /// Hands out a fresh owner identity. Ids are never reused.
  OwnerId newOwnerId() noexcept;

  /// Claims `id` for `owner`. The entry does not resolve until update().
  RegisterResult registerBucket(const BucketId& id, OwnerId owner);

  /// Publishes the table for an id claimed by `owner`. False if `owner`
  /// no longer holds the id.
  bool update(const BucketId& id, OwnerId owner, const std::shared_ptr<Table>& table);

  /// nullptr when the id is unknown, unpublished, or its table is gone.
  std::shared_ptr<Table> resolve(const BucketId& id) const;

  /// Drops the entry if `owner` still holds it.
  void unregister(const BucketId& id, OwnerId owner);

  bool contains(const BucketId& id) const;
  std::vector<BucketId> names() const;
  std::size_t size() const;

private:
  struct Slot {
    OwnerId             owner = 0;
    bool                published = false;
    std::weak_ptr<Table> table;
  };

  void purgeExpired(const BucketId& id) const;

  mutable std::shared_mutex _mutex;
  // mutable: resolve() purges entries whose table has expired
  mutable std::unordered_map<BucketId, Slot> _slots;
  std::atomic<OwnerId> _nextOwner{1};
};

} // namespace rkv
