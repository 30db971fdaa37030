#pragma once

#include "rkv/Context.hpp"
#include "rkv/Event.hpp"
#include "rkv/Subscriber.hpp"
#include "rkv/Value.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace rkv {

class Table;

enum class PutResult {
  Ok,
  AlreadyExists
};

/// Whether del() announces deletes of keys that were not there.
enum class DeleteNotify {
  Always,
  IfExisted
};

struct StoreOptions {
  DeleteNotify deleteNotify = DeleteNotify::Always;
};

/// Public operation surface over every bucket in a Context.
///
/// Each call resolves the bucket through the registry and then works on the
/// table directly. Unknown buckets throw UnknownBucketError; nothing is
/// retried. Successful mutations are announced on the (bucket, key) topic
/// and then on the bucket topic.
class Store {
public:
  explicit Store(const Context& ctx, StoreOptions opts = {});

  /// `def` when the key is absent.
  Value get(const BucketId& bucket, const Key& key, const Value& def = Value{}) const;

  std::optional<Value> fetch(const BucketId& bucket, const Key& key) const;

  void put(const BucketId& bucket, const Key& key, Value value);

  /// Announces only when the value was inserted.
  PutResult putNew(const BucketId& bucket, const Key& key, Value value);

  void del(const BucketId& bucket, const Key& key);

  bool exists(const BucketId& bucket, const Key& key) const;

  std::vector<Entry> all(const BucketId& bucket) const;

  /// The bucket's table, for callers that want to skip resolution.
  std::shared_ptr<Table> table(const BucketId& bucket) const;

  // Subscriptions do not require the bucket to be live.
  void watchKey(const BucketId& bucket, const Key& key, const std::shared_ptr<Subscriber>& sub);
  void watchAll(const BucketId& bucket, const std::shared_ptr<Subscriber>& sub);
  void unwatchKey(const BucketId& bucket, const Key& key, const std::shared_ptr<Subscriber>& sub);
  void unwatchAll(const BucketId& bucket, const std::shared_ptr<Subscriber>& sub);

  const StoreOptions& options() const noexcept { return _opts; }

private:
  void announce(EventKind kind, const BucketId& bucket, const Key& key);

  Context      _ctx;
  StoreOptions _opts;
};

} // namespace rkv
