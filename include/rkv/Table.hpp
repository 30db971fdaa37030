#pragma once

#include "rkv/BucketOptions.hpp"
#include "rkv/Value.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace rkv {

/// Concurrent key -> value table backing one bucket.
///
/// Keys are spread over independently locked shards; an operation touches
/// exactly one shard, so callers on different shards never contend. A table
/// always holds at most one value per key. Its TableOptions are kept so the
/// owning manager can refuse configurations a bucket cannot be built on.
class Table {
public:
  explicit Table(TableOptions opts = {});

  Table(const Table&)            = delete;
  Table& operator=(const Table&) = delete;

  std::optional<Value> get(const Key& key) const;

  /// Inserts or replaces.
  void put(const Key& key, Value value);

  /// Inserts only if the key is absent. Returns false if it was present.
  bool putNew(const Key& key, Value value);

  /// Returns whether the key was present. Erasing an absent key is a no-op.
  bool erase(const Key& key);

  bool exists(const Key& key) const;

  /// Walks shards one at a time; concurrent writes may or may not be seen.
  /// Sorted by key for ordered_set tables.
  std::vector<Entry> all() const;

  std::size_t size() const;
  void clear();

  const TableOptions& options() const noexcept { return _opts; }
  std::size_t shardCount() const noexcept { return _shardCount; }

private:
  struct Shard {
    mutable std::shared_mutex    mutex;
    std::unordered_map<Key, Value> data;
  };

  Shard& shardFor(const Key& key) const;

  template <typename Fn>
  auto readLocked(const Shard& s, Fn&& fn) const;

  TableOptions             _opts;
  std::size_t              _shardCount;
  std::unique_ptr<Shard[]> _shards;
};

} // namespace rkv
