#pragma once

#include "rkv/BucketOptions.hpp"
#include "rkv/BucketRegistry.hpp"
#include "rkv/Context.hpp"
#include "rkv/Value.hpp"

#include <atomic>
#include <memory>

namespace rkv {

class Table;

enum class ManagerState {
  Starting,
  Validating,
  Published,
  Running,
  Terminated
};

const char* toString(ManagerState s) noexcept;

/// Owns one bucket's table and its registry entry.
///
/// The manager is not on the data path: once published, readers and writers
/// resolve the table through the registry and use it directly. Destroying
/// the manager (or calling stop()) withdraws the entry and releases the
/// table, after which the bucket no longer resolves.
class BucketManager {
public:
  /// Builds, validates and publishes the table. Throws ConfigError when the
  /// options cannot back a bucket, AlreadyRegisteredError when `id` is
  /// owned by another live manager.
  static std::unique_ptr<BucketManager> start(const Context& ctx,
                                              const BucketId& id,
                                              const BucketOptions& opts = {});

  ~BucketManager();

  BucketManager(const BucketManager&)            = delete;
  BucketManager& operator=(const BucketManager&) = delete;

  /// Idempotent.
  void stop() noexcept;

  const BucketId& id() const noexcept { return _id; }
  ManagerState state() const noexcept { return _state.load(std::memory_order_acquire); }
  const BucketOptions& options() const noexcept { return _opts; }

private:
  BucketManager(const Context& ctx, BucketId id, BucketOptions opts);

  void run();
  void enter(ManagerState s) noexcept;

  BucketRegistry&           _registry;
  BucketId                  _id;
  BucketOptions             _opts;
  OwnerId                   _owner;
  std::shared_ptr<Table>    _table;
  std::atomic<bool>         _registered{false};
  std::atomic<ManagerState> _state{ManagerState::Starting};
};

} // namespace rkv
