#include "rkv/BucketManager.hpp"
#include "rkv/Errors.hpp"
#include "rkv/Table.hpp"

#include "rkv/util/Logger.hpp"

#include <utility>

namespace rkv {

const char* toString(ManagerState s) noexcept {
  switch (s) {
    case ManagerState::Starting:   return "starting";
    case ManagerState::Validating: return "validating";
    case ManagerState::Published:  return "published";
    case ManagerState::Running:    return "running";
    case ManagerState::Terminated: return "terminated";
  }
  return "terminated";
}

BucketManager::BucketManager(const Context& ctx, BucketId id, BucketOptions opts)
  : _registry(ctx.registry())
  , _id(std::move(id))
  , _opts(std::move(opts))
  , _owner(_registry.newOwnerId()) {}

std::unique_ptr<BucketManager> BucketManager::start(const Context& ctx,
                                                    const BucketId& id,
                                                    const BucketOptions& opts) {
  std::unique_ptr<BucketManager> mgr(new BucketManager(ctx, id, opts));
  // On throw, the unique_ptr runs stop() through the destructor.
  mgr->run();
  return mgr;
}

void BucketManager::run() {
  util::Logger::Scoped scope({ {"bucket", _id} });

  _table = std::make_shared<Table>(_opts.table);

  enter(ManagerState::Validating);
  // Check what the table actually ended up as, not just what was asked for.
  if (auto issue = validate(_table->options())) {
    util::logger().log(util::LogLevel::Error, "Bucket configuration rejected",
                       { {"path", issue->path}, {"reason", issue->message} });
    enter(ManagerState::Terminated);
    _table.reset();
    throw ConfigError("rkv: " + issue->describe());
  }

  enter(ManagerState::Published);
  if (_registry.registerBucket(_id, _owner) != RegisterResult::Ok) {
    enter(ManagerState::Terminated);
    _table.reset();
    throw AlreadyRegisteredError(_id);
  }
  _registered = true;
  if (!_registry.update(_id, _owner, _table)) {
    // Lost the claim between register and publish.
    _registered = false;
    enter(ManagerState::Terminated);
    _table.reset();
    throw AlreadyRegisteredError(_id);
  }

  enter(ManagerState::Running);
  util::logger().log(util::LogLevel::Info, "Bucket started",
                     { {"type", toString(_table->options().kind)},
                       {"shards", std::to_string(_table->shardCount())} });
}

BucketManager::~BucketManager() {
  stop();
}

void BucketManager::stop() noexcept {
  _state.store(ManagerState::Terminated, std::memory_order_release);
  // Only one caller tears down; a failed start already released the table.
  if (!_registered.exchange(false, std::memory_order_acq_rel)) return;
  _registry.unregister(_id, _owner);
  _table.reset();
  util::logger().log(util::LogLevel::Info, "Bucket stopped", { {"bucket", _id} });
}

void BucketManager::enter(ManagerState s) noexcept {
  _state.store(s, std::memory_order_release);
  util::logger().log(util::LogLevel::Trace, "Bucket state", { {"state", toString(s)} });
}

} // namespace rkv
