#include "rkv/Store.hpp"
#include "rkv/Errors.hpp"
#include "rkv/Table.hpp"

#include "rkv/util/Logger.hpp"
#include "rkv/util/Metrics.hpp"

#include <utility>

namespace rkv {

Store::Store(const Context& ctx, StoreOptions opts)
  : _ctx(ctx), _opts(opts) {}

std::shared_ptr<Table> Store::table(const BucketId& bucket) const {
  auto t = _ctx.registry().resolve(bucket);
  if (!t) {
    RKV_METRIC_HIT("rkv.unknown_bucket");
    util::logger().log(util::LogLevel::Warn, "Unknown bucket", { {"bucket", bucket} });
    throw UnknownBucketError(bucket);
  }
  return t;
}

Value Store::get(const BucketId& bucket, const Key& key, const Value& def) const {
  auto v = table(bucket)->get(key);
  return v ? std::move(*v) : def;
}

std::optional<Value> Store::fetch(const BucketId& bucket, const Key& key) const {
  return table(bucket)->get(key);
}

void Store::put(const BucketId& bucket, const Key& key, Value value) {
  table(bucket)->put(key, std::move(value));
  RKV_METRIC_HIT("rkv.put");
  announce(EventKind::Updated, bucket, key);
}

PutResult Store::putNew(const BucketId& bucket, const Key& key, Value value) {
  if (!table(bucket)->putNew(key, std::move(value))) {
    RKV_METRIC_HIT("rkv.put_new.rejected");
    return PutResult::AlreadyExists;
  }
  RKV_METRIC_HIT("rkv.put");
  announce(EventKind::Updated, bucket, key);
  return PutResult::Ok;
}

void Store::del(const BucketId& bucket, const Key& key) {
  const bool existed = table(bucket)->erase(key);
  RKV_METRIC_HIT("rkv.delete");
  if (existed || _opts.deleteNotify == DeleteNotify::Always) {
    announce(EventKind::Deleted, bucket, key);
  }
}

bool Store::exists(const BucketId& bucket, const Key& key) const {
  return table(bucket)->exists(key);
}

std::vector<Entry> Store::all(const BucketId& bucket) const {
  return table(bucket)->all();
}

void Store::announce(EventKind kind, const BucketId& bucket, const Key& key) {
  const Event ev{ kind, bucket, key };
  _ctx.bus().broadcast(Topic::forKey(bucket, key), ev);
  _ctx.bus().broadcast(Topic::forBucket(bucket), ev);
}

void Store::watchKey(const BucketId& bucket, const Key& key, const std::shared_ptr<Subscriber>& sub) {
  _ctx.bus().subscribe(Topic::forKey(bucket, key), sub);
}

void Store::watchAll(const BucketId& bucket, const std::shared_ptr<Subscriber>& sub) {
  _ctx.bus().subscribe(Topic::forBucket(bucket), sub);
}

void Store::unwatchKey(const BucketId& bucket, const Key& key, const std::shared_ptr<Subscriber>& sub) {
  _ctx.bus().unsubscribe(Topic::forKey(bucket, key), sub);
}

void Store::unwatchAll(const BucketId& bucket, const std::shared_ptr<Subscriber>& sub) {
  _ctx.bus().unsubscribe(Topic::forBucket(bucket), sub);
}

} // namespace rkv
