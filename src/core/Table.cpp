#include "rkv/Table.hpp"

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>

namespace rkv {

Table::Table(TableOptions opts)
  : _opts(std::move(opts))
  , _shardCount(_opts.writeConcurrency ? std::max<std::size_t>(1, _opts.shards) : 1)
  , _shards(std::make_unique<Shard[]>(_shardCount)) {}

Table::Shard& Table::shardFor(const Key& key) const {
  return _shards[std::hash<Key>{}(key) % _shardCount];
}

template <typename Fn>
auto Table::readLocked(const Shard& s, Fn&& fn) const {
  if (_opts.readConcurrency) {
    std::shared_lock lock(s.mutex);
    return fn(s.data);
  }
  std::unique_lock lock(s.mutex);
  return fn(s.data);
}

std::optional<Value> Table::get(const Key& key) const {
  return readLocked(shardFor(key), [&](const auto& data) -> std::optional<Value> {
    auto it = data.find(key);
    if (it == data.end()) return std::nullopt;
    return it->second;
  });
}

void Table::put(const Key& key, Value value) {
  auto& s = shardFor(key);
  std::unique_lock lock(s.mutex);
  s.data.insert_or_assign(key, std::move(value));
}

bool Table::putNew(const Key& key, Value value) {
  auto& s = shardFor(key);
  std::unique_lock lock(s.mutex);
  return s.data.try_emplace(key, std::move(value)).second;
}

bool Table::erase(const Key& key) {
  auto& s = shardFor(key);
  std::unique_lock lock(s.mutex);
  return s.data.erase(key) > 0;
}

bool Table::exists(const Key& key) const {
  return readLocked(shardFor(key), [&](const auto& data) {
    return data.find(key) != data.end();
  });
}

std::vector<Entry> Table::all() const {
  std::vector<Entry> out;
  for (std::size_t i = 0; i < _shardCount; ++i) {
    readLocked(_shards[i], [&](const auto& data) {
      out.reserve(out.size() + data.size());
      for (const auto& [k, v] : data) out.push_back(Entry{ k, v });
      return 0;
    });
  }
  if (_opts.kind == TableKind::OrderedSet) {
    std::sort(out.begin(), out.end(),
              [](const Entry& a, const Entry& b){ return a.key < b.key; });
  }
  return out;
}

std::size_t Table::size() const {
  std::size_t n = 0;
  for (std::size_t i = 0; i < _shardCount; ++i) {
    n += readLocked(_shards[i], [](const auto& data) { return data.size(); });
  }
  return n;
}

void Table::clear() {
  for (std::size_t i = 0; i < _shardCount; ++i) {
    std::unique_lock lock(_shards[i].mutex);
    _shards[i].data.clear();
  }
}

} // namespace rkv
