#pragma once

#include "rkv/Value.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace rkv {

enum class EventKind {
  Updated,
  Deleted
};

const char* toString(EventKind k) noexcept;

/// Change notification published after a successful mutation.
struct Event {
  EventKind kind;
  BucketId  bucket;
  Key       key;

  bool operator==(const Event& o) const {
    return kind == o.kind && bucket == o.bucket && key == o.key;
  }
  bool operator!=(const Event& o) const { return !(*this == o); }

  /// {"event":"updated","bucket":"..","key":".."}
  std::string toJson() const;
};

/// Bus address: a whole bucket, or one key inside it.
struct Topic {
  BucketId           bucket;
  std::optional<Key> key;

  static Topic forBucket(BucketId b) { return Topic{ std::move(b), std::nullopt }; }
  static Topic forKey(BucketId b, Key k) { return Topic{ std::move(b), std::move(k) }; }

  bool isBucketWide() const noexcept { return !key.has_value(); }

  bool operator==(const Topic& o) const { return bucket == o.bucket && key == o.key; }
  bool operator!=(const Topic& o) const { return !(*this == o); }

  std::string describe() const { return key ? bucket + "/" + *key : bucket; }
};

struct TopicHash {
  std::size_t operator()(const Topic& t) const noexcept {
    std::size_t h = std::hash<std::string>{}(t.bucket);
    if (t.key) {
      h ^= std::hash<std::string>{}(*t.key) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    }
    return h;
  }
};

} // namespace rkv
