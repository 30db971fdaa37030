#pragma once

#include "rkv/Result.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace rkv {

enum class TableKind {
  Set,
  OrderedSet,
  Bag,
  DuplicateBag
};

enum class Access {
  Public,
  Protected,
  Private
};

const char* toString(TableKind k) noexcept;
const char* toString(Access a) noexcept;

std::optional<TableKind> parseTableKind(const std::string& s);
std::optional<Access>    parseAccess(const std::string& s);

struct TableOptions {
  TableKind   kind   = TableKind::Set;
  Access      access = Access::Public;
  std::size_t shards = 16;

  // With readConcurrency off, reads take the same exclusive lock as writes.
  bool readConcurrency  = true;
  // With writeConcurrency off, the table collapses to a single shard.
  bool writeConcurrency = true;
};

/// Checks that a table can back a bucket: one value per key, reachable
/// by every caller. Returns the first problem found.
std::optional<Issue> validate(const TableOptions& opts);

struct BucketOptions {
  TableOptions table;

  /// Parses {"type":..,"access":..,"shards":..,"read_concurrency":..,
  /// "write_concurrency":..}. Missing members keep the defaults in `base`.
  static Result<BucketOptions> fromJson(const std::string& text,
                                        const BucketOptions& base = {});
};

} // namespace rkv
