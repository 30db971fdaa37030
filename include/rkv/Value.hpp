#pragma once

#include <string>
#include <variant>
#include <vector>

namespace rkv {

using BucketId = std::string;
using Key      = std::string;

// std::monostate is "nil": what get() hands back for a missing key
// when the caller supplies no default.
using Value = std::variant<
  std::monostate,
  bool,
  int,
  double,
  std::string,
  std::vector<int>,
  std::vector<double>,
  std::vector<std::string>
>;

struct Entry {
  Key   key;
  Value value;

  bool operator==(const Entry& o) const { return key == o.key && value == o.value; }
  bool operator!=(const Entry& o) const { return !(*this == o); }
};

inline bool isNil(const Value& v) noexcept {
  return std::holds_alternative<std::monostate>(v);
}

} // namespace rkv
