#include "rkv/BucketOptions.hpp"

#include "rkv/util/Logger.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <algorithm>
#include <cctype>

namespace rkv {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return s;
}

} // namespace

const char* toString(TableKind k) noexcept {
  switch (k) {
    case TableKind::Set:          return "set";
    case TableKind::OrderedSet:   return "ordered_set";
    case TableKind::Bag:          return "bag";
    case TableKind::DuplicateBag: return "duplicate_bag";
  }
  return "set";
}

const char* toString(Access a) noexcept {
  switch (a) {
    case Access::Public:    return "public";
    case Access::Protected: return "protected";
    case Access::Private:   return "private";
  }
  return "public";
}

std::optional<TableKind> parseTableKind(const std::string& s) {
  const auto x = lower(s);
  if (x == "set")           return TableKind::Set;
  if (x == "ordered_set")   return TableKind::OrderedSet;
  if (x == "bag")           return TableKind::Bag;
  if (x == "duplicate_bag") return TableKind::DuplicateBag;
  return std::nullopt;
}

std::optional<Access> parseAccess(const std::string& s) {
  const auto x = lower(s);
  if (x == "public")    return Access::Public;
  if (x == "protected") return Access::Protected;
  if (x == "private")   return Access::Private;
  return std::nullopt;
}

std::optional<Issue> validate(const TableOptions& opts) {
  if (opts.kind != TableKind::Set && opts.kind != TableKind::OrderedSet) {
    return Issue{ std::string("table must be set or ordered_set, got ") + toString(opts.kind), "type" };
  }
  if (opts.access != Access::Public) {
    return Issue{ std::string("table must be public, got ") + toString(opts.access), "access" };
  }
  if (opts.shards == 0) {
    return Issue{ "shard count must be positive", "shards" };
  }
  return std::nullopt;
}

Result<BucketOptions> BucketOptions::fromJson(const std::string& text, const BucketOptions& base) {
  rapidjson::Document doc;
  doc.Parse(text.c_str(), text.size());
  if (doc.HasParseError()) {
    return Issue{ std::string("invalid JSON: ") + rapidjson::GetParseError_En(doc.GetParseError()),
                  "offset " + std::to_string(doc.GetErrorOffset()) };
  }
  if (!doc.IsObject()) {
    return Issue{ "bucket options must be a JSON object", "$" };
  }

  BucketOptions out = base;
  TableOptions& t = out.table;

  if (doc.HasMember("type")) {
    const auto& v = doc["type"];
    if (!v.IsString()) return Issue{ "must be a string", "$.type" };
    auto kind = parseTableKind(v.GetString());
    if (!kind) return Issue{ std::string("unknown table type '") + v.GetString() + "'", "$.type" };
    t.kind = *kind;
  }

  if (doc.HasMember("access")) {
    const auto& v = doc["access"];
    if (!v.IsString()) return Issue{ "must be a string", "$.access" };
    auto access = parseAccess(v.GetString());
    if (!access) return Issue{ std::string("unknown access '") + v.GetString() + "'", "$.access" };
    t.access = *access;
  }

  if (doc.HasMember("shards")) {
    const auto& v = doc["shards"];
    if (!v.IsUint() || v.GetUint() == 0) return Issue{ "must be a positive integer", "$.shards" };
    t.shards = v.GetUint();
  }

  if (doc.HasMember("read_concurrency")) {
    const auto& v = doc["read_concurrency"];
    if (!v.IsBool()) return Issue{ "must be a boolean", "$.read_concurrency" };
    t.readConcurrency = v.GetBool();
  }

  if (doc.HasMember("write_concurrency")) {
    const auto& v = doc["write_concurrency"];
    if (!v.IsBool()) return Issue{ "must be a boolean", "$.write_concurrency" };
    t.writeConcurrency = v.GetBool();
  }

  util::logger().log(util::LogLevel::Debug, "Bucket options parsed",
                     { {"type", toString(t.kind)}, {"access", toString(t.access)},
                       {"shards", std::to_string(t.shards)} });
  return out;
}

} // namespace rkv
