#include "rkv/util/Config.hpp"
#include "rkv/util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <string>

namespace rkv {
namespace util {

namespace {

const std::string kBucketPrefix = "bucket.";

unsigned atLeastOne(const std::string& v) {
  return static_cast<unsigned>(std::max(1, std::atoi(v.c_str())));
}

} // namespace

std::string Config::trim(const std::string& s) {
  const auto is_ws = [](unsigned char c){ return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_ws);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_ws).base();
  if (b >= e) return {};
  return std::string(b, e);
}

bool Config::parseLineKV(const std::string& line, std::string& k, std::string& v) {
  auto pos = line.find('=');
  if (pos == std::string::npos) return false;
  k = trim(line.substr(0, pos));
  v = trim(line.substr(pos + 1));
  if (k.empty()) return false;
  return true;
}

void Config::applyLine(const std::string& raw) {
  std::string line = raw;
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

  auto s = trim(line);
  if (s.empty()) return;
  if (s[0] == '#' || s[0] == ';') return; // comment

  std::string key, val;
  if (!parseLineKV(s, key, val)) return;

  if      (key == "logLevel")           logLevel = val;
  else if (key == "logFormat")          logFormat = val;
  else if (key == "logFile")            logFile = val;
  else if (key == "busThreads")         busThreads = atLeastOne(val);
  else if (key == "defaultShards")      defaultShards = atLeastOne(val);
  else if (key == "metricsIntervalSec") metricsIntervalSec = static_cast<unsigned>(std::max(0, std::atoi(val.c_str())));
  else if (key == "deleteNotify") {
    deleteNotify = (val == "existed") ? DeleteNotify::IfExisted : DeleteNotify::Always;
  }
  else if (key.compare(0, kBucketPrefix.size(), kBucketPrefix) == 0 && key.size() > kBucketPrefix.size()) {
    buckets[key.substr(kBucketPrefix.size())] = val;
  }
  else {
    // Unknown key; ignore to stay forward-compatible
  }
}

void Config::loadFromString(const std::string& text) {
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) applyLine(line);
}

bool Config::loadFromFile(const std::string& path) {
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return false;

  std::string line;
  char tmp[1024];
  while (std::fgets(tmp, sizeof(tmp), f)) {
    line.append(tmp);
    // fgets splits lines longer than the buffer; keep reading until the newline
    if (!line.empty() && line.back() != '\n' && !std::feof(f)) continue;
    applyLine(line);
    line.clear();
  }
  if (!line.empty()) applyLine(line);

  std::fclose(f);
  return true;
}

void Config::apply() const {
  auto& L = logger();
  L.setLevel(parseLevel(logLevel));
  L.setFormatJson(logFormat == "json");
  if (!L.setFile(logFile)) {
    L.log(LogLevel::Warn, "Cannot open log file, using stdout", { {"path", logFile} });
  }
}

StoreOptions Config::storeOptions() const {
  StoreOptions o;
  o.deleteNotify = deleteNotify;
  return o;
}

BucketOptions Config::defaultBucketOptions() const {
  BucketOptions o;
  o.table.shards = defaultShards;
  return o;
}

} // namespace util
} // namespace rkv
