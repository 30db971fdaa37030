#pragma once

#include "rkv/BucketOptions.hpp"
#include "rkv/Store.hpp"

#include <cstddef>
#include <map>
#include <string>

namespace rkv {
namespace util {

class Config {
public:
  // Construct with sensible defaults.
  Config() = default;

  // Load from a simple "key=value" file (unknown keys ignored).
  // Returns true if file read successfully (even if some keys are unknown).
  bool loadFromFile(const std::string& path);

  // Same format, from memory.
  void loadFromString(const std::string& text);

  // Push logging settings into util::logger().
  void apply() const;

  StoreOptions  storeOptions() const;
  BucketOptions defaultBucketOptions() const;

  // --- logging ---
  std::string logLevel  = "info";
  std::string logFormat = "text";   // text | json
  std::string logFile;              // empty -> stdout

  // --- bus / store ---
  unsigned     busThreads    = 2;
  DeleteNotify deleteNotify  = DeleteNotify::Always;
  std::size_t  defaultShards = 16;

  // --- metrics ---
  unsigned metricsIntervalSec = 0;  // 0 disables the reporter

  // bucket.<name>=<json options>, started by the demo at boot
  std::map<std::string, std::string> buckets;

private:
  void applyLine(const std::string& line);

  static bool parseLineKV(const std::string& line, std::string& k, std::string& v);
  static std::string trim(const std::string& s);
};

} // namespace util
} // namespace rkv
