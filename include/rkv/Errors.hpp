#pragma once

#include <stdexcept>
#include <string>

namespace rkv {

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Invalid backing-store options; the bucket never becomes reachable.
class ConfigError : public Error {
public:
  using Error::Error;
};

/// A live manager already owns the bucket id.
class AlreadyRegisteredError : public Error {
public:
  explicit AlreadyRegisteredError(const std::string& bucket)
    : Error("rkv: bucket already registered: " + bucket), _bucket(bucket) {}

  const std::string& bucket() const noexcept { return _bucket; }

private:
  std::string _bucket;
};

/// No live manager owns the bucket id.
class UnknownBucketError : public Error {
public:
  explicit UnknownBucketError(const std::string& bucket)
    : Error("rkv: unknown bucket: " + bucket), _bucket(bucket) {}

  const std::string& bucket() const noexcept { return _bucket; }

private:
  std::string _bucket;
};

} // namespace rkv
