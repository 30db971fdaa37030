#pragma once

#include <string>
#include <utility>
#include <variant>

namespace rkv {

struct Issue {
  std::string message;
  std::string path;

  std::string describe() const {
    return path.empty() ? message : path + ": " + message;
  }
};

template <typename T>
class Result {
public:
  Result(const T& value) : _value(value) {}
  Result(T&& value) : _value(std::move(value)) {}
  Result(const Issue& issue) : _value(issue) {}
  Result(Issue&& issue) : _value(std::move(issue)) {}

  bool has_value() const { return std::holds_alternative<T>(_value); }
  explicit operator bool() const { return has_value(); }

  T& value() { return std::get<T>(_value); }
  const T& value() const { return std::get<T>(_value); }

  const Issue& error() const { return std::get<Issue>(_value); }

  T& operator*() { return value(); }
  const T& operator*() const { return value(); }
  T* operator->() { return &value(); }
  const T* operator->() const { return &value(); }

private:
  std::variant<T, Issue> _value;
};

} // namespace rkv
