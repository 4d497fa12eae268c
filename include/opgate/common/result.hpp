#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace opgate::common {

enum class ErrorKind { Validation, PermissionDenied, NotFound, Io, Cancelled };

[[nodiscard]] std::string_view error_kind_to_string(ErrorKind kind);

class Status {
public:
  static Status success() { return Status(true, "", ErrorKind::Io); }
  static Status error(std::string message, ErrorKind kind = ErrorKind::Io) {
    return Status(false, std::move(message), kind);
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }

private:
  Status(bool ok, std::string error, ErrorKind kind)
      : ok_(ok), error_(std::move(error)), kind_(kind) {}

  bool ok_;
  std::string error_;
  ErrorKind kind_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(true, std::move(value), "", ErrorKind::Io); }
  static Result failure(std::string message, ErrorKind kind = ErrorKind::Io) {
    return Result(false, std::nullopt, std::move(message), kind);
  }
  // Carries the message and kind of an upstream failure.
  template <typename U> static Result failure(const Result<U> &other) {
    return failure(other.error(), other.kind());
  }
  static Result failure(const Status &status) { return failure(status.error(), status.kind()); }

  [[nodiscard]] bool ok() const { return ok_; }

  [[nodiscard]] const T &value() const {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }

private:
  Result(bool ok, std::optional<T> value, std::string error, ErrorKind kind)
      : ok_(ok), value_(std::move(value)), error_(std::move(error)), kind_(kind) {}

  bool ok_;
  std::optional<T> value_;
  std::string error_;
  ErrorKind kind_;
};

template <> class Result<void> {
public:
  static Result success() { return Result(true, "", ErrorKind::Io); }
  static Result failure(std::string message, ErrorKind kind = ErrorKind::Io) {
    return Result(false, std::move(message), kind);
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }

private:
  Result(bool ok, std::string error, ErrorKind kind)
      : ok_(ok), error_(std::move(error)), kind_(kind) {}

  bool ok_;
  std::string error_;
  ErrorKind kind_;
};

} // namespace opgate::common
