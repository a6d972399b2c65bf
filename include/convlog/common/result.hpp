#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace convlog::common {

enum class ErrorCode {
  None,
  NotFound,
  InvalidArgument,
  Io,
  Parse,
  Callback,
};

[[nodiscard]] constexpr std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::NotFound:
    return "not_found";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::Io:
    return "io";
  case ErrorCode::Parse:
    return "parse";
  case ErrorCode::Callback:
    return "callback";
  }
  return "none";
}

class Status {
public:
  static Status success() { return Status(true, "", ErrorCode::None); }
  static Status error(std::string message, ErrorCode code = ErrorCode::Io) {
    return Status(false, std::move(message), code);
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorCode code() const { return code_; }

private:
  Status(bool ok, std::string error, ErrorCode code)
      : ok_(ok), error_(std::move(error)), code_(code) {}

  bool ok_;
  std::string error_;
  ErrorCode code_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(true, std::move(value), "", ErrorCode::None); }
  static Result failure(std::string message, ErrorCode code = ErrorCode::Io) {
    return Result(false, std::nullopt, std::move(message), code);
  }
  // Carries the message and code of a failed Status or Result of another type.
  template <typename Other> static Result failure_from(const Other &other) {
    return Result(false, std::nullopt, other.error(), other.code());
  }

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
  [[nodiscard]] ErrorCode code() const { return code_; }

private:
  Result(bool ok, std::optional<T> value, std::string error, ErrorCode code)
      : ok_(ok), value_(std::move(value)), error_(std::move(error)), code_(code) {}

  bool ok_;
  std::optional<T> value_;
  std::string error_;
  ErrorCode code_;
};

template <typename Other> Status status_from(const Other &other) {
  if (other.ok()) {
    return Status::success();
  }
  return Status::error(other.error(), other.code());
}

} // namespace convlog::common
