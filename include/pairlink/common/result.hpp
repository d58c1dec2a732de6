#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace pairlink::common {

enum class ErrorCode {
  None,
  BindFailure,
  Timeout,
  Stopped,
  InvalidPayload,
  ConnectFailure,
  Rejected,
  LoginFailed,
  NoToken,
  Io,
  InvalidArgument,
  Busy,
  AlreadyRunning,
  NotFound,
  Internal,
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code);

class Status {
public:
  static Status success() { return Status(ErrorCode::None, "", ""); }
  static Status error(std::string message) {
    return Status(ErrorCode::Internal, std::move(message), "");
  }
  static Status error(ErrorCode code, std::string message, std::string detail = "") {
    return Status(code, std::move(message), std::move(detail));
  }

  [[nodiscard]] bool ok() const { return code_ == ErrorCode::None; }
  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  /// Diagnostic payload attached to the failure (e.g. the offending raw line).
  [[nodiscard]] const std::string &detail() const { return detail_; }

private:
  Status(ErrorCode code, std::string error, std::string detail)
      : code_(code), error_(std::move(error)), detail_(std::move(detail)) {}

  ErrorCode code_;
  std::string error_;
  std::string detail_;
};

template <typename T> class Result {
public:
  static Result success(T value) {
    return Result(ErrorCode::None, std::move(value), "", "");
  }
  static Result failure(std::string message) {
    return Result(ErrorCode::Internal, std::nullopt, std::move(message), "");
  }
  static Result failure(ErrorCode code, std::string message, std::string detail = "") {
    return Result(code, std::nullopt, std::move(message), std::move(detail));
  }
  static Result failure(const Status &status) {
    return Result(status.code(), std::nullopt, status.error(), status.detail());
  }

  [[nodiscard]] bool ok() const { return code_ == ErrorCode::None; }
  [[nodiscard]] ErrorCode code() const { return code_; }

  [[nodiscard]] const T &value() const {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] const std::string &detail() const { return detail_; }

  [[nodiscard]] Status status() const {
    return ok() ? Status::success() : Status::error(code_, error_, detail_);
  }

private:
  Result(ErrorCode code, std::optional<T> value, std::string error, std::string detail)
      : code_(code), value_(std::move(value)), error_(std::move(error)),
        detail_(std::move(detail)) {}

  ErrorCode code_;
  std::optional<T> value_;
  std::string error_;
  std::string detail_;
};

inline std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "ok";
  case ErrorCode::BindFailure:
    return "bind_failure";
  case ErrorCode::Timeout:
    return "timeout";
  case ErrorCode::Stopped:
    return "stopped";
  case ErrorCode::InvalidPayload:
    return "invalid_payload";
  case ErrorCode::ConnectFailure:
    return "connect_failure";
  case ErrorCode::Rejected:
    return "rejected";
  case ErrorCode::LoginFailed:
    return "login_failed";
  case ErrorCode::NoToken:
    return "no_token";
  case ErrorCode::Io:
    return "io";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::Busy:
    return "busy";
  case ErrorCode::AlreadyRunning:
    return "already_running";
  case ErrorCode::NotFound:
    return "not_found";
  case ErrorCode::Internal:
    return "internal";
  }
  return "internal";
}

} // namespace pairlink::common
