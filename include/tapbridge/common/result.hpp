#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace tapbridge::common {

enum class ErrorCode {
  None,
  Failed,
  InvalidArgument,
  NotConnected,
  UnknownSession,
  UnknownRequest,
  UnknownMachine,
  MalformedEvent,
  TransportError,
  NetworkError,
  ConfigError,
  StorageError,
};

[[nodiscard]] constexpr std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::Failed:
    return "failed";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::NotConnected:
    return "not_connected";
  case ErrorCode::UnknownSession:
    return "unknown_session";
  case ErrorCode::UnknownRequest:
    return "unknown_request";
  case ErrorCode::UnknownMachine:
    return "unknown_machine";
  case ErrorCode::MalformedEvent:
    return "malformed_event";
  case ErrorCode::TransportError:
    return "transport_error";
  case ErrorCode::NetworkError:
    return "network_error";
  case ErrorCode::ConfigError:
    return "config_error";
  case ErrorCode::StorageError:
    return "storage_error";
  }
  return "failed";
}

class Status {
public:
  static Status success() { return Status(ErrorCode::None, ""); }
  static Status error(std::string message) { return Status(ErrorCode::Failed, std::move(message)); }
  static Status error(ErrorCode code, std::string message) {
    return Status(code == ErrorCode::None ? ErrorCode::Failed : code, std::move(message));
  }

  [[nodiscard]] bool ok() const { return code_ == ErrorCode::None; }
  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Status(ErrorCode code, std::string error) : code_(code), error_(std::move(error)) {}

  ErrorCode code_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(ErrorCode::None, std::move(value), ""); }
  static Result failure(std::string message) {
    return Result(ErrorCode::Failed, std::nullopt, std::move(message));
  }
  static Result failure(ErrorCode code, std::string message) {
    return Result(code == ErrorCode::None ? ErrorCode::Failed : code, std::nullopt,
                  std::move(message));
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

  [[nodiscard]] Status status() const {
    return ok() ? Status::success() : Status::error(code_, error_);
  }

private:
  Result(ErrorCode code, std::optional<T> value, std::string error)
      : code_(code), value_(std::move(value)), error_(std::move(error)) {}

  ErrorCode code_;
  std::optional<T> value_;
  std::string error_;
};

} // namespace tapbridge::common
