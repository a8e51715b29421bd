#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

enum class ErrorKind { Unresolved, FetchFailed, ConfigInvalid };

const char* ErrorKindName(ErrorKind kind);

// Typed failure with the identity (token, pool, config key) it refers to.
struct ScanError {
  ErrorKind kind = ErrorKind::FetchFailed;
  std::string context;
  std::string message;

  std::string Describe() const;
};

class ScanException : public std::runtime_error {
public:
  explicit ScanException(ScanError error)
    : std::runtime_error(error.Describe()), error_(std::move(error)) {}
  ScanException(ErrorKind kind, const std::string& context, const std::string& message)
    : ScanException(ScanError{kind, context, message}) {}
  const ScanError& Error() const { return error_; }
private:
  ScanError error_;
};

// Value-or-error return for operations whose failure is an expected outcome.
template <typename T>
class Result {
public:
  static Result Of(T value) { return Result(std::move(value)); }
  static Result Fail(ScanError error) { return Result(std::move(error)); }
  static Result Fail(ErrorKind kind, const std::string& context, const std::string& message) {
    return Result(ScanError{kind, context, message});
  }

  bool IsOk() const { return std::holds_alternative<T>(state_); }
  explicit operator bool() const { return IsOk(); }

  const T& Value() const {
    if (!IsOk()) throw ScanException(std::get<ScanError>(state_));
    return std::get<T>(state_);
  }
  T& Value() {
    if (!IsOk()) throw ScanException(std::get<ScanError>(state_));
    return std::get<T>(state_);
  }
  const ScanError& Error() const {
    if (IsOk()) throw std::logic_error("Result holds a value, not an error");
    return std::get<ScanError>(state_);
  }

private:
  explicit Result(T value) : state_(std::move(value)) {}
  explicit Result(ScanError error) : state_(std::move(error)) {}
  std::variant<T, ScanError> state_;
};
