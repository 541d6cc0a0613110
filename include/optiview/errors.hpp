#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace optiview {

enum class ErrorKind {
  kValidation,
  kInvalidQuote,
  kConvergence,
  kDataUnavailable,
};

std::string_view to_string(ErrorKind kind);

struct Error {
  ErrorKind kind;
  std::string message;
};

Error validation_error(std::string message);
Error invalid_quote_error(std::string message);
Error convergence_error(std::string message);
Error data_unavailable_error(std::string message);

// Either a computed value or the reason it could not be computed.
// Callers must check ok() before touching value().
template <typename T>
class Result {
 public:
  Result(T value) : state_(std::move(value)) {}
  Result(Error error) : state_(std::move(error)) {}

  bool ok() const { return std::holds_alternative<T>(state_); }
  explicit operator bool() const { return ok(); }

  const T& value() const { return std::get<T>(state_); }
  T& value() { return std::get<T>(state_); }

  const Error& error() const { return std::get<Error>(state_); }

 private:
  std::variant<T, Error> state_;
};

}  // namespace optiview
