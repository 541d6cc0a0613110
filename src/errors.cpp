#include "optiview/errors.hpp"

namespace optiview {

std::string_view to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kValidation:
      return "validation";
    case ErrorKind::kInvalidQuote:
      return "invalid_quote";
    case ErrorKind::kConvergence:
      return "convergence";
    case ErrorKind::kDataUnavailable:
      return "data_unavailable";
  }
  return "unknown";
}

Error validation_error(std::string message) {
  return Error{.kind = ErrorKind::kValidation, .message = std::move(message)};
}

Error invalid_quote_error(std::string message) {
  return Error{.kind = ErrorKind::kInvalidQuote, .message = std::move(message)};
}

Error convergence_error(std::string message) {
  return Error{.kind = ErrorKind::kConvergence, .message = std::move(message)};
}

Error data_unavailable_error(std::string message) {
  return Error{.kind = ErrorKind::kDataUnavailable, .message = std::move(message)};
}

}  // namespace optiview
