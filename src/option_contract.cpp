#include "optiview/option_contract.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

namespace optiview {

namespace {

constexpr double kDaysPerYear = 365.0;

bool equals_ignore_case(std::string_view lhs, std::string_view rhs) {
  return lhs.size() == rhs.size() &&
         std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
           return std::tolower(static_cast<unsigned char>(a)) ==
                  std::tolower(static_cast<unsigned char>(b));
         });
}

}  // namespace

std::string_view to_string(OptionType type) {
  return type == OptionType::kCall ? "call" : "put";
}

Result<OptionType> parse_option_type(std::string_view text) {
  if (equals_ignore_case(text, "call")) {
    return OptionType::kCall;
  }
  if (equals_ignore_case(text, "put")) {
    return OptionType::kPut;
  }
  return validation_error("option type must be 'call' or 'put', got '" + std::string(text) + "'");
}

std::optional<Error> validate_contract(const OptionContract& contract) {
  if (!std::isfinite(contract.spot) || contract.spot <= 0.0) {
    return validation_error("spot price must be positive, got " + std::to_string(contract.spot));
  }
  if (!std::isfinite(contract.strike) || contract.strike <= 0.0) {
    return validation_error("strike price must be positive, got " + std::to_string(contract.strike));
  }
  if (!std::isfinite(contract.time_to_maturity) || contract.time_to_maturity < 0.0) {
    return validation_error(
      "time to maturity must be non-negative, got " + std::to_string(contract.time_to_maturity));
  }
  if (!std::isfinite(contract.volatility) || contract.volatility < 0.0) {
    return validation_error("volatility must be non-negative, got " + std::to_string(contract.volatility));
  }
  if (!std::isfinite(contract.rate)) {
    return validation_error("risk-free rate must be finite");
  }
  if (!std::isfinite(contract.dividend_yield)) {
    return validation_error("dividend yield must be finite");
  }
  return std::nullopt;
}

double intrinsic_value(const OptionContract& contract) {
  if (contract.type == OptionType::kCall) {
    return std::max(contract.spot - contract.strike, 0.0);
  }
  return std::max(contract.strike - contract.spot, 0.0);
}

double years_from_days(double days) {
  return days / kDaysPerYear;
}

}  // namespace optiview
