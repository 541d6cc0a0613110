#pragma once

#include <optional>
#include <string_view>

#include "optiview/errors.hpp"

namespace optiview {

enum class OptionType {
  kCall,
  kPut,
};

std::string_view to_string(OptionType type);

// Accepts "call" or "put" in any letter case.
Result<OptionType> parse_option_type(std::string_view text);

// A single European option. Built once per computation and passed by const
// reference; anything that needs a variation works on its own copy.
struct OptionContract {
  double spot;
  double strike;
  double time_to_maturity;  // years
  double rate;
  double volatility;
  double dividend_yield = 0.0;
  OptionType type = OptionType::kCall;
};

// Empty when the contract can be priced.
std::optional<Error> validate_contract(const OptionContract& contract);

// Payoff if exercised now: max(S - K, 0) for a call, max(K - S, 0) for a put.
double intrinsic_value(const OptionContract& contract);

// Calendar-day convention.
double years_from_days(double days);

}  // namespace optiview
