#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "optiview/black_scholes.hpp"
#include "optiview/errors.hpp"
#include "optiview/implied_volatility.hpp"
#include "optiview/option_contract.hpp"

namespace optiview {

// Model versus market for one quoted option.
struct QuoteAnalysis {
  PricingResult theoretical;
  double market_price;
  // market - theoretical; positive means the market is richer than the model.
  double difference;
  // Absent when the theoretical price is zero.
  std::optional<double> percentage_diff;
  double moneyness;  // S / K
  Result<ImpliedVolatilityResult> implied_volatility;
};

Result<QuoteAnalysis> analyze_quote(
  const OptionContract& contract,
  double market_price,
  const ImpliedVolatilityOptions& options = {});

struct ChainEntry {
  double strike;
  PricingResult pricing;
};

// Prices `contract` at each strike, preserving input order.
Result<std::vector<ChainEntry>> price_chain(
  const OptionContract& contract,
  const std::vector<double>& strikes);

inline constexpr std::size_t kTradingDaysPerYear = 252;

// Annualized sample standard deviation of daily log returns.
Result<double> historical_volatility(
  const std::vector<double>& closes,
  std::size_t trading_days_per_year = kTradingDaysPerYear);

}  // namespace optiview
