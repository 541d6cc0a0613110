#include "optiview/market_analysis.hpp"

#include <cmath>
#include <string>

namespace optiview {

Result<QuoteAnalysis> analyze_quote(
  const OptionContract& contract,
  double market_price,
  const ImpliedVolatilityOptions& options) {
  if (!std::isfinite(market_price)) {
    return validation_error("market price must be finite");
  }
  const auto theoretical = price(contract);
  if (!theoretical) {
    return theoretical.error();
  }

  const double model_price = theoretical.value().price;
  const double difference = market_price - model_price;
  std::optional<double> percentage_diff;
  if (model_price != 0.0) {
    percentage_diff = difference / model_price * 100.0;
  }

  return QuoteAnalysis{
    .theoretical = theoretical.value(),
    .market_price = market_price,
    .difference = difference,
    .percentage_diff = percentage_diff,
    .moneyness = contract.spot / contract.strike,
    .implied_volatility = implied_volatility(contract, market_price, options),
  };
}

Result<std::vector<ChainEntry>> price_chain(
  const OptionContract& contract,
  const std::vector<double>& strikes) {
  std::vector<ChainEntry> chain;
  chain.reserve(strikes.size());
  for (const double strike : strikes) {
    OptionContract leg = contract;
    leg.strike = strike;
    const auto result = price(leg);
    if (!result) {
      return result.error();
    }
    chain.push_back(ChainEntry{.strike = strike, .pricing = result.value()});
  }
  return chain;
}

Result<double> historical_volatility(
  const std::vector<double>& closes,
  std::size_t trading_days_per_year) {
  if (closes.size() < 3) {
    return validation_error(
      "historical volatility needs at least 3 closes, got " + std::to_string(closes.size()));
  }
  if (trading_days_per_year == 0) {
    return validation_error("trading days per year must be positive");
  }
  for (const double close : closes) {
    if (!std::isfinite(close) || close <= 0.0) {
      return validation_error("close prices must be positive, got " + std::to_string(close));
    }
  }

  std::vector<double> returns;
  returns.reserve(closes.size() - 1);
  double sum = 0.0;
  for (std::size_t i = 1; i < closes.size(); ++i) {
    const double log_return = std::log(closes[i] / closes[i - 1]);
    returns.push_back(log_return);
    sum += log_return;
  }

  const double mean = sum / static_cast<double>(returns.size());
  double variance_sum = 0.0;
  for (const double log_return : returns) {
    const double diff = log_return - mean;
    variance_sum += diff * diff;
  }

  const double variance = variance_sum / static_cast<double>(returns.size() - 1);
  return std::sqrt(variance) * std::sqrt(static_cast<double>(trading_days_per_year));
}

}  // namespace optiview
