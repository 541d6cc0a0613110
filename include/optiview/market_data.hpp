#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "optiview/errors.hpp"
#include "optiview/option_contract.hpp"

namespace optiview {

// An observed traded option price.
struct MarketQuote {
  double strike;
  double time_to_maturity;
  OptionType type;
  double price;
};

// Where callers of the pricing core get spot and volatility when a request
// does not carry them. Failures are kDataUnavailable.
class MarketDataSource {
 public:
  virtual ~MarketDataSource() = default;

  virtual Result<double> spot_price(const std::string& ticker) const = 0;
  virtual Result<double> historical_volatility(const std::string& ticker, std::size_t lookback_days) const = 0;
  virtual Result<std::vector<MarketQuote>> option_chain(const std::string& ticker) const = 0;
};

inline constexpr std::size_t kDefaultVolatilityLookbackDays = 30;

// Process-local source fed by whoever fetched the data.
class InMemoryMarketData final : public MarketDataSource {
 public:
  InMemoryMarketData() = default;
  ~InMemoryMarketData() override = default;

  // Oldest first; the last close is the spot price.
  void set_closes(const std::string& ticker, std::vector<double> closes);
  void set_option_chain(const std::string& ticker, std::vector<MarketQuote> quotes);

  Result<double> spot_price(const std::string& ticker) const override;
  Result<double> historical_volatility(const std::string& ticker, std::size_t lookback_days) const override;
  Result<std::vector<MarketQuote>> option_chain(const std::string& ticker) const override;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::vector<double>> closes_;
  std::map<std::string, std::vector<MarketQuote>> chains_;
};

}  // namespace optiview
