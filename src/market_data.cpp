#include "optiview/market_data.hpp"

#include <cstddef>
#include <utility>

#include "optiview/market_analysis.hpp"

namespace optiview {

void InMemoryMarketData::set_closes(const std::string& ticker, std::vector<double> closes) {
  std::lock_guard<std::mutex> lock(mutex_);
  closes_[ticker] = std::move(closes);
}

void InMemoryMarketData::set_option_chain(const std::string& ticker, std::vector<MarketQuote> quotes) {
  std::lock_guard<std::mutex> lock(mutex_);
  chains_[ticker] = std::move(quotes);
}

Result<double> InMemoryMarketData::spot_price(const std::string& ticker) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = closes_.find(ticker);
  if (it == closes_.end() || it->second.empty()) {
    return data_unavailable_error("no price data for ticker " + ticker);
  }
  return it->second.back();
}

Result<double> InMemoryMarketData::historical_volatility(
  const std::string& ticker,
  std::size_t lookback_days) const {
  std::vector<double> window;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = closes_.find(ticker);
    if (it == closes_.end()) {
      return data_unavailable_error("no price data for ticker " + ticker);
    }
    const auto& closes = it->second;
    const std::size_t wanted = lookback_days + 1;
    const std::size_t first = closes.size() > wanted ? closes.size() - wanted : 0;
    window.assign(closes.begin() + static_cast<std::ptrdiff_t>(first), closes.end());
  }

  auto volatility = optiview::historical_volatility(window);
  if (!volatility) {
    return data_unavailable_error(
      "cannot estimate volatility for ticker " + ticker + ": " + volatility.error().message);
  }
  return volatility;
}

Result<std::vector<MarketQuote>> InMemoryMarketData::option_chain(const std::string& ticker) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = chains_.find(ticker);
  if (it == chains_.end()) {
    return data_unavailable_error("no option chain for ticker " + ticker);
  }
  return it->second;
}

}  // namespace optiview
