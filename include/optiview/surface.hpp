#pragma once

#include <cstddef>
#include <vector>

#include "optiview/errors.hpp"
#include "optiview/option_contract.hpp"

namespace optiview {

inline constexpr std::size_t kMaxGridPoints = 50;

struct SurfaceRequest {
  double price_range_pct = 0.5;
  double time_horizon = 1.0;
  std::size_t num_price_points = 50;
  std::size_t num_time_points = 30;
};

// Option values over a stock price x time-remaining grid.
//
// Both axes ascend. times[i] = time_horizon * (i + 1) / num_time_points, so
// the first row is the shortest time remaining and the last row is exactly
// time_horizon; T = 0 is never sampled. values[i][j] is the price of
// `contract` with spot = stock_prices[j] and time_to_maturity = times[i].
struct SurfaceGrid {
  OptionContract contract;
  std::vector<double> stock_prices;
  std::vector<double> times;
  std::vector<std::vector<double>> values;
};

class SurfaceGenerator {
 public:
  // Caps each axis at max_grid_points, which is clamped to [2, kMaxGridPoints].
  explicit SurfaceGenerator(std::size_t max_grid_points = kMaxGridPoints);

  std::size_t max_grid_points() const { return max_grid_points_; }

  // Any failure aborts the whole grid; no cell is ever defaulted.
  Result<SurfaceGrid> generate(const OptionContract& contract, const SurfaceRequest& request) const;

 private:
  std::size_t max_grid_points_;
};

// Evenly spaced, first == start and last == stop exactly.
std::vector<double> linspace(double start, double stop, std::size_t count);

}  // namespace optiview
