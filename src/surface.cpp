#include "optiview/surface.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "optiview/black_scholes.hpp"

namespace optiview {

std::vector<double> linspace(double start, double stop, std::size_t count) {
  std::vector<double> points;
  if (count == 0) {
    return points;
  }
  points.reserve(count);
  if (count == 1) {
    points.push_back(start);
    return points;
  }
  const double step = (stop - start) / static_cast<double>(count - 1);
  for (std::size_t i = 0; i + 1 < count; ++i) {
    points.push_back(start + step * static_cast<double>(i));
  }
  points.push_back(stop);
  return points;
}

SurfaceGenerator::SurfaceGenerator(std::size_t max_grid_points)
    : max_grid_points_(std::clamp<std::size_t>(max_grid_points, 2, kMaxGridPoints)) {}

Result<SurfaceGrid> SurfaceGenerator::generate(
  const OptionContract& contract,
  const SurfaceRequest& request) const {
  if (auto error = validate_contract(contract)) {
    return *std::move(error);
  }
  if (!std::isfinite(request.price_range_pct) || request.price_range_pct <= 0.0 ||
      request.price_range_pct >= 1.0) {
    return validation_error(
      "price range must lie strictly between 0 and 1, got " + std::to_string(request.price_range_pct));
  }
  if (!std::isfinite(request.time_horizon) || request.time_horizon <= 0.0) {
    return validation_error("time horizon must be positive, got " + std::to_string(request.time_horizon));
  }
  if (request.num_price_points < 2 || request.num_price_points > max_grid_points_) {
    return validation_error(
      "number of price points must be in [2, " + std::to_string(max_grid_points_) + "], got " +
      std::to_string(request.num_price_points));
  }
  if (request.num_time_points < 1 || request.num_time_points > max_grid_points_) {
    return validation_error(
      "number of time points must be in [1, " + std::to_string(max_grid_points_) + "], got " +
      std::to_string(request.num_time_points));
  }

  SurfaceGrid grid{
    .contract = contract,
    .stock_prices = linspace(
      contract.spot * (1.0 - request.price_range_pct),
      contract.spot * (1.0 + request.price_range_pct),
      request.num_price_points),
    .times = {},
    .values = {},
  };

  grid.times.reserve(request.num_time_points);
  for (std::size_t i = 0; i < request.num_time_points; ++i) {
    grid.times.push_back(
      request.time_horizon * static_cast<double>(i + 1) / static_cast<double>(request.num_time_points));
  }

  grid.values.reserve(grid.times.size());
  for (const double T : grid.times) {
    std::vector<double> row;
    row.reserve(grid.stock_prices.size());
    for (const double S : grid.stock_prices) {
      OptionContract node = contract;
      node.spot = S;
      node.time_to_maturity = T;
      const auto result = price(node);
      if (!result) {
        return result.error();
      }
      row.push_back(result.value().price);
    }
    grid.values.push_back(std::move(row));
  }

  return grid;
}

}  // namespace optiview
