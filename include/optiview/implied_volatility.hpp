#pragma once

#include <cstddef>

#include "optiview/errors.hpp"
#include "optiview/option_contract.hpp"

namespace optiview {

struct ImpliedVolatilityOptions {
  double initial_guess = 0.2;
  double price_tolerance = 1e-6;
  std::size_t max_newton_iterations = 100;
  // Below this vega a Newton step is treated as unstable.
  double min_vega = 1e-8;
  double lower_bound = 1e-4;
  double upper_bound = 5.0;
  std::size_t max_bisection_iterations = 200;
  double volatility_tolerance = 1e-12;
};

enum class SolverMethod {
  kNewton,
  kBisection,
};

struct ImpliedVolatilityResult {
  double implied_volatility;
  std::size_t iterations;  // Newton and bisection combined
  SolverMethod method;
};

struct PriceBounds {
  double lower;
  double upper;
};

// European no-arbitrage bounds for the option's price, independent of
// the contract's volatility.
PriceBounds no_arbitrage_bounds(const OptionContract& contract);

// Recovers the volatility that reprices `contract` to `market_price`.
// The contract's own volatility field is ignored. Newton-Raphson on vega
// first, bisection on [lower_bound, upper_bound] when Newton stalls.
Result<ImpliedVolatilityResult> implied_volatility(
  const OptionContract& contract,
  double market_price,
  const ImpliedVolatilityOptions& options = {});

}  // namespace optiview
