#include "optiview/implied_volatility.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>

#include "optiview/black_scholes.hpp"

namespace optiview {

namespace {

Result<PricingResult> price_at(const OptionContract& contract, double sigma) {
  OptionContract guess = contract;
  guess.volatility = sigma;
  return price(guess);
}

bool positive_finite(double value) {
  return std::isfinite(value) && value > 0.0;
}

std::optional<Error> validate_options(const ImpliedVolatilityOptions& options) {
  if (!positive_finite(options.lower_bound)) {
    return validation_error(
      "volatility lower bound must be positive, got " + std::to_string(options.lower_bound));
  }
  if (!std::isfinite(options.upper_bound) || options.upper_bound <= options.lower_bound) {
    return validation_error(
      "volatility upper bound " + std::to_string(options.upper_bound) +
      " must exceed the lower bound " + std::to_string(options.lower_bound));
  }
  if (!std::isfinite(options.initial_guess) || options.initial_guess < options.lower_bound ||
      options.initial_guess > options.upper_bound) {
    return validation_error(
      "initial guess " + std::to_string(options.initial_guess) + " lies outside the volatility bounds");
  }
  if (!positive_finite(options.price_tolerance)) {
    return validation_error("price tolerance must be positive");
  }
  if (!positive_finite(options.volatility_tolerance)) {
    return validation_error("volatility tolerance must be positive");
  }
  if (!std::isfinite(options.min_vega) || options.min_vega < 0.0) {
    return validation_error("minimum vega must be non-negative");
  }
  return std::nullopt;
}

}  // namespace

PriceBounds no_arbitrage_bounds(const OptionContract& contract) {
  const double T = contract.time_to_maturity;
  const double forward_spot = contract.spot * std::exp(-contract.dividend_yield * T);
  const double discounted_strike = contract.strike * std::exp(-contract.rate * T);
  if (contract.type == OptionType::kCall) {
    return PriceBounds{
      .lower = std::max(forward_spot - discounted_strike, 0.0),
      .upper = forward_spot,
    };
  }
  return PriceBounds{
    .lower = std::max(discounted_strike - forward_spot, 0.0),
    .upper = discounted_strike,
  };
}

Result<ImpliedVolatilityResult> implied_volatility(
  const OptionContract& contract,
  double market_price,
  const ImpliedVolatilityOptions& options) {
  if (auto error = validate_options(options)) {
    return *std::move(error);
  }
  OptionContract base = contract;
  base.volatility = options.initial_guess;
  if (auto error = validate_contract(base)) {
    return *std::move(error);
  }
  if (base.time_to_maturity == 0.0) {
    return validation_error("implied volatility is undefined for an expired option");
  }

  const PriceBounds bounds = no_arbitrage_bounds(base);
  if (!std::isfinite(market_price) || market_price <= 0.0) {
    return invalid_quote_error("market price must be positive, got " + std::to_string(market_price));
  }
  if (market_price < bounds.lower) {
    return invalid_quote_error(
      "market price " + std::to_string(market_price) + " is below the arbitrage lower bound " +
      std::to_string(bounds.lower));
  }
  if (market_price >= bounds.upper) {
    return invalid_quote_error(
      "market price " + std::to_string(market_price) + " is at or above the arbitrage upper bound " +
      std::to_string(bounds.upper));
  }

  std::size_t iterations = 0;
  double sigma = options.initial_guess;
  for (; iterations < options.max_newton_iterations; ++iterations) {
    const auto priced = price_at(base, sigma);
    if (!priced) {
      return priced.error();
    }
    const PricingResult& trial = priced.value();
    const double diff = trial.price - market_price;
    if (std::abs(diff) < options.price_tolerance) {
      return ImpliedVolatilityResult{
        .implied_volatility = sigma,
        .iterations = iterations + 1,
        .method = SolverMethod::kNewton,
      };
    }
    if (trial.vega < options.min_vega) {
      break;
    }
    const double next = sigma - diff / trial.vega;
    if (!std::isfinite(next) || next < options.lower_bound || next > options.upper_bound) {
      break;
    }
    sigma = next;
  }

  double low = options.lower_bound;
  double high = options.upper_bound;
  const auto low_priced = price_at(base, low);
  if (!low_priced) {
    return low_priced.error();
  }
  const auto high_priced = price_at(base, high);
  if (!high_priced) {
    return high_priced.error();
  }
  const double low_diff = low_priced.value().price - market_price;
  const double high_diff = high_priced.value().price - market_price;
  if (std::abs(low_diff) < options.price_tolerance) {
    return ImpliedVolatilityResult{
      .implied_volatility = low,
      .iterations = iterations + 1,
      .method = SolverMethod::kBisection,
    };
  }
  if (std::abs(high_diff) < options.price_tolerance) {
    return ImpliedVolatilityResult{
      .implied_volatility = high,
      .iterations = iterations + 1,
      .method = SolverMethod::kBisection,
    };
  }
  if (low_diff > 0.0 || high_diff < 0.0) {
    return convergence_error(
      "market price " + std::to_string(market_price) + " is not bracketed by volatilities [" +
      std::to_string(low) + ", " + std::to_string(high) + "]");
  }

  for (std::size_t step = 0; step < options.max_bisection_iterations; ++step) {
    ++iterations;
    const double mid = 0.5 * (low + high);
    const auto priced = price_at(base, mid);
    if (!priced) {
      return priced.error();
    }
    const double diff = priced.value().price - market_price;

    if (std::abs(diff) < options.price_tolerance) {
      return ImpliedVolatilityResult{
        .implied_volatility = mid,
        .iterations = iterations,
        .method = SolverMethod::kBisection,
      };
    }

    // Price is increasing in volatility.
    if (diff > 0.0) {
      high = mid;
    } else {
      low = mid;
    }

    if (std::abs(high - low) < options.volatility_tolerance) {
      return ImpliedVolatilityResult{
        .implied_volatility = 0.5 * (low + high),
        .iterations = iterations,
        .method = SolverMethod::kBisection,
      };
    }
  }

  return convergence_error(
    "implied volatility did not converge after " + std::to_string(iterations) + " iterations");
}

}  // namespace optiview
