#include "optiview/black_scholes.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace {

constexpr double kSqrtTwo = 1.41421356237309504880;
constexpr double kInvSqrtTwoPi = 0.39894228040143267794;  // 1/sqrt(2*pi)

double normal_pdf(double x) {
  return kInvSqrtTwoPi * std::exp(-0.5 * x * x);
}

double normal_cdf(double x) {
  return 0.5 * std::erfc(-x / kSqrtTwo);
}

}  // namespace

namespace optiview {

namespace {

PricingResult expired_result(const OptionContract& option) {
  const bool is_call = option.type == OptionType::kCall;
  double delta = 0.0;
  if (is_call && option.spot > option.strike) {
    delta = 1.0;
  } else if (!is_call && option.spot < option.strike) {
    delta = -1.0;
  }
  return PricingResult{
    .price = intrinsic_value(option),
    .delta = delta,
    .gamma = 0.0,
    .theta = 0.0,
    .vega = 0.0,
    .rho = 0.0,
  };
}

// sigma = 0: the terminal price is the forward, so the value is the
// discounted deterministic payoff.
PricingResult deterministic_result(const OptionContract& option) {
  const double T = option.time_to_maturity;
  const double dividend_discount = std::exp(-option.dividend_yield * T);
  const double forward_spot = option.spot * dividend_discount;
  const double discounted_strike = option.strike * std::exp(-option.rate * T);

  double price = 0.0;
  double delta = 0.0;
  if (option.type == OptionType::kCall) {
    if (forward_spot > discounted_strike) {
      price = forward_spot - discounted_strike;
      delta = dividend_discount;
    }
  } else if (discounted_strike > forward_spot) {
    price = discounted_strike - forward_spot;
    delta = -dividend_discount;
  }
  return PricingResult{
    .price = price,
    .delta = delta,
    .gamma = 0.0,
    .theta = 0.0,
    .vega = 0.0,
    .rho = 0.0,
  };
}

}  // namespace

Result<PricingResult> price(const OptionContract& option) {
  if (auto error = validate_contract(option)) {
    return *std::move(error);
  }
  if (option.time_to_maturity == 0.0) {
    return expired_result(option);
  }
  if (option.volatility == 0.0) {
    return deterministic_result(option);
  }

  const double S = option.spot;
  const double K = option.strike;
  const double r = option.rate;
  const double q = option.dividend_yield;
  const double sigma = option.volatility;
  const double T = option.time_to_maturity;

  const double sqrtT = std::sqrt(T);
  const double sigmaSqT = sigma * sqrtT;
  // A subnormal volatility can underflow sigma*sqrt(T); that is the sigma = 0 limit.
  if (sigmaSqT == 0.0) {
    return deterministic_result(option);
  }
  if (!std::isfinite(sigmaSqT)) {
    return validation_error("volatility * sqrt(T) overflows; volatility " + std::to_string(sigma) +
                            " is out of range");
  }

  const double dividend_discount = std::exp(-q * T);
  const double forward = S * dividend_discount;
  const double discount = std::exp(-r * T);
  const double logTerm = std::log(S / K);
  // Split so that sigma^2 never overflows for very large volatilities.
  const double d1 = (logTerm + (r - q) * T) / sigmaSqT + 0.5 * sigmaSqT;
  const double d2 = d1 - sigmaSqT;

  const double pdfD1 = normal_pdf(d1);

  double value = 0.0;
  double delta = 0.0;
  double theta = 0.0;
  double rho = 0.0;

  if (option.type == OptionType::kCall) {
    value = forward * normal_cdf(d1) - K * discount * normal_cdf(d2);
    delta = dividend_discount * normal_cdf(d1);
    theta = - (forward * pdfD1 * sigma) / (2.0 * sqrtT)
            - r * K * discount * normal_cdf(d2)
            + q * forward * normal_cdf(d1);
    rho = K * T * discount * normal_cdf(d2);
  } else {
    value = K * discount * normal_cdf(-d2) - forward * normal_cdf(-d1);
    delta = dividend_discount * (normal_cdf(d1) - 1.0);
    theta = - (forward * pdfD1 * sigma) / (2.0 * sqrtT)
            + r * K * discount * normal_cdf(-d2)
            - q * forward * normal_cdf(-d1);
    rho = -K * T * discount * normal_cdf(-d2);
  }

  const double gamma = dividend_discount * pdfD1 / (S * sigmaSqT);
  const double vega = forward * pdfD1 * sqrtT;

  // Far out of the money the subtraction can go a few ulps below zero.
  value = std::max(value, 0.0);

  if (!std::isfinite(value) || !std::isfinite(delta) || !std::isfinite(gamma) ||
      !std::isfinite(theta) || !std::isfinite(vega) || !std::isfinite(rho)) {
    return validation_error("contract inputs are outside the numerically representable range");
  }

  return PricingResult{
    .price = value,
    .delta = delta,
    .gamma = gamma,
    .theta = theta,
    .vega = vega,
    .rho = rho,
  };
}

Result<double> put_call_parity_residual(const OptionContract& option) {
  OptionContract call = option;
  call.type = OptionType::kCall;
  OptionContract put = option;
  put.type = OptionType::kPut;

  const auto call_result = price(call);
  if (!call_result) {
    return call_result.error();
  }
  const auto put_result = price(put);
  if (!put_result) {
    return put_result.error();
  }

  const double T = option.time_to_maturity;
  const double parity = option.spot * std::exp(-option.dividend_yield * T)
                        - option.strike * std::exp(-option.rate * T);
  return call_result.value().price - put_result.value().price - parity;
}

}  // namespace optiview
