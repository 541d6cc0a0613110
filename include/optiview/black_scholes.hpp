#pragma once

#include "optiview/errors.hpp"
#include "optiview/option_contract.hpp"

namespace optiview {

// Theta is the calendar decay -dV/dT per year; vega and rho are per unit
// (1.00) change in volatility and rate.
struct PricingResult {
  double price;
  double delta;
  double gamma;
  double theta;
  double vega;
  double rho;
};

// Closed-form Black-Scholes value and Greeks. Expired (T = 0) and
// zero-volatility contracts take their limiting forms instead of d1/d2.
Result<PricingResult> price(const OptionContract& contract);

// C - P - (S e^{-qT} - K e^{-rT}); zero up to rounding for any valid contract.
Result<double> put_call_parity_residual(const OptionContract& contract);

}  // namespace optiview
