#include <cmath>
#include <cstdlib>
#include <initializer_list>
#include <iostream>

#include "optiview/black_scholes.hpp"
#include "optiview/implied_volatility.hpp"

namespace {

bool nearly_equal(double lhs, double rhs, double tolerance = 1e-6) {
  return std::abs(lhs - rhs) <= tolerance;
}

void assert_near(const char* label, double actual, double expected, double tolerance) {
  if (!nearly_equal(actual, expected, tolerance)) {
    std::cerr << label << " expected " << expected << " but got " << actual << '\n';
    std::exit(EXIT_FAILURE);
  }
}

void assert_condition(bool condition, const char* message) {
  if (!condition) {
    std::cerr << message << '\n';
    std::exit(EXIT_FAILURE);
  }
}

void assert_error(
  const optiview::Result<optiview::ImpliedVolatilityResult>& result,
  optiview::ErrorKind kind,
  const char* label) {
  if (result.ok()) {
    std::cerr << label << ": expected " << optiview::to_string(kind) << " but solver returned "
              << result.value().implied_volatility << '\n';
    std::exit(EXIT_FAILURE);
  }
  if (result.error().kind != kind) {
    std::cerr << label << ": expected " << optiview::to_string(kind) << " but got "
              << optiview::to_string(result.error().kind) << ": " << result.error().message << '\n';
    std::exit(EXIT_FAILURE);
  }
}

double model_price(optiview::OptionContract option, double sigma) {
  option.volatility = sigma;
  const auto result = optiview::price(option);
  assert_condition(result.ok(), "model price should be computable");
  return result.value().price;
}

void test_round_trip() {
  for (double spot : {90.0, 100.0, 110.0}) {
    for (double T : {0.5, 1.0, 2.0}) {
      for (double sigma : {0.15, 0.3, 0.6, 1.2}) {
        for (auto type : {optiview::OptionType::kCall, optiview::OptionType::kPut}) {
          const optiview::OptionContract option{
            .spot = spot,
            .strike = 100.0,
            .time_to_maturity = T,
            .rate = 0.05,
            .volatility = 0.0,
            .type = type,
          };
          const auto iv = optiview::implied_volatility(option, model_price(option, sigma));
          assert_condition(iv.ok(), "round trip should converge");
          assert_near("round-trip volatility", iv.value().implied_volatility, sigma, 1e-4);
        }
      }
    }
  }
}

void test_newton_path() {
  const optiview::OptionContract call{
    .spot = 100.0,
    .strike = 100.0,
    .time_to_maturity = 1.0,
    .rate = 0.05,
    .volatility = 0.0,
    .type = optiview::OptionType::kCall,
  };
  const auto iv = optiview::implied_volatility(call, 10.450584);
  assert_condition(iv.ok(), "at-the-money quote should converge");
  assert_near("atm implied volatility", iv.value().implied_volatility, 0.2, 1e-4);
  assert_condition(iv.value().method == optiview::SolverMethod::kNewton, "atm quote should solve by Newton");
  assert_condition(iv.value().iterations <= 10, "Newton should converge in a few iterations");
}

void test_bisection_fallback() {
  // Vega at the 20% starting guess is ~1e-14, so Newton cannot move.
  const optiview::OptionContract deep_call{
    .spot = 100.0,
    .strike = 60.0,
    .time_to_maturity = 0.1,
    .rate = 0.05,
    .volatility = 0.0,
    .type = optiview::OptionType::kCall,
  };
  const auto iv = optiview::implied_volatility(deep_call, model_price(deep_call, 0.9));
  assert_condition(iv.ok(), "deep in-the-money quote should converge through bisection");
  assert_near("bisection volatility", iv.value().implied_volatility, 0.9, 1e-4);
  assert_condition(iv.value().method == optiview::SolverMethod::kBisection, "expected bisection fallback");

  optiview::ImpliedVolatilityOptions no_newton;
  no_newton.max_newton_iterations = 0;
  const optiview::OptionContract put{
    .spot = 100.0,
    .strike = 105.0,
    .time_to_maturity = 0.75,
    .rate = 0.02,
    .volatility = 0.0,
    .type = optiview::OptionType::kPut,
  };
  const auto forced = optiview::implied_volatility(put, model_price(put, 0.35), no_newton);
  assert_condition(forced.ok(), "bisection alone should converge");
  assert_near("forced bisection volatility", forced.value().implied_volatility, 0.35, 1e-4);
  assert_condition(forced.value().method == optiview::SolverMethod::kBisection, "expected bisection");
}

void test_european_lower_bound() {
  // A deep in-the-money European put is worth less than K - S.
  const optiview::OptionContract put{
    .spot = 100.0,
    .strike = 150.0,
    .time_to_maturity = 1.0,
    .rate = 0.05,
    .volatility = 0.0,
    .type = optiview::OptionType::kPut,
  };
  const double quote = model_price(put, 0.3);
  assert_condition(quote < 50.0, "deep put should trade below intrinsic value");
  const auto iv = optiview::implied_volatility(put, quote);
  assert_condition(iv.ok(), "deep put quote inside European bounds should converge");
  assert_near("deep put volatility", iv.value().implied_volatility, 0.3, 1e-4);
}

void test_invalid_quotes() {
  const optiview::OptionContract call{
    .spot = 100.0,
    .strike = 60.0,
    .time_to_maturity = 1.0,
    .rate = 0.05,
    .volatility = 0.0,
    .type = optiview::OptionType::kCall,
  };
  assert_error(optiview::implied_volatility(call, 0.0), optiview::ErrorKind::kInvalidQuote, "zero quote");
  assert_error(optiview::implied_volatility(call, -1.0), optiview::ErrorKind::kInvalidQuote, "negative quote");
  assert_error(optiview::implied_volatility(call, std::nan("")), optiview::ErrorKind::kInvalidQuote, "nan quote");
  assert_error(optiview::implied_volatility(call, 39.0), optiview::ErrorKind::kInvalidQuote, "below intrinsic");
  assert_error(optiview::implied_volatility(call, 41.0), optiview::ErrorKind::kInvalidQuote,
               "below discounted forward intrinsic");
  assert_error(optiview::implied_volatility(call, 100.0), optiview::ErrorKind::kInvalidQuote, "at spot");
  assert_error(optiview::implied_volatility(call, 120.0), optiview::ErrorKind::kInvalidQuote, "above spot");

  optiview::OptionContract put = call;
  put.type = optiview::OptionType::kPut;
  put.strike = 100.0;
  // Upper bound K e^{-rT} = 95.12
  assert_error(optiview::implied_volatility(put, 96.0), optiview::ErrorKind::kInvalidQuote,
               "put above discounted strike");

  const auto bounds = optiview::no_arbitrage_bounds(put);
  assert_near("put lower bound", bounds.lower, 0.0, 0.0);
  assert_near("put upper bound", bounds.upper, 100.0 * std::exp(-0.05), 1e-12);
}

void test_failures() {
  optiview::OptionContract expired{
    .spot = 100.0,
    .strike = 100.0,
    .time_to_maturity = 0.0,
    .rate = 0.05,
    .volatility = 0.0,
    .type = optiview::OptionType::kCall,
  };
  assert_error(optiview::implied_volatility(expired, 1.0), optiview::ErrorKind::kValidation, "expired");

  expired.spot = -1.0;
  expired.time_to_maturity = 1.0;
  assert_error(optiview::implied_volatility(expired, 1.0), optiview::ErrorKind::kValidation, "negative spot");

  const optiview::OptionContract call{
    .spot = 100.0,
    .strike = 100.0,
    .time_to_maturity = 1.0,
    .rate = 0.05,
    .volatility = 0.0,
    .type = optiview::OptionType::kCall,
  };
  const double quote = model_price(call, 0.6);

  optiview::ImpliedVolatilityOptions narrow;
  narrow.max_newton_iterations = 0;
  narrow.upper_bound = 0.3;
  assert_error(optiview::implied_volatility(call, quote, narrow), optiview::ErrorKind::kConvergence,
               "quote outside the bisection bracket");

  optiview::ImpliedVolatilityOptions starved;
  starved.max_newton_iterations = 0;
  starved.max_bisection_iterations = 3;
  assert_error(optiview::implied_volatility(call, quote, starved), optiview::ErrorKind::kConvergence,
               "bisection budget exhausted");
}

void test_solver_options_validated() {
  const optiview::OptionContract call{
    .spot = 100.0,
    .strike = 100.0,
    .time_to_maturity = 1.0,
    .rate = 0.05,
    .volatility = 0.0,
    .type = optiview::OptionType::kCall,
  };

  optiview::ImpliedVolatilityOptions negative_floor;
  negative_floor.lower_bound = -1.0;
  negative_floor.max_newton_iterations = 0;
  assert_error(optiview::implied_volatility(call, 10.0, negative_floor), optiview::ErrorKind::kValidation,
               "negative volatility lower bound");

  optiview::ImpliedVolatilityOptions inverted;
  inverted.lower_bound = 0.5;
  inverted.upper_bound = 0.1;
  assert_error(optiview::implied_volatility(call, 10.0, inverted), optiview::ErrorKind::kValidation,
               "inverted volatility bracket");

  optiview::ImpliedVolatilityOptions outside_guess;
  outside_guess.initial_guess = 7.0;
  assert_error(optiview::implied_volatility(call, 10.0, outside_guess), optiview::ErrorKind::kValidation,
               "initial guess outside the bracket");

  optiview::ImpliedVolatilityOptions zero_tolerance;
  zero_tolerance.price_tolerance = 0.0;
  assert_error(optiview::implied_volatility(call, 10.0, zero_tolerance), optiview::ErrorKind::kValidation,
               "zero price tolerance");

  optiview::ImpliedVolatilityOptions nan_tolerance;
  nan_tolerance.volatility_tolerance = std::nan("");
  assert_error(optiview::implied_volatility(call, 10.0, nan_tolerance), optiview::ErrorKind::kValidation,
               "nan volatility tolerance");

  optiview::ImpliedVolatilityOptions negative_vega;
  negative_vega.min_vega = -1.0;
  assert_error(optiview::implied_volatility(call, 10.0, negative_vega), optiview::ErrorKind::kValidation,
               "negative minimum vega");
}

}  // namespace

int main() {
  test_round_trip();
  test_newton_path();
  test_bisection_fallback();
  test_european_lower_bound();
  test_invalid_quotes();
  test_failures();
  test_solver_options_validated();
  return EXIT_SUCCESS;
}
