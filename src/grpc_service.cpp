#include "optiview/grpc_service.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <grpcpp/server_context.h>

#include "optiview/black_scholes.hpp"
#include "optiview/implied_volatility.hpp"
#include "optiview/market_analysis.hpp"

namespace optiview {

namespace {

pricing::ErrorKind to_proto(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kValidation:
      return pricing::ERROR_KIND_VALIDATION;
    case ErrorKind::kInvalidQuote:
      return pricing::ERROR_KIND_INVALID_QUOTE;
    case ErrorKind::kConvergence:
      return pricing::ERROR_KIND_CONVERGENCE;
    case ErrorKind::kDataUnavailable:
      return pricing::ERROR_KIND_DATA_UNAVAILABLE;
  }
  return pricing::ERROR_KIND_UNSPECIFIED;
}

pricing::OptionType to_proto(OptionType type) {
  return type == OptionType::kCall ? pricing::OPTION_TYPE_CALL : pricing::OPTION_TYPE_PUT;
}

pricing::SolverMethod to_proto(SolverMethod method) {
  return method == SolverMethod::kNewton ? pricing::SOLVER_METHOD_NEWTON : pricing::SOLVER_METHOD_BISECTION;
}

grpc::Status fail(const char* rpc, const Error& error) {
  std::cerr << rpc << " failed: " << to_string(error.kind) << ": " << error.message << '\n';
  return to_status(error);
}

grpc::Status null_arguments(const char* rpc) {
  std::cerr << rpc << " failed: request/response must not be null\n";
  return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "request/response must not be null");
}

void fill_echo(const std::string& ticker, const OptionContract& contract, pricing::ContractEcho* echo) {
  echo->set_ticker(ticker);
  echo->set_spot(contract.spot);
  echo->set_strike(contract.strike);
  echo->set_rate(contract.rate);
  echo->set_volatility(contract.volatility);
  echo->set_time_to_maturity(contract.time_to_maturity);
  echo->set_dividend(contract.dividend_yield);
  echo->set_option_type(to_proto(contract.type));
}

void fill_greeks(const PricingResult& result, pricing::GreekValues* greeks) {
  greeks->set_price(result.price);
  greeks->set_delta(result.delta);
  greeks->set_gamma(result.gamma);
  greeks->set_vega(result.vega);
  greeks->set_theta(result.theta);
  greeks->set_rho(result.rho);
}

}  // namespace

grpc::Status to_status(const Error& error) {
  grpc::StatusCode code = grpc::StatusCode::UNKNOWN;
  switch (error.kind) {
    case ErrorKind::kValidation:
      code = grpc::StatusCode::INVALID_ARGUMENT;
      break;
    case ErrorKind::kInvalidQuote:
      code = grpc::StatusCode::FAILED_PRECONDITION;
      break;
    case ErrorKind::kConvergence:
      code = grpc::StatusCode::ABORTED;
      break;
    case ErrorKind::kDataUnavailable:
      code = grpc::StatusCode::UNAVAILABLE;
      break;
  }

  pricing::ErrorDetail detail;
  detail.set_kind(to_proto(error.kind));
  detail.set_message(error.message);
  return grpc::Status(code, error.message, detail.SerializeAsString());
}

PricingGrpcService::PricingGrpcService(
  ServerConfig config,
  std::shared_ptr<const MarketDataSource> market_data)
    : config_(std::move(config)),
      surface_generator_(config_.max_grid_points),
      market_data_(std::move(market_data)) {}

Result<OptionContract> PricingGrpcService::resolve_contract(const pricing::OptionSpecification& proto) const {
  OptionType type = OptionType::kCall;
  switch (proto.option_type()) {
    case pricing::OPTION_TYPE_CALL:
      type = OptionType::kCall;
      break;
    case pricing::OPTION_TYPE_PUT:
      type = OptionType::kPut;
      break;
    default:
      return validation_error("option type must be call or put");
  }

  const std::string& ticker = proto.ticker();
  if ((!proto.has_spot() || !proto.has_volatility()) && market_data_ == nullptr) {
    return data_unavailable_error(
      "no market data source configured; supply spot and volatility explicitly");
  }
  if ((!proto.has_spot() || !proto.has_volatility()) && ticker.empty()) {
    return data_unavailable_error("a ticker is required to look up missing spot or volatility");
  }

  double spot = proto.spot();
  if (!proto.has_spot()) {
    const auto resolved = market_data_->spot_price(ticker);
    if (!resolved) {
      return resolved.error();
    }
    spot = resolved.value();
  }

  double volatility = proto.volatility();
  if (!proto.has_volatility()) {
    const auto resolved = market_data_->historical_volatility(ticker, kDefaultVolatilityLookbackDays);
    if (!resolved) {
      return data_unavailable_error(resolved.error().message + "; supply volatility explicitly");
    }
    volatility = resolved.value();
  }

  const OptionContract contract{
    .spot = spot,
    .strike = proto.strike(),
    .time_to_maturity = proto.time_to_maturity(),
    .rate = proto.has_rate() ? proto.rate() : config_.default_rate,
    .volatility = volatility,
    .dividend_yield = proto.dividend(),
    .type = type,
  };
  if (auto error = validate_contract(contract)) {
    return *std::move(error);
  }
  return contract;
}

grpc::Status PricingGrpcService::Price(
  grpc::ServerContext*,
  const pricing::PriceRequest* request,
  pricing::PriceResponse* response) {
  if (request == nullptr || response == nullptr) {
    return null_arguments("Price");
  }
  const auto contract = resolve_contract(request->option());
  if (!contract) {
    return fail("Price", contract.error());
  }
  const auto result = price(contract.value());
  if (!result) {
    return fail("Price", result.error());
  }
  fill_echo(request->option().ticker(), contract.value(), response->mutable_contract());
  response->set_price(result.value().price);
  return grpc::Status::OK;
}

grpc::Status PricingGrpcService::Greeks(
  grpc::ServerContext*,
  const pricing::PriceRequest* request,
  pricing::GreeksResponse* response) {
  if (request == nullptr || response == nullptr) {
    return null_arguments("Greeks");
  }
  const auto contract = resolve_contract(request->option());
  if (!contract) {
    return fail("Greeks", contract.error());
  }
  const auto result = price(contract.value());
  if (!result) {
    return fail("Greeks", result.error());
  }
  fill_echo(request->option().ticker(), contract.value(), response->mutable_contract());
  fill_greeks(result.value(), response->mutable_greeks());
  return grpc::Status::OK;
}

grpc::Status PricingGrpcService::ImpliedVol(
  grpc::ServerContext*,
  const pricing::ImpliedVolRequest* request,
  pricing::ImpliedVolResponse* response) {
  if (request == nullptr || response == nullptr) {
    return null_arguments("ImpliedVol");
  }
  // The quote stands in for volatility: any supplied value is discarded
  // and nothing is looked up.
  pricing::OptionSpecification option = request->option();
  option.set_volatility(ImpliedVolatilityOptions{}.initial_guess);
  const auto contract = resolve_contract(option);
  if (!contract) {
    return fail("ImpliedVol", contract.error());
  }
  const auto result = implied_volatility(contract.value(), request->market_price());
  if (!result) {
    return fail("ImpliedVol", result.error());
  }
  OptionContract solved = contract.value();
  solved.volatility = result.value().implied_volatility;
  fill_echo(option.ticker(), solved, response->mutable_contract());
  response->set_implied_volatility(result.value().implied_volatility);
  response->set_iterations(static_cast<std::uint32_t>(result.value().iterations));
  response->set_method(to_proto(result.value().method));
  return grpc::Status::OK;
}

grpc::Status PricingGrpcService::Surface(
  grpc::ServerContext*,
  const pricing::SurfaceRequest* request,
  pricing::SurfaceResponse* response) {
  if (request == nullptr || response == nullptr) {
    return null_arguments("Surface");
  }
  const auto contract = resolve_contract(request->option());
  if (!contract) {
    return fail("Surface", contract.error());
  }

  const SurfaceRequest defaults;
  const std::size_t cap = surface_generator_.max_grid_points();
  const SurfaceRequest surface_request{
    .price_range_pct = request->price_range_pct() == 0.0 ? defaults.price_range_pct : request->price_range_pct(),
    .time_horizon = request->time_horizon() == 0.0 ? defaults.time_horizon : request->time_horizon(),
    .num_price_points = request->num_price_points() == 0U
      ? std::min(defaults.num_price_points, cap)
      : request->num_price_points(),
    .num_time_points = request->num_time_points() == 0U
      ? std::min(defaults.num_time_points, cap)
      : request->num_time_points(),
  };

  const auto grid = surface_generator_.generate(contract.value(), surface_request);
  if (!grid) {
    return fail("Surface", grid.error());
  }

  const SurfaceGrid& surface = grid.value();
  response->set_ticker(request->option().ticker());
  response->set_strike(surface.contract.strike);
  response->set_option_type(to_proto(surface.contract.type));
  response->set_volatility(surface.contract.volatility);
  response->set_current_price(surface.contract.spot);
  response->mutable_stock_prices()->Add(surface.stock_prices.begin(), surface.stock_prices.end());
  response->mutable_times()->Add(surface.times.begin(), surface.times.end());
  for (const auto& row : surface.values) {
    response->add_rows()->mutable_values()->Add(row.begin(), row.end());
  }
  return grpc::Status::OK;
}

grpc::Status PricingGrpcService::AnalyzeQuote(
  grpc::ServerContext*,
  const pricing::AnalyzeQuoteRequest* request,
  pricing::AnalyzeQuoteResponse* response) {
  if (request == nullptr || response == nullptr) {
    return null_arguments("AnalyzeQuote");
  }
  const auto contract = resolve_contract(request->option());
  if (!contract) {
    return fail("AnalyzeQuote", contract.error());
  }
  const auto analysis = analyze_quote(contract.value(), request->market_price());
  if (!analysis) {
    return fail("AnalyzeQuote", analysis.error());
  }

  const QuoteAnalysis& result = analysis.value();
  fill_echo(request->option().ticker(), contract.value(), response->mutable_contract());
  fill_greeks(result.theoretical, response->mutable_theoretical());
  response->set_market_price(result.market_price);
  response->set_difference(result.difference);
  if (result.percentage_diff) {
    response->set_percentage_diff(*result.percentage_diff);
  }
  response->set_moneyness(result.moneyness);
  if (result.implied_volatility) {
    response->set_implied_volatility(result.implied_volatility.value().implied_volatility);
  } else {
    auto* error = response->mutable_implied_volatility_error();
    error->set_kind(to_proto(result.implied_volatility.error().kind));
    error->set_message(result.implied_volatility.error().message);
  }
  return grpc::Status::OK;
}

grpc::Status PricingGrpcService::PriceChain(
  grpc::ServerContext*,
  const pricing::PriceChainRequest* request,
  pricing::PriceChainResponse* response) {
  if (request == nullptr || response == nullptr) {
    return null_arguments("PriceChain");
  }
  const auto contract = resolve_contract(request->option());
  if (!contract) {
    return fail("PriceChain", contract.error());
  }
  const std::vector<double> strikes(request->strikes().begin(), request->strikes().end());
  const auto chain = price_chain(contract.value(), strikes);
  if (!chain) {
    return fail("PriceChain", chain.error());
  }

  fill_echo(request->option().ticker(), contract.value(), response->mutable_contract());
  for (const ChainEntry& entry : chain.value()) {
    auto* out = response->add_entries();
    out->set_strike(entry.strike);
    fill_greeks(entry.pricing, out->mutable_greeks());
  }
  return grpc::Status::OK;
}

}  // namespace optiview
