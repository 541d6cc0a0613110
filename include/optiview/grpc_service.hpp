#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "optiview.grpc.pb.h"

#include "optiview/config.hpp"
#include "optiview/errors.hpp"
#include "optiview/market_data.hpp"
#include "optiview/option_contract.hpp"
#include "optiview/surface.hpp"

namespace optiview {

// Maps an error to its status code, with a serialized ErrorDetail attached.
grpc::Status to_status(const Error& error);

class PricingGrpcService final : public pricing::PricingService::Service {
 public:
  // Without a market data source every request must carry spot and volatility.
  explicit PricingGrpcService(
    ServerConfig config = {},
    std::shared_ptr<const MarketDataSource> market_data = nullptr);
  ~PricingGrpcService() override = default;

  // Fills in defaults and market data, then validates.
  Result<OptionContract> resolve_contract(const pricing::OptionSpecification& proto) const;

  grpc::Status Price(
    grpc::ServerContext* context,
    const pricing::PriceRequest* request,
    pricing::PriceResponse* response) override;

  grpc::Status Greeks(
    grpc::ServerContext* context,
    const pricing::PriceRequest* request,
    pricing::GreeksResponse* response) override;

  grpc::Status ImpliedVol(
    grpc::ServerContext* context,
    const pricing::ImpliedVolRequest* request,
    pricing::ImpliedVolResponse* response) override;

  grpc::Status Surface(
    grpc::ServerContext* context,
    const pricing::SurfaceRequest* request,
    pricing::SurfaceResponse* response) override;

  grpc::Status AnalyzeQuote(
    grpc::ServerContext* context,
    const pricing::AnalyzeQuoteRequest* request,
    pricing::AnalyzeQuoteResponse* response) override;

  grpc::Status PriceChain(
    grpc::ServerContext* context,
    const pricing::PriceChainRequest* request,
    pricing::PriceChainResponse* response) override;

 private:
  ServerConfig config_;
  SurfaceGenerator surface_generator_;
  std::shared_ptr<const MarketDataSource> market_data_;
};

}  // namespace optiview
