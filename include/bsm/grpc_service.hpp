#pragma once

#include <optional>

#include <grpcpp/grpcpp.h>

#include "bsm_engine.grpc.pb.h"

#include "bsm/engine.hpp"
#include "bsm/status.hpp"

namespace bsm {

// An omitted valuation date becomes `today`; an omitted exercise date falls one
// year after the valuation date.
MarketInputs market_inputs_from_proto(const rpc::MarketInputs& proto, const CalendarDate& today);

grpc::Status to_grpc_status(const EngineStatus& status);

class OptionEngineService final : public rpc::OptionEngine::Service {
 public:
  OptionEngineService() = default;
  explicit OptionEngineService(EngineConfig config) : config_(config) {}
  // A pinned valuation date replaces the UTC date for requests that omit one.
  OptionEngineService(EngineConfig config, std::optional<CalendarDate> valuation_date)
    : config_(config), valuation_date_(valuation_date) {}
  ~OptionEngineService() override = default;

  grpc::Status Price(
    grpc::ServerContext* context,
    const rpc::PriceRequest* request,
    rpc::PriceResponse* response) override;

  grpc::Status Curve(
    grpc::ServerContext* context,
    const rpc::CurveRequest* request,
    rpc::CurveResponse* response) override;

  grpc::Status ImpliedVol(
    grpc::ServerContext* context,
    const rpc::ImpliedVolRequest* request,
    rpc::ImpliedVolResponse* response) override;

  grpc::Status Evaluate(
    grpc::ServerContext* context,
    const rpc::EvaluateRequest* request,
    rpc::EvaluateResponse* response) override;

 private:
  CalendarDate today() const;

  EngineConfig config_;
  std::optional<CalendarDate> valuation_date_;
};

}  // namespace bsm
