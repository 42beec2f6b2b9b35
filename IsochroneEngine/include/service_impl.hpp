#ifndef SERVICE_IMPL_HPP
#define SERVICE_IMPL_HPP

#include "isochrone.grpc.pb.h"
#include "isochrone_engine.hpp"
#include <chrono>
#include <grpcpp/grpcpp.h>
#include <mutex>

using grpc::Server;
using grpc::ServerBuilder;
using grpc::ServerContext;
using grpc::Status;
using isochrone::IsochroneRequest;
using isochrone::IsochroneResponse;
using isochrone::IsochroneService;
using isochrone::LayersRequest;
using isochrone::LayersResponse;
using isochrone::SetOriginRequest;
using isochrone::SetOriginResponse;
using isochrone::TravelTimeRequest;
using isochrone::TravelTimeResponse;

// Serializes every call onto the engine, which is single-controller.
class IsochroneServiceImpl final : public IsochroneService::Service {
public:
  explicit IsochroneServiceImpl(
      IsochroneEngine &engine,
      std::chrono::milliseconds renderTimeout = std::chrono::seconds(30))
      : engine_(engine), renderTimeout_(renderTimeout) {}

  Status SetOrigin(ServerContext *context, const SetOriginRequest *request,
                   SetOriginResponse *reply) override;
  Status GetTravelTime(ServerContext *context, const TravelTimeRequest *request,
                       TravelTimeResponse *reply) override;
  Status RenderIsochrone(ServerContext *context, const IsochroneRequest *request,
                         IsochroneResponse *reply) override;
  Status SetLayers(ServerContext *context, const LayersRequest *request,
                   LayersResponse *reply) override;

private:
  IsochroneEngine &engine_;
  std::chrono::milliseconds renderTimeout_;
  std::mutex mutex_;
};

#endif // SERVICE_IMPL_HPP
