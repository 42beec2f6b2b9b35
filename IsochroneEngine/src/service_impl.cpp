#include "service_impl.hpp"
#include "errors.hpp"
#include <iostream>
#include <stdexcept>

Status IsochroneServiceImpl::SetOrigin(ServerContext *context,
                                       const SetOriginRequest *request,
                                       SetOriginResponse *reply) {
  if (!request->has_origin())
    return Status(grpc::StatusCode::INVALID_ARGUMENT, "origin is required");
  double lat = request->origin().latitude();
  double lon = request->origin().longitude();

  std::lock_guard<std::mutex> lock(mutex_);
  try {
    engine_.setOrigin(lat, lon);
  } catch (const ConfigurationError &e) {
    return Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
  }

  reply->set_reachable_stations(
      static_cast<int>(engine_.networkTimes().size()));
  reply->set_walking_nodes_reached(
      static_cast<int>(engine_.walking().reachedCount()));
  return Status::OK;
}

Status IsochroneServiceImpl::GetTravelTime(ServerContext *context,
                                           const TravelTimeRequest *request,
                                           TravelTimeResponse *reply) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!engine_.hasOrigin())
    return Status(grpc::StatusCode::FAILED_PRECONDITION, "no origin set");

  double minutes =
      engine_.getTravelTime(request->point().latitude(),
                            request->point().longitude());
  bool found = minutes < INF;
  reply->set_found(found);
  reply->set_minutes(found ? minutes : 0.0);
  return Status::OK;
}

Status IsochroneServiceImpl::RenderIsochrone(ServerContext *context,
                                             const IsochroneRequest *request,
                                             IsochroneResponse *reply) {
  Viewport viewport;
  viewport.bounds = {request->bounds().north(), request->bounds().south(),
                     request->bounds().east(), request->bounds().west()};
  viewport.width = request->width();
  viewport.height = request->height();

  std::cout << "Received render request: " << viewport.width << "x"
            << viewport.height << (request->preview() ? " (preview)" : "")
            << std::endl;

  std::lock_guard<std::mutex> lock(mutex_);
  try {
    if (request->has_origin())
      engine_.setOrigin(request->origin().latitude(),
                        request->origin().longitude());
    if (!engine_.hasOrigin())
      return Status(grpc::StatusCode::FAILED_PRECONDITION, "no origin set");
    engine_.setViewport(viewport);

    RenderResult result;
    if (request->preview()) {
      result = engine_.renderSync(true);
    } else {
      engine_.requestRender();
      if (!engine_.waitForCompletion(renderTimeout_))
        return Status(grpc::StatusCode::DEADLINE_EXCEEDED,
                      "render did not complete in time");
      result = engine_.image();
    }

    reply->set_pixels(result.pixels.data(), result.pixels.size());
    reply->set_width(result.width);
    reply->set_height(result.height);
    reply->set_is_preview(result.isPreview);
    reply->set_sequence(result.sequence);
  } catch (const ConfigurationError &e) {
    return Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
  } catch (const std::logic_error &e) {
    return Status(grpc::StatusCode::FAILED_PRECONDITION, e.what());
  }
  return Status::OK;
}

Status IsochroneServiceImpl::SetLayers(ServerContext *context,
                                       const LayersRequest *request,
                                       LayersResponse *reply) {
  std::lock_guard<std::mutex> lock(mutex_);
  engine_.setWalkingEnabled(request->walking_enabled());
  engine_.setBuildingsEnabled(request->buildings_enabled());

  reply->set_walking_loaded(engine_.walking().isLoaded());
  reply->set_water_loaded(engine_.water().isLoaded());
  reply->set_buildings_loaded(engine_.buildings().isLoaded());
  return Status::OK;
}
