#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "errors.hpp"
#include "isochrone_engine.hpp"
#include "service_impl.hpp"
#include <grpcpp/grpcpp.h>

using grpc::Server;
using grpc::ServerBuilder;

namespace {
std::string envOr(const char *name, const std::string &fallback) {
  if (const char *env_p = std::getenv(name))
    return env_p;
  return fallback;
}

std::vector<std::string> splitList(const std::string &value) {
  std::vector<std::string> items;
  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty())
      items.push_back(item);
  }
  return items;
}

EngineConfig configFromEnvironment() {
  EngineConfig config;
  std::string edges = envOr("ISOCHRONE_EDGES", "directed");
  if (edges == "bidirectional")
    config.edgeDirection = EdgeDirection::Bidirectional;
  else if (edges != "directed")
    throw ConfigurationError("ISOCHRONE_EDGES must be directed or bidirectional");

  try {
    config.pixelSize = std::stoi(envOr("ISOCHRONE_PIXEL_SIZE", "2"));
    config.maxTimeMinutes = std::stod(envOr("ISOCHRONE_MAX_MINUTES", "30"));
  } catch (const std::logic_error &e) {
    throw ConfigurationError(std::string("invalid numeric setting: ") + e.what());
  }
  config.validate();
  return config;
}
} // namespace

void RunServer() {
  std::string server_address = envOr("ISOCHRONE_ADDRESS", "0.0.0.0:50051");

  EngineConfig config;
  try {
    config = configFromEnvironment();
  } catch (const ConfigurationError &e) {
    std::cerr << "[Server] " << e.what() << std::endl;
    std::exit(1);
  }

  IsochroneEngine engine(config);

  // Rail and bus datasets merge into one graph before transfers are built.
  std::string transitPaths = envOr("ISOCHRONE_TRANSIT", "transit_data/transit.json");
  if (!engine.loadTransitFiles(splitList(transitPaths),
                               envOr("ISOCHRONE_ROUTES", ""))) {
    std::cerr << "Failed to load transit data from: " << transitPaths
              << std::endl;
    std::cerr << "Ensure ISOCHRONE_TRANSIT lists graph JSON files (comma "
                 "separated)."
              << std::endl;
    std::exit(1);
  }

  // Optional layers; the engine degrades to straight-line walking without
  // them.
  std::string walkingPath = envOr("ISOCHRONE_WALKING", "");
  if (!walkingPath.empty())
    engine.loadWalkingFile(walkingPath);
  std::string waterPath = envOr("ISOCHRONE_WATER", "");
  if (!waterPath.empty())
    engine.loadObstacleFile(waterPath, ObstacleKind::Water);
  std::string buildingsPath = envOr("ISOCHRONE_BUILDINGS", "");
  if (!buildingsPath.empty())
    engine.loadObstacleFile(buildingsPath, ObstacleKind::Buildings);

  IsochroneServiceImpl service(engine);

  ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);

  std::unique_ptr<Server> server(builder.BuildAndStart());
  if (!server) {
    std::cerr << "[Server] Could not listen on " << server_address << std::endl;
    std::exit(1);
  }
  std::cout << "Server listening on " << server_address << std::endl;
  std::cout << "Graph loaded with " << engine.transit().nodeCount()
            << " stations"
            << (engine.isSynchronous() ? " (synchronous rendering)." : ".")
            << std::endl;

  server->Wait();
}

int main(int argc, char **argv) {
  RunServer();
  return 0;
}
