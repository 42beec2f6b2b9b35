#ifndef ISOCHRONE_ENGINE_HPP
#define ISOCHRONE_ENGINE_HPP

#include "dataset_loader.hpp"
#include "network_propagator.hpp"
#include "obstacle_mask.hpp"
#include "render_worker.hpp"
#include "transit_graph.hpp"
#include "walking_network.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

struct EngineConfig {
  double walkSpeed = WALK_SPEED_MPS;
  double transferPenalty = TRANSFER_PENALTY;
  double stopPenalty = STOP_PENALTY;
  double transferDistance = TRANSFER_DISTANCE;
  double entryRadius = ENTRY_RADIUS;
  int pixelSize = DEFAULT_PIXEL_SIZE;
  int previewPixelSize = PREVIEW_PIXEL_SIZE;
  double opacity = DEFAULT_OPACITY;
  double maxTimeMinutes = DEFAULT_MAX_TIME_MINUTES;
  EdgeDirection edgeDirection = EdgeDirection::Directed;
  bool useWorker = true;

  // Throws ConfigurationError.
  void validate() const;
};

enum class RenderState { Idle, Preview, Full, Complete };

std::string renderStateToString(RenderState state);

// Controller: owns the datasets, recomputes network times on origin changes
// and drives preview/full renders through the worker.
class IsochroneEngine {
public:
  explicit IsochroneEngine(
      EngineConfig config = EngineConfig(),
      std::shared_ptr<DatasetCache> cache = std::make_shared<MemoryDatasetCache>(),
      RenderFunction workerRender = IsochroneRasterizer::Render);
  ~IsochroneEngine();

  // --- Datasets ---
  // Builds a new transit graph from every dataset (plus optional route
  // relations) and generates transfer edges. DataError leaves the current
  // graph in place.
  void loadTransitDatasets(const std::vector<GraphDataset> &datasets,
                           const RouteTopology *routes = nullptr);
  // File variants log failures and return false instead of throwing.
  bool loadTransitFiles(const std::vector<std::string> &paths,
                        const std::string &routesPath = "");
  void loadWalkingDataset(const GraphDataset &dataset);
  bool loadWalkingFile(const std::string &path);
  void setObstacles(ObstacleKind kind, std::vector<Polygon> polygons);
  bool loadObstacleFile(const std::string &path, ObstacleKind kind);

  void setWalkingEnabled(bool enabled);
  void setBuildingsEnabled(bool enabled);

  // --- Interaction ---
  void setOrigin(double lat, double lon);
  bool hasOrigin() const { return hasOrigin_; }
  GeoPoint origin() const { return origin_; }

  void setViewport(const Viewport &viewport);
  bool hasViewport() const { return hasViewport_; }

  // Minutes from the origin, INF when unknown.
  double getTravelTime(double lat, double lon) const;

  // Starts a new render pipeline (preview first unless withPreview is false).
  // Returns the sequence of the submitted request.
  uint64_t requestRender(bool withPreview = true);
  // Applies queued worker responses. Returns true when a new image was
  // accepted.
  bool pump();
  bool waitForCompletion(std::chrono::milliseconds timeout);
  // Renders on the calling thread.
  RenderResult renderSync(bool preview);

  RenderRequest buildRequest(bool preview) const;

  RenderState state() const { return state_; }
  int progress() const { return progress_; }
  bool isSynchronous() const { return !worker_ || !worker_->isRunning(); }
  const RenderResult &image() const { return image_; }
  uint64_t latestSequence() const { return latestSequence_; }

  const TransitGraph &transit() const { return transit_; }
  const WalkingNetwork &walking() const { return walking_; }
  const ObstacleMask &water() const { return water_; }
  const ObstacleMask &buildings() const { return buildings_; }
  const NetworkTimes &networkTimes() const { return times_; }
  const EngineConfig &config() const { return config_; }

private:
  void propagate();
  void submit(bool preview);
  bool accept(RenderResult result);
  std::vector<StationTime> activeStations() const;
  std::shared_ptr<const ObstacleRaster> obstacleRaster() const;
  std::shared_ptr<const WalkingGrid> walkingGrid() const;
  void invalidateRender();

  EngineConfig config_;
  DatasetLoader loader_;

  TransitGraph transit_;
  WalkingNetwork walking_;
  ObstacleMask water_;
  ObstacleMask buildings_;
  NetworkTimes times_;

  bool hasOrigin_ = false;
  GeoPoint origin_{0, 0};
  bool hasViewport_ = false;
  Viewport viewport_;

  // Per-viewport snapshots, rebuilt lazily.
  mutable std::shared_ptr<const ObstacleRaster> raster_;
  mutable std::shared_ptr<const WalkingGrid> walkingGrid_;

  std::unique_ptr<RenderWorker> worker_;
  RenderState state_ = RenderState::Idle;
  RenderResult image_;
  std::atomic<uint64_t> latestSequence_{0};
  std::atomic<int> progress_{0};
};

#endif // ISOCHRONE_ENGINE_HPP
