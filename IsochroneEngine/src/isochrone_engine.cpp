#include "isochrone_engine.hpp"
#include "errors.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>

void EngineConfig::validate() const {
  if (!(walkSpeed > 0.0) || !std::isfinite(walkSpeed))
    throw ConfigurationError("config: walk speed must be positive");
  if (!(transferPenalty >= 0.0) || !(stopPenalty >= 0.0))
    throw ConfigurationError("config: penalties must be >= 0");
  if (!(transferDistance > 0.0))
    throw ConfigurationError("config: transfer distance must be positive");
  if (!(entryRadius >= 0.0))
    throw ConfigurationError("config: entry radius must be >= 0");
  if (pixelSize < 1 || previewPixelSize < 1)
    throw ConfigurationError("config: pixel size must be >= 1");
  if (!(opacity >= 0.0 && opacity <= 1.0))
    throw ConfigurationError("config: opacity must be within [0, 1]");
  if (!(maxTimeMinutes > 0.0) || !std::isfinite(maxTimeMinutes))
    throw ConfigurationError("config: max time must be positive");
}

std::string renderStateToString(RenderState state) {
  switch (state) {
  case RenderState::Idle:
    return "idle";
  case RenderState::Preview:
    return "preview";
  case RenderState::Full:
    return "full";
  case RenderState::Complete:
    return "complete";
  }
  return "unknown";
}

IsochroneEngine::IsochroneEngine(EngineConfig config,
                                 std::shared_ptr<DatasetCache> cache,
                                 RenderFunction workerRender)
    : config_(config), loader_(std::move(cache)), walking_(config.walkSpeed),
      water_(), buildings_(OBSTACLE_VIEW_MARGIN_DEG, false) {
  config_.validate();

  if (config_.useWorker) {
    worker_ = std::make_unique<RenderWorker>(std::move(workerRender));
    worker_->setProgressCallback([this](uint64_t sequence, int percent) {
      if (sequence == latestSequence_)
        progress_ = percent;
    });
    if (!worker_->start()) {
      worker_.reset();
      std::cerr << "[Engine] Render thread unavailable, rendering on the "
                   "calling thread."
                << std::endl;
    }
  }
}

IsochroneEngine::~IsochroneEngine() {
  if (worker_)
    worker_->stop();
}

// --- Datasets ---

void IsochroneEngine::loadTransitDatasets(
    const std::vector<GraphDataset> &datasets, const RouteTopology *routes) {
  TransitGraph next;
  for (const auto &dataset : datasets)
    next.loadDataset(dataset, config_.edgeDirection);
  if (routes)
    next.loadRouteRelations(*routes);
  next.generateTransferEdges(config_.transferDistance);

  transit_.swap(next);
  std::cout << "[Engine] Transit network ready: " << transit_.nodeCount()
            << " stations, " << transit_.edgeCount() << " edges." << std::endl;
  if (hasOrigin_)
    propagate();
}

bool IsochroneEngine::loadTransitFiles(const std::vector<std::string> &paths,
                                       const std::string &routesPath) {
  try {
    std::vector<GraphDataset> datasets;
    for (const auto &path : paths)
      datasets.push_back(loader_.LoadTransitGraph(path));
    if (routesPath.empty()) {
      loadTransitDatasets(datasets);
    } else {
      RouteTopology routes = loader_.LoadRouteRelations(routesPath);
      loadTransitDatasets(datasets, &routes);
    }
    return true;
  } catch (const DataError &e) {
    std::cerr << "[Engine] Transit data not loaded: " << e.what() << std::endl;
    return false;
  }
}

void IsochroneEngine::loadWalkingDataset(const GraphDataset &dataset) {
  walking_.load(dataset);
  walkingGrid_.reset();
  if (hasOrigin_)
    walking_.computeFromOrigin(origin_.lat, origin_.lon);
}

bool IsochroneEngine::loadWalkingFile(const std::string &path) {
  try {
    loadWalkingDataset(loader_.LoadWalkingGraph(path));
    return true;
  } catch (const DataError &e) {
    std::cerr << "[Engine] Walking network not available: " << e.what()
              << std::endl;
    return false;
  }
}

void IsochroneEngine::setObstacles(ObstacleKind kind,
                                   std::vector<Polygon> polygons) {
  ObstacleMask &mask = kind == ObstacleKind::Water ? water_ : buildings_;
  size_t count = polygons.size();
  mask.setPolygons(std::move(polygons));
  raster_.reset();
  std::cout << "[Engine] "
            << (kind == ObstacleKind::Water ? "Water" : "Building")
            << " mask loaded: " << count << " polygons." << std::endl;
}

bool IsochroneEngine::loadObstacleFile(const std::string &path,
                                       ObstacleKind kind) {
  try {
    setObstacles(kind, loader_.LoadObstacles(path, kind));
    return true;
  } catch (const DataError &e) {
    std::cerr << "[Engine] Obstacle data not available: " << e.what()
              << std::endl;
    return false;
  }
}

void IsochroneEngine::setWalkingEnabled(bool enabled) {
  walking_.setEnabled(enabled);
  walkingGrid_.reset();
  if (enabled && hasOrigin_)
    walking_.computeFromOrigin(origin_.lat, origin_.lon);
}

void IsochroneEngine::setBuildingsEnabled(bool enabled) {
  buildings_.setEnabled(enabled);
  raster_.reset();
}

// --- Interaction ---

void IsochroneEngine::setOrigin(double lat, double lon) {
  if (!std::isfinite(lat) || !std::isfinite(lon) || std::fabs(lat) > 90.0 ||
      std::fabs(lon) > 180.0)
    throw ConfigurationError("origin outside valid coordinates");
  origin_ = {lat, lon};
  hasOrigin_ = true;
  propagate();
}

void IsochroneEngine::propagate() {
  std::vector<EntryNode> entries = transit_.findEntryNodes(
      origin_.lat, origin_.lon, config_.entryRadius, config_.walkSpeed);
  times_ = NetworkTimePropagator::Propagate(
      transit_, entries, config_.transferPenalty, config_.stopPenalty);
  walking_.computeFromOrigin(origin_.lat, origin_.lon);
  walkingGrid_.reset();

  std::cout << "[Engine] Origin (" << origin_.lat << ", " << origin_.lon
            << "): " << entries.size() << " entry stations, " << times_.size()
            << " reachable." << std::endl;
}

void IsochroneEngine::setViewport(const Viewport &viewport) {
  viewport.validate();
  viewport_ = viewport;
  hasViewport_ = true;
  invalidateRender();
}

void IsochroneEngine::invalidateRender() {
  raster_.reset();
  walkingGrid_.reset();
}

double IsochroneEngine::getTravelTime(double lat, double lon) const {
  if (!hasOrigin_)
    return INF;

  double timeWalkDirect = walking_.getWalkingTime(lat, lon);
  if (timeWalkDirect == INF)
    timeWalkDirect =
        haversine(origin_.lat, origin_.lon, lat, lon) / config_.walkSpeed;

  double timeTransit = INF;
  const Graph &graph = transit_.graph();
  for (const auto &kv : times_) {
    const Node *node = graph.GetNode(kv.first);
    if (!node)
      continue;
    double total =
        kv.second + haversine(lat, lon, node->lat, node->lon) / config_.walkSpeed;
    timeTransit = std::min(timeTransit, total);
  }

  double best = std::min(timeWalkDirect, timeTransit);
  return best == INF ? INF : best / 60.0;
}

std::vector<StationTime> IsochroneEngine::activeStations() const {
  std::vector<StationTime> stations;
  const Bounds area = viewport_.bounds.expanded(STATION_VIEW_MARGIN_DEG);
  const Graph &graph = transit_.graph();
  for (const auto &kv : times_) {
    const Node *node = graph.GetNode(kv.first);
    if (node && area.contains(node->lat, node->lon))
      stations.push_back({node->lat, node->lon, kv.second});
  }
  return stations;
}

std::shared_ptr<const ObstacleRaster> IsochroneEngine::obstacleRaster() const {
  if (raster_)
    return raster_;
  bool water = water_.isLoaded();
  bool buildings = buildings_.isLoaded() && buildings_.isEnabled();
  if (!water && !buildings)
    return nullptr;

  auto raster = std::make_shared<ObstacleRaster>(viewport_.width, viewport_.height);
  water_.paint(viewport_, *raster);
  buildings_.paint(viewport_, *raster);
  raster_ = raster;
  return raster_;
}

std::shared_ptr<const WalkingGrid> IsochroneEngine::walkingGrid() const {
  if (!walkingGrid_ && walking_.isActive())
    walkingGrid_ = walking_.sampleGrid(viewport_.bounds);
  return walkingGrid_;
}

RenderRequest IsochroneEngine::buildRequest(bool preview) const {
  if (!hasOrigin_)
    throw std::logic_error("render requested before an origin was set");
  if (!hasViewport_)
    throw std::logic_error("render requested before a viewport was set");

  RenderRequest req;
  req.width = viewport_.width;
  req.height = viewport_.height;
  req.pixelSize = preview ? config_.previewPixelSize : config_.pixelSize;
  req.opacity = config_.opacity;
  req.maxTimeMinutes = config_.maxTimeMinutes;
  req.origin = origin_;
  req.bounds = viewport_.bounds;
  req.activeStations = activeStations();
  req.obstacles = preview ? nullptr : obstacleRaster();
  req.walkingGrid = walkingGrid();
  req.walkSpeed = config_.walkSpeed;
  req.isPreview = preview;
  req.sequence = latestSequence_;
  return req;
}

uint64_t IsochroneEngine::requestRender(bool withPreview) {
  if (isSynchronous()) {
    ++latestSequence_;
    accept(renderSync(false));
    return latestSequence_;
  }
  submit(withPreview);
  return latestSequence_;
}

void IsochroneEngine::submit(bool preview) {
  RenderRequest req = buildRequest(preview);
  req.sequence = ++latestSequence_;
  state_ = preview ? RenderState::Preview : RenderState::Full;
  progress_ = 0;
  worker_->submit(std::move(req));
}

RenderResult IsochroneEngine::renderSync(bool preview) {
  RenderRequest req = buildRequest(preview);
  uint64_t sequence = req.sequence;
  return IsochroneRasterizer::Render(req, [this, sequence](int percent) {
    if (sequence == latestSequence_)
      progress_ = percent;
  });
}

bool IsochroneEngine::accept(RenderResult result) {
  // Anything older than the latest request is stale.
  if (result.sequence != latestSequence_)
    return false;

  if (!result.ok()) {
    std::cerr << "[Engine] Render " << result.sequence
              << " failed on the worker (" << result.error
              << "), re-rendering on the calling thread." << std::endl;
    try {
      result = renderSync(result.isPreview);
    } catch (const std::exception &e) {
      std::cerr << "[Engine] Render " << latestSequence_
                << " failed: " << e.what() << std::endl;
      state_ = RenderState::Idle;
      return false;
    }
  }

  image_ = std::move(result);
  if (image_.isPreview && !isSynchronous()) {
    submit(false);
    return true;
  }
  state_ = RenderState::Complete;
  progress_ = 100;
  std::cout << "[Engine] Render " << image_.sequence << " complete ("
            << image_.width << "x" << image_.height << ")." << std::endl;
  return true;
}

bool IsochroneEngine::pump() {
  if (!worker_)
    return false;
  bool accepted = false;
  RenderResult result;
  while (worker_->poll(result))
    accepted = accept(std::move(result)) || accepted;
  return accepted;
}

bool IsochroneEngine::waitForCompletion(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (state_ != RenderState::Complete) {
    if (state_ == RenderState::Idle || isSynchronous())
      return false;
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0)
      return false;
    RenderResult result;
    if (worker_->waitResponse(result, remaining))
      accept(std::move(result));
  }
  return true;
}
