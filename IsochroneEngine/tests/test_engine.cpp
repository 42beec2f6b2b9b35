#include <boost/test/unit_test.hpp>

#include "errors.hpp"
#include "isochrone_engine.hpp"
#include <stdexcept>

namespace {
// Two stations 1.1 km apart with a 60 s ride between them.
GraphDataset lineDataset() {
  GraphDataset ds;
  ds.nodes = {{"A", 0.0, 0.0}, {"B", 0.0, 0.01}, {"far", 2.0, 2.0}};
  ds.edges = {{0, 1, 60.0}, {1, 0, 60.0}};
  return ds;
}

Viewport view() {
  Viewport vp;
  vp.bounds = {0.01, -0.01, 0.02, -0.005};
  vp.width = 80;
  vp.height = 60;
  return vp;
}

EngineConfig syncConfig() {
  EngineConfig config;
  config.useWorker = false;
  return config;
}
} // namespace

BOOST_AUTO_TEST_SUITE(engine)

BOOST_AUTO_TEST_CASE(network_times_follow_the_origin) {
  IsochroneEngine engine(syncConfig());
  engine.loadTransitDatasets({lineDataset()});
  BOOST_CHECK_EQUAL(engine.transit().nodeCount(), 3u);

  engine.setOrigin(0.0, 0.0);
  const NetworkTimes &times = engine.networkTimes();
  BOOST_CHECK_EQUAL(times.at(0), TRANSFER_PENALTY);
  BOOST_CHECK_EQUAL(times.at(1), TRANSFER_PENALTY + 60.0 + STOP_PENALTY);
  BOOST_CHECK_EQUAL(times.count(2), 0u);

  BOOST_CHECK_THROW(engine.setOrigin(95.0, 0.0), ConfigurationError);
}

BOOST_AUTO_TEST_CASE(travel_time_queries) {
  IsochroneEngine engine(syncConfig());
  engine.loadTransitDatasets({lineDataset()});
  BOOST_CHECK_EQUAL(engine.getTravelTime(0.0, 0.0), INF);

  engine.setOrigin(0.0, 0.0);
  BOOST_CHECK_EQUAL(engine.getTravelTime(0.0, 0.0), 0.0);

  // At B: walking 1.1 km (14.3 min) loses to the ride (6.25 min).
  BOOST_CHECK_CLOSE(engine.getTravelTime(0.0, 0.01), 375.0 / 60.0, 1e-6);
}

BOOST_AUTO_TEST_CASE(synchronous_render) {
  IsochroneEngine engine(syncConfig());
  BOOST_CHECK(engine.isSynchronous());
  engine.loadTransitDatasets({lineDataset()});
  BOOST_CHECK_THROW(engine.requestRender(), std::logic_error);

  engine.setOrigin(0.0, 0.0);
  engine.setViewport(view());
  uint64_t sequence = engine.requestRender();
  BOOST_CHECK(engine.state() == RenderState::Complete);
  BOOST_CHECK_EQUAL(engine.image().sequence, sequence);
  BOOST_CHECK(!engine.image().isPreview);
  BOOST_CHECK_EQUAL(engine.image().width, 80);
  BOOST_CHECK_EQUAL(engine.progress(), 100);
}

BOOST_AUTO_TEST_CASE(preview_then_full_on_the_worker) {
  IsochroneEngine engine;
  BOOST_REQUIRE(!engine.isSynchronous());
  engine.loadTransitDatasets({lineDataset()});
  engine.setOrigin(0.0, 0.0);
  engine.setViewport(view());

  engine.requestRender();
  BOOST_CHECK(engine.state() == RenderState::Preview);
  BOOST_REQUIRE(engine.waitForCompletion(std::chrono::seconds(10)));
  BOOST_CHECK(engine.state() == RenderState::Complete);
  BOOST_CHECK(!engine.image().isPreview);
  BOOST_CHECK(engine.image().ok());
  BOOST_CHECK_EQUAL(engine.image().sequence, engine.latestSequence());
}

BOOST_AUTO_TEST_CASE(newer_requests_supersede_older_ones) {
  IsochroneEngine engine;
  engine.loadTransitDatasets({lineDataset()});
  engine.setOrigin(0.0, 0.0);
  engine.setViewport(view());

  engine.requestRender();
  engine.requestRender(false);
  uint64_t last = engine.requestRender(false);
  BOOST_REQUIRE(engine.waitForCompletion(std::chrono::seconds(10)));
  BOOST_CHECK_EQUAL(engine.image().sequence, last);
  BOOST_CHECK(!engine.pump());
}

BOOST_AUTO_TEST_CASE(worker_failure_falls_back_to_calling_thread) {
  IsochroneEngine engine(
      EngineConfig(), std::make_shared<MemoryDatasetCache>(),
      [](const RenderRequest &, const ProgressCallback &) -> RenderResult {
        throw std::runtime_error("worker crashed");
      });
  engine.loadTransitDatasets({lineDataset()});
  engine.setOrigin(0.0, 0.0);
  engine.setViewport(view());

  engine.requestRender();
  BOOST_REQUIRE(engine.waitForCompletion(std::chrono::seconds(10)));
  BOOST_CHECK(engine.image().ok());
  BOOST_CHECK(!engine.image().isPreview);
  BOOST_CHECK_EQUAL(engine.image().pixels.size(), 80u * 60u * 4u);
}

BOOST_AUTO_TEST_CASE(failed_transit_load_keeps_the_graph) {
  IsochroneEngine engine(syncConfig());
  engine.loadTransitDatasets({lineDataset()});

  GraphDataset bad;
  bad.nodes = {{"X", 100.0, 0.0}};
  BOOST_CHECK_THROW(engine.loadTransitDatasets({lineDataset(), bad}), DataError);
  BOOST_CHECK_EQUAL(engine.transit().nodeCount(), 3u);

  BOOST_CHECK(!engine.loadTransitFiles({"does/not/exist.json"}));
  BOOST_CHECK_EQUAL(engine.transit().nodeCount(), 3u);
}

BOOST_AUTO_TEST_CASE(bidirectional_option_mirrors_edges) {
  GraphDataset oneWay;
  oneWay.nodes = {{"A", 0.0, 0.0}, {"B", 0.0, 0.01}};
  oneWay.edges = {{0, 1, 60.0}};

  EngineConfig config = syncConfig();
  config.edgeDirection = EdgeDirection::Bidirectional;
  IsochroneEngine engine(config);
  engine.loadTransitDatasets({oneWay});
  engine.setOrigin(0.0, 0.01);
  BOOST_CHECK_EQUAL(engine.networkTimes().at(0),
                    TRANSFER_PENALTY + 60.0 + STOP_PENALTY);
}

BOOST_AUTO_TEST_CASE(render_request_snapshot) {
  GraphDataset ds = lineDataset();
  ds.edges.push_back({1, 2, 600.0});
  IsochroneEngine engine(syncConfig());
  engine.loadTransitDatasets({ds});
  engine.setOrigin(0.0, 0.0);
  engine.setViewport(view());
  BOOST_CHECK_EQUAL(engine.networkTimes().size(), 3u);
  engine.setObstacles(ObstacleKind::Water,
                      {{{0.005, 0.0}, {0.005, 0.01}, {0.008, 0.01}, {0.008, 0.0}}});

  RenderRequest preview = engine.buildRequest(true);
  BOOST_CHECK_EQUAL(preview.pixelSize, PREVIEW_PIXEL_SIZE);
  BOOST_CHECK(!preview.obstacles);
  // The far station is reached but lies outside the viewport margin.
  BOOST_CHECK_EQUAL(preview.activeStations.size(), 2u);

  RenderRequest full = engine.buildRequest(false);
  BOOST_CHECK_EQUAL(full.pixelSize, DEFAULT_PIXEL_SIZE);
  BOOST_REQUIRE(full.obstacles);
  BOOST_CHECK(full.obstacles->blockedCount() > 0);

  // Buildings stay off until enabled.
  size_t waterOnly = full.obstacles->blockedCount();
  engine.setObstacles(ObstacleKind::Buildings,
                      {{{-0.005, -0.004}, {-0.005, 0.0}, {-0.002, 0.0}, {-0.002, -0.004}}});
  BOOST_CHECK_EQUAL(engine.buildRequest(false).obstacles->blockedCount(), waterOnly);
  engine.setBuildingsEnabled(true);
  BOOST_CHECK(engine.buildRequest(false).obstacles->blockedCount() > waterOnly);
}

BOOST_AUTO_TEST_CASE(walking_network_feeds_the_renderer) {
  IsochroneEngine engine(syncConfig());
  engine.loadTransitDatasets({lineDataset()});

  GraphDataset street;
  street.nodes = {{"0", 0.0, 0.0}, {"1", 0.0, 0.0005}, {"2", 0.0, 0.001}};
  street.edges = {{0, 1, 40.0}, {1, 2, 40.0}, {1, 0, 40.0}, {2, 1, 40.0}};
  engine.loadWalkingDataset(street);
  engine.setOrigin(0.0, 0.0);
  engine.setViewport(view());
  BOOST_CHECK(engine.walking().isActive());

  RenderRequest req = engine.buildRequest(false);
  BOOST_REQUIRE(req.walkingGrid);
  BOOST_CHECK_EQUAL(req.walkingGrid->size, WALKING_GRID_SIZE);
  BOOST_CHECK_CLOSE(engine.getTravelTime(0.0, 0.001), 80.0 / 60.0, 1e-6);

  engine.setWalkingEnabled(false);
  BOOST_CHECK(!engine.buildRequest(false).walkingGrid);
}

BOOST_AUTO_TEST_SUITE_END()
