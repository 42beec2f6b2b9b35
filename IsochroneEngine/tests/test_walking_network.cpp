#include <boost/test/unit_test.hpp>

#include "errors.hpp"
#include "walking_network.hpp"

namespace {
const double STEP_DEG = 0.00045; // ~50 m on the equator

// Straight street along the equator, both directions listed explicitly.
GraphDataset streetDataset(int count) {
  GraphDataset ds;
  for (int i = 0; i < count; ++i)
    ds.nodes.push_back({std::to_string(i), 0.0, i * STEP_DEG});
  for (int i = 0; i + 1 < count; ++i) {
    double seconds = haversine(0.0, i * STEP_DEG, 0.0, (i + 1) * STEP_DEG) /
                     WALK_SPEED_MPS;
    ds.edges.push_back({static_cast<size_t>(i), static_cast<size_t>(i + 1), seconds});
    ds.edges.push_back({static_cast<size_t>(i + 1), static_cast<size_t>(i), seconds});
  }
  return ds;
}
} // namespace

BOOST_AUTO_TEST_SUITE(walking_network)

BOOST_AUTO_TEST_CASE(not_loaded_returns_nothing) {
  WalkingNetwork net;
  BOOST_CHECK(!net.isLoaded());
  BOOST_CHECK(!net.findNearestNode(0.0, 0.0, 500.0).found());
  BOOST_CHECK(!net.computeFromOrigin(0.0, 0.0));
  BOOST_CHECK_EQUAL(net.getWalkingTime(0.0, 0.0), INF);
}

BOOST_AUTO_TEST_CASE(nearest_node) {
  WalkingNetwork net;
  net.load(streetDataset(10));

  NearestNode n = net.findNearestNode(0.0001, 3 * STEP_DEG + 0.0001, 500.0);
  BOOST_REQUIRE(n.found());
  BOOST_CHECK_EQUAL(net.graph().GetNode(n.id)->key, "3");
  BOOST_CHECK(n.distance < 20.0);

  // 2 km north of the street: nothing within 500 m.
  BOOST_CHECK(!net.findNearestNode(0.018, 0.001, 500.0).found());
  BOOST_CHECK(net.findNearestNode(0.018, 0.001, 2500.0).found());
}

// Away from longitude 0 the grid cells shift sideways with latitude.
BOOST_AUTO_TEST_CASE(nearest_node_at_high_longitude) {
  const double lat = -33.87, lon = 151.2;

  GraphDataset north;
  north.nodes = {{"north", -33.865683, lon}};
  WalkingNetwork single;
  single.load(north);
  NearestNode n = single.findNearestNode(lat, lon, 500.0);
  BOOST_REQUIRE(n.found());
  BOOST_CHECK_CLOSE(n.distance, 480.0, 0.1);

  GraphDataset pair;
  pair.nodes = {{"A", -33.866403, lon}, {"B", lat, 151.204874}};
  WalkingNetwork net;
  net.load(pair);
  n = net.findNearestNode(lat, lon, 1000.0);
  BOOST_REQUIRE(n.found());
  BOOST_CHECK_EQUAL(net.graph().GetNode(n.id)->key, "A");
  BOOST_CHECK_CLOSE(n.distance, 400.0, 0.1);
  BOOST_CHECK(!net.findNearestNode(lat, lon, 390.0).found());
}

BOOST_AUTO_TEST_CASE(walking_times_from_origin) {
  WalkingNetwork net;
  net.load(streetDataset(10));
  BOOST_REQUIRE(net.computeFromOrigin(0.0, 0.0));
  BOOST_CHECK_EQUAL(net.reachedCount(), 10u);
  BOOST_CHECK(net.isActive());

  double expected = haversine(0.0, 0.0, 0.0, 6 * STEP_DEG) / WALK_SPEED_MPS;
  BOOST_CHECK_CLOSE(net.getWalkingTime(0.0, 6 * STEP_DEG), expected, 1e-6);

  // Off the network by ~11 m: adds the last-mile walk.
  double offset = net.getWalkingTime(0.0001, 6 * STEP_DEG);
  BOOST_CHECK(offset > expected);
  BOOST_CHECK(offset < expected + 20.0 / WALK_SPEED_MPS);
}

BOOST_AUTO_TEST_CASE(origin_cache_and_toggle) {
  WalkingNetwork net;
  net.load(streetDataset(5));
  BOOST_CHECK(net.computeFromOrigin(0.0, 0.0));
  // Within the epsilon: cached result.
  BOOST_CHECK(net.computeFromOrigin(0.00005, 0.00005));
  BOOST_CHECK_EQUAL(net.reachedCount(), 5u);

  net.setEnabled(false);
  BOOST_CHECK(!net.isActive());
  BOOST_CHECK_EQUAL(net.getWalkingTime(0.0, 0.0), INF);
  BOOST_CHECK(!net.computeFromOrigin(0.0, 0.0));
  net.setEnabled(true);
  BOOST_CHECK(net.getWalkingTime(0.0, 0.0) < INF);
}

BOOST_AUTO_TEST_CASE(time_ceiling_prunes_long_walks) {
  GraphDataset ds;
  ds.nodes = {{"a", 0.0, 0.0}, {"b", 0.0, 0.0005}, {"c", 0.0, 0.001}};
  ds.edges = {{0, 1, 3000.0}, {1, 2, 700.0}};
  WalkingNetwork net;
  net.load(ds);
  BOOST_REQUIRE(net.computeFromOrigin(0.0, 0.0));
  BOOST_CHECK_EQUAL(net.reachedCount(), 2u);
  BOOST_CHECK(net.getWalkingTime(0.0, 0.0005) < INF);
  BOOST_CHECK_EQUAL(net.getWalkingTime(0.0, 0.001), INF);
}

BOOST_AUTO_TEST_CASE(origin_far_from_network) {
  WalkingNetwork net;
  net.load(streetDataset(5));
  BOOST_CHECK(!net.computeFromOrigin(1.0, 1.0));
  BOOST_CHECK(!net.isActive());
}

BOOST_AUTO_TEST_CASE(failed_load_keeps_previous_network) {
  WalkingNetwork net;
  net.load(streetDataset(5));
  GraphDataset bad;
  bad.nodes = {{"x", 0.0, 0.0}};
  bad.edges = {{0, 3, 10.0}};
  BOOST_CHECK_THROW(net.load(bad), DataError);
  BOOST_CHECK(net.isLoaded());
  BOOST_CHECK_EQUAL(net.nodeCount(), 5u);
}

BOOST_AUTO_TEST_CASE(sampled_grid) {
  WalkingNetwork net;
  net.load(streetDataset(10));
  Bounds view{0.002, -0.002, 0.005, -0.001};
  BOOST_CHECK(net.sampleGrid(view) == nullptr); // no origin yet

  net.computeFromOrigin(0.0, 0.0);
  auto grid = net.sampleGrid(view, 20);
  BOOST_REQUIRE(grid);
  BOOST_CHECK_EQUAL(grid->size, 20);
  BOOST_CHECK_EQUAL(grid->data.size(), 400u);

  // Cells on the street have data; the lookup matches the network.
  double onStreet = grid->lookup(0.0, 2 * STEP_DEG);
  BOOST_CHECK(onStreet < INF);
  BOOST_CHECK(grid->lookup(1.0, 1.0) == INF);
  BOOST_CHECK_THROW(net.sampleGrid(view, 0), ConfigurationError);
}

BOOST_AUTO_TEST_SUITE_END()
