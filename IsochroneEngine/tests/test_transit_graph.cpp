#include <boost/test/unit_test.hpp>

#include "errors.hpp"
#include "transit_graph.hpp"
#include <algorithm>

namespace {
// Degrees of longitude on the equator covering `meters`.
double lonForMeters(double meters) { return meters / 111194.9266; }

const EntryNode *findEntry(const std::vector<EntryNode> &entries, NodeID id) {
  auto it = std::find_if(entries.begin(), entries.end(),
                         [id](const EntryNode &e) { return e.id == id; });
  return it == entries.end() ? nullptr : &*it;
}
} // namespace

BOOST_AUTO_TEST_SUITE(transit_graph)

BOOST_AUTO_TEST_CASE(add_node_is_idempotent) {
  TransitGraph g;
  NodeID a = g.addNode("A", 1.0, 2.0);
  NodeID again = g.addNode("A", 5.0, 6.0);
  BOOST_CHECK_EQUAL(a, again);
  BOOST_CHECK_EQUAL(g.nodeCount(), 1u);
  BOOST_CHECK_EQUAL(g.stations().size(), 1u);
  BOOST_CHECK_EQUAL(g.graph().GetNode(a)->lat, 1.0);
  BOOST_CHECK_EQUAL(g.graph().getNodeId("A"), a);
  BOOST_CHECK_EQUAL(g.graph().getNodeId("missing"), -1);
}

BOOST_AUTO_TEST_CASE(add_edge_uses_distance_over_speed_both_ways) {
  TransitGraph g;
  NodeID a = g.addNode("A", 0.0, 0.0);
  NodeID b = g.addNode("B", 0.0, 0.001);
  BOOST_CHECK(g.addEdge(a, b, 8.3));

  double expected = haversine(0.0, 0.0, 0.0, 0.001) / 8.3;
  const Edge *ab = g.graph().findEdge(a, b);
  const Edge *ba = g.graph().findEdge(b, a);
  BOOST_REQUIRE(ab && ba);
  BOOST_CHECK_CLOSE(ab->weight, expected, 1e-9);
  BOOST_CHECK_CLOSE(ba->weight, expected, 1e-9);

  BOOST_CHECK(!g.addEdge(a, 42, 8.3));
  BOOST_CHECK_THROW(g.addEdge(a, b, 0.0), ConfigurationError);
  BOOST_CHECK_THROW(g.addWeightedEdge(a, b, -1.0, true), ConfigurationError);
}

BOOST_AUTO_TEST_CASE(transfer_edge_between_close_stations) {
  TransitGraph g;
  NodeID a = g.addNode("A", 0.0, 0.0);
  NodeID b = g.addNode("B", 0.0, lonForMeters(150.0));

  int added = g.generateTransferEdges(200.0);
  BOOST_CHECK_EQUAL(added, 2);

  const Edge *ab = g.graph().findEdge(a, b);
  const Edge *ba = g.graph().findEdge(b, a);
  BOOST_REQUIRE(ab && ba);
  BOOST_CHECK_CLOSE(ab->weight, 115.4, 0.1);
  BOOST_CHECK_CLOSE(ba->weight, ab->weight, 1e-9);
}

BOOST_AUTO_TEST_CASE(transfer_edges_skip_distant_stations) {
  TransitGraph g;
  NodeID a = g.addNode("A", 0.0, 0.0);
  NodeID b = g.addNode("B", 0.0, lonForMeters(300.0));
  BOOST_CHECK_EQUAL(g.generateTransferEdges(200.0), 0);
  BOOST_CHECK(g.graph().findEdge(a, b) == nullptr);
}

BOOST_AUTO_TEST_CASE(transfer_never_overwrites_a_faster_edge) {
  TransitGraph g;
  NodeID a = g.addNode("A", 0.0, 0.0);
  NodeID b = g.addNode("B", 0.0, lonForMeters(150.0));
  g.addWeightedEdge(a, b, 10.0, true);
  g.addWeightedEdge(b, a, 1000.0, true);

  g.generateTransferEdges(200.0);
  BOOST_CHECK_EQUAL(g.graph().findEdge(a, b)->weight, 10.0);
  // The slower edge is improved to walking time.
  BOOST_CHECK_CLOSE(g.graph().findEdge(b, a)->weight, 115.4, 0.1);
}

BOOST_AUTO_TEST_CASE(transfer_edges_between_colocated_stations) {
  TransitGraph g;
  NodeID a = g.addNode("platform-1", 51.5, -0.12);
  NodeID b = g.addNode("platform-2", 51.5, -0.12);
  g.generateTransferEdges();
  BOOST_REQUIRE(g.graph().findEdge(a, b));
  BOOST_CHECK_EQUAL(g.graph().findEdge(a, b)->weight, 0.0);
  BOOST_CHECK(g.graph().findEdge(a, a) == nullptr);
}

BOOST_AUTO_TEST_CASE(entry_nodes_within_radius) {
  TransitGraph g;
  NodeID near = g.addNode("near", 0.0, lonForMeters(1500.0));
  NodeID far = g.addNode("far", 0.0, lonForMeters(2500.0));

  auto entries = g.findEntryNodes(0.0, 0.0);
  BOOST_CHECK_EQUAL(entries.size(), 1u);
  const EntryNode *e = findEntry(entries, near);
  BOOST_REQUIRE(e);
  BOOST_CHECK_CLOSE(e->walkSeconds, 1500.0 / WALK_SPEED_MPS, 0.01);
  BOOST_CHECK(findEntry(entries, far) == nullptr);

  BOOST_CHECK_THROW(g.findEntryNodes(0.0, 0.0, -1.0), ConfigurationError);
}

BOOST_AUTO_TEST_CASE(dataset_direction_option) {
  GraphDataset ds;
  ds.nodes = {{"A", 0.0, 0.0}, {"B", 0.0, 0.01}};
  ds.edges = {{0, 1, 60.0}};

  TransitGraph directed;
  directed.loadDataset(ds, EdgeDirection::Directed);
  BOOST_CHECK(directed.graph().findEdge(0, 1) != nullptr);
  BOOST_CHECK(directed.graph().findEdge(1, 0) == nullptr);

  TransitGraph both;
  both.loadDataset(ds, EdgeDirection::Bidirectional);
  BOOST_REQUIRE(both.graph().findEdge(1, 0));
  BOOST_CHECK_EQUAL(both.graph().findEdge(1, 0)->weight, 60.0);
}

BOOST_AUTO_TEST_CASE(invalid_dataset_leaves_graph_untouched) {
  TransitGraph g;
  g.addNode("existing", 1.0, 1.0);

  GraphDataset bad;
  bad.nodes = {{"A", 0.0, 0.0}};
  bad.edges = {{0, 5, 60.0}};
  BOOST_CHECK_THROW(g.loadDataset(bad, EdgeDirection::Directed), DataError);

  GraphDataset negative;
  negative.nodes = {{"A", 0.0, 0.0}, {"B", 0.0, 0.01}};
  negative.edges = {{0, 1, -3.0}};
  BOOST_CHECK_THROW(g.loadDataset(negative, EdgeDirection::Directed), DataError);

  BOOST_CHECK_EQUAL(g.nodeCount(), 1u);
  BOOST_CHECK_EQUAL(g.edgeCount(), 0u);
}

BOOST_AUTO_TEST_CASE(merging_datasets_shares_stations) {
  GraphDataset rail;
  rail.nodes = {{"hub", 0.0, 0.0}, {"r1", 0.0, 0.02}};
  rail.edges = {{0, 1, 120.0}};
  GraphDataset bus;
  bus.nodes = {{"hub", 0.0, 0.0}, {"b1", 0.02, 0.0}};
  bus.edges = {{0, 1, 300.0}};

  TransitGraph g;
  g.loadDataset(rail, EdgeDirection::Directed);
  g.loadDataset(bus, EdgeDirection::Directed);
  BOOST_CHECK_EQUAL(g.nodeCount(), 3u);
  NodeID hub = g.graph().getNodeId("hub");
  BOOST_CHECK_EQUAL(g.graph().GetNode(hub)->outgoing.size(), 2u);
}

BOOST_AUTO_TEST_CASE(route_relations_chain_members) {
  RouteTopology topology;
  topology.nodes = {{"1", 0.0, 0.0}, {"2", 0.0, 0.01}, {"3", 0.0, 0.02}};
  topology.routes = {{"1", "2", "3"}, {"3", "unknown"}};

  TransitGraph g;
  g.loadRouteRelations(topology);
  BOOST_CHECK_EQUAL(g.nodeCount(), 3u);
  NodeID n1 = g.graph().getNodeId("1");
  NodeID n2 = g.graph().getNodeId("2");
  NodeID n3 = g.graph().getNodeId("3");
  BOOST_REQUIRE(g.graph().findEdge(n1, n2));
  BOOST_CHECK(g.graph().findEdge(n2, n1) != nullptr);
  BOOST_CHECK(g.graph().findEdge(n2, n3) != nullptr);
  BOOST_CHECK(g.graph().findEdge(n1, n3) == nullptr);
  BOOST_CHECK_CLOSE(g.graph().findEdge(n1, n2)->weight,
                    haversine(0.0, 0.0, 0.0, 0.01) / TRANSIT_SPEED_MPS, 1e-9);
}

BOOST_AUTO_TEST_SUITE_END()
