#include "dataset_loader.hpp"
#include "errors.hpp"
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>
#include <unordered_map>

using json = nlohmann::json;

namespace {

// Natural ids arrive as strings or integers.
std::string idToString(const json &id) {
  if (id.is_string())
    return id.get<std::string>();
  if (id.is_number_unsigned())
    return std::to_string(id.get<unsigned long long>());
  if (id.is_number_integer())
    return std::to_string(id.get<long long>());
  throw DataError("node id must be a string or an integer");
}

// Node index in an optimized edge; must be an integer that fits long long.
long long indexAt(const json &value) {
  if (value.is_number_unsigned()) {
    unsigned long long index = value.get<unsigned long long>();
    if (index > static_cast<unsigned long long>(
                    std::numeric_limits<long long>::max()))
      throw DataError("optimized edge index out of range");
    return static_cast<long long>(index);
  }
  if (value.is_number_integer())
    return value.get<long long>();
  throw DataError("optimized edge index must be an integer");
}

// [lat, lon]
GeoPoint pairToPoint(const json &pair) {
  if (!pair.is_array() || pair.size() < 2)
    throw DataError("expected a [lat, lon] pair");
  return {pair.at(0).get<double>(), pair.at(1).get<double>()};
}

// Overpass geometry: [{"lat": .., "lon": ..}, ...]
Polygon geometryToPolygon(const json &geometry) {
  Polygon poly;
  poly.reserve(geometry.size());
  for (const auto &p : geometry)
    poly.push_back({p.at("lat").get<double>(), p.at("lon").get<double>()});
  return poly;
}

LegacyFormat parseLegacy(const json &j) {
  LegacyFormat doc;
  for (const auto &n : j.at("nodes")) {
    doc.nodes.push_back({idToString(n.at("id")), n.at("lat").get<double>(),
                         n.at("lon").get<double>()});
  }
  if (!j.contains("edges"))
    return doc;
  for (const auto &e : j.at("edges")) {
    double time;
    if (e.contains("time"))
      time = e.at("time").get<double>();
    else if (e.contains("weight"))
      time = e.at("weight").get<double>();
    else
      throw DataError("legacy edge without time or weight");
    doc.edges.push_back({idToString(e.at("from")), idToString(e.at("to")), time});
  }
  return doc;
}

OptimizedFormat parseOptimized(const json &j) {
  OptimizedFormat doc;
  for (const auto &n : j.at("nodes"))
    doc.nodes.push_back(pairToPoint(n));
  if (!j.contains("edges"))
    return doc;
  for (const auto &e : j.at("edges")) {
    if (!e.is_array() || e.size() < 3)
      throw DataError("optimized edge must be [from, to, time]");
    doc.edges.push_back({indexAt(e.at(0)), indexAt(e.at(1)),
                         e.at(2).get<double>()});
  }
  return doc;
}

struct CanonicalizeVisitor {
  GraphDataset operator()(const LegacyFormat &doc) const {
    GraphDataset ds;
    std::unordered_map<std::string, size_t> index;
    for (const auto &n : doc.nodes) {
      if (index.count(n.id))
        continue;
      index[n.id] = ds.nodes.size();
      ds.nodes.push_back({n.id, n.lat, n.lon});
    }
    for (const auto &e : doc.edges) {
      auto from = index.find(e.from);
      auto to = index.find(e.to);
      if (from == index.end() || to == index.end())
        continue;
      ds.edges.push_back({from->second, to->second, e.time});
    }
    return ds;
  }

  GraphDataset operator()(const OptimizedFormat &doc) const {
    GraphDataset ds;
    ds.nodes.reserve(doc.nodes.size());
    for (size_t i = 0; i < doc.nodes.size(); ++i)
      ds.nodes.push_back({std::to_string(i), doc.nodes[i].lat, doc.nodes[i].lon});
    const long long count = static_cast<long long>(doc.nodes.size());
    for (const auto &e : doc.edges) {
      if (e.from < 0 || e.from >= count || e.to < 0 || e.to >= count)
        continue;
      ds.edges.push_back({static_cast<size_t>(e.from),
                          static_cast<size_t>(e.to), e.time});
    }
    return ds;
  }
};

size_t edgeCount(const GraphDocument &document) {
  return std::visit([](const auto &doc) { return doc.edges.size(); }, document);
}

} // namespace

// --- MemoryDatasetCache ---

bool MemoryDatasetCache::get(const std::string &key, std::string &bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = slots_.find(key);
  if (it == slots_.end())
    return false;
  if (std::chrono::steady_clock::now() >= it->second.expires) {
    slots_.erase(it);
    return false;
  }
  bytes = it->second.bytes;
  return true;
}

void MemoryDatasetCache::put(const std::string &key, const std::string &bytes,
                             std::chrono::seconds ttl) {
  std::lock_guard<std::mutex> lock(mutex_);
  slots_[key] = {bytes, std::chrono::steady_clock::now() + ttl};
}

size_t MemoryDatasetCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return slots_.size();
}

// --- DatasetLoader ---

DatasetLoader::DatasetLoader(std::shared_ptr<DatasetCache> cache)
    : cache_(std::move(cache)) {}

GraphDocument DatasetLoader::ParseGraphDocument(const std::string &text) {
  try {
    json j = json::parse(text);
    if (!j.is_object() || !j.contains("nodes"))
      throw DataError("graph dataset must be an object with nodes");
    if (j.contains("v") && j.at("v").is_number_integer() && j.at("v") == 2)
      return parseOptimized(j);
    return parseLegacy(j);
  } catch (const json::exception &e) {
    throw DataError(std::string("graph dataset: ") + e.what());
  }
}

GraphDataset DatasetLoader::Canonicalize(const GraphDocument &document) {
  GraphDataset ds = std::visit(CanonicalizeVisitor{}, document);
  size_t dropped = edgeCount(document) - ds.edges.size();
  if (dropped > 0)
    std::cout << "[Dataset] Dropped " << dropped
              << " edges referencing unknown nodes." << std::endl;
  return ds;
}

RouteTopology DatasetLoader::ParseRouteRelations(const std::string &text) {
  try {
    json j = json::parse(text);
    if (!j.is_object() || !j.contains("elements"))
      throw DataError("route relations must contain elements");

    RouteTopology topology;
    std::unordered_map<std::string, size_t> nodeIndex;
    for (const auto &el : j.at("elements")) {
      if (el.value("type", "") != "node")
        continue;
      std::string key = idToString(el.at("id"));
      if (nodeIndex.count(key))
        continue;
      nodeIndex[key] = topology.nodes.size();
      topology.nodes.push_back(
          {key, el.at("lat").get<double>(), el.at("lon").get<double>()});
    }

    for (const auto &el : j.at("elements")) {
      if (el.value("type", "") != "relation" || !el.contains("members"))
        continue;
      std::vector<std::string> route;
      for (const auto &m : el.at("members")) {
        if (m.value("type", "") != "node")
          continue;
        std::string ref = idToString(m.at("ref"));
        if (nodeIndex.count(ref))
          route.push_back(ref);
      }
      if (route.size() > 1)
        topology.routes.push_back(std::move(route));
    }
    return topology;
  } catch (const json::exception &e) {
    throw DataError(std::string("route relations: ") + e.what());
  }
}

std::vector<Polygon> DatasetLoader::ParseObstacles(const std::string &text,
                                                   ObstacleKind kind) {
  const size_t minVertices = kind == ObstacleKind::Buildings ? 4 : 3;
  std::vector<Polygon> polygons;
  auto keep = [&](Polygon poly) {
    if (poly.size() >= minVertices)
      polygons.push_back(std::move(poly));
  };

  try {
    json j = json::parse(text);

    // Plain array of polygons, each a list of [lat, lon] pairs.
    if (j.is_array()) {
      for (const auto &ring : j) {
        Polygon poly;
        for (const auto &pt : ring)
          poly.push_back(pairToPoint(pt));
        keep(std::move(poly));
      }
      return polygons;
    }

    if (!j.is_object() || !j.contains("elements"))
      throw DataError("obstacle dataset must be an array or contain elements");

    for (const auto &el : j.at("elements")) {
      const std::string type = el.value("type", "");
      if (type == "way" && el.contains("geometry")) {
        keep(geometryToPolygon(el.at("geometry")));
      } else if (type == "relation" && kind == ObstacleKind::Water &&
                 el.contains("members")) {
        for (const auto &m : el.at("members")) {
          if (m.value("role", "") == "outer" && m.contains("geometry"))
            keep(geometryToPolygon(m.at("geometry")));
        }
      }
    }
    return polygons;
  } catch (const json::exception &e) {
    throw DataError(std::string("obstacle dataset: ") + e.what());
  }
}

std::string DatasetLoader::CacheKey(const std::string &category,
                                    const std::string &path) {
  return std::string(CACHE_VERSION) + ":" + category + ":" + path;
}

std::string DatasetLoader::readSource(const std::string &category,
                                      const std::string &path, bool &cached) {
  std::string bytes;
  cached = cache_ && cache_->get(CacheKey(category, path), bytes);
  if (cached)
    return bytes;

  std::ifstream in(path, std::ios::binary);
  if (!in)
    throw DataError("cannot open " + category + " dataset " + path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

// Only bytes that parsed successfully are cached.
void DatasetLoader::store(const std::string &category, const std::string &path,
                          const std::string &bytes, std::chrono::seconds ttl) {
  if (cache_)
    cache_->put(CacheKey(category, path), bytes, ttl);
}

GraphDataset DatasetLoader::LoadTransitGraph(const std::string &path) {
  bool cached = false;
  std::string bytes = readSource("transit", path, cached);
  GraphDataset ds = Canonicalize(ParseGraphDocument(bytes));
  if (!cached)
    store("transit", path, bytes, TRANSIT_CACHE_TTL);
  return ds;
}

GraphDataset DatasetLoader::LoadWalkingGraph(const std::string &path) {
  bool cached = false;
  std::string bytes = readSource("walking", path, cached);
  GraphDataset ds = Canonicalize(ParseGraphDocument(bytes));
  if (!cached)
    store("walking", path, bytes, WALKING_CACHE_TTL);
  return ds;
}

RouteTopology DatasetLoader::LoadRouteRelations(const std::string &path) {
  bool cached = false;
  std::string bytes = readSource("routes", path, cached);
  RouteTopology topology = ParseRouteRelations(bytes);
  if (!cached)
    store("routes", path, bytes, TRANSIT_CACHE_TTL);
  return topology;
}

std::vector<Polygon> DatasetLoader::LoadObstacles(const std::string &path,
                                                  ObstacleKind kind) {
  const std::string category =
      kind == ObstacleKind::Water ? "water" : "buildings";
  bool cached = false;
  std::string bytes = readSource(category, path, cached);
  std::vector<Polygon> polygons = ParseObstacles(bytes, kind);
  if (!cached)
    store(category, path, bytes, OBSTACLE_CACHE_TTL);
  return polygons;
}
