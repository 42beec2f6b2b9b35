#ifndef DATASET_LOADER_HPP
#define DATASET_LOADER_HPP

#include "dataset.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// --- Dataset Cache ---
const char *const CACHE_VERSION = "v2";
const std::chrono::seconds TRANSIT_CACHE_TTL = std::chrono::hours(24);
const std::chrono::seconds WALKING_CACHE_TTL = std::chrono::hours(24 * 7);
const std::chrono::seconds OBSTACLE_CACHE_TTL = std::chrono::hours(24 * 7);

// Byte store consulted before a dataset is read from its source.
class DatasetCache {
public:
  virtual ~DatasetCache() = default;
  // Returns false on a miss or an expired entry.
  virtual bool get(const std::string &key, std::string &bytes) = 0;
  virtual void put(const std::string &key, const std::string &bytes,
                   std::chrono::seconds ttl) = 0;
};

class MemoryDatasetCache : public DatasetCache {
public:
  bool get(const std::string &key, std::string &bytes) override;
  void put(const std::string &key, const std::string &bytes,
           std::chrono::seconds ttl) override;
  size_t size() const;

private:
  struct Slot {
    std::string bytes;
    std::chrono::steady_clock::time_point expires;
  };
  mutable std::mutex mutex_;
  std::map<std::string, Slot> slots_;
};

enum class ObstacleKind { Water, Buildings };

// Parses the JSON datasets into their in-memory forms. Every failure is
// reported as DataError.
class DatasetLoader {
public:
  explicit DatasetLoader(std::shared_ptr<DatasetCache> cache = nullptr);

  // {"v": 2, ...} selects the optimized schema, anything else the legacy one.
  static GraphDocument ParseGraphDocument(const std::string &text);
  // Resolves either schema into index-based nodes and edges. Edges that
  // reference unknown nodes are dropped.
  static GraphDataset Canonicalize(const GraphDocument &document);
  static RouteTopology ParseRouteRelations(const std::string &text);
  static std::vector<Polygon> ParseObstacles(const std::string &text,
                                             ObstacleKind kind);

  GraphDataset LoadTransitGraph(const std::string &path);
  GraphDataset LoadWalkingGraph(const std::string &path);
  RouteTopology LoadRouteRelations(const std::string &path);
  std::vector<Polygon> LoadObstacles(const std::string &path,
                                     ObstacleKind kind);

  static std::string CacheKey(const std::string &category,
                              const std::string &path);

private:
  std::string readSource(const std::string &category, const std::string &path,
                         bool &cached);
  void store(const std::string &category, const std::string &path,
             const std::string &bytes, std::chrono::seconds ttl);

  std::shared_ptr<DatasetCache> cache_;
};

#endif // DATASET_LOADER_HPP
