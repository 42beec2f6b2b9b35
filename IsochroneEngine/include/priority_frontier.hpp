#ifndef PRIORITY_FRONTIER_HPP
#define PRIORITY_FRONTIER_HPP

#include "types.hpp"
#include <vector>

// Binary min-heap of (node, arrival time), ties broken by node id. There is
// no decrease-key: callers push a node again when its time improves and skip
// stale entries on pop.
class PriorityFrontier {
public:
  struct Item {
    NodeID id;
    double priority;
  };

  void push(NodeID id, double priority);

  // Removes and returns the item with the smallest priority. The frontier
  // must not be empty.
  Item pop();

  const Item &top() const { return heap_.front(); }
  size_t size() const { return heap_.size(); }
  bool empty() const { return heap_.empty(); }
  void clear() { heap_.clear(); }
  void reserve(size_t n) { heap_.reserve(n); }

private:
  void siftUp(size_t n);
  void siftDown(size_t n);

  std::vector<Item> heap_;
};

#endif // PRIORITY_FRONTIER_HPP
