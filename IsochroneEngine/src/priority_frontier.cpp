#include "priority_frontier.hpp"

namespace {
// Equal priorities pop in ascending id order.
bool before(const PriorityFrontier::Item &a, const PriorityFrontier::Item &b) {
  if (a.priority != b.priority)
    return a.priority < b.priority;
  return a.id < b.id;
}
} // namespace

void PriorityFrontier::push(NodeID id, double priority) {
  heap_.push_back({id, priority});
  siftUp(heap_.size() - 1);
}

PriorityFrontier::Item PriorityFrontier::pop() {
  Item result = heap_.front();
  Item last = heap_.back();
  heap_.pop_back();
  if (!heap_.empty()) {
    heap_[0] = last;
    siftDown(0);
  }
  return result;
}

void PriorityFrontier::siftUp(size_t n) {
  Item element = heap_[n];
  while (n > 0) {
    size_t parent = (n - 1) / 2;
    if (!before(element, heap_[parent]))
      break;
    heap_[n] = heap_[parent];
    n = parent;
  }
  heap_[n] = element;
}

void PriorityFrontier::siftDown(size_t n) {
  const size_t length = heap_.size();
  Item element = heap_[n];

  while (true) {
    size_t left = 2 * n + 1;
    size_t right = left + 1;
    size_t smallest = n;
    const Item *smallestItem = &element;

    if (left < length && before(heap_[left], *smallestItem)) {
      smallest = left;
      smallestItem = &heap_[left];
    }
    if (right < length && before(heap_[right], *smallestItem))
      smallest = right;

    if (smallest == n)
      break;
    heap_[n] = heap_[smallest];
    n = smallest;
  }
  heap_[n] = element;
}
