#ifndef RENDER_WORKER_HPP
#define RENDER_WORKER_HPP

#include "isochrone_rasterizer.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

using RenderFunction =
    std::function<RenderResult(const RenderRequest &, const ProgressCallback &)>;
using WorkerProgressCallback = std::function<void(uint64_t sequence, int percent)>;

// Dedicated rasterization thread. Requests go through a one-slot channel
// (a newer submit replaces a request that has not started yet); results are
// queued until the controller polls them.
class RenderWorker {
public:
  explicit RenderWorker(RenderFunction render = IsochroneRasterizer::Render);
  ~RenderWorker();

  RenderWorker(const RenderWorker &) = delete;
  RenderWorker &operator=(const RenderWorker &) = delete;

  // Returns false when the thread cannot be started.
  bool start();
  void stop();
  bool isRunning() const { return running_; }

  void submit(RenderRequest request);
  // Invoked on the worker thread.
  void setProgressCallback(WorkerProgressCallback callback);

  // Non-blocking.
  bool poll(RenderResult &result);
  bool waitResponse(RenderResult &result, std::chrono::milliseconds timeout);

  bool busy() const;

private:
  void run();

  RenderFunction render_;
  WorkerProgressCallback onProgress_;

  mutable std::mutex mutex_;
  std::condition_variable requestCv_;
  std::condition_variable responseCv_;
  bool hasPending_ = false;
  RenderRequest pending_;
  bool inFlight_ = false;
  std::deque<RenderResult> responses_;
  bool stopping_ = false;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

#endif // RENDER_WORKER_HPP
