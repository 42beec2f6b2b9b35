#include "render_worker.hpp"
#include <exception>
#include <iostream>
#include <system_error>

RenderWorker::RenderWorker(RenderFunction render) : render_(std::move(render)) {}

RenderWorker::~RenderWorker() { stop(); }

bool RenderWorker::start() {
  if (running_)
    return true;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = false;
  }
  try {
    thread_ = std::thread(&RenderWorker::run, this);
  } catch (const std::system_error &e) {
    std::cerr << "[Worker] Failed to start render thread: " << e.what()
              << std::endl;
    return false;
  }
  running_ = true;
  return true;
}

void RenderWorker::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  requestCv_.notify_all();
  if (thread_.joinable())
    thread_.join();
  running_ = false;
}

void RenderWorker::submit(RenderRequest request) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_ = std::move(request);
    hasPending_ = true;
  }
  requestCv_.notify_one();
}

void RenderWorker::setProgressCallback(WorkerProgressCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  onProgress_ = std::move(callback);
}

bool RenderWorker::poll(RenderResult &result) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (responses_.empty())
    return false;
  result = std::move(responses_.front());
  responses_.pop_front();
  return true;
}

bool RenderWorker::waitResponse(RenderResult &result,
                                std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!responseCv_.wait_for(lock, timeout,
                            [this] { return !responses_.empty(); }))
    return false;
  result = std::move(responses_.front());
  responses_.pop_front();
  return true;
}

bool RenderWorker::busy() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return hasPending_ || inFlight_;
}

void RenderWorker::run() {
  while (true) {
    RenderRequest request;
    WorkerProgressCallback onProgress;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      requestCv_.wait(lock, [this] { return stopping_ || hasPending_; });
      if (stopping_)
        return;
      request = std::move(pending_);
      hasPending_ = false;
      inFlight_ = true;
      onProgress = onProgress_;
    }

    const uint64_t sequence = request.sequence;
    RenderResult result;
    try {
      result = render_(request, [&](int percent) {
        if (onProgress)
          onProgress(sequence, percent);
      });
    } catch (const std::exception &e) {
      result = RenderResult();
      result.isPreview = request.isPreview;
      result.error = e.what();
      if (result.error.empty())
        result.error = "render failed";
    } catch (...) {
      result = RenderResult();
      result.isPreview = request.isPreview;
      result.error = "render failed";
    }
    result.sequence = sequence;

    {
      std::lock_guard<std::mutex> lock(mutex_);
      responses_.push_back(std::move(result));
      inFlight_ = false;
    }
    responseCv_.notify_all();
  }
}
