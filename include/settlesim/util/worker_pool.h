#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace settlesim::util {

// Fixed-size pool of std::thread workers.
//
// parallel_for() is the only entry point the engine needs: it fans a batch of
// independent items out to the workers and blocks until every item has run.
class WorkerPool {
 public:
  // threads <= 0 picks std::thread::hardware_concurrency() (at least 1).
  explicit WorkerPool(int threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  int size() const { return static_cast<int>(workers_.size()); }

  // Calls fn(i) for every i in [0, n). Blocks until all calls returned.
  // If any call throws, the first exception is rethrown after the batch drains.
  void parallel_for(std::size_t n, const std::function<void(std::size_t)>& fn);

 private:
  void worker_loop();

  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> queue_;
  bool stop_{false};
  std::vector<std::thread> workers_;
};

} // namespace settlesim::util
