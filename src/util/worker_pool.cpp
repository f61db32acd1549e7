#include "settlesim/util/worker_pool.h"

#include <exception>

namespace settlesim::util {

WorkerPool::WorkerPool(int threads) {
  if (threads <= 0) threads = static_cast<int>(std::thread::hardware_concurrency());
  if (threads <= 0) threads = 1;
  workers_.reserve(static_cast<std::size_t>(threads));
  for (int i = 0; i < threads; ++i) {
    workers_.emplace_back([this]() { this->worker_loop(); });
  }
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_ = true;
  }
  cv_.notify_all();
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
}

void WorkerPool::worker_loop() {
  for (;;) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [&]() { return stop_ || !queue_.empty(); });
      // Queued work is always finished before the pool stops.
      if (queue_.empty()) break;
      task = std::move(queue_.front());
      queue_.pop_front();
    }
    task();
  }
}

void WorkerPool::parallel_for(std::size_t n, const std::function<void(std::size_t)>& fn) {
  if (n == 0) return;

  if (workers_.size() <= 1 || n == 1) {
    for (std::size_t i = 0; i < n; ++i) fn(i);
    return;
  }

  struct Batch {
    std::mutex mu;
    std::condition_variable done_cv;
    std::size_t remaining{0};
    std::exception_ptr first_error;
  };
  Batch batch;
  batch.remaining = n;

  {
    std::lock_guard<std::mutex> lk(mu_);
    for (std::size_t i = 0; i < n; ++i) {
      queue_.emplace_back([&batch, &fn, i]() {
        std::exception_ptr err;
        try {
          fn(i);
        } catch (...) {
          err = std::current_exception();
        }
        std::lock_guard<std::mutex> blk(batch.mu);
        if (err && !batch.first_error) batch.first_error = err;
        if (--batch.remaining == 0) batch.done_cv.notify_all();
      });
    }
  }
  cv_.notify_all();

  std::unique_lock<std::mutex> lk(batch.mu);
  batch.done_cv.wait(lk, [&]() { return batch.remaining == 0; });
  if (batch.first_error) std::rethrow_exception(batch.first_error);
}

} // namespace settlesim::util
