#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "common/channel.hpp"
#include "common/job.hpp"
#include "common/message.hpp"
#include "server/worker.hpp"

namespace webpool::server {

// Fixed-size pool of workers fed through one FIFO dispatch channel.
class ThreadPool {
 public:
  // Throws std::invalid_argument when size is zero.
  explicit ThreadPool(std::size_t size);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  // Queues a job for exactly one worker. Safe to call from several threads,
  // including pool jobs. Once shutdown() has begun it throws
  // std::runtime_error; a job it accepted always runs.
  void execute(Job job);

  // Sends one Terminate per worker, then joins them all. Jobs queued before
  // this call still run. Idempotent.
  void shutdown();

  std::size_t size() const { return size_; }
  std::size_t completed_jobs() const { return stats_->completed.load(); }
  std::size_t failed_jobs() const { return stats_->failed.load(); }

 private:
  std::size_t size_;
  std::shared_ptr<WorkerStats> stats_;
  std::optional<Sender<Message>> sender_;
  std::vector<Worker> workers_;
  std::mutex submit_mtx_;  // orders submissions against the Terminate broadcast
  std::atomic<bool> stopped_{false};
};

}  // namespace webpool::server
