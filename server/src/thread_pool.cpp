#include "server/thread_pool.hpp"

#include <mutex>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace webpool::server {

namespace {

std::size_t checked_size(std::size_t size) {
  if (size == 0) {
    throw std::invalid_argument("thread pool size must be greater than zero");
  }
  return size;
}

}  // namespace

ThreadPool::ThreadPool(std::size_t size)
    : size_(checked_size(size)), stats_(std::make_shared<WorkerStats>()) {
  auto [sender, receiver] = make_channel<Message>();
  sender_.emplace(std::move(sender));
  auto shared = std::make_shared<LockedReceiver>(std::move(receiver));

  workers_.reserve(size_);
  try {
    for (std::size_t id = 0; id < size_; ++id) {
      workers_.emplace_back(id, shared, stats_);
    }
  } catch (const std::system_error& ex) {
    spdlog::critical("failed to spawn worker {}: {}", workers_.size(), ex.what());
    shutdown();
    throw;
  }
  spdlog::info("thread pool started with {} workers", size_);
}

ThreadPool::~ThreadPool() {
  shutdown();
}

void ThreadPool::execute(Job job) {
  if (!job) throw std::invalid_argument("cannot execute an empty job");
  std::lock_guard<std::mutex> lock(submit_mtx_);
  if (stopped_.load()) throw std::runtime_error("execute on stopped ThreadPool");
  if (!sender_->send(NewJob{std::move(job)})) {
    throw std::logic_error("dispatch channel has no receiver");
  }
}

void ThreadPool::shutdown() {
  {
    // No NewJob may land behind the Terminate markers. Released before the
    // joins so running jobs that call execute() get an error, not a hang.
    std::lock_guard<std::mutex> lock(submit_mtx_);
    if (stopped_.exchange(true)) return;

    // Signal every worker before joining any of them: a busy worker must not
    // be waited on while an idle one swallows the only Terminate.
    spdlog::info("sending terminate message to all workers");
    for (std::size_t i = 0; i < workers_.size(); ++i) {
      if (!sender_->send(Terminate{})) {
        spdlog::critical("dispatch channel closed during shutdown");
        break;
      }
    }
  }

  spdlog::info("shutting down all workers");
  for (auto& worker : workers_) {
    spdlog::info("shutting down worker {}", worker.id());
    if (auto thread = worker.take_thread()) {
      thread->join();
    }
  }
  sender_.reset();
  spdlog::info("thread pool stopped ({} jobs completed, {} failed)",
               completed_jobs(), failed_jobs());
}

}  // namespace webpool::server
