#include "server/worker.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace webpool::server {

Worker::Worker(std::size_t id, SharedReceiver receiver, std::shared_ptr<WorkerStats> stats)
    : id_(id),
      thread_(std::in_place, &Worker::run, id, std::move(receiver), std::move(stats)) {}

Worker::~Worker() {
  // The pool takes every handle during shutdown; this only covers a worker
  // torn down without one (e.g. a failed pool constructor).
  if (thread_ && thread_->joinable()) {
    spdlog::warn("worker {} destroyed while its thread is still attached; joining", id_);
    thread_->join();
  }
}

std::optional<std::thread> Worker::take_thread() {
  return std::exchange(thread_, std::nullopt);
}

void Worker::run(std::size_t id, SharedReceiver receiver,
                 std::shared_ptr<WorkerStats> stats) {
  while (true) {
    std::optional<Message> message;
    {
      std::lock_guard<std::mutex> lock(receiver->mtx);
      message = receiver->rx.recv();
    }
    // Lock released: the job below runs in parallel with other workers.

    if (!message) {
      spdlog::warn("worker {} lost its dispatch channel; exiting", id);
      break;
    }
    if (is_terminate(*message)) {
      spdlog::info("worker {} received {}; exiting", id, to_string(*message));
      break;
    }

    spdlog::debug("worker {} received {}; executing", id, to_string(*message));
    Job job = std::move(std::get<NewJob>(*message).job);
    try {
      job();
      stats->completed.fetch_add(1);
    } catch (const std::exception& ex) {
      stats->failed.fetch_add(1);
      spdlog::error("worker {} job failed: {}", id, ex.what());
    } catch (...) {
      stats->failed.fetch_add(1);
      spdlog::error("worker {} job failed with a non-standard exception", id);
    }
  }
}

}  // namespace webpool::server
