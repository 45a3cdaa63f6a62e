#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

#include "common/channel.hpp"
#include "common/message.hpp"

namespace webpool::server {

// The single consumer end of the dispatch channel, shared by every worker.
// Holding `mtx` is what makes a worker the only one receiving.
struct LockedReceiver {
  explicit LockedReceiver(Receiver<Message> receiver) : rx(std::move(receiver)) {}

  std::mutex mtx;
  Receiver<Message> rx;
};

using SharedReceiver = std::shared_ptr<LockedReceiver>;

struct WorkerStats {
  std::atomic<std::size_t> completed{0};
  std::atomic<std::size_t> failed{0};
};

class Worker {
 public:
  Worker(std::size_t id, SharedReceiver receiver, std::shared_ptr<WorkerStats> stats);
  ~Worker();

  Worker(Worker&&) noexcept = default;
  Worker& operator=(Worker&&) = delete;
  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  std::size_t id() const { return id_; }
  bool has_thread() const { return thread_.has_value(); }

  // Moves the thread handle out. Only the first call gets it.
  std::optional<std::thread> take_thread();

 private:
  static void run(std::size_t id, SharedReceiver receiver,
                  std::shared_ptr<WorkerStats> stats);

  std::size_t id_;
  std::optional<std::thread> thread_;
};

}  // namespace webpool::server
