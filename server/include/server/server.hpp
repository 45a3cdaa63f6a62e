#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <thread>

#include "server/config.hpp"
#include "server/thread_pool.hpp"

namespace webpool::server {

// Accepts TCP connections and hands each one to the pool as a job.
class Server {
 public:
  explicit Server(ServerConfig config);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  bool start();
  // Stops accepting, then waits for every accepted connection to be answered.
  void stop();

  bool accepting() const { return accepting_.load(); }
  // Port actually bound; differs from the config when it asked for port 0.
  std::uint16_t port() const { return bound_port_; }
  std::size_t connections_accepted() const { return accepted_.load(); }

 private:
  void accept_loop();

  ServerConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};
  std::atomic<std::size_t> accepted_{0};
  int listen_fd_{-1};
  std::uint16_t bound_port_{0};
  std::thread accept_thread_;

  ThreadPool workers_;
};

}  // namespace webpool::server
