#include "server/server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <utility>

#include <spdlog/spdlog.h>

#include "server/http.hpp"

namespace webpool::server {

namespace {

int create_listen_socket(const std::string& host, std::uint16_t port) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    spdlog::error("socket: {}", std::strerror(errno));
    return -1;
  }
  int opt = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
    spdlog::warn("setsockopt(SO_REUSEADDR): {}", std::strerror(errno));
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
    spdlog::error("invalid host: {}", host);
    ::close(fd);
    return -1;
  }
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    spdlog::error("bind {}:{}: {}", host, port, std::strerror(errno));
    ::close(fd);
    return -1;
  }
  if (::listen(fd, 64) < 0) {
    spdlog::error("listen: {}", std::strerror(errno));
    ::close(fd);
    return -1;
  }
  return fd;
}

std::uint16_t local_port(int fd) {
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
    return ntohs(addr.sin_port);
  }
  return 0;
}

std::string peer_addr(const sockaddr_in& addr) {
  char buf[INET_ADDRSTRLEN];
  if (!::inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf))) return "unknown";
  std::ostringstream oss;
  oss << buf << ":" << ntohs(addr.sin_port);
  return oss.str();
}

}  // namespace

Server::Server(ServerConfig config)
    : config_(std::move(config)), workers_(config_.workers) {}

Server::~Server() {
  stop();
}

bool Server::start() {
  if (running_.load()) return true;
  listen_fd_ = create_listen_socket(config_.host, config_.port);
  if (listen_fd_ < 0) return false;
  bound_port_ = local_port(listen_fd_);
  running_.store(true);
  accepting_.store(true);
  accept_thread_ = std::thread(&Server::accept_loop, this);
  spdlog::info("listening on {}:{} with {} workers", config_.host, bound_port_,
               workers_.size());
  return true;
}

void Server::stop() {
  if (!running_.exchange(false)) return;
  if (listen_fd_ >= 0) {
    // Wakes a thread blocked in accept().
    ::shutdown(listen_fd_, SHUT_RDWR);
  }
  if (accept_thread_.joinable()) accept_thread_.join();
  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
    listen_fd_ = -1;
  }
  workers_.shutdown();
  spdlog::info("server stopped after {} connections", accepted_.load());
}

void Server::accept_loop() {
  while (running_.load()) {
    if (config_.max_connections != 0 && accepted_.load() >= config_.max_connections) {
      spdlog::info("connection limit {} reached; no longer accepting",
                   config_.max_connections);
      break;
    }
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    int client_fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    if (client_fd < 0) {
      if (errno == EINTR) continue;
      if (!running_.load()) break;
      if (errno == EINVAL) break;  // listening socket shut down
      spdlog::warn("accept: {}", std::strerror(errno));
      continue;
    }
    accepted_.fetch_add(1);
    std::string peer = peer_addr(addr);
    spdlog::debug("new connection from {}", peer);
    workers_.execute([client_fd, root = config_.document_root, peer] {
      handle_connection(client_fd, root, peer);
    });
  }
  accepting_.store(false);
}

}  // namespace webpool::server
