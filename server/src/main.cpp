#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "server/config.hpp"
#include "server/server.hpp"

using webpool::server::Server;
using webpool::server::ServerConfig;

namespace {
std::atomic<bool> g_stop{false};

void signal_handler(int) {
  g_stop.store(true);
}

bool setup_logging(const ServerConfig& cfg) {
  try {
    auto dir = std::filesystem::path(cfg.log_file).parent_path();
    if (!dir.empty()) std::filesystem::create_directories(dir);
    auto logger = spdlog::rotating_logger_mt("server", cfg.log_file, 1024 * 1024 * 5, 3);
    spdlog::set_default_logger(logger);
  } catch (const std::exception& ex) {
    std::cerr << "[server] cannot open log file " << cfg.log_file << ": " << ex.what()
              << "\n";
    return false;
  }
  spdlog::set_level(spdlog::level::from_str(cfg.log_level));
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  spdlog::flush_on(spdlog::level::warn);
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  ServerConfig cfg;
  if (argc > 1) {
    std::string error;
    auto loaded = webpool::server::load_config(argv[1], error);
    if (!loaded) {
      std::cerr << "[server] config error: " << error << "\n";
      return 1;
    }
    cfg = *loaded;
  }
  if (argc > 2) {
    try {
      int port = std::stoi(argv[2]);
      if (port < 0 || port > 65535) throw std::out_of_range("port");
      cfg.port = static_cast<std::uint16_t>(port);
    } catch (const std::exception&) {
      std::cerr << "Usage: " << argv[0] << " [config.json] [port]\n";
      return 1;
    }
  }

  if (!setup_logging(cfg)) return 1;

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  Server server(cfg);
  if (!server.start()) {
    std::cerr << "[server] failed to start\n";
    return 1;
  }

  std::cout << "[server] listening on " << cfg.host << ":" << server.port()
            << " with " << cfg.workers << " workers. Press Ctrl+C to stop.\n";

  while (!g_stop.load() && server.accepting()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  std::cout << "[server] shutting down.\n";
  server.stop();
  spdlog::shutdown();
  std::cout << "[server] stopped.\n";
  return 0;
}
