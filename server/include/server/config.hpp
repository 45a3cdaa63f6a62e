#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace webpool::server {

struct ServerConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{7878};
  std::size_t workers{4};
  std::string document_root{"www"};
  std::size_t max_connections{0};  // 0 = unlimited.
  std::string log_file{"logs/server.log"};
  std::string log_level{"info"};
};

// Missing keys keep their defaults. On failure, returns std::nullopt and fills error.
std::optional<ServerConfig> config_from_json(const nlohmann::json& j, std::string& error);

std::optional<ServerConfig> load_config(const std::string& path, std::string& error);

nlohmann::json config_to_json(const ServerConfig& config);

}  // namespace webpool::server
