#include "server/config.hpp"

#include <array>
#include <fstream>
#include <string_view>

namespace webpool::server {

namespace {

constexpr std::array<std::string_view, 7> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off"};

bool is_log_level(const std::string& value) {
  for (auto level : kLogLevels) {
    if (value == level) return true;
  }
  return false;
}

template <typename T>
bool read_unsigned(const nlohmann::json& j, const char* key, std::uint64_t max, T& out,
                   std::string& error) {
  if (!j.contains(key)) return true;
  const auto& v = j.at(key);
  if (!v.is_number_integer() || (!v.is_number_unsigned() && v.get<std::int64_t>() < 0)) {
    error = std::string("'") + key + "' must be a non-negative integer";
    return false;
  }
  auto value = v.get<std::uint64_t>();
  if (value > max) {
    error = std::string("'") + key + "' is out of range";
    return false;
  }
  out = static_cast<T>(value);
  return true;
}

bool read_string(const nlohmann::json& j, const char* key, std::string& out,
                 std::string& error) {
  if (!j.contains(key)) return true;
  const auto& v = j.at(key);
  if (!v.is_string()) {
    error = std::string("'") + key + "' must be a string";
    return false;
  }
  out = v.get<std::string>();
  return true;
}

}  // namespace

std::optional<ServerConfig> config_from_json(const nlohmann::json& j, std::string& error) {
  if (!j.is_object()) {
    error = "config must be a JSON object";
    return std::nullopt;
  }
  ServerConfig cfg;
  if (!read_string(j, "host", cfg.host, error) ||
      !read_unsigned(j, "port", 65535, cfg.port, error) ||
      !read_unsigned(j, "workers", 4096, cfg.workers, error) ||
      !read_string(j, "document_root", cfg.document_root, error) ||
      !read_unsigned(j, "max_connections", UINT32_MAX, cfg.max_connections, error) ||
      !read_string(j, "log_file", cfg.log_file, error) ||
      !read_string(j, "log_level", cfg.log_level, error)) {
    return std::nullopt;
  }
  if (cfg.workers == 0) {
    error = "'workers' must be at least 1";
    return std::nullopt;
  }
  if (!is_log_level(cfg.log_level)) {
    error = "unknown log level: " + cfg.log_level;
    return std::nullopt;
  }
  return cfg;
}

std::optional<ServerConfig> load_config(const std::string& path, std::string& error) {
  std::ifstream in(path);
  if (!in) {
    error = "cannot open config file: " + path;
    return std::nullopt;
  }
  nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
  if (j.is_discarded()) {
    error = "invalid JSON in " + path;
    return std::nullopt;
  }
  return config_from_json(j, error);
}

nlohmann::json config_to_json(const ServerConfig& config) {
  return {{"host", config.host},
          {"port", config.port},
          {"workers", config.workers},
          {"document_root", config.document_root},
          {"max_connections", config.max_connections},
          {"log_file", config.log_file},
          {"log_level", config.log_level}};
}

}  // namespace webpool::server
