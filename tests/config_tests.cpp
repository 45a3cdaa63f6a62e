#include <filesystem>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "server/config.hpp"
#include "test_runner.hpp"

using webpool::server::ServerConfig;
using webpool::test::TestRunner;

int main() {
  TestRunner tr("config");

  // Empty object keeps the defaults.
  {
    std::string err;
    auto cfg = webpool::server::config_from_json(nlohmann::json::object(), err);
    tr.expect(cfg.has_value(), "empty config accepted");
    if (cfg) {
      tr.expect(cfg->host == "127.0.0.1", "default host");
      tr.expect(cfg->port == 7878, "default port");
      tr.expect(cfg->workers == 4, "default workers");
      tr.expect(cfg->document_root == "www", "default document root");
      tr.expect(cfg->max_connections == 0, "unlimited connections by default");
      tr.expect(cfg->log_level == "info", "default log level");
    }
  }

  // Every key read.
  {
    nlohmann::json j = {{"host", "0.0.0.0"},       {"port", 8080},
                        {"workers", 16},           {"document_root", "/srv/www"},
                        {"max_connections", 2},    {"log_file", "/tmp/w.log"},
                        {"log_level", "debug"}};
    std::string err;
    auto cfg = webpool::server::config_from_json(j, err);
    tr.expect(cfg.has_value(), "full config accepted: " + err);
    if (cfg) {
      tr.expect(cfg->host == "0.0.0.0", "host read");
      tr.expect(cfg->port == 8080, "port read");
      tr.expect(cfg->workers == 16, "workers read");
      tr.expect(cfg->document_root == "/srv/www", "document root read");
      tr.expect(cfg->max_connections == 2, "max connections read");
      tr.expect(cfg->log_file == "/tmp/w.log", "log file read");
      tr.expect(cfg->log_level == "debug", "log level read");
      tr.expect(webpool::server::config_to_json(*cfg) == j, "config serializes back");
    }
  }

  // Rejected values.
  {
    std::string err;
    tr.expect(!webpool::server::config_from_json({{"workers", 0}}, err),
              "zero workers rejected");
    tr.expect(err.find("workers") != std::string::npos, "error names the key");
    tr.expect(!webpool::server::config_from_json({{"workers", -3}}, err),
              "negative workers rejected");
    tr.expect(!webpool::server::config_from_json({{"port", 70000}}, err),
              "port out of range rejected");
    tr.expect(!webpool::server::config_from_json({{"port", "80"}}, err),
              "string port rejected");
    tr.expect(!webpool::server::config_from_json({{"host", 1}}, err),
              "numeric host rejected");
    tr.expect(!webpool::server::config_from_json({{"log_level", "loud"}}, err),
              "unknown log level rejected");
    tr.expect(!webpool::server::config_from_json(nlohmann::json::array(), err),
              "non-object rejected");
  }

  // Loading from disk.
  {
    auto path = std::filesystem::temp_directory_path() / "webpool_config_tests.json";
    {
      std::ofstream out(path);
      out << R"({"port": 9000, "workers": 2})";
    }
    std::string err;
    auto cfg = webpool::server::load_config(path.string(), err);
    tr.expect(cfg && cfg->port == 9000 && cfg->workers == 2, "config file loaded");

    {
      std::ofstream out(path);
      out << "{ not json";
    }
    tr.expect(!webpool::server::load_config(path.string(), err), "bad JSON rejected");
    tr.expect(!err.empty(), "bad JSON explained");

    std::filesystem::remove(path);
    tr.expect(!webpool::server::load_config(path.string(), err), "missing file rejected");
  }

  return tr.exit_code();
}
