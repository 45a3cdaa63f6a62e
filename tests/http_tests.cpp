#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "server/config.hpp"
#include "server/http.hpp"
#include "server/server.hpp"
#include "test_runner.hpp"

using webpool::server::Response;
using webpool::server::Server;
using webpool::server::ServerConfig;
using webpool::test::TestRunner;

namespace {

const std::string kHello = "<h1>Hello!</h1>";
const std::string kMissing = "<h1>Oops!</h1>";

std::filesystem::path make_docroot() {
  auto dir = std::filesystem::temp_directory_path() /
             ("webpool_http_tests_" + std::to_string(::getpid()));
  std::filesystem::create_directories(dir);
  std::ofstream(dir / "hello.html") << kHello;
  std::ofstream(dir / "404.html") << kMissing;
  return dir;
}

std::string fetch(std::uint16_t port, const std::string& request) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) return {};
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
  if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    ::close(fd);
    return {};
  }
  ::send(fd, request.data(), request.size(), MSG_NOSIGNAL);
  std::string response;
  char buf[1024];
  ssize_t n = 0;
  while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0) {
    response.append(buf, static_cast<std::size_t>(n));
  }
  ::close(fd);
  return response;
}

}  // namespace

int main() {
  spdlog::set_level(spdlog::level::warn);
  TestRunner tr("http");
  auto docroot = make_docroot();

  // Routing.
  {
    auto ok = webpool::server::route_request("GET / HTTP/1.1\r\nHost: x\r\n\r\n",
                                             docroot.string());
    tr.expect(ok.status_line == "HTTP/1.1 200 OK", "index gets 200");
    tr.expect(ok.body == kHello, "index serves hello.html");

    auto other = webpool::server::route_request("GET /nope HTTP/1.1\r\n\r\n", docroot.string());
    tr.expect(other.status_line == "HTTP/1.1 404 NOT FOUND", "unknown path gets 404");
    tr.expect(other.body == kMissing, "unknown path serves 404.html");

    auto post = webpool::server::route_request("POST / HTTP/1.1\r\n\r\n", docroot.string());
    tr.expect(post.status_line == "HTTP/1.1 404 NOT FOUND", "non-GET gets 404");

    auto old = webpool::server::route_request("GET / HTTP/1.0\r\n\r\n", docroot.string());
    tr.expect(old.status_line == "HTTP/1.1 404 NOT FOUND", "only HTTP/1.1 index matches");

    auto truncated = webpool::server::route_request("GET / HTTP", docroot.string());
    tr.expect(truncated.status_line == "HTTP/1.1 404 NOT FOUND", "short request gets 404");

    auto missing = webpool::server::route_request("GET / HTTP/1.1\r\n\r\n",
                                                  (docroot / "absent").string());
    tr.expect(missing.status_line == "HTTP/1.1 500 INTERNAL SERVER ERROR",
              "unreadable page gets 500");
    tr.expect(missing.body.empty(), "500 has no body");
  }

  // Formatting.
  {
    Response resp{"HTTP/1.1 200 OK", "abc"};
    tr.expect(webpool::server::format_response(resp) ==
                  "HTTP/1.1 200 OK\r\nContent-Length: 3\r\n\r\nabc",
              "response layout");
    Response empty{"HTTP/1.1 404 NOT FOUND", ""};
    tr.expect(webpool::server::format_response(empty) ==
                  "HTTP/1.1 404 NOT FOUND\r\nContent-Length: 0\r\n\r\n",
              "empty body layout");
  }

  // handle_connection on a local socket pair.
  {
    int fds[2];
    tr.expect(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0, "socketpair for request");
    const std::string request = "GET / HTTP/1.1\r\n\r\n";
    ::send(fds[0], request.data(), request.size(), MSG_NOSIGNAL);
    webpool::server::handle_connection(fds[1], docroot.string(), "pair");
    std::string response;
    char buf[1024];
    ssize_t n = 0;
    while ((n = ::recv(fds[0], buf, sizeof(buf), 0)) > 0) {
      response.append(buf, static_cast<std::size_t>(n));
    }
    ::close(fds[0]);
    tr.expect(response.rfind("HTTP/1.1 200 OK\r\n", 0) == 0, "request answered");
  }

  // A peer that closes without sending anything gets no response.
  {
    int fds[2];
    tr.expect(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0, "socketpair for silent peer");
    ::shutdown(fds[0], SHUT_WR);
    webpool::server::handle_connection(fds[1], docroot.string(), "silent");
    char buf[64];
    ssize_t n = ::recv(fds[0], buf, sizeof(buf), 0);
    ::close(fds[0]);
    tr.expect(n == 0, "nothing written to a peer that sent no request");
  }

  // End to end over loopback, with concurrent clients.
  {
    ServerConfig cfg;
    cfg.port = 0;
    cfg.workers = 4;
    cfg.document_root = docroot.string();
    Server server(cfg);
    tr.expect(server.start(), "server starts on an ephemeral port");
    tr.expect(server.port() != 0, "bound port reported");

    auto index = fetch(server.port(), "GET / HTTP/1.1\r\nHost: localhost\r\n\r\n");
    tr.expect(index == "HTTP/1.1 200 OK\r\nContent-Length: " + std::to_string(kHello.size()) +
                           "\r\n\r\n" + kHello,
              "index response over the wire");

    auto missing = fetch(server.port(), "GET /missing HTTP/1.1\r\n\r\n");
    tr.expect(missing.rfind("HTTP/1.1 404 NOT FOUND\r\n", 0) == 0, "404 over the wire");

    std::atomic<int> ok{0};
    std::vector<std::thread> clients;
    for (int i = 0; i < 8; ++i) {
      clients.emplace_back([&ok, port = server.port()] {
        auto r = fetch(port, "GET / HTTP/1.1\r\n\r\n");
        if (r.rfind("HTTP/1.1 200 OK\r\n", 0) == 0) ok.fetch_add(1);
      });
    }
    for (auto& c : clients) c.join();
    tr.expect(ok.load() == 8, "concurrent clients all served");

    server.stop();
    tr.expect(server.connections_accepted() == 10, "every connection counted");
    tr.expect(!server.accepting(), "accept loop stopped");
  }

  // The accept loop stops itself after max_connections.
  {
    ServerConfig cfg;
    cfg.port = 0;
    cfg.workers = 2;
    cfg.max_connections = 2;
    cfg.document_root = docroot.string();
    Server server(cfg);
    tr.expect(server.start(), "limited server starts");
    fetch(server.port(), "GET / HTTP/1.1\r\n\r\n");
    fetch(server.port(), "GET / HTTP/1.1\r\n\r\n");
    for (int i = 0; i < 100 && server.accepting(); ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    tr.expect(!server.accepting(), "accept loop ends at the connection limit");
    server.stop();
    tr.expect(server.connections_accepted() == 2, "limit respected");
  }

  std::error_code ec;
  std::filesystem::remove_all(docroot, ec);
  return tr.exit_code();
}
