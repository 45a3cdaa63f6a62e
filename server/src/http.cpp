#include "server/http.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <sstream>

#include <spdlog/spdlog.h>

namespace webpool::server {

namespace {

std::optional<std::string> read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;
  std::ostringstream oss;
  oss << in.rdbuf();
  return oss.str();
}

std::string_view first_line(std::string_view request) {
  auto end = request.find("\r\n");
  return end == std::string_view::npos ? request : request.substr(0, end);
}

bool write_all(int fd, const std::string& data, std::string& error) {
  std::size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      error = std::strerror(errno);
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

}  // namespace

Response route_request(std::string_view request, const std::string& document_root) {
  const bool index = request.substr(0, kIndexRequestLine.size()) == kIndexRequestLine;
  Response resp;
  resp.status_line = index ? "HTTP/1.1 200 OK" : "HTTP/1.1 404 NOT FOUND";
  const char* filename = index ? "hello.html" : "404.html";

  auto path = std::filesystem::path(document_root) / filename;
  auto contents = read_file(path);
  if (!contents) {
    spdlog::error("cannot read {}", path.string());
    resp.status_line = "HTTP/1.1 500 INTERNAL SERVER ERROR";
    return resp;
  }
  resp.body = std::move(*contents);
  return resp;
}

std::string format_response(const Response& response) {
  std::ostringstream oss;
  oss << response.status_line << "\r\n"
      << "Content-Length: " << response.body.size() << "\r\n\r\n"
      << response.body;
  return oss.str();
}

void handle_connection(int fd, const std::string& document_root, const std::string& peer) {
  std::array<char, kRequestBufferBytes> buffer{};
  ssize_t n = -1;
  do {
    n = ::recv(fd, buffer.data(), buffer.size(), 0);
  } while (n < 0 && errno == EINTR);

  if (n < 0) {
    spdlog::warn("read error from {}: {}", peer, std::strerror(errno));
  } else if (n == 0) {
    spdlog::debug("{} closed the connection without a request", peer);
  } else {
    std::string_view request(buffer.data(), static_cast<std::size_t>(n));
    spdlog::info("request from {}: {}", peer, first_line(request));

    auto resp = route_request(request, document_root);
    std::string error;
    if (!write_all(fd, format_response(resp), error)) {
      spdlog::warn("send error to {}: {}", peer, error);
    }
  }
  ::close(fd);
}

}  // namespace webpool::server
