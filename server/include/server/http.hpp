#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace webpool::server {

constexpr std::size_t kRequestBufferBytes = 1024;
constexpr std::string_view kIndexRequestLine = "GET / HTTP/1.1\r\n";

struct Response {
  std::string status_line;
  std::string body;
};

// Picks the page for a raw request: the index for `GET /`, 404 for the rest.
Response route_request(std::string_view request, const std::string& document_root);

std::string format_response(const Response& response);

// Reads one request from fd, answers it and closes fd. A peer that closes
// without sending anything gets no response. Runs on a pool worker.
void handle_connection(int fd, const std::string& document_root, const std::string& peer);

}  // namespace webpool::server
