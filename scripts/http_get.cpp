#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <string>

namespace {

bool fetch(const std::string& host, std::uint16_t port, const std::string& path,
           std::string& response) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    std::perror("socket");
    return false;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
    std::cerr << "Invalid host\n";
    ::close(fd);
    return false;
  }
  if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::perror("connect");
    ::close(fd);
    return false;
  }

  std::string request = "GET " + path + " HTTP/1.1\r\nHost: " + host + "\r\n\r\n";
  if (::send(fd, request.data(), request.size(), 0) < 0) {
    std::perror("send");
    ::close(fd);
    return false;
  }

  response.clear();
  char buf[4096];
  while (true) {
    ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
    if (n < 0) {
      std::perror("recv");
      ::close(fd);
      return false;
    }
    if (n == 0) break;
    response.append(buf, static_cast<std::size_t>(n));
  }
  ::close(fd);
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <host> <port> [path] [count]\n";
    return 1;
  }
  std::string host = argv[1];
  auto port = static_cast<std::uint16_t>(std::stoi(argv[2]));
  std::string path = (argc > 3) ? argv[3] : "/";
  int count = (argc > 4) ? std::stoi(argv[4]) : 1;

  int failures = 0;
  for (int i = 0; i < count; ++i) {
    std::string response;
    if (!fetch(host, port, path, response)) {
      ++failures;
      continue;
    }
    std::cout << response << "\n";
  }
  return failures == 0 ? 0 : 1;
}
