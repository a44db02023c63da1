#include "rag_api/server.hpp"

#include <iostream>
#include <stdexcept>

namespace rag_api {
Server::Server(const std::string &host, int port) : host_(host), port_(port), running_(false) {}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  std::cout << "[Server] Listening on " << host_ << ":" << port_ << std::endl;
  server_thread_future_ =
      std::async(std::launch::async, [this] { app_.port(port_).bindaddr(host_).multithreaded().run(); });
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();

  if (server_thread_future_.valid()) {
    server_thread_future_.get();
  }
  running_ = false;
}

std::pair<std::string, int> Server::parse_address(const std::string &address) {
  const size_t colon = address.rfind(':');
  if (colon == std::string::npos || colon + 1 >= address.size()) {
    throw std::invalid_argument("Address must be host:port, got '" + address + "'");
  }
  const int port = std::stoi(address.substr(colon + 1));
  if (port <= 0 || port > 65535) {
    throw std::invalid_argument("Port out of range in '" + address + "'");
  }
  return {address.substr(0, colon), port};
}
}  // namespace rag_api
