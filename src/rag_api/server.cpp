#include "rag_api/server.hpp"

#include <iostream>
#include <stdexcept>

namespace rag_api {
Server::Server(const std::string &host, int port) : host_(host), port_(port), running_(false) {
  if (port_ < 1 || port_ > 65535) {
    throw std::invalid_argument("Server port must be between 1 and 65535, got " +
                                std::to_string(port_));
  }
}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  std::cout << "Listening on " << host_ << ":" << port_ << std::endl;
  server_thread_future_ = std::async(std::launch::async, [this] {
    app_.port(static_cast<uint16_t>(port_)).bindaddr(host_).multithreaded().run();
  });
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
}  // namespace rag_api
