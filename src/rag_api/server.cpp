#include "rag_api/server.hpp"

#include <iostream>

namespace rag_api {

Server::Server(const std::string &host, int port) : host_(host), port_(port) {
  app_.server_name("manual-rag/0.1.0");
}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  server_thread_future_ =
      std::async(std::launch::async, [this] { app_.port(port_).bindaddr(host_).run(); });
  std::cout << "[Server] Serving on " << url() << std::endl;
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();

  // Rethrows a failure from the run loop, such as the port being taken.
  if (server_thread_future_.valid()) {
    server_thread_future_.get();
  }
  running_ = false;
  std::cout << "[Server] Stopped." << std::endl;
}

}  // namespace rag_api
