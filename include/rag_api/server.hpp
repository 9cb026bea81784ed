#pragma once
#include <crow.h>

#include <future>
#include <string>

namespace rag_api {

/**
 * @class Server
 * @brief Runs the Crow application serving the retrieval endpoints on a
 * background thread.
 *
 * Routes must be registered before start(). stop() blocks until in-flight
 * requests have been answered.
 */
class Server {
 public:
  Server(const std::string &host, int port);
  ~Server() = default;

  // crow::SimpleApp is neither copyable nor movable
  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }

  // Non-blocking. A bind failure surfaces from stop().
  void start();

  void stop();

  bool is_running() const {
    return running_;
  }

  std::string url() const {
    return "http://" + host_ + ":" + std::to_string(port_);
  }

 private:
  crow::SimpleApp app_;
  std::string host_;
  int port_;
  std::future<void> server_thread_future_;
  bool running_ = false;
};

}  // namespace rag_api
