#pragma once
#include <crow.h>

#include <future>
#include <string>

namespace harvest_api {

/**
 * Runs the Crow application on a background thread so main() stays free to
 * wait for signals and drive the ordered shutdown of the engine.
 */
class Server {
 public:
  Server(const std::string &host, int port);
  ~Server();

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }

  // Returns once the listener is accepting connections. Throws
  // std::runtime_error if the server thread died while binding.
  void start();

  // Stops accepting requests and waits for in-flight handlers.
  void stop();

  bool is_running() const {
    return running_;
  }

  std::string endpoint() const {
    return host_ + ":" + std::to_string(port_);
  }

 private:
  crow::SimpleApp app_;
  std::string host_;
  int port_;
  std::future<void> server_thread_future_;
  bool running_ = false;
};

}  // namespace harvest_api
