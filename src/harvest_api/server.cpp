#include "harvest_api/server.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <stdexcept>

namespace harvest_api {

Server::Server(const std::string &host, int port) : host_(host), port_(port) {}

Server::~Server() {
  stop();
}

void Server::start() {
  if (running_) {
    return;
  }
  server_thread_future_ = std::async(std::launch::async, [this] {
    app_.bindaddr(host_).port(static_cast<std::uint16_t>(port_)).multithreaded().run();
  });

  // run() returns early (or throws) when the address cannot be bound.
  if (server_thread_future_.wait_for(std::chrono::milliseconds(200)) ==
      std::future_status::ready) {
    try {
      server_thread_future_.get();
    } catch (const std::exception &e) {
      throw std::runtime_error("HTTP server failed to start on " + endpoint() + ": " + e.what());
    }
    throw std::runtime_error("HTTP server exited during startup on " + endpoint());
  }
  app_.wait_for_server_start();
  running_ = true;
  std::cout << "Server: listening on " << endpoint() << std::endl;
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();
  if (server_thread_future_.valid()) {
    try {
      server_thread_future_.get();
    } catch (const std::exception &e) {
      std::cerr << "Server: listener thread ended with error: " << e.what() << std::endl;
    }
  }
  running_ = false;
  std::cout << "Server: stopped" << std::endl;
}

}  // namespace harvest_api
