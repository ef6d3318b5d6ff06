#pragma once

#include "Node.h"
#include "../lib/ResultOrError.hpp"
#include "../lib/Service.h"

#include <atomic>
#include <cstdint>
#include <httplib.h>
#include <string>

namespace powledger {

/**
 * JSON control surface of a node:
 *   GET  /mine
 *   POST /transactions/new
 *   GET  /chain
 *   POST /nodes/register
 *   GET  /nodes/resolve
 */
class HttpServer : public Service {
public:
  struct Config {
    std::string host{ "127.0.0.1" };
    uint16_t port{ 5000 };
  };

  HttpServer(const Config &config, Node &node);
  ~HttpServer() override;

  // Actual bound port, valid once started
  uint16_t getPort() const { return port_; }

protected:
  Service::Roe<void> onStart() override;
  void runLoop() override;
  void onStopRequested() override;

private:
  void registerRoutes();

  void handleMine(httplib::Response &res);
  void handleNewTransaction(const httplib::Request &req, httplib::Response &res);
  void handleChain(httplib::Response &res);
  void handleRegisterNodes(const httplib::Request &req, httplib::Response &res);
  void handleResolve(httplib::Response &res);

  Config config_;
  Node &node_;
  httplib::Server server_;
  uint16_t port_{ 0 };
  // Set once listen_after_bind() has returned
  std::atomic<bool> listenDone_{ false };
};

} // namespace powledger
