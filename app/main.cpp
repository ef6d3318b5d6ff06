#include "HttpServer.h"
#include "Node.h"
#include "Logger.h"

#include <CLI/CLI.hpp>

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace {
std::atomic<bool> g_running{true};
std::mutex g_mutex;
std::condition_variable g_cv;

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_running = false;
    g_cv.notify_one();
  }
}
} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"pow-node: proof-of-work ledger node"};

  std::string configPath;
  std::optional<std::string> host;
  std::optional<std::string> advertiseHost;
  std::optional<uint16_t> port;
  std::optional<uint16_t> p2pPort;
  std::vector<std::string> peers;
  std::optional<uint32_t> difficulty;
  std::optional<std::string> nodeId;
  std::string logFile;
  bool debug = false;

  app.add_option("-c,--config", configPath, "JSON config file")->check(CLI::ExistingFile);
  app.add_option("--host", host, "Address to bind");
  app.add_option("--advertise-host", advertiseHost,
                 "Address peers use to reach this node (default: --host)");
  app.add_option("-p,--port", port, "HTTP control port");
  app.add_option("--p2p-port", p2pPort, "P2P port (default: HTTP port + 1000)");
  app.add_option("--peer", peers, "Peer control address host:port (repeatable)");
  app.add_option("--difficulty", difficulty, "Leading hex zeros required by proof-of-work")
      ->check(CLI::Range(0u, powledger::ProofOfWork::MAX_DIFFICULTY));
  app.add_option("--node-id", nodeId, "Recipient of mining rewards (default: random)");
  app.add_option("--log-file", logFile, "Also write logs to this file");
  app.add_flag("--debug", debug, "Enable debug logging");
  CLI11_PARSE(app, argc, argv);

  auto rootLogger = powledger::logging::getRootLogger();
  rootLogger.setLevel(debug ? powledger::logging::Level::DEBUG : powledger::logging::Level::INFO);
  if (!logFile.empty()) {
    rootLogger.addFileHandler(logFile, powledger::logging::Level::DEBUG);
  }

  auto logger = powledger::logging::getLogger("pow.main");

  powledger::Node::Config config;
  if (!configPath.empty()) {
    auto loaded = powledger::Node::Config::load(configPath);
    if (!loaded) {
      logger.error << "Failed to load config: " << loaded.error().message;
      std::cerr << "Error: " << loaded.error().message << "\n";
      return 1;
    }
    config = loaded.value();
  }

  // Command line overrides the config file
  if (host) {
    config.host = *host;
  }
  if (advertiseHost) {
    config.advertiseHost = *advertiseHost;
  }
  if (port) {
    config.port = *port;
  }
  if (p2pPort) {
    config.p2pPort = *p2pPort;
  }
  if (!peers.empty()) {
    config.peers.insert(config.peers.end(), peers.begin(), peers.end());
  }
  if (difficulty) {
    config.difficulty = *difficulty;
  }
  if (nodeId) {
    config.nodeId = *nodeId;
  }

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  powledger::Node node(config);
  auto started = node.start();
  if (!started) {
    logger.error << "Failed to start node: " << started.error().message;
    std::cerr << "Error: " << started.error().message << "\n";
    return 1;
  }

  powledger::HttpServer::Config httpConfig;
  httpConfig.host = config.host;
  httpConfig.port = config.port;
  powledger::HttpServer http(httpConfig, node);
  auto httpStarted = http.start();
  if (!httpStarted) {
    logger.error << "Failed to start HTTP server: " << httpStarted.error().message;
    std::cerr << "Error: " << httpStarted.error().message << "\n";
    node.stop();
    return 1;
  }

  logger.info << "Node " << node.getNodeId() << " serving on " << config.host << ":"
              << http.getPort();
  std::cout << "Press Ctrl+C to stop the node...\n";

  {
    std::unique_lock<std::mutex> lock(g_mutex);
    g_cv.wait(lock, [] { return !g_running.load(); });
  }

  node.cancelMining();
  http.stop();
  node.stop();
  logger.info << "Node stopped";
  return 0;
}
