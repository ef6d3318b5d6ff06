#include "HttpServer.h"
#include "../lib/Utilities.h"

#include <chrono>
#include <nlohmann/json.hpp>
#include <thread>

using json = nlohmann::json;

namespace powledger {

namespace {

void setJson(httplib::Response &res, int status, const json &body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

void setJsonError(httplib::Response &res, int status, const std::string &message) {
  setJson(res, status, json{ { "error", message } });
}

} // namespace

HttpServer::HttpServer(const Config &config, Node &node)
    : Service("pow.node.http"), config_(config), node_(node) {
  registerRoutes();
}

HttpServer::~HttpServer() { stop(); }

void HttpServer::registerRoutes() {
  server_.set_logger([this](const httplib::Request &req, const httplib::Response &res) {
    log().debug << req.method << " " << req.path << " " << res.status << " ("
                << (req.remote_addr.empty() ? "-" : req.remote_addr) << ")";
  });

  server_.Get("/mine", [this](const httplib::Request &, httplib::Response &res) {
    handleMine(res);
  });
  server_.Post("/transactions/new", [this](const httplib::Request &req, httplib::Response &res) {
    handleNewTransaction(req, res);
  });
  server_.Get("/chain", [this](const httplib::Request &, httplib::Response &res) {
    handleChain(res);
  });
  server_.Post("/nodes/register", [this](const httplib::Request &req, httplib::Response &res) {
    handleRegisterNodes(req, res);
  });
  server_.Get("/nodes/resolve", [this](const httplib::Request &, httplib::Response &res) {
    handleResolve(res);
  });
}

Service::Roe<void> HttpServer::onStart() {
  if (config_.port == 0) {
    int bound = server_.bind_to_any_port(config_.host);
    if (bound <= 0) {
      return Service::Error(1, "Failed to bind HTTP server to " + config_.host);
    }
    port_ = static_cast<uint16_t>(bound);
  } else {
    if (!server_.bind_to_port(config_.host, config_.port)) {
      return Service::Error(1, "Failed to bind HTTP server to " + config_.host + ":" +
                                   std::to_string(config_.port));
    }
    port_ = config_.port;
  }
  listenDone_ = false;
  log().info << "HTTP listening on " << config_.host << ":" << port_;
  return {};
}

void HttpServer::runLoop() {
  if (!server_.listen_after_bind()) {
    log().error << "HTTP server stopped unexpectedly";
  }
  listenDone_ = true;
}

void HttpServer::onStopRequested() {
  // listen_after_bind() may not have entered its accept loop yet, or may
  // already have left it
  for (int i = 0; i < 100 && !server_.is_running() && !listenDone_; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  server_.stop();
}

void HttpServer::handleMine(httplib::Response &res) {
  auto block = node_.mine();
  if (!block) {
    int status = block.error().code == Node::E_CANCELLED ? 503 : 500;
    setJsonError(res, status, block.error().message);
    return;
  }

  json body = block->toJson();
  body.erase("timestamp");
  body["message"] = "New Block Forged";
  setJson(res, 200, body);
}

void HttpServer::handleNewTransaction(const httplib::Request &req, httplib::Response &res) {
  auto parsed = utl::parseJson(req.body);
  if (!parsed) {
    setJsonError(res, 400, "Invalid JSON: " + parsed.error().message);
    return;
  }

  auto tx = Transaction::fromJson(parsed.value());
  if (!tx) {
    setJsonError(res, 400, tx.error().message);
    return;
  }

  uint64_t index = node_.newTransaction(tx.value());
  setJson(res, 201,
          json{ { "message", "Transaction will be added to Block " + std::to_string(index) } });
}

void HttpServer::handleChain(httplib::Response &res) {
  Chain chain = node_.getChain();
  setJson(res, 200, json{ { "chain", chainToJson(chain) }, { "length", chain.size() } });
}

void HttpServer::handleRegisterNodes(const httplib::Request &req, httplib::Response &res) {
  auto parsed = utl::parseJson(req.body);
  if (!parsed) {
    setJsonError(res, 400, "Invalid JSON: " + parsed.error().message);
    return;
  }

  const json &body = parsed.value();
  if (!body.is_object() || !body.contains("nodes") || !body["nodes"].is_array()) {
    setJsonError(res, 400, "Please supply a valid list of nodes");
    return;
  }

  std::vector<std::string> addresses;
  for (const auto &item : body["nodes"]) {
    if (!item.is_string()) {
      setJsonError(res, 400, "Please supply a valid list of nodes");
      return;
    }
    addresses.push_back(item.get<std::string>());
  }

  auto registered = node_.registerNodes(addresses);
  if (!registered) {
    setJsonError(res, 400, registered.error().message);
    return;
  }

  json nodes = json::array();
  for (const auto &peer : node_.getPeers().list()) {
    nodes.push_back(peer);
  }
  setJson(res, 201, json{ { "message", "New nodes have been added" }, { "total_nodes", nodes } });
}

void HttpServer::handleResolve(httplib::Response &res) {
  bool replaced = node_.resolve();
  json chain = chainToJson(node_.getChain());
  if (replaced) {
    setJson(res, 200, json{ { "message", "Our chain was replaced" }, { "new_chain", chain } });
  } else {
    setJson(res, 200, json{ { "message", "Our chain is authoritative" }, { "chain", chain } });
  }
}

} // namespace powledger
