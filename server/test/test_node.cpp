#include "../HttpServer.h"
#include "../Node.h"
#include "../../network/TcpServer.h"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <httplib.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <thread>

using namespace powledger;
using ::testing::HasSubstr;
using json = nlohmann::json;

namespace {

bool waitFor(const std::function<bool()> &condition, int timeoutMs = 5000) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return condition();
}

// Control port whose P2P companion (port + 1000) was free a moment ago
uint16_t findControlPort() {
  network::TcpServer probe;
  auto result = probe.listen({ "127.0.0.1", 0 });
  EXPECT_TRUE(result.isOk());
  return static_cast<uint16_t>(probe.getPort() - PeerRegistry::P2P_PORT_OFFSET);
}

// A node with its HTTP control surface, both on loopback
struct RunningNode {
  std::unique_ptr<Node> node;
  std::unique_ptr<HttpServer> http;
  std::string address;

  explicit RunningNode(const std::string &nodeId) {
    Node::Config config;
    config.host = "127.0.0.1";
    config.port = findControlPort();
    config.difficulty = 2;
    config.nodeId = nodeId;
    config.connectTimeoutMs = 500;
    config.ioTimeoutMs = 2000;
    config.httpTimeoutMs = 2000;
    node = std::make_unique<Node>(config);

    HttpServer::Config httpConfig;
    httpConfig.host = config.host;
    httpConfig.port = config.port;
    http = std::make_unique<HttpServer>(httpConfig, *node);
    address = "127.0.0.1:" + std::to_string(config.port);
  }

  ~RunningNode() {
    http->stop();
    node->stop();
  }

  void start() {
    auto started = node->start();
    ASSERT_TRUE(started.isOk()) << started.error().message;
    auto httpStarted = http->start();
    ASSERT_TRUE(httpStarted.isOk()) << httpStarted.error().message;
  }

  httplib::Client client() const {
    httplib::Client c("http://" + address);
    c.set_read_timeout(10, 0);
    return c;
  }
};

} // namespace

// ============================================================================
// Config
// ============================================================================

TEST(NodeConfigTest, DefaultP2pPortIsOffsetFromHttpPort) {
  Node::Config config;
  config.port = 5000;
  EXPECT_EQ(config.getP2pPort().value(), 6000);

  config.p2pPort = 7000;
  EXPECT_EQ(config.getP2pPort().value(), 7000);

  config.p2pPort.reset();
  config.port = 65000;
  EXPECT_TRUE(config.getP2pPort().isError());
}

TEST(NodeConfigTest, MergeOverlaysKnownKeys) {
  Node::Config config;
  json j = { { "host", "0.0.0.0" },          { "port", 5050 },
             { "peers", { "127.0.0.1:5001" } }, { "difficulty", 3 },
             { "nodeId", "miner-7" },         { "ioTimeoutMs", 250 },
             { "somethingElse", true } };
  auto merged = config.merge(j);
  ASSERT_TRUE(merged.isOk()) << merged.error().message;
  EXPECT_EQ(config.host, "0.0.0.0");
  EXPECT_EQ(config.port, 5050);
  EXPECT_EQ(config.getP2pPort().value(), 6050);
  EXPECT_EQ(config.peers, std::vector<std::string>{ "127.0.0.1:5001" });
  EXPECT_EQ(config.difficulty, 3u);
  EXPECT_EQ(config.nodeId, "miner-7");
  EXPECT_EQ(config.ioTimeoutMs, 250u);
  EXPECT_EQ(config.connectTimeoutMs, 3000u);
}

TEST(NodeConfigTest, AdvertiseHostIsStampedOnPeerMessages) {
  Node::Config config;
  ASSERT_TRUE(config.merge(json{ { "host", "0.0.0.0" }, { "advertiseHost", "10.0.0.7" },
                                 { "port", 5050 } })
                  .isOk());
  EXPECT_EQ(config.advertiseHost, "10.0.0.7");

  Node node(config);
  EXPECT_EQ(node.getTransport().getEndpoint(), (network::TcpEndpoint{ "10.0.0.7", 6050 }));

  Node::Config plain;
  plain.port = 5050;
  Node unadvertised(plain);
  EXPECT_EQ(unadvertised.getTransport().getEndpoint(),
            (network::TcpEndpoint{ "127.0.0.1", 6050 }));
}

TEST(NodeConfigTest, MergeRejectsWrongTypes) {
  Node::Config config;
  EXPECT_TRUE(config.merge(json{ { "advertiseHost", 7 } }).isError());
  EXPECT_TRUE(config.merge(json{ { "port", "5000" } }).isError());
  EXPECT_TRUE(config.merge(json{ { "port", 70000 } }).isError());
  EXPECT_TRUE(config.merge(json{ { "peers", "127.0.0.1:5001" } }).isError());
  EXPECT_TRUE(config.merge(json{ { "difficulty", 65 } }).isError());
  EXPECT_TRUE(config.merge(json::array()).isError());
}

TEST(NodeConfigTest, LoadFromFile) {
  auto path = std::filesystem::temp_directory_path() / "pow_node_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"port": 5123, "p2pPort": 7123, "nodeId": "from-file"})";
  }

  auto config = Node::Config::load(path.string());
  std::filesystem::remove(path);
  ASSERT_TRUE(config.isOk()) << config.error().message;
  EXPECT_EQ(config->port, 5123);
  EXPECT_EQ(config->getP2pPort().value(), 7123);
  EXPECT_EQ(config->nodeId, "from-file");

  EXPECT_TRUE(Node::Config::load("/nonexistent/pow.json").isError());
}

// ============================================================================
// Node operations
// ============================================================================

TEST(NodeTest, GeneratesNodeIdWhenMissing) {
  Node::Config config;
  config.difficulty = 1;
  Node node(config);
  EXPECT_EQ(node.getNodeId().size(), 32u);
}

TEST(NodeTest, MineAppendsRewardForNode) {
  Node::Config config;
  config.difficulty = 2;
  config.nodeId = "miner-1";
  Node node(config);

  EXPECT_EQ(node.newTransaction({ "alice", "bob", 5 }), 2u);
  auto block = node.mine();
  ASSERT_TRUE(block.isOk()) << block.error().message;
  ASSERT_EQ(block->transactions.size(), 2u);
  EXPECT_EQ(block->transactions[0].sender, "alice");
  EXPECT_EQ(block->transactions[1], (Transaction{ "0", "miner-1", 1 }));
  EXPECT_EQ(node.getChain().size(), 2u);
}

TEST(NodeTest, CancelledMiningFails) {
  Node::Config config;
  config.difficulty = 2;
  Node node(config);
  node.cancelMining();

  auto block = node.mine();
  ASSERT_TRUE(block.isError());
  EXPECT_EQ(block.error().code, Node::E_CANCELLED);
  EXPECT_EQ(node.getChain().size(), 1u);
}

TEST(NodeTest, RegisterNodesIsAllOrNothing) {
  Node node(Node::Config{});
  auto result = node.registerNodes({ "127.0.0.1:5001", "bad address" });
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, Node::E_PEER);
  EXPECT_EQ(node.getPeers().size(), 0u);

  result = node.registerNodes({ "127.0.0.1:5001", "http://127.0.0.1:5002" });
  ASSERT_TRUE(result.isOk());
  EXPECT_EQ(result.value(), 2u);
}

// ============================================================================
// HTTP control surface
// ============================================================================

TEST(HttpServerTest, ChainStartsWithGenesis) {
  RunningNode a("node-a");
  a.start();

  auto res = a.client().Get("/chain");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  json body = json::parse(res->body);
  EXPECT_EQ(body["length"], 1);
  ASSERT_EQ(body["chain"].size(), 1u);
  EXPECT_EQ(body["chain"][0]["previous_hash"], "1");
  EXPECT_EQ(body["chain"][0]["proof"], 100);
}

TEST(HttpServerTest, TransactionValidation) {
  RunningNode a("node-a");
  a.start();
  auto client = a.client();

  auto bad = client.Post("/transactions/new", R"({"sender":"x","recipient":"y"})",
                         "application/json");
  ASSERT_TRUE(bad);
  EXPECT_EQ(bad->status, 400);
  EXPECT_THAT(bad->body, HasSubstr("Missing values"));

  auto notJson = client.Post("/transactions/new", "sender=x", "text/plain");
  ASSERT_TRUE(notJson);
  EXPECT_EQ(notJson->status, 400);

  auto good = client.Post("/transactions/new",
                          R"({"sender":"x","recipient":"y","amount":5})", "application/json");
  ASSERT_TRUE(good);
  EXPECT_EQ(good->status, 201);
  EXPECT_EQ(json::parse(good->body)["message"], "Transaction will be added to Block 2");

  auto numeric = client.Post("/transactions/new",
                             R"({"sender":17,"recipient":"y","amount":1})", "application/json");
  ASSERT_TRUE(numeric);
  EXPECT_EQ(numeric->status, 201);

  auto structured = client.Post("/transactions/new",
                                R"({"sender":{"id":1},"recipient":"y","amount":1})",
                                "application/json");
  ASSERT_TRUE(structured);
  EXPECT_EQ(structured->status, 400);
}

TEST(HttpServerTest, MineReturnsForgedBlock) {
  RunningNode a("node-a");
  a.start();
  auto client = a.client();

  auto res = client.Get("/mine");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  json body = json::parse(res->body);
  EXPECT_EQ(body["message"], "New Block Forged");
  EXPECT_EQ(body["index"], 2);
  ASSERT_EQ(body["transactions"].size(), 1u);
  EXPECT_EQ(body["transactions"][0]["recipient"], "node-a");
  EXPECT_TRUE(body.contains("proof"));
  EXPECT_TRUE(body.contains("previous_hash"));
}

TEST(HttpServerTest, MineAfterCancelIsUnavailable) {
  RunningNode a("node-a");
  a.start();
  a.node->cancelMining();

  auto res = a.client().Get("/mine");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 503);
}

TEST(HttpServerTest, RegisterNodes) {
  RunningNode a("node-a");
  a.start();
  auto client = a.client();

  auto missing = client.Post("/nodes/register", R"({"peers":[]})", "application/json");
  ASSERT_TRUE(missing);
  EXPECT_EQ(missing->status, 400);

  auto empty = client.Post("/nodes/register", "{}", "application/json");
  ASSERT_TRUE(empty);
  EXPECT_EQ(empty->status, 400);
  EXPECT_EQ(json::parse(empty->body)["error"], "Please supply a valid list of nodes");
  EXPECT_TRUE(a.node->getPeers().list().empty());

  auto invalid = client.Post("/nodes/register", R"({"nodes":["nope"]})", "application/json");
  ASSERT_TRUE(invalid);
  EXPECT_EQ(invalid->status, 400);

  auto ok = client.Post("/nodes/register",
                        R"({"nodes":["http://127.0.0.1:5001","127.0.0.1:5001"]})",
                        "application/json");
  ASSERT_TRUE(ok);
  EXPECT_EQ(ok->status, 201);
  json body = json::parse(ok->body);
  EXPECT_EQ(body["message"], "New nodes have been added");
  EXPECT_EQ(body["total_nodes"], json::array({ "127.0.0.1:5001" }));
}

TEST(HttpServerTest, StopRightAfterStartIsPrompt) {
  RunningNode a("node-a");
  a.start();

  auto started = std::chrono::steady_clock::now();
  a.http->stop();
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(900));
  EXPECT_FALSE(a.http->isRunning());

  // A second stop has nothing to wait for
  started = std::chrono::steady_clock::now();
  a.http->stop();
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(100));
}

TEST(HttpServerTest, ResolvePullsLongerChain) {
  RunningNode a("node-a");
  RunningNode b("node-b");
  a.start();
  b.start();

  ASSERT_TRUE(a.client().Get("/mine"));
  ASSERT_TRUE(a.client().Get("/mine"));

  ASSERT_TRUE(b.node->registerNodes({ a.address }).isOk());
  auto res = b.client().Get("/nodes/resolve");
  ASSERT_TRUE(res);
  json body = json::parse(res->body);
  EXPECT_EQ(body["message"], "Our chain was replaced");
  EXPECT_EQ(body["new_chain"].size(), 3u);
  EXPECT_EQ(b.node->getChain(), a.node->getChain());

  ASSERT_TRUE(a.node->registerNodes({ b.address }).isOk());
  res = a.client().Get("/nodes/resolve");
  ASSERT_TRUE(res);
  body = json::parse(res->body);
  EXPECT_EQ(body["message"], "Our chain is authoritative");
  EXPECT_EQ(body["chain"].size(), 3u);
}

TEST(HttpServerTest, MinedBlockPropagatesToPeers) {
  RunningNode a("node-a");
  RunningNode b("node-b");
  a.start();
  b.start();
  ASSERT_TRUE(a.node->registerNodes({ b.address }).isOk());
  ASSERT_TRUE(b.node->registerNodes({ a.address }).isOk());

  auto res = a.client().Get("/mine");
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200);

  ASSERT_TRUE(waitFor([&]() { return b.node->getChain().size() == 2; }));
  EXPECT_EQ(b.node->getChain(), a.node->getChain());
}

TEST(HttpServerTest, TransactionPropagatesToPeers) {
  RunningNode a("node-a");
  RunningNode b("node-b");
  a.start();
  b.start();
  ASSERT_TRUE(a.node->registerNodes({ b.address }).isOk());

  auto res = a.client().Post("/transactions/new",
                             R"({"sender":"alice","recipient":"bob","amount":2})",
                             "application/json");
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 201);

  ASSERT_TRUE(waitFor([&]() { return b.node->getLedger().getPendingTransactions().size() == 1; }));
  EXPECT_EQ(a.node->getLedger().getPendingTransactions().size(), 1u);
}

TEST(HttpServerTest, JoiningNodeBootstrapsChainOnStart) {
  RunningNode a("node-a");
  a.start();
  ASSERT_TRUE(a.client().Get("/mine"));

  Node::Config config;
  config.host = "127.0.0.1";
  config.port = findControlPort();
  config.difficulty = 2;
  config.peers = { a.address };
  Node joiner(config);
  ASSERT_TRUE(joiner.start().isOk());

  ASSERT_TRUE(waitFor([&]() { return joiner.getChain().size() == 2; }));
  EXPECT_EQ(joiner.getChain(), a.node->getChain());
  joiner.stop();
}
