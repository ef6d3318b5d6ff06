#include "../PeerTransport.h"
#include "../../network/TcpClient.h"
#include "../../network/TcpServer.h"
#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using namespace powledger;

namespace {

constexpr uint32_t DIFFICULTY = 2;

class FakeChainSource : public ChainSource {
public:
  void setChain(const std::string &address, const Chain &chain) {
    std::lock_guard<std::mutex> lock(mutex_);
    chains_[address] = chain;
  }

  Roe<FetchedChain> fetchChain(const std::string &address) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chains_.find(address);
    if (it == chains_.end()) {
      return Error(E_UNREACHABLE, "Unreachable: " + address);
    }
    return FetchedChain{ it->second.size(), it->second };
  }

private:
  std::mutex mutex_;
  std::map<std::string, Chain> chains_;
};

// Free port above the P2P offset, so that port - 1000 is a usable control port
uint16_t findP2pPort() {
  network::TcpServer probe;
  auto result = probe.listen({ "127.0.0.1", 0 });
  EXPECT_TRUE(result.isOk());
  return probe.getPort();
}

bool waitFor(const std::function<bool()> &condition, int timeoutMs = 3000) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return condition();
}

void mineBlocks(Ledger &ledger, int count) {
  for (int i = 0; i < count; ++i) {
    auto proof = ledger.getProofOfWork().solve(ledger.lastBlock().proof);
    ASSERT_TRUE(proof.isOk());
    ASSERT_TRUE(ledger.mineBlock(proof.value()).isOk());
  }
}

struct TestPeer {
  Ledger ledger{ DIFFICULTY };
  PeerRegistry peers;
  FakeChainSource source;
  ConsensusResolver resolver{ ledger, peers, source };
  std::unique_ptr<PeerTransport> transport;
  std::string controlAddress;

  explicit TestPeer(const std::string &host = "127.0.0.1",
                    const std::string &advertiseHost = "") {
    PeerTransport::Config config;
    config.host = host;
    config.advertiseHost = advertiseHost;
    config.port = findP2pPort();
    config.connectTimeout = std::chrono::milliseconds(500);
    config.ioTimeout = std::chrono::milliseconds(1000);
    transport = std::make_unique<PeerTransport>(config, ledger, peers, resolver);
    controlAddress = "127.0.0.1:" + std::to_string(config.port - PeerRegistry::P2P_PORT_OFFSET);
  }

  void start() {
    auto started = transport->start();
    ASSERT_TRUE(started.isOk()) << started.error().message;
  }
};

Message transactionMessage(const std::string &sender, bool relayed = false) {
  Message message;
  message.body = NewTransaction{ { sender, "bob", 4 } };
  message.relayed = relayed;
  return message;
}

// Connected loopback socket that the caller writes to directly
int connectRaw(uint16_t port) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
  if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    ::close(fd);
    return -1;
  }
  return fd;
}

} // namespace

TEST(PeerTransportTest, StartAndStop) {
  TestPeer peer;
  peer.start();
  EXPECT_TRUE(peer.transport->isRunning());

  auto again = peer.transport->start();
  EXPECT_TRUE(again.isError());

  peer.transport->stop();
  EXPECT_FALSE(peer.transport->isRunning());
}

TEST(PeerTransportTest, RecordsIncomingTransaction) {
  TestPeer receiver;
  TestPeer sender;
  receiver.start();

  auto sent = sender.transport->send(receiver.transport->getEndpoint(),
                                     transactionMessage("alice"));
  ASSERT_TRUE(sent.isOk()) << sent.error().message;

  ASSERT_TRUE(waitFor([&]() { return receiver.ledger.getPendingTransactions().size() == 1; }));
  EXPECT_EQ(receiver.ledger.getPendingTransactions()[0].sender, "alice");
}

TEST(PeerTransportTest, RelaysTransactionOnce) {
  TestPeer origin;
  TestPeer middle;
  TestPeer far;
  middle.start();
  far.start();
  origin.start();

  // middle knows both; far knows middle
  ASSERT_TRUE(middle.peers.registerPeer(origin.controlAddress).isOk());
  ASSERT_TRUE(middle.peers.registerPeer(far.controlAddress).isOk());
  ASSERT_TRUE(far.peers.registerPeer(middle.controlAddress).isOk());

  ASSERT_TRUE(origin.transport->send(middle.transport->getEndpoint(), transactionMessage("alice"))
                  .isOk());

  ASSERT_TRUE(waitFor([&]() { return far.ledger.getPendingTransactions().size() == 1; }));
  EXPECT_EQ(middle.ledger.getPendingTransactions().size(), 1u);

  // Give a second hop time to show up if it were going to
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  EXPECT_EQ(far.ledger.getPendingTransactions().size(), 1u);
  EXPECT_EQ(middle.ledger.getPendingTransactions().size(), 1u);
  // The sending node is excluded from the relay
  EXPECT_TRUE(origin.ledger.getPendingTransactions().empty());
}

TEST(PeerTransportTest, RelayedTransactionIsNotForwarded) {
  TestPeer receiver;
  TestPeer neighbour;
  TestPeer sender;
  receiver.start();
  neighbour.start();
  ASSERT_TRUE(receiver.peers.registerPeer(neighbour.controlAddress).isOk());

  ASSERT_TRUE(sender.transport->send(receiver.transport->getEndpoint(),
                                     transactionMessage("carol", true))
                  .isOk());

  ASSERT_TRUE(waitFor([&]() { return receiver.ledger.getPendingTransactions().size() == 1; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  EXPECT_TRUE(neighbour.ledger.getPendingTransactions().empty());
}

TEST(PeerTransportTest, RequestChainPushesLongerChain) {
  TestPeer holder;
  TestPeer joiner;
  mineBlocks(holder.ledger, 2);
  holder.start();
  joiner.start();

  ASSERT_TRUE(joiner.transport->requestChain(holder.controlAddress).isOk());

  ASSERT_TRUE(waitFor([&]() { return joiner.ledger.getLength() == 3; }));
  EXPECT_EQ(joiner.ledger.getChain(), holder.ledger.getChain());
}

TEST(PeerTransportTest, PushedShorterChainIsIgnored) {
  TestPeer holder;
  TestPeer joiner;
  mineBlocks(joiner.ledger, 2);
  holder.start();
  joiner.start();

  Chain before = joiner.ledger.getChain();
  ASSERT_TRUE(joiner.transport->requestChain(holder.controlAddress).isOk());
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  EXPECT_EQ(joiner.ledger.getChain(), before);
}

TEST(PeerTransportTest, NewBlockTriggersResolution) {
  TestPeer miner;
  TestPeer follower;
  mineBlocks(miner.ledger, 1);
  follower.start();

  ASSERT_TRUE(follower.peers.registerPeer(miner.controlAddress).isOk());
  follower.source.setChain(miner.controlAddress, miner.ledger.getChain());

  Message announce;
  announce.body = NewBlock{ miner.ledger.lastBlock() };
  ASSERT_TRUE(miner.transport->send(follower.transport->getEndpoint(), announce).isOk());

  ASSERT_TRUE(waitFor([&]() { return follower.ledger.getLength() == 2; }));
  EXPECT_EQ(follower.ledger.getChain(), miner.ledger.getChain());
}

TEST(PeerTransportTest, SurvivesMalformedAndUnknownMessages) {
  TestPeer receiver;
  receiver.start();
  const auto endpoint = receiver.transport->getEndpoint();

  for (const std::string payload : { std::string("garbage"), std::string(R"({"type":"PING"})"),
                                     std::string(R"({"type":"NEW_TRANSACTION"})") }) {
    network::TcpClient client;
    ASSERT_TRUE(client.connect(endpoint, std::chrono::milliseconds(500)).isOk());
    ASSERT_TRUE(client.sendAndShutdown(payload).isOk());
  }

  TestPeer sender;
  ASSERT_TRUE(sender.transport->send(endpoint, transactionMessage("dave")).isOk());
  ASSERT_TRUE(waitFor([&]() { return receiver.ledger.getPendingTransactions().size() == 1; }));
  EXPECT_EQ(receiver.ledger.getPendingTransactions()[0].sender, "dave");
}

TEST(PeerTransportTest, BroadcastCountsDeliveriesAndSkipsSelf) {
  TestPeer hub;
  TestPeer live;
  TestPeer dead;
  hub.start();
  live.start();
  // `dead` never starts listening

  ASSERT_TRUE(hub.peers.registerPeer(hub.controlAddress).isOk());
  ASSERT_TRUE(hub.peers.registerPeer(live.controlAddress).isOk());
  ASSERT_TRUE(hub.peers.registerPeer(dead.controlAddress).isOk());

  size_t delivered = hub.transport->broadcast(transactionMessage("erin"));
  EXPECT_EQ(delivered, 1u);
  ASSERT_TRUE(waitFor([&]() { return live.ledger.getPendingTransactions().size() == 1; }));
  EXPECT_TRUE(hub.ledger.getPendingTransactions().empty());
}

TEST(PeerTransportTest, BroadcastHonoursExclusion) {
  TestPeer hub;
  TestPeer live;
  hub.start();
  live.start();
  ASSERT_TRUE(hub.peers.registerPeer(live.controlAddress).isOk());

  size_t delivered = hub.transport->broadcast(transactionMessage("frank"),
                                              live.transport->getEndpoint());
  EXPECT_EQ(delivered, 0u);
}

TEST(PeerTransportTest, SendToClosedPortFails) {
  TestPeer sender;
  TestPeer absent;
  auto sent = sender.transport->send(absent.transport->getEndpoint(), transactionMessage("x"));
  ASSERT_TRUE(sent.isError());
  EXPECT_EQ(sent.error().code, PeerTransport::E_CONNECT);
}

TEST(PeerTransportTest, RelayExcludesSenderRegisteredUnderHostname) {
  TestPeer origin;
  TestPeer middle;
  TestPeer far;
  origin.start();
  middle.start();
  far.start();

  // middle knows the origin by name, the origin stamps its numeric address
  const std::string originByName =
      "localhost:" + std::to_string(origin.transport->getEndpoint().port -
                                    PeerRegistry::P2P_PORT_OFFSET);
  ASSERT_TRUE(middle.peers.registerPeer(originByName).isOk());
  ASSERT_TRUE(middle.peers.registerPeer(far.controlAddress).isOk());

  ASSERT_TRUE(origin.transport->send(middle.transport->getEndpoint(), transactionMessage("gina"))
                  .isOk());

  ASSERT_TRUE(waitFor([&]() { return far.ledger.getPendingTransactions().size() == 1; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  EXPECT_TRUE(origin.ledger.getPendingTransactions().empty());
}

TEST(PeerTransportTest, OriginIgnoresRelayedCopyOfItsOwnTransaction) {
  TestPeer origin;
  TestPeer middle;
  origin.start();

  Message relayed = transactionMessage("hank", true);
  relayed.origin = network::TcpEndpoint{ "localhost", origin.transport->getEndpoint().port };
  ASSERT_TRUE(middle.transport->send(origin.transport->getEndpoint(), relayed).isOk());

  // A relayed copy from someone else is still recorded
  Message foreign = transactionMessage("ivy", true);
  foreign.origin = middle.transport->getEndpoint();
  ASSERT_TRUE(middle.transport->send(origin.transport->getEndpoint(), foreign).isOk());

  ASSERT_TRUE(waitFor([&]() { return origin.ledger.getPendingTransactions().size() == 1; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  ASSERT_EQ(origin.ledger.getPendingTransactions().size(), 1u);
  EXPECT_EQ(origin.ledger.getPendingTransactions()[0].sender, "ivy");
}

TEST(PeerTransportTest, BroadcastSkipsSelfUnderAnotherSpelling) {
  TestPeer hub;
  hub.start();
  const uint16_t controlPort =
      static_cast<uint16_t>(hub.transport->getEndpoint().port - PeerRegistry::P2P_PORT_OFFSET);
  ASSERT_TRUE(hub.peers.registerPeer("localhost:" + std::to_string(controlPort)).isOk());

  EXPECT_EQ(hub.transport->broadcast(transactionMessage("jack")), 0u);
  EXPECT_TRUE(hub.transport->isSelf({ "localhost", hub.transport->getEndpoint().port }));
  EXPECT_FALSE(hub.transport->isSelf({ "127.0.0.1", 1 }));
}

TEST(PeerTransportTest, AdvertiseHostIsStampedAsSender) {
  TestPeer bound("0.0.0.0");
  EXPECT_EQ(bound.transport->getEndpoint().address, "0.0.0.0");

  TestPeer advertised("0.0.0.0", "127.0.0.1");
  EXPECT_EQ(advertised.transport->getEndpoint().address, "127.0.0.1");
  EXPECT_TRUE(advertised.transport->isSelf({ "127.0.0.1", advertised.transport->getEndpoint().port }));
}

TEST(PeerTransportTest, ChainRequestFromWildcardListenerIsAnswered) {
  TestPeer holder;
  TestPeer joiner("0.0.0.0");
  mineBlocks(holder.ledger, 2);
  holder.start();
  joiner.start();

  // joiner stamps 0.0.0.0; holder answers the address the request came from
  ASSERT_TRUE(joiner.transport->requestChain(holder.controlAddress).isOk());

  ASSERT_TRUE(waitFor([&]() { return joiner.ledger.getLength() == 3; }));
  EXPECT_EQ(joiner.ledger.getChain(), holder.ledger.getChain());
}

TEST(PeerTransportTest, RequestChainWithoutSenderIsIgnored) {
  TestPeer holder;
  mineBlocks(holder.ledger, 1);
  holder.start();

  network::TcpClient client;
  ASSERT_TRUE(client.connect(holder.transport->getEndpoint(), std::chrono::milliseconds(500))
                  .isOk());
  ASSERT_TRUE(client.sendAndShutdown(R"({"type":"REQUEST_CHAIN","payload":null})").isOk());

  // The node keeps serving afterwards
  TestPeer sender;
  ASSERT_TRUE(sender.transport->send(holder.transport->getEndpoint(), transactionMessage("kim"))
                  .isOk());
  ASSERT_TRUE(waitFor([&]() { return holder.ledger.getPendingTransactions().size() == 1; }));
  EXPECT_EQ(holder.ledger.getLength(), 2u);
}

TEST(PeerTransportTest, StopIsNotHeldUpByTricklingPeer) {
  TestPeer receiver;
  receiver.start();

  int fd = connectRaw(receiver.transport->getEndpoint().port);
  ASSERT_GE(fd, 0);

  // Every byte lands within the per-read timeout, the message never completes
  std::atomic<bool> done{ false };
  std::thread trickle([fd, &done]() {
    while (!done) {
      if (::send(fd, "{", 1, MSG_NOSIGNAL) < 0) {
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  auto started = std::chrono::steady_clock::now();
  receiver.transport->stop();
  auto elapsed = std::chrono::steady_clock::now() - started;

  done = true;
  trickle.join();
  ::close(fd);

  // ioTimeout is 1000ms and covers the whole message
  EXPECT_LT(elapsed, std::chrono::milliseconds(2500));
  EXPECT_TRUE(receiver.ledger.getPendingTransactions().empty());
}
