#include "Node.h"
#include "../lib/Utilities.h"

namespace powledger {

namespace {

bool readUnsigned(const nlohmann::json &j, const char *key, uint64_t max,
                  uint64_t &out, std::string &error) {
  if (!j.contains(key)) {
    return true;
  }
  const auto &value = j.at(key);
  if (!value.is_number_unsigned() || value.get<uint64_t>() > max) {
    error = std::string(key) + " must be an unsigned integer not above " +
            std::to_string(max);
    return false;
  }
  out = value.get<uint64_t>();
  return true;
}

bool readString(const nlohmann::json &j, const char *key, std::string &out,
                std::string &error) {
  if (!j.contains(key)) {
    return true;
  }
  const auto &value = j.at(key);
  if (!value.is_string()) {
    error = std::string(key) + " must be a string";
    return false;
  }
  out = value.get<std::string>();
  return true;
}

} // namespace

Node::Roe<uint16_t> Node::Config::getP2pPort() const {
  if (p2pPort) {
    return *p2pPort;
  }
  uint32_t derived = static_cast<uint32_t>(port) + PeerRegistry::P2P_PORT_OFFSET;
  if (derived > 65535) {
    return Error(E_CONFIG, "P2P port for HTTP port " + std::to_string(port) +
                               " is out of range, set p2pPort explicitly");
  }
  return static_cast<uint16_t>(derived);
}

Node::Roe<void> Node::Config::merge(const nlohmann::json &j) {
  if (!j.is_object()) {
    return Error(E_CONFIG, "Config must be a JSON object");
  }

  std::string error;
  uint64_t value = 0;

  if (!readString(j, "host", host, error) ||
      !readString(j, "advertiseHost", advertiseHost, error)) {
    return Error(E_CONFIG, error);
  }

  value = port;
  if (!readUnsigned(j, "port", 65535, value, error)) {
    return Error(E_CONFIG, error);
  }
  port = static_cast<uint16_t>(value);

  if (j.contains("p2pPort")) {
    if (!readUnsigned(j, "p2pPort", 65535, value, error)) {
      return Error(E_CONFIG, error);
    }
    p2pPort = static_cast<uint16_t>(value);
  }

  if (j.contains("peers")) {
    const auto &list = j.at("peers");
    if (!list.is_array()) {
      return Error(E_CONFIG, "peers must be an array of addresses");
    }
    peers.clear();
    for (const auto &peer : list) {
      if (!peer.is_string()) {
        return Error(E_CONFIG, "peers must be an array of addresses");
      }
      peers.push_back(peer.get<std::string>());
    }
  }

  value = difficulty;
  if (!readUnsigned(j, "difficulty", ProofOfWork::MAX_DIFFICULTY, value, error)) {
    return Error(E_CONFIG, error);
  }
  difficulty = static_cast<uint32_t>(value);

  if (!readString(j, "nodeId", nodeId, error) ||
      !readUnsigned(j, "connectTimeoutMs", UINT32_MAX, connectTimeoutMs, error) ||
      !readUnsigned(j, "ioTimeoutMs", UINT32_MAX, ioTimeoutMs, error) ||
      !readUnsigned(j, "httpTimeoutMs", UINT32_MAX, httpTimeoutMs, error) ||
      !readUnsigned(j, "maxMessageBytes", UINT64_MAX, maxMessageBytes, error)) {
    return Error(E_CONFIG, error);
  }

  return {};
}

Node::Roe<Node::Config> Node::Config::load(const std::string &path) {
  auto j = utl::loadJsonFile(path);
  if (!j) {
    return Error(E_CONFIG, j.error().message);
  }

  Config config;
  auto merged = config.merge(j.value());
  if (!merged) {
    return Error(E_CONFIG, path + ": " + merged.error().message);
  }
  return config;
}

PeerTransport::Config Node::makeTransportConfig(const Config &config) {
  PeerTransport::Config transport;
  transport.host = config.host;
  transport.advertiseHost = config.advertiseHost;
  transport.port = config.getP2pPort().valueOr(0);
  transport.connectTimeout = std::chrono::milliseconds(config.connectTimeoutMs);
  transport.ioTimeout = std::chrono::milliseconds(config.ioTimeoutMs);
  transport.maxMessageBytes = static_cast<size_t>(config.maxMessageBytes);
  return transport;
}

Node::Node(const Config &config)
    : Module("pow.node"), config_(config), ledger_(config.difficulty),
      chainSource_(std::chrono::milliseconds(config.httpTimeoutMs)),
      resolver_(ledger_, peers_, chainSource_),
      transport_(makeTransportConfig(config), ledger_, peers_, resolver_) {
  if (config_.nodeId.empty()) {
    config_.nodeId = utl::randomHex(16);
  }
}

Node::~Node() { stop(); }

Node::Roe<void> Node::start() {
  auto p2pPort = config_.getP2pPort();
  if (!p2pPort) {
    return p2pPort.error();
  }

  auto registered = registerNodes(config_.peers);
  if (!registered) {
    return registered.error();
  }

  auto started = transport_.start();
  if (!started) {
    return Error(E_START, started.error().message);
  }

  log().info << "Node " << config_.nodeId << " started, P2P at "
             << transport_.getEndpoint() << ", " << peers_.size() << " peers";

  for (const auto &peer : peers_.list()) {
    auto requested = transport_.requestChain(peer);
    if (!requested) {
      log().warning << "Chain request to " << peer
                    << " failed: " << requested.error().message;
    }
  }
  return {};
}

void Node::stop() {
  cancelMining();
  transport_.stop();
}

void Node::cancelMining() { miningCancelled_ = true; }

Node::Roe<Block> Node::mine() {
  const ProofOfWork &proofOfWork = ledger_.getProofOfWork();

  while (true) {
    Block last = ledger_.lastBlock();
    auto proof = proofOfWork.solve(last.proof, &miningCancelled_);
    if (!proof) {
      if (proof.error().code == ProofOfWork::E_CANCELLED) {
        return Error(E_CANCELLED, "Mining cancelled");
      }
      return Error(E_MINE, proof.error().message);
    }

    Transaction reward;
    reward.sender = REWARD_SENDER;
    reward.recipient = config_.nodeId;
    reward.amount = REWARD_AMOUNT;

    auto block = ledger_.mineBlock(proof.value(), Ledger::hash(last), reward);
    if (!block) {
      if (block.error().code == Ledger::E_STALE_PREVIOUS_HASH) {
        log().info << "Chain changed while mining, searching again";
        continue;
      }
      return Error(E_MINE, block.error().message);
    }

    Message announce;
    announce.body = NewBlock{ block.value() };
    size_t delivered = transport_.broadcast(announce);
    log().info << "Announced block " << block->index << " to " << delivered << " peers";
    return block.value();
  }
}

uint64_t Node::newTransaction(const Transaction &tx) {
  uint64_t index = ledger_.recordTransaction(tx);

  Message message;
  message.body = NewTransaction{ tx };
  size_t delivered = transport_.broadcast(message);
  log().debug << "Transaction for block " << index << " sent to " << delivered << " peers";
  return index;
}

Node::Roe<size_t> Node::registerNodes(const std::vector<std::string> &addresses) {
  for (const auto &address : addresses) {
    auto normalized = PeerRegistry::normalize(address);
    if (!normalized) {
      return Error(E_PEER, normalized.error().message);
    }
  }

  for (const auto &address : addresses) {
    auto registered = peers_.registerPeer(address);
    if (!registered) {
      return Error(E_PEER, registered.error().message);
    }
  }
  return peers_.size();
}

bool Node::resolve() { return resolver_.resolve(); }

} // namespace powledger
