#include "PeerTransport.h"
#include "../network/TcpClient.h"

#include <system_error>
#include <thread>
#include <type_traits>

namespace powledger {

namespace {

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

PeerTransport::PeerTransport(const Config &config, Ledger &ledger,
                             const PeerRegistry &peers, ConsensusResolver &resolver)
    : Service("pow.node.transport"), config_(config), ledger_(ledger), peers_(peers),
      resolver_(resolver) {}

PeerTransport::~PeerTransport() { stop(); }

network::TcpEndpoint PeerTransport::getEndpoint() const {
  const std::string &host = config_.advertiseHost.empty() ? config_.host : config_.advertiseHost;
  return network::TcpEndpoint{ host, config_.port };
}

network::TcpEndpoint PeerTransport::resolveOrKeep(const network::TcpEndpoint &endpoint) const {
  if (endpoint.isWildcard()) {
    return endpoint;
  }
  auto resolved = network::TcpClient::resolve(endpoint);
  if (!resolved) {
    log().debug << "Cannot resolve " << endpoint << ": " << resolved.error().message;
    return endpoint;
  }
  return resolved.value();
}

bool PeerTransport::sameNode(const network::TcpEndpoint &a, const network::TcpEndpoint &b) {
  if (a.port != b.port) {
    return false;
  }
  if (a.address == b.address) {
    return true;
  }
  // A wildcard listener is reachable on loopback
  return (a.isWildcard() && b.isLoopback()) || (b.isWildcard() && a.isLoopback());
}

bool PeerTransport::isSelf(const network::TcpEndpoint &endpoint) const {
  const network::TcpEndpoint candidate = resolveOrKeep(endpoint);
  return sameNode(candidate, resolveOrKeep(getEndpoint())) ||
         sameNode(candidate, resolveOrKeep({ config_.host, config_.port }));
}

Service::Roe<void> PeerTransport::onStart() {
  auto result = server_.listen({ config_.host, config_.port });
  if (!result) {
    return Service::Error(E_LISTEN, result.error().message);
  }
  // Port 0 binds an ephemeral port; advertise the real one
  config_.port = server_.getPort();
  log().info << "P2P listening on " << getEndpoint();
  return {};
}

void PeerTransport::runLoop() {
  while (!isStopSet()) {
    auto ready = server_.waitForEvents(100);
    if (!ready) {
      if (ready.error().code != network::TcpServer::E_TIMEOUT) {
        log().error << "Listener failed: " << ready.error().message;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
      continue;
    }
    acceptPending();
  }
}

void PeerTransport::acceptPending() {
  while (true) {
    auto accepted = server_.accept();
    if (!accepted) {
      if (accepted.error().code != network::TcpServer::E_NO_PENDING) {
        log().warning << "Accept failed: " << accepted.error().message;
      }
      return;
    }

    {
      std::lock_guard<std::mutex> lock(handlersMutex_);
      ++activeHandlers_;
    }

    try {
      std::thread([this, connection = std::move(accepted.value())]() mutable {
        handleConnection(std::move(connection));
      }).detach();
    } catch (const std::system_error &e) {
      log().error << "Failed to spawn connection handler: " << e.what();
      std::lock_guard<std::mutex> lock(handlersMutex_);
      --activeHandlers_;
      handlersCv_.notify_all();
    }
  }
}

void PeerTransport::onStop() {
  server_.stop();

  // Each handler reads under a total deadline of ioTimeout
  std::unique_lock<std::mutex> lock(handlersMutex_);
  handlersCv_.wait(lock, [this] { return activeHandlers_ == 0; });
}

void PeerTransport::handleConnection(network::TcpConnection connection) {
  struct HandlerGuard {
    PeerTransport *transport;
    ~HandlerGuard() {
      std::lock_guard<std::mutex> lock(transport->handlersMutex_);
      --transport->activeHandlers_;
      transport->handlersCv_.notify_all();
    }
  } guard{ this };

  const network::TcpEndpoint peer = connection.getPeerEndpoint();

  auto timeout = connection.setTimeout(config_.ioTimeout);
  if (!timeout) {
    log().warning << "Failed to set timeout for " << peer << ": " << timeout.error().message;
    return;
  }

  auto data = connection.receiveAll(config_.maxMessageBytes, config_.ioTimeout);
  connection.close();
  if (!data) {
    log().warning << "Failed to read message from " << peer << ": " << data.error().message;
    return;
  }

  auto message = Message::decode(data.value());
  if (!message) {
    log().warning << "Dropping malformed message from " << peer << ": "
                  << message.error().message;
    return;
  }
  // A sender listening on every interface is reachable where it connected from
  if (message->sender && message->sender->isWildcard()) {
    message->sender->address = peer.address;
  }

  log().debug << "Received " << message->getType() << " from " << peer;
  dispatch(message.value());
}

void PeerTransport::dispatch(const Message &message) {
  std::visit(
      Overloaded{
          [this](const NewBlock &m) {
            log().info << "Peer announced block " << m.block.index << ", resolving";
            resolver_.resolve();
          },
          [this, &message](const NewTransaction &m) {
            if (message.relayed && message.origin && isSelf(*message.origin)) {
              log().debug << "Ignoring relayed copy of our own transaction";
              return;
            }
            uint64_t index = ledger_.recordTransaction(m.tx);
            log().debug << "Recorded relayed transaction for block " << index;
            if (message.relayed) {
              return;
            }
            Message relay;
            relay.body = m;
            relay.relayed = true;
            relay.origin = message.sender;
            size_t delivered = broadcast(relay, message.sender);
            log().debug << "Relayed transaction to " << delivered << " peers";
          },
          [this, &message](const RequestChain &) {
            if (!message.sender) {
              log().warning << "REQUEST_CHAIN without sender endpoint";
              return;
            }
            Chain chain = ledger_.getChain();
            Message response;
            response.body = RespondChain{ chain, static_cast<uint64_t>(chain.size()) };
            auto sent = send(*message.sender, response);
            if (!sent) {
              log().warning << "Failed to answer REQUEST_CHAIN from " << *message.sender
                            << ": " << sent.error().message;
            }
          },
          [this](const RespondChain &m) {
            if (m.length != m.chain.size()) {
              log().warning << "RESPOND_CHAIN length " << m.length << " does not match "
                            << m.chain.size() << " blocks";
              return;
            }
            auto replaced = ledger_.replaceChain(m.chain);
            if (replaced) {
              log().info << "Adopted pushed chain of length " << m.chain.size();
            } else {
              log().debug << "Pushed chain not adopted: " << replaced.error().message;
            }
          },
          [this](const UnknownMessage &m) {
            log().warning << "Ignoring message of unknown type " << m.type;
          },
      },
      message.body);
}

PeerTransport::Roe<void> PeerTransport::send(const network::TcpEndpoint &endpoint,
                                             const Message &message) const {
  Message stamped = message;
  if (!stamped.sender) {
    stamped.sender = getEndpoint();
  }

  network::TcpClient client;
  auto connected = client.connect(endpoint, config_.connectTimeout);
  if (!connected) {
    return Error(E_CONNECT, connected.error().message);
  }

  auto timeout = client.setTimeout(config_.ioTimeout);
  if (!timeout) {
    return Error(E_SEND, timeout.error().message);
  }

  auto sent = client.sendAndShutdown(stamped.encode());
  if (!sent) {
    return Error(E_SEND, "Failed to send to " + endpoint.toString() + ": " +
                             sent.error().message);
  }

  log().debug << "Sent " << stamped.getType() << " to " << endpoint;
  return {};
}

size_t PeerTransport::broadcast(const Message &message,
                                const std::optional<network::TcpEndpoint> &exclude) const {
  std::optional<network::TcpEndpoint> excluded;
  if (exclude) {
    excluded = resolveOrKeep(*exclude);
  }
  size_t delivered = 0;

  for (const auto &peer : peers_.list()) {
    auto endpoint = PeerRegistry::p2pEndpointOf(peer);
    if (!endpoint) {
      log().warning << "Skipping peer " << peer << ": " << endpoint.error().message;
      continue;
    }
    const network::TcpEndpoint target = resolveOrKeep(endpoint.value());
    if (isSelf(target) || (excluded && sameNode(target, *excluded))) {
      continue;
    }

    auto sent = send(endpoint.value(), message);
    if (!sent) {
      log().warning << "Broadcast to " << peer << " failed: " << sent.error().message;
      continue;
    }
    ++delivered;
  }

  return delivered;
}

PeerTransport::Roe<void> PeerTransport::requestChain(const std::string &peerAddress) const {
  auto endpoint = PeerRegistry::p2pEndpointOf(peerAddress);
  if (!endpoint) {
    return Error(E_ADDRESS, endpoint.error().message);
  }

  Message request;
  request.body = RequestChain{};
  return send(endpoint.value(), request);
}

} // namespace powledger
