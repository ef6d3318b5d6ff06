#pragma once

#include "ConsensusResolver.h"
#include "Message.h"
#include "PeerRegistry.h"
#include "../ledger/Ledger.h"
#include "../lib/ResultOrError.hpp"
#include "../lib/Service.h"
#include "../network/TcpConnection.h"
#include "../network/TcpServer.h"
#include "../network/Types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

namespace powledger {

/**
 * Peer-to-peer channel between nodes.
 *
 * Inbound: a listener thread accepts connections and hands each one to a
 * detached handler thread that reads a single message and dispatches it.
 * Outbound: one short-lived connection per message. A message is one JSON
 * document terminated by the sender half-closing its side of the socket.
 */
class PeerTransport : public Service {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_LISTEN = 1;
  static constexpr int32_t E_ADDRESS = 2;
  static constexpr int32_t E_CONNECT = 3;
  static constexpr int32_t E_SEND = 4;

  static constexpr size_t DEFAULT_MAX_MESSAGE_BYTES = 64 * 1024 * 1024;

  struct Config {
    std::string host{ "127.0.0.1" };
    uint16_t port{ 6000 };
    // Host stamped on outgoing messages; empty means `host`
    std::string advertiseHost;
    std::chrono::milliseconds connectTimeout{ 3000 };
    std::chrono::milliseconds ioTimeout{ 5000 };
    size_t maxMessageBytes{ DEFAULT_MAX_MESSAGE_BYTES };
  };

  PeerTransport(const Config &config, Ledger &ledger, const PeerRegistry &peers,
                ConsensusResolver &resolver);
  ~PeerTransport() override;

  /**
   * Deliver one message. The envelope is stamped with this node's endpoint
   * unless it already carries a sender.
   */
  Roe<void> send(const network::TcpEndpoint &endpoint, const Message &message) const;

  /**
   * Send to every registered peer's P2P endpoint except `exclude` and this
   * node. Endpoints are compared after name resolution, so "localhost" and
   * "127.0.0.1" name the same peer. Failures are logged and skipped.
   * @return Number of peers the message was delivered to
   */
  size_t broadcast(const Message &message,
                   const std::optional<network::TcpEndpoint> &exclude = std::nullopt) const;

  // Ask a peer to push its chain back to us
  Roe<void> requestChain(const std::string &peerAddress) const;

  // This node's P2P endpoint as advertised to peers
  network::TcpEndpoint getEndpoint() const;

  // True if `endpoint` names this node's P2P listener
  bool isSelf(const network::TcpEndpoint &endpoint) const;

protected:
  Service::Roe<void> onStart() override;
  void runLoop() override;
  void onStop() override;

private:
  void acceptPending();
  void handleConnection(network::TcpConnection connection);
  void dispatch(const Message &message);

  // Numeric form of `endpoint`, or `endpoint` itself when it does not resolve
  network::TcpEndpoint resolveOrKeep(const network::TcpEndpoint &endpoint) const;
  static bool sameNode(const network::TcpEndpoint &a, const network::TcpEndpoint &b);

  Config config_;
  Ledger &ledger_;
  const PeerRegistry &peers_;
  ConsensusResolver &resolver_;

  network::TcpServer server_;

  std::mutex handlersMutex_;
  std::condition_variable handlersCv_;
  size_t activeHandlers_{ 0 };
};

} // namespace powledger
