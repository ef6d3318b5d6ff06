#include "PeerRegistry.h"
#include "../lib/Utilities.h"

namespace powledger {

PeerRegistry::PeerRegistry() : Module("pow.node.peers") {}

PeerRegistry::Roe<std::string> PeerRegistry::normalize(const std::string &address) {
  std::string rest = address;

  size_t scheme = rest.find("://");
  if (scheme != std::string::npos) {
    rest = rest.substr(scheme + 3);
  }

  size_t path = rest.find_first_of("/?#");
  if (path != std::string::npos) {
    rest = rest.substr(0, path);
  }

  // Drop userinfo the way URL parsers do
  size_t at = rest.rfind('@');
  if (at != std::string::npos) {
    rest = rest.substr(at + 1);
  }

  std::string host;
  uint16_t port = 0;
  if (!utl::parseHostPort(rest, host, port) || host.empty()) {
    return Error(E_INVALID_ADDRESS, "Invalid URL: " + address);
  }
  if (port == 0) {
    return Error(E_PORT_RANGE, "Invalid port in: " + address);
  }

  return host + ":" + std::to_string(port);
}

PeerRegistry::Roe<std::string> PeerRegistry::registerPeer(const std::string &address) {
  auto normalized = normalize(address);
  if (!normalized) {
    return normalized;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (peers_.insert(normalized.value()).second) {
    log().info << "Registered peer " << normalized.value();
  }
  return normalized;
}

std::set<std::string> PeerRegistry::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_;
}

size_t PeerRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size();
}

PeerRegistry::Roe<network::TcpEndpoint>
PeerRegistry::p2pEndpointOf(const std::string &address) {
  network::TcpEndpoint endpoint;
  if (!utl::parseHostPort(address, endpoint.address, endpoint.port) ||
      endpoint.address.empty()) {
    return Error(E_INVALID_ADDRESS, "Invalid peer address: " + address);
  }

  uint32_t p2pPort = static_cast<uint32_t>(endpoint.port) + P2P_PORT_OFFSET;
  if (p2pPort > 65535) {
    return Error(E_PORT_RANGE, "P2P port out of range for " + address);
  }
  endpoint.port = static_cast<uint16_t>(p2pPort);
  return endpoint;
}

} // namespace powledger
