#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace powledger {
namespace network {

struct TcpEndpoint {
  std::string address;
  uint16_t port{0};

  std::string toString() const {
    return address + ":" + std::to_string(port);
  }

  // Bound on every interface; not a routable address to hand to peers
  bool isWildcard() const { return address.empty() || address == "0.0.0.0"; }

  bool isLoopback() const { return address.compare(0, 4, "127.") == 0; }

  bool operator==(const TcpEndpoint &other) const {
    return address == other.address && port == other.port;
  }
  bool operator!=(const TcpEndpoint &other) const { return !(*this == other); }
};

inline std::ostream &operator<<(std::ostream &os, const TcpEndpoint &endpoint) {
  return os << endpoint.address << ":" << endpoint.port;
}

} // namespace network
} // namespace powledger
