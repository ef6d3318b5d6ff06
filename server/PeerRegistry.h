#pragma once

#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"
#include "../network/Types.hpp"

#include <cstdint>
#include <mutex>
#include <set>
#include <string>

namespace powledger {

/**
 * Set of peer control-surface addresses in normalized "host:port" form.
 */
class PeerRegistry : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_INVALID_ADDRESS = 1;
  static constexpr int32_t E_PORT_RANGE = 2;

  // P2P listener port = control port + offset
  static constexpr uint16_t P2P_PORT_OFFSET = 1000;

  PeerRegistry();

  /**
   * Register a peer. Accepts "host:port" or "scheme://host:port[/path]".
   * Registering an address twice is a no-op.
   * @return The normalized "host:port" form
   */
  Roe<std::string> registerPeer(const std::string &address);

  std::set<std::string> list() const;
  size_t size() const;

  static Roe<std::string> normalize(const std::string &address);

  // P2P endpoint of a normalized control address
  static Roe<network::TcpEndpoint> p2pEndpointOf(const std::string &address);

private:
  mutable std::mutex mutex_;
  std::set<std::string> peers_;
};

} // namespace powledger
