#pragma once

#include "../lib/ResultOrError.hpp"
#include "TcpConnection.h"
#include "Types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace powledger {
namespace network {

class TcpServer {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_STATE = 1;
  static constexpr int32_t E_SOCKET = 2;
  static constexpr int32_t E_NO_PENDING = 3;
  static constexpr int32_t E_TIMEOUT = 4;

  TcpServer();
  ~TcpServer();

  TcpServer(const TcpServer &) = delete;
  TcpServer &operator=(const TcpServer &) = delete;

  // Bind to a host and port and start listening. Port 0 picks a free port.
  Roe<void> listen(const TcpEndpoint &endpoint, int backlog = 16);

  // Accept a client connection (non-blocking)
  Roe<TcpConnection> accept();

  // Wait for an incoming connection (timeout in milliseconds, -1 for infinite)
  Roe<void> waitForEvents(int timeoutMs = -1);

  void stop();

  bool isListening() const { return listening_; }

  const TcpEndpoint &getEndpoint() const { return endpoint_; }
  uint16_t getPort() const { return endpoint_.port; }

private:
  int socketFd_{ -1 };
  int epollFd_{ -1 };
  bool listening_{ false };
  TcpEndpoint endpoint_;
};

} // namespace network
} // namespace powledger
