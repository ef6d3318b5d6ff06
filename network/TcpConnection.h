#pragma once

#include "../lib/ResultOrError.hpp"
#include "Types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace powledger {
namespace network {

class TcpConnection {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_CLOSED = 1;
  static constexpr int32_t E_IO = 2;
  static constexpr int32_t E_TIMEOUT = 3;
  static constexpr int32_t E_TOO_LARGE = 4;

  explicit TcpConnection(int socketFd);
  ~TcpConnection();

  TcpConnection(const TcpConnection &) = delete;
  TcpConnection &operator=(const TcpConnection &) = delete;

  TcpConnection(TcpConnection &&other) noexcept;
  TcpConnection &operator=(TcpConnection &&other) noexcept;

  // Send data; loops until the whole buffer is written
  Roe<size_t> send(const void *data, size_t length);
  Roe<size_t> send(const std::string &message);

  // Send data and shutdown writing in one call
  Roe<size_t> sendAndShutdown(const std::string &message);

  // Shutdown writing (half-close the connection)
  Roe<void> shutdownWrite();

  // Receive data
  Roe<size_t> receive(void *buffer, size_t maxLength);

  /**
   * Read until the peer half-closes the connection.
   * @param maxBytes Upper bound on the accepted payload size
   * @param timeout Deadline for the whole message (0 = only the socket timeout)
   */
  Roe<std::string> receiveAll(size_t maxBytes,
                              std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

  // Set socket send/receive timeout (0 = no timeout)
  Roe<void> setTimeout(std::chrono::milliseconds timeout);

  void close();

  bool isOpen() const { return socketFd_ >= 0; }

  const TcpEndpoint &getPeerEndpoint() const { return peer_; }

private:
  Roe<void> waitReadable(std::chrono::milliseconds timeout);

  int socketFd_;
  TcpEndpoint peer_;
};

} // namespace network
} // namespace powledger
