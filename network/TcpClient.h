#pragma once

#include "../lib/ResultOrError.hpp"
#include "TcpConnection.h"
#include "Types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace powledger {
namespace network {

class TcpClient {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_ALREADY_CONNECTED = 1;
  static constexpr int32_t E_RESOLVE = 2;
  static constexpr int32_t E_CONNECT = 3;
  static constexpr int32_t E_TIMEOUT = 4;
  static constexpr int32_t E_NOT_CONNECTED = 5;
  static constexpr int32_t E_IO = 6;

  TcpClient();
  ~TcpClient();

  TcpClient(const TcpClient &) = delete;
  TcpClient &operator=(const TcpClient &) = delete;

  TcpClient(TcpClient &&other) noexcept;
  TcpClient &operator=(TcpClient &&other) noexcept;

  /**
   * Connect to a server
   * @param endpoint Remote host and port
   * @param timeout Upper bound for the TCP handshake (0 = OS default)
   */
  Roe<void> connect(const TcpEndpoint &endpoint,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

  // Send data and shutdown writing in one call
  Roe<size_t> sendAndShutdown(const std::string &message);

  Roe<void> setTimeout(std::chrono::milliseconds timeout);

  void close();

  /**
   * Resolve the host part to a numeric IPv4 address, keeping the port.
   * Numeric addresses come back unchanged.
   */
  static Roe<TcpEndpoint> resolve(const TcpEndpoint &endpoint);

private:
  std::optional<TcpConnection> connection_;
};

} // namespace network
} // namespace powledger
