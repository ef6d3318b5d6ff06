#include "TcpClient.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace powledger {
namespace network {

namespace {

// Connect with an optional timeout using a non-blocking handshake, then switch
// the socket back to blocking mode.
int connectWithTimeout(int fd, const struct sockaddr *addr, socklen_t len,
                       std::chrono::milliseconds timeout, std::string &errMsg,
                       bool &timedOut) {
  timedOut = false;
  if (timeout.count() <= 0) {
    if (::connect(fd, addr, len) < 0) {
      errMsg = std::strerror(errno);
      return -1;
    }
    return 0;
  }

  int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    errMsg = "Failed to set non-blocking mode";
    return -1;
  }

  int rc = ::connect(fd, addr, len);
  if (rc < 0 && errno != EINPROGRESS) {
    errMsg = std::strerror(errno);
    return -1;
  }

  if (rc < 0) {
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLOUT;
    pfd.revents = 0;
    int n;
    do {
      n = poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (n < 0 && errno == EINTR);
    if (n == 0) {
      timedOut = true;
      errMsg = "Connection timed out";
      return -1;
    }
    if (n < 0) {
      errMsg = std::strerror(errno);
      return -1;
    }
    int soError = 0;
    socklen_t soLen = sizeof(soError);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &soLen) < 0 || soError != 0) {
      errMsg = std::strerror(soError != 0 ? soError : errno);
      return -1;
    }
  }

  if (fcntl(fd, F_SETFL, flags) < 0) {
    errMsg = "Failed to restore blocking mode";
    return -1;
  }
  return 0;
}

} // namespace

TcpClient::TcpClient() {}

TcpClient::~TcpClient() { close(); }

TcpClient::TcpClient(TcpClient &&other) noexcept
    : connection_(std::move(other.connection_)) {
  other.connection_.reset();
}

TcpClient &TcpClient::operator=(TcpClient &&other) noexcept {
  if (this != &other) {
    close();
    connection_ = std::move(other.connection_);
    other.connection_.reset();
  }
  return *this;
}

TcpClient::Roe<void> TcpClient::connect(const TcpEndpoint &endpoint,
                                        std::chrono::milliseconds timeout) {
  if (connection_) {
    return Error(E_ALREADY_CONNECTED, "Already connected");
  }

  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo *result = nullptr;
  std::string portStr = std::to_string(endpoint.port);
  int gaiRc = getaddrinfo(endpoint.address.c_str(), portStr.c_str(), &hints, &result);
  if (gaiRc != 0 || result == nullptr) {
    return Error(E_RESOLVE, "Failed to resolve hostname: " + endpoint.address);
  }

  int fd = socket(result->ai_family, result->ai_socktype, result->ai_protocol);
  if (fd < 0) {
    freeaddrinfo(result);
    return Error(E_CONNECT, "Failed to create socket");
  }

  std::string errMsg;
  bool timedOut = false;
  int rc = connectWithTimeout(fd, result->ai_addr, result->ai_addrlen, timeout,
                              errMsg, timedOut);
  freeaddrinfo(result);
  if (rc < 0) {
    ::close(fd);
    return Error(timedOut ? E_TIMEOUT : E_CONNECT,
                 "Failed to connect to " + endpoint.toString() + ": " + errMsg);
  }

  connection_.emplace(fd);
  return {};
}

TcpClient::Roe<size_t> TcpClient::sendAndShutdown(const std::string &message) {
  if (!connection_) {
    return Error(E_NOT_CONNECTED, "Not connected");
  }
  auto result = connection_->sendAndShutdown(message);
  if (!result) {
    return Error(E_IO, result.error().message);
  }
  return result.value();
}

TcpClient::Roe<void> TcpClient::setTimeout(std::chrono::milliseconds timeout) {
  if (!connection_) {
    return Error(E_NOT_CONNECTED, "Not connected");
  }
  auto result = connection_->setTimeout(timeout);
  if (!result) {
    return Error(E_IO, result.error().message);
  }
  return {};
}

void TcpClient::close() { connection_.reset(); }

TcpClient::Roe<TcpEndpoint> TcpClient::resolve(const TcpEndpoint &endpoint) {
  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo *result = nullptr;
  int gaiRc = getaddrinfo(endpoint.address.c_str(), nullptr, &hints, &result);
  if (gaiRc != 0 || result == nullptr) {
    return Error(E_RESOLVE, "Failed to resolve hostname: " + endpoint.address);
  }

  char addrStr[INET_ADDRSTRLEN];
  const auto *addr = reinterpret_cast<const struct sockaddr_in *>(result->ai_addr);
  const char *converted = inet_ntop(AF_INET, &addr->sin_addr, addrStr, INET_ADDRSTRLEN);
  freeaddrinfo(result);
  if (converted == nullptr) {
    return Error(E_RESOLVE, "Failed to format address of " + endpoint.address);
  }

  return TcpEndpoint{ addrStr, endpoint.port };
}

} // namespace network
} // namespace powledger
