#include "TcpConnection.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace powledger {
namespace network {

TcpConnection::TcpConnection(int socketFd) : socketFd_(socketFd) {
  struct sockaddr_in peerAddr;
  socklen_t addrLen = sizeof(peerAddr);
  if (getpeername(socketFd_, (struct sockaddr *)&peerAddr, &addrLen) == 0 &&
      peerAddr.sin_family == AF_INET) {
    char addrStr[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &peerAddr.sin_addr, addrStr, INET_ADDRSTRLEN);
    peer_.address = addrStr;
    peer_.port = ntohs(peerAddr.sin_port);
  }
}

TcpConnection::~TcpConnection() { close(); }

TcpConnection::TcpConnection(TcpConnection &&other) noexcept
    : socketFd_(other.socketFd_), peer_(std::move(other.peer_)) {
  other.socketFd_ = -1;
  other.peer_ = {};
}

TcpConnection &TcpConnection::operator=(TcpConnection &&other) noexcept {
  if (this != &other) {
    close();
    socketFd_ = other.socketFd_;
    peer_ = std::move(other.peer_);
    other.socketFd_ = -1;
    other.peer_ = {};
  }
  return *this;
}

TcpConnection::Roe<size_t> TcpConnection::send(const void *data, size_t length) {
  if (socketFd_ < 0) {
    return Error(E_CLOSED, "Connection closed");
  }

  const char *cursor = static_cast<const char *>(data);
  size_t total = 0;
  while (total < length) {
    ssize_t sent = ::send(socketFd_, cursor + total, length - total, MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return Error(E_TIMEOUT, "Send timeout");
      }
      return Error(E_IO, "Failed to send data: " + std::string(std::strerror(errno)));
    }
    total += static_cast<size_t>(sent);
  }

  return total;
}

TcpConnection::Roe<size_t> TcpConnection::send(const std::string &message) {
  return send(message.data(), message.size());
}

TcpConnection::Roe<size_t> TcpConnection::sendAndShutdown(const std::string &message) {
  auto result = send(message);
  if (!result) {
    return result;
  }

  auto shutdownResult = shutdownWrite();
  if (!shutdownResult) {
    return Error(shutdownResult.error().code, shutdownResult.error().message);
  }

  return result;
}

TcpConnection::Roe<void> TcpConnection::shutdownWrite() {
  if (socketFd_ < 0) {
    return Error(E_CLOSED, "Connection closed");
  }

  if (shutdown(socketFd_, SHUT_WR) < 0) {
    return Error(E_IO, "Failed to shutdown write: " + std::string(std::strerror(errno)));
  }

  return {};
}

TcpConnection::Roe<size_t> TcpConnection::receive(void *buffer, size_t maxLength) {
  if (socketFd_ < 0) {
    return Error(E_CLOSED, "Connection closed");
  }

  ssize_t received;
  do {
    received = recv(socketFd_, buffer, maxLength, 0);
  } while (received < 0 && errno == EINTR);

  if (received < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return Error(E_TIMEOUT, "Receive timeout (no data within socket timeout)");
    }
    return Error(E_IO, "Failed to receive data: " + std::string(std::strerror(errno)));
  }
  if (received == 0) {
    return Error(E_CLOSED, "Connection closed by peer");
  }

  return static_cast<size_t>(received);
}

TcpConnection::Roe<std::string> TcpConnection::receiveAll(size_t maxBytes,
                                                          std::chrono::milliseconds timeout) {
  using Clock = std::chrono::steady_clock;
  const bool bounded = timeout.count() > 0;
  const Clock::time_point deadline = Clock::now() + timeout;

  std::string data;
  char buffer[8192];

  while (true) {
    if (bounded) {
      auto remaining =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
      if (remaining.count() <= 0) {
        return Error(E_TIMEOUT, "Message not complete within " +
                                    std::to_string(timeout.count()) + " ms");
      }
      auto ready = waitReadable(remaining);
      if (!ready) {
        return ready.error();
      }
    }

    auto result = receive(buffer, sizeof(buffer));
    if (!result) {
      if (result.error().code == E_CLOSED && socketFd_ >= 0) {
        // Orderly shutdown by the peer marks the end of the message
        break;
      }
      return result.error();
    }
    if (data.size() + result.value() > maxBytes) {
      return Error(E_TOO_LARGE, "Message exceeds " + std::to_string(maxBytes) + " bytes");
    }
    data.append(buffer, result.value());
  }

  return data;
}

TcpConnection::Roe<void> TcpConnection::waitReadable(std::chrono::milliseconds timeout) {
  if (socketFd_ < 0) {
    return Error(E_CLOSED, "Connection closed");
  }

  struct pollfd pfd;
  pfd.fd = socketFd_;
  pfd.events = POLLIN;
  pfd.revents = 0;

  int n;
  do {
    n = poll(&pfd, 1, static_cast<int>(timeout.count()));
  } while (n < 0 && errno == EINTR);

  if (n < 0) {
    return Error(E_IO, "poll failed: " + std::string(std::strerror(errno)));
  }
  if (n == 0) {
    return Error(E_TIMEOUT, "Message not complete within deadline");
  }
  return {};
}

TcpConnection::Roe<void> TcpConnection::setTimeout(std::chrono::milliseconds timeout) {
  if (socketFd_ < 0) {
    return Error(E_CLOSED, "Connection closed");
  }

  struct timeval tv;
  tv.tv_sec = timeout.count() / 1000;
  tv.tv_usec = (timeout.count() % 1000) * 1000;

  if (setsockopt(socketFd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
    return Error(E_IO, "Failed to set receive timeout: " + std::string(std::strerror(errno)));
  }
  if (setsockopt(socketFd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
    return Error(E_IO, "Failed to set send timeout: " + std::string(std::strerror(errno)));
  }

  return {};
}

void TcpConnection::close() {
  if (socketFd_ >= 0) {
    ::close(socketFd_);
    socketFd_ = -1;
  }
}

} // namespace network
} // namespace powledger
