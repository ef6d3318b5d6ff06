#include "TcpServer.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace powledger {
namespace network {

TcpServer::TcpServer() {}

TcpServer::~TcpServer() { stop(); }

TcpServer::Roe<void> TcpServer::listen(const TcpEndpoint &endpoint, int backlog) {
  if (listening_) {
    return Error(E_STATE, "Server already listening");
  }

  socketFd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (socketFd_ < 0) {
    return Error(E_SOCKET, "Failed to create socket");
  }

  int opt = 1;
  if (setsockopt(socketFd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
    stop();
    return Error(E_SOCKET, "Failed to set socket options");
  }

  struct sockaddr_in serverAddr;
  std::memset(&serverAddr, 0, sizeof(serverAddr));
  serverAddr.sin_family = AF_INET;
  serverAddr.sin_port = htons(endpoint.port);
  if (endpoint.address.empty() || endpoint.address == "0.0.0.0") {
    serverAddr.sin_addr.s_addr = INADDR_ANY;
  } else if (endpoint.address == "localhost") {
    serverAddr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  } else if (inet_pton(AF_INET, endpoint.address.c_str(), &serverAddr.sin_addr) != 1) {
    stop();
    return Error(E_SOCKET, "Invalid bind address: " + endpoint.address);
  }

  if (bind(socketFd_, (struct sockaddr *)&serverAddr, sizeof(serverAddr)) < 0) {
    std::string reason = std::strerror(errno);
    stop();
    return Error(E_SOCKET, "Failed to bind to " + endpoint.toString() + ": " + reason);
  }

  if (::listen(socketFd_, backlog) < 0) {
    stop();
    return Error(E_SOCKET, "Failed to listen on " + endpoint.toString());
  }

  int flags = fcntl(socketFd_, F_GETFL, 0);
  if (flags < 0 || fcntl(socketFd_, F_SETFL, flags | O_NONBLOCK) < 0) {
    stop();
    return Error(E_SOCKET, "Failed to set socket to non-blocking mode");
  }

  epollFd_ = epoll_create1(0);
  if (epollFd_ < 0) {
    stop();
    return Error(E_SOCKET, "Failed to create epoll instance");
  }

  struct epoll_event event;
  std::memset(&event, 0, sizeof(event));
  event.events = EPOLLIN;
  event.data.fd = socketFd_;
  if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, socketFd_, &event) < 0) {
    stop();
    return Error(E_SOCKET, "Failed to add socket to epoll");
  }

  // Resolve the actual port when an ephemeral one was requested
  struct sockaddr_in boundAddr;
  socklen_t boundLen = sizeof(boundAddr);
  endpoint_ = endpoint;
  if (getsockname(socketFd_, (struct sockaddr *)&boundAddr, &boundLen) == 0) {
    endpoint_.port = ntohs(boundAddr.sin_port);
  }

  listening_ = true;
  return {};
}

TcpServer::Roe<TcpConnection> TcpServer::accept() {
  if (!listening_) {
    return Error(E_STATE, "Server not listening");
  }

  struct sockaddr_in clientAddr;
  socklen_t clientLen = sizeof(clientAddr);

  int clientFd = ::accept(socketFd_, (struct sockaddr *)&clientAddr, &clientLen);
  if (clientFd < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return Error(E_NO_PENDING, "No pending connections");
    }
    return Error(E_SOCKET, "Failed to accept connection: " + std::string(std::strerror(errno)));
  }

  // Accepted sockets inherit O_NONBLOCK on some platforms; handlers expect
  // blocking I/O bounded by socket timeouts.
  int flags = fcntl(clientFd, F_GETFL, 0);
  if (flags >= 0) {
    fcntl(clientFd, F_SETFL, flags & ~O_NONBLOCK);
  }

  return TcpConnection(clientFd);
}

TcpServer::Roe<void> TcpServer::waitForEvents(int timeoutMs) {
  if (!listening_) {
    return Error(E_STATE, "Server not listening");
  }

  struct epoll_event event;
  int numEvents = epoll_wait(epollFd_, &event, 1, timeoutMs);

  if (numEvents < 0) {
    if (errno == EINTR) {
      return Error(E_TIMEOUT, "Interrupted while waiting for events");
    }
    return Error(E_SOCKET, "epoll_wait failed");
  }

  if (numEvents == 0) {
    return Error(E_TIMEOUT, "Timeout waiting for events");
  }

  return {};
}

void TcpServer::stop() {
  if (epollFd_ >= 0) {
    ::close(epollFd_);
    epollFd_ = -1;
  }
  if (socketFd_ >= 0) {
    ::close(socketFd_);
    socketFd_ = -1;
  }
  listening_ = false;
}

} // namespace network
} // namespace powledger
