#include <arpa/inet.h>
#include <cerrno>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include "common/errors.hpp"
#include "transport/tcp_client_transport.hpp"

namespace litemb {

namespace {

bool SetBlocking(int fd, bool blocking) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    return false;
  }
  flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
  return ::fcntl(fd, F_SETFL, flags) == 0;
}

// Non-blocking connect so the attempt can be abandoned after timeout_ms
std::optional<TransportError> ConnectWithTimeout(int fd, const sockaddr *addr, socklen_t addr_len,
                                                 uint32_t timeout_ms) {
  if (!SetBlocking(fd, false)) {
    return TransportError::kConnectFailed;
  }

  if (::connect(fd, addr, addr_len) != 0) {
    if (errno != EINPROGRESS) {
      return TransportError::kConnectFailed;
    }

    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLOUT;
    // poll takes a signed timeout; a negative value would wait forever
    const int poll_timeout_ms =
        static_cast<int>(std::min<uint32_t>(timeout_ms, static_cast<uint32_t>(std::numeric_limits<int>::max())));
    int ready;
    do {
      ready = ::poll(&pfd, 1, poll_timeout_ms);
    } while (ready < 0 && errno == EINTR);

    if (ready == 0) {
      return TransportError::kConnectTimeout;
    }
    if (ready < 0) {
      return TransportError::kConnectFailed;
    }

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
      return TransportError::kConnectFailed;
    }
  }

  if (!SetBlocking(fd, true)) {
    return TransportError::kConnectFailed;
  }
  return {};
}

}  // namespace

TcpClientTransport::ConnectResult TcpClientTransport::Connect(const std::string &host, uint16_t port,
                                                              uint32_t timeout_ms) {
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo *resolved = nullptr;
  const std::string service = std::to_string(port);
  if (::getaddrinfo(host.c_str(), service.c_str(), &hints, &resolved) != 0 || resolved == nullptr) {
    return TransportError::kResolveFailed;
  }

  TransportError error = TransportError::kConnectFailed;
  for (addrinfo *candidate = resolved; candidate != nullptr; candidate = candidate->ai_next) {
    int fd = ::socket(candidate->ai_family, candidate->ai_socktype, candidate->ai_protocol);
    if (fd < 0) {
      continue;
    }

    auto connect_error = ConnectWithTimeout(fd, candidate->ai_addr, candidate->ai_addrlen, timeout_ms);
    if (connect_error.has_value()) {
      ::close(fd);
      error = *connect_error;
      continue;
    }

    ::freeaddrinfo(resolved);

    TcpClientTransport transport(fd);
    // Small request/response frames; do not wait for Nagle coalescing
    int nodelay = 1;
    if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay)) != 0 ||
        !transport.SetTimeout(timeout_ms)) {
      return TransportError::kConnectFailed;
    }
    return std::move(transport);
  }

  ::freeaddrinfo(resolved);
  return error;
}

bool TcpClientTransport::SetTimeout(uint32_t timeout_ms) {
  if (fd_ < 0) {
    return false;
  }
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout_ms / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000) * 1000);
  return ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
         ::setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

int TcpClientTransport::Read(std::span<uint8_t> buffer) {
  if (fd_ < 0) {
    last_error_ = TransportError::kNotConnected;
    return -1;
  }

  ssize_t n;
  do {
    n = ::recv(fd_, buffer.data(), buffer.size(), 0);
  } while (n < 0 && errno == EINTR);

  if (n < 0) {
    last_error_ = (errno == EAGAIN || errno == EWOULDBLOCK) ? TransportError::kReadTimeout : TransportError::kReadFailed;
    return -1;
  }
  if (n == 0) {
    last_error_ = TransportError::kConnectionClosed;
  }
  return static_cast<int>(n);
}

int TcpClientTransport::Write(std::span<const uint8_t> data) {
  if (fd_ < 0) {
    last_error_ = TransportError::kNotConnected;
    return -1;
  }

  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      last_error_ = TransportError::kWriteFailed;
      return -1;
    }
    sent += static_cast<size_t>(n);
  }
  return static_cast<int>(sent);
}

bool TcpClientTransport::Flush() {
  if (fd_ < 0) {
    last_error_ = TransportError::kNotConnected;
    return false;
  }
  return true;  // TCP stream has no application-level flush
}

void TcpClientTransport::Close() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

}  // namespace litemb
