/* @file SocketChannel.cpp
 * @brief IO abstraction layer that wraps a TCP stream - handles fd, line framing, timeouts and RAII - POSIX compliant
 *
 * © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Linux headers
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

// dcbench headers
#include "io/SocketChannel.hpp"

using namespace dcbench::io;

namespace {

  int msLeft(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
  }

  // Wait for a non-blocking connect() to finish. Returns 0 or an errno value.
  int awaitConnect(int fd, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    pollfd pfd{ fd, POLLOUT, 0 };
    for (;;) {
      int rc = ::poll(&pfd, 1, msLeft(deadline));
      if (rc == -1) {
        if (errno == EINTR)
          continue;
        return errno;
      }
      if (rc == 0)
        return ETIMEDOUT;
      int soError = 0;
      socklen_t len = sizeof(soError);
      if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) != 0)
        return errno;
      return soError;
    }
  }

} // namespace

SocketChannel::~SocketChannel() { close(); }

SocketChannel::SocketChannel(SocketChannel&& other) noexcept
    : lastError_(std::move(other.lastError_)), fd_(std::exchange(other.fd_, -1)),
      rx_buffer_(std::move(other.rx_buffer_)) {}

SocketChannel& SocketChannel::operator=(SocketChannel&& other) noexcept {
  if (this != &other) {
    close();
    lastError_ = std::move(other.lastError_);
    fd_ = std::exchange(other.fd_, -1);
    rx_buffer_ = std::move(other.rx_buffer_);
  }
  return *this;
}

void SocketChannel::fail(const std::string& what) {
  lastError_ = what;
  std::cerr << "[SocketChannel] " << what << "\n";
}

bool SocketChannel::open(const std::string& host, std::uint16_t port,
                         std::chrono::milliseconds timeout) {
  close();
  lastError_.clear();

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* found = nullptr;
  const std::string service = std::to_string(port);
  if (int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &found); rc != 0) {
    fail("cannot resolve " + host + ": " + gai_strerror(rc));
    return false;
  }

  int lastErrno = 0;
  for (addrinfo* ai = found; ai != nullptr; ai = ai->ai_next) {
    // non-blocking so connect() and every later read/write honour our timeouts
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                      ai->ai_protocol);
    if (fd < 0) {
      lastErrno = errno;
      continue;
    }
    int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
    int err = (rc == 0) ? 0 : errno;
    if (err == EINPROGRESS)
      err = awaitConnect(fd, timeout);
    if (err == 0) {
      fd_ = fd;
      break;
    }
    lastErrno = err;
    ::close(fd);
  }
  ::freeaddrinfo(found);

  if (fd_ < 0) {
    fail("connect to " + host + ":" + service + " failed: " +
         (lastErrno == ETIMEDOUT ? std::string("connection timed out") : strerror(lastErrno)));
    return false;
  }
  return true;
}

bool SocketChannel::writeLine(const std::string& line) {

  if (fd_ < 0) {
    lastError_ = "socket not open";
    return false;
  }

  std::string out = line;
  if (!out.ends_with('\n')) {
    out += '\n';
  }

  std::size_t total = 0;
  while (total < out.size()) {
    ssize_t written = ::send(fd_, out.data() + total, out.size() - total, MSG_NOSIGNAL);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{ fd_, POLLOUT, 0 };
      if (::poll(&pfd, 1, 1000) <= 0) {
        fail("write stalled: send buffer full");
        return false;
      }
    } else {
      fail(std::string("write: ") + strerror(errno));
      return false;
    }
  }

  return true;
}

// -------------------------------------------------------------------
// SocketChannel::readLine
// Line reader with timeout and internal buffer.
// Returns std::nullopt on timeout, disconnect, or error.
// -------------------------------------------------------------------
std::optional<std::string> SocketChannel::readLine(std::chrono::milliseconds timeout) {
  if (fd_ < 0)
    return std::nullopt;

  auto takeLine = [this]() -> std::optional<std::string> {
    auto pos = rx_buffer_.find('\n');
    if (pos == std::string::npos)
      return std::nullopt;
    std::string line = rx_buffer_.substr(0, pos);
    rx_buffer_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    return line;
  };

  // a previous read may already hold a full line
  if (auto line = takeLine())
    return line;

  char temp[512];
  pollfd pfd{ fd_, POLLIN, 0 };

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (std::chrono::steady_clock::now() < deadline) {

    int rc = ::poll(&pfd, 1, msLeft(deadline));
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      fail(std::string("poll: ") + strerror(errno));
      return std::nullopt;
    }
    if (rc == 0)
      break; // timeout

    if (pfd.revents & (POLLIN | POLLHUP)) {
      ssize_t n = ::recv(fd_, temp, sizeof(temp), 0);
      if (n > 0) {
        rx_buffer_.append(temp, static_cast<std::size_t>(n));
      } else if (n == 0) { // peer closed
        fail("connection closed by peer");
        close();
        return std::nullopt;
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue; // transient → retry
      } else {
        fail(std::string("read: ") + strerror(errno));
        return std::nullopt;
      }

      if (auto line = takeLine())
        return line;
    }
  }
  lastError_ = "timed out waiting for reply";
  return std::nullopt; // timeout/partial
}

void SocketChannel::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
  rx_buffer_.clear();
}
