#include "pairlink/net/socket.hpp"

#include <array>
#include <cerrno>
#include <charconv>
#include <cstring>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace pairlink::net {

namespace {

constexpr std::size_t kReadChunk = 4096;

timeval to_timeval(const std::chrono::milliseconds value) {
  timeval tv{};
  tv.tv_sec = static_cast<long>(value.count() / 1000);
  tv.tv_usec = static_cast<decltype(tv.tv_usec)>((value.count() % 1000) * 1000);
  return tv;
}

// Waits for a non-blocking connect to finish. Returns 0 on success, otherwise an errno value.
int finish_connect(const int fd, const std::chrono::milliseconds timeout) {
  pollfd pfd{};
  pfd.fd = fd;
  pfd.events = POLLOUT;
  int ready = 0;
  do {
    ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  } while (ready < 0 && errno == EINTR);
  if (ready == 0) {
    return ETIMEDOUT;
  }
  if (ready < 0) {
    return errno;
  }
  int so_error = 0;
  socklen_t len = sizeof(so_error);
  if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) {
    return errno;
  }
  return so_error;
}

} // namespace

std::string Endpoint::to_string() const {
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

common::Result<Endpoint> parse_endpoint(const std::string &text) {
  const auto invalid = [&text](const std::string &why) {
    return common::Result<Endpoint>::failure(common::ErrorCode::InvalidArgument,
                                             "invalid endpoint '" + text + "': " + why);
  };

  std::string host;
  std::string port_text;
  if (!text.empty() && text.front() == '[') {
    const auto close = text.find(']');
    if (close == std::string::npos || close + 1 >= text.size() || text[close + 1] != ':') {
      return invalid("expected [address]:port");
    }
    host = text.substr(1, close - 1);
    port_text = text.substr(close + 2);
  } else {
    const auto colon = text.rfind(':');
    if (colon == std::string::npos) {
      return invalid("missing port");
    }
    host = text.substr(0, colon);
    port_text = text.substr(colon + 1);
    if (host.find(':') != std::string::npos) {
      return invalid("IPv6 addresses must be bracketed");
    }
  }

  if (host.empty()) {
    return invalid("missing host");
  }
  std::uint32_t port = 0;
  const auto [ptr, ec] =
      std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
  if (port_text.empty() || ec != std::errc() || ptr != port_text.data() + port_text.size() ||
      port == 0 || port > 65535) {
    return invalid("port must be 1-65535");
  }
  return common::Result<Endpoint>::success(
      Endpoint{.host = std::move(host), .port = static_cast<std::uint16_t>(port)});
}

common::Result<int> connect_with_timeout(const Endpoint &endpoint,
                                         const std::chrono::milliseconds timeout) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *resolved = nullptr;
  const std::string port = std::to_string(endpoint.port);
  if (const int rc = getaddrinfo(endpoint.host.c_str(), port.c_str(), &hints, &resolved);
      rc != 0) {
    return common::Result<int>::failure(common::ErrorCode::ConnectFailure,
                                        "failed to resolve " + endpoint.host + ": " +
                                            gai_strerror(rc));
  }

  int last_error = ECONNREFUSED;
  int connected_fd = -1;
  for (const addrinfo *ai = resolved; ai != nullptr; ai = ai->ai_next) {
    int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      last_error = errno;
      continue;
    }
    if (!set_nonblocking(fd, true).ok()) {
      last_error = errno;
      close_fd(fd);
      continue;
    }

    int err = 0;
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) != 0) {
      err = errno == EINPROGRESS ? finish_connect(fd, timeout) : errno;
    }
    if (err == 0 && set_nonblocking(fd, false).ok()) {
      connected_fd = fd;
      break;
    }
    last_error = err == 0 ? errno : err;
    close_fd(fd);
  }
  freeaddrinfo(resolved);

  if (connected_fd >= 0) {
    return common::Result<int>::success(connected_fd);
  }
  if (last_error == ETIMEDOUT) {
    return common::Result<int>::failure(common::ErrorCode::Timeout,
                                        "connect to " + endpoint.to_string() + " timed out");
  }
  return common::Result<int>::failure(common::ErrorCode::ConnectFailure,
                                      "connect to " + endpoint.to_string() +
                                          " failed: " + std::strerror(last_error));
}

common::Status set_nonblocking(const int fd, const bool enabled) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    return common::Status::error(common::ErrorCode::Io,
                                 std::string("fcntl(F_GETFL) failed: ") + std::strerror(errno));
  }
  const int wanted = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  if (wanted != flags && fcntl(fd, F_SETFL, wanted) != 0) {
    return common::Status::error(common::ErrorCode::Io,
                                 std::string("fcntl(F_SETFL) failed: ") + std::strerror(errno));
  }
  return common::Status::success();
}

common::Status set_socket_timeouts(const int fd, const std::chrono::milliseconds read,
                                   const std::chrono::milliseconds write) {
  const timeval read_tv = to_timeval(read);
  const timeval write_tv = to_timeval(write);
  if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &read_tv, sizeof(read_tv)) != 0 ||
      setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &write_tv, sizeof(write_tv)) != 0) {
    return common::Status::error(common::ErrorCode::Io,
                                 std::string("failed to set socket timeouts: ") +
                                     std::strerror(errno));
  }
  return common::Status::success();
}

bool send_all(const int fd, const std::string &data) {
  std::size_t sent = 0;
  while (sent < data.size()) {
    const ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

std::string_view read_status_name(const ReadStatus status) {
  switch (status) {
  case ReadStatus::Ok:
    return "ok";
  case ReadStatus::Eof:
    return "connection closed";
  case ReadStatus::Timeout:
    return "read timed out";
  case ReadStatus::TooLong:
    return "line too long";
  case ReadStatus::Error:
    return "read failed";
  }
  return "read failed";
}

LineReader::LineReader(const int fd, const std::size_t max_line_bytes)
    : fd_(fd), max_line_bytes_(max_line_bytes) {}

ReadStatus LineReader::fill() {
  std::array<char, kReadChunk> chunk{};
  while (true) {
    const ssize_t n = ::recv(fd_, chunk.data(), chunk.size(), 0);
    if (n > 0) {
      buffer_.append(chunk.data(), static_cast<std::size_t>(n));
      return ReadStatus::Ok;
    }
    if (n == 0) {
      return ReadStatus::Eof;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return ReadStatus::Timeout;
    }
    return ReadStatus::Error;
  }
}

ReadStatus LineReader::read_line(std::string &line) {
  std::size_t scanned = 0;
  while (true) {
    const auto newline = buffer_.find('\n', scanned);
    if (newline != std::string::npos) {
      if (newline > max_line_bytes_) {
        return ReadStatus::TooLong;
      }
      line = buffer_.substr(0, newline);
      buffer_.erase(0, newline + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      return ReadStatus::Ok;
    }
    if (buffer_.size() > max_line_bytes_) {
      return ReadStatus::TooLong;
    }
    scanned = buffer_.size();

    const ReadStatus status = fill();
    if (status == ReadStatus::Eof && !buffer_.empty()) {
      line = std::move(buffer_);
      buffer_.clear();
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      return ReadStatus::Ok;
    }
    if (status != ReadStatus::Ok) {
      return status;
    }
  }
}

ReadStatus LineReader::read_exact(const std::size_t size, std::string &out) {
  while (buffer_.size() < size) {
    const ReadStatus status = fill();
    if (status != ReadStatus::Ok) {
      return status;
    }
  }
  out = buffer_.substr(0, size);
  buffer_.erase(0, size);
  return ReadStatus::Ok;
}

} // namespace pairlink::net
