#include "pairlink/pairing/listener.hpp"

#include "pairlink/common/fs.hpp"
#include "pairlink/observability/global.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace pairlink::pairing {

namespace {

constexpr int kListenBacklog = 16;
constexpr std::size_t kMaxHeaderCount = 64;
constexpr std::size_t kMaxHeaderLineBytes = 8 * 1024;

common::Result<PairingResult> read_failure(const net::ReadStatus status,
                                           const std::string &what) {
  const std::string message = what + ": " + std::string(net::read_status_name(status));
  switch (status) {
  case net::ReadStatus::Timeout:
    return common::Result<PairingResult>::failure(common::ErrorCode::Timeout, message);
  case net::ReadStatus::TooLong:
    return common::Result<PairingResult>::failure(common::ErrorCode::InvalidPayload, message);
  default:
    return common::Result<PairingResult>::failure(common::ErrorCode::Io, message);
  }
}

// Sends an error status and reports the handshake as invalid.
common::Result<PairingResult> reject_http(const int client_fd, const int status,
                                          const std::string &reason,
                                          const std::string &detail = "") {
  if (!net::send_all(client_fd, render_http_response(make_empty_response(status)))) {
    return common::Result<PairingResult>::failure(
        common::ErrorCode::Io, "failed to write HTTP " + std::to_string(status) + " response",
        detail);
  }
  return common::Result<PairingResult>::failure(common::ErrorCode::InvalidPayload, reason,
                                                detail);
}

} // namespace

ListenerOptions listener_options_from_config(const config::ListenerConfig &config) {
  return ListenerOptions{
      .host = config.host,
      .port = config.port,
      .poll_interval = std::chrono::milliseconds(config.poll_interval_ms),
      .client_read_timeout = std::chrono::seconds(config.client_read_timeout_secs),
      .max_body_bytes = config.max_body_bytes,
  };
}

std::string_view listener_state_name(const ListenerState state) {
  switch (state) {
  case ListenerState::Created:
    return "created";
  case ListenerState::Listening:
    return "listening";
  case ListenerState::Paired:
    return "paired";
  case ListenerState::TimedOut:
    return "timed_out";
  case ListenerState::Stopped:
    return "stopped";
  }
  return "stopped";
}

common::Result<std::shared_ptr<PairingListener>>
PairingListener::bind(const ListenerOptions &options) {
  using BindResult = common::Result<std::shared_ptr<PairingListener>>;

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(options.port);
  const std::string host = common::to_lower(common::trim(options.host));
  if (host == "localhost") {
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  } else if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    return BindResult::failure(common::ErrorCode::BindFailure,
                               "invalid bind host: " + options.host);
  }

  int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return BindResult::failure(common::ErrorCode::BindFailure,
                               std::string("failed to create listen socket: ") +
                                   std::strerror(errno));
  }

  int reuse = 1;
  setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  const std::string where = options.host + ":" + std::to_string(options.port);
  if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    const std::string msg = std::strerror(errno);
    net::close_fd(fd);
    return BindResult::failure(common::ErrorCode::BindFailure,
                               "bind " + where + " failed: " + msg);
  }
  if (listen(fd, kListenBacklog) != 0) {
    const std::string msg = std::strerror(errno);
    net::close_fd(fd);
    return BindResult::failure(common::ErrorCode::BindFailure,
                               "listen on " + where + " failed: " + msg);
  }
  if (const auto nonblocking = net::set_nonblocking(fd, true); !nonblocking.ok()) {
    net::close_fd(fd);
    return BindResult::failure(common::ErrorCode::BindFailure, nonblocking.error());
  }

  std::uint16_t bound_port = options.port;
  sockaddr_in actual{};
  socklen_t actual_len = sizeof(actual);
  if (getsockname(fd, reinterpret_cast<sockaddr *>(&actual), &actual_len) == 0) {
    bound_port = ntohs(actual.sin_port);
  }

  std::shared_ptr<PairingListener> listener(new PairingListener(options, fd, bound_port));
  observability::record_listener_started(options.host, bound_port);
  return BindResult::success(std::move(listener));
}

PairingListener::PairingListener(ListenerOptions options, const int listen_fd,
                                 const std::uint16_t port)
    : options_(std::move(options)), port_(port), listen_fd_(listen_fd),
      state_(ListenerState::Listening) {}

PairingListener::~PairingListener() { stop(); }

common::Result<PairingResult>
PairingListener::await_pairing(const std::chrono::milliseconds timeout) {
  if (busy_.exchange(true)) {
    return common::Result<PairingResult>::failure(common::ErrorCode::Busy,
                                                  "a pairing wait is already in progress");
  }
  struct WaitGuard {
    std::atomic<bool> &waiting;
    std::atomic<bool> &busy;
    ~WaitGuard() {
      waiting = false;
      busy = false;
    }
  } guard{waiting_, busy_};

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_requested_ || listen_fd_ < 0) {
      return common::Result<PairingResult>::failure(common::ErrorCode::Stopped,
                                                    "listener is stopped");
    }
    state_ = ListenerState::Listening;
  }
  waiting_ = true;

  const auto started = std::chrono::steady_clock::now();
  while (true) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (elapsed >= timeout) {
      finish_session(ListenerState::TimedOut);
      return common::Result<PairingResult>::failure(
          common::ErrorCode::Timeout,
          "no pairing request within " + std::to_string(timeout.count()) + " ms");
    }
    if (stop_requested_) {
      return common::Result<PairingResult>::failure(common::ErrorCode::Stopped,
                                                    "listener stopped");
    }

    int client = -1;
    int accept_errno = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (listen_fd_ < 0) {
        return common::Result<PairingResult>::failure(common::ErrorCode::Stopped,
                                                      "listener stopped");
      }
      client = ::accept(listen_fd_, nullptr, nullptr);
      accept_errno = errno;
    }

    if (client < 0) {
      if (accept_errno == EAGAIN || accept_errno == EWOULDBLOCK || accept_errno == EINTR ||
          accept_errno == ECONNABORTED) {
        std::this_thread::sleep_for(std::min(options_.poll_interval, timeout - elapsed));
        continue;
      }
      const std::string message =
          std::string("accept failed: ") + std::strerror(accept_errno);
      observability::record_error("pairing", message);
      return common::Result<PairingResult>::failure(common::ErrorCode::Io, message);
    }

    // A silent client may not hold the wait past the caller's budget.
    const auto remaining = timeout - elapsed;
    const bool clamped = remaining < options_.client_read_timeout;
    std::string transport = "raw";
    auto result = handle_client(client, transport,
                                clamped ? remaining : options_.client_read_timeout);
    net::close_fd(client);

    if (!result.ok()) {
      observability::record_handshake_failed(transport, result.error());
      if (clamped && result.code() == common::ErrorCode::Timeout) {
        finish_session(ListenerState::TimedOut);
        return common::Result<PairingResult>::failure(
            common::ErrorCode::Timeout,
            "no pairing request within " + std::to_string(timeout.count()) + " ms");
      }
      return result;
    }

    finish_session(ListenerState::Paired);
    observability::record_pairing_received(transport, result.value().url,
                                           result.value().token);
    observability::record_metric(
        observability::PairingLatencyMetric{.latency = std::chrono::duration_cast<
                                                std::chrono::milliseconds>(
                                                std::chrono::steady_clock::now() - started)});
    return result;
  }
}

void PairingListener::stop() {
  stop_requested_ = true;
  std::lock_guard<std::mutex> lock(mutex_);
  if (listen_fd_ < 0) {
    return;
  }
  // Paired and TimedOut are terminal and survive the close.
  if (state_ == ListenerState::Created || state_ == ListenerState::Listening) {
    state_ = ListenerState::Stopped;
  }
  shutdown(listen_fd_, SHUT_RDWR);
  net::close_fd(listen_fd_);
  observability::record_listener_stopped(port_, std::string(listener_state_name(state_)));
}

ListenerStatus PairingListener::status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ListenerStatus{.running = listen_fd_ >= 0,
                        .waiting_for_pairing = waiting_.load(),
                        .port = port_,
                        .state = state_};
}

bool PairingListener::is_running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return listen_fd_ >= 0;
}

ListenerState PairingListener::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

void PairingListener::finish_session(const ListenerState outcome) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != ListenerState::Stopped) {
    state_ = outcome;
  }
}

common::Result<PairingResult>
PairingListener::handle_client(const int client_fd, std::string &transport,
                               const std::chrono::milliseconds read_timeout) {
  if (const auto blocking = net::set_nonblocking(client_fd, false); !blocking.ok()) {
    return common::Result<PairingResult>::failure(blocking);
  }
  // A zero SO_RCVTIMEO blocks forever.
  const auto io_timeout = std::max(read_timeout, std::chrono::milliseconds(1));
  if (const auto timeouts = net::set_socket_timeouts(client_fd, io_timeout, io_timeout);
      !timeouts.ok()) {
    return common::Result<PairingResult>::failure(timeouts);
  }

  net::LineReader reader(client_fd, std::max(options_.max_body_bytes, kMaxHeaderLineBytes));
  std::string first_line;
  if (const auto status = reader.read_line(first_line); status != net::ReadStatus::Ok) {
    return read_failure(status, "pairing request");
  }

  if (const auto request_line = parse_http_request_line(first_line);
      request_line.has_value()) {
    transport = "http";
    return handle_http(client_fd, reader, *request_line);
  }
  transport = "raw";
  return handle_raw_line(client_fd, first_line);
}

common::Result<PairingResult> PairingListener::handle_raw_line(const int client_fd,
                                                               const std::string &line) {
  auto parsed = parse_pairing_payload(line);
  if (!parsed.ok()) {
    return common::Result<PairingResult>::failure(common::ErrorCode::InvalidPayload,
                                                  parsed.error(), line);
  }
  if (!net::send_all(client_fd, success_line())) {
    return common::Result<PairingResult>::failure(common::ErrorCode::Io,
                                                  "failed to write pairing reply");
  }
  return parsed;
}

common::Result<PairingResult>
PairingListener::handle_http(const int client_fd, net::LineReader &reader,
                             const HttpRequestLine &request_line) {
  std::optional<std::string> content_length;
  std::size_t header_count = 0;
  while (true) {
    std::string line;
    if (const auto status = reader.read_line(line); status != net::ReadStatus::Ok) {
      return read_failure(status, "HTTP headers");
    }
    if (line.empty()) {
      break;
    }
    if (++header_count > kMaxHeaderCount) {
      return reject_http(client_fd, 400, "too many HTTP headers");
    }
    const auto header = parse_header_line(line);
    if (!header.has_value()) {
      return reject_http(client_fd, 400, "malformed HTTP header", line);
    }
    if (header->first == "content-length") {
      content_length = header->second;
    }
  }

  if (request_line.method != "POST") {
    return reject_http(client_fd, 405, "method not allowed: " + request_line.method);
  }
  if (request_line.path() != kPairPath) {
    return reject_http(client_fd, 404, "unknown path: " + request_line.target);
  }

  const auto length =
      content_length.has_value() ? parse_content_length(*content_length) : std::nullopt;
  if (!length.has_value() || *length == 0) {
    return reject_http(client_fd, 400, "missing or invalid Content-Length",
                       content_length.value_or(""));
  }
  if (*length > options_.max_body_bytes) {
    return reject_http(client_fd, 413,
                       "request body of " + std::to_string(*length) + " bytes exceeds limit");
  }

  std::string body;
  if (const auto status = reader.read_exact(*length, body); status != net::ReadStatus::Ok) {
    return read_failure(status, "HTTP body");
  }

  auto parsed = parse_pairing_payload(body);
  if (!parsed.ok()) {
    return reject_http(client_fd, 400, parsed.error(), body);
  }
  if (!net::send_all(client_fd, render_http_response(make_success_response()))) {
    return common::Result<PairingResult>::failure(common::ErrorCode::Io,
                                                  "failed to write HTTP pairing response");
  }
  return parsed;
}

} // namespace pairlink::pairing
