#pragma once

#include "pairlink/common/result.hpp"
#include "pairlink/config/schema.hpp"
#include "pairlink/net/socket.hpp"
#include "pairlink/pairing/protocol.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace pairlink::pairing {

struct ListenerOptions {
  std::string host = "0.0.0.0";
  std::uint16_t port = 10035;
  std::chrono::milliseconds poll_interval{100};
  std::chrono::milliseconds client_read_timeout{30000};
  std::size_t max_body_bytes = 64 * 1024;
};

[[nodiscard]] ListenerOptions listener_options_from_config(const config::ListenerConfig &config);

enum class ListenerState { Created, Listening, Paired, TimedOut, Stopped };

[[nodiscard]] std::string_view listener_state_name(ListenerState state);

struct ListenerStatus {
  bool running = false;
  bool waiting_for_pairing = false;
  std::uint16_t port = 0;
  ListenerState state = ListenerState::Created;
};

/// One-shot pairing endpoint. Accepts either a raw JSON line or `POST /pair` on the same port.
///
/// Only `await_pairing` blocks. `stop`, `status` and the accessors may be called from any
/// thread while a wait is in progress; the wait observes a stop at its next poll boundary.
/// Once stopped the instance never listens again. A `Paired` or `TimedOut` state is kept after
/// the socket is closed.
class PairingListener {
public:
  [[nodiscard]] static common::Result<std::shared_ptr<PairingListener>>
  bind(const ListenerOptions &options);

  ~PairingListener();

  PairingListener(const PairingListener &) = delete;
  PairingListener &operator=(const PairingListener &) = delete;

  /// Waits for a single handshake. A failed handshake ends this call but leaves the socket
  /// open for the next one.
  [[nodiscard]] common::Result<PairingResult> await_pairing(std::chrono::milliseconds timeout);

  void stop();

  [[nodiscard]] ListenerStatus status() const;
  [[nodiscard]] bool is_running() const;
  [[nodiscard]] std::uint16_t port() const { return port_; }
  [[nodiscard]] ListenerState state() const;
  [[nodiscard]] const ListenerOptions &options() const { return options_; }

private:
  PairingListener(ListenerOptions options, int listen_fd, std::uint16_t port);

  [[nodiscard]] common::Result<PairingResult>
  handle_client(int client_fd, std::string &transport, std::chrono::milliseconds read_timeout);
  [[nodiscard]] common::Result<PairingResult> handle_raw_line(int client_fd,
                                                              const std::string &line);
  [[nodiscard]] common::Result<PairingResult> handle_http(int client_fd,
                                                          net::LineReader &reader,
                                                          const HttpRequestLine &request_line);
  void finish_session(ListenerState outcome);

  const ListenerOptions options_;
  const std::uint16_t port_;

  mutable std::mutex mutex_;
  int listen_fd_ = -1;
  ListenerState state_ = ListenerState::Created;

  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> waiting_{false};
  std::atomic<bool> busy_{false};
};

} // namespace pairlink::pairing
