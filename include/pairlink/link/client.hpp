#pragma once

#include "pairlink/common/result.hpp"
#include "pairlink/config/schema.hpp"
#include "pairlink/link/protocol.hpp"
#include "pairlink/net/socket.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace pairlink::link {

struct LinkOptions {
  std::chrono::milliseconds connect_timeout{10000};
  std::chrono::milliseconds read_timeout{30000};
  std::chrono::milliseconds write_timeout{10000};
  std::size_t max_line_bytes = 64 * 1024;
};

[[nodiscard]] LinkOptions link_options_from_config(const config::LinkConfig &config);

struct LinkSession {
  std::string connection_id;
  std::string endpoint;
  std::optional<std::string> token;
};

/// Persistent line-delimited JSON connection to a device's socket server.
/// One request/response exchange runs at a time per instance.
class LinkClient {
public:
  [[nodiscard]] static common::Result<std::shared_ptr<LinkClient>>
  connect(const std::string &endpoint, const LinkOptions &options = {});

  ~LinkClient();

  LinkClient(const LinkClient &) = delete;
  LinkClient &operator=(const LinkClient &) = delete;

  /// Asks the device to issue a token. When the device answers `pending`, waits for the
  /// user's decision on the same connection.
  [[nodiscard]] common::Result<std::string> request_token();

  [[nodiscard]] common::Status login(const std::string &token);

  void disconnect();

  [[nodiscard]] bool is_connected() const { return connected_.load(); }
  [[nodiscard]] const std::string &endpoint() const { return endpoint_; }
  [[nodiscard]] std::optional<std::string> token() const;
  [[nodiscard]] LinkSession session(const std::string &connection_id) const;

private:
  LinkClient(std::string endpoint, int fd, const LinkOptions &options);

  [[nodiscard]] common::Status send_request_locked(const AuthRequest &request);
  [[nodiscard]] common::Result<AuthResponse> read_response_locked();
  void remember_token(const std::string &token);

  const std::string endpoint_;
  const int fd_;

  std::mutex io_mutex_;
  net::LineReader reader_;
  bool closed_ = false;

  mutable std::mutex token_mutex_;
  std::optional<std::string> token_;

  std::atomic<bool> connected_{true};
};

} // namespace pairlink::link
