#pragma once

#include "pairlink/common/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace pairlink::net {

struct Endpoint {
  std::string host;
  std::uint16_t port = 0;

  /// `host:port`, with IPv6 literals in brackets.
  [[nodiscard]] std::string to_string() const;
};

/// Accepts `host:port` and `[v6-literal]:port`.
[[nodiscard]] common::Result<Endpoint> parse_endpoint(const std::string &text);

/// Resolves the endpoint and connects to the first address that answers within `timeout`.
/// The returned descriptor is in blocking mode.
[[nodiscard]] common::Result<int> connect_with_timeout(const Endpoint &endpoint,
                                                       std::chrono::milliseconds timeout);

[[nodiscard]] common::Status set_nonblocking(int fd, bool enabled);
[[nodiscard]] common::Status set_socket_timeouts(int fd, std::chrono::milliseconds read,
                                                 std::chrono::milliseconds write);

[[nodiscard]] bool send_all(int fd, const std::string &data);

/// Closes the descriptor if open and resets it to -1.
void close_fd(int &fd);

enum class ReadStatus { Ok, Eof, Timeout, TooLong, Error };

[[nodiscard]] std::string_view read_status_name(ReadStatus status);

/// Buffered reader over a blocking socket. Read deadlines come from SO_RCVTIMEO.
class LineReader {
public:
  LineReader(int fd, std::size_t max_line_bytes);

  /// Next line without its terminator (`\n` or `\r\n`). A final unterminated line is returned
  /// when the peer closes after sending it.
  ReadStatus read_line(std::string &line);

  /// Exactly `size` bytes, consuming anything already buffered first.
  ReadStatus read_exact(std::size_t size, std::string &out);

private:
  ReadStatus fill();

  int fd_;
  std::size_t max_line_bytes_;
  std::string buffer_;
};

} // namespace pairlink::net
