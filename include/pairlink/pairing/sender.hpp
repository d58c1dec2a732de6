#pragma once

#include "pairlink/common/result.hpp"
#include "pairlink/net/socket.hpp"
#include "pairlink/pairing/protocol.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace pairlink::pairing {

struct HttpReply {
  std::uint16_t status = 0;
  std::string body;
};

/// Device side of the pairing handshake, for diagnostics and tests.
class PairingSender {
public:
  explicit PairingSender(std::chrono::milliseconds timeout = std::chrono::seconds(10));
  ~PairingSender();

  PairingSender(const PairingSender &) = delete;
  PairingSender &operator=(const PairingSender &) = delete;

  /// Sends the raw JSON line and returns the reply line. A listener that rejects the payload
  /// closes without replying, which surfaces as an `Io` failure.
  [[nodiscard]] common::Result<std::string> send_line(const net::Endpoint &target,
                                                      const PairingResult &pairing) const;

  /// POSTs to `<base_url>/pair`. Any HTTP status counts as a completed exchange.
  [[nodiscard]] common::Result<HttpReply> send_http(const std::string &base_url,
                                                    const PairingResult &pairing) const;

private:
  std::chrono::milliseconds timeout_;
};

} // namespace pairlink::pairing
