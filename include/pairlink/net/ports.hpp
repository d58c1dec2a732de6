#pragma once

#include "pairlink/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace pairlink::net {

constexpr std::uint16_t kDefaultPortSearchSpan = 100;

/// True when a local bind on 127.0.0.1:port succeeds. The test socket is released at once.
[[nodiscard]] bool is_port_available(std::uint16_t port);

/// First available port in [start, start + span], clamped at 65535.
[[nodiscard]] std::optional<std::uint16_t>
find_available_port(std::uint16_t start, std::uint16_t span = kDefaultPortSearchSpan);

/// First non-loopback IPv4 address of an interface that is up.
[[nodiscard]] common::Result<std::string> local_ipv4_address();

} // namespace pairlink::net
