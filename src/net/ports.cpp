#include "pairlink/net/ports.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace pairlink::net {

bool is_port_available(const std::uint16_t port) {
  const int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return false;
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  const bool bound = ::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0;
  ::close(fd);
  return bound;
}

std::optional<std::uint16_t> find_available_port(const std::uint16_t start,
                                                 const std::uint16_t span) {
  const std::uint32_t last = std::min<std::uint32_t>(static_cast<std::uint32_t>(start) + span,
                                                     65535U);
  for (std::uint32_t port = start; port <= last; ++port) {
    if (port == 0) {
      continue;
    }
    if (is_port_available(static_cast<std::uint16_t>(port))) {
      return static_cast<std::uint16_t>(port);
    }
  }
  return std::nullopt;
}

common::Result<std::string> local_ipv4_address() {
  ifaddrs *interfaces = nullptr;
  if (getifaddrs(&interfaces) != 0) {
    return common::Result<std::string>::failure(
        common::ErrorCode::Io, std::string("getifaddrs failed: ") + std::strerror(errno));
  }

  std::string found;
  for (const ifaddrs *it = interfaces; it != nullptr; it = it->ifa_next) {
    if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    if ((it->ifa_flags & IFF_UP) == 0 || (it->ifa_flags & IFF_LOOPBACK) != 0) {
      continue;
    }
    const auto *addr = reinterpret_cast<const sockaddr_in *>(it->ifa_addr);
    char text[INET_ADDRSTRLEN] = {};
    if (inet_ntop(AF_INET, &addr->sin_addr, text, sizeof(text)) != nullptr) {
      found = text;
      break;
    }
  }
  freeifaddrs(interfaces);

  if (found.empty()) {
    return common::Result<std::string>::failure(common::ErrorCode::NotFound,
                                                "no non-loopback IPv4 interface is up");
  }
  return common::Result<std::string>::success(found);
}

} // namespace pairlink::net
