#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace pairlink::config {

struct ListenerConfig {
  std::string host = "0.0.0.0";
  std::uint16_t port = 10035;
  std::uint32_t pairing_timeout_secs = 300;
  std::uint32_t poll_interval_ms = 100;
  std::uint32_t client_read_timeout_secs = 30;
  std::size_t max_body_bytes = 64 * 1024;
  std::uint16_t port_search_span = 100;
};

struct LinkConfig {
  std::uint32_t connect_timeout_secs = 10;
  std::uint32_t read_timeout_secs = 30;
  std::uint32_t write_timeout_secs = 10;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  ListenerConfig listener;
  LinkConfig link;
  ObservabilityConfig observability;
};

} // namespace pairlink::config
