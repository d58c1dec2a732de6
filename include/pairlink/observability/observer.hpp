#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace pairlink::observability {

struct ListenerStartedEvent {
  std::string host;
  std::uint16_t port = 0;
};

struct ListenerStoppedEvent {
  std::uint16_t port = 0;
  std::string reason;
};

struct PairingReceivedEvent {
  std::string transport;
  std::string url;
  std::string token_fingerprint;
};

struct HandshakeFailedEvent {
  std::string transport;
  std::string reason;
};

struct LinkEvent {
  std::string connection_id;
  std::string endpoint;
  std::string action;
  bool success = false;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<ListenerStartedEvent, ListenerStoppedEvent, PairingReceivedEvent,
                 HandshakeFailedEvent, LinkEvent, ErrorEvent>;

struct PairingLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct ActiveLinksMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<PairingLatencyMetric, ActiveLinksMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace pairlink::observability
