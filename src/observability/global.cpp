#include "pairlink/observability/global.hpp"

#include "pairlink/common/crypto.hpp"

#include <mutex>

namespace pairlink::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_listener_started(const std::string &host, const std::uint16_t port) {
  record_event(ListenerStartedEvent{.host = host, .port = port});
}

void record_listener_stopped(const std::uint16_t port, const std::string &reason) {
  record_event(ListenerStoppedEvent{.port = port, .reason = reason});
}

void record_pairing_received(const std::string &transport, const std::string &url,
                             const std::string &token) {
  record_event(PairingReceivedEvent{.transport = transport,
                                    .url = url,
                                    .token_fingerprint = common::token_fingerprint(token)});
}

void record_handshake_failed(const std::string &transport, const std::string &reason) {
  record_event(HandshakeFailedEvent{.transport = transport, .reason = reason});
}

void record_link_event(const std::string &connection_id, const std::string &endpoint,
                       const std::string &action, const bool success,
                       const std::string &message) {
  record_event(LinkEvent{.connection_id = connection_id,
                         .endpoint = endpoint,
                         .action = action,
                         .success = success,
                         .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace pairlink::observability
