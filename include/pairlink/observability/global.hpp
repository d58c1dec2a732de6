#pragma once

#include "pairlink/observability/observer.hpp"

#include <memory>
#include <string>

namespace pairlink::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_listener_started(const std::string &host, std::uint16_t port);
void record_listener_stopped(std::uint16_t port, const std::string &reason);
/// The token itself is never forwarded, only its fingerprint.
void record_pairing_received(const std::string &transport, const std::string &url,
                             const std::string &token);
void record_handshake_failed(const std::string &transport, const std::string &reason);
void record_link_event(const std::string &connection_id, const std::string &endpoint,
                       const std::string &action, bool success, const std::string &message = "");
void record_error(const std::string &component, const std::string &message);

} // namespace pairlink::observability
