#include "pairlink/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace pairlink::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ListenerStartedEvent>) {
          log_line("INFO", "listener.start host=" + evt.host + " port=" + std::to_string(evt.port));
        } else if constexpr (std::is_same_v<T, ListenerStoppedEvent>) {
          log_line("INFO",
                   "listener.stop port=" + std::to_string(evt.port) + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, PairingReceivedEvent>) {
          log_line("INFO", "pairing.received transport=" + evt.transport + " url=" + evt.url +
                               " token=" + evt.token_fingerprint);
        } else if constexpr (std::is_same_v<T, HandshakeFailedEvent>) {
          log_line("WARN", "pairing.rejected transport=" + evt.transport + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, LinkEvent>) {
          std::string line = "link." + evt.action + " id=" + evt.connection_id +
                             " endpoint=" + evt.endpoint +
                             " success=" + (evt.success ? "true" : "false");
          if (!evt.message.empty()) {
            line += " message=" + evt.message;
          }
          log_line(evt.success ? "INFO" : "WARN", line);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, PairingLatencyMetric>) {
          log_line("DEBUG", "metric.pairing_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, ActiveLinksMetric>) {
          log_line("DEBUG", "metric.active_links=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(write_mutex_);
  std::cerr.flush();
}

} // namespace pairlink::observability
