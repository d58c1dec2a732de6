#include "test_framework.hpp"

#include "pairlink/config/schema.hpp"
#include "pairlink/observability/factory.hpp"
#include "pairlink/observability/global.hpp"
#include "pairlink/observability/log_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <iostream>
#include <sstream>

namespace {

// Redirects std::cerr into a buffer for the lifetime of the guard.
struct StderrCapture {
  std::ostringstream buffer;
  std::streambuf *previous;

  StderrCapture() : previous(std::cerr.rdbuf(buffer.rdbuf())) {}
  ~StderrCapture() { std::cerr.rdbuf(previous); }
};

} // namespace

void register_observability_tests(std::vector<pairlink::tests::TestCase> &tests) {
  using pairlink::tests::require;
  namespace obs = pairlink::observability;

  tests.push_back({"observer_factory_selects_backend", [] {
                     pairlink::config::Config config;
                     config.observability.backend = "log";
                     require(obs::create_observer(config)->name() == "log", "log backend");
                     config.observability.backend = "NONE";
                     require(obs::create_observer(config)->name() == "noop", "none backend");
                     config.observability.backend = "noop";
                     require(obs::create_observer(config)->name() == "noop", "noop backend");
                     config.observability.backend = "prometheus";
                     require(obs::create_observer(config)->name() == "log",
                             "unknown backend falls back to log");
                   }});

  tests.push_back({"log_observer_writes_level_prefixed_lines", [] {
                     obs::LogObserver observer;
                     StderrCapture capture;
                     observer.record_event(obs::ListenerStartedEvent{.host = "0.0.0.0",
                                                                     .port = 10035});
                     observer.record_event(
                         obs::HandshakeFailedEvent{.transport = "raw", .reason = "bad json"});
                     observer.record_event(
                         obs::ErrorEvent{.component = "pairing", .message = "accept failed"});
                     observer.record_metric(obs::ActiveLinksMetric{.count = 2});
                     const std::string out = capture.buffer.str();
                     require(out.find("[INFO] listener.start host=0.0.0.0 port=10035") !=
                                 std::string::npos,
                             "missing start line: " + out);
                     require(out.find("[WARN] pairing.rejected transport=raw") !=
                                 std::string::npos,
                             "missing warn line: " + out);
                     require(out.find("[ERROR] pairing: accept failed") != std::string::npos,
                             "missing error line: " + out);
                     require(out.find("[DEBUG] metric.active_links=2") != std::string::npos,
                             "missing metric line: " + out);
                   }});

  tests.push_back({"global_observer_receives_helpers", [] {
                     auto capture = std::make_unique<pairlink::testing::CaptureObserver>();
                     auto *raw = capture.get();
                     obs::set_global_observer(std::move(capture));

                     obs::record_listener_started("127.0.0.1", 4000);
                     obs::record_link_event("phone", "10.0.0.2:9000", "connect", true);
                     obs::record_metric(obs::PairingLatencyMetric{});

                     const auto events = raw->events();
                     require(events.size() == 2, "expected two events");
                     require(std::holds_alternative<obs::ListenerStartedEvent>(events[0]),
                             "first event type");
                     const auto &link = std::get<obs::LinkEvent>(events[1]);
                     require(link.connection_id == "phone" && link.success, "link event fields");
                     require(raw->metrics().size() == 1, "expected one metric");

                     obs::set_global_observer(nullptr);
                     obs::record_error("test", "dropped without observer");
                   }});

  tests.push_back({"pairing_event_never_carries_raw_token", [] {
                     auto capture = std::make_unique<pairlink::testing::CaptureObserver>();
                     auto *raw = capture.get();
                     obs::set_global_observer(std::move(capture));

                     obs::record_pairing_received("http", "ws://10.0.0.5:8080", "tok-123456");

                     const auto events = raw->events();
                     obs::set_global_observer(nullptr);
                     require(events.size() == 1, "expected one event");
                     const auto &event = std::get<obs::PairingReceivedEvent>(events[0]);
                     require(event.url == "ws://10.0.0.5:8080", "url mismatch");
                     require(event.token_fingerprint.find("tok-123456") == std::string::npos,
                             "token leaked into event");
                     require(event.token_fingerprint.find("len=10") == 0, "fingerprint length");
                   }});
}
