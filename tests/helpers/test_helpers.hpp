#pragma once

#include "pairlink/config/schema.hpp"
#include "pairlink/observability/observer.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace pairlink::testing {

/// Defaults with short timeouts and no log output.
config::Config quiet_config();

/// A port the kernel just handed out on 127.0.0.1; free again when this returns.
std::uint16_t ephemeral_port();

class TempDir {
public:
  TempDir();
  ~TempDir();

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

/// Keeps every event and metric it receives.
class CaptureObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "capture"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::vector<observability::ObserverMetric> metrics() const;

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::vector<observability::ObserverMetric> metrics_;
};

/// Single-connection device socket server. For the n-th request line it receives it writes
/// the n-th group of reply lines. An empty group sends nothing back.
class FakeDevice {
public:
  explicit FakeDevice(std::vector<std::vector<std::string>> replies);
  ~FakeDevice();

  FakeDevice(const FakeDevice &) = delete;
  FakeDevice &operator=(const FakeDevice &) = delete;

  [[nodiscard]] std::uint16_t port() const { return port_; }
  [[nodiscard]] std::string endpoint() const;
  /// Request lines received so far.
  [[nodiscard]] std::vector<std::string> requests() const;

private:
  void serve();

  std::vector<std::vector<std::string>> replies_;
  int listen_fd_ = -1;
  int client_fd_ = -1;
  std::uint16_t port_ = 0;
  mutable std::mutex mutex_;
  std::vector<std::string> requests_;
  std::thread thread_;
};

/// Blocking loopback client socket with a receive timeout, or -1.
int connect_local(std::uint16_t port, std::chrono::milliseconds timeout = std::chrono::seconds(5));
bool send_text(int fd, const std::string &text);
/// Everything the peer sends until it closes or the receive timeout fires.
std::string read_all(int fd);
void close_socket(int fd);

/// Sends `payload` to a loopback port and returns the full reply.
std::string exchange(std::uint16_t port, const std::string &payload);

} // namespace pairlink::testing
