#pragma once

#include "pairlink/common/result.hpp"
#include "pairlink/config/schema.hpp"
#include "pairlink/link/registry.hpp"
#include "pairlink/pairing/listener.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace pairlink::runtime {

/// Owns the pairing listener, its worker thread and the link registry for one host process.
/// All methods are synchronous and thread-safe.
class PairingCoordinator {
public:
  explicit PairingCoordinator(config::Config config);
  ~PairingCoordinator();

  PairingCoordinator(const PairingCoordinator &) = delete;
  PairingCoordinator &operator=(const PairingCoordinator &) = delete;

  /// Loads the config from disk and installs the configured observer.
  [[nodiscard]] static common::Result<std::unique_ptr<PairingCoordinator>> from_disk();

  [[nodiscard]] const config::Config &config() const { return config_; }

  /// Binds a listener and starts waiting for a device in the background. Port 0 selects the
  /// configured port; a busy port is replaced by the next free one. Returns the bound port.
  [[nodiscard]] common::Result<std::uint16_t> start_listener(std::uint16_t port = 0);

  /// Signals the listener to stop and returns without waiting for the worker.
  void stop_listener();

  [[nodiscard]] pairing::ListenerStatus listener_status() const;

  [[nodiscard]] std::optional<pairing::PairingResult> latest_pairing() const;
  /// Returns the unconsumed pairing result and clears it.
  [[nodiscard]] std::optional<pairing::PairingResult> take_pairing();
  /// Blocks until a result is available or the current listener session ends.
  [[nodiscard]] common::Result<pairing::PairingResult>
  wait_for_pairing(std::chrono::milliseconds timeout);

  /// `<lan-ipv4>:<port>` for the running listener.
  [[nodiscard]] common::Result<std::string> pairing_address() const;

  /// Connects, then logs in with `token` or asks the device for a new one. Returns the token.
  [[nodiscard]] common::Result<std::string>
  connect_link(const std::string &connection_id, const std::string &endpoint,
               const std::optional<std::string> &token = std::nullopt);
  [[nodiscard]] common::Status disconnect_link(const std::string &connection_id);

  [[nodiscard]] std::shared_ptr<link::LinkClient> link(const std::string &connection_id) const;
  [[nodiscard]] std::vector<link::LinkSession> links() const;

private:
  void run_listener(std::shared_ptr<pairing::PairingListener> listener);
  void finish_worker(common::Status outcome);

  config::Config config_;

  mutable std::mutex mutex_;
  std::condition_variable pairing_cv_;
  std::shared_ptr<pairing::PairingListener> listener_;
  std::thread worker_;
  bool worker_active_ = false;
  common::Status last_outcome_;
  std::optional<pairing::PairingResult> latest_;

  link::LinkRegistry registry_;
};

} // namespace pairlink::runtime
