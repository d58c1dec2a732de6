#include "pairlink/runtime/coordinator.hpp"

#include "pairlink/config/config.hpp"
#include "pairlink/net/ports.hpp"
#include "pairlink/observability/factory.hpp"
#include "pairlink/observability/global.hpp"

#include <algorithm>

namespace pairlink::runtime {

namespace {

common::Status not_started() {
  return common::Status::error(common::ErrorCode::NotFound,
                               "pairing listener has not been started");
}

void record_active_links(const std::size_t count) {
  observability::record_metric(observability::ActiveLinksMetric{.count = count});
}

} // namespace

PairingCoordinator::PairingCoordinator(config::Config config)
    : config_(std::move(config)), last_outcome_(not_started()) {}

PairingCoordinator::~PairingCoordinator() {
  stop_listener();
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    worker = std::move(worker_);
  }
  if (worker.joinable()) {
    worker.join();
  }
  for (const auto &id : registry_.ids()) {
    if (auto client = registry_.get(id); client != nullptr) {
      client->disconnect();
    }
  }
  registry_.clear();
}

common::Result<std::unique_ptr<PairingCoordinator>> PairingCoordinator::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<std::unique_ptr<PairingCoordinator>>::failure(loaded.status());
  }
  observability::set_global_observer(observability::create_observer(loaded.value()));
  return common::Result<std::unique_ptr<PairingCoordinator>>::success(
      std::make_unique<PairingCoordinator>(std::move(loaded.value())));
}

common::Result<std::uint16_t> PairingCoordinator::start_listener(const std::uint16_t port) {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    if (listener_ != nullptr && listener_->is_running()) {
      return common::Result<std::uint16_t>::failure(
          common::ErrorCode::AlreadyRunning,
          "pairing listener already running on port " + std::to_string(listener_->port()));
    }
    if (!worker_.joinable()) {
      break;
    }
    // The exiting worker takes mutex_; join unlocked, then re-check.
    std::thread previous = std::move(worker_);
    lock.unlock();
    previous.join();
    lock.lock();
  }

  auto options = pairing::listener_options_from_config(config_.listener);
  options.port = port == 0 ? config_.listener.port : port;

  auto bound = pairing::PairingListener::bind(options);
  if (!bound.ok() && bound.code() == common::ErrorCode::BindFailure) {
    const auto alternative =
        net::find_available_port(options.port, config_.listener.port_search_span);
    if (alternative.has_value() && *alternative != options.port) {
      observability::record_error("coordinator", "port " + std::to_string(options.port) +
                                                     " unavailable, trying " +
                                                     std::to_string(*alternative));
      options.port = *alternative;
      bound = pairing::PairingListener::bind(options);
    }
  }
  if (!bound.ok()) {
    observability::record_error("coordinator", bound.error());
    return common::Result<std::uint16_t>::failure(bound.status());
  }

  listener_ = bound.value();
  worker_active_ = true;
  last_outcome_ = common::Status::success();
  worker_ = std::thread([this, listener = listener_]() { run_listener(listener); });
  return common::Result<std::uint16_t>::success(listener_->port());
}

void PairingCoordinator::stop_listener() {
  std::shared_ptr<pairing::PairingListener> listener;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    listener = listener_;
  }
  if (listener != nullptr) {
    listener->stop();
  }
}

pairing::ListenerStatus PairingCoordinator::listener_status() const {
  std::shared_ptr<pairing::PairingListener> listener;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    listener = listener_;
  }
  return listener != nullptr ? listener->status() : pairing::ListenerStatus{};
}

std::optional<pairing::PairingResult> PairingCoordinator::latest_pairing() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return latest_;
}

std::optional<pairing::PairingResult> PairingCoordinator::take_pairing() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto taken = std::move(latest_);
  latest_.reset();
  return taken;
}

common::Result<pairing::PairingResult>
PairingCoordinator::wait_for_pairing(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  pairing_cv_.wait_for(lock, timeout,
                       [this]() { return latest_.has_value() || !worker_active_; });
  if (latest_.has_value()) {
    return common::Result<pairing::PairingResult>::success(*latest_);
  }
  if (!worker_active_) {
    return common::Result<pairing::PairingResult>::failure(last_outcome_);
  }
  return common::Result<pairing::PairingResult>::failure(common::ErrorCode::Timeout,
                                                         "still waiting for a device");
}

common::Result<std::string> PairingCoordinator::pairing_address() const {
  const auto status = listener_status();
  if (!status.running) {
    return common::Result<std::string>::failure(common::ErrorCode::NotFound,
                                                "pairing listener is not running");
  }
  const auto ip = net::local_ipv4_address();
  if (!ip.ok()) {
    return common::Result<std::string>::failure(ip.status());
  }
  return common::Result<std::string>::success(ip.value() + ":" + std::to_string(status.port));
}

common::Result<std::string>
PairingCoordinator::connect_link(const std::string &connection_id, const std::string &endpoint,
                                 const std::optional<std::string> &token) {
  if (connection_id.empty()) {
    return common::Result<std::string>::failure(common::ErrorCode::InvalidArgument,
                                                "connection id must not be empty");
  }

  const auto fail = [&](const common::Status &status) {
    observability::record_link_event(connection_id, endpoint, "connect", false, status.error());
    return common::Result<std::string>::failure(status);
  };

  auto connected =
      link::LinkClient::connect(endpoint, link::link_options_from_config(config_.link));
  if (!connected.ok()) {
    return fail(connected.status());
  }
  auto client = connected.value();

  std::string issued;
  if (token.has_value()) {
    if (const auto logged_in = client->login(*token); !logged_in.ok()) {
      client->disconnect();
      return fail(logged_in);
    }
    issued = *token;
  } else {
    auto requested = client->request_token();
    if (!requested.ok()) {
      client->disconnect();
      return fail(requested.status());
    }
    issued = requested.value();
  }

  // The displaced client, if any, is released here; its destructor closes the socket once
  // no other holder remains.
  const auto displaced = registry_.put(connection_id, client);
  observability::record_link_event(connection_id, endpoint, "connect", true,
                                   displaced != nullptr ? "replaced existing link" : "");
  record_active_links(registry_.size());
  return common::Result<std::string>::success(issued);
}

common::Status PairingCoordinator::disconnect_link(const std::string &connection_id) {
  const auto client = registry_.get(connection_id);
  if (client == nullptr || !registry_.remove(connection_id)) {
    return common::Status::error(common::ErrorCode::NotFound,
                                 "no link with id " + connection_id);
  }
  client->disconnect();
  observability::record_link_event(connection_id, client->endpoint(), "disconnect", true);
  record_active_links(registry_.size());
  return common::Status::success();
}

std::shared_ptr<link::LinkClient>
PairingCoordinator::link(const std::string &connection_id) const {
  return registry_.get(connection_id);
}

std::vector<link::LinkSession> PairingCoordinator::links() const { return registry_.sessions(); }

void PairingCoordinator::run_listener(std::shared_ptr<pairing::PairingListener> listener) {
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::seconds(config_.listener.pairing_timeout_secs);

  while (true) {
    const auto remaining = std::max(std::chrono::duration_cast<std::chrono::milliseconds>(
                                        deadline - std::chrono::steady_clock::now()),
                                    std::chrono::milliseconds(0));
    auto result = listener->await_pairing(remaining);
    if (result.ok()) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        latest_ = result.value();
      }
      listener->stop();
      finish_worker(common::Status::success());
      return;
    }

    const auto state = listener->state();
    if (state == pairing::ListenerState::TimedOut) {
      listener->stop();
      finish_worker(result.status());
      return;
    }
    if (state == pairing::ListenerState::Stopped ||
        result.code() == common::ErrorCode::Stopped || result.code() == common::ErrorCode::Busy) {
      finish_worker(result.status());
      return;
    }
    if (result.code() == common::ErrorCode::Io) {
      std::this_thread::sleep_for(listener->options().poll_interval);
    }
  }
}

void PairingCoordinator::finish_worker(common::Status outcome) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    worker_active_ = false;
    last_outcome_ = std::move(outcome);
  }
  pairing_cv_.notify_all();
}

} // namespace pairlink::runtime
