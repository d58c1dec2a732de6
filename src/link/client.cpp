#include "pairlink/link/client.hpp"

#include <sys/socket.h>
#include <unistd.h>

namespace pairlink::link {

namespace {

constexpr const char *kRejectedMessage = "Authorization rejected by user";
constexpr const char *kNoTokenAfterPending = "No token in authorization response";
constexpr const char *kNoToken = "Failed to get token";
constexpr const char *kLoginFailed = "Login failed";

} // namespace

LinkOptions link_options_from_config(const config::LinkConfig &config) {
  return LinkOptions{.connect_timeout = std::chrono::seconds(config.connect_timeout_secs),
                     .read_timeout = std::chrono::seconds(config.read_timeout_secs),
                     .write_timeout = std::chrono::seconds(config.write_timeout_secs)};
}

common::Result<std::shared_ptr<LinkClient>> LinkClient::connect(const std::string &endpoint,
                                                                const LinkOptions &options) {
  using ConnectResult = common::Result<std::shared_ptr<LinkClient>>;

  const auto parsed = net::parse_endpoint(endpoint);
  if (!parsed.ok()) {
    return ConnectResult::failure(parsed.status());
  }
  auto connected = net::connect_with_timeout(parsed.value(), options.connect_timeout);
  if (!connected.ok()) {
    return ConnectResult::failure(connected.status());
  }

  int fd = connected.value();
  if (const auto timeouts =
          net::set_socket_timeouts(fd, options.read_timeout, options.write_timeout);
      !timeouts.ok()) {
    net::close_fd(fd);
    return ConnectResult::failure(timeouts);
  }
  return ConnectResult::success(
      std::shared_ptr<LinkClient>(new LinkClient(endpoint, fd, options)));
}

LinkClient::LinkClient(std::string endpoint, const int fd, const LinkOptions &options)
    : endpoint_(std::move(endpoint)), fd_(fd), reader_(fd, options.max_line_bytes) {}

LinkClient::~LinkClient() { disconnect(); }

common::Result<std::string> LinkClient::request_token() {
  std::lock_guard<std::mutex> lock(io_mutex_);
  const AuthRequest request{.action = AuthAction::RequestToken,
                            .request_id = make_request_id(),
                            .token = std::nullopt};
  if (const auto sent = send_request_locked(request); !sent.ok()) {
    return common::Result<std::string>::failure(sent);
  }

  auto response = read_response_locked();
  if (!response.ok()) {
    return common::Result<std::string>::failure(response.status());
  }

  const bool pending = response.value().pending;
  if (pending && !response.value().rejected) {
    response = read_response_locked();
    if (!response.ok()) {
      return common::Result<std::string>::failure(response.status());
    }
  }

  const AuthResponse &decision = response.value();
  if (decision.rejected) {
    return common::Result<std::string>::failure(common::ErrorCode::Rejected, kRejectedMessage);
  }
  if (decision.token.has_value()) {
    remember_token(*decision.token);
    return common::Result<std::string>::success(*decision.token);
  }
  return common::Result<std::string>::failure(
      common::ErrorCode::NoToken,
      decision.message.value_or(pending ? kNoTokenAfterPending : kNoToken));
}

common::Status LinkClient::login(const std::string &token) {
  std::lock_guard<std::mutex> lock(io_mutex_);
  const AuthRequest request{
      .action = AuthAction::Login, .request_id = make_request_id(), .token = token};
  if (const auto sent = send_request_locked(request); !sent.ok()) {
    return sent;
  }

  const auto response = read_response_locked();
  if (!response.ok()) {
    return response.status();
  }
  if (!response.value().success) {
    return common::Status::error(common::ErrorCode::LoginFailed,
                                 response.value().message.value_or(kLoginFailed));
  }
  remember_token(token);
  return common::Status::success();
}

void LinkClient::disconnect() {
  if (connected_.exchange(false)) {
    shutdown(fd_, SHUT_RDWR);
  }
  std::lock_guard<std::mutex> lock(io_mutex_);
  if (!closed_) {
    ::close(fd_);
    closed_ = true;
  }
}

std::optional<std::string> LinkClient::token() const {
  std::lock_guard<std::mutex> lock(token_mutex_);
  return token_;
}

LinkSession LinkClient::session(const std::string &connection_id) const {
  return LinkSession{.connection_id = connection_id, .endpoint = endpoint_, .token = token()};
}

common::Status LinkClient::send_request_locked(const AuthRequest &request) {
  if (closed_ || !connected_) {
    return common::Status::error(common::ErrorCode::Io, "link to " + endpoint_ + " is closed");
  }
  if (!net::send_all(fd_, request.to_json() + "\n")) {
    connected_ = false;
    return common::Status::error(common::ErrorCode::Io,
                                 "failed to send " +
                                     std::string(auth_action_name(request.action)) + " to " +
                                     endpoint_);
  }
  return common::Status::success();
}

common::Result<AuthResponse> LinkClient::read_response_locked() {
  std::string line;
  const auto status = reader_.read_line(line);
  switch (status) {
  case net::ReadStatus::Ok:
    return parse_auth_response(line);
  case net::ReadStatus::Timeout:
    return common::Result<AuthResponse>::failure(common::ErrorCode::Timeout,
                                                 "timed out waiting for " + endpoint_);
  case net::ReadStatus::TooLong:
    return common::Result<AuthResponse>::failure(common::ErrorCode::InvalidPayload,
                                                 "device response exceeds line limit");
  case net::ReadStatus::Eof:
  case net::ReadStatus::Error:
    break;
  }
  connected_ = false;
  return common::Result<AuthResponse>::failure(
      common::ErrorCode::Io, endpoint_ + ": " + std::string(net::read_status_name(status)));
}

void LinkClient::remember_token(const std::string &token) {
  std::lock_guard<std::mutex> lock(token_mutex_);
  token_ = token;
}

} // namespace pairlink::link
