#include "pairlink/link/protocol.hpp"

#include "pairlink/common/crypto.hpp"
#include "pairlink/common/fs.hpp"
#include "pairlink/common/json_util.hpp"

#include <chrono>
#include <sstream>

namespace pairlink::link {

std::string_view auth_action_name(const AuthAction action) {
  switch (action) {
  case AuthAction::RequestToken:
    return "request_token";
  case AuthAction::Login:
    return "login";
  }
  return "request_token";
}

std::string AuthRequest::to_json() const {
  std::ostringstream out;
  out << R"({"action":)" << common::json_quote(std::string(auth_action_name(action)))
      << R"(,"requestId":)" << common::json_quote(request_id);
  if (token.has_value()) {
    out << R"(,"token":)" << common::json_quote(*token);
  }
  out << "}";
  return out.str();
}

common::Result<AuthResponse> parse_auth_response(const std::string &line) {
  const auto parsed = common::json_parse_object(common::trim(line));
  if (!parsed.ok()) {
    return common::Result<AuthResponse>::failure(common::ErrorCode::InvalidPayload,
                                                 "malformed device response: " + parsed.error(),
                                                 line);
  }
  const auto &object = parsed.value();

  AuthResponse response;
  response.success = object.get_bool("success").value_or(false);
  response.rejected = object.get_bool("rejected").value_or(false);
  response.pending = object.get_bool("pending").value_or(false);
  response.message = object.get_string("message");
  response.request_id = object.get_string("requestId");
  if (auto token = object.get_string("token"); token.has_value() && !token->empty()) {
    response.token = std::move(token);
  }
  return common::Result<AuthResponse>::success(std::move(response));
}

std::string make_request_id() {
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  return "socket_" + std::to_string(millis) + "_" + std::to_string(common::random_below(10000));
}

} // namespace pairlink::link
