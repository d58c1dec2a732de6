#pragma once

#include "pairlink/common/result.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace pairlink::link {

enum class AuthAction { RequestToken, Login };

[[nodiscard]] std::string_view auth_action_name(AuthAction action);

struct AuthRequest {
  AuthAction action = AuthAction::RequestToken;
  std::string request_id;
  std::optional<std::string> token;

  /// Single-line JSON; `token` is omitted when absent.
  [[nodiscard]] std::string to_json() const;
};

struct AuthResponse {
  bool success = false;
  std::optional<std::string> message;
  std::optional<std::string> token;
  bool rejected = false;
  std::optional<std::string> request_id;
  bool pending = false;
};

/// Every member but `success` is optional; booleans may also arrive as "true"/"false".
[[nodiscard]] common::Result<AuthResponse> parse_auth_response(const std::string &line);

/// `socket_<unix-millis>_<0..9999>`. Not guaranteed unique.
[[nodiscard]] std::string make_request_id();

} // namespace pairlink::link
