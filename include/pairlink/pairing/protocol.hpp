#pragma once

#include "pairlink/common/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace pairlink::pairing {

/// What a device hands over during a pairing handshake.
struct PairingResult {
  std::string url;
  std::string token;

  bool operator==(const PairingResult &) const = default;

  [[nodiscard]] std::string to_json() const;
};

inline constexpr std::string_view kPairPath = "/pair";
inline constexpr std::string_view kSuccessBody =
    R"({"success":true,"message":"Pairing successful"})";

struct HttpRequestLine {
  std::string method;
  std::string target;
  std::string version;

  /// Target without its query string.
  [[nodiscard]] std::string path() const;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
};

/// Requires `{url, token}` with both members as strings; other members are ignored.
[[nodiscard]] common::Result<PairingResult> parse_pairing_payload(const std::string &payload);

/// Matches `METHOD SP target SP HTTP/x.y`.
[[nodiscard]] std::optional<HttpRequestLine> parse_http_request_line(const std::string &line);

/// Lowercased name and trimmed value of a `Name: value` header line.
[[nodiscard]] std::optional<std::pair<std::string, std::string>>
parse_header_line(const std::string &line);

/// Decimal Content-Length; nullopt for anything else.
[[nodiscard]] std::optional<std::size_t> parse_content_length(const std::string &value);

[[nodiscard]] std::string status_text(int status);
[[nodiscard]] std::string render_http_response(const HttpResponse &response);

[[nodiscard]] HttpResponse make_success_response();
/// Status line plus `Content-Length: 0`.
[[nodiscard]] HttpResponse make_empty_response(int status);

/// Reply written on the raw-line transport.
[[nodiscard]] std::string success_line();

} // namespace pairlink::pairing
