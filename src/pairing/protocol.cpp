#include "pairlink/pairing/protocol.hpp"

#include "pairlink/common/fs.hpp"
#include "pairlink/common/json_util.hpp"

#include <cctype>
#include <charconv>
#include <sstream>

namespace pairlink::pairing {

namespace {

bool is_method_char(const char ch) {
  return std::isupper(static_cast<unsigned char>(ch)) != 0 || ch == '-' || ch == '_';
}

bool is_http_version(const std::string &text) {
  return text.size() == 8 && text.compare(0, 5, "HTTP/") == 0 &&
         std::isdigit(static_cast<unsigned char>(text[5])) != 0 && text[6] == '.' &&
         std::isdigit(static_cast<unsigned char>(text[7])) != 0;
}

} // namespace

std::string PairingResult::to_json() const {
  return R"({"url":)" + common::json_quote(url) + R"(,"token":)" + common::json_quote(token) +
         "}";
}

std::string HttpRequestLine::path() const {
  const auto query = target.find('?');
  return query == std::string::npos ? target : target.substr(0, query);
}

common::Result<PairingResult> parse_pairing_payload(const std::string &payload) {
  const std::string trimmed = common::trim(payload);
  const auto parsed = common::json_parse_object(trimmed);
  if (!parsed.ok()) {
    return common::Result<PairingResult>::failure(common::ErrorCode::InvalidPayload,
                                                  parsed.error(), payload);
  }

  const auto url = parsed.value().get_string("url");
  if (!url.has_value()) {
    return common::Result<PairingResult>::failure(common::ErrorCode::InvalidPayload,
                                                  "missing string field 'url'", payload);
  }
  const auto token = parsed.value().get_string("token");
  if (!token.has_value()) {
    return common::Result<PairingResult>::failure(common::ErrorCode::InvalidPayload,
                                                  "missing string field 'token'", payload);
  }
  return common::Result<PairingResult>::success(PairingResult{.url = *url, .token = *token});
}

std::optional<HttpRequestLine> parse_http_request_line(const std::string &line) {
  const auto first = line.find(' ');
  if (first == std::string::npos || first == 0) {
    return std::nullopt;
  }
  const auto second = line.find(' ', first + 1);
  if (second == std::string::npos || second == first + 1 ||
      line.find(' ', second + 1) != std::string::npos) {
    return std::nullopt;
  }

  HttpRequestLine request{.method = line.substr(0, first),
                          .target = line.substr(first + 1, second - first - 1),
                          .version = line.substr(second + 1)};
  for (const char ch : request.method) {
    if (!is_method_char(ch)) {
      return std::nullopt;
    }
  }
  if (!is_http_version(request.version)) {
    return std::nullopt;
  }
  return request;
}

std::optional<std::pair<std::string, std::string>> parse_header_line(const std::string &line) {
  const auto colon = line.find(':');
  if (colon == std::string::npos || colon == 0) {
    return std::nullopt;
  }
  return std::make_pair(common::to_lower(common::trim(line.substr(0, colon))),
                        common::trim(line.substr(colon + 1)));
}

std::optional<std::size_t> parse_content_length(const std::string &value) {
  if (value.empty()) {
    return std::nullopt;
  }
  std::size_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc() || ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return parsed;
}

std::string status_text(const int status) {
  switch (status) {
  case 200:
    return "OK";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 413:
    return "Payload Too Large";
  case 500:
    return "Internal Server Error";
  default:
    return "Unknown";
  }
}

std::string render_http_response(const HttpResponse &response) {
  std::ostringstream out;
  out << "HTTP/1.1 " << response.status << " " << status_text(response.status) << "\r\n";
  if (!response.content_type.empty()) {
    out << "Content-Type: " << response.content_type << "\r\n";
  }
  out << "Content-Length: " << response.body.size() << "\r\n";
  out << "Connection: close\r\n";
  out << "\r\n";
  out << response.body;
  return out.str();
}

HttpResponse make_success_response() {
  return HttpResponse{.status = 200,
                      .content_type = "application/json",
                      .body = std::string(kSuccessBody)};
}

HttpResponse make_empty_response(const int status) {
  return HttpResponse{.status = status, .content_type = "", .body = ""};
}

std::string success_line() { return std::string(kSuccessBody) + "\n"; }

} // namespace pairlink::pairing
