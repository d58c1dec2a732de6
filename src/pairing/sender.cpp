#include "pairlink/pairing/sender.hpp"

#include "pairlink/common/fs.hpp"

#include <curl/curl.h>

namespace pairlink::pairing {

namespace {

constexpr std::size_t kMaxReplyBytes = 64 * 1024;

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

std::string pair_url(const std::string &base_url) {
  std::string url = common::trim(base_url);
  if (url.find("://") == std::string::npos) {
    url = "http://" + url;
  }
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url + std::string(kPairPath);
}

} // namespace

PairingSender::PairingSender(const std::chrono::milliseconds timeout) : timeout_(timeout) {
  curl_global_init(CURL_GLOBAL_DEFAULT);
}

PairingSender::~PairingSender() { curl_global_cleanup(); }

common::Result<std::string> PairingSender::send_line(const net::Endpoint &target,
                                                     const PairingResult &pairing) const {
  auto connected = net::connect_with_timeout(target, timeout_);
  if (!connected.ok()) {
    return common::Result<std::string>::failure(connected.status());
  }
  int fd = connected.value();

  if (const auto timeouts = net::set_socket_timeouts(fd, timeout_, timeout_); !timeouts.ok()) {
    net::close_fd(fd);
    return common::Result<std::string>::failure(timeouts);
  }
  if (!net::send_all(fd, pairing.to_json() + "\n")) {
    net::close_fd(fd);
    return common::Result<std::string>::failure(common::ErrorCode::Io,
                                                "failed to send pairing line to " +
                                                    target.to_string());
  }

  net::LineReader reader(fd, kMaxReplyBytes);
  std::string reply;
  const auto status = reader.read_line(reply);
  net::close_fd(fd);
  if (status == net::ReadStatus::Ok) {
    return common::Result<std::string>::success(reply);
  }
  return common::Result<std::string>::failure(
      status == net::ReadStatus::Timeout ? common::ErrorCode::Timeout : common::ErrorCode::Io,
      "no pairing reply: " + std::string(net::read_status_name(status)));
}

common::Result<HttpReply> PairingSender::send_http(const std::string &base_url,
                                                   const PairingResult &pairing) const {
  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    return common::Result<HttpReply>::failure(common::ErrorCode::Internal,
                                              "curl_easy_init failed");
  }

  const std::string url = pair_url(base_url);
  const std::string body = pairing.to_json();
  HttpReply reply;

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &reply.body);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "pairlink/0.1");
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

  struct curl_slist *header_list = nullptr;
  header_list = curl_slist_append(header_list, "Content-Type: application/json");
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

  const CURLcode code = curl_easy_perform(curl);
  long status = 0;
  if (code == CURLE_OK) {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  }
  curl_slist_free_all(header_list);
  curl_easy_cleanup(curl);

  if (code == CURLE_OPERATION_TIMEDOUT) {
    return common::Result<HttpReply>::failure(common::ErrorCode::Timeout,
                                              "POST " + url + " timed out");
  }
  if (code == CURLE_COULDNT_CONNECT || code == CURLE_COULDNT_RESOLVE_HOST) {
    return common::Result<HttpReply>::failure(common::ErrorCode::ConnectFailure,
                                              "POST " + url + ": " + curl_easy_strerror(code));
  }
  if (code != CURLE_OK) {
    return common::Result<HttpReply>::failure(common::ErrorCode::Io,
                                              "POST " + url + ": " + curl_easy_strerror(code));
  }
  reply.status = static_cast<std::uint16_t>(status);
  return common::Result<HttpReply>::success(std::move(reply));
}

} // namespace pairlink::pairing
