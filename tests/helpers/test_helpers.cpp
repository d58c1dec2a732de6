#include "tests/helpers/test_helpers.hpp"

#include <fstream>
#include <random>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace pairlink::testing {

namespace {

constexpr int kDeviceIdleMs = 5000;

void set_receive_timeout(const int fd, const std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<long>(timeout.count() / 1000);
  tv.tv_usec = static_cast<decltype(tv.tv_usec)>((timeout.count() % 1000) * 1000);
  setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

bool read_line(const int fd, std::string &buffer, std::string &line) {
  while (true) {
    const auto newline = buffer.find('\n');
    if (newline != std::string::npos) {
      line = buffer.substr(0, newline);
      buffer.erase(0, newline + 1);
      return true;
    }
    char chunk[1024];
    const ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
    if (n <= 0) {
      return false;
    }
    buffer.append(chunk, static_cast<std::size_t>(n));
  }
}

} // namespace

config::Config quiet_config() {
  config::Config config;
  config.listener.host = "127.0.0.1";
  config.listener.pairing_timeout_secs = 5;
  config.listener.poll_interval_ms = 20;
  config.listener.client_read_timeout_secs = 2;
  config.link.connect_timeout_secs = 2;
  config.link.read_timeout_secs = 2;
  config.link.write_timeout_secs = 2;
  config.observability.backend = "none";
  return config;
}

std::uint16_t ephemeral_port() {
  const int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return 0;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = 0;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  std::uint16_t port = 0;
  if (bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0) {
    sockaddr_in actual{};
    socklen_t len = sizeof(actual);
    if (getsockname(fd, reinterpret_cast<sockaddr *>(&actual), &len) == 0) {
      port = ntohs(actual.sin_port);
    }
  }
  close(fd);
  return port;
}

TempDir::TempDir() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("pairlink-test-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempDir::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

void CaptureObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

void CaptureObserver::record_metric(const observability::ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.push_back(metric);
}

std::vector<observability::ObserverEvent> CaptureObserver::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::vector<observability::ObserverMetric> CaptureObserver::metrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

FakeDevice::FakeDevice(std::vector<std::vector<std::string>> replies)
    : replies_(std::move(replies)) {
  listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
  int reuse = 1;
  setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = 0;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0 &&
      listen(listen_fd_, 4) == 0) {
    sockaddr_in actual{};
    socklen_t len = sizeof(actual);
    if (getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&actual), &len) == 0) {
      port_ = ntohs(actual.sin_port);
    }
  }
  thread_ = std::thread([this]() { serve(); });
}

FakeDevice::~FakeDevice() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (client_fd_ >= 0) {
      shutdown(client_fd_, SHUT_RDWR);
    }
  }
  shutdown(listen_fd_, SHUT_RDWR);
  if (thread_.joinable()) {
    thread_.join();
  }
  close(listen_fd_);
}

std::string FakeDevice::endpoint() const { return "127.0.0.1:" + std::to_string(port_); }

std::vector<std::string> FakeDevice::requests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_;
}

void FakeDevice::serve() {
  pollfd pfd{};
  pfd.fd = listen_fd_;
  pfd.events = POLLIN;
  if (poll(&pfd, 1, kDeviceIdleMs) <= 0) {
    return;
  }
  const int client = accept(listen_fd_, nullptr, nullptr);
  if (client < 0) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    client_fd_ = client;
  }
  set_receive_timeout(client, std::chrono::milliseconds(kDeviceIdleMs));

  std::string buffer;
  for (const auto &group : replies_) {
    std::string line;
    if (!read_line(client, buffer, line)) {
      break;
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(line);
    }
    for (const auto &reply : group) {
      const std::string framed = reply + "\n";
      if (send(client, framed.data(), framed.size(), MSG_NOSIGNAL) <= 0) {
        break;
      }
    }
  }

  // Hold the connection open until the client hangs up.
  char sink[256];
  while (recv(client, sink, sizeof(sink), 0) > 0) {
  }
  std::lock_guard<std::mutex> lock(mutex_);
  client_fd_ = -1;
  close(client);
}

int connect_local(const std::uint16_t port, const std::chrono::milliseconds timeout) {
  const int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return -1;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
  if (connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    close(fd);
    return -1;
  }
  set_receive_timeout(fd, timeout);
  return fd;
}

bool send_text(const int fd, const std::string &text) {
  std::size_t sent = 0;
  while (sent < text.size()) {
    const ssize_t n = send(fd, text.data() + sent, text.size() - sent, MSG_NOSIGNAL);
    if (n <= 0) {
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

std::string read_all(const int fd) {
  std::string out;
  char chunk[1024];
  while (true) {
    const ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
    if (n <= 0) {
      break;
    }
    out.append(chunk, static_cast<std::size_t>(n));
  }
  return out;
}

void close_socket(const int fd) {
  if (fd >= 0) {
    close(fd);
  }
}

std::string exchange(const std::uint16_t port, const std::string &payload) {
  const int fd = connect_local(port);
  if (fd < 0) {
    return "";
  }
  std::string reply;
  if (send_text(fd, payload)) {
    reply = read_all(fd);
  }
  close_socket(fd);
  return reply;
}

} // namespace pairlink::testing
