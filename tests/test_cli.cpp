#include "test_framework.hpp"

#include "pairlink/cli/commands.hpp"
#include "pairlink/config/config.hpp"
#include "pairlink/net/ports.hpp"
#include "pairlink/observability/global.hpp"
#include "pairlink/pairing/sender.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <future>
#include <iostream>
#include <sstream>
#include <thread>

namespace {

using namespace std::chrono_literals;

struct OutputCapture {
  std::ostringstream out;
  std::ostringstream err;
  std::streambuf *previous_out;
  std::streambuf *previous_err;

  OutputCapture()
      : previous_out(std::cout.rdbuf(out.rdbuf())), previous_err(std::cerr.rdbuf(err.rdbuf())) {}
  ~OutputCapture() {
    std::cout.rdbuf(previous_out);
    std::cerr.rdbuf(previous_err);
  }
};

// Gives each command its own config file and undoes the global state run_cli leaves behind.
class CliSandbox {
public:
  explicit CliSandbox(const std::uint32_t pairing_timeout_secs = 5)
      : port_(pairlink::testing::ephemeral_port()) {
    dir_.create_file("config.toml", "[listener]\n"
                                    "host = \"127.0.0.1\"\n"
                                    "port = " +
                                        std::to_string(port_) +
                                        "\n"
                                        "pairing_timeout_secs = " +
                                        std::to_string(pairing_timeout_secs) +
                                        "\n"
                                        "poll_interval_ms = 20\n"
                                        "client_read_timeout_secs = 1\n\n"
                                        "[link]\n"
                                        "connect_timeout_secs = 2\n"
                                        "read_timeout_secs = 2\n\n"
                                        "[observability]\n"
                                        "backend = \"none\"\n");
  }

  ~CliSandbox() {
    pairlink::config::clear_config_path_override();
    pairlink::observability::set_global_observer(nullptr);
  }

  CliSandbox(const CliSandbox &) = delete;
  CliSandbox &operator=(const CliSandbox &) = delete;

  [[nodiscard]] std::uint16_t port() const { return port_; }
  [[nodiscard]] std::string config_file() const { return (dir_.path() / "config.toml").string(); }

  int run(std::vector<std::string> args) const {
    args.insert(args.begin(), {"pairlink", "--config", config_file()});
    std::vector<char *> argv;
    argv.reserve(args.size());
    for (auto &arg : args) {
      argv.push_back(arg.data());
    }
    return pairlink::cli::run_cli(static_cast<int>(argv.size()), argv.data());
  }

private:
  pairlink::testing::TempDir dir_;
  std::uint16_t port_;
};

bool wait_until_bound(const std::uint16_t port) {
  const auto deadline = std::chrono::steady_clock::now() + 3s;
  while (std::chrono::steady_clock::now() < deadline) {
    if (!pairlink::net::is_port_available(port)) {
      return true;
    }
    std::this_thread::sleep_for(10ms);
  }
  return false;
}

} // namespace

void register_cli_tests(std::vector<pairlink::tests::TestCase> &tests) {
  using pairlink::tests::require;

  tests.push_back({"cli_version_and_help", [] {
                     CliSandbox sandbox;
                     {
                       OutputCapture capture;
                       require(sandbox.run({"version"}) == 0, "version exit code");
                       require(capture.out.str().rfind("pairlink ", 0) == 0, capture.out.str());
                     }
                     {
                       OutputCapture capture;
                       require(sandbox.run({"help"}) == 0, "help exit code");
                       require(capture.out.str().find("USAGE") != std::string::npos, "usage");
                       require(capture.out.str().find("listen") != std::string::npos,
                               "commands listed");
                     }
                     {
                       OutputCapture capture;
                       require(sandbox.run({}) == 0, "bare invocation prints help");
                     }
                   }});

  tests.push_back({"cli_unknown_command_fails", [] {
                     CliSandbox sandbox;
                     OutputCapture capture;
                     require(sandbox.run({"frobnicate"}) == 1, "unknown command exit code");
                     require(capture.err.str().find("unknown command: frobnicate") !=
                                 std::string::npos,
                             capture.err.str());
                   }});

  tests.push_back({"cli_config_path_honours_override", [] {
                     CliSandbox sandbox;
                     OutputCapture capture;
                     require(sandbox.run({"config-path"}) == 0, "config-path exit code");
                     require(capture.out.str() == sandbox.config_file() + "\n",
                             capture.out.str());
                   }});

  tests.push_back({"cli_config_flag_requires_value", [] {
                     OutputCapture capture;
                     std::string program = "pairlink";
                     std::string flag = "--config";
                     char *argv[] = {program.data(), flag.data()};
                     require(pairlink::cli::run_cli(2, argv) == 1, "missing value should fail");
                     require(capture.err.str().find("missing value for --config") !=
                                 std::string::npos,
                             capture.err.str());
                   }});

  tests.push_back({"cli_rejects_bad_arguments", [] {
                     CliSandbox sandbox;
                     OutputCapture capture;
                     require(sandbox.run({"listen", "--port", "70000"}) == 1, "port range");
                     require(sandbox.run({"listen", "--timeout", "0"}) == 1, "zero timeout");
                     require(sandbox.run({"listen", "extra"}) == 1, "leftover argument");
                     require(sandbox.run({"send", "--target", "127.0.0.1:1"}) == 1,
                             "send needs url and token");
                     require(sandbox.run({"link"}) == 1, "link needs an endpoint");
                     require(sandbox.run({"ports", "--start", "0"}) == 1, "port zero");
                   }});

  tests.push_back({"cli_listen_times_out", [] {
                     CliSandbox sandbox(1);
                     OutputCapture capture;
                     const auto started = std::chrono::steady_clock::now();
                     require(sandbox.run({"listen"}) == 1, "no device means failure");
                     require(std::chrono::steady_clock::now() - started < 4s, "bounded wait");
                     require(capture.out.str().find("Pairing listener on 127.0.0.1:" +
                                                    std::to_string(sandbox.port())) !=
                                 std::string::npos,
                             capture.out.str());
                     require(capture.err.str().find("error (timeout)") != std::string::npos,
                             capture.err.str());
                   }});

  tests.push_back({"cli_listen_prints_pairing", [] {
                     CliSandbox sandbox;
                     OutputCapture capture;
                     auto listening = std::async(std::launch::async,
                                                 [&sandbox]() { return sandbox.run({"listen"}); });
                     require(wait_until_bound(sandbox.port()), "listener never bound");

                     const pairlink::pairing::PairingSender sender(2s);
                     const auto reply = sender.send_line(
                         pairlink::net::Endpoint{.host = "127.0.0.1", .port = sandbox.port()},
                         pairlink::pairing::PairingResult{.url = "ws://10.1.1.1:9000",
                                                          .token = "cli-token"});
                     require(reply.ok(), reply.error());
                     require(listening.get() == 0, "listen should succeed");
                     require(capture.out.str().find(
                                 R"({"url":"ws://10.1.1.1:9000","token":"cli-token"})") !=
                                 std::string::npos,
                             capture.out.str());
                   }});

  tests.push_back({"cli_link_requests_token", [] {
                     pairlink::testing::FakeDevice device({{R"({"success":true,"token":"xyz"})"}});
                     CliSandbox sandbox;
                     OutputCapture capture;
                     require(sandbox.run({"link", "--endpoint", device.endpoint(), "--id",
                                          "desk"}) == 0,
                             "link exit code: " + capture.err.str());
                     require(capture.out.str().find("token: xyz") != std::string::npos,
                             capture.out.str());
                   }});

  tests.push_back({"cli_ports_reports_availability", [] {
                     CliSandbox sandbox;
                     OutputCapture capture;
                     require(sandbox.run({"ports", "--start", std::to_string(sandbox.port())}) ==
                                 0,
                             "ports exit code");
                     require(capture.out.str().find("port " + std::to_string(sandbox.port()) +
                                                    ": available") != std::string::npos,
                             capture.out.str());
                     require(capture.out.str().find("first free port: ") != std::string::npos,
                             capture.out.str());
                   }});
}
