#include "pairlink/cli/commands.hpp"

#include "pairlink/common/fs.hpp"
#include "pairlink/config/config.hpp"
#include "pairlink/net/ports.hpp"
#include "pairlink/net/socket.hpp"
#include "pairlink/observability/factory.hpp"
#include "pairlink/observability/global.hpp"
#include "pairlink/pairing/sender.hpp"
#include "pairlink/runtime/coordinator.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace pairlink::cli {

namespace {

std::string version_string() {
#ifdef PAIRLINK_VERSION
  return std::string("pairlink ") + PAIRLINK_VERSION;
#else
  return "pairlink 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

bool reject_leftovers(const std::vector<std::string> &args) {
  if (args.empty()) {
    return false;
  }
  std::cerr << "unexpected argument: " << args.front() << "\n";
  return true;
}

std::optional<std::uint64_t> parse_number(const std::string &raw, const std::uint64_t max) {
  std::uint64_t value = 0;
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
  if (raw.empty() || ec != std::errc() || ptr != raw.data() + raw.size() || value > max) {
    return std::nullopt;
  }
  return value;
}

common::Result<config::Config> load_runtime_config() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return loaded;
  }
  observability::set_global_observer(observability::create_observer(loaded.value()));
  return loaded;
}

int fail(const common::Status &status) {
  std::cerr << "error (" << common::error_code_name(status.code()) << "): " << status.error()
            << "\n";
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return 1;
}

int run_listen(std::vector<std::string> args) {
  std::string port_raw;
  std::string timeout_raw;
  (void)take_option(args, "--port", "-p", port_raw);
  (void)take_option(args, "--timeout", "-t", timeout_raw);
  if (reject_leftovers(args)) {
    return 1;
  }

  auto cfg = load_runtime_config();
  if (!cfg.ok()) {
    return fail(cfg.status());
  }
  config::Config config = std::move(cfg.value());

  std::uint16_t port = 0;
  if (!port_raw.empty()) {
    const auto parsed = parse_number(port_raw, std::numeric_limits<std::uint16_t>::max());
    if (!parsed.has_value()) {
      std::cerr << "invalid port: " << port_raw << "\n";
      return 1;
    }
    port = static_cast<std::uint16_t>(*parsed);
  }
  if (!timeout_raw.empty()) {
    const auto parsed = parse_number(timeout_raw, std::numeric_limits<std::uint32_t>::max());
    if (!parsed.has_value() || *parsed == 0) {
      std::cerr << "invalid timeout: " << timeout_raw << "\n";
      return 1;
    }
    config.listener.pairing_timeout_secs = static_cast<std::uint32_t>(*parsed);
  }

  const auto validated = config::validate_config(config);
  if (!validated.ok()) {
    return fail(validated.status());
  }
  for (const auto &warning : validated.value()) {
    std::cerr << "warning: " << warning << "\n";
  }

  runtime::PairingCoordinator coordinator(config);
  const auto started = coordinator.start_listener(port);
  if (!started.ok()) {
    return fail(started.status());
  }

  std::cout << "Pairing listener on " << config.listener.host << ":" << started.value() << "\n";
  if (const auto address = coordinator.pairing_address(); address.ok()) {
    std::cout << "Pair devices with: " << address.value() << "\n";
  }
  std::cout << "Waiting up to " << config.listener.pairing_timeout_secs << "s for a device...\n";

  const auto wait = std::chrono::seconds(config.listener.pairing_timeout_secs) +
                    std::chrono::seconds(config.listener.client_read_timeout_secs) +
                    std::chrono::seconds(1);
  const auto paired = coordinator.wait_for_pairing(wait);
  coordinator.stop_listener();
  if (!paired.ok()) {
    return fail(paired.status());
  }
  std::cout << paired.value().to_json() << "\n";
  return 0;
}

int run_send(std::vector<std::string> args) {
  std::string target;
  std::string url;
  std::string token;
  const bool http = take_flag(args, "--http");
  (void)take_option(args, "--target", "", target);
  (void)take_option(args, "--url", "", url);
  (void)take_option(args, "--token", "", token);
  if (reject_leftovers(args)) {
    return 1;
  }
  if (target.empty() || url.empty() || token.empty()) {
    std::cerr << "usage: pairlink send --target HOST:PORT --url URL --token TOKEN [--http]\n";
    return 1;
  }

  const pairing::PairingResult pairing{.url = url, .token = token};
  const pairing::PairingSender sender;
  if (http) {
    const auto reply = sender.send_http(target, pairing);
    if (!reply.ok()) {
      return fail(reply.status());
    }
    std::cout << "HTTP " << reply.value().status << " " << reply.value().body << "\n";
    return reply.value().status == 200 ? 0 : 1;
  }

  const auto endpoint = net::parse_endpoint(target);
  if (!endpoint.ok()) {
    return fail(endpoint.status());
  }
  const auto reply = sender.send_line(endpoint.value(), pairing);
  if (!reply.ok()) {
    return fail(reply.status());
  }
  std::cout << reply.value() << "\n";
  return 0;
}

int run_link(std::vector<std::string> args) {
  std::string endpoint;
  std::string id = "cli";
  std::string token;
  (void)take_option(args, "--endpoint", "-e", endpoint);
  (void)take_option(args, "--id", "", id);
  const bool has_token = take_option(args, "--token", "", token);
  if (reject_leftovers(args)) {
    return 1;
  }
  if (endpoint.empty()) {
    std::cerr << "usage: pairlink link --endpoint HOST:PORT [--id ID] [--token TOKEN]\n";
    return 1;
  }

  auto coordinator = runtime::PairingCoordinator::from_disk();
  if (!coordinator.ok()) {
    return fail(coordinator.status());
  }

  const auto linked = coordinator.value()->connect_link(
      id, endpoint, has_token ? std::optional<std::string>(token) : std::nullopt);
  if (!linked.ok()) {
    return fail(linked.status());
  }
  std::cout << (has_token ? "Logged in to " : "Token issued by ") << endpoint << "\n";
  std::cout << "token: " << linked.value() << "\n";

  if (const auto closed = coordinator.value()->disconnect_link(id); !closed.ok()) {
    return fail(closed);
  }
  return 0;
}

int run_ports(std::vector<std::string> args) {
  std::string start_raw;
  (void)take_option(args, "--start", "-s", start_raw);
  if (reject_leftovers(args)) {
    return 1;
  }

  auto cfg = load_runtime_config();
  if (!cfg.ok()) {
    return fail(cfg.status());
  }

  std::uint16_t start = cfg.value().listener.port;
  if (!start_raw.empty()) {
    const auto parsed = parse_number(start_raw, std::numeric_limits<std::uint16_t>::max());
    if (!parsed.has_value() || *parsed == 0) {
      std::cerr << "invalid port: " << start_raw << "\n";
      return 1;
    }
    start = static_cast<std::uint16_t>(*parsed);
  }

  std::cout << "port " << start << ": "
            << (net::is_port_available(start) ? "available" : "in use") << "\n";
  const auto free_port = net::find_available_port(start, cfg.value().listener.port_search_span);
  if (free_port.has_value()) {
    std::cout << "first free port: " << *free_port << "\n";
  } else {
    std::cout << "no free port in " << start << "-"
              << std::min<std::uint32_t>(65535U, static_cast<std::uint32_t>(start) +
                                                     cfg.value().listener.port_search_span)
              << "\n";
  }
  if (const auto ip = net::local_ipv4_address(); ip.ok()) {
    std::cout << "local address: " << ip.value() << "\n";
  } else {
    std::cout << "local address: unknown (" << ip.error() << ")\n";
  }
  return free_port.has_value() ? 0 : 1;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "USAGE\n";
  std::cout << "  pairlink [--config PATH] <command> [options]\n\n";
  std::cout << "COMMANDS\n";
  std::cout << "  listen [--port N] [--timeout S]        Wait for one device to pair\n";
  std::cout << "  send --target HOST:PORT --url U --token T [--http]\n";
  std::cout << "                                         Send a pairing handshake\n";
  std::cout << "  link --endpoint HOST:PORT [--id ID] [--token T]\n";
  std::cout << "                                         Request a token or log in to a device\n";
  std::cout << "  ports [--start N]                      Check port availability\n";
  std::cout << "  config-path                            Print the config file location\n";
  std::cout << "  version                                Show version\n";
  std::cout << "  help                                   Show this help\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "listen") {
    return run_listen(std::move(args));
  }
  if (subcommand == "send") {
    return run_send(std::move(args));
  }
  if (subcommand == "link") {
    return run_link(std::move(args));
  }
  if (subcommand == "ports") {
    return run_ports(std::move(args));
  }

  std::cerr << "unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace pairlink::cli
