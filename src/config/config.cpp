#include "pairlink/config/config.hpp"

#include "pairlink/common/fs.hpp"
#include "pairlink/common/toml.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <regex>
#include <sstream>

namespace pairlink::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".pairlink";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("PAIRLINK_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

bool is_valid_host(const std::string &host) {
  if (host.empty()) {
    return false;
  }

  static const std::regex host_re(
      R"(^(([a-zA-Z0-9]([a-zA-Z0-9\-]{0,61}[a-zA-Z0-9])?\.)*[a-zA-Z0-9]([a-zA-Z0-9\-]{0,61}[a-zA-Z0-9])?|((25[0-5]|2[0-4][0-9]|[01]?[0-9]?[0-9])\.){3}(25[0-5]|2[0-4][0-9]|[01]?[0-9]?[0-9]))$)");
  return std::regex_match(host, host_re);
}

std::optional<std::uint64_t> parse_env_number(const char *raw) {
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  const std::string value = common::trim(raw);
  std::uint64_t parsed = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc() || ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return parsed;
}

// Reads an integer key into `out`; a present but malformed or out-of-range value is an error.
template <typename T>
common::Status read_bounded(const common::TomlDocument &doc, const std::string &key, T &out,
                            const std::uint64_t min = 0) {
  if (!doc.has(key)) {
    return common::Status::success();
  }
  const auto value = doc.get_bounded(key, min, std::numeric_limits<T>::max());
  if (!value.has_value()) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "Invalid value for " + key + ": " + doc.values.at(key));
  }
  out = static_cast<T>(*value);
  return common::Status::success();
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            common::ErrorCode::Io, "unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.status());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.status());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *host = std::getenv("PAIRLINK_HOST"); host != nullptr && *host != '\0') {
    config.listener.host = common::trim(host);
  }
  if (const auto port = parse_env_number(std::getenv("PAIRLINK_PORT"));
      port.has_value() && *port > 0 && *port <= std::numeric_limits<std::uint16_t>::max()) {
    config.listener.port = static_cast<std::uint16_t>(*port);
  }
  if (const auto timeout = parse_env_number(std::getenv("PAIRLINK_PAIRING_TIMEOUT"));
      timeout.has_value() && *timeout > 0 &&
      *timeout <= std::numeric_limits<std::uint32_t>::max()) {
    config.listener.pairing_timeout_secs = static_cast<std::uint32_t>(*timeout);
  }
  if (const char *backend = std::getenv("PAIRLINK_OBSERVABILITY");
      backend != nullptr && *backend != '\0') {
    config.observability.backend = backend;
  }
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status());
  }
  const auto &doc = parsed.value();

  Config config;
  config.listener.host = doc.get_string("listener.host", config.listener.host);

  const common::Status checks[] = {
      read_bounded(doc, "listener.port", config.listener.port),
      read_bounded(doc, "listener.pairing_timeout_secs", config.listener.pairing_timeout_secs),
      read_bounded(doc, "listener.poll_interval_ms", config.listener.poll_interval_ms),
      read_bounded(doc, "listener.client_read_timeout_secs",
                   config.listener.client_read_timeout_secs),
      read_bounded(doc, "listener.max_body_bytes", config.listener.max_body_bytes),
      read_bounded(doc, "listener.port_search_span", config.listener.port_search_span),
      read_bounded(doc, "link.connect_timeout_secs", config.link.connect_timeout_secs),
      read_bounded(doc, "link.read_timeout_secs", config.link.read_timeout_secs),
      read_bounded(doc, "link.write_timeout_secs", config.link.write_timeout_secs),
  };
  for (const auto &check : checks) {
    if (!check.ok()) {
      return common::Result<Config>::failure(check);
    }
  }

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.status());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure(common::ErrorCode::Io,
                                           "Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto parsed = parse_config(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.code(),
                                           path.string() + ": " + parsed.error());
  }
  apply_env_overrides(parsed.value());
  return parsed;
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return cfg_path_result.status();
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    if (auto ensured = common::ensure_dir(path.parent_path()); !ensured.ok()) {
      return ensured.status();
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  {
    std::ofstream file(tmp_path, std::ios::trunc);
    if (!file) {
      return common::Status::error(common::ErrorCode::Io,
                                   "Unable to write temporary config file");
    }

    file << "[listener]\n";
    file << "host = " << common::quote_toml_string(config.listener.host) << "\n";
    file << "port = " << config.listener.port << "\n";
    file << "pairing_timeout_secs = " << config.listener.pairing_timeout_secs << "\n";
    file << "poll_interval_ms = " << config.listener.poll_interval_ms << "\n";
    file << "client_read_timeout_secs = " << config.listener.client_read_timeout_secs << "\n";
    file << "max_body_bytes = " << config.listener.max_body_bytes << "\n";
    file << "port_search_span = " << config.listener.port_search_span << "\n\n";

    file << "[link]\n";
    file << "connect_timeout_secs = " << config.link.connect_timeout_secs << "\n";
    file << "read_timeout_secs = " << config.link.read_timeout_secs << "\n";
    file << "write_timeout_secs = " << config.link.write_timeout_secs << "\n\n";

    file << "[observability]\n";
    file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

    if (!file.good()) {
      return common::Status::error(common::ErrorCode::Io, "Failed to write config file");
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::filesystem::remove(tmp_path, ec);
    return common::Status::error(common::ErrorCode::Io,
                                 "Failed to replace config file: " + path.string());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (!is_valid_host(config.listener.host)) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "listener.host is invalid: " + config.listener.host);
  }
  if (config.listener.port == 0) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "listener.port must be 1-65535");
  }
  if (config.listener.pairing_timeout_secs == 0) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "listener.pairing_timeout_secs must be positive");
  }
  if (config.listener.poll_interval_ms == 0 || config.listener.poll_interval_ms > 1000) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "listener.poll_interval_ms must be between 1 and 1000");
  }
  if (config.listener.client_read_timeout_secs == 0) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "listener.client_read_timeout_secs must be positive");
  }
  if (config.listener.max_body_bytes == 0) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "listener.max_body_bytes must be positive");
  }
  if (config.link.connect_timeout_secs == 0 || config.link.read_timeout_secs == 0 ||
      config.link.write_timeout_secs == 0) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "link timeouts must be positive");
  }

  if (config.listener.port < 1024) {
    warnings.push_back("listener.port below 1024 usually requires elevated privileges");
  }
  if (config.listener.port_search_span == 0) {
    warnings.push_back("listener.port_search_span is 0; a busy port will not be replaced");
  }
  if (config.listener.pairing_timeout_secs < 10) {
    warnings.push_back("listener.pairing_timeout_secs is shorter than a QR scan usually takes");
  }
  if (config.listener.host == "127.0.0.1" || config.listener.host == "localhost") {
    warnings.push_back("listener.host is loopback; devices on the LAN cannot reach it");
  }

  return Warnings::success(std::move(warnings));
}

} // namespace pairlink::config
