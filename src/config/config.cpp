#include "hooktunnel/config/config.hpp"

#include "hooktunnel/common/fs.hpp"
#include "hooktunnel/common/toml.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace hooktunnel::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".hooktunnel";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("HOOKTUNNEL_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    // Variables already present in the environment win.
    setenv(key.c_str(), strip_env_quotes(trimmed.substr(eq + 1)).c_str(), 0);
  }
}

void load_dotenv_files() {
  if (const char *env_file = std::getenv("HOOKTUNNEL_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    load_dotenv_file(common::expand_path(env_file));
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    load_dotenv_file(cwd / ".env");
  }
}

void override_from_env(std::string &target, const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    target = value;
  }
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      std::error_code ec;
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.error());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status());
  }
  const auto &doc = parsed.value();

  Config config;
  auto &billing = config.billing;
  billing.api_key = expand_config_value(doc.get_string("api_key", billing.api_key));
  billing.store_id = expand_config_value(doc.get_string("store", billing.store_id));
  billing.signing_secret =
      expand_config_value(doc.get_string("signing_secret", billing.signing_secret));
  billing.path = doc.get_string("path", billing.path);
  billing.api_base = doc.get_string("api_base", billing.api_base);

  config.app.environment = doc.get_string("environment", config.app.environment);
  config.app.local_url = doc.get_string("local_url", config.app.local_url);

  config.expose.command = expand_config_value(doc.get_string("expose.command", config.expose.command));
  config.expose.domain = doc.get_string("expose.domain", config.expose.domain);

  config.ngrok.command = expand_config_value(doc.get_string("ngrok.command", config.ngrok.command));
  config.ngrok.api_base = doc.get_string("ngrok.api_base", config.ngrok.api_base);
  config.ngrok.domain = doc.get_string("ngrok.domain", config.ngrok.domain);

  auto &rel = config.reliability;
  rel.registry_retries = static_cast<std::uint32_t>(
      doc.get_u64("reliability.registry_retries", rel.registry_retries));
  rel.registry_backoff_ms = doc.get_u64("reliability.registry_backoff_ms", rel.registry_backoff_ms);
  rel.discovery_retries = static_cast<std::uint32_t>(
      doc.get_u64("reliability.discovery_retries", rel.discovery_retries));
  rel.discovery_backoff_ms =
      doc.get_u64("reliability.discovery_backoff_ms", rel.discovery_backoff_ms);
  rel.poll_interval_ms = doc.get_u64("reliability.poll_interval_ms", rel.poll_interval_ms);
  rel.process_timeout_secs =
      doc.get_u64("reliability.process_timeout_secs", rel.process_timeout_secs);
  rel.request_log_limit = static_cast<std::uint32_t>(
      doc.get_u64("reliability.request_log_limit", rel.request_log_limit));

  config.observability.backend = doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto path_result = config_path();
  if (!path_result.ok()) {
    return common::Result<Config>::failure(path_result.error());
  }

  const auto &path = path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure(common::ErrorKind::ConfigValidation,
                                           "Unable to open config file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  auto parsed = parse_config(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.kind(),
                                           path.string() + ": " + parsed.error());
  }
  apply_env_overrides(parsed.value());
  return parsed;
}

void apply_env_overrides(Config &config) {
  override_from_env(config.billing.api_key, "LEMON_SQUEEZY_API_KEY");
  override_from_env(config.billing.store_id, "LEMON_SQUEEZY_STORE");
  override_from_env(config.billing.signing_secret, "LEMON_SQUEEZY_SIGNING_SECRET");
  override_from_env(config.billing.path, "LEMON_SQUEEZY_PATH");
  override_from_env(config.app.environment, "APP_ENV");
  override_from_env(config.app.local_url, "APP_URL");
}

std::vector<std::string> validate_config(const Config &config) {
  std::vector<std::string> errors;
  if (common::trim(config.billing.api_key).empty()) {
    errors.emplace_back("The LEMON_SQUEEZY_API_KEY environment variable is required.");
  }
  if (common::trim(config.billing.store_id).empty()) {
    errors.emplace_back("The LEMON_SQUEEZY_STORE environment variable is required.");
  }
  if (common::trim(config.billing.path).empty()) {
    errors.emplace_back("The webhook path must not be empty.");
  }
  return errors;
}

std::string local_webhook_route(const Config &config) {
  return common::rtrim_chars(common::trim(config.app.local_url), "/") + "/" + config.billing.path +
         "/webhook";
}

} // namespace hooktunnel::config
