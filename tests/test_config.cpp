#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "hooktunnel/config/config.hpp"

#include <memory>
#include <optional>

namespace {

void clear_billing_env(std::vector<std::unique_ptr<hooktunnel::testing::EnvGuard>> &guards) {
  for (const char *key : {"LEMON_SQUEEZY_API_KEY", "LEMON_SQUEEZY_STORE",
                          "LEMON_SQUEEZY_SIGNING_SECRET", "LEMON_SQUEEZY_PATH", "APP_ENV",
                          "APP_URL", "HOOKTUNNEL_ENV_FILE"}) {
    guards.push_back(std::make_unique<hooktunnel::testing::EnvGuard>(key, std::nullopt));
  }
}

} // namespace

void register_config_tests(std::vector<hooktunnel::tests::TestCase> &tests) {
  using hooktunnel::tests::require;
  namespace cfg = hooktunnel::config;
  namespace ht = hooktunnel::testing;

  tests.push_back({"config_defaults_are_documented_values", [] {
                     const cfg::Config config;
                     require(config.billing.path == "lemon-squeezy", "default path");
                     require(config.billing.api_base == "https://api.lemonsqueezy.com/v1",
                             "default api base");
                     require(config.ngrok.api_base == "http://localhost:4040/api",
                             "default ngrok api");
                     require(config.expose.domain == "sharedwithexpose.com", "expose domain");
                     require(config.ngrok.domain == "ngrok-free.app", "ngrok domain");
                     require(config.reliability.registry_retries == 3, "registry retries");
                     require(config.reliability.registry_backoff_ms == 250, "registry backoff");
                     require(config.reliability.discovery_retries == 5, "discovery retries");
                     require(config.reliability.discovery_backoff_ms == 1000, "discovery backoff");
                     require(config.reliability.request_log_limit == 50, "request log limit");
                   }});

  tests.push_back({"config_parse_reads_sections", [] {
                     const auto parsed = cfg::parse_config(R"(
api_key = "abc"
store = "99"
path = "billing"
environment = "local"

[ngrok]
api_base = "http://127.0.0.1:4041/api"

[reliability]
poll_interval_ms = 250
process_timeout_secs = 30

[observability]
backend = "none"
)");
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.billing.api_key == "abc", "api key");
                     require(config.billing.store_id == "99", "store");
                     require(config.billing.path == "billing", "path");
                     require(config.app.environment == "local", "environment");
                     require(config.ngrok.api_base == "http://127.0.0.1:4041/api", "ngrok api");
                     require(config.reliability.poll_interval_ms == 250, "poll interval");
                     require(config.reliability.process_timeout_secs == 30, "timeout");
                     require(config.reliability.registry_retries == 3, "untouched default");
                     require(config.observability.backend == "none", "backend");
                   }});

  tests.push_back({"config_validate_names_each_missing_variable", [] {
                     cfg::Config config;
                     const auto errors = cfg::validate_config(config);
                     require(errors.size() == 2, "api key and store should both be reported");
                     require(errors[0] ==
                                 "The LEMON_SQUEEZY_API_KEY environment variable is required.",
                             "api key message");
                     require(errors[1] == "The LEMON_SQUEEZY_STORE environment variable is required.",
                             "store message");

                     config.billing.api_key = "k";
                     config.billing.store_id = "1";
                     require(cfg::validate_config(config).empty(), "complete config is valid");
                   }});

  tests.push_back({"config_env_overrides_file_values", [] {
                     std::vector<std::unique_ptr<ht::EnvGuard>> guards;
                     clear_billing_env(guards);
                     const ht::EnvGuard key("LEMON_SQUEEZY_API_KEY", "from-env");
                     const ht::EnvGuard env("APP_ENV", "local");

                     auto parsed = cfg::parse_config("api_key = \"from-file\"\nstore = \"5\"\n");
                     require(parsed.ok(), parsed.error());
                     cfg::apply_env_overrides(parsed.value());
                     require(parsed.value().billing.api_key == "from-env", "env should win");
                     require(parsed.value().billing.store_id == "5", "file value kept");
                     require(parsed.value().app.environment == "local", "APP_ENV applied");
                   }});

  tests.push_back({"config_load_uses_override_path_and_dotenv", [] {
                     std::vector<std::unique_ptr<ht::EnvGuard>> guards;
                     clear_billing_env(guards);

                     ht::TempWorkspace workspace;
                     workspace.create_file("config.toml", "store = \"12\"\nenvironment = \"local\"\n");
                     workspace.create_file("test.env",
                                           "# comment\nexport LEMON_SQUEEZY_API_KEY=\"dotenv-key\"\n");
                     const ht::EnvGuard env_file("HOOKTUNNEL_ENV_FILE",
                                                 (workspace.path() / "test.env").string());

                     cfg::set_config_path_override(workspace.path() / "config.toml");
                     auto loaded = cfg::load_config();
                     cfg::clear_config_path_override();

                     require(loaded.ok(), loaded.error());
                     require(loaded.value().billing.store_id == "12", "store from file");
                     require(loaded.value().billing.api_key == "dotenv-key", "key from .env");
                     require(cfg::validate_config(loaded.value()).empty(), "should validate");
                   }});

  tests.push_back({"config_load_without_file_uses_environment", [] {
                     std::vector<std::unique_ptr<ht::EnvGuard>> guards;
                     clear_billing_env(guards);
                     const ht::EnvGuard store("LEMON_SQUEEZY_STORE", "77");

                     ht::TempWorkspace workspace;
                     cfg::set_config_path_override(workspace.path() / "absent.toml");
                     auto loaded = cfg::load_config();
                     cfg::clear_config_path_override();

                     require(loaded.ok(), loaded.error());
                     require(loaded.value().billing.store_id == "77", "store from env");
                   }});

  tests.push_back({"config_invalid_file_reports_path", [] {
                     ht::TempWorkspace workspace;
                     workspace.create_file("config.toml", "[broken\n");
                     cfg::set_config_path_override(workspace.path() / "config.toml");
                     auto loaded = cfg::load_config();
                     cfg::clear_config_path_override();

                     require(!loaded.ok(), "malformed config should fail");
                     require(loaded.error().find("config.toml") != std::string::npos,
                             "error should name the file");
                   }});

  tests.push_back({"config_local_route_joins_path", [] {
                     cfg::Config config;
                     config.app.local_url = "http://localhost:8000/";
                     config.billing.path = "lemon-squeezy";
                     require(cfg::local_webhook_route(config) ==
                                 "http://localhost:8000/lemon-squeezy/webhook",
                             "route mismatch");
                   }});
}
