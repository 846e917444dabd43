#pragma once

#include <cstdint>
#include <string>

namespace hooktunnel::config {

struct BillingConfig {
  std::string api_key;
  std::string store_id;
  std::string signing_secret;
  std::string path = "lemon-squeezy";
  std::string api_base = "https://api.lemonsqueezy.com/v1";
};

struct AppConfig {
  std::string environment = "production";
  std::string local_url = "http://localhost:8000";
};

struct ExposeConfig {
  std::string command = "expose";
  std::string domain = "sharedwithexpose.com";
};

struct NgrokConfig {
  std::string command = "ngrok";
  std::string api_base = "http://localhost:4040/api";
  std::string domain = "ngrok-free.app";
};

struct ReliabilityConfig {
  std::uint32_t registry_retries = 3;
  std::uint64_t registry_backoff_ms = 250;
  std::uint32_t discovery_retries = 5;
  std::uint64_t discovery_backoff_ms = 1000;
  std::uint64_t poll_interval_ms = 1000;
  std::uint64_t process_timeout_secs = 120;
  std::uint32_t request_log_limit = 50;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  BillingConfig billing;
  AppConfig app;
  ExposeConfig expose;
  NgrokConfig ngrok;
  ReliabilityConfig reliability;
  ObservabilityConfig observability;
};

} // namespace hooktunnel::config
