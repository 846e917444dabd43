#pragma once

#include "hooktunnel/cli/console.hpp"
#include "hooktunnel/config/schema.hpp"
#include "hooktunnel/http/client.hpp"
#include "hooktunnel/lifecycle/cancellation.hpp"
#include "hooktunnel/lifecycle/context.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hooktunnel::lifecycle {

inline constexpr int EXIT_OK = 0;
inline constexpr int EXIT_FAILURE_STATUS = 1;

struct ControllerOptions {
  /// Route SIGINT/SIGTERM into the cancellation flag for the duration of `run`.
  bool install_signal_handlers = true;
  /// Pid file used by `--isolated`; defaults to `<config dir>/listen.pid`.
  std::optional<std::filesystem::path> lock_path;
};

/// Drives one `listen` invocation from validation to teardown.
class LifecycleController {
public:
  /// `transport` is the raw client; retry policies from the config are layered on top.
  LifecycleController(const config::Config &config, cli::Console &console,
                      http::HttpClient &transport, CancellationFlag &cancel,
                      ControllerOptions options = {});

  [[nodiscard]] int run(const ListenOptions &options);

  [[nodiscard]] LifecycleState state() const { return state_; }
  [[nodiscard]] const std::optional<std::string> &last_webhook_id() const {
    return last_webhook_id_;
  }

  [[nodiscard]] static bool is_local_environment(const std::string &environment);
  /// Every reason the invocation cannot start; empty when it can.
  [[nodiscard]] static std::vector<std::string> validate(const config::Config &config,
                                                         const ListenOptions &options);

private:
  void transition(LifecycleState next);
  [[nodiscard]] int fail(const std::string &message);
  [[nodiscard]] int run_cleanup(Service service, const std::string &custom_url);
  [[nodiscard]] int run_listen(Service service, const ListenOptions &options,
                               const std::string &custom_url);

  const config::Config &config_;
  cli::Console &console_;
  http::HttpClient &transport_;
  CancellationFlag &cancel_;
  ControllerOptions options_;
  LifecycleState state_ = LifecycleState::Idle;
  std::optional<std::string> last_webhook_id_;
};

} // namespace hooktunnel::lifecycle
