#pragma once

#include "hooktunnel/common/result.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace hooktunnel::tunnel {

using OutputCallback = std::function<void(std::string_view chunk)>;

/// Supervises one tunnel subprocess. stdout and stderr are merged into a single
/// pipe that is drained without blocking whenever the owner polls.
class TunnelProcess {
public:
  TunnelProcess() = default;
  ~TunnelProcess();

  TunnelProcess(const TunnelProcess &) = delete;
  TunnelProcess &operator=(const TunnelProcess &) = delete;

  /// `argv[0]` is resolved through PATH. With a timeout, the process is killed if it is
  /// still running when the deadline passes and `disarm_timeout()` was never called.
  [[nodiscard]] common::Status start(const std::vector<std::string> &argv,
                                     OutputCallback on_output,
                                     std::optional<std::chrono::seconds> timeout = std::nullopt);

  [[nodiscard]] bool is_running();
  /// Output captured since the previous call.
  [[nodiscard]] std::string latest_output();
  void disarm_timeout();
  void terminate();

  [[nodiscard]] bool started() const { return pid_ > 0 || exited_; }
  [[nodiscard]] bool timed_out() const { return timed_out_; }
  [[nodiscard]] std::optional<int> exit_code() const { return exit_code_; }
  [[nodiscard]] pid_t pid() const { return pid_; }

private:
  void drain();
  void close_output();
  void mark_exited(int status);

  pid_t pid_ = 0;
  int output_fd_ = -1;
  std::string unread_;
  OutputCallback on_output_;
  std::optional<std::chrono::steady_clock::time_point> deadline_;
  bool exited_ = false;
  bool timed_out_ = false;
  std::optional<int> exit_code_;
};

} // namespace hooktunnel::tunnel
