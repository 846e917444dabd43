#pragma once

#include <atomic>
#include <chrono>

namespace hooktunnel::lifecycle {

/// Set asynchronously (from a signal handler or another component), polled by the run loop.
class CancellationFlag {
public:
  void request() { requested_.store(true); }
  void reset() { requested_.store(false); }
  [[nodiscard]] bool requested() const { return requested_.load(); }

  /// Sleeps in short slices; returns true as soon as cancellation is requested.
  [[nodiscard]] bool sleep_for(std::chrono::milliseconds duration) const;

private:
  std::atomic<bool> requested_{false};
};

/// Routes SIGINT and SIGTERM to `flag` while alive; previous dispositions are restored after.
class ScopedInterruptHandler {
public:
  explicit ScopedInterruptHandler(CancellationFlag &flag);
  ~ScopedInterruptHandler();

  ScopedInterruptHandler(const ScopedInterruptHandler &) = delete;
  ScopedInterruptHandler &operator=(const ScopedInterruptHandler &) = delete;

private:
  CancellationFlag *previous_target_;
  bool installed_ = false;
};

} // namespace hooktunnel::lifecycle
