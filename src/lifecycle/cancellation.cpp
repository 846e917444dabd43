#include "hooktunnel/lifecycle/cancellation.hpp"

#include <csignal>
#include <thread>

namespace hooktunnel::lifecycle {

namespace {

constexpr auto SLEEP_SLICE = std::chrono::milliseconds(50);

std::atomic<CancellationFlag *> g_signal_target{nullptr};
struct sigaction g_previous_int {};
struct sigaction g_previous_term {};

static_assert(std::atomic<bool>::is_always_lock_free, "flag must be async-signal-safe");
static_assert(std::atomic<CancellationFlag *>::is_always_lock_free,
              "signal target must be async-signal-safe");

void on_interrupt(int) {
  if (auto *flag = g_signal_target.load(); flag != nullptr) {
    flag->request();
  }
}

} // namespace

bool CancellationFlag::sleep_for(const std::chrono::milliseconds duration) const {
  const auto deadline = std::chrono::steady_clock::now() + duration;
  while (!requested()) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return false;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(remaining < SLEEP_SLICE ? remaining : SLEEP_SLICE);
  }
  return true;
}

ScopedInterruptHandler::ScopedInterruptHandler(CancellationFlag &flag)
    : previous_target_(g_signal_target.exchange(&flag)) {
  if (previous_target_ != nullptr) {
    // An outer handler is already installed; only the target changes.
    return;
  }

  struct sigaction action {};
  action.sa_handler = on_interrupt;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, &g_previous_int);
  sigaction(SIGTERM, &action, &g_previous_term);
  installed_ = true;
}

ScopedInterruptHandler::~ScopedInterruptHandler() {
  if (installed_) {
    sigaction(SIGINT, &g_previous_int, nullptr);
    sigaction(SIGTERM, &g_previous_term, nullptr);
  }
  g_signal_target.store(previous_target_);
}

} // namespace hooktunnel::lifecycle
