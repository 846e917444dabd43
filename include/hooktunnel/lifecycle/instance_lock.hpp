#pragma once

#include "hooktunnel/common/result.hpp"

#include <filesystem>

namespace hooktunnel::lifecycle {

/// Pid file that keeps a second listener from running at the same time.
/// A file left behind by a dead process is reclaimed.
class InstanceLock {
public:
  explicit InstanceLock(std::filesystem::path path);
  ~InstanceLock();

  InstanceLock(const InstanceLock &) = delete;
  InstanceLock &operator=(const InstanceLock &) = delete;

  [[nodiscard]] common::Status acquire();
  void release();
  [[nodiscard]] bool held() const { return acquired_; }

  [[nodiscard]] static bool is_process_running(int pid);

private:
  std::filesystem::path path_;
  bool acquired_ = false;
};

} // namespace hooktunnel::lifecycle
