#include "hooktunnel/lifecycle/instance_lock.hpp"

#include <cerrno>
#include <fstream>

#include <signal.h>
#include <unistd.h>

namespace hooktunnel::lifecycle {

InstanceLock::InstanceLock(std::filesystem::path path) : path_(std::move(path)) {}

InstanceLock::~InstanceLock() { release(); }

common::Status InstanceLock::acquire() {
  if (acquired_) {
    return common::Status::success();
  }

  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      return common::Status::error("failed to create lock directory: " + ec.message());
    }
  }

  if (std::filesystem::exists(path_, ec)) {
    std::ifstream in(path_);
    int existing_pid = 0;
    in >> existing_pid;
    if (existing_pid > 0 && existing_pid != static_cast<int>(getpid()) &&
        is_process_running(existing_pid)) {
      return common::Status::error("another listener is already running with pid " +
                                   std::to_string(existing_pid));
    }
    std::filesystem::remove(path_, ec);
  }

  std::ofstream out(path_, std::ios::trunc);
  if (!out) {
    return common::Status::error("failed to write lock file " + path_.string());
  }
  out << getpid() << "\n";
  acquired_ = true;
  return common::Status::success();
}

void InstanceLock::release() {
  if (!acquired_) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  acquired_ = false;
}

bool InstanceLock::is_process_running(const int pid) {
  if (pid <= 0) {
    return false;
  }
  return kill(pid, 0) == 0 || errno == EPERM;
}

} // namespace hooktunnel::lifecycle
