#include "hooktunnel/tunnel/process.hpp"

#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hooktunnel::tunnel {

TunnelProcess::~TunnelProcess() { terminate(); }

common::Status TunnelProcess::start(const std::vector<std::string> &argv, OutputCallback on_output,
                                    const std::optional<std::chrono::seconds> timeout) {
  if (argv.empty()) {
    return common::Status::error(common::ErrorKind::Process, "empty tunnel command");
  }
  if (pid_ > 0) {
    return common::Status::error(common::ErrorKind::Process, "tunnel process already started");
  }

  int pipefd[2] = {-1, -1};
  if (pipe(pipefd) != 0) {
    return common::Status::error(common::ErrorKind::Process, "failed to create pipe");
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close(pipefd[0]);
    close(pipefd[1]);
    return common::Status::error(common::ErrorKind::Process, "failed to fork tunnel process");
  }

  if (pid == 0) {
    dup2(pipefd[1], STDOUT_FILENO);
    dup2(pipefd[1], STDERR_FILENO);
    close(pipefd[0]);
    close(pipefd[1]);

    std::vector<char *> cargs;
    cargs.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
      cargs.push_back(const_cast<char *>(arg.c_str()));
    }
    cargs.push_back(nullptr);

    execvp(cargs[0], cargs.data());
    _exit(127);
  }

  close(pipefd[1]);
  const int flags = fcntl(pipefd[0], F_GETFL, 0);
  fcntl(pipefd[0], F_SETFL, flags | O_NONBLOCK);

  pid_ = pid;
  output_fd_ = pipefd[0];
  on_output_ = std::move(on_output);
  exited_ = false;
  timed_out_ = false;
  exit_code_.reset();
  unread_.clear();
  if (timeout.has_value()) {
    deadline_ = std::chrono::steady_clock::now() + *timeout;
  } else {
    deadline_.reset();
  }
  return common::Status::success();
}

void TunnelProcess::drain() {
  if (output_fd_ < 0) {
    return;
  }

  char buf[4096];
  while (true) {
    const ssize_t n = read(output_fd_, buf, sizeof(buf));
    if (n > 0) {
      const std::string_view chunk(buf, static_cast<std::size_t>(n));
      unread_.append(chunk);
      if (on_output_) {
        on_output_(chunk);
      }
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n == 0) {
      close_output();
    }
    break;
  }
}

void TunnelProcess::close_output() {
  if (output_fd_ >= 0) {
    close(output_fd_);
    output_fd_ = -1;
  }
}

void TunnelProcess::mark_exited(const int status) {
  exited_ = true;
  pid_ = 0;
  if (WIFEXITED(status)) {
    exit_code_ = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit_code_ = 128 + WTERMSIG(status);
  }
}

bool TunnelProcess::is_running() {
  if (pid_ <= 0) {
    drain();
    return false;
  }

  drain();

  int status = 0;
  const pid_t done = waitpid(pid_, &status, WNOHANG);
  if (done == pid_) {
    mark_exited(status);
    drain();
    close_output();
    return false;
  }
  if (done < 0 && errno == ECHILD) {
    exited_ = true;
    pid_ = 0;
    close_output();
    return false;
  }

  if (deadline_.has_value() && std::chrono::steady_clock::now() >= *deadline_) {
    timed_out_ = true;
    terminate();
    return false;
  }
  return true;
}

std::string TunnelProcess::latest_output() {
  drain();
  std::string out;
  out.swap(unread_);
  return out;
}

void TunnelProcess::disarm_timeout() { deadline_.reset(); }

void TunnelProcess::terminate() {
  if (pid_ > 0) {
    kill(pid_, SIGTERM);
    bool reaped = false;
    for (int i = 0; i < 20; ++i) {
      int status = 0;
      if (waitpid(pid_, &status, WNOHANG) == pid_) {
        mark_exited(status);
        reaped = true;
        break;
      }
      usleep(50 * 1000);
    }
    if (!reaped) {
      kill(pid_, SIGKILL);
      int status = 0;
      if (waitpid(pid_, &status, 0) == pid_) {
        mark_exited(status);
      }
      pid_ = 0;
      exited_ = true;
    }
  }
  close_output();
}

} // namespace hooktunnel::tunnel
