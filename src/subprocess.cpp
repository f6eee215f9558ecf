#include "evaluation_backend.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <stdexcept>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace {
struct Pipe {
  int fd[2] = {-1, -1};
  Pipe() {
    if (pipe2(fd, O_CLOEXEC) != 0) throw std::runtime_error(std::string("pipe: ") + std::strerror(errno));
  }
  ~Pipe() { close_read(); close_write(); }
  void close_read() { if (fd[0] >= 0) { ::close(fd[0]); fd[0] = -1; } }
  void close_write() { if (fd[1] >= 0) { ::close(fd[1]); fd[1] = -1; } }
};

// Reap pid; a child still running at the deadline is killed and timed_out
// set. Returns the exit status, -1 when the child did not exit normally.
int wait_child(pid_t pid, std::chrono::steady_clock::time_point deadline, bool& timed_out) {
  int status = 0;
  for (;;) {
    pid_t r = waitpid(pid, &status, timed_out ? 0 : WNOHANG);
    if (r == pid) break;
    if (r < 0) {
      if (errno == EINTR) continue;
      return -1;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      timed_out = true;
      kill(pid, SIGKILL);
      continue;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  return -1;
}
} // namespace

ProcessOutput run_process(const std::vector<std::string>& argv, long timeout_ms) {
  if (argv.empty()) throw std::runtime_error("run_process: empty command");

  Pipe out;
  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_adddup2(&actions, out.fd[1], STDOUT_FILENO);

  std::vector<char*> args;
  for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
  args.push_back(nullptr);

  pid_t pid = 0;
  int rc = posix_spawnp(&pid, args[0], &actions, nullptr, args.data(), environ);
  posix_spawn_file_actions_destroy(&actions);
  if (rc != 0) throw std::runtime_error("cannot start " + argv[0] + ": " + std::strerror(rc));
  out.close_write();

  ProcessOutput po;
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  char buf[4096];
  for (;;) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    if (left <= 0) {
      po.timed_out = true;
      break;
    }
    pollfd pfd{out.fd[0], POLLIN, 0};
    int pr = poll(&pfd, 1, (int)std::min<long long>(left, 1000));
    if (pr < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (pr == 0) continue;
    ssize_t n = ::read(out.fd[0], buf, sizeof(buf));
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break; // EOF
    po.out.append(buf, (size_t)n);
  }

  if (po.timed_out) kill(pid, SIGKILL);
  // stdout closing does not mean the child is done
  po.exit_code = wait_child(pid, deadline, po.timed_out);
  return po;
}
