#include "gradebox/sandbox.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

extern char** environ;

namespace gradebox {

namespace {

void close_fd(int& fd) {
  if (fd >= 0) close(fd);
  fd = -1;
}

void clear_cloexec(int fd) {
  const int flags = fcntl(fd, F_GETFD);
  if (flags >= 0) fcntl(fd, F_SETFD, flags & ~FD_CLOEXEC);
}

// Async-signal-safe: only raw writes between fork and exec.
[[noreturn]] void child_fail(int status_fd, int err) {
  ssize_t w = write(status_fd, &err, sizeof(err));
  (void)w;
  _exit(127);
}

}  // namespace

SpawnedWorker spawn_worker(const WorkerSpec& spec) {
  SpawnedWorker out;
  int req_pipe[2] = {-1, -1};   // host -> worker
  int resp_pipe[2] = {-1, -1};  // worker -> host
  int status_pipe[2] = {-1, -1};
  if (pipe2(req_pipe, O_CLOEXEC) != 0 || pipe2(resp_pipe, O_CLOEXEC) != 0 ||
      pipe2(status_pipe, O_CLOEXEC) != 0) {
    out.error_message = std::string("pipe: ") + std::strerror(errno);
    close_fd(req_pipe[0]);
    close_fd(req_pipe[1]);
    close_fd(resp_pipe[0]);
    close_fd(resp_pipe[1]);
    close_fd(status_pipe[0]);
    close_fd(status_pipe[1]);
    return out;
  }

  // Everything the child needs is built before fork.
  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  all.push_back("--in-fd");
  all.push_back(std::to_string(req_pipe[0]));
  all.push_back("--out-fd");
  all.push_back(std::to_string(resp_pipe[1]));
  if (spec.inherit_fd >= 0) {
    all.push_back("--interrupt-fd");
    all.push_back(std::to_string(spec.inherit_fd));
  }
  std::vector<char*> argv;
  argv.reserve(all.size() + 1);
  for (auto& s : all) argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<std::string> envs;
  std::vector<char*> envp;
  if (!spec.env.empty()) {
    for (const auto& [k, v] : spec.env) envs.push_back(k + "=" + v);
    for (auto& e : envs) envp.push_back(e.data());
    envp.push_back(nullptr);
  }

  pid_t pid = fork();
  if (pid < 0) {
    out.error_message = std::string("fork: ") + std::strerror(errno);
    close_fd(req_pipe[0]);
    close_fd(req_pipe[1]);
    close_fd(resp_pipe[0]);
    close_fd(resp_pipe[1]);
    close_fd(status_pipe[0]);
    close_fd(status_pipe[1]);
    return out;
  }

  if (pid == 0) {
    setsid();
    signal(SIGPIPE, SIG_DFL);
    int devnull = open("/dev/null", O_WRONLY);
    if (devnull >= 0) {
      dup2(devnull, STDOUT_FILENO);
      close(devnull);
    }
    clear_cloexec(req_pipe[0]);
    clear_cloexec(resp_pipe[1]);
    if (spec.inherit_fd >= 0) clear_cloexec(spec.inherit_fd);

    if (spec.max_address_space_bytes > 0) {
      struct rlimit rl;
      rl.rlim_cur = spec.max_address_space_bytes;
      rl.rlim_max = spec.max_address_space_bytes;
      if (setrlimit(RLIMIT_AS, &rl) != 0) child_fail(status_pipe[1], errno);
    }
    if (spec.max_file_descriptors > 0) {
      struct rlimit rl;
      rl.rlim_cur = spec.max_file_descriptors;
      rl.rlim_max = spec.max_file_descriptors;
      if (setrlimit(RLIMIT_NOFILE, &rl) != 0) child_fail(status_pipe[1], errno);
    }

    execve(spec.command.c_str(), argv.data(), envp.empty() ? environ : envp.data());
    child_fail(status_pipe[1], errno);
  }

  close_fd(req_pipe[0]);
  close_fd(resp_pipe[1]);
  close_fd(status_pipe[1]);

  // A successful exec closes the status pipe without writing.
  int child_errno = 0;
  ssize_t n;
  do {
    n = read(status_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close_fd(status_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    waitpid(pid, &status, 0);
    close_fd(req_pipe[1]);
    close_fd(resp_pipe[0]);
    out.error_message = "exec " + spec.command + ": " + std::strerror(child_errno);
    return out;
  }

  out.pid = pid;
  out.to_worker = req_pipe[1];
  out.from_worker = resp_pipe[0];
  return out;
}

int kill_worker(pid_t pid) {
  int status = 0;
  if (pid <= 0) return status;
  kill(-pid, SIGKILL);
  kill(pid, SIGKILL);
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
  return status;
}

std::string describe_wait_status(int status) {
  if (WIFEXITED(status)) return "exit " + std::to_string(WEXITSTATUS(status));
  if (WIFSIGNALED(status)) return "signal " + std::to_string(WTERMSIG(status));
  return "status " + std::to_string(status);
}

}  // namespace gradebox
