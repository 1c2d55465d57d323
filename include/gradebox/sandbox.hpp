#pragma once

// gradebox/sandbox.hpp — Worker process spawning (POSIX).
//
// The worker is started with fork()+execve() in its own session so the whole
// process group can be SIGKILLed. Two pipes form the message channel; the
// child-side ends and the interrupt memfd are the only descriptors that
// survive exec (everything else is O_CLOEXEC). The child's stdout goes to
// /dev/null (guest output is captured in-process and returned in frames);
// stderr is inherited for worker diagnostics.
//
// Exec failures are reported through a CLOEXEC status pipe, so a bad worker
// path surfaces as spawn_failed with errno text rather than as a closed
// channel later.

#include <sys/types.h>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace gradebox {

struct WorkerSpec {
  std::string command;
  std::vector<std::string> argv;         // arguments after argv[0]
  std::map<std::string, std::string> env;  // empty = inherit the host environment
  int inherit_fd{-1};                    // extra fd kept open across exec (interrupt cell)
  std::uint64_t max_address_space_bytes{0};  // RLIMIT_AS, 0 = unlimited
  std::uint64_t max_file_descriptors{0};     // RLIMIT_NOFILE, 0 = unlimited
};

struct SpawnedWorker {
  pid_t pid{-1};
  int to_worker{-1};    // host writes requests
  int from_worker{-1};  // host reads responses
  std::string error_message;

  bool ok() const { return pid > 0; }
};

// On success the returned argv has "--in-fd N --out-fd M" appended (and
// "--interrupt-fd K" when inherit_fd >= 0).
SpawnedWorker spawn_worker(const WorkerSpec& spec);

// SIGKILL the worker's process group and reap it. Returns the wait status.
int kill_worker(pid_t pid);

// Human-readable description of a wait status ("exit 1", "signal 9").
std::string describe_wait_status(int status);

}  // namespace gradebox
