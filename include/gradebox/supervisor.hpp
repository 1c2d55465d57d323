#pragma once

// gradebox/supervisor.hpp — Host-side owner of the single guest worker.
//
// LIFECYCLE:
//   initialize(image) spawns gradebox_worker and performs the init/ready
//   handshake. Concurrent callers share one in-flight initialization. A
//   failed initialization is remembered and returned to every later caller;
//   it is not retried.
//
//   execute(request) runs one program on the worker. At most one execution
//   is in flight; a concurrent call fails fast with ErrorCode::worker_busy.
//   The governor arms the deadline and memory sampler on the shared
//   interrupt cell; the guest stops cooperatively at its next safe point.
//   If no result arrives within time_limit + kill_grace, the worker process
//   group is SIGKILLed, a Timeout result is synthesized, and a fresh worker
//   is spawned lazily on the next call.
//
//   terminate() kills the worker immediately. An in-flight execute returns
//   ErrorCode::terminated; later calls do too.
//
// THREADING: all public methods are safe to call from any thread.

#include <sys/types.h>

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "gradebox/config.hpp"
#include "gradebox/interrupt.hpp"
#include "gradebox/types.hpp"

namespace gradebox {

struct InitStatus {
  bool ok{false};
  ErrorCode error_code{ErrorCode::none};
  std::string message;
  std::string runtime_version;
  std::string lib_prefix;  // runtime library directory reported by the worker
};

class WorkerSupervisor {
 public:
  explicit WorkerSupervisor(EngineConfig config);
  ~WorkerSupervisor();

  WorkerSupervisor(const WorkerSupervisor&) = delete;
  WorkerSupervisor& operator=(const WorkerSupervisor&) = delete;

  InitStatus initialize(const std::string& image);

  ExecutionResult execute(const ExecutionRequest& request);

  // Round-trips a ping frame. false when not initialized, busy, dead, or no
  // ack within timeout_ms; a worker that misses the deadline is killed and
  // replaced on the next call.
  bool ping(const std::string& nonce, std::uint64_t timeout_ms = 1000);

  void terminate();

  bool worker_alive() const;
  pid_t worker_pid() const;
  const EngineConfig& config() const { return config_; }

 private:
  struct Worker {
    pid_t pid{-1};
    int to_worker{-1};
    int from_worker{-1};
  };

  struct Acquired {
    std::optional<Worker> worker;
    bool restarted{false};
    ErrorCode error_code{ErrorCode::none};
    std::string message;
  };

  // The live worker, or a freshly spawned one when the previous worker was
  // dropped. Requires a successful initialize().
  Acquired acquire_worker();
  InitStatus start_worker(const std::string& image);
  InitStatus handshake(Worker& w, const std::string& image);
  // Kills and reaps the worker and closes the channel. Caller holds
  // state_mu_. Returns the wait status.
  int drop_worker_locked();
  std::optional<Worker> current_worker() const;

  ExecutionResult run_on_worker(const Worker& w, const ExecutionRequest& request);

  EngineConfig config_;
  InterruptCell cell_;

  std::mutex init_mu_;
  std::optional<std::shared_future<InitStatus>> init_future_;
  std::string image_;
  std::string lib_prefix_;

  mutable std::mutex state_mu_;
  std::optional<Worker> worker_;
  bool terminated_{false};

  std::atomic<bool> busy_{false};
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace gradebox
