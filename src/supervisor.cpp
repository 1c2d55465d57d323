#include "gradebox/supervisor.hpp"

#include <signal.h>
#include <unistd.h>

#include <chrono>
#include <cstdio>

#include "gradebox/governor.hpp"
#include "gradebox/observability.hpp"
#include "gradebox/postprocess.hpp"
#include "gradebox/protocol.hpp"
#include "gradebox/sandbox.hpp"
#include "gradebox/version.hpp"

namespace gradebox {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::uint64_t kMiB = 1024ull * 1024ull;

void ignore_sigpipe_once() {
  static std::once_flag flag;
  // A worker that dies mid-write must surface as a failed write_frame, not
  // kill the host.
  std::call_once(flag, [] { ::signal(SIGPIPE, SIG_IGN); });
}

InitStatus init_failure(const std::string& message) {
  InitStatus s;
  s.ok = false;
  s.error_code = ErrorCode::init_failed;
  s.message = message;
  return s;
}

ExecutionResult host_failure(ErrorCode code, const std::string& message) {
  ExecutionResult r;
  r.ok = false;
  r.error_code = code;
  r.error_message = message;
  r.exit_reason = ExitReason::runtime_error;
  return r;
}

PostProcessOptions postprocess_options(const EngineConfig& config, const std::string& lib_prefix) {
  PostProcessOptions opts;
  opts.max_stdout = config.max_stdout;
  opts.max_stderr = config.max_stderr;
  opts.runtime_lib_prefix = lib_prefix;
  return opts;
}

// Result for a run whose worker never answered: every case fails with the
// limit that stopped it.
ExecutionResult synthesized_limit_result(const ExecutionRequest& request, bool timed_out,
                                         bool memory_exceeded, const PostProcessOptions& opts) {
  ExecutionResult r;
  r.ok = true;
  const std::string reason = timed_out ? "Execution timed out" : "Memory limit exceeded";
  for (const auto& tc : request.test_cases) {
    TestOutcome o;
    o.id = tc.id;
    o.target_name = tc.target_name;
    o.passed = false;
    o.expected_value = tc.expected_value;
    o.error_text = reason;
    r.outcomes.push_back(std::move(o));
  }
  PostProcessInput in;
  in.outcomes = &r.outcomes;
  in.timed_out = timed_out;
  in.memory_exceeded = memory_exceeded;
  PostProcessed pp = postprocess(in, opts);
  r.stdout_text = std::move(pp.stdout_text);
  r.stderr_text = std::move(pp.stderr_text);
  r.exit_reason = pp.exit_reason;
  r.truncation = pp.truncation;
  r.timed_out = timed_out;
  r.memory_exceeded = memory_exceeded;
  return r;
}

void close_fd(int& fd) {
  if (fd >= 0) ::close(fd);
  fd = -1;
}

// Claims the single in-flight slot for the lifetime of the guard.
class BusyGuard {
 public:
  explicit BusyGuard(std::atomic<bool>& flag)
      : flag_(flag), acquired_(!flag.exchange(true, std::memory_order_acq_rel)) {}
  ~BusyGuard() {
    if (acquired_) flag_.store(false, std::memory_order_release);
  }
  BusyGuard(const BusyGuard&) = delete;
  BusyGuard& operator=(const BusyGuard&) = delete;

  bool acquired() const { return acquired_; }

 private:
  std::atomic<bool>& flag_;
  bool acquired_;
};

}  // namespace

WorkerSupervisor::WorkerSupervisor(EngineConfig config)
    : config_(std::move(config)), cell_(InterruptCell::create()) {
  ignore_sigpipe_once();
  if (config_.worker_path.empty()) config_.worker_path = default_worker_path();
  if (!cell_.shared()) {
    std::fprintf(stderr,
                 "[gradebox] interrupt cell is not shared; runaway guests are stopped by hard kill only\n");
  }
}

WorkerSupervisor::~WorkerSupervisor() { terminate(); }

InitStatus WorkerSupervisor::initialize(const std::string& image) {
  std::optional<std::promise<InitStatus>> owner;
  std::shared_future<InitStatus> future;
  {
    std::lock_guard<std::mutex> lk(init_mu_);
    if (!init_future_) {
      owner.emplace();
      init_future_ = owner->get_future().share();
      image_ = image;
    }
    future = *init_future_;
  }
  if (owner) {
    InitStatus s = start_worker(image);
    if (!s.ok) {
      s.error_code = ErrorCode::init_failed;
      global_engine_stats().init_failures.fetch_add(1, std::memory_order_relaxed);
      std::fprintf(stderr, "[gradebox] worker initialization failed: %s\n", s.message.c_str());
    }
    owner->set_value(std::move(s));
  }
  return future.get();
}

InitStatus WorkerSupervisor::start_worker(const std::string& image) {
  WorkerSpec spec;
  spec.command = config_.worker_path;
  spec.inherit_fd = cell_.shared() ? cell_.fd() : -1;
  spec.max_address_space_bytes = config_.worker_address_space_mb * kMiB;

  SpawnedWorker spawned = spawn_worker(spec);
  if (!spawned.ok()) {
    InitStatus s = init_failure("cannot start worker " + config_.worker_path + ": " + spawned.error_message);
    s.error_code = ErrorCode::spawn_failed;
    return s;
  }
  global_engine_stats().worker_spawns.fetch_add(1, std::memory_order_relaxed);

  Worker w{spawned.pid, spawned.to_worker, spawned.from_worker};
  InitStatus s = handshake(w, image);

  std::lock_guard<std::mutex> lk(state_mu_);
  if (s.ok && terminated_) {
    s = init_failure("supervisor terminated during initialization");
    s.error_code = ErrorCode::terminated;
  }
  if (!s.ok) {
    const int status = kill_worker(w.pid);
    close_fd(w.to_worker);
    close_fd(w.from_worker);
    if (s.error_code == ErrorCode::init_failed) s.message += " (worker " + describe_wait_status(status) + ")";
    return s;
  }
  if (!config_.runtime_lib_prefix.empty()) s.lib_prefix = config_.runtime_lib_prefix;
  lib_prefix_ = s.lib_prefix;
  worker_ = w;
  return s;
}

InitStatus WorkerSupervisor::handshake(Worker& w, const std::string& image) {
  const std::uint64_t id = next_id_.fetch_add(1, std::memory_order_relaxed);
  jsonlite::Object body;
  body["image"] = image;
  if (!protocol::write_frame(w.to_worker, protocol::encode_message("init", id, std::move(body)))) {
    return init_failure("could not send init request to worker");
  }

  const auto deadline = Clock::now() + std::chrono::milliseconds(config_.init_timeout_ms);
  for (;;) {
    std::string frame;
    const protocol::ReadStatus st = protocol::read_frame(w.from_worker, frame, deadline);
    if (st == protocol::ReadStatus::timeout) {
      return init_failure("worker not ready after " + std::to_string(config_.init_timeout_ms) + " ms");
    }
    if (st != protocol::ReadStatus::ok) {
      return init_failure("worker channel " + protocol::to_string(st) + " during initialization");
    }
    std::string err;
    auto msg = protocol::decode_message(frame, &err);
    if (!msg) return init_failure(err);
    if (msg->id != id) continue;

    if (msg->type == "error") return init_failure(jsonlite::get_string(msg->body, "message"));
    if (msg->type != "ready") return init_failure("unexpected '" + msg->type + "' frame during initialization");

    const auto compat =
        version::check_compatibility(static_cast<std::uint32_t>(jsonlite::get_u64(msg->body, "protocol", 0)));
    if (!compat.ok) return init_failure(compat.error_code + ": " + compat.description);

    InitStatus s;
    s.ok = true;
    s.runtime_version = jsonlite::get_string(msg->body, "runtime");
    s.lib_prefix = jsonlite::get_string(msg->body, "libPrefix");
    return s;
  }
}

int WorkerSupervisor::drop_worker_locked() {
  if (!worker_) return 0;
  Worker w = *worker_;
  worker_.reset();
  const int status = kill_worker(w.pid);
  close_fd(w.to_worker);
  close_fd(w.from_worker);
  return status;
}

std::optional<WorkerSupervisor::Worker> WorkerSupervisor::current_worker() const {
  std::lock_guard<std::mutex> lk(state_mu_);
  if (terminated_) return std::nullopt;
  return worker_;
}

ExecutionResult WorkerSupervisor::execute(const ExecutionRequest& request) {
  BusyGuard busy(busy_);
  if (!busy.acquired()) {
    global_engine_stats().busy_rejections.fetch_add(1, std::memory_order_relaxed);
    return host_failure(ErrorCode::worker_busy, "another execution is in flight");
  }

  Acquired a = acquire_worker();
  if (!a.worker) return host_failure(a.error_code, a.message);
  ExecutionResult r = run_on_worker(*a.worker, request);
  r.worker_restarted = a.restarted;
  return r;
}

WorkerSupervisor::Acquired WorkerSupervisor::acquire_worker() {
  Acquired a;
  auto fail = [&a](ErrorCode code, std::string message) {
    a.error_code = code;
    a.message = std::move(message);
    return a;
  };

  std::optional<std::shared_future<InitStatus>> init;
  {
    std::lock_guard<std::mutex> lk(init_mu_);
    init = init_future_;
  }
  if (!init) return fail(ErrorCode::init_failed, "worker not initialized");
  const InitStatus& init_status = init->get();
  if (!init_status.ok) return fail(ErrorCode::init_failed, init_status.message);

  {
    std::lock_guard<std::mutex> lk(state_mu_);
    if (terminated_) return fail(ErrorCode::terminated, "supervisor terminated");
    a.worker = worker_;
  }
  if (a.worker) return a;

  InitStatus s = start_worker(image_);
  if (!s.ok) return fail(s.error_code, s.message);
  a.worker = current_worker();
  if (!a.worker) return fail(ErrorCode::terminated, "supervisor terminated");
  a.restarted = true;
  return a;
}

ExecutionResult WorkerSupervisor::run_on_worker(const Worker& w, const ExecutionRequest& request) {
  auto& stats = global_engine_stats();
  const auto started = Clock::now();
  auto elapsed_ms = [&started] {
    return std::chrono::duration<double, std::milli>(Clock::now() - started).count();
  };

  cell_.reset();
  const std::uint64_t id = next_id_.fetch_add(1, std::memory_order_relaxed);
  jsonlite::Object body;
  body["source"] = request.source_text;
  jsonlite::Array tests;
  for (const auto& tc : request.test_cases) tests.push_back(test_case_to_json(tc));
  body["tests"] = std::move(tests);
  body["timeLimitMs"] = request.time_limit_ms;
  body["memLimitMb"] = request.mem_limit_mb;

  if (!protocol::write_frame(w.to_worker, protocol::encode_message("run", id, std::move(body)))) {
    std::lock_guard<std::mutex> lk(state_mu_);
    const bool terminated = terminated_;
    const int status = drop_worker_locked();
    if (terminated) return host_failure(ErrorCode::terminated, "supervisor terminated during execution");
    stats.worker_crashes.fetch_add(1, std::memory_order_relaxed);
    return host_failure(ErrorCode::worker_crashed,
                        "could not send run request, worker " + describe_wait_status(status));
  }

  const pid_t pid = w.pid;
  GovernorLimits limits;
  limits.time_limit_ms = request.time_limit_ms;
  limits.mem_limit_bytes = request.mem_limit_mb * kMiB;
  limits.sample_interval_ms = config_.sample_interval_ms;
  Governor governor(cell_, limits, [pid] { return rss_bytes(pid); });
  governor.arm();

  const auto deadline =
      started + std::chrono::milliseconds(request.time_limit_ms + config_.kill_grace_ms);
  std::optional<protocol::Message> reply;
  protocol::ReadStatus st = protocol::ReadStatus::ok;
  std::string decode_error;
  for (;;) {
    std::string frame;
    st = protocol::read_frame(w.from_worker, frame, deadline);
    if (st != protocol::ReadStatus::ok) break;
    auto msg = protocol::decode_message(frame, &decode_error);
    if (!msg) {
      st = protocol::ReadStatus::io_error;
      break;
    }
    if (msg->id != id) continue;  // stale reply to an abandoned request
    reply = std::move(msg);
    break;
  }
  governor.disarm();
  stats.record_rss(governor.peak_rss());

  PostProcessOptions opts;
  {
    std::lock_guard<std::mutex> lk(state_mu_);
    opts = postprocess_options(config_, lib_prefix_);
  }

  if (!reply) {
    const bool timed_out = governor.timed_out();
    const bool memory = governor.memory_exceeded();
    std::lock_guard<std::mutex> lk(state_mu_);
    const bool terminated = terminated_;
    const int status = drop_worker_locked();
    if (terminated) return host_failure(ErrorCode::terminated, "supervisor terminated during execution");

    if (st == protocol::ReadStatus::timeout) {
      stats.worker_kills.fetch_add(1, std::memory_order_relaxed);
      std::fprintf(stderr, "[gradebox] worker %d unresponsive after %llu ms, killed\n", static_cast<int>(pid),
                   static_cast<unsigned long long>(request.time_limit_ms + config_.kill_grace_ms));
      ExecutionResult r = synthesized_limit_result(request, !memory, memory, opts);
      r.duration_ms = elapsed_ms();
      return r;
    }

    stats.worker_crashes.fetch_add(1, std::memory_order_relaxed);
    if (memory || timed_out) {
      ExecutionResult r = synthesized_limit_result(request, timed_out && !memory, memory, opts);
      r.duration_ms = elapsed_ms();
      return r;
    }
    if (st == protocol::ReadStatus::oversize || !decode_error.empty()) {
      return host_failure(ErrorCode::protocol_error,
                          decode_error.empty() ? "worker sent an oversize frame" : decode_error);
    }
    std::fprintf(stderr, "[gradebox] worker %d exited unexpectedly (%s)\n", static_cast<int>(pid),
                 describe_wait_status(status).c_str());
    return host_failure(ErrorCode::worker_crashed, "worker exited unexpectedly (" + describe_wait_status(status) + ")");
  }

  if (reply->type == "error") {
    return host_failure(ErrorCode::invalid_request, jsonlite::get_string(reply->body, "message"));
  }
  if (reply->type != "result") {
    std::lock_guard<std::mutex> lk(state_mu_);
    drop_worker_locked();
    return host_failure(ErrorCode::protocol_error, "unexpected '" + reply->type + "' frame in reply to run");
  }

  RawRunResult raw = raw_result_from_json(reply->body);
  // The cell is authoritative only if the guest actually stopped on it; a
  // run that finished before its next safe point keeps its own verdict.
  const InterruptReason reason = raw.interrupted ? cell_.load() : InterruptReason::none;

  ExecutionResult r;
  r.ok = true;
  r.timed_out = reason == InterruptReason::timeout;
  r.memory_exceeded = reason == InterruptReason::memory;
  r.outcomes = std::move(raw.outcomes);
  r.user_tests = std::move(raw.user_tests);

  PostProcessInput in;
  in.stdout_text = std::move(raw.stdout_text);
  in.stderr_text = std::move(raw.stderr_text);
  in.outcomes = &r.outcomes;
  in.timed_out = r.timed_out;
  in.memory_exceeded = r.memory_exceeded;
  PostProcessed pp = postprocess(in, opts);
  r.stdout_text = std::move(pp.stdout_text);
  r.stderr_text = std::move(pp.stderr_text);
  r.exit_reason = pp.exit_reason;
  r.visualization = std::move(pp.visualization);
  r.truncation = pp.truncation;
  r.duration_ms = elapsed_ms();
  return r;
}

bool WorkerSupervisor::ping(const std::string& nonce, std::uint64_t timeout_ms) {
  BusyGuard busy(busy_);
  if (!busy.acquired()) return false;
  Acquired a = acquire_worker();
  if (!a.worker) return false;
  const Worker* w = &*a.worker;

  const std::uint64_t id = next_id_.fetch_add(1, std::memory_order_relaxed);
  jsonlite::Object body;
  body["nonce"] = nonce;
  if (!protocol::write_frame(w->to_worker, protocol::encode_message("ping", id, std::move(body)))) return false;

  const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
  for (;;) {
    std::string frame;
    const protocol::ReadStatus st = protocol::read_frame(w->from_worker, frame, deadline);
    if (st != protocol::ReadStatus::ok) {
      // A late ack would arrive mid-stream on the next request; the worker
      // is replaced instead.
      std::lock_guard<std::mutex> lk(state_mu_);
      drop_worker_locked();
      if (st == protocol::ReadStatus::timeout) {
        global_engine_stats().worker_kills.fetch_add(1, std::memory_order_relaxed);
        std::fprintf(stderr, "[gradebox] worker %d missed ping after %llu ms, killed\n", static_cast<int>(w->pid),
                     static_cast<unsigned long long>(timeout_ms));
      }
      return false;
    }
    auto msg = protocol::decode_message(frame, nullptr);
    if (!msg || msg->id != id) continue;
    return msg->type == "ack" && jsonlite::get_string(msg->body, "nonce") == nonce;
  }
}

void WorkerSupervisor::terminate() {
  std::lock_guard<std::mutex> lk(state_mu_);
  terminated_ = true;
  if (!worker_) return;
  if (busy_.load(std::memory_order_acquire)) {
    // The in-flight call owns the channel; it observes EOF and cleans up.
    ::kill(-worker_->pid, SIGKILL);
    ::kill(worker_->pid, SIGKILL);
    return;
  }
  drop_worker_locked();
}

bool WorkerSupervisor::worker_alive() const {
  std::lock_guard<std::mutex> lk(state_mu_);
  return worker_.has_value() && !terminated_;
}

pid_t WorkerSupervisor::worker_pid() const {
  std::lock_guard<std::mutex> lk(state_mu_);
  return worker_ ? worker_->pid : -1;
}

}  // namespace gradebox
