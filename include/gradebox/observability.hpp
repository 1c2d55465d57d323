#pragma once

// gradebox/observability.hpp — Structured execution observability.
//
// ExecutionEvent is the observable unit. Every Engine::execute() call emits
// exactly one, which is recorded in the global EngineStats and, when
// GRADEBOX_EVENT_LOG is set, appended to that file as one JSON line.
//
// Event fields never carry guest stdout/stderr content, only sizes and
// digests.

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "gradebox/types.hpp"

namespace gradebox {

struct ExecutionEvent {
  std::string execution_id;   // = request digest
  std::string outcome_digest;

  uint64_t duration_ns{0};    // whole execute() wall-clock
  uint64_t worker_ns{0};      // run request sent -> result received

  size_t bytes_in{0};         // source text size
  size_t bytes_stdout{0};
  size_t bytes_stderr{0};
  size_t tests_total{0};
  size_t tests_passed{0};

  bool ok{false};
  std::string error_code;
  ExitReason exit_reason{ExitReason::success};
  bool timed_out{false};
  bool memory_exceeded{false};
  bool worker_restarted{false};
};

// ---------------------------------------------------------------------------
// LatencyHistogram — power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us). Bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // p in [0.0, 1.0]. Returns microseconds, 0.0 with no samples.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// EngineStats — global aggregated statistics
// ---------------------------------------------------------------------------
// Thread-safe. Counters are atomic; the recent-event ring uses a mutex.
// Exposed via `gradebox health`.
class EngineStats {
 public:
  void record_execution(const ExecutionEvent& ev);
  std::string to_json() const;

  alignas(64) std::atomic<uint64_t> total_executions{0};
  alignas(64) std::atomic<uint64_t> successful_executions{0};  // host ok, regardless of verdict
  alignas(64) std::atomic<uint64_t> failed_executions{0};

  // Guest verdicts, indexed by ExitReason.
  static constexpr size_t kExitReasons = 7;
  std::array<std::atomic<uint64_t>, kExitReasons> exit_reasons{};

  // Worker lifecycle, bumped by the supervisor.
  alignas(64) std::atomic<uint64_t> worker_spawns{0};
  alignas(64) std::atomic<uint64_t> worker_kills{0};
  alignas(64) std::atomic<uint64_t> worker_crashes{0};
  alignas(64) std::atomic<uint64_t> init_failures{0};
  alignas(64) std::atomic<uint64_t> busy_rejections{0};

  // Governor
  alignas(64) std::atomic<uint64_t> rss_bytes_max{0};
  alignas(64) std::atomic<uint64_t> rss_bytes_last{0};

  LatencyHistogram latency_histogram;

  // MICRO_OPT: fixed-size circular buffer; ring_head_ is the next slot to
  // overwrite (the oldest entry once full).
  static constexpr size_t kMaxRecentEvents = 256;
  // Oldest first.
  std::vector<ExecutionEvent> recent_events_snapshot() const;

  void record_rss(uint64_t bytes);

 private:
  mutable std::mutex ring_mu_;
  std::vector<ExecutionEvent> ring_buffer_;
  size_t ring_head_{0};
};

EngineStats& global_engine_stats();

// Fire-and-forget. Never throws, never blocks on anything but a local append.
void emit_execution_event(const ExecutionEvent& ev);

std::string event_to_json(const ExecutionEvent& ev);

using ExecutionEventHook = void (*)(const ExecutionEvent&);
void set_execution_event_hook(ExecutionEventHook hook);

}  // namespace gradebox
