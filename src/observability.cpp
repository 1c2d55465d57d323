#include "gradebox/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

namespace gradebox {

namespace {

// MICRO_OPT: bit_width gives the bucket index in O(1) (BSR/CLZ).
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

void append_fixed(std::string& out, const char* fmt, double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), fmt, v);
  out += buf;
}

}  // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  uint64_t counts[kBuckets];
  for (size_t i = 0; i < kBuckets; ++i) {
    counts[i] = buckets_[i].load(std::memory_order_relaxed);
  }

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += counts[i];
    if (cumulative >= target) {
      const double bucket_lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double bucket_hi = static_cast<double>(1ULL << i);
      return (bucket_lo + bucket_hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(256);
  out += "{\"count\":";
  out += std::to_string(count_.load(std::memory_order_relaxed));
  out += ",\"mean_us\":";
  append_fixed(out, "%.2f", mean_us());
  out += ",\"p50_ms\":";
  append_fixed(out, "%.3f", percentile(0.50) / 1000.0);
  out += ",\"p95_ms\":";
  append_fixed(out, "%.3f", percentile(0.95) / 1000.0);
  out += ",\"p99_ms\":";
  append_fixed(out, "%.3f", percentile(0.99) / 1000.0);
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record_rss(uint64_t bytes) {
  rss_bytes_last.store(bytes, std::memory_order_relaxed);
  uint64_t prev = rss_bytes_max.load(std::memory_order_relaxed);
  while (bytes > prev &&
         !rss_bytes_max.compare_exchange_weak(prev, bytes, std::memory_order_relaxed)) {
  }
}

void EngineStats::record_execution(const ExecutionEvent& ev) {
  total_executions.fetch_add(1, std::memory_order_relaxed);
  if (ev.ok) {
    successful_executions.fetch_add(1, std::memory_order_relaxed);
    exit_reasons[static_cast<size_t>(ev.exit_reason)].fetch_add(1, std::memory_order_relaxed);
  } else {
    failed_executions.fetch_add(1, std::memory_order_relaxed);
  }
  latency_histogram.record(ev.duration_ns);

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
  }
  ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
}

std::vector<ExecutionEvent> EngineStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) return ring_buffer_;
  // Oldest first.
  std::vector<ExecutionEvent> out;
  out.reserve(ring_buffer_.size());
  for (size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % kMaxRecentEvents]);
  }
  return out;
}

std::string EngineStats::to_json() const {
  std::string out;
  out.reserve(1024);
  auto field = [&](const char* name, uint64_t v, bool first = false) {
    if (!first) out += ',';
    out += '"';
    out += name;
    out += "\":";
    out += std::to_string(v);
  };

  out += '{';
  field("total_executions", total_executions.load(std::memory_order_relaxed), true);
  field("successful_executions", successful_executions.load(std::memory_order_relaxed));
  field("failed_executions", failed_executions.load(std::memory_order_relaxed));

  out += ",\"exit_reasons\":{";
  for (size_t i = 0; i < kExitReasons; ++i) {
    field(to_string(static_cast<ExitReason>(i)).c_str(),
          exit_reasons[i].load(std::memory_order_relaxed), i == 0);
  }
  out += '}';

  out += ",\"worker\":{";
  field("spawns", worker_spawns.load(std::memory_order_relaxed), true);
  field("kills", worker_kills.load(std::memory_order_relaxed));
  field("crashes", worker_crashes.load(std::memory_order_relaxed));
  field("init_failures", init_failures.load(std::memory_order_relaxed));
  field("busy_rejections", busy_rejections.load(std::memory_order_relaxed));
  out += '}';

  out += ",\"memory\":{";
  field("rss_bytes_max", rss_bytes_max.load(std::memory_order_relaxed), true);
  field("rss_bytes_last", rss_bytes_last.load(std::memory_order_relaxed));
  out += '}';

  out += ",\"latency\":";
  out += latency_histogram.to_json();

  out += ",\"recent_events\":[";
  const std::vector<ExecutionEvent> recent = recent_events_snapshot();
  for (size_t i = 0; i < recent.size(); ++i) {
    if (i) out += ',';
    out += event_to_json(recent[i]);
  }
  out += "]}";
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

EngineStats& global_engine_stats() {
  static EngineStats inst;
  return inst;
}

namespace {
std::atomic<ExecutionEventHook> g_event_hook{nullptr};
}

void set_execution_event_hook(ExecutionEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

std::string event_to_json(const ExecutionEvent& ev) {
  jsonlite::Object o;
  o["execution_id"] = ev.execution_id;
  o["outcome_digest"] = ev.outcome_digest;
  o["ok"] = ev.ok;
  o["error_code"] = ev.error_code;
  o["exit_reason"] = to_string(ev.exit_reason);
  o["duration_ns"] = static_cast<std::uint64_t>(ev.duration_ns);
  o["worker_ns"] = static_cast<std::uint64_t>(ev.worker_ns);
  o["bytes_in"] = static_cast<std::uint64_t>(ev.bytes_in);
  o["bytes_out"] = static_cast<std::uint64_t>(ev.bytes_stdout + ev.bytes_stderr);
  o["tests_total"] = static_cast<std::uint64_t>(ev.tests_total);
  o["tests_passed"] = static_cast<std::uint64_t>(ev.tests_passed);
  o["timed_out"] = ev.timed_out;
  o["memory_exceeded"] = ev.memory_exceeded;
  o["worker_restarted"] = ev.worker_restarted;
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

void emit_execution_event(const ExecutionEvent& ev) {
  global_engine_stats().record_execution(ev);

  ExecutionEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  // GRADEBOX_EVENT_LOG=/path/to/events.jsonl, one JSON object per line.
  const char* log_path = std::getenv("GRADEBOX_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  std::string line = event_to_json(ev);
  line += '\n';
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace gradebox
