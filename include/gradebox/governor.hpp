#pragma once

// gradebox/governor.hpp — Per-run resource governor.
//
// Two concerns race on one InterruptCell:
//   - deadline: time_limit_ms after arm()
//   - memory:   an RSS sampler polling every sample_interval_ms
// Whichever fires first sets the cell; the other is then moot. The worker
// observes the cell cooperatively. The governor itself never kills anything;
// the supervisor owns the hard-kill backstop.
//
// Memory is the worker's whole resident set, interpreter included. Memory a
// previous run left behind in the same worker counts against the next run.

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

#include "gradebox/interrupt.hpp"

namespace gradebox {

// Resident set size of pid in bytes from /proc/<pid>/statm. 0 if unreadable.
std::uint64_t rss_bytes(pid_t pid);

struct GovernorLimits {
  std::uint64_t time_limit_ms{2000};
  std::uint64_t mem_limit_bytes{128ull * 1024 * 1024};
  std::uint64_t sample_interval_ms{50};
};

class Governor {
 public:
  using RssSampler = std::function<std::uint64_t()>;

  Governor(InterruptCell& cell, GovernorLimits limits, RssSampler sample_rss);
  ~Governor();

  Governor(const Governor&) = delete;
  Governor& operator=(const Governor&) = delete;

  // Starts the watch thread.
  void arm();
  // Stops the watch thread. Idempotent. Flags stay readable afterwards.
  void disarm();

  bool timed_out() const { return timed_out_.load(std::memory_order_acquire); }
  bool memory_exceeded() const { return memory_exceeded_.load(std::memory_order_acquire); }
  std::uint64_t peak_rss() const { return peak_rss_.load(std::memory_order_relaxed); }

 private:
  void watch();

  InterruptCell& cell_;
  GovernorLimits limits_;
  RssSampler sample_rss_;
  std::chrono::steady_clock::time_point deadline_{};

  std::mutex mu_;
  std::condition_variable cv_;
  bool stop_{false};
  std::thread thread_;

  std::atomic<bool> timed_out_{false};
  std::atomic<bool> memory_exceeded_{false};
  std::atomic<std::uint64_t> peak_rss_{0};
};

}  // namespace gradebox
