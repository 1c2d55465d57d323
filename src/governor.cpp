#include "gradebox/governor.hpp"

#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <string>

namespace gradebox {

std::uint64_t rss_bytes(pid_t pid) {
  const std::string path = "/proc/" + std::to_string(pid) + "/statm";
  FILE* f = std::fopen(path.c_str(), "r");
  if (!f) return 0;
  unsigned long long size_pages = 0;
  unsigned long long resident_pages = 0;
  const int n = std::fscanf(f, "%llu %llu", &size_pages, &resident_pages);
  std::fclose(f);
  if (n != 2) return 0;
  const long page = sysconf(_SC_PAGESIZE);
  return resident_pages * static_cast<std::uint64_t>(page > 0 ? page : 4096);
}

Governor::Governor(InterruptCell& cell, GovernorLimits limits, RssSampler sample_rss)
    : cell_(cell), limits_(limits), sample_rss_(std::move(sample_rss)) {
  if (limits_.sample_interval_ms == 0) limits_.sample_interval_ms = 50;
}

Governor::~Governor() { disarm(); }

void Governor::arm() {
  disarm();
  peak_rss_.store(0, std::memory_order_relaxed);
  timed_out_.store(false, std::memory_order_release);
  memory_exceeded_.store(false, std::memory_order_release);
  deadline_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(limits_.time_limit_ms);
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_ = false;
  }
  thread_ = std::thread([this] { watch(); });
}

void Governor::disarm() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void Governor::watch() {
  const auto interval = std::chrono::milliseconds(limits_.sample_interval_ms);
  std::unique_lock<std::mutex> lk(mu_);
  while (!stop_) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline_) {
      if (cell_.set(InterruptReason::timeout)) timed_out_.store(true, std::memory_order_release);
      return;
    }
    const auto wake = std::min(deadline_, now + interval);
    if (cv_.wait_until(lk, wake, [this] { return stop_; })) return;

    if (std::chrono::steady_clock::now() >= deadline_) continue;
    if (!sample_rss_) continue;
    const std::uint64_t rss = sample_rss_();
    if (rss > peak_rss_.load(std::memory_order_relaxed)) {
      peak_rss_.store(rss, std::memory_order_relaxed);
    }
    if (rss > limits_.mem_limit_bytes) {
      if (cell_.set(InterruptReason::memory)) memory_exceeded_.store(true, std::memory_order_release);
      return;
    }
  }
}

}  // namespace gradebox
